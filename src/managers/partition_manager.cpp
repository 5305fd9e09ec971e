#include "pgq/partition_manager.hpp"
#include "pgq/errors.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace pgq {

namespace {

constexpr const char* CONTROL_COLUMN = "created_at";
constexpr const char* PARTITION_TYPE = "range";

int parse_int(const std::string& value, const std::string& field) {
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        throw std::runtime_error("unexpected value '" + value + "' in part_config." + field);
    }
}

} // namespace

PartitionManager::PartitionManager(std::shared_ptr<DatabasePool> db_pool, const PartmanConfig& config)
    : db_pool_(std::move(db_pool)), config_(config) {
    if (!db_pool_) {
        throw std::invalid_argument("Database pool cannot be null");
    }
    if (!is_valid_identifier(config_.schema)) {
        throw std::invalid_argument("invalid pg_partman schema: '" + config_.schema + "'");
    }
}

std::string PartitionManager::function(const std::string& name) const {
    return quote_identifier(config_.schema) + "." + name;
}

std::string PartitionManager::part_config_table() const {
    return quote_identifier(config_.schema) + ".part_config";
}

void PartitionManager::register_parent(const SchemaName& schema, const QueueName& name,
                                       const PartitionConfig& cfg) {
    FQN fqn = make_fqn(schema, name);
    Queue queue{name, schema, true};

    try {
        Transaction tx(db_pool_.get());

        // NULL-valued arguments (start partition, constraint columns) keep their defaults
        tx.execute(
            "SELECT " + function("create_parent") + "("
            "p_parent_table := $1::text, "
            "p_control := $2::text, "
            "p_interval := $3::text, "
            "p_type := $4::text, "
            "p_premake := $5::int, "
            "p_default_table := $6::boolean, "
            "p_automatic_maintenance := $7::text, "
            "p_template_table := $8::text, "
            "p_jobmon := $9::boolean)",
            {
                fqn.str(),
                CONTROL_COLUMN,
                cfg.interval,
                PARTITION_TYPE,
                std::to_string(cfg.premake),
                cfg.default_partition ? "true" : "false",
                "on",
                queue.template_fqn().str(),
                "true"
            });

        // create_parent's own defaults for these are not what queues need
        try {
            tx.execute(
                "UPDATE " + part_config_table() + R"(
                 SET retention = $2,
                     retention_keep_index = TRUE,
                     retention_keep_table = FALSE,
                     datetime_string = $3,
                     optimize_constraint = $4::int,
                     ignore_default_data = TRUE
                 WHERE parent_table = $1)",
                {fqn.str(), cfg.retention, cfg.datetime_string, std::to_string(cfg.optimize_constraint)});
        } catch (const DatabaseError&) {
            rethrow_as<PartmanError>("update_config", fqn);
        }

        tx.commit();
    } catch (const DatabaseError&) {
        rethrow_as<PartmanError>("create_parent", fqn);
    }

    spdlog::info("Registered {} with pg_partman (interval={}, premake={}, retention={})",
                 fqn.str(), cfg.interval, cfg.premake, cfg.retention);
}

PartitionConfig PartitionManager::get_partition_config(const SchemaName& schema, const QueueName& name) {
    FQN fqn = make_fqn(schema, name);
    PartitionConfig cfg;

    try {
        auto result = db_pool_->execute(
            "SELECT partition_interval::text, premake, retention::text, "
            "datetime_string, optimize_constraint "
            "FROM " + part_config_table() + " WHERE parent_table = $1",
            {fqn.str()});

        if (result.num_rows() == 0) {
            throw PartmanError("get_config", fqn, "no part_config row");
        }

        cfg.interval = result.get_value(0, 0);
        cfg.premake = parse_int(result.get_value(0, 1), "premake");
        cfg.retention = result.get_value(0, 2);
        cfg.datetime_string = result.get_value(0, 3);
        cfg.optimize_constraint = parse_int(result.get_value(0, 4), "optimize_constraint");
    } catch (const std::runtime_error&) {
        rethrow_as<PartmanError>("get_config", fqn);
    }

    try {
        auto result = db_pool_->execute(R"(
            SELECT EXISTS (
                SELECT 1 FROM pg_inherits i
                JOIN pg_class parent ON i.inhparent = parent.oid
                JOIN pg_class child ON i.inhrelid = child.oid
                JOIN pg_namespace n ON parent.relnamespace = n.oid
                WHERE n.nspname = $1
                  AND parent.relname = $2
                  AND child.relname LIKE '%\_default'
            )
        )", {schema.str(), name.str()});

        cfg.default_partition = result.get_bool(0, 0);
    } catch (const DatabaseError&) {
        rethrow_as<PartmanError>("check_default_partition", fqn);
    }

    return cfg;
}

void PartitionManager::update_partition_config(const SchemaName& schema, const QueueName& name,
                                               const PartitionConfig& cfg) {
    FQN fqn = make_fqn(schema, name);

    try {
        db_pool_->execute(
            "UPDATE " + part_config_table() + R"(
             SET partition_interval = $2, premake = $3::int, retention = $4,
                 datetime_string = $5, optimize_constraint = $6::int
             WHERE parent_table = $1)",
            {
                fqn.str(),
                cfg.interval,
                std::to_string(cfg.premake),
                cfg.retention,
                cfg.datetime_string,
                std::to_string(cfg.optimize_constraint)
            });
    } catch (const DatabaseError&) {
        rethrow_as<PartmanError>("update_config", fqn);
    }

    spdlog::info("Updated pg_partman config for {} (interval={}, premake={}, retention={})",
                 fqn.str(), cfg.interval, cfg.premake, cfg.retention);
}

void PartitionManager::remove_partman_config(const SchemaName& schema, const QueueName& name) {
    FQN fqn = make_fqn(schema, name);

    try {
        db_pool_->execute(
            "SELECT " + function("undo_partition") +
            "($1::text, p_loop_count := $2::int, p_keep_table := false)",
            {fqn.str(), std::to_string(config_.undo_batch_size)});
    } catch (const DatabaseError&) {
        rethrow_as<PartmanError>("undo_partition", fqn);
    }

    spdlog::info("Removed pg_partman config for {}", fqn.str());
}

} // namespace pgq
