#include "pgq/queue_manager.hpp"
#include "pgq/errors.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace pgq {

namespace {

struct StandardIndex {
    const char* suffix;
    const char* definition;
};

const StandardIndex STANDARD_INDEXES[] = {
    {INDEX_SUFFIX_CREATED_AT,        "(created_at)"},
    {INDEX_SUFFIX_PROCESSED_AT_NULL, "(processed_at) WHERE (processed_at IS NULL)"},
    {INDEX_SUFFIX_SCHEDULED_FOR,     "(scheduled_for ASC NULLS LAST) WHERE (processed_at IS NULL)"},
    {INDEX_SUFFIX_METADATA,          "USING GIN (metadata) WHERE processed_at IS NULL"},
};

} // namespace

QueueManager::QueueManager(std::shared_ptr<DatabasePool> db_pool, const PartmanConfig& partman_config)
    : db_pool_(db_pool),
      indexes_(db_pool),
      partitions_(db_pool, partman_config) {
}

void QueueManager::create_table(Transaction& tx, const SchemaName& schema, const QueueName& name,
                                bool partitioned) {
    std::string sql = "CREATE TABLE IF NOT EXISTS " + qualified_table(schema, name.str()) + R"( (
            id             UUID        NOT NULL DEFAULT gen_random_uuid(),
            created_at     TIMESTAMPTZ NOT NULL DEFAULT CURRENT_TIMESTAMP,
            started_at     TIMESTAMPTZ,
            locked_until   TIMESTAMPTZ,
            scheduled_for  TIMESTAMPTZ,
            processed_at   TIMESTAMPTZ,
            consumed_count INTEGER     NOT NULL DEFAULT 0,
            error_detail   TEXT,
            payload        JSONB       NOT NULL,
            metadata       JSONB       NOT NULL,
            )";

    if (partitioned) {
        // The partition key has to be part of every unique constraint
        sql += "PRIMARY KEY (id, created_at)) PARTITION BY RANGE (created_at)";
    } else {
        sql += "PRIMARY KEY (id))";
    }

    try {
        tx.execute(sql);
    } catch (const DatabaseError&) {
        rethrow_as<DdlError>("create_table", make_fqn(schema, name));
    }
}

void QueueManager::create_standard_indexes(Transaction& tx, const SchemaName& schema, const QueueName& name) {
    for (const auto& index : STANDARD_INDEXES) {
        std::string index_name = standard_index_name(name.str(), index.suffix);
        std::string sql = "CREATE INDEX IF NOT EXISTS " + quote_identifier(index_name) +
                          " ON " + qualified_table(schema, name.str()) + " " + index.definition;
        try {
            tx.execute(sql);
        } catch (const DatabaseError&) {
            rethrow_as<DdlError>(std::string("create_index") + index.suffix, make_fqn(schema, name));
        }
    }
}

void QueueManager::create_template(Transaction& tx, const SchemaName& schema, const QueueName& name) {
    Queue queue{name, schema, true};

    std::string sql = "CREATE TABLE IF NOT EXISTS " + qualified_table(schema, queue.template_name().str()) +
                      " (LIKE " + qualified_table(schema, name.str()) + " INCLUDING ALL)";
    try {
        tx.execute(sql);
    } catch (const DatabaseError&) {
        rethrow_as<DdlError>("create_template", queue.fqn());
    }
}

void QueueManager::create_ddl(const SchemaName& schema, const QueueName& name, bool partitioned) {
    FQN fqn = make_fqn(schema, name);

    try {
        Transaction tx(db_pool_.get());

        create_table(tx, schema, name, partitioned);
        create_standard_indexes(tx, schema, name);
        if (partitioned) {
            create_template(tx, schema, name);
        }

        tx.commit();
    } catch (const DatabaseError&) {
        rethrow_as<DdlError>("create_ddl", fqn);
    }
}

void QueueManager::ensure_absent(const SchemaName& schema, const QueueName& name) {
    validate_names(schema, name);
    check_standard_index_names(name);
    if (exists(schema, name)) {
        throw QueueExistsError(make_fqn(schema, name));
    }
}

void QueueManager::create_simple(const SchemaName& schema, const QueueName& name) {
    ensure_absent(schema, name);
    create_ddl(schema, name, false);
    spdlog::info("Created queue {}", make_fqn(schema, name).str());
}

void QueueManager::create_partitioned(const SchemaName& schema, const QueueName& name,
                                      const PartitionConfig& cfg) {
    FQN fqn = make_fqn(schema, name);

    ensure_absent(schema, name);
    create_ddl(schema, name, true);
    spdlog::info("Created partitioned queue {}", fqn.str());

    // pg_partman has to see the committed parent table
    try {
        partitions_.register_parent(schema, name, cfg);
    } catch (const PartmanError& e) {
        spdlog::error("Queue {} exists but is not registered with pg_partman: {}", fqn.str(), e.what());
        throw;
    }
}

bool QueueManager::exists(const SchemaName& schema, const QueueName& name) {
    try {
        auto result = db_pool_->execute(R"(
            SELECT EXISTS (
                SELECT 1 FROM pg_tables
                WHERE schemaname = $1 AND tablename = $2
            )
        )", {schema.str(), name.str()});
        return result.get_bool(0, 0);
    } catch (const DatabaseError&) {
        rethrow_as<DdlError>("check_exists", make_fqn(schema, name));
    }
}

bool QueueManager::is_partitioned(const SchemaName& schema, const QueueName& name) {
    try {
        auto result = db_pool_->execute(R"(
            SELECT EXISTS (
                SELECT 1 FROM pg_partitioned_table pt
                JOIN pg_class c ON pt.partrelid = c.oid
                JOIN pg_namespace n ON c.relnamespace = n.oid
                WHERE n.nspname = $1 AND c.relname = $2
            )
        )", {schema.str(), name.str()});
        return result.get_bool(0, 0);
    } catch (const DatabaseError&) {
        rethrow_as<DdlError>("check_partitioned", make_fqn(schema, name));
    }
}

Queue QueueManager::get(const SchemaName& schema, const QueueName& name) {
    if (!exists(schema, name)) {
        throw QueueNotFoundError(make_fqn(schema, name));
    }

    Queue queue;
    queue.name = name;
    queue.schema = schema;
    queue.partitioned = is_partitioned(schema, name);
    return queue;
}

void QueueManager::drop(const SchemaName& schema, const QueueName& name) {
    validate_names(schema, name);
    FQN fqn = make_fqn(schema, name);

    try {
        db_pool_->execute("DROP TABLE IF EXISTS " + qualified_table(schema, name.str()) + " CASCADE");
    } catch (const DatabaseError&) {
        rethrow_as<DdlError>("drop", fqn);
    }

    spdlog::info("Dropped queue {}", fqn.str());
}

void QueueManager::drop_template(const SchemaName& schema, const QueueName& name) {
    validate_names(schema, name);
    Queue queue{name, schema, true};

    try {
        db_pool_->execute("DROP TABLE IF EXISTS " + qualified_table(schema, queue.template_name().str()));
    } catch (const DatabaseError&) {
        rethrow_as<DdlError>("drop_template", queue.fqn());
    }
}

} // namespace pgq
