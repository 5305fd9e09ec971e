#include "pgq/queue_resource.hpp"
#include "pgq/errors.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace pgq {

namespace {

// Fields that live in part_config
bool stored_settings_equal(const PartitionConfig& a, const PartitionConfig& b) {
    return a.interval == b.interval &&
           a.premake == b.premake &&
           a.retention == b.retention &&
           a.datetime_string == b.datetime_string &&
           a.optimize_constraint == b.optimize_constraint;
}

} // namespace

// AdvisoryLock Implementation
AdvisoryLock::AdvisoryLock(DatabasePool* pool, const FQN& fqn)
    : conn_(pool), key_(fqn.str()) {
    conn_->execute("SELECT pg_advisory_lock(hashtext($1))", {key_});
    spdlog::debug("Acquired advisory lock for {}", key_);
}

AdvisoryLock::~AdvisoryLock() {
    try {
        conn_->execute("SELECT pg_advisory_unlock(hashtext($1))", {key_});
    } catch (const std::exception& e) {
        // Lock will be released when connection closes anyway
        spdlog::debug("Failed to release advisory lock for {}: {}", key_, e.what());
    }
}

const char* to_string(ApplyAction action) {
    switch (action) {
        case ApplyAction::Created:   return "created";
        case ApplyAction::Updated:   return "updated";
        case ApplyAction::Unchanged: return "unchanged";
    }
    return "unchanged";
}

// QueueResource Implementation
QueueResource::QueueResource(std::shared_ptr<QueueManager> manager, bool serialize_by_name)
    : manager_(std::move(manager)), serialize_by_name_(serialize_by_name) {
    if (!manager_) {
        throw std::invalid_argument("Queue manager cannot be null");
    }
}

std::unique_ptr<AdvisoryLock> QueueResource::lock_for(const FQN& fqn) {
    if (!serialize_by_name_) {
        return nullptr;
    }
    try {
        return std::make_unique<AdvisoryLock>(manager_->get_db_pool().get(), fqn);
    } catch (const DatabaseError&) {
        rethrow_as<DdlError>("advisory_lock", fqn);
    }
}

QueueState QueueResource::create_unlocked(const QueueSpec& spec) {
    FQN fqn = spec.fqn();

    spdlog::debug("Creating queue {} (partitioned={})", fqn.str(), spec.partitioned);

    if (spec.partitioned) {
        manager_->create_partitioned(spec.schema, spec.name, spec.partition);
    } else {
        manager_->create_simple(spec.schema, spec.name);
    }

    // Own transaction: the queue itself is already committed at this point
    if (!spec.custom_indexes.empty()) {
        try {
            Transaction tx(manager_->get_db_pool().get());
            manager_->indexes().create(tx, spec.schema, spec.name, spec.custom_indexes);
            tx.commit();
        } catch (const DatabaseError&) {
            rethrow_as<DdlError>("create_custom_indexes", fqn);
        }
        spdlog::info("Created {} custom index(es) on {}", spec.custom_indexes.size(), fqn.str());
    }

    auto state = read(spec.schema, spec.name);
    if (!state) {
        throw QueueNotFoundError(fqn);
    }
    return *state;
}

QueueState QueueResource::create(const QueueSpec& spec) {
    validate_names(spec.schema, spec.name);
    auto lock = lock_for(spec.fqn());
    return create_unlocked(spec);
}

std::optional<QueueState> QueueResource::read(const SchemaName& schema, const QueueName& name) {
    validate_names(schema, name);
    FQN fqn = make_fqn(schema, name);

    QueueState state;
    try {
        state.queue = manager_->get(schema, name);
    } catch (const QueueNotFoundError&) {
        return std::nullopt;
    }

    if (state.queue.partitioned) {
        try {
            state.partition = manager_->partitions().get_partition_config(schema, name);
        } catch (const PartmanError& e) {
            spdlog::warn("Failed to read partition config for {}: {}", fqn.str(), e.what());
        }
    }

    try {
        state.custom_indexes = manager_->indexes().get(schema, name);
    } catch (const DdlError& e) {
        spdlog::warn("Failed to read custom indexes for {}: {}", fqn.str(), e.what());
    }

    return state;
}

bool QueueResource::update_unlocked(const QueueState& observed, const QueueSpec& plan) {
    FQN fqn = plan.fqn();
    bool changed = false;

    if (observed.queue.partitioned && plan.partitioned) {
        if (!observed.partition || !stored_settings_equal(*observed.partition, plan.partition)) {
            manager_->partitions().update_partition_config(plan.schema, plan.name, plan.partition);
            changed = true;
        }
        if (observed.partition && observed.partition->default_partition != plan.partition.default_partition) {
            spdlog::warn("default_partition of {} can only be chosen at creation; requested {} but the queue has {}",
                         fqn.str(), plan.partition.default_partition, observed.partition->default_partition);
        }
    }

    // Compare in the catalog's own rendering so equivalent definitions match
    auto planned = manager_->indexes().canonicalize(plan.schema, plan.name, plan.custom_indexes);
    auto changes = plan_index_changes(plan.name.str(), observed.custom_indexes, planned);
    if (!changes.empty()) {
        manager_->indexes().apply(plan.schema, plan.name, changes);
        changed = true;
    }

    return changed;
}

bool QueueResource::update(const QueueState& observed, const QueueSpec& plan) {
    validate_names(plan.schema, plan.name);
    return update_unlocked(observed, plan);
}

void QueueResource::remove(const SchemaName& schema, const QueueName& name, bool partitioned) {
    validate_names(schema, name);

    if (partitioned) {
        // The table drop is authoritative; a stale part_config row is only logged
        try {
            manager_->partitions().remove_partman_config(schema, name);
        } catch (const PartmanError& e) {
            spdlog::warn("Failed to remove pg_partman config for {}: {}", make_fqn(schema, name).str(), e.what());
        }
    }

    manager_->drop(schema, name);

    if (partitioned) {
        manager_->drop_template(schema, name);
    }
}

ApplyResult QueueResource::apply(const QueueSpec& spec) {
    validate_names(spec.schema, spec.name);
    FQN fqn = spec.fqn();
    auto lock = lock_for(fqn);

    ApplyResult result;

    auto observed = read(spec.schema, spec.name);
    if (!observed) {
        result.action = ApplyAction::Created;
        result.state = create_unlocked(spec);
        return result;
    }

    if (observed->queue.partitioned != spec.partitioned) {
        throw std::invalid_argument("partitioning of " + fqn.str() +
                                    " cannot be changed in place; delete and recreate the queue");
    }

    if (!update_unlocked(*observed, spec)) {
        result.action = ApplyAction::Unchanged;
        result.state = *observed;
        return result;
    }

    auto refreshed = read(spec.schema, spec.name);
    if (!refreshed) {
        throw QueueNotFoundError(fqn);
    }
    result.action = ApplyAction::Updated;
    result.state = *refreshed;
    return result;
}

} // namespace pgq
