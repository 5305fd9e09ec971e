#pragma once

#include "pgq/database.hpp"
#include "pgq/queue_manager.hpp"
#include "pgq/queue_types.hpp"
#include <memory>
#include <optional>
#include <string>

namespace pgq {

// Session-level advisory lock keyed by hashtext(fqn), held on its own pooled
// connection until destruction
class AdvisoryLock {
private:
    ScopedConnection conn_;
    std::string key_;

public:
    AdvisoryLock(DatabasePool* pool, const FQN& fqn);
    ~AdvisoryLock();

    AdvisoryLock(const AdvisoryLock&) = delete;
    AdvisoryLock& operator=(const AdvisoryLock&) = delete;
};

enum class ApplyAction {
    Created,
    Updated,
    Unchanged
};

const char* to_string(ApplyAction action);

struct ApplyResult {
    ApplyAction action = ApplyAction::Unchanged;
    QueueState state;
};

/**
 * QueueResource - declarative create/read/update/delete of a queue
 *
 * Maps a desired QueueSpec onto QueueManager, IndexManager and
 * PartitionManager. Reads are always fresh from the catalog; updates diff
 * the observed state against the plan and touch only what changed.
 */
class QueueResource {
private:
    std::shared_ptr<QueueManager> manager_;
    bool serialize_by_name_;

    std::unique_ptr<AdvisoryLock> lock_for(const FQN& fqn);
    QueueState create_unlocked(const QueueSpec& spec);
    bool update_unlocked(const QueueState& observed, const QueueSpec& plan);

public:
    // With serialize_by_name, create/apply on the same FQN are mutually exclusive
    // across processes
    explicit QueueResource(std::shared_ptr<QueueManager> manager, bool serialize_by_name = true);

    // Throws QueueExistsError when the table is already there
    QueueState create(const QueueSpec& spec);

    // nullopt when the queue is gone. Partition config and custom index read
    // failures are logged and leave that part of the state empty.
    std::optional<QueueState> read(const SchemaName& schema, const QueueName& name);

    // Returns true when anything was changed
    bool update(const QueueState& observed, const QueueSpec& plan);

    // Unregisters from pg_partman (best effort) and drops the table
    void remove(const SchemaName& schema, const QueueName& name, bool partitioned);

    // Create when absent, otherwise update in place. Switching partitioning on
    // or off is not possible in place and throws std::invalid_argument.
    ApplyResult apply(const QueueSpec& spec);
};

} // namespace pgq
