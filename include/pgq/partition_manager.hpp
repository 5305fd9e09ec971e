#pragma once

#include "pgq/config.hpp"
#include "pgq/database.hpp"
#include "pgq/queue_types.hpp"
#include <memory>
#include <string>

namespace pgq {

/**
 * PartitionManager - bridge to the pg_partman extension
 *
 * Registers partitioned queue tables with pg_partman and reads/updates their
 * row in part_config. Every failure surfaces as PartmanError.
 *
 * Only interval, premake, retention, datetime_string and optimize_constraint
 * live in part_config. Whether a default partition exists is a property of
 * the table tree and is probed from pg_inherits on every read; it can only be
 * chosen at registration time.
 */
class PartitionManager {
private:
    std::shared_ptr<DatabasePool> db_pool_;
    PartmanConfig config_;

    std::string function(const std::string& name) const;
    std::string part_config_table() const;

public:
    PartitionManager(std::shared_ptr<DatabasePool> db_pool, const PartmanConfig& config = PartmanConfig{});

    // create_parent followed by the part_config fix-up, in one transaction.
    // The parent table must already be committed.
    void register_parent(const SchemaName& schema, const QueueName& name, const PartitionConfig& cfg);

    PartitionConfig get_partition_config(const SchemaName& schema, const QueueName& name);

    // Leaves default_partition alone and does not re-register
    void update_partition_config(const SchemaName& schema, const QueueName& name, const PartitionConfig& cfg);

    // undo_partition without keeping the table
    void remove_partman_config(const SchemaName& schema, const QueueName& name);
};

} // namespace pgq
