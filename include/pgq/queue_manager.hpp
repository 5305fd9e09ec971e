#pragma once

#include "pgq/config.hpp"
#include "pgq/database.hpp"
#include "pgq/index_manager.hpp"
#include "pgq/partition_manager.hpp"
#include "pgq/queue_types.hpp"
#include <memory>

namespace pgq {

/**
 * QueueManager - lifecycle of queue tables
 *
 * Every queue is a table with a fixed column set and four standard indexes.
 * Partitioned queues are range-partitioned on created_at, get a
 * <name>_template table and are handed to pg_partman.
 *
 * Nothing is cached: every read goes to the catalog.
 */
class QueueManager {
private:
    std::shared_ptr<DatabasePool> db_pool_;
    IndexManager indexes_;
    PartitionManager partitions_;

    void create_table(Transaction& tx, const SchemaName& schema, const QueueName& name, bool partitioned);
    void create_standard_indexes(Transaction& tx, const SchemaName& schema, const QueueName& name);
    void create_template(Transaction& tx, const SchemaName& schema, const QueueName& name);

    // Table, standard indexes and (if partitioned) template in one transaction
    void create_ddl(const SchemaName& schema, const QueueName& name, bool partitioned);
    void ensure_absent(const SchemaName& schema, const QueueName& name);

public:
    explicit QueueManager(std::shared_ptr<DatabasePool> db_pool,
                          const PartmanConfig& partman_config = PartmanConfig{});

    void create_simple(const SchemaName& schema, const QueueName& name);

    // The DDL commits before pg_partman registration starts. If registration
    // fails the table stays, unregistered, and PartmanError is thrown.
    void create_partitioned(const SchemaName& schema, const QueueName& name, const PartitionConfig& cfg);

    bool exists(const SchemaName& schema, const QueueName& name);
    bool is_partitioned(const SchemaName& schema, const QueueName& name);

    // Throws QueueNotFoundError
    Queue get(const SchemaName& schema, const QueueName& name);

    // DROP TABLE IF EXISTS ... CASCADE
    void drop(const SchemaName& schema, const QueueName& name);

    // The template is not a dependent of the parent, so CASCADE leaves it behind
    void drop_template(const SchemaName& schema, const QueueName& name);

    IndexManager& indexes() { return indexes_; }
    PartitionManager& partitions() { return partitions_; }
    std::shared_ptr<DatabasePool> get_db_pool() const { return db_pool_; }
};

} // namespace pgq
