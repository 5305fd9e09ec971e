#pragma once

#include "pgq/database.hpp"
#include "pgq/queue_types.hpp"
#include <memory>
#include <string>
#include <vector>

namespace pgq {

// Suffixes of the four indexes every queue table gets. Indexes named
// standard_index_name(queue, suffix) are never reported or touched as custom indexes.
constexpr const char* INDEX_SUFFIX_CREATED_AT = "_created_at_idx";
constexpr const char* INDEX_SUFFIX_PROCESSED_AT_NULL = "_processed_at_null_idx";
constexpr const char* INDEX_SUFFIX_SCHEDULED_FOR = "_scheduled_for_idx";
constexpr const char* INDEX_SUFFIX_METADATA = "_metadata_idx";

constexpr const char* STANDARD_INDEX_SUFFIXES[] = {
    INDEX_SUFFIX_CREATED_AT,
    INDEX_SUFFIX_PROCESSED_AT_NULL,
    INDEX_SUFFIX_SCHEDULED_FOR,
    INDEX_SUFFIX_METADATA
};

// <table><suffix> cut to 63 bytes, the name PostgreSQL stores the index under
std::string standard_index_name(const std::string& table, const char* suffix);

// Throws std::invalid_argument when truncation makes the standard index names
// of a queue collide with each other or with the table
void check_standard_index_names(const QueueName& name);

/**
 * Deterministic name for an unnamed index:
 *   <table>_<col1>_..._<colN>[_<type>]_<sha256(cols joined by ",")[0:8]>_idx
 * Each column is stripped of ( ) ' ", JSON operators and spaces become "_",
 * and it is cut to 20 bytes. The result is cut to 63 bytes. The hash is
 * taken over the original expressions so columns that collapse to the same
 * cleaned prefix still get distinct names.
 *
 * Changing this function renames every generated index.
 */
std::string generate_index_name(const std::string& table,
                                const std::vector<std::string>& columns,
                                IndexType type);

// Name the index will be created under
std::string resolved_index_name(const std::string& table, const CustomIndex& index);

// Rebuild a CustomIndex from pg_get_indexdef() output
CustomIndex parse_index_definition(const std::string& name, const std::string& definition);

// Same name, type, predicate and (ordered) columns
bool indexes_equal(const CustomIndex& a, const CustomIndex& b);

struct IndexChanges {
    std::vector<std::string> to_drop;
    std::vector<CustomIndex> to_create;  // names always resolved

    bool empty() const { return to_drop.empty() && to_create.empty(); }
};

// Diff keyed by index name. Changed indexes show up in both lists: indexes
// cannot be altered, so they are dropped and recreated under the same name.
IndexChanges plan_index_changes(const std::string& table,
                                const std::vector<CustomIndex>& state,
                                const std::vector<CustomIndex>& plan);

class IndexManager {
private:
    std::shared_ptr<DatabasePool> db_pool_;

public:
    explicit IndexManager(std::shared_ptr<DatabasePool> db_pool);

    // Runs inside the caller's transaction; batch atomicity is the caller's call
    void create(Transaction& tx, const SchemaName& schema, const QueueName& name,
                const std::vector<CustomIndex>& indexes);

    std::vector<CustomIndex> get(const SchemaName& schema, const QueueName& name);

    // Planned indexes as the catalog would report them. Each one is built on an
    // empty temporary copy of the table and read back through pg_get_indexdef
    // inside a transaction that is rolled back. Names are resolved from the
    // planned columns.
    std::vector<CustomIndex> canonicalize(const SchemaName& schema, const QueueName& name,
                                          const std::vector<CustomIndex>& indexes);

    // One DROP INDEX IF EXISTS per name, each outside any transaction
    void drop(const SchemaName& schema, const QueueName& name,
              const std::vector<std::string>& index_names);

    // Drops first, then creates the new set in one transaction
    void apply(const SchemaName& schema, const QueueName& name, const IndexChanges& changes);
};

} // namespace pgq
