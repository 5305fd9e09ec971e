#pragma once

#include <string>
#include <vector>
#include <optional>
#include <utility>
#include <cstddef>

namespace pgq {

// ============================================================================
// Identifier & Name Model
// ============================================================================

// PostgreSQL identifier length limit (NAMEDATALEN - 1)
constexpr size_t MAX_IDENTIFIER_LENGTH = 63;

// Non-empty, at most 63 bytes, first character a letter or underscore
bool is_valid_identifier(const std::string& identifier);

// Double-quoted identifier with embedded quotes doubled, safe for interpolation
std::string quote_identifier(const std::string& identifier);

// A validated-on-demand identifier. The tag keeps queue and schema names
// from being mixed up at compile time.
template <typename Tag>
class Identifier {
private:
    std::string value_;

public:
    Identifier() = default;
    explicit Identifier(std::string value) : value_(std::move(value)) {}

    const std::string& str() const { return value_; }
    bool empty() const { return value_.empty(); }
    bool valid() const { return is_valid_identifier(value_); }
    std::string quoted() const { return quote_identifier(value_); }

    bool operator==(const Identifier& other) const { return value_ == other.value_; }
    bool operator!=(const Identifier& other) const { return value_ != other.value_; }
};

struct QueueNameTag {};
struct SchemaNameTag {};

using QueueName = Identifier<QueueNameTag>;
using SchemaName = Identifier<SchemaNameTag>;

// Fully qualified name: "schema.queue"
class FQN {
private:
    std::string value_;

public:
    FQN() = default;
    explicit FQN(std::string value) : value_(std::move(value)) {}

    const std::string& str() const { return value_; }

    // Splits at the first '.'; throws std::invalid_argument when there is none
    std::pair<SchemaName, QueueName> split() const;

    bool operator==(const FQN& other) const { return value_ == other.value_; }
    bool operator!=(const FQN& other) const { return value_ != other.value_; }
};

FQN make_fqn(const SchemaName& schema, const QueueName& name);

// "<schema>"."<name>" for use in DDL
std::string qualified_table(const SchemaName& schema, const std::string& table);

// Throws std::invalid_argument unless both names are valid identifiers and the
// schema has no '.' (so the FQN splits back into the same pair)
void validate_names(const SchemaName& schema, const QueueName& name);

// ============================================================================
// Queue
// ============================================================================

// Observed state of a queue table, always produced by probing the catalog
struct Queue {
    QueueName name;
    SchemaName schema;
    bool partitioned = false;

    FQN fqn() const { return make_fqn(schema, name); }
    QueueName template_name() const {
        std::string table = name.str() + "_template";
        if (table.size() > MAX_IDENTIFIER_LENGTH) {
            table.resize(MAX_IDENTIFIER_LENGTH);
        }
        return QueueName(table);
    }
    FQN template_fqn() const { return make_fqn(schema, template_name()); }
};

// ============================================================================
// Custom indexes
// ============================================================================

enum class IndexType {
    BTree,
    Gin,
    Gist,
    Hash,
    Brin
};

const char* to_string(IndexType type);

// Accepts "btree", "gin", "gist", "hash", "brin" (case-insensitive); empty means btree
std::optional<IndexType> parse_index_type(const std::string& text);

struct CustomIndex {
    std::string name;                 // empty: derived by generate_index_name
    std::vector<std::string> columns; // column expressions, order matters
    IndexType type = IndexType::BTree;
    std::string where;                // partial index predicate, empty for none
};

// ============================================================================
// Partitioning
// ============================================================================

struct PartitionConfig {
    std::string interval = "1 day";
    int premake = 7;
    std::string retention = "14 days";
    std::string datetime_string = "YYYYMMDD";
    int optimize_constraint = 30;
    // Read back from the catalog (child named *_default), never stored in part_config
    bool default_partition = true;
};

// ============================================================================
// Declarative resource
// ============================================================================

// Desired state of a queue
struct QueueSpec {
    SchemaName schema{"public"};
    QueueName name;
    bool partitioned = false;
    PartitionConfig partition;
    std::vector<CustomIndex> custom_indexes;

    FQN fqn() const { return make_fqn(schema, name); }
};

// Observed state of a queue
struct QueueState {
    Queue queue;
    std::optional<PartitionConfig> partition;  // only for partitioned queues
    std::vector<CustomIndex> custom_indexes;
};

} // namespace pgq
