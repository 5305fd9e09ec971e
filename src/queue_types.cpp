#include "pgq/queue_types.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace pgq {

bool is_valid_identifier(const std::string& identifier) {
    if (identifier.empty() || identifier.size() > MAX_IDENTIFIER_LENGTH) {
        return false;
    }
    unsigned char first = static_cast<unsigned char>(identifier[0]);
    return (first >= 'a' && first <= 'z') || (first >= 'A' && first <= 'Z') || first == '_';
}

std::string quote_identifier(const std::string& identifier) {
    std::string quoted;
    quoted.reserve(identifier.size() + 2);
    quoted += '"';
    for (char c : identifier) {
        if (c == '"') {
            quoted += '"';
        }
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

std::pair<SchemaName, QueueName> FQN::split() const {
    auto pos = value_.find('.');
    if (pos == std::string::npos) {
        throw std::invalid_argument("invalid FQN format: " + value_ + " (expected schema.queue)");
    }
    return {SchemaName(value_.substr(0, pos)), QueueName(value_.substr(pos + 1))};
}

FQN make_fqn(const SchemaName& schema, const QueueName& name) {
    return FQN(schema.str() + "." + name.str());
}

std::string qualified_table(const SchemaName& schema, const std::string& table) {
    return schema.quoted() + "." + quote_identifier(table);
}

void validate_names(const SchemaName& schema, const QueueName& name) {
    if (!schema.valid()) {
        throw std::invalid_argument("invalid schema name: '" + schema.str() + "'");
    }
    // FQN::split cuts at the first '.'
    if (schema.str().find('.') != std::string::npos) {
        throw std::invalid_argument("schema name must not contain '.': '" + schema.str() + "'");
    }
    if (!name.valid()) {
        throw std::invalid_argument("invalid queue name: '" + name.str() + "'");
    }
}

const char* to_string(IndexType type) {
    switch (type) {
        case IndexType::BTree: return "btree";
        case IndexType::Gin:   return "gin";
        case IndexType::Gist:  return "gist";
        case IndexType::Hash:  return "hash";
        case IndexType::Brin:  return "brin";
    }
    return "btree";
}

std::optional<IndexType> parse_index_type(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower.empty() || lower == "btree") return IndexType::BTree;
    if (lower == "gin") return IndexType::Gin;
    if (lower == "gist") return IndexType::Gist;
    if (lower == "hash") return IndexType::Hash;
    if (lower == "brin") return IndexType::Brin;
    return std::nullopt;
}

} // namespace pgq
