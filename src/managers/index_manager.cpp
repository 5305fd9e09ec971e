#include "pgq/index_manager.hpp"
#include "pgq/errors.hpp"
#include <spdlog/spdlog.h>
#include <openssl/evp.h>
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <map>
#include <set>
#include <sstream>
#include <stdexcept>

namespace pgq {

namespace {

constexpr size_t MAX_COLUMN_NAME_LENGTH = 20;
constexpr size_t NAME_HASH_LENGTH = 8;

std::string sha256_hex(const std::string& data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;

    if (EVP_Digest(data.data(), data.size(), digest, &digest_len, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("SHA-256 digest failed");
    }

    std::ostringstream hex;
    hex << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < digest_len; ++i) {
        hex << std::setw(2) << static_cast<int>(digest[i]);
    }
    return hex.str();
}

std::string join(const std::vector<std::string>& parts, const std::string& separator) {
    std::string joined;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) joined += separator;
        joined += parts[i];
    }
    return joined;
}

std::string clean_column(const std::string& column) {
    std::string clean;
    clean.reserve(column.size());

    for (size_t i = 0; i < column.size();) {
        if (column.compare(i, 3, "->>") == 0) {
            clean += '_';
            i += 3;
        } else if (column.compare(i, 2, "->") == 0) {
            clean += '_';
            i += 2;
        } else {
            char c = column[i++];
            switch (c) {
                case '(': case ')': case '\'': case '"':
                    break;
                case ' ':
                    clean += '_';
                    break;
                default:
                    clean += c;
            }
        }
    }

    if (clean.size() > MAX_COLUMN_NAME_LENGTH) {
        clean.resize(MAX_COLUMN_NAME_LENGTH);
    }
    return clean;
}

std::string trim(const std::string& text) {
    auto begin = std::find_if_not(text.begin(), text.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(text.rbegin(), text.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

std::string to_upper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

// The catalog wraps predicates in one pair of parentheses: "(processed_at IS NULL)"
std::string normalize_predicate(const std::string& predicate) {
    std::string text = trim(predicate);
    if (text.size() < 2 || text.front() != '(' || text.back() != ')') {
        return text;
    }

    // Only strip when the outer pair encloses the whole expression
    int depth = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '(') ++depth;
        else if (text[i] == ')') --depth;
        if (depth == 0 && i + 1 < text.size()) {
            return text;
        }
    }
    return trim(text.substr(1, text.size() - 2));
}

std::vector<std::string> split_columns(const std::string& text) {
    std::vector<std::string> columns;
    size_t start = 0;
    while (true) {
        size_t pos = text.find(", ", start);
        if (pos == std::string::npos) {
            columns.push_back(text.substr(start));
            break;
        }
        columns.push_back(text.substr(start, pos - start));
        start = pos + 2;
    }
    return columns;
}

constexpr const char* CANONICAL_TABLE = "pgq_canonical";

void check_index(const FQN& fqn, const CustomIndex& index) {
    if (index.columns.empty()) {
        throw std::invalid_argument("custom index on " + fqn.str() + " has no columns");
    }
    if (!index.name.empty() && !is_valid_identifier(index.name)) {
        throw std::invalid_argument("invalid index name: '" + index.name + "'");
    }
}

// CREATE INDEX <index_name> ON <table> [USING <type>] (<columns>) [WHERE <predicate>]
std::string create_index_sql(const std::string& index_name, const std::string& table,
                             const CustomIndex& index, bool if_not_exists) {
    std::string sql = if_not_exists ? "CREATE INDEX IF NOT EXISTS " : "CREATE INDEX ";
    sql += quote_identifier(index_name) + " ON " + table;
    if (index.type != IndexType::BTree) {
        sql += " USING ";
        sql += to_string(index.type);
    }
    sql += " (" + join(index.columns, ", ") + ")";
    if (!index.where.empty()) {
        sql += " WHERE " + index.where;
    }
    return sql;
}

} // namespace

std::string standard_index_name(const std::string& table, const char* suffix) {
    std::string name = table + suffix;
    if (name.size() > MAX_IDENTIFIER_LENGTH) {
        name.resize(MAX_IDENTIFIER_LENGTH);
    }
    return name;
}

void check_standard_index_names(const QueueName& name) {
    std::set<std::string> seen = {name.str()};
    for (const char* suffix : STANDARD_INDEX_SUFFIXES) {
        if (!seen.insert(standard_index_name(name.str(), suffix)).second) {
            throw std::invalid_argument("queue name '" + name.str() + "' is too long: its standard index names "
                                        "collide once cut to " + std::to_string(MAX_IDENTIFIER_LENGTH) + " bytes");
        }
    }
}

std::string generate_index_name(const std::string& table,
                                const std::vector<std::string>& columns,
                                IndexType type) {
    std::vector<std::string> parts = {table};
    for (const auto& column : columns) {
        parts.push_back(clean_column(column));
    }

    std::string name = join(parts, "_");

    if (type != IndexType::BTree) {
        name += "_";
        name += to_string(type);
    }

    name += "_" + sha256_hex(join(columns, ",")).substr(0, NAME_HASH_LENGTH);
    name += "_idx";

    if (name.size() > MAX_IDENTIFIER_LENGTH) {
        name.resize(MAX_IDENTIFIER_LENGTH);
    }
    return name;
}

std::string resolved_index_name(const std::string& table, const CustomIndex& index) {
    if (!index.name.empty()) {
        return index.name;
    }
    return generate_index_name(table, index.columns, index.type);
}

CustomIndex parse_index_definition(const std::string& name, const std::string& definition) {
    CustomIndex index;
    index.name = name;

    // e.g. CREATE INDEX q_x ON public.q USING gin (metadata) WHERE (processed_at IS NULL)
    auto using_pos = definition.find(" USING ");
    if (using_pos != std::string::npos) {
        size_t start = using_pos + 7;
        size_t end = definition.find(' ', start);
        auto parsed = parse_index_type(definition.substr(start, end == std::string::npos ? std::string::npos : end - start));
        index.type = parsed.value_or(IndexType::BTree);
    }

    std::string head = definition;
    auto where_pos = to_upper(definition).find(" WHERE ");
    if (where_pos != std::string::npos) {
        index.where = trim(definition.substr(where_pos + 7));
        head = definition.substr(0, where_pos);
    }

    auto open = head.find('(');
    auto close = head.rfind(')');
    if (open != std::string::npos && close != std::string::npos && close > open) {
        index.columns = split_columns(head.substr(open + 1, close - open - 1));
    }

    return index;
}

bool indexes_equal(const CustomIndex& a, const CustomIndex& b) {
    if (a.name != b.name) {
        return false;
    }
    return a.type == b.type &&
           normalize_predicate(a.where) == normalize_predicate(b.where) &&
           a.columns == b.columns;
}

IndexChanges plan_index_changes(const std::string& table,
                                const std::vector<CustomIndex>& state,
                                const std::vector<CustomIndex>& plan) {
    std::map<std::string, CustomIndex> state_map;
    for (const auto& index : state) {
        state_map[index.name] = index;
    }

    std::map<std::string, CustomIndex> plan_map;
    for (const auto& index : plan) {
        CustomIndex resolved = index;
        resolved.name = resolved_index_name(table, index);
        plan_map[resolved.name] = resolved;
    }

    IndexChanges changes;

    for (const auto& [name, state_index] : state_map) {
        auto it = plan_map.find(name);
        if (it == plan_map.end() || !indexes_equal(state_index, it->second)) {
            changes.to_drop.push_back(name);
        }
    }

    for (const auto& [name, plan_index] : plan_map) {
        auto it = state_map.find(name);
        if (it == state_map.end() || !indexes_equal(it->second, plan_index)) {
            changes.to_create.push_back(plan_index);
        }
    }

    return changes;
}

IndexManager::IndexManager(std::shared_ptr<DatabasePool> db_pool)
    : db_pool_(std::move(db_pool)) {
    if (!db_pool_) {
        throw std::invalid_argument("Database pool cannot be null");
    }
}

void IndexManager::create(Transaction& tx, const SchemaName& schema, const QueueName& name,
                          const std::vector<CustomIndex>& indexes) {
    FQN fqn = make_fqn(schema, name);

    for (const auto& index : indexes) {
        check_index(fqn, index);

        std::string index_name = resolved_index_name(name.str(), index);
        std::string sql = create_index_sql(index_name, qualified_table(schema, name.str()), index, true);

        spdlog::debug("{}: {}", fqn.str(), sql);

        try {
            tx.execute(sql);
        } catch (const DatabaseError&) {
            rethrow_as<DdlError>("create_custom_index_" + index_name, fqn);
        }
    }
}

std::vector<CustomIndex> IndexManager::get(const SchemaName& schema, const QueueName& name) {
    FQN fqn = make_fqn(schema, name);

    std::string sql = R"(
        SELECT
            i.relname AS index_name,
            pg_get_indexdef(i.oid) AS index_def
        FROM pg_index x
        JOIN pg_class t ON t.oid = x.indrelid
        JOIN pg_class i ON i.oid = x.indexrelid
        JOIN pg_namespace n ON n.oid = t.relnamespace
        WHERE n.nspname = $1
          AND t.relname = $2
          AND i.relname NOT LIKE '%\_pkey'
          AND i.relname NOT IN ($3, $4, $5, $6)
        ORDER BY i.relname
    )";

    std::vector<CustomIndex> indexes;
    try {
        auto result = db_pool_->execute(sql, {
            schema.str(),
            name.str(),
            standard_index_name(name.str(), INDEX_SUFFIX_CREATED_AT),
            standard_index_name(name.str(), INDEX_SUFFIX_PROCESSED_AT_NULL),
            standard_index_name(name.str(), INDEX_SUFFIX_SCHEDULED_FOR),
            standard_index_name(name.str(), INDEX_SUFFIX_METADATA)
        });

        for (int row = 0; row < result.num_rows(); ++row) {
            indexes.push_back(parse_index_definition(result.get_value(row, 0), result.get_value(row, 1)));
        }
    } catch (const DatabaseError&) {
        rethrow_as<DdlError>("get_custom_indexes", fqn);
    }

    return indexes;
}

std::vector<CustomIndex> IndexManager::canonicalize(const SchemaName& schema, const QueueName& name,
                                                    const std::vector<CustomIndex>& indexes) {
    FQN fqn = make_fqn(schema, name);
    std::vector<CustomIndex> canonical;

    if (indexes.empty()) {
        return canonical;
    }

    for (const auto& index : indexes) {
        check_index(fqn, index);
    }

    try {
        Transaction tx(db_pool_.get());
        tx.execute("CREATE TEMP TABLE " + quote_identifier(CANONICAL_TABLE) +
                   " (LIKE " + qualified_table(schema, name.str()) + ")");

        for (size_t i = 0; i < indexes.size(); ++i) {
            std::string scratch_name = std::string(CANONICAL_TABLE) + "_" + std::to_string(i);
            tx.execute(create_index_sql(scratch_name, "pg_temp." + quote_identifier(CANONICAL_TABLE),
                                        indexes[i], false));

            auto result = tx.execute("SELECT pg_get_indexdef($1::regclass)",
                                     {"pg_temp." + quote_identifier(scratch_name)});
            canonical.push_back(parse_index_definition(resolved_index_name(name.str(), indexes[i]),
                                                       result.get_value(0, 0)));
        }

        tx.rollback();
    } catch (const DatabaseError&) {
        rethrow_as<DdlError>("canonicalize_custom_indexes", fqn);
    }

    return canonical;
}

void IndexManager::drop(const SchemaName& schema, const QueueName& name,
                        const std::vector<std::string>& index_names) {
    FQN fqn = make_fqn(schema, name);

    for (const auto& index_name : index_names) {
        std::string sql = "DROP INDEX IF EXISTS " + qualified_table(schema, index_name);
        spdlog::debug("{}: {}", fqn.str(), sql);

        try {
            db_pool_->execute(sql);
        } catch (const DatabaseError&) {
            rethrow_as<DdlError>("drop_custom_index_" + index_name, fqn);
        }
    }
}

void IndexManager::apply(const SchemaName& schema, const QueueName& name, const IndexChanges& changes) {
    FQN fqn = make_fqn(schema, name);

    if (!changes.to_drop.empty()) {
        drop(schema, name, changes.to_drop);
        spdlog::info("Dropped {} custom index(es) on {}", changes.to_drop.size(), fqn.str());
    }

    if (changes.to_create.empty()) {
        return;
    }

    try {
        Transaction tx(db_pool_.get());
        create(tx, schema, name, changes.to_create);
        tx.commit();
    } catch (const DatabaseError&) {
        rethrow_as<DdlError>("create_custom_indexes", fqn);
    }

    spdlog::info("Created {} custom index(es) on {}", changes.to_create.size(), fqn.str());
}

} // namespace pgq
