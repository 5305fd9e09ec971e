#include "pgq/queue_spec_json.hpp"
#include <stdexcept>
#include <string>

namespace pgq {

namespace {

template <typename T>
T value_or(const nlohmann::json& j, const char* key, const T& default_value) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return default_value;
    }
    return it->get<T>();
}

CustomIndex custom_index_from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("custom_index entries must be objects");
    }

    CustomIndex index;
    index.name = value_or<std::string>(j, "name", "");
    index.where = value_or<std::string>(j, "where", "");

    std::string type = value_or<std::string>(j, "type", "btree");
    auto parsed = parse_index_type(type);
    if (!parsed) {
        throw std::invalid_argument("unsupported index type '" + type +
                                    "' (expected btree, gin, gist, hash or brin)");
    }
    index.type = *parsed;

    auto columns = j.find("columns");
    if (columns == j.end() || !columns->is_array() || columns->empty()) {
        throw std::invalid_argument("custom_index requires a non-empty \"columns\" list");
    }
    index.columns = columns->get<std::vector<std::string>>();

    return index;
}

} // namespace

QueueSpec queue_spec_from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("queue spec must be a JSON object");
    }

    QueueSpec spec;
    try {
        auto name = j.find("name");
        if (name == j.end() || !name->is_string()) {
            throw std::invalid_argument("queue spec requires a string \"name\"");
        }
        spec.name = QueueName(name->get<std::string>());
        spec.schema = SchemaName(value_or<std::string>(j, "schema", "public"));
        spec.partitioned = value_or<bool>(j, "enable_partitioning", false);

        PartitionConfig defaults;
        spec.partition.interval = value_or<std::string>(j, "partition_interval", defaults.interval);
        spec.partition.premake = value_or<int>(j, "partition_premake", defaults.premake);
        spec.partition.retention = value_or<std::string>(j, "retention_period", defaults.retention);
        spec.partition.datetime_string = value_or<std::string>(j, "datetime_string", defaults.datetime_string);
        spec.partition.optimize_constraint = value_or<int>(j, "optimize_constraint", defaults.optimize_constraint);
        spec.partition.default_partition = value_or<bool>(j, "default_partition", defaults.default_partition);

        auto indexes = j.find("custom_index");
        if (indexes != j.end() && !indexes->is_null()) {
            if (!indexes->is_array()) {
                throw std::invalid_argument("\"custom_index\" must be a list");
            }
            for (const auto& entry : *indexes) {
                spec.custom_indexes.push_back(custom_index_from_json(entry));
            }
        }
    } catch (const nlohmann::json::exception& e) {
        throw std::invalid_argument(std::string("malformed queue spec: ") + e.what());
    }

    validate_names(spec.schema, spec.name);
    if (spec.partitioned && spec.partition.interval.empty()) {
        throw std::invalid_argument("partition_interval of " + spec.fqn().str() + " must not be empty");
    }

    return spec;
}

std::vector<QueueSpec> queue_specs_from_json(const nlohmann::json& j) {
    std::vector<QueueSpec> specs;
    if (j.is_array()) {
        for (const auto& entry : j) {
            specs.push_back(queue_spec_from_json(entry));
        }
    } else {
        specs.push_back(queue_spec_from_json(j));
    }
    return specs;
}

nlohmann::json to_json(const CustomIndex& index) {
    nlohmann::json j = {
        {"name", index.name},
        {"columns", index.columns},
        {"type", to_string(index.type)}
    };
    if (index.where.empty()) {
        j["where"] = nullptr;
    } else {
        j["where"] = index.where;
    }
    return j;
}

nlohmann::json to_json(const PartitionConfig& cfg) {
    return {
        {"partition_interval", cfg.interval},
        {"partition_premake", cfg.premake},
        {"retention_period", cfg.retention},
        {"datetime_string", cfg.datetime_string},
        {"optimize_constraint", cfg.optimize_constraint},
        {"default_partition", cfg.default_partition}
    };
}

nlohmann::json to_json(const QueueState& state) {
    nlohmann::json j = {
        {"id", state.queue.fqn().str()},
        {"name", state.queue.name.str()},
        {"schema", state.queue.schema.str()},
        {"enable_partitioning", state.queue.partitioned}
    };

    if (state.partition) {
        j.update(to_json(*state.partition));
    }

    nlohmann::json indexes = nlohmann::json::array();
    for (const auto& index : state.custom_indexes) {
        indexes.push_back(to_json(index));
    }
    j["custom_index"] = indexes;

    return j;
}

} // namespace pgq
