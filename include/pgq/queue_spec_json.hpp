#pragma once

#include "pgq/queue_types.hpp"
#include <nlohmann/json.hpp>
#include <vector>

namespace pgq {

// ============================================================================
// JSON form of queue specs and observed state
//
//   {
//     "name": "events",
//     "schema": "public",
//     "enable_partitioning": true,
//     "partition_interval": "1 day",
//     "partition_premake": 7,
//     "retention_period": "14 days",
//     "datetime_string": "YYYYMMDD",
//     "optimize_constraint": 30,
//     "default_partition": true,
//     "custom_index": [
//       {"columns": ["(payload->>'user_id')"], "type": "btree", "where": "processed_at IS NULL"}
//     ]
//   }
//
// Only "name" is required. Malformed input throws std::invalid_argument.
// ============================================================================

QueueSpec queue_spec_from_json(const nlohmann::json& j);

// Accepts a single spec object or an array of them
std::vector<QueueSpec> queue_specs_from_json(const nlohmann::json& j);

nlohmann::json to_json(const CustomIndex& index);
nlohmann::json to_json(const PartitionConfig& cfg);
nlohmann::json to_json(const QueueState& state);

} // namespace pgq
