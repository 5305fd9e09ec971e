/**
 * Queue spec JSON and configuration tests
 */

#include "pgq/config.hpp"
#include "pgq/queue_spec_json.hpp"
#include "test_helpers.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

using namespace pgq;
using json = nlohmann::json;

bool test_spec_defaults() {
    std::cout << "\n=== Test 1: Spec Defaults ===" << std::endl;

    auto spec = queue_spec_from_json(json{{"name", "events"}});

    TEST_ASSERT(spec.name.str() == "events", "name parsed");
    TEST_ASSERT(spec.schema.str() == "public", "schema defaults to public");
    TEST_ASSERT(!spec.partitioned, "partitioning is off by default");
    TEST_ASSERT(spec.partition.interval == "1 day", "interval default");
    TEST_ASSERT(spec.partition.premake == 7, "premake default");
    TEST_ASSERT(spec.partition.retention == "14 days", "retention default");
    TEST_ASSERT(spec.partition.datetime_string == "YYYYMMDD", "datetime_string default");
    TEST_ASSERT(spec.partition.optimize_constraint == 30, "optimize_constraint default");
    TEST_ASSERT(spec.partition.default_partition, "default partition on by default");
    TEST_ASSERT(spec.custom_indexes.empty(), "no custom indexes");

    auto with_nulls = queue_spec_from_json(json{{"name", "events"}, {"schema", nullptr}, {"custom_index", nullptr}});
    TEST_ASSERT(with_nulls.schema.str() == "public", "null attributes fall back to defaults");

    return true;
}

bool test_spec_full() {
    std::cout << "\n=== Test 2: Full Spec ===" << std::endl;

    auto spec = queue_spec_from_json(json::parse(R"json({
        "name": "orders",
        "schema": "app",
        "enable_partitioning": true,
        "partition_interval": "1 hour",
        "partition_premake": 24,
        "retention_period": "3 days",
        "datetime_string": "YYYYMMDD_HH24",
        "optimize_constraint": 10,
        "default_partition": false,
        "custom_index": [
            {"name": "orders_user_idx", "columns": ["(payload->>'user_id')"], "where": "processed_at IS NULL"},
            {"columns": ["payload"], "type": "GIN"}
        ]
    })json"));

    TEST_ASSERT(spec.fqn().str() == "app.orders", "fqn");
    TEST_ASSERT(spec.partitioned, "partitioning enabled");
    TEST_ASSERT(spec.partition.interval == "1 hour", "interval");
    TEST_ASSERT(spec.partition.premake == 24, "premake");
    TEST_ASSERT(spec.partition.retention == "3 days", "retention");
    TEST_ASSERT(spec.partition.datetime_string == "YYYYMMDD_HH24", "datetime_string");
    TEST_ASSERT(spec.partition.optimize_constraint == 10, "optimize_constraint");
    TEST_ASSERT(!spec.partition.default_partition, "default partition disabled");

    TEST_ASSERT(spec.custom_indexes.size() == 2, "two custom indexes");
    TEST_ASSERT(spec.custom_indexes[0].name == "orders_user_idx", "explicit index name");
    TEST_ASSERT(spec.custom_indexes[0].type == IndexType::BTree, "index type defaults to btree");
    TEST_ASSERT(spec.custom_indexes[0].where == "processed_at IS NULL", "predicate");
    TEST_ASSERT(spec.custom_indexes[1].name.empty(), "unnamed index");
    TEST_ASSERT(spec.custom_indexes[1].type == IndexType::Gin, "index type is case-insensitive");

    return true;
}

bool test_spec_rejections() {
    std::cout << "\n=== Test 3: Malformed Specs ===" << std::endl;

    TEST_THROWS(queue_spec_from_json(json::array()), std::invalid_argument, "non-object spec");
    TEST_THROWS(queue_spec_from_json(json::object()), std::invalid_argument, "missing name");
    TEST_THROWS(queue_spec_from_json(json{{"name", 42}}), std::invalid_argument, "non-string name");
    TEST_THROWS(queue_spec_from_json(json{{"name", "1events"}}), std::invalid_argument, "invalid name");
    TEST_THROWS(queue_spec_from_json(json{{"name", "events"}, {"schema", ""}}), std::invalid_argument,
                "empty schema");
    TEST_THROWS(queue_spec_from_json(json{{"name", "events"}, {"partition_premake", "seven"}}),
                std::invalid_argument, "wrongly typed attribute");
    TEST_THROWS(queue_spec_from_json(json{{"name", "events"}, {"enable_partitioning", true},
                                          {"partition_interval", ""}}),
                std::invalid_argument, "partitioned spec with empty interval");
    TEST_THROWS(queue_spec_from_json(json{{"name", "events"}, {"custom_index", "status"}}),
                std::invalid_argument, "custom_index must be a list");
    TEST_THROWS(queue_spec_from_json(json::parse(R"({"name": "events", "custom_index": [{"columns": []}]})")),
                std::invalid_argument, "index without columns");
    TEST_THROWS(queue_spec_from_json(json::parse(
                    R"({"name": "events", "custom_index": [{"columns": ["status"], "type": "bitmap"}]})")),
                std::invalid_argument, "unknown index type");

    return true;
}

bool test_spec_list() {
    std::cout << "\n=== Test 4: Spec Lists ===" << std::endl;

    auto specs = queue_specs_from_json(json::parse(R"([
        {"name": "events"},
        {"name": "orders", "schema": "app"}
    ])"));
    TEST_ASSERT(specs.size() == 2, "array yields every spec");
    TEST_ASSERT(specs[1].fqn().str() == "app.orders", "order preserved");

    TEST_ASSERT(queue_specs_from_json(json{{"name", "events"}}).size() == 1, "single object accepted");

    return true;
}

bool test_state_to_json() {
    std::cout << "\n=== Test 5: Observed State JSON ===" << std::endl;

    QueueState simple;
    simple.queue.schema = SchemaName("public");
    simple.queue.name = QueueName("events");

    CustomIndex index;
    index.name = "events_created_at_e878a9d9_idx";
    index.columns = {"created_at"};
    simple.custom_indexes.push_back(index);

    auto j = to_json(simple);
    TEST_ASSERT(j["id"] == "public.events", "id is the fqn");
    TEST_ASSERT(j["enable_partitioning"] == false, "not partitioned");
    TEST_ASSERT(!j.contains("partition_interval"), "no partition fields for simple queues");
    TEST_ASSERT(j["custom_index"].size() == 1, "custom index listed");
    TEST_ASSERT(j["custom_index"][0]["type"] == "btree", "index type rendered");
    TEST_ASSERT(j["custom_index"][0]["where"].is_null(), "empty predicate is null");

    QueueState partitioned = simple;
    partitioned.queue.partitioned = true;
    partitioned.partition = PartitionConfig{};
    partitioned.custom_indexes.clear();

    auto p = to_json(partitioned);
    TEST_ASSERT(p["enable_partitioning"] == true, "partitioned");
    TEST_ASSERT(p["partition_interval"] == "1 day", "interval rendered");
    TEST_ASSERT(p["partition_premake"] == 7, "premake rendered");
    TEST_ASSERT(p["default_partition"] == true, "default partition rendered");
    TEST_ASSERT(p["custom_index"].is_array() && p["custom_index"].empty(), "empty index list");

    auto round = queue_spec_from_json(p);
    TEST_ASSERT(round.partitioned && round.partition.retention == "14 days",
                "observed state reads back as a spec");

    return true;
}

bool test_connection_string() {
    std::cout << "\n=== Test 6: Connection String ===" << std::endl;

    DatabaseConfig config;
    std::string conn = config.connection_string();
    TEST_ASSERT(conn.find("host=localhost") != std::string::npos, "host");
    TEST_ASSERT(conn.find("dbname=postgres") != std::string::npos, "database");
    TEST_ASSERT(conn.find("password=") == std::string::npos, "empty password omitted");
    TEST_ASSERT(conn.find("sslmode=prefer") != std::string::npos, "sslmode");
    TEST_ASSERT(conn.find("connect_timeout=5") != std::string::npos, "connect timeout in seconds");

    config.password = "secret";
    config.connection_timeout = 200;
    conn = config.connection_string();
    TEST_ASSERT(conn.find("password=secret") != std::string::npos, "password included");
    TEST_ASSERT(conn.find("connect_timeout=1") != std::string::npos, "connect timeout at least 1s");

    PartmanConfig partman;
    TEST_ASSERT(partman.schema == "partman" && partman.undo_batch_size == 20, "partman defaults");

    return true;
}

int main() {
    spdlog::set_level(spdlog::level::warn);

    print_banner("Queue Spec JSON & Config Tests");

    bool all_passed = true;

    all_passed &= test_spec_defaults();
    all_passed &= test_spec_full();
    all_passed &= test_spec_rejections();
    all_passed &= test_spec_list();
    all_passed &= test_state_to_json();
    all_passed &= test_connection_string();

    return report(all_passed);
}
