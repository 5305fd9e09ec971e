/**
 * Custom index reconciler tests
 *
 * Name generation, catalog definition parsing, equality and the
 * drop/create diff, plus the error taxonomy the managers throw.
 */

#include "pgq/database.hpp"
#include "pgq/errors.hpp"
#include "pgq/index_manager.hpp"
#include "test_helpers.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

using namespace pgq;

namespace {

CustomIndex make_index(const std::string& name, std::vector<std::string> columns,
                       IndexType type = IndexType::BTree, const std::string& where = "") {
    CustomIndex index;
    index.name = name;
    index.columns = std::move(columns);
    index.type = type;
    index.where = where;
    return index;
}

} // namespace

bool test_generate_index_name() {
    std::cout << "\n=== Test 1: Generated Index Names ===" << std::endl;

    TEST_ASSERT(generate_index_name("events", {"created_at"}, IndexType::BTree) ==
                    "events_created_at_e878a9d9_idx",
                "single column btree name");

    TEST_ASSERT(generate_index_name("events", {"status", "created_at"}, IndexType::BTree) ==
                    "events_status_created_at_c234f6be_idx",
                "multi-column name joins cleaned columns");

    TEST_ASSERT(generate_index_name("events", {"(payload->>'user_id')"}, IndexType::BTree) ==
                    "events_payload_user_id_ca2a6bff_idx",
                "JSON expression is cleaned, hash covers the raw expression");

    TEST_ASSERT(generate_index_name("events", {"metadata"}, IndexType::Gin) ==
                    "events_metadata_gin_45447b7a_idx",
                "non-btree type is part of the name");

    TEST_ASSERT(generate_index_name("events", {"created_at"}, IndexType::BTree) ==
                    generate_index_name("events", {"created_at"}, IndexType::BTree),
                "generation is deterministic");

    return true;
}

bool test_generate_index_name_limits() {
    std::cout << "\n=== Test 2: Name Collisions and Length ===" << std::endl;

    std::string a = generate_index_name("events", {"payload->>'customer_identifier_a'"}, IndexType::BTree);
    std::string b = generate_index_name("events", {"payload->>'customer_identifier_b'"}, IndexType::BTree);
    TEST_ASSERT(a.rfind("events_payload_customer_ide_", 0) == 0, "cleaned column is cut to 20 bytes");
    TEST_ASSERT(a != b, "columns with the same cleaned prefix get distinct names");

    std::string long_table(60, 't');
    std::string name = generate_index_name(long_table, {"created_at"}, IndexType::BTree);
    TEST_ASSERT(name.size() == MAX_IDENTIFIER_LENGTH, "long names are cut to 63 bytes");
    TEST_ASSERT(name.rfind(long_table, 0) == 0, "truncated name keeps the table prefix");

    CustomIndex unnamed = make_index("", {"created_at"});
    TEST_ASSERT(resolved_index_name("events", unnamed) == "events_created_at_e878a9d9_idx",
                "unnamed index resolves to its generated name");
    TEST_ASSERT(resolved_index_name("events", make_index("my_idx", {"created_at"})) == "my_idx",
                "explicit name wins");

    return true;
}

bool test_standard_index_names() {
    std::cout << "\n=== Test 3: Standard Index Names ===" << std::endl;

    TEST_ASSERT(standard_index_name("events", INDEX_SUFFIX_PROCESSED_AT_NULL) == "events_processed_at_null_idx",
                "short names are kept whole");

    std::string queue(45, 'q');
    std::string processed = standard_index_name(queue, INDEX_SUFFIX_PROCESSED_AT_NULL);
    TEST_ASSERT(processed.size() == MAX_IDENTIFIER_LENGTH, "long standard name is cut to 63 bytes");
    TEST_ASSERT(processed == queue + "_processed_at_n", "cut keeps the leading bytes");
    TEST_ASSERT(standard_index_name(queue, INDEX_SUFFIX_METADATA) == queue + "_metadata_idx",
                "names that fit are untouched");

    check_standard_index_names(QueueName(queue));
    check_standard_index_names(QueueName(std::string(61, 'q')));
    std::cout << "✅ 45 and 61 byte queue names keep distinct standard index names" << std::endl;

    TEST_THROWS(check_standard_index_names(QueueName(std::string(62, 'q'))), std::invalid_argument,
                "62 byte queue name is rejected");
    TEST_THROWS(check_standard_index_names(QueueName(std::string(63, 'q'))), std::invalid_argument,
                "63 byte queue name is rejected");

    return true;
}

bool test_parse_index_definition() {
    std::cout << "\n=== Test 4: Parse pg_get_indexdef Output ===" << std::endl;

    auto simple = parse_index_definition("events_status_idx",
        "CREATE INDEX events_status_idx ON public.events USING btree (status)");
    TEST_ASSERT(simple.name == "events_status_idx", "name is taken from the catalog row");
    TEST_ASSERT(simple.type == IndexType::BTree, "btree type parsed");
    TEST_ASSERT(simple.columns == std::vector<std::string>{"status"}, "single column parsed");
    TEST_ASSERT(simple.where.empty(), "no predicate");

    auto partial = parse_index_definition("x",
        "CREATE INDEX x ON public.q USING gin (metadata) WHERE (processed_at IS NULL)");
    TEST_ASSERT(partial.type == IndexType::Gin, "gin type parsed");
    TEST_ASSERT(partial.columns == std::vector<std::string>{"metadata"},
                "columns exclude the predicate");
    TEST_ASSERT(partial.where == "(processed_at IS NULL)", "predicate parsed");

    auto multi = parse_index_definition("x",
        "CREATE INDEX x ON public.events USING btree (status, created_at DESC)");
    TEST_ASSERT((multi.columns == std::vector<std::string>{"status", "created_at DESC"}),
                "multiple columns split in order");

    auto expression = parse_index_definition("x",
        "CREATE INDEX x ON public.events USING btree (((payload ->> 'user_id'::text)))");
    TEST_ASSERT(expression.columns == std::vector<std::string>{"((payload ->> 'user_id'::text))"},
                "expression column keeps its inner parentheses");

    auto lower = parse_index_definition("x", "CREATE INDEX x ON s.t USING hash (a) where (a > 1)");
    TEST_ASSERT(lower.type == IndexType::Hash, "hash type parsed");
    TEST_ASSERT(lower.where == "(a > 1)", "predicate keyword is case-insensitive");

    auto unique = parse_index_definition("x", "CREATE UNIQUE INDEX x ON public.events USING brin (created_at)");
    TEST_ASSERT(unique.type == IndexType::Brin, "brin type parsed");

    return true;
}

bool test_indexes_equal() {
    std::cout << "\n=== Test 5: Index Equality ===" << std::endl;

    auto base = make_index("idx", {"status", "created_at"}, IndexType::BTree, "processed_at IS NULL");

    TEST_ASSERT(indexes_equal(base, base), "identical indexes are equal");
    TEST_ASSERT(!indexes_equal(base, make_index("other", base.columns, base.type, base.where)),
                "name differs");
    TEST_ASSERT(!indexes_equal(base, make_index("idx", base.columns, IndexType::Hash, base.where)),
                "type differs");
    TEST_ASSERT(!indexes_equal(base, make_index("idx", {"created_at", "status"}, base.type, base.where)),
                "column order matters");
    TEST_ASSERT(!indexes_equal(base, make_index("idx", base.columns, base.type, "")),
                "predicate presence matters");
    TEST_ASSERT(indexes_equal(base, make_index("idx", base.columns, base.type, "(processed_at IS NULL)")),
                "predicate wrapped by the catalog is equal");
    TEST_ASSERT(!indexes_equal(make_index("idx", {"a"}, IndexType::BTree, "(a > 1) AND (b > 2)"),
                               make_index("idx", {"a"}, IndexType::BTree, "a > 1) AND (b > 2")),
                "only a fully enclosing pair is stripped");

    return true;
}

bool test_plan_index_changes() {
    std::cout << "\n=== Test 6: Index Diff ===" << std::endl;

    std::vector<CustomIndex> state = {
        make_index("a_idx", {"status"}),
        make_index("b_idx", {"created_at"}),
        make_index("c_idx", {"consumed_count"})
    };
    std::vector<CustomIndex> plan = {
        make_index("d_idx", {"scheduled_for"}),
        make_index("b_idx", {"created_at", "status"}),
        make_index("a_idx", {"status"})
    };

    auto changes = plan_index_changes("events", state, plan);
    TEST_ASSERT((changes.to_drop == std::vector<std::string>{"b_idx", "c_idx"}),
                "changed and removed indexes are dropped in name order");
    TEST_ASSERT(changes.to_create.size() == 2, "two indexes to create");
    TEST_ASSERT(changes.to_create[0].name == "b_idx" && changes.to_create[1].name == "d_idx",
                "changed and new indexes are created in name order");
    TEST_ASSERT((changes.to_create[0].columns == std::vector<std::string>{"created_at", "status"}),
                "changed index is recreated with the planned columns");

    auto unchanged = plan_index_changes("events",
        {make_index("events_created_at_e878a9d9_idx", {"created_at"})},
        {make_index("", {"created_at"})});
    TEST_ASSERT(unchanged.empty(), "unnamed plan index matches its generated name");

    auto created = plan_index_changes("events", {}, {make_index("", {"created_at"})});
    TEST_ASSERT(created.to_create.size() == 1 &&
                    created.to_create[0].name == "events_created_at_e878a9d9_idx",
                "created indexes carry resolved names");

    auto dropped = plan_index_changes("events", state, {});
    TEST_ASSERT(dropped.to_drop.size() == 3 && dropped.to_create.empty(), "empty plan drops everything");

    TEST_ASSERT(plan_index_changes("events", {}, {}).empty(), "nothing to do");

    return true;
}

bool test_error_taxonomy() {
    std::cout << "\n=== Test 7: Error Taxonomy ===" << std::endl;

    FQN fqn("public.events");

    QueueExistsError exists(fqn);
    TEST_ASSERT(std::string(exists.what()) == "queue public.events already exists", "exists message");
    TEST_ASSERT(exists.queue() == fqn, "error names the queue");
    TEST_ASSERT(!exists.has_cause(), "exists error has no cause");

    QueueNotFoundError missing(fqn);
    TEST_ASSERT(std::string(missing.what()) == "queue public.events not found", "not found message");

    bool wrapped = false;
    try {
        try {
            throw DatabaseError("relation already exists", "42P07");
        } catch (const DatabaseError&) {
            rethrow_as<DdlError>("create_table", fqn);
        }
    } catch (const DdlError& e) {
        wrapped = true;
        TEST_ASSERT(e.op() == "create_table", "operation recorded");
        TEST_ASSERT(std::string(e.what()) ==
                        "queue public.events: create_table failed: relation already exists",
                    "ddl message");
        TEST_ASSERT(e.has_cause(), "cause kept");

        bool unwrapped = false;
        try {
            e.rethrow_cause();
        } catch (const DatabaseError& cause) {
            unwrapped = cause.sqlstate() == "42P07";
        }
        TEST_ASSERT(unwrapped, "cause unwraps to the database error");
    }
    TEST_ASSERT(wrapped, "database error wrapped as DdlError");

    bool passed_through = false;
    try {
        try {
            throw QueueNotFoundError(fqn);
        } catch (const std::exception&) {
            rethrow_as<PartmanError>("get_config", fqn);
        }
    } catch (const PartmanError&) {
        passed_through = false;
    } catch (const QueueNotFoundError&) {
        passed_through = true;
    }
    TEST_ASSERT(passed_through, "categorized errors are not wrapped twice");

    PartmanError partman("create_parent", fqn, "function does not exist");
    TEST_ASSERT(std::string(partman.what()) ==
                    "pg_partman create_parent for public.events: function does not exist",
                "partman message");

    bool caught_as_base = false;
    try {
        throw PartmanError("update_config", fqn, "boom");
    } catch (const QueueError& e) {
        caught_as_base = e.queue() == fqn;
    }
    TEST_ASSERT(caught_as_base, "all queue errors share one base");

    return true;
}

int main() {
    spdlog::set_level(spdlog::level::warn);

    print_banner("Custom Index Reconciler Tests");

    bool all_passed = true;

    all_passed &= test_generate_index_name();
    all_passed &= test_generate_index_name_limits();
    all_passed &= test_standard_index_names();
    all_passed &= test_parse_index_definition();
    all_passed &= test_indexes_equal();
    all_passed &= test_plan_index_changes();
    all_passed &= test_error_taxonomy();

    return report(all_passed);
}
