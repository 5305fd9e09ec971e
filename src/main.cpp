#include "pgq/config.hpp"
#include "pgq/database.hpp"
#include "pgq/errors.hpp"
#include "pgq/queue_manager.hpp"
#include "pgq/queue_resource.hpp"
#include "pgq/queue_spec_json.hpp"
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options] <command> <argument>\n"
              << "Commands:\n"
              << "  apply FILE         Create or update the queues described in FILE (JSON)\n"
              << "  show SCHEMA.NAME   Print the observed state of a queue as JSON\n"
              << "  delete SCHEMA.NAME Unregister from pg_partman and drop a queue\n"
              << "Options:\n"
              << "  --dev              Enable debug logging\n"
              << "  --help             Show this help message\n"
              << "\n"
              << "Environment variables:\n"
              << "  PG_HOST            PostgreSQL host (default: localhost)\n"
              << "  PG_PORT            PostgreSQL port (default: 5432)\n"
              << "  PG_DB              PostgreSQL database (default: postgres)\n"
              << "  PG_USER            PostgreSQL user (default: postgres)\n"
              << "  PG_PASSWORD        PostgreSQL password\n"
              << "  PG_SSLMODE         SSL mode (default: prefer)\n"
              << "  DB_POOL_SIZE       Database pool size (default: 4)\n"
              << "  PARTMAN_SCHEMA     Schema of the pg_partman extension (default: partman)\n"
              << "  LOG_LEVEL          trace, debug, info, warn, error (default: info)\n"
              << std::endl;
}

int run_apply(pgq::QueueResource& resource, const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        spdlog::error("Cannot open {}", path);
        return 1;
    }

    std::vector<pgq::QueueSpec> specs;
    try {
        specs = pgq::queue_specs_from_json(nlohmann::json::parse(file));
    } catch (const nlohmann::json::parse_error& e) {
        spdlog::error("Failed to parse {}: {}", path, e.what());
        return 1;
    }

    nlohmann::json output = nlohmann::json::array();
    for (const auto& spec : specs) {
        auto result = resource.apply(spec);
        spdlog::info("{}: {}", spec.fqn().str(), pgq::to_string(result.action));

        auto state = pgq::to_json(result.state);
        state["action"] = pgq::to_string(result.action);
        output.push_back(state);
    }

    std::cout << output.dump(2) << std::endl;
    return 0;
}

int run_show(pgq::QueueResource& resource, const pgq::FQN& fqn) {
    auto [schema, name] = fqn.split();
    auto state = resource.read(schema, name);
    if (!state) {
        spdlog::error("Queue {} not found", fqn.str());
        return 1;
    }
    std::cout << pgq::to_json(*state).dump(2) << std::endl;
    return 0;
}

int run_delete(pgq::QueueResource& resource, const pgq::FQN& fqn) {
    auto [schema, name] = fqn.split();
    auto state = resource.read(schema, name);
    if (!state) {
        spdlog::info("Queue {} does not exist, nothing to delete", fqn.str());
        return 0;
    }
    resource.remove(schema, name, state->queue.partitioned);
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    pgq::Config config = pgq::Config::load();

    // Set up logging
    spdlog::set_level(spdlog::level::from_str(config.logging.level));
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");

    std::vector<std::string> positional;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--dev") {
            spdlog::set_level(spdlog::level::debug);
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown argument: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() != 2) {
        print_usage(argv[0]);
        return 1;
    }

    const std::string& command = positional[0];
    const std::string& argument = positional[1];

    if (command != "apply" && command != "show" && command != "delete") {
        std::cerr << "Unknown command: " << command << std::endl;
        print_usage(argv[0]);
        return 1;
    }

    try {
        spdlog::debug("Connecting to {}:{}/{}", config.database.host, config.database.port, config.database.database);

        auto db_pool = std::make_shared<pgq::DatabasePool>(
            config.database.connection_string(),
            static_cast<size_t>(config.database.pool_size),
            config.database.pool_acquisition_timeout,
            config.database.statement_timeout,
            config.database.lock_timeout);

        auto manager = std::make_shared<pgq::QueueManager>(db_pool, config.partman);

        // The advisory lock pins one connection for the whole apply
        bool serialize = config.database.pool_size >= 2;
        if (!serialize) {
            spdlog::warn("DB_POOL_SIZE < 2: applying without the per-queue advisory lock");
        }
        pgq::QueueResource resource(manager, serialize);

        if (command == "apply") {
            return run_apply(resource, argument);
        } else if (command == "show") {
            return run_show(resource, pgq::FQN(argument));
        } else {
            return run_delete(resource, pgq::FQN(argument));
        }

    } catch (const pgq::QueueError& e) {
        spdlog::error("{}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("{}", e.what());
        return 1;
    }
}
