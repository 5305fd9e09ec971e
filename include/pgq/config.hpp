#pragma once

#include <string>
#include <cstdlib>
#include <cstring>

namespace pgq {

// Helper function to get boolean from environment
inline bool get_env_bool(const char* name, bool default_value) {
    const char* value = std::getenv(name);
    if (!value) return default_value;
    return std::strcmp(value, "true") == 0;
}

// Helper function to get int from environment
inline int get_env_int(const char* name, int default_value) {
    const char* value = std::getenv(name);
    return value ? std::atoi(value) : default_value;
}

// Helper function to get string from environment
inline std::string get_env_string(const char* name, const std::string& default_value) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : default_value;
}

struct DatabaseConfig {
    // Connection settings
    std::string user = "postgres";
    std::string host = "localhost";
    std::string database = "postgres";
    std::string password = "";
    std::string port = "5432";
    std::string sslmode = "prefer";  // disable, require, verify-ca, verify-full

    // Pool configuration
    int pool_size = 4;
    int connection_timeout = 5000;        // 5 seconds
    int statement_timeout = 600000;       // 10 minutes - index builds on large queues are slow
    int lock_timeout = 30000;             // 30 seconds
    int pool_acquisition_timeout = 10000; // 10 seconds - timeout for acquiring connection from pool

    static DatabaseConfig from_env() {
        DatabaseConfig config;
        config.user = get_env_string("PG_USER", "postgres");
        config.host = get_env_string("PG_HOST", "localhost");
        config.database = get_env_string("PG_DB", "postgres");
        config.password = get_env_string("PG_PASSWORD", "");
        config.port = get_env_string("PG_PORT", "5432");
        config.sslmode = get_env_string("PG_SSLMODE", "prefer");

        config.pool_size = get_env_int("DB_POOL_SIZE", 4);
        config.connection_timeout = get_env_int("DB_CONNECTION_TIMEOUT", 5000);
        config.statement_timeout = get_env_int("DB_STATEMENT_TIMEOUT", 600000);
        config.lock_timeout = get_env_int("DB_LOCK_TIMEOUT", 30000);
        config.pool_acquisition_timeout = get_env_int("DB_POOL_ACQUISITION_TIMEOUT", 10000);

        return config;
    }

    std::string connection_string() const {
        std::string conn_str = "host=" + host + " port=" + port + " dbname=" + database +
                               " user=" + user;
        if (!password.empty()) {
            conn_str += " password=" + password;
        }
        conn_str += " sslmode=" + sslmode;

        // connect_timeout is in seconds and must be at least 1 to be effective
        int connect_seconds = connection_timeout / 1000;
        conn_str += " connect_timeout=" + std::to_string(connect_seconds > 0 ? connect_seconds : 1);

        // statement_timeout and lock_timeout are applied per connection via SET
        // in the DatabaseConnection constructor

        return conn_str;
    }
};

struct PartmanConfig {
    // Schema pg_partman was installed into (CREATE EXTENSION pg_partman SCHEMA ...)
    std::string schema = "partman";

    // Batch count handed to undo_partition when a queue is deleted
    int undo_batch_size = 20;

    static PartmanConfig from_env() {
        PartmanConfig config;
        config.schema = get_env_string("PARTMAN_SCHEMA", "partman");
        config.undo_batch_size = get_env_int("PARTMAN_UNDO_BATCH_SIZE", 20);
        return config;
    }
};

struct LoggingConfig {
    std::string level = "info";  // trace, debug, info, warn, error, critical, off

    static LoggingConfig from_env() {
        LoggingConfig config;
        config.level = get_env_string("LOG_LEVEL", "info");
        return config;
    }
};

struct Config {
    DatabaseConfig database;
    PartmanConfig partman;
    LoggingConfig logging;

    static Config load() {
        Config config;
        config.database = DatabaseConfig::from_env();
        config.partman = PartmanConfig::from_env();
        config.logging = LoggingConfig::from_env();
        return config;
    }
};

} // namespace pgq
