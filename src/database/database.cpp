#include "pgq/database.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <chrono>

namespace pgq {

// DatabaseConnection Implementation
DatabaseConnection::DatabaseConnection(const std::string& connection_string,
                                       int statement_timeout_ms,
                                       int lock_timeout_ms)
    : conn_(nullptr) {
    conn_ = PQconnectdb(connection_string.c_str());

    if (PQstatus(conn_) != CONNECTION_OK) {
        std::string error = PQerrorMessage(conn_);
        PQfinish(conn_);
        conn_ = nullptr;
        throw DatabaseError("Failed to connect to database: " + error);
    }

    PQsetClientEncoding(conn_, "UTF8");

    // Index builds and pg_partman calls can run long; keep them bounded per session
    std::string set_timeouts =
        "SET statement_timeout = " + std::to_string(statement_timeout_ms) + "; " +
        "SET lock_timeout = " + std::to_string(lock_timeout_ms) + ";";

    PGresult* result = PQexec(conn_, set_timeouts.c_str());
    if (PQresultStatus(result) != PGRES_COMMAND_OK) {
        std::string error = PQerrorMessage(conn_);
        PQclear(result);
        PQfinish(conn_);
        conn_ = nullptr;
        throw DatabaseError("Failed to set timeout parameters: " + error);
    }
    PQclear(result);
}

DatabaseConnection::~DatabaseConnection() {
    if (conn_) {
        PQfinish(conn_);
    }
}

DatabaseConnection::DatabaseConnection(DatabaseConnection&& other) noexcept
    : conn_(other.conn_) {
    other.conn_ = nullptr;
}

DatabaseConnection& DatabaseConnection::operator=(DatabaseConnection&& other) noexcept {
    if (this != &other) {
        if (conn_) PQfinish(conn_);
        conn_ = other.conn_;
        other.conn_ = nullptr;
    }
    return *this;
}

bool DatabaseConnection::is_valid() const {
    return conn_ && PQstatus(conn_) == CONNECTION_OK;
}

PGresult* DatabaseConnection::exec(const std::string& query) {
    if (!is_valid()) return nullptr;
    return PQexec(conn_, query.c_str());
}

PGresult* DatabaseConnection::exec_params(const std::string& query, const std::vector<std::string>& params) {
    if (!is_valid()) return nullptr;

    std::vector<const char*> param_values;
    param_values.reserve(params.size());

    for (const auto& param : params) {
        param_values.push_back(param.c_str());
    }

    return PQexecParams(conn_, query.c_str(), static_cast<int>(params.size()),
                       nullptr, param_values.data(), nullptr, nullptr, 0);
}

QueryResult DatabaseConnection::execute(const std::string& query, const std::vector<std::string>& params) {
    // Without parameters use the simple protocol so multi-statement DDL works
    auto result = QueryResult(params.empty() ? exec(query) : exec_params(query, params));

    if (!result.is_valid()) {
        std::string error = conn_ ? PQerrorMessage(conn_) : "connection is not open";
        throw DatabaseError("Query failed: " + error);
    }
    if (!result.is_success()) {
        throw DatabaseError(result.error_message(), result.sqlstate());
    }
    return result;
}

bool DatabaseConnection::rollback_transaction() {
    auto result = QueryResult(exec("ROLLBACK"));
    return result.is_success();
}

// DatabasePool Implementation
DatabasePool::DatabasePool(const std::string& connection_string,
                           size_t pool_size,
                           int acquisition_timeout_ms,
                           int statement_timeout_ms,
                           int lock_timeout_ms)
    : available_connections_(), mutex_(), condition_(),
      connection_string_(connection_string),
      pool_size_(pool_size),
      current_size_(0),
      acquisition_timeout_ms_(acquisition_timeout_ms),
      statement_timeout_ms_(statement_timeout_ms),
      lock_timeout_ms_(lock_timeout_ms) {

    // Pre-populate the pool
    for (size_t i = 0; i < pool_size_; ++i) {
        try {
            auto conn = create_connection();
            if (conn && conn->is_valid()) {
                available_connections_.push(std::move(conn));
                ++current_size_;
            }
        } catch (const std::exception& e) {
            spdlog::error("Failed to create initial database connection: {}", e.what());
        }
    }

    if (current_size_ == 0) {
        throw DatabaseError("Failed to create any database connections");
    }

    spdlog::debug("Database pool initialized with {}/{} connections (acquisition timeout: {}ms, statement timeout: {}ms)",
                  current_size_, pool_size_, acquisition_timeout_ms_, statement_timeout_ms_);
}

DatabasePool::~DatabasePool() {
    std::lock_guard<std::mutex> lock(mutex_);
    while (!available_connections_.empty()) {
        available_connections_.pop();
    }
}

std::unique_ptr<DatabaseConnection> DatabasePool::create_connection() {
    return std::make_unique<DatabaseConnection>(connection_string_,
                                                statement_timeout_ms_,
                                                lock_timeout_ms_);
}

std::unique_ptr<DatabaseConnection> DatabasePool::get_connection() {
    std::unique_lock<std::mutex> lock(mutex_);

    if (!condition_.wait_for(lock, std::chrono::milliseconds(acquisition_timeout_ms_),
                            [this] { return !available_connections_.empty(); })) {
        throw DatabaseError("Database connection pool timeout (waited " +
                            std::to_string(acquisition_timeout_ms_) + "ms)");
    }

    auto conn = std::move(available_connections_.front());
    available_connections_.pop();

    // Verify connection is still valid
    if (!conn->is_valid()) {
        spdlog::warn("Invalid connection found in pool, replacing it");
        --current_size_;

        lock.unlock();
        auto new_conn = create_connection();
        lock.lock();

        ++current_size_;
        return new_conn;
    }

    return conn;
}

void DatabasePool::return_connection(std::unique_ptr<DatabaseConnection> conn) {
    if (!conn) return;

    std::lock_guard<std::mutex> lock(mutex_);
    if (conn->is_valid()) {
        available_connections_.push(std::move(conn));
        condition_.notify_one();
        return;
    }

    spdlog::warn("Returned invalid connection to pool, attempting to create replacement");
    --current_size_;

    try {
        auto new_conn = create_connection();
        available_connections_.push(std::move(new_conn));
        ++current_size_;
        spdlog::info("Successfully replaced invalid connection, pool at {}/{}", current_size_, pool_size_);
    } catch (const std::exception& e) {
        spdlog::error("Exception creating replacement connection: {} - pool size now {}/{}",
                      e.what(), current_size_, pool_size_);
    }
    condition_.notify_one();
}

QueryResult DatabasePool::execute(const std::string& sql, const std::vector<std::string>& params) {
    ScopedConnection conn(this);
    return conn->execute(sql, params);
}

size_t DatabasePool::available() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return available_connections_.size();
}

// ScopedConnection Implementation
ScopedConnection::ScopedConnection(DatabasePool* pool) : pool_(pool) {
    if (!pool_) {
        throw std::invalid_argument("Database pool cannot be null");
    }
    conn_ = pool_->get_connection();
}

ScopedConnection::~ScopedConnection() {
    if (pool_ && conn_) {
        pool_->return_connection(std::move(conn_));
    }
}

// Transaction Implementation
Transaction::Transaction(DatabasePool* pool) : conn_(pool), finished_(false) {
    conn_->execute("BEGIN");
}

Transaction::~Transaction() {
    if (!finished_ && conn_.is_valid()) {
        if (!conn_->rollback_transaction()) {
            spdlog::warn("Rollback of abandoned transaction failed");
        }
    }
}

QueryResult Transaction::execute(const std::string& sql, const std::vector<std::string>& params) {
    if (finished_) {
        throw std::logic_error("Transaction already finished");
    }
    return conn_->execute(sql, params);
}

void Transaction::commit() {
    if (finished_) {
        throw std::logic_error("Transaction already finished");
    }
    finished_ = true;
    conn_->execute("COMMIT");
}

void Transaction::rollback() {
    if (finished_) return;
    finished_ = true;
    conn_->execute("ROLLBACK");
}

} // namespace pgq
