#pragma once

#include <libpq-fe.h>
#include <memory>
#include <string>
#include <vector>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <stdexcept>

namespace pgq {

// Raised by the database layer for connection failures and failed statements.
// sqlstate() is empty when the failure did not come from the server.
class DatabaseError : public std::runtime_error {
private:
    std::string sqlstate_;

public:
    explicit DatabaseError(const std::string& message, std::string sqlstate = "")
        : std::runtime_error(message), sqlstate_(std::move(sqlstate)) {}

    const std::string& sqlstate() const { return sqlstate_; }
};

// Result wrapper for easier handling
class QueryResult {
private:
    PGresult* result_;

public:
    explicit QueryResult(PGresult* result) : result_(result) {}
    ~QueryResult() { if (result_) PQclear(result_); }

    // Non-copyable, movable
    QueryResult(const QueryResult&) = delete;
    QueryResult& operator=(const QueryResult&) = delete;
    QueryResult(QueryResult&& other) noexcept : result_(other.result_) { other.result_ = nullptr; }
    QueryResult& operator=(QueryResult&& other) noexcept {
        if (this != &other) {
            if (result_) PQclear(result_);
            result_ = other.result_;
            other.result_ = nullptr;
        }
        return *this;
    }

    bool is_valid() const { return result_ != nullptr; }
    bool is_success() const {
        return result_ && (PQresultStatus(result_) == PGRES_COMMAND_OK ||
                          PQresultStatus(result_) == PGRES_TUPLES_OK);
    }

    int num_rows() const { return result_ ? PQntuples(result_) : 0; }
    int num_fields() const { return result_ ? PQnfields(result_) : 0; }

    std::string get_value(int row, int col) const {
        if (!result_ || row >= num_rows() || col >= num_fields()) return "";
        const char* val = PQgetvalue(result_, row, col);
        return val ? std::string(val) : "";
    }

    bool get_bool(int row, int col) const {
        std::string value = get_value(row, col);
        return value == "t" || value == "true";
    }

    std::string sqlstate() const {
        if (!result_) return "";
        const char* state = PQresultErrorField(result_, PG_DIAG_SQLSTATE);
        return state ? std::string(state) : "";
    }

    std::string error_message() const {
        return result_ ? PQresultErrorMessage(result_) : "No result";
    }
};

class DatabaseConnection {
private:
    PGconn* conn_;

public:
    DatabaseConnection(const std::string& connection_string,
                       int statement_timeout_ms,
                       int lock_timeout_ms);
    ~DatabaseConnection();

    // Non-copyable, movable
    DatabaseConnection(const DatabaseConnection&) = delete;
    DatabaseConnection& operator=(const DatabaseConnection&) = delete;
    DatabaseConnection(DatabaseConnection&& other) noexcept;
    DatabaseConnection& operator=(DatabaseConnection&& other) noexcept;

    bool is_valid() const;

    PGresult* exec(const std::string& query);
    PGresult* exec_params(const std::string& query, const std::vector<std::string>& params);

    // Like exec_params, but throws DatabaseError unless the statement succeeded
    QueryResult execute(const std::string& query, const std::vector<std::string>& params = {});

    // Best-effort ROLLBACK, used when abandoning a transaction
    bool rollback_transaction();
};

class DatabasePool {
private:
    std::queue<std::unique_ptr<DatabaseConnection>> available_connections_;
    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::string connection_string_;
    size_t pool_size_;
    size_t current_size_;
    int acquisition_timeout_ms_;
    int statement_timeout_ms_;
    int lock_timeout_ms_;

    std::unique_ptr<DatabaseConnection> create_connection();

public:
    DatabasePool(const std::string& connection_string,
                 size_t pool_size = 4,
                 int acquisition_timeout_ms = 10000,
                 int statement_timeout_ms = 600000,
                 int lock_timeout_ms = 30000);
    ~DatabasePool();

    std::unique_ptr<DatabaseConnection> get_connection();
    void return_connection(std::unique_ptr<DatabaseConnection> conn);

    // Convenience: run one statement on a pooled connection, throwing on failure
    QueryResult execute(const std::string& sql, const std::vector<std::string>& params = {});

    size_t size() const { return current_size_; }
    size_t available() const;
};

// RAII connection wrapper
class ScopedConnection {
private:
    DatabasePool* pool_;
    std::unique_ptr<DatabaseConnection> conn_;

public:
    explicit ScopedConnection(DatabasePool* pool);
    ~ScopedConnection();

    ScopedConnection(const ScopedConnection&) = delete;
    ScopedConnection& operator=(const ScopedConnection&) = delete;

    DatabaseConnection* operator->() { return conn_.get(); }
    bool is_valid() const { return conn_ && conn_->is_valid(); }
};

// A transaction on a pooled connection. BEGIN is issued on construction;
// unless commit() succeeded the destructor rolls back.
class Transaction {
private:
    ScopedConnection conn_;
    bool finished_;

public:
    explicit Transaction(DatabasePool* pool);
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    QueryResult execute(const std::string& sql, const std::vector<std::string>& params = {});

    void commit();
    void rollback();
};

} // namespace pgq
