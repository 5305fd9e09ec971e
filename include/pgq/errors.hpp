#pragma once

#include "pgq/queue_types.hpp"
#include <exception>
#include <stdexcept>
#include <string>

namespace pgq {

// Base of the queue error taxonomy. Every error names the queue it concerns
// and may carry the exception that caused it.
class QueueError : public std::runtime_error {
private:
    FQN queue_;
    std::exception_ptr cause_;

public:
    QueueError(const std::string& message, FQN queue, std::exception_ptr cause = nullptr)
        : std::runtime_error(message), queue_(std::move(queue)), cause_(std::move(cause)) {}

    const FQN& queue() const { return queue_; }
    std::exception_ptr cause() const { return cause_; }
    bool has_cause() const { return static_cast<bool>(cause_); }

    // Rethrows the underlying error; no-op when there is none
    void rethrow_cause() const {
        if (cause_) std::rethrow_exception(cause_);
    }
};

// Creation attempted against a name that already resolves to a live table
class QueueExistsError : public QueueError {
public:
    explicit QueueExistsError(const FQN& queue)
        : QueueError("queue " + queue.str() + " already exists", queue) {}
};

// Read or update against a name with no live table
class QueueNotFoundError : public QueueError {
public:
    explicit QueueNotFoundError(const FQN& queue)
        : QueueError("queue " + queue.str() + " not found", queue) {}
};

// Any other database failure while inspecting or changing a queue's schema
class DdlError : public QueueError {
private:
    std::string op_;

public:
    DdlError(const std::string& op, const FQN& queue, const std::string& detail,
             std::exception_ptr cause = nullptr)
        : QueueError("queue " + queue.str() + ": " + op + " failed: " + detail, queue, std::move(cause)),
          op_(op) {}

    const std::string& op() const { return op_; }
};

// Failure of a call into pg_partman
class PartmanError : public QueueError {
private:
    std::string op_;

public:
    PartmanError(const std::string& op, const FQN& queue, const std::string& detail,
                 std::exception_ptr cause = nullptr)
        : QueueError("pg_partman " + op + " for " + queue.str() + ": " + detail, queue, std::move(cause)),
          op_(op) {}

    const std::string& op() const { return op_; }
};

// Wrap the exception currently being handled. Must be called from a catch block.
template <typename Error>
[[noreturn]] void rethrow_as(const std::string& op, const FQN& queue) {
    auto cause = std::current_exception();
    try {
        std::rethrow_exception(cause);
    } catch (const QueueError&) {
        // Already categorized further down
        throw;
    } catch (const std::exception& e) {
        throw Error(op, queue, e.what(), cause);
    }
}

} // namespace pgq
