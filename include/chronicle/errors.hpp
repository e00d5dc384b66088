#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <grpcpp/grpcpp.h>

namespace chronicle {

/**
 * Base exception for all Chronicle errors.
 *
 * Every error carries the gRPC status code a service boundary would report
 * for it.
 */
class ChronicleError : public std::runtime_error {
public:
    ChronicleError(const std::string& message, grpc::StatusCode code)
        : std::runtime_error(message), status_code_(code) {}

    grpc::StatusCode status_code() const { return status_code_; }

    grpc::Status to_grpc_status() const {
        return grpc::Status(status_code_, what());
    }

    /**
     * Returns true if a command was rejected by business rules.
     */
    virtual bool is_rejection() const { return false; }

    /**
     * Returns true if this is an optimistic concurrency conflict.
     */
    virtual bool is_conflict() const { return false; }

    /**
     * Returns true if this signals a programming error or a corrupt log.
     */
    virtual bool is_internal() const { return false; }

private:
    grpc::StatusCode status_code_;
};

/**
 * Thrown when a command is rejected by an aggregate.
 */
class CommandRejectedError : public ChronicleError {
public:
    CommandRejectedError(const std::string& message, grpc::StatusCode code)
        : ChronicleError(message, code) {}

    bool is_rejection() const override { return true; }
};

/**
 * Malformed command input (non-positive amount, blank name, ...).
 */
class ValidationError : public CommandRejectedError {
public:
    explicit ValidationError(const std::string& message)
        : CommandRejectedError(message, grpc::StatusCode::INVALID_ARGUMENT) {}
};

/**
 * Command is not allowed in the aggregate's current state.
 */
class InvalidStateError : public CommandRejectedError {
public:
    explicit InvalidStateError(const std::string& message)
        : CommandRejectedError(message, grpc::StatusCode::FAILED_PRECONDITION) {}
};

/**
 * Thrown by EventStore::append when the stream moved past the expected version.
 * Recovery is reload-and-retry by the caller.
 */
class ConcurrencyConflictError : public ChronicleError {
public:
    ConcurrencyConflictError(const std::string& stream_id, int64_t expected, int64_t actual)
        : ChronicleError("Concurrency conflict on stream " + stream_id +
                             ": expected version " + std::to_string(expected) +
                             ", actual version " + std::to_string(actual),
                         grpc::StatusCode::ABORTED),
          stream_id_(stream_id), expected_(expected), actual_(actual) {}

    const std::string& stream_id() const { return stream_id_; }
    int64_t expected_version() const { return expected_; }
    int64_t actual_version() const { return actual_; }

    bool is_conflict() const override { return true; }

private:
    std::string stream_id_;
    int64_t expected_;
    int64_t actual_;
};

/**
 * A store invariant (version contiguity, stream ownership) would be broken.
 */
class InvariantViolationError : public ChronicleError {
public:
    explicit InvariantViolationError(const std::string& message)
        : ChronicleError(message, grpc::StatusCode::INTERNAL) {}

    bool is_internal() const override { return true; }
};

/**
 * Replay met an event kind the aggregate does not know, under the reject policy.
 */
class UnknownEventError : public ChronicleError {
public:
    UnknownEventError(const std::string& type_url, int64_t stream_version)
        : ChronicleError("Unknown event type " + (type_url.empty() ? "<empty>" : type_url) +
                             " at stream version " + std::to_string(stream_version),
                         grpc::StatusCode::UNIMPLEMENTED),
          type_url_(type_url), stream_version_(stream_version) {}

    const std::string& type_url() const { return type_url_; }
    int64_t stream_version() const { return stream_version_; }

    bool is_internal() const override { return true; }

private:
    std::string type_url_;
    int64_t stream_version_;
};

/**
 * Thrown when configuration values cannot be parsed.
 */
class ConfigError : public ChronicleError {
public:
    explicit ConfigError(const std::string& message)
        : ChronicleError(message, grpc::StatusCode::INVALID_ARGUMENT) {}
};

} // namespace chronicle
