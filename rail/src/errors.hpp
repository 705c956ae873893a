#pragma once

#include <string>
#include <vector>
#include <optional>
#include <utility>

enum class ErrorKind {
    Unreachable,
    Timeout,
    ChainMismatch,
    MalformedResponse,
    CallFailed,
    NoRpcConfigured,
    NoPrimaryConfigured,
    NoBackupsAvailable,
    PoolFull,
    DuplicateEndpoint,
    UnknownEndpoint,
    AllEndpointsFailed,
    RegistryUnavailable,
    InvalidArgument
};

const char* to_string(ErrorKind kind);
int error_code(ErrorKind kind);

// Probe-level kinds are transient faults of a single endpoint
bool is_endpoint_fault(ErrorKind kind);

struct AttemptFailure {
    std::string url;
    ErrorKind kind;
    std::string message;
};

struct RailError {
    ErrorKind kind;
    std::string message;
    std::vector<AttemptFailure> attempts; // only for AllEndpointsFailed
};

RailError make_error(ErrorKind kind, const std::string& message = "");

// Either a value or a RailError. Core operations return this instead of throwing.
template <typename T>
class Outcome {
public:
    Outcome(T value) : value_(std::move(value)) {}
    Outcome(RailError error) : error_(std::move(error)) {}

    bool ok() const { return value_.has_value(); }
    explicit operator bool() const { return ok(); }

    const T& value() const { return *value_; }
    T& value() { return *value_; }
    const T* operator->() const { return &*value_; }

    const RailError& error() const { return *error_; }

private:
    std::optional<T> value_;
    std::optional<RailError> error_;
};

struct Unit {};
