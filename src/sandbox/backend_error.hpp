#pragma once

#include <stdexcept>
#include <string>

namespace codebox::sandbox {

// Raised by a backend when it cannot produce an ExecResponse. Kind() names the
// cause so callers can tell failures apart without parsing the message.
class BackendError : public std::runtime_error {
public:
    explicit BackendError(const std::string& message)
        : std::runtime_error(message) {}

    virtual const char* Kind() const noexcept { return "BackendError"; }
};

// The command could not be started.
class SpawnError : public BackendError {
public:
    using BackendError::BackendError;
    const char* Kind() const noexcept override { return "SpawnError"; }
};

// The backend could not be reached, or the connection failed mid-request.
class TransportError : public BackendError {
public:
    using BackendError::BackendError;
    const char* Kind() const noexcept override { return "TransportError"; }
};

// The backend answered with something that is not a valid response.
class MalformedResponseError : public BackendError {
public:
    using BackendError::BackendError;
    const char* Kind() const noexcept override { return "MalformedResponseError"; }
};

}  // namespace codebox::sandbox
