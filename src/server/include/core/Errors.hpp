#pragma once

#include <stdexcept>
#include <string>

// [ALL-AGENTS] Errors surfaced synchronously to callers of the service
// Delivery failures and stale updates are not errors; they are counted and logged

namespace NearbyConnect {

class NearbyError : public std::runtime_error {
public:
    explicit NearbyError(const std::string& what) : std::runtime_error(what) {}
};

// Malformed coordinates, out-of-range radius, empty recipient list, bad content
class ValidationError : public NearbyError {
public:
    explicit ValidationError(const std::string& what) : NearbyError(what) {}
};

// Unknown requester, recipient or connection
class NotFoundError : public NearbyError {
public:
    explicit NotFoundError(const std::string& what) : NearbyError(what) {}
};

// Join of another user's location room without a sharing grant
class PermissionDeniedError : public NearbyError {
public:
    explicit PermissionDeniedError(const std::string& what) : NearbyError(what) {}
};

// External store could not answer a read (unreachable, timed out); not the same as missing
class StoreUnavailableError : public NearbyError {
public:
    explicit StoreUnavailableError(const std::string& what) : NearbyError(what) {}
};

// External store rejected a write that must be durable before fan-out
class PersistenceError : public NearbyError {
public:
    explicit PersistenceError(const std::string& what) : NearbyError(what) {}
};

} // namespace NearbyConnect
