#pragma once

#include <stdexcept>
#include <string>

namespace notes {

// ── Backend failures ──────────────────────────────────────────────────────────
//
// Thrown out of Backend coroutines and propagated untouched through the core.
// The router is the only place that maps them to transport-level responses.

// The requested identifier does not exist in the backend.
class NotFoundError : public std::runtime_error {
public:
    explicit NotFoundError(const std::string& id)
        : std::runtime_error("note '" + id + "' not found"), id_(id) {}

    [[nodiscard]] const std::string& id() const noexcept { return id_; }

private:
    std::string id_;
};

// The underlying network/library call failed: connection, auth, timeout,
// error reply or a stored payload that could not be decoded.
class BackendUnavailableError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace notes
