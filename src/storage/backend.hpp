#pragma once

#include "model/note.hpp"

#include <utility>

#include <boost/asio/awaitable.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace notes {

// ── Backend ──────────────────────────────────────────────────────────────────
//
// Abstract interface for a note storage backend.
//
// Implementations must be safe to call from several coroutines at once on a
// multi-threaded io_context.  The concrete backend (in-process memory, remote
// cache, object store) is chosen once per process by BackendSelector.
//
// Every operation is a coroutine so network variants can suspend around I/O
// without blocking a worker thread.  Arguments are taken by value: a call owns
// everything it touches.
//
// Failures are thrown, never returned:
//   NotFoundError           – get() on an identifier that was never set
//   BackendUnavailableError – transport, auth, timeout or malformed payload

class Backend {
public:
    virtual ~Backend() = default;

    // Returns the note stored under `id`.
    [[nodiscard]] virtual boost::asio::awaitable<Note> get(std::string id) = 0;

    // Creates or fully overwrites the note stored under `id`.
    virtual boost::asio::awaitable<void> set(std::string id, CreateNoteRequest request) = 0;

    // Returns every known identifier (order is unspecified).
    [[nodiscard]] virtual boost::asio::awaitable<std::vector<std::string>> keys() = 0;

    // Short variant name for logs: "memory", "remote-cache", "object-store".
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

} // namespace notes
