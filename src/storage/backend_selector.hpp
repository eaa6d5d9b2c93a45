#pragma once

#include "common/service_config.hpp"
#include "storage/backend.hpp"

#include <boost/asio/io_context.hpp>

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace notes {

enum class BackendKind : uint8_t {
    Memory,
    RemoteCache,
    ObjectStore,
};

[[nodiscard]] std::string_view to_string(BackendKind kind) noexcept;

// Case-insensitive: "memory", "remote-cache" | "redis", "object-store" | "gcs".
// Returns nullopt for anything else (including the empty string).
[[nodiscard]] std::optional<BackendKind> parse_backend_kind(std::string_view value);

// ── BackendSelector ──────────────────────────────────────────────────────────
//
// Lazily constructs the process-wide backend on first use and hands out the
// same instance forever after.
//
//   Uninitialized ──get()──▶ Constructing ──▶ Ready
//
// The selection value is read from `source` inside the one-time construction;
// absent or unrecognised values select BackendKind::Memory.  Concurrent first
// callers block until the single construction finishes.  If `factory` throws,
// the exception reaches that caller, the selector stays Uninitialized and the
// next get() tries again.
//
// Owned by main and passed by reference; there is no global instance.

class BackendSelector {
public:
    using KindSource = std::function<std::string()>;
    using Factory    = std::function<std::unique_ptr<Backend>(BackendKind)>;

    BackendSelector(KindSource source, Factory factory,
                    std::shared_ptr<spdlog::logger> logger);

    BackendSelector(const BackendSelector&)            = delete;
    BackendSelector& operator=(const BackendSelector&) = delete;

    // Returns the backend, constructing it on the first successful call.
    [[nodiscard]] Backend& get();

    [[nodiscard]] bool initialized() const noexcept {
        return ready_.load(std::memory_order_acquire);
    }

    // Kind of the constructed backend, or nullopt before a successful get().
    [[nodiscard]] std::optional<BackendKind> kind() const noexcept {
        if (!ready_.load(std::memory_order_acquire)) {
            return std::nullopt;
        }
        return kind_;
    }

private:
    void construct();

    KindSource                      source_;
    Factory                         factory_;
    std::shared_ptr<spdlog::logger> logger_;

    std::once_flag                  once_;
    std::unique_ptr<Backend>        backend_;
    BackendKind                     kind_ = BackendKind::Memory;
    std::atomic<bool>               ready_{false};
};

// Factory that builds each kind from `config`, with its I/O on `ioc`.
// Backends log through the "backend" component logger.
[[nodiscard]] BackendSelector::Factory
make_backend_factory(const ServiceConfig& config, boost::asio::io_context& ioc);

} // namespace notes
