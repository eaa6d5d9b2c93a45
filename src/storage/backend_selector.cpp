#include "storage/backend_selector.hpp"

#include "common/logger.hpp"
#include "storage/memory_backend.hpp"
#include "storage/object_store_backend.hpp"
#include "storage/redis_backend.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <utility>

namespace notes {

std::string_view to_string(BackendKind kind) noexcept {
    switch (kind) {
    case BackendKind::Memory:      return "memory";
    case BackendKind::RemoteCache: return "remote-cache";
    case BackendKind::ObjectStore: return "object-store";
    }
    return "unknown";
}

std::optional<BackendKind> parse_backend_kind(std::string_view value) {
    std::string lower(value);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "memory")                         return BackendKind::Memory;
    if (lower == "remote-cache" || lower == "redis") return BackendKind::RemoteCache;
    if (lower == "object-store" || lower == "gcs")   return BackendKind::ObjectStore;
    return std::nullopt;
}

// ── BackendSelector ──────────────────────────────────────────────────────────

BackendSelector::BackendSelector(KindSource source, Factory factory,
                                 std::shared_ptr<spdlog::logger> logger)
    : source_(std::move(source)),
      factory_(std::move(factory)),
      logger_(std::move(logger)) {}

Backend& BackendSelector::get() {
    // call_once leaves the flag unset when construct() throws.
    std::call_once(once_, [this] { construct(); });
    return *backend_;
}

void BackendSelector::construct() {
    const std::string raw = source_ ? source_() : std::string{};

    BackendKind kind = BackendKind::Memory;
    if (raw.empty()) {
        logger_->info("No backend selected, defaulting to {}", to_string(kind));
    } else if (auto parsed = parse_backend_kind(raw)) {
        kind = *parsed;
    } else {
        logger_->warn("Unknown backend '{}', falling back to {}", raw, to_string(kind));
    }

    auto backend = factory_(kind);
    if (!backend) {
        throw std::runtime_error("backend factory returned no instance for " +
                                 std::string(to_string(kind)));
    }

    backend_ = std::move(backend);
    kind_    = kind;
    ready_.store(true, std::memory_order_release);
    logger_->info("Backend ready: {}", backend_->name());
}

// ── Default factory ──────────────────────────────────────────────────────────

BackendSelector::Factory
make_backend_factory(const ServiceConfig& config, boost::asio::io_context& ioc) {
    return [config, &ioc](BackendKind kind) -> std::unique_ptr<Backend> {
        auto logger = make_component_logger("backend", parse_log_level(config.log_level));
        switch (kind) {
        case BackendKind::RemoteCache:
            return std::make_unique<RedisBackend>(ioc, config.redis, std::move(logger));
        case BackendKind::ObjectStore:
            return std::make_unique<ObjectStoreBackend>(ioc, config.object_store,
                                                        std::move(logger));
        case BackendKind::Memory:
            break;
        }
        logger->info("Memory backend: notes are lost on restart");
        return std::make_unique<MemoryBackend>();
    };
}

} // namespace notes
