#pragma once

#include "common/service_config.hpp"
#include "network/redis_client.hpp"
#include "storage/backend.hpp"

#include <boost/asio/io_context.hpp>

#include <spdlog/spdlog.h>

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace notes {

// ── RedisBackend ─────────────────────────────────────────────────────────────
//
// Remote-cache backend: one Redis string per note.
//
//   key   = <key_prefix><id>
//   value = {"title": ..., "content": ...}
//
// get()  → GET;  null reply → NotFoundError
// set()  → SET key value [EX ttl]
// keys() → SCAN 0 MATCH <escaped prefix>* COUNT 100 ... until the cursor is back at 0
//
// keys() walks the whole key space; it is unbounded on large deployments.
// Every transport failure, timeout, -ERR reply or undecodable value is thrown
// as BackendUnavailableError.
//
// The connection pool is created here, once; sockets open lazily.

// SCAN MATCH pattern selecting every key that starts with `prefix`.  Glob
// metacharacters in the prefix (\ * ? [ ]) are backslash-escaped.
[[nodiscard]] std::string scan_pattern_for_prefix(std::string_view prefix);

class RedisBackend final : public Backend {
public:
    static constexpr const char* kScanBatch = "100";

    RedisBackend(boost::asio::io_context& ioc,
                 RedisConfig config,
                 std::shared_ptr<spdlog::logger> logger);

    [[nodiscard]] boost::asio::awaitable<Note> get(std::string id) override;
    boost::asio::awaitable<void> set(std::string id, CreateNoteRequest request) override;
    [[nodiscard]] boost::asio::awaitable<std::vector<std::string>> keys() override;

    [[nodiscard]] std::string_view name() const noexcept override { return "remote-cache"; }

private:
    // Runs a command and throws BackendUnavailableError on ClientError or an
    // error reply.
    [[nodiscard]] boost::asio::awaitable<network::RespReply>
    call(std::vector<std::string> args);

    [[nodiscard]] std::string key_for(const std::string& id) const;

    network::RedisClient            client_;
    std::string                     prefix_;
    uint32_t                        ttl_seconds_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace notes
