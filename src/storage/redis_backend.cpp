#include "storage/redis_backend.hpp"
#include "storage/errors.hpp"

#include <string>
#include <unordered_set>
#include <utility>
#include <variant>

namespace notes {

using network::RespReply;

std::string scan_pattern_for_prefix(std::string_view prefix) {
    std::string pattern;
    pattern.reserve(prefix.size() + 1);
    for (char c : prefix) {
        switch (c) {
        case '\\': case '*': case '?': case '[': case ']':
            pattern.push_back('\\');
            break;
        default:
            break;
        }
        pattern.push_back(c);
    }
    pattern.push_back('*');
    return pattern;
}

RedisBackend::RedisBackend(boost::asio::io_context& ioc,
                           RedisConfig config,
                           std::shared_ptr<spdlog::logger> logger)
    : client_(ioc, config, logger),
      prefix_(config.key_prefix),
      ttl_seconds_(config.ttl_seconds),
      logger_(std::move(logger)) {
    logger_->info("Remote cache backend: {}:{} db={} prefix='{}' ttl={}s timeout={}ms",
                  config.host, config.port, config.db, prefix_,
                  ttl_seconds_, config.timeout_ms);
}

std::string RedisBackend::key_for(const std::string& id) const {
    return prefix_ + id;
}

boost::asio::awaitable<RespReply> RedisBackend::call(std::vector<std::string> args) {
    const std::string verb = args.front();
    auto result = co_await client_.command(std::move(args));

    if (auto* err = std::get_if<network::ClientError>(&result)) {
        throw BackendUnavailableError("remote cache " + verb + " failed: " + err->message);
    }
    auto& reply = std::get<RespReply>(result);
    if (reply.is_error()) {
        throw BackendUnavailableError("remote cache " + verb + " error reply: " + reply.str);
    }
    co_return std::move(reply);
}

boost::asio::awaitable<Note> RedisBackend::get(std::string id) {
    auto reply = co_await call({"GET", key_for(id)});

    if (reply.is_null()) {
        throw NotFoundError(id);
    }
    if (reply.type != RespReply::Type::BulkString) {
        throw BackendUnavailableError("remote cache GET returned an unexpected reply type");
    }

    auto decoded = decode_payload(reply.str);
    if (auto* bad = std::get_if<MalformedPayload>(&decoded)) {
        logger_->error("Malformed payload stored under '{}': {}", id, bad->reason);
        throw BackendUnavailableError("malformed payload for note '" + id + "': " + bad->reason);
    }
    co_return make_note(std::move(id), std::move(std::get<CreateNoteRequest>(decoded)));
}

boost::asio::awaitable<void> RedisBackend::set(std::string id, CreateNoteRequest request) {
    std::vector<std::string> args{"SET", key_for(id), encode_payload(request)};
    if (ttl_seconds_ > 0) {
        args.emplace_back("EX");
        args.push_back(std::to_string(ttl_seconds_));
    }
    co_await call(std::move(args));
}

boost::asio::awaitable<std::vector<std::string>> RedisBackend::keys() {
    const std::string pattern = scan_pattern_for_prefix(prefix_);

    std::unordered_set<std::string> seen;
    std::vector<std::string> result;
    std::string cursor = "0";

    // SCAN may return a key more than once over one full iteration.
    do {
        auto reply = co_await call({"SCAN", cursor, "MATCH", pattern, "COUNT", kScanBatch});

        if (reply.type != RespReply::Type::Array || reply.elements.size() != 2 ||
            reply.elements[0].type != RespReply::Type::BulkString ||
            reply.elements[1].type != RespReply::Type::Array) {
            throw BackendUnavailableError("remote cache SCAN returned a malformed reply");
        }

        cursor = reply.elements[0].str;
        for (auto& elem : reply.elements[1].elements) {
            if (elem.type != RespReply::Type::BulkString || !elem.str.starts_with(prefix_)) {
                continue;
            }
            std::string id = elem.str.substr(prefix_.size());
            if (seen.insert(id).second) {
                result.push_back(std::move(id));
            }
        }
    } while (cursor != "0");

    logger_->debug("SCAN returned {} keys", result.size());
    co_return result;
}

} // namespace notes
