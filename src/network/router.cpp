#include "network/router.hpp"

#include "model/note.hpp"
#include "storage/errors.hpp"

#include <boost/beast/http/field.hpp>
#include <boost/beast/http/status.hpp>
#include <boost/beast/http/verb.hpp>

#include <json/json.h>

#include <chrono>
#include <exception>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace notes::network {

namespace http = boost::beast::http;

namespace {

constexpr const char*      kNotesPath   = "/notes";
constexpr std::string_view kNotesPrefix = "/notes/";

Router::Response make_response(const Router::Request& req, http::status status,
                               std::string body) {
    Router::Response res{status, req.version()};
    res.set(http::field::server, "notes-api");
    res.set(http::field::content_type, "application/json");
    res.keep_alive(req.keep_alive());
    res.body() = std::move(body);
    res.prepare_payload();
    return res;
}

Router::Response detail_response(const Router::Request& req, http::status status,
                                 const std::string& detail) {
    Json::Value root(Json::objectValue);
    root["detail"] = detail;
    return make_response(req, status, write_compact(root));
}

Router::Response method_not_allowed(const Router::Request& req, const char* allow) {
    auto res = detail_response(req, http::status::method_not_allowed, "Method Not Allowed");
    res.set(http::field::allow, allow);
    return res;
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // anonymous namespace

std::string percent_decode(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (std::size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '%' && i + 2 < s.size()) {
            const int hi = hex_value(s[i + 1]);
            const int lo = hex_value(s[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>((hi << 4) | lo));
                i += 2;
                continue;
            }
        }
        out.push_back(s[i]);
    }
    return out;
}

// ── Router ───────────────────────────────────────────────────────────────────

Router::Router(BackendSelector& selector, std::shared_ptr<spdlog::logger> logger)
    : selector_(selector), logger_(std::move(logger)) {}

boost::asio::awaitable<Router::Response> Router::handle(const Request& req) {
    const auto start = std::chrono::steady_clock::now();

    Response res;
    try {
        res = co_await dispatch(req);
    } catch (const NotFoundError&) {
        res = detail_response(req, http::status::not_found, "Note not found");
    } catch (const BackendUnavailableError& e) {
        logger_->error("{} {}: backend unavailable: {}",
                       std::string(req.method_string()), std::string(req.target()), e.what());
        res = detail_response(req, http::status::service_unavailable, e.what());
    } catch (const std::exception& e) {
        logger_->error("{} {}: unhandled error: {}",
                       std::string(req.method_string()), std::string(req.target()), e.what());
        res = detail_response(req, http::status::internal_server_error, "Internal Server Error");
    }

    const auto elapsed = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - start);
    logger_->info("{} {} {} {:.2f}ms",
                  std::string(req.method_string()), std::string(req.target()),
                  res.result_int(), elapsed.count());
    co_return res;
}

boost::asio::awaitable<Router::Response> Router::dispatch(const Request& req) {
    std::string_view path{req.target().data(), req.target().size()};
    if (const auto q = path.find('?'); q != std::string_view::npos) {
        path = path.substr(0, q);
    }

    if (path == "/") {
        if (req.method() != http::verb::get) {
            co_return method_not_allowed(req, "GET");
        }
        auto res = make_response(req, http::status::temporary_redirect, {});
        res.set(http::field::location, kNotesPath);
        co_return res;
    }

    if (path == kNotesPath) {
        switch (req.method()) {
        case http::verb::get:  co_return co_await list_notes(req);
        case http::verb::post: co_return co_await create_note(req);
        default:               co_return method_not_allowed(req, "GET, POST");
        }
    }

    if (path.starts_with(kNotesPrefix)) {
        const auto segment = path.substr(kNotesPrefix.size());
        if (!segment.empty() && segment.find('/') == std::string_view::npos) {
            std::string id = percent_decode(segment);
            switch (req.method()) {
            case http::verb::get: co_return co_await get_note(req, std::move(id));
            case http::verb::put: co_return co_await put_note(req, std::move(id));
            default:              co_return method_not_allowed(req, "GET, PUT");
            }
        }
    }

    co_return detail_response(req, http::status::not_found, "Not Found");
}

// ── Handlers ─────────────────────────────────────────────────────────────────

boost::asio::awaitable<Router::Response> Router::list_notes(const Request& req) {
    Backend& backend = selector_.get();
    const auto ids = co_await backend.keys();

    Json::Value array(Json::arrayValue);
    for (const auto& id : ids) {
        try {
            array.append(note_to_json(co_await backend.get(id)));
        } catch (const NotFoundError&) {
            // Expired or overwritten between keys() and get().
            logger_->debug("Note '{}' vanished while listing", id);
        }
    }
    co_return make_response(req, http::status::ok, write_compact(array));
}

boost::asio::awaitable<Router::Response> Router::create_note(const Request& req) {
    auto decoded = decode_payload(req.body());
    if (auto* bad = std::get_if<MalformedPayload>(&decoded)) {
        co_return detail_response(req, http::status::unprocessable_entity, bad->reason);
    }

    Backend& backend = selector_.get();
    std::string id = generate_note_id();
    co_await backend.set(id, std::move(std::get<CreateNoteRequest>(decoded)));
    logger_->debug("Created note {} in {}", id, backend.name());

    co_return make_response(req, http::status::ok, write_compact(Json::Value(id)));
}

boost::asio::awaitable<Router::Response> Router::get_note(const Request& req, std::string id) {
    Backend& backend = selector_.get();
    const Note note = co_await backend.get(std::move(id));
    co_return make_response(req, http::status::ok, encode_note(note));
}

boost::asio::awaitable<Router::Response> Router::put_note(const Request& req, std::string id) {
    auto decoded = decode_payload(req.body());
    if (auto* bad = std::get_if<MalformedPayload>(&decoded)) {
        co_return detail_response(req, http::status::unprocessable_entity, bad->reason);
    }

    Backend& backend = selector_.get();
    co_await backend.set(std::move(id), std::move(std::get<CreateNoteRequest>(decoded)));
    co_return make_response(req, http::status::ok, "null");
}

} // namespace notes::network
