#pragma once

#include "storage/backend_selector.hpp"

#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>

#include <spdlog/spdlog.h>

#include <memory>
#include <string>
#include <string_view>

namespace notes::network {

// ── Router ───────────────────────────────────────────────────────────────────
//
// Maps HTTP requests onto the selected backend.
//
//   GET  /             → 307, Location: /notes
//   GET  /notes        → 200 [Note, ...]
//   POST /notes        → 200 "<new id>"
//   GET  /notes/{id}   → 200 Note | 404 {"detail":"Note not found"}
//   PUT  /notes/{id}   → 200 null
//
// Unknown path → 404, known path with another method → 405 (+ Allow),
// malformed body → 422, BackendUnavailableError → 503, anything else → 500.
// Every error body is {"detail": "..."}.
//
// handle() never throws; it is safe to call concurrently.

class Router {
public:
    using Request  = boost::beast::http::request<boost::beast::http::string_body>;
    using Response = boost::beast::http::response<boost::beast::http::string_body>;

    Router(BackendSelector& selector, std::shared_ptr<spdlog::logger> logger);

    Router(const Router&)            = delete;
    Router& operator=(const Router&) = delete;

    [[nodiscard]] boost::asio::awaitable<Response> handle(const Request& req);

private:
    [[nodiscard]] boost::asio::awaitable<Response> dispatch(const Request& req);

    [[nodiscard]] boost::asio::awaitable<Response> list_notes(const Request& req);
    [[nodiscard]] boost::asio::awaitable<Response> create_note(const Request& req);
    [[nodiscard]] boost::asio::awaitable<Response> get_note(const Request& req, std::string id);
    [[nodiscard]] boost::asio::awaitable<Response> put_note(const Request& req, std::string id);

    BackendSelector&                selector_;
    std::shared_ptr<spdlog::logger> logger_;
};

// Decode %XX escapes in a path segment.  Malformed escapes are kept verbatim.
[[nodiscard]] std::string percent_decode(std::string_view s);

} // namespace notes::network
