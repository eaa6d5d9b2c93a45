#include "network/http_session.hpp"

#include "model/note.hpp"

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http.hpp>
#include <boost/system/error_code.hpp>

#include <json/json.h>

#include <string>
#include <utility>

namespace notes::network {

namespace beast = boost::beast;
namespace http  = boost::beast::http;

namespace {
constexpr auto use_awaitable = boost::asio::as_tuple(boost::asio::use_awaitable);

bool is_disconnect(const boost::system::error_code& ec) {
    return ec == http::error::end_of_stream ||
           ec == boost::asio::error::eof ||
           ec == boost::asio::error::connection_reset ||
           ec == boost::asio::error::operation_aborted ||
           ec == beast::error::timeout;
}
} // namespace

HttpSession::HttpSession(boost::asio::ip::tcp::socket socket, Router& router,
                         std::shared_ptr<spdlog::logger> logger)
    : stream_(std::move(socket)), router_(router), logger_(std::move(logger)) {}

boost::asio::awaitable<void> HttpSession::run() {
    const auto remote = [&]() -> std::string {
        boost::system::error_code ec;
        const auto ep = stream_.socket().remote_endpoint(ec);
        return ec ? "<unknown>" : ep.address().to_string() + ":" + std::to_string(ep.port());
    }();

    logger_->debug("Session {}: connected", remote);

    beast::flat_buffer buffer;
    for (;;) {
        http::request_parser<http::string_body> parser;
        parser.body_limit(kMaxBodyBytes);

        stream_.expires_after(kIdleTimeout);
        auto [ec, n] = co_await http::async_read(stream_, buffer, parser, use_awaitable);

        if (ec == http::error::body_limit) {
            Json::Value detail(Json::objectValue);
            detail["detail"] = "Request body too large";

            http::response<http::string_body> res{http::status::payload_too_large,
                                                  parser.get().version()};
            res.set(http::field::server, "notes-api");
            res.set(http::field::content_type, "application/json");
            res.keep_alive(false);
            res.body() = write_compact(detail);
            res.prepare_payload();

            logger_->warn("Session {}: request body over {} bytes rejected",
                          remote, kMaxBodyBytes);
            auto [wec, wn] = co_await http::async_write(stream_, res, use_awaitable);
            if (wec) {
                logger_->debug("Session {}: write error: {}", remote, wec.message());
            }
            break;
        }
        if (ec) {
            if (!is_disconnect(ec)) {
                logger_->debug("Session {}: read error: {}", remote, ec.message());
            }
            break;
        }

        const auto req = parser.release();
        stream_.expires_never();

        auto res = co_await router_.handle(req);

        stream_.expires_after(kIdleTimeout);
        auto [wec, wn] = co_await http::async_write(stream_, res, use_awaitable);
        if (wec) {
            logger_->debug("Session {}: write error: {}", remote, wec.message());
            break;
        }
        if (!res.keep_alive()) {
            break;
        }
    }

    boost::system::error_code ec;
    stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
    logger_->debug("Session {}: disconnected", remote);
}

} // namespace notes::network
