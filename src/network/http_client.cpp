#include "network/http_client.hpp"
#include "network/resolver.hpp"

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/system/error_code.hpp>

#include <openssl/ssl.h>

#include <algorithm>
#include <cctype>
#include <string>
#include <utility>

namespace notes::network {

namespace asio  = boost::asio;
namespace beast = boost::beast;
namespace http  = boost::beast::http;
namespace ssl   = boost::asio::ssl;
using tcp       = boost::asio::ip::tcp;

namespace {

constexpr auto use_awaitable = asio::as_tuple(asio::use_awaitable);
constexpr const char* kUserAgent = "notes-api";

using Request = http::request<http::string_body>;

// Write `req` and read one response, with the deadline re-armed first.
// Works for both beast::tcp_stream and beast::ssl_stream<beast::tcp_stream>.
template <typename Stream>
asio::awaitable<HttpResult>
exchange(Stream& stream, const Request& req, std::chrono::milliseconds timeout) {
    beast::get_lowest_layer(stream).expires_after(timeout);

    auto [wec, wn] = co_await http::async_write(stream, req, use_awaitable);
    if (wec) {
        co_return ClientError{"write failed: " + wec.message()};
    }

    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(HttpClient::kMaxBodyBytes);

    auto [rec, rn] = co_await http::async_read(stream, buffer, parser, use_awaitable);
    if (rec) {
        co_return ClientError{"read failed: " + rec.message()};
    }

    auto res = parser.release();
    co_return HttpResponse{res.result_int(), std::move(res.body())};
}

asio::awaitable<HttpResult>
perform_plain(const HttpEndpoint& ep, Request req, std::chrono::milliseconds timeout) {
    auto resolved = co_await resolve(ep.host, ep.port, timeout);
    if (auto* err = std::get_if<ClientError>(&resolved)) {
        co_return std::move(*err);
    }

    beast::tcp_stream stream(co_await asio::this_coro::executor);
    stream.expires_after(timeout);
    auto [cec, endpoint] = co_await stream.async_connect(
        std::get<tcp::resolver::results_type>(resolved), use_awaitable);
    if (cec) {
        co_return ClientError{"connect to " + ep.host + ":" + ep.port + " failed: " + cec.message()};
    }

    auto result = co_await exchange(stream, req, timeout);

    // not_connected is common here once the peer has closed; nothing to do.
    boost::system::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    co_return result;
}

asio::awaitable<HttpResult>
perform_tls(const HttpEndpoint& ep, ssl::context& ctx, Request req,
            std::chrono::milliseconds timeout, spdlog::logger& logger) {
    auto resolved = co_await resolve(ep.host, ep.port, timeout);
    if (auto* err = std::get_if<ClientError>(&resolved)) {
        co_return std::move(*err);
    }

    beast::ssl_stream<beast::tcp_stream> stream(co_await asio::this_coro::executor, ctx);

    // SNI: most TLS front ends reject handshakes without it.
    if (!SSL_set_tlsext_host_name(stream.native_handle(), ep.host.c_str())) {
        co_return ClientError{"failed to set TLS SNI host name " + ep.host};
    }
    stream.set_verify_callback(ssl::host_name_verification(ep.host));

    beast::get_lowest_layer(stream).expires_after(timeout);
    auto [cec, endpoint] = co_await beast::get_lowest_layer(stream).async_connect(
        std::get<tcp::resolver::results_type>(resolved), use_awaitable);
    if (cec) {
        co_return ClientError{"connect to " + ep.host + ":" + ep.port + " failed: " + cec.message()};
    }

    beast::get_lowest_layer(stream).expires_after(timeout);
    auto [hec] = co_await stream.async_handshake(ssl::stream_base::client, use_awaitable);
    if (hec) {
        co_return ClientError{"TLS handshake with " + ep.host + " failed: " + hec.message()};
    }

    auto result = co_await exchange(stream, req, timeout);

    beast::get_lowest_layer(stream).expires_after(timeout);
    auto [sec] = co_await stream.async_shutdown(use_awaitable);
    if (sec && sec != asio::error::eof && sec != ssl::error::stream_truncated) {
        logger.debug("TLS shutdown with {} failed: {}", ep.host, sec.message());
    }
    co_return result;
}

bool is_unreserved(unsigned char c) {
    return std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~';
}

} // anonymous namespace

// ── Free helpers ─────────────────────────────────────────────────────────────

std::optional<HttpEndpoint> parse_endpoint(std::string_view url) {
    HttpEndpoint ep;
    std::string_view rest;
    if (url.starts_with("https://")) {
        ep.tls = true;
        rest   = url.substr(8);
    } else if (url.starts_with("http://")) {
        rest = url.substr(7);
    } else {
        return std::nullopt;
    }

    const auto slash = rest.find('/');
    const std::string_view authority = rest.substr(0, slash);
    std::string_view path = (slash == std::string_view::npos) ? std::string_view{}
                                                              : rest.substr(slash);
    while (!path.empty() && path.back() == '/') {
        path.remove_suffix(1);
    }

    // host[:port] – bracketed IPv6 literals are not supported.
    const auto colon = authority.rfind(':');
    if (colon == std::string_view::npos) {
        ep.host = std::string(authority);
        ep.port = ep.tls ? "443" : "80";
    } else {
        ep.host = std::string(authority.substr(0, colon));
        ep.port = std::string(authority.substr(colon + 1));
        if (ep.port.empty() ||
            !std::all_of(ep.port.begin(), ep.port.end(),
                         [](unsigned char c) { return std::isdigit(c); })) {
            return std::nullopt;
        }
    }
    if (ep.host.empty()) {
        return std::nullopt;
    }
    ep.base_path = std::string(path);
    return ep;
}

std::string percent_encode(std::string_view s) {
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(s.size());
    for (const char ch : s) {
        const auto c = static_cast<unsigned char>(ch);
        if (is_unreserved(c)) {
            out.push_back(ch);
        } else {
            out.push_back('%');
            out.push_back(kHex[c >> 4]);
            out.push_back(kHex[c & 0x0F]);
        }
    }
    return out;
}

// ── HttpClient ───────────────────────────────────────────────────────────────

HttpClient::HttpClient(boost::asio::io_context& ioc,
                       HttpEndpoint endpoint,
                       std::chrono::milliseconds timeout,
                       std::shared_ptr<spdlog::logger> logger)
    : ioc_(ioc),
      endpoint_(std::move(endpoint)),
      timeout_(timeout),
      ssl_ctx_(ssl::context::tls_client),
      logger_(std::move(logger)) {
    if (endpoint_.tls) {
        ssl_ctx_.set_default_verify_paths();
        ssl_ctx_.set_verify_mode(ssl::verify_peer);
    }
}

asio::awaitable<HttpResult>
HttpClient::request(http::verb method, std::string target, std::string body,
                    HttpHeaders headers) {
    const bool default_port = endpoint_.port == (endpoint_.tls ? "443" : "80");

    Request req{method, endpoint_.base_path + target, 11};
    req.set(http::field::host,
            default_port ? endpoint_.host : endpoint_.host + ":" + endpoint_.port);
    req.set(http::field::user_agent, kUserAgent);
    req.keep_alive(false);
    for (auto& [name, value] : headers) {
        req.set(name, std::move(value));
    }
    req.body() = std::move(body);
    req.prepare_payload();

    logger_->trace("HTTP {} {}{}", std::string(http::to_string(method)),
                   endpoint_.host, std::string(req.target()));

    auto strand = asio::make_strand(ioc_);
    if (endpoint_.tls) {
        co_return co_await asio::co_spawn(
            strand, perform_tls(endpoint_, ssl_ctx_, std::move(req), timeout_, *logger_),
            asio::use_awaitable);
    }
    co_return co_await asio::co_spawn(
        strand, perform_plain(endpoint_, std::move(req), timeout_),
        asio::use_awaitable);
}

} // namespace notes::network
