#pragma once

#include "network/client_error.hpp"

#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/beast/http/verb.hpp>

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace notes::network {

// ── HttpEndpoint ─────────────────────────────────────────────────────────────
// Parsed form of "http[s]://host[:port][/base/path]".

struct HttpEndpoint {
    bool        tls = false;
    std::string host;
    std::string port;        // "80" / "443" when the URL has none
    std::string base_path;   // no trailing '/', empty for the root
};

// Returns nullopt on anything that is not an http:// or https:// URL with a
// non-empty host.
[[nodiscard]] std::optional<HttpEndpoint> parse_endpoint(std::string_view url);

// Percent-encode everything except RFC 3986 unreserved characters
// (A-Z a-z 0-9 - . _ ~).  '/' is encoded too, as GCS object names require.
[[nodiscard]] std::string percent_encode(std::string_view s);

// ── HttpClient ───────────────────────────────────────────────────────────────

struct HttpResponse {
    unsigned    status = 0;
    std::string body;
};

using HttpResult = std::variant<HttpResponse, ClientError>;
using HttpHeaders = std::vector<std::pair<std::string, std::string>>;

// Minimal HTTP/1.1 client over Boost.Beast, plain or TLS.
//
//   - One connection per request (Connection: close); no pooling.
//   - Each request runs on its own strand, so concurrent request() calls are
//     independent.
//   - Resolve, connect, handshake, write and read are each bounded by the
//     configured timeout.
//   - Any HTTP status is a successful exchange; only transport failures come
//     back as ClientError.
//   - TLS verifies the peer certificate against the system trust store and
//     the endpoint host name.

class HttpClient {
public:
    // Response bodies larger than this are rejected.
    static constexpr std::size_t kMaxBodyBytes = 64u * 1024u * 1024u; // 64 MiB

    HttpClient(boost::asio::io_context& ioc,
               HttpEndpoint endpoint,
               std::chrono::milliseconds timeout,
               std::shared_ptr<spdlog::logger> logger);

    HttpClient(const HttpClient&)            = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    // `target` is appended to the endpoint's base path and must start with '/'.
    [[nodiscard]] boost::asio::awaitable<HttpResult>
    request(boost::beast::http::verb method,
            std::string target,
            std::string body = {},
            HttpHeaders headers = {});

private:
    boost::asio::io_context&        ioc_;
    HttpEndpoint                    endpoint_;
    std::chrono::milliseconds       timeout_;
    boost::asio::ssl::context       ssl_ctx_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace notes::network
