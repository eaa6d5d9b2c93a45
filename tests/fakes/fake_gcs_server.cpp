#include "fakes/fake_gcs_server.hpp"

#include "network/router.hpp"

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <json/json.h>

#include <algorithm>
#include <string_view>
#include <utility>

namespace notes::test {

namespace asio  = boost::asio;
namespace beast = boost::beast;
namespace http  = boost::beast::http;
using tcp = asio::ip::tcp;

namespace {

constexpr auto use_awaitable = asio::as_tuple(asio::use_awaitable);

std::map<std::string, std::string> parse_query(std::string_view query) {
    std::map<std::string, std::string> out;
    while (!query.empty()) {
        const auto amp  = query.find('&');
        const auto pair = query.substr(0, amp);
        const auto eq   = pair.find('=');
        if (eq == std::string_view::npos) {
            out[network::percent_decode(pair)] = "";
        } else {
            out[network::percent_decode(pair.substr(0, eq))] =
                network::percent_decode(pair.substr(eq + 1));
        }
        if (amp == std::string_view::npos) break;
        query.remove_prefix(amp + 1);
    }
    return out;
}

std::string json_error(unsigned status, const std::string& message) {
    Json::Value root(Json::objectValue);
    root["error"]["code"]    = status;
    root["error"]["message"] = message;
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, root);
}

} // namespace

FakeGcsServer::FakeGcsServer(std::string bucket)
    : bucket_(std::move(bucket)),
      acceptor_(ioc_, {asio::ip::make_address("127.0.0.1"), 0}) {
    port_ = acceptor_.local_endpoint().port();
    asio::co_spawn(ioc_, accept_loop(), asio::detached);
    thread_ = std::thread([this] { ioc_.run(); });
}

FakeGcsServer::~FakeGcsServer() {
    ioc_.stop();
    if (thread_.joinable()) thread_.join();
}

std::string FakeGcsServer::endpoint() const {
    return "http://127.0.0.1:" + std::to_string(port_);
}

void FakeGcsServer::put(const std::string& name, const std::string& body) {
    std::lock_guard lock(mutex_);
    objects_[name] = body;
}

std::optional<std::string> FakeGcsServer::object(const std::string& name) const {
    std::lock_guard lock(mutex_);
    auto it = objects_.find(name);
    if (it == objects_.end()) return std::nullopt;
    return it->second;
}

void FakeGcsServer::set_page_size(std::size_t n) {
    std::lock_guard lock(mutex_);
    page_size_ = n;
}

void FakeGcsServer::fail_with(unsigned status) {
    std::lock_guard lock(mutex_);
    fail_status_ = status;
}

std::vector<std::string> FakeGcsServer::targets() const {
    std::lock_guard lock(mutex_);
    return targets_;
}

std::string FakeGcsServer::last_authorization() const {
    std::lock_guard lock(mutex_);
    return last_authorization_;
}

std::string FakeGcsServer::last_content_type() const {
    std::lock_guard lock(mutex_);
    return last_content_type_;
}

asio::awaitable<void> FakeGcsServer::accept_loop() {
    for (;;) {
        auto [ec, socket] = co_await acceptor_.async_accept(use_awaitable);
        if (ec) co_return;
        asio::co_spawn(ioc_, serve(std::move(socket)), asio::detached);
    }
}

asio::awaitable<void> FakeGcsServer::serve(tcp::socket socket) {
    beast::tcp_stream stream(std::move(socket));
    beast::flat_buffer buffer;

    for (;;) {
        Request req;
        auto [ec, n] = co_await http::async_read(stream, buffer, req, use_awaitable);
        if (ec) co_return;

        auto res = handle(req);
        res.keep_alive(req.keep_alive());
        res.prepare_payload();

        auto [wec, wn] = co_await http::async_write(stream, res, use_awaitable);
        if (wec || !res.keep_alive()) break;
    }

    boost::system::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_send, ec);
}

FakeGcsServer::Response FakeGcsServer::handle(const Request& req) {
    const std::string target(req.target());
    {
        std::lock_guard lock(mutex_);
        targets_.push_back(target);
        last_authorization_ = std::string(req[http::field::authorization]);
        last_content_type_  = std::string(req[http::field::content_type]);
    }

    Response res{http::status::ok, req.version()};
    res.set(http::field::content_type, "application/json");

    unsigned fail_status = 0;
    {
        std::lock_guard lock(mutex_);
        fail_status = fail_status_;
    }
    if (fail_status != 0) {
        res.result(fail_status);
        res.body() = json_error(fail_status, "injected failure");
        return res;
    }

    std::string_view path(target);
    std::string_view query;
    if (const auto q = path.find('?'); q != std::string_view::npos) {
        query = path.substr(q + 1);
        path  = path.substr(0, q);
    }
    const auto params = parse_query(query);

    const std::string upload_prefix = "/upload/storage/v1/b/" + bucket_ + "/o";
    const std::string object_prefix = "/storage/v1/b/" + bucket_ + "/o";

    if (req.method() == http::verb::post && path == upload_prefix) {
        auto name = params.find("name");
        if (name == params.end() || params.count("uploadType") == 0) {
            res.result(http::status::bad_request);
            res.body() = json_error(400, "missing name or uploadType");
            return res;
        }
        put(name->second, req.body());

        Json::Value meta(Json::objectValue);
        meta["bucket"] = bucket_;
        meta["name"]   = name->second;
        Json::StreamWriterBuilder builder;
        res.body() = Json::writeString(builder, meta);
        return res;
    }

    if (req.method() == http::verb::get && path == object_prefix) {
        return list(req, params);
    }

    if (req.method() == http::verb::get && path.starts_with(object_prefix + "/")) {
        const std::string name = network::percent_decode(path.substr(object_prefix.size() + 1));
        auto body = object(name);
        if (!body) {
            res.result(http::status::not_found);
            res.body() = json_error(404, "No such object: " + bucket_ + "/" + name);
            return res;
        }
        res.body() = *body;
        return res;
    }

    res.result(http::status::not_found);
    res.body() = json_error(404, "The specified bucket does not exist.");
    return res;
}

FakeGcsServer::Response FakeGcsServer::list(const Request& req,
                                            const std::map<std::string, std::string>& query) {
    std::string prefix;
    if (auto it = query.find("prefix"); it != query.end()) prefix = it->second;

    std::size_t start = 0;
    if (auto it = query.find("pageToken"); it != query.end()) start = std::stoul(it->second);

    Json::Value root(Json::objectValue);
    root["kind"] = "storage#objects";
    {
        std::lock_guard lock(mutex_);
        std::vector<std::string> names;
        for (const auto& [name, _] : objects_) {
            if (name.starts_with(prefix)) names.push_back(name);
        }
        const std::size_t end = std::min(start + page_size_, names.size());
        if (start < end) {
            Json::Value items(Json::arrayValue);
            for (std::size_t i = start; i < end; ++i) {
                Json::Value item(Json::objectValue);
                item["name"]   = names[i];
                item["bucket"] = bucket_;
                items.append(item);
            }
            root["items"] = items;
        }
        if (end < names.size()) {
            root["nextPageToken"] = std::to_string(end);
        }
    }

    Response res{http::status::ok, req.version()};
    res.set(http::field::content_type, "application/json");
    Json::StreamWriterBuilder builder;
    res.body() = Json::writeString(builder, root);
    return res;
}

} // namespace notes::test
