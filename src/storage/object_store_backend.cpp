#include "storage/object_store_backend.hpp"
#include "storage/errors.hpp"

#include <json/json.h>

#include <chrono>
#include <memory>
#include <string>
#include <utility>
#include <variant>

namespace notes {

namespace http = boost::beast::http;
using network::HttpResponse;
using network::percent_encode;

namespace {

bool is_success(unsigned status) {
    return status >= 200 && status < 300;
}

// Checked before the HTTP client is built from it.
network::HttpEndpoint checked_endpoint(const ObjectStoreConfig& config) {
    if (config.bucket.empty()) {
        throw BackendUnavailableError("object store bucket is not configured");
    }
    auto endpoint = network::parse_endpoint(config.endpoint);
    if (!endpoint) {
        throw BackendUnavailableError("object store endpoint '" + config.endpoint +
                                      "' is not an http(s) URL");
    }
    return *endpoint;
}

std::string describe(const HttpResponse& res) {
    constexpr std::size_t kMaxBodyInMessage = 200;
    std::string msg = "HTTP " + std::to_string(res.status);
    if (!res.body.empty()) {
        msg += ": " + res.body.substr(0, kMaxBodyInMessage);
    }
    return msg;
}

} // anonymous namespace

ObjectStoreBackend::ObjectStoreBackend(boost::asio::io_context& ioc,
                                       ObjectStoreConfig config,
                                       std::shared_ptr<spdlog::logger> logger)
    : config_(std::move(config)),
      client_(ioc, checked_endpoint(config_),
              std::chrono::milliseconds(config_.timeout_ms), logger),
      logger_(std::move(logger)) {
    logger_->info("Object store backend: {} bucket={} prefix='{}' auth={} timeout={}ms",
                  config_.endpoint, config_.bucket, config_.prefix,
                  config_.token.empty() ? "none" : "bearer", config_.timeout_ms);
}

boost::asio::awaitable<HttpResponse>
ObjectStoreBackend::call(http::verb method, std::string target,
                         std::string body, network::HttpHeaders headers) {
    if (!config_.token.empty()) {
        headers.emplace_back("Authorization", "Bearer " + config_.token);
    }
    auto result = co_await client_.request(method, std::move(target),
                                           std::move(body), std::move(headers));
    if (auto* err = std::get_if<network::ClientError>(&result)) {
        throw BackendUnavailableError("object store request failed: " + err->message);
    }
    co_return std::move(std::get<HttpResponse>(result));
}

boost::asio::awaitable<Note> ObjectStoreBackend::get(std::string id) {
    const std::string target = "/storage/v1/b/" + percent_encode(config_.bucket) +
                               "/o/" + percent_encode(config_.prefix + id) + "?alt=media";
    auto res = co_await call(http::verb::get, target);

    if (res.status == 404) {
        throw NotFoundError(id);
    }
    if (!is_success(res.status)) {
        throw BackendUnavailableError("object store GET failed: " + describe(res));
    }

    auto decoded = decode_payload(res.body);
    if (auto* bad = std::get_if<MalformedPayload>(&decoded)) {
        logger_->error("Malformed payload stored in object '{}{}': {}",
                       config_.prefix, id, bad->reason);
        throw BackendUnavailableError("malformed payload for note '" + id + "': " + bad->reason);
    }
    co_return make_note(std::move(id), std::move(std::get<CreateNoteRequest>(decoded)));
}

boost::asio::awaitable<void> ObjectStoreBackend::set(std::string id, CreateNoteRequest request) {
    const std::string target = "/upload/storage/v1/b/" + percent_encode(config_.bucket) +
                               "/o?uploadType=media&name=" + percent_encode(config_.prefix + id);
    auto res = co_await call(http::verb::post, target, encode_payload(request),
                             {{"Content-Type", "application/json"}});

    if (!is_success(res.status)) {
        throw BackendUnavailableError("object store upload failed: " + describe(res));
    }
}

boost::asio::awaitable<std::vector<std::string>> ObjectStoreBackend::keys() {
    const std::string base = "/storage/v1/b/" + percent_encode(config_.bucket) +
                             "/o?prefix=" + percent_encode(config_.prefix);

    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    const std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    std::vector<std::string> result;
    std::string page_token;
    int pages = 0;

    do {
        std::string target = base;
        if (!page_token.empty()) {
            target += "&pageToken=" + percent_encode(page_token);
        }
        auto res = co_await call(http::verb::get, std::move(target));
        if (!is_success(res.status)) {
            throw BackendUnavailableError("object store listing failed: " + describe(res));
        }

        Json::Value root;
        std::string errs;
        if (!reader->parse(res.body.data(), res.body.data() + res.body.size(), &root, &errs) ||
            !root.isObject()) {
            throw BackendUnavailableError("object store listing is not a JSON object: " + errs);
        }

        // "items" is omitted entirely on an empty page.
        for (const auto& item : root["items"]) {
            if (!item.isObject()) {
                continue;
            }
            const Json::Value& name = item["name"];
            if (!name.isString()) {
                continue;
            }
            std::string object_name = name.asString();
            if (!object_name.starts_with(config_.prefix)) {
                continue;
            }
            result.push_back(object_name.substr(config_.prefix.size()));
        }

        const Json::Value& next = root["nextPageToken"];
        page_token = next.isString() ? next.asString() : std::string{};
        ++pages;
    } while (!page_token.empty());

    logger_->debug("Object listing returned {} keys over {} page(s)", result.size(), pages);
    co_return result;
}

} // namespace notes
