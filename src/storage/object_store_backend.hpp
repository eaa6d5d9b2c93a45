#pragma once

#include "common/service_config.hpp"
#include "network/http_client.hpp"
#include "storage/backend.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/beast/http/verb.hpp>

#include <spdlog/spdlog.h>

#include <memory>
#include <string>
#include <vector>

namespace notes {

// ── ObjectStoreBackend ───────────────────────────────────────────────────────
//
// Object-store backend over the Google Cloud Storage JSON API.  One object per
// note, named <prefix><id>, holding {"title": ..., "content": ...}.
//
// get()  → GET  /storage/v1/b/<bucket>/o/<name>?alt=media      404 → NotFoundError
// set()  → POST /upload/storage/v1/b/<bucket>/o?uploadType=media&name=<name>
// keys() → GET  /storage/v1/b/<bucket>/o?prefix=<prefix>[&pageToken=...]
//
// keys() follows nextPageToken until the listing is exhausted.
// Everything else that is not a 2xx (including transport failures and
// undecodable bodies) is thrown as BackendUnavailableError.
//
// The constructor throws BackendUnavailableError when the bucket is empty or
// the endpoint is not an http(s) URL.

class ObjectStoreBackend final : public Backend {
public:
    ObjectStoreBackend(boost::asio::io_context& ioc,
                       ObjectStoreConfig config,
                       std::shared_ptr<spdlog::logger> logger);

    [[nodiscard]] boost::asio::awaitable<Note> get(std::string id) override;
    boost::asio::awaitable<void> set(std::string id, CreateNoteRequest request) override;
    [[nodiscard]] boost::asio::awaitable<std::vector<std::string>> keys() override;

    [[nodiscard]] std::string_view name() const noexcept override { return "object-store"; }

private:
    // Sends one request; throws BackendUnavailableError on transport failure.
    [[nodiscard]] boost::asio::awaitable<network::HttpResponse>
    call(boost::beast::http::verb method, std::string target,
         std::string body = {}, network::HttpHeaders headers = {});

    ObjectStoreConfig               config_;
    network::HttpClient             client_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace notes
