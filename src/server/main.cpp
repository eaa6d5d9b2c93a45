#include "common/logger.hpp"
#include "common/service_config.hpp"
#include "network/http_server.hpp"
#include "network/router.hpp"
#include "storage/backend_selector.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/system/system_error.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdio>
#include <stdexcept>
#include <string>

namespace asio = boost::asio;

int main(int argc, char* argv[]) {
    // ── Parse CLI arguments ──────────────────────────────────────────────────
    notes::ServiceConfig cfg;
    try {
        cfg = notes::parse_config(argc, argv);
    } catch (const std::runtime_error& e) {
        fprintf(stderr, "%s\n", e.what());
        return 1;
    }

    // ── Logging ──────────────────────────────────────────────────────────────
    const auto level = notes::parse_log_level(cfg.log_level);
    notes::init_default_logger(level);
    auto logger = spdlog::default_logger();

    logger->info("notes-server starting – http={}:{} threads={} backend='{}'",
                 cfg.host, cfg.port, cfg.threads, cfg.backend);

    // ── Shared io_context ────────────────────────────────────────────────────
    // The HTTP server and the network backends share one io_context.
    asio::io_context ioc{static_cast<int>(std::max(1u, cfg.threads))};

    // ── Backend selection ────────────────────────────────────────────────────
    // Resolved on the first request, not here.
    notes::BackendSelector selector{
        [&cfg] { return cfg.backend; },
        notes::make_backend_factory(cfg, ioc),
        logger};

    // ── HTTP ─────────────────────────────────────────────────────────────────
    auto http_logger = notes::make_component_logger("http", level);
    notes::network::Router router{selector, http_logger};

    try {
        notes::network::HttpServer server{ioc, cfg.host, cfg.port, router, http_logger};
        server.run(cfg.threads);
    } catch (const boost::system::system_error& e) {
        logger->error("Failed to start HTTP server on {}:{}: {}", cfg.host, cfg.port, e.what());
        return 1;
    }

    logger->info("notes-server stopped");
    return 0;
}
