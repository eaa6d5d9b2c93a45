#include "common/service_config.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <cstdlib>
#include <spdlog/fmt/fmt.h>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include <boost/program_options.hpp>

namespace po = boost::program_options;

namespace notes {

namespace {

// ── Environment mapping ───────────────────────────────────────────────────────

constexpr std::array<std::pair<std::string_view, std::string_view>, 17> kEnvOptions{{
    {"NOTES_HOST",       "host"},
    {"NOTES_PORT",       "port"},
    {"NOTES_THREADS",    "threads"},
    {"NOTES_LOG_LEVEL",  "log-level"},
    {"BACKEND",          "backend"},
    {"REDIS_HOST",       "redis-host"},
    {"REDIS_PORT",       "redis-port"},
    {"REDIS_PASSWORD",   "redis-password"},
    {"REDIS_DB",         "redis-db"},
    {"REDIS_PREFIX",     "redis-prefix"},
    {"REDIS_TTL",        "redis-ttl"},
    {"REDIS_TIMEOUT_MS", "redis-timeout-ms"},
    {"GCS_ENDPOINT",     "gcs-endpoint"},
    {"GCS_BUCKET",       "gcs-bucket"},
    {"GCS_PREFIX",       "gcs-prefix"},
    {"GCS_TOKEN",        "gcs-token"},
    {"GCS_TIMEOUT_MS",   "gcs-timeout-ms"},
}};

constexpr uint32_t kMaxThreads   = 1024;
constexpr uint32_t kMaxTimeoutMs = 3'600'000;

// ── Helpers ───────────────────────────────────────────────────────────────────

// Numeric options are read as text and converted here: from_chars on an
// unsigned type rejects a sign and values that do not fit.
template <typename T>
[[nodiscard]] T parse_uint(std::string_view sv, std::string_view field_name) {
    T value{};
    auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);
    if (sv.empty() || ec != std::errc{} || ptr != sv.data() + sv.size()) {
        throw std::runtime_error(
            fmt::format("Invalid integer for {}: '{}'", field_name, sv));
    }
    return value;
}

template <typename T>
[[nodiscard]] T option_uint(const po::variables_map& vm, const char* option) {
    return parse_uint<T>(vm[option].as<std::string>(), fmt::format("--{}", option));
}

// Validate that a port number is in [1, 65535].
void validate_port(uint16_t port, std::string_view field_name) {
    if (port == 0) {
        throw std::runtime_error(
            fmt::format("Port for {} must be in [1, 65535], got 0", field_name));
    }
    // uint16_t max is 65535 by definition – no upper bound check needed.
}

void validate_range(uint32_t value, uint32_t max, std::string_view field_name) {
    if (value == 0 || value > max) {
        throw std::runtime_error(
            fmt::format("{} must be in [1, {}], got {}", field_name, max, value));
    }
}

// Validate the fully populated ServiceConfig.
void validate(const ServiceConfig& cfg) {
    validate_port(cfg.port,       "--port");
    validate_port(cfg.redis.port, "--redis-port");

    validate_range(cfg.threads,                 kMaxThreads,   "--threads");
    validate_range(cfg.redis.timeout_ms,        kMaxTimeoutMs, "--redis-timeout-ms");
    validate_range(cfg.object_store.timeout_ms, kMaxTimeoutMs, "--gcs-timeout-ms");

    const auto& ep = cfg.object_store.endpoint;
    if (!ep.starts_with("http://") && !ep.starts_with("https://")) {
        throw std::runtime_error(
            fmt::format("--gcs-endpoint must be an http:// or https:// URL, got '{}'", ep));
    }
}

// Options taken from an injected environment, mapped the same way
// po::parse_environment() maps the process environment.
[[nodiscard]] po::parsed_options parse_env(const po::options_description& desc,
                                           const EnvLookup& lookup_env) {
    po::parsed_options parsed(&desc);
    for (const auto& [env_name, option] : kEnvOptions) {
        const char* value = lookup_env(std::string(env_name).c_str());
        if (value == nullptr) {
            continue;
        }
        parsed.options.emplace_back(std::string(option),
                                    std::vector<std::string>{value});
    }
    return parsed;
}

// Command line first, then the environment.  po::store() keeps values the
// command line already set, so environment options only fill gaps.
template <typename EnvParser>
[[nodiscard]] ServiceConfig parse_with(int argc, char* argv[], EnvParser&& env_parser) {
    po::options_description desc("notes-server options");
    add_options(desc);

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);

        if (vm.count("help")) {
            std::ostringstream oss;
            oss << desc;
            throw std::runtime_error(oss.str());
        }

        po::store(env_parser(desc), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        throw std::runtime_error(fmt::format("Argument error: {}", e.what()));
    }

    ServiceConfig cfg;
    cfg.host      = vm["host"].as<std::string>();
    cfg.port      = option_uint<uint16_t>(vm, "port");
    cfg.threads   = option_uint<uint32_t>(vm, "threads");
    cfg.log_level = vm["log-level"].as<std::string>();
    cfg.backend   = vm["backend"].as<std::string>();

    cfg.redis.host        = vm["redis-host"].as<std::string>();
    cfg.redis.port        = option_uint<uint16_t>(vm, "redis-port");
    cfg.redis.password    = vm["redis-password"].as<std::string>();
    cfg.redis.db          = option_uint<uint32_t>(vm, "redis-db");
    cfg.redis.key_prefix  = vm["redis-prefix"].as<std::string>();
    cfg.redis.ttl_seconds = option_uint<uint32_t>(vm, "redis-ttl");
    cfg.redis.timeout_ms  = option_uint<uint32_t>(vm, "redis-timeout-ms");

    cfg.object_store.endpoint   = vm["gcs-endpoint"].as<std::string>();
    cfg.object_store.bucket     = vm["gcs-bucket"].as<std::string>();
    cfg.object_store.prefix     = vm["gcs-prefix"].as<std::string>();
    cfg.object_store.token      = vm["gcs-token"].as<std::string>();
    cfg.object_store.timeout_ms = option_uint<uint32_t>(vm, "gcs-timeout-ms");

    validate(cfg);
    return cfg;
}

} // anonymous namespace

// ── add_options ───────────────────────────────────────────────────────────────

void add_options(po::options_description& desc) {
    const uint32_t default_threads = std::max(1u, std::thread::hardware_concurrency());

    desc.add_options()
        ("help,h",
            "Show this help message and exit")
        ("host",
            po::value<std::string>()->default_value("0.0.0.0"),
            "Bind address for HTTP connections")
        ("port",
            po::value<std::string>()->default_value("8080"),
            "HTTP port")
        ("threads",
            po::value<std::string>()->default_value(std::to_string(default_threads)),
            "Number of io_context worker threads")
        ("log-level",
            po::value<std::string>()->default_value("info"),
            "Log level: trace|debug|info|warn|error|critical")
        ("backend",
            po::value<std::string>()->default_value("memory"),
            "Storage backend: memory (default), remote-cache|redis, object-store|gcs")
        ("redis-host",
            po::value<std::string>()->default_value("127.0.0.1"),
            "Remote cache host")
        ("redis-port",
            po::value<std::string>()->default_value("6379"),
            "Remote cache port")
        ("redis-password",
            po::value<std::string>()->default_value(""),
            "Remote cache password (AUTH), empty to skip")
        ("redis-db",
            po::value<std::string>()->default_value("0"),
            "Remote cache database index")
        ("redis-prefix",
            po::value<std::string>()->default_value(""),
            "Prefix prepended to every note key")
        ("redis-ttl",
            po::value<std::string>()->default_value("0"),
            "Expiry in seconds for stored notes, 0 = never")
        ("redis-timeout-ms",
            po::value<std::string>()->default_value("2000"),
            "Connect and per-command timeout for the remote cache")
        ("gcs-endpoint",
            po::value<std::string>()->default_value("https://storage.googleapis.com"),
            "Object store endpoint URL")
        ("gcs-bucket",
            po::value<std::string>()->default_value(""),
            "Object store bucket holding one object per note")
        ("gcs-prefix",
            po::value<std::string>()->default_value(""),
            "Prefix prepended to every object name")
        ("gcs-token",
            po::value<std::string>()->default_value(""),
            "OAuth2 bearer token for the object store, empty for anonymous")
        ("gcs-timeout-ms",
            po::value<std::string>()->default_value("10000"),
            "Per-request timeout for the object store");
}

std::string env_to_option(const std::string& env_name) {
    for (const auto& [env, option] : kEnvOptions) {
        if (env == env_name) {
            return std::string(option);
        }
    }
    return {};
}

// ── parse_config ──────────────────────────────────────────────────────────────

ServiceConfig parse_config(int argc, char* argv[]) {
    return parse_with(argc, argv, [](const po::options_description& desc) {
        return po::parse_environment(
            desc, [](const std::string& env_name) { return env_to_option(env_name); });
    });
}

ServiceConfig parse_config(int argc, char* argv[], const EnvLookup& lookup_env) {
    return parse_with(argc, argv, [&lookup_env](const po::options_description& desc) {
        return parse_env(desc, lookup_env);
    });
}

} // namespace notes
