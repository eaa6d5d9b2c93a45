#pragma once

#include <cstdint>
#include <functional>
#include <string>

#include <boost/program_options.hpp>

namespace notes {

// ── RedisConfig ───────────────────────────────────────────────────────────────
// Connection parameters for the remote-cache backend.

struct RedisConfig {
    std::string host       = "127.0.0.1";
    uint16_t    port       = 6379;
    std::string password;              // empty = no AUTH
    uint32_t    db         = 0;        // SELECT index, 0 = skip
    std::string key_prefix;            // prepended to every note id
    uint32_t    ttl_seconds = 0;       // 0 = keys never expire
    uint32_t    timeout_ms = 2000;     // connect + per-command I/O timeout
};

// ── ObjectStoreConfig ─────────────────────────────────────────────────────────
// Parameters for the object-store backend (GCS JSON API).

struct ObjectStoreConfig {
    std::string endpoint   = "https://storage.googleapis.com";
    std::string bucket;
    std::string prefix;                // prepended to every object name
    std::string token;                 // OAuth2 bearer token, empty = anonymous
    uint32_t    timeout_ms = 10000;    // per-request timeout
};

// ── ServiceConfig ─────────────────────────────────────────────────────────────
// Full configuration for one notes-server process.
// Populated by parse_config() from CLI arguments and environment variables.

struct ServiceConfig {
    std::string host;                  // Bind address for HTTP connections
    uint16_t    port;                  // HTTP port
    uint32_t    threads;               // io_context worker threads
    std::string log_level;             // spdlog level string
    std::string backend;               // Raw selection value, resolved lazily

    RedisConfig       redis;
    ObjectStoreConfig object_store;
};

// getenv-compatible lookup: returns the variable's value or nullptr.
using EnvLookup = std::function<const char*(const char*)>;

// ── parse_config ──────────────────────────────────────────────────────────────
// Parse CLI arguments, then environment variables for anything the command
// line left unset, into a ServiceConfig.
//
// On success: returns a validated ServiceConfig.
// On error  : throws std::runtime_error with a human-readable message
//             (the --help text is thrown the same way).
//
// Validates:
//   - numeric options are unsigned decimal integers (no sign)
//   - port and redis-port in [1, 65535]
//   - threads in [1, 1024], timeouts in [1, 3600000] ms
//   - gcs-endpoint starts with http:// or https://
//
// The backend value is deliberately not validated: unknown values select the
// memory backend.

[[nodiscard]] ServiceConfig parse_config(int argc, char* argv[]);

// The process environment is read with po::parse_environment(), mapped by
// env_to_option().  This overload reads it through `lookup_env` instead
// (used by tests).
[[nodiscard]] ServiceConfig parse_config(int argc, char* argv[],
                                         const EnvLookup& lookup_env);

// ── add_options ───────────────────────────────────────────────────────────────
// Populate a boost::program_options::options_description with notes-server
// options.  Exposed for testing and help-text generation.

void add_options(boost::program_options::options_description& desc);

// Returns the option fed by environment variable `env_name`, or "" if the
// variable is not one of ours.
[[nodiscard]] std::string env_to_option(const std::string& env_name);

} // namespace notes
