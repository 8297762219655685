#pragma once
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <json/json.h>

#include "errors.hpp"

struct LogFormat {
    enum class Variable {
        CLIENT_ADDR,
        BYTES_SENT,
        PROCESSING_TIME,
        REQUEST_URI,
        REQUEST_METHOD,
        STATUS,
        HTTP_USER_AGENT,
        WORKER_PID,
    };

    static Variable string_to_variable(std::string_view str);

    static std::string variable_to_string(Variable var);

    std::string format;
    std::unordered_set<Variable> used_vars;
};

std::unordered_set<LogFormat::Variable> parse_variables(std::string_view format);

static constexpr std::size_t DEFAULT_WORKER_COUNT = 4;
static constexpr unsigned short DEFAULT_PORT = 8080;
static constexpr int DEFAULT_BACKLOG = 512;
static constexpr std::size_t DEFAULT_TIMEOUT = 5000;
static constexpr std::size_t DEFAULT_MAX_REQUEST_BYTES = 8192;
static constexpr std::size_t DEFAULT_TICK = 200;
static constexpr std::string_view DEFAULT_ADDRESS = "localhost";
static constexpr std::string_view DEFAULT_FORMAT_LOG =
        R"($client_addr "$request_method $request_uri" $status $bytes_sent $processing_time)";

struct Config {
    Config();

    std::size_t worker_count{DEFAULT_WORKER_COUNT};
    std::string address{DEFAULT_ADDRESS};
    unsigned short port{DEFAULT_PORT};
    int backlog{DEFAULT_BACKLOG};
    bool debug{};

    // Per connection: reading the request plus writing the response
    std::size_t timeout_ms{DEFAULT_TIMEOUT};
    // Applies to the header block and to the body separately
    std::size_t max_request_bytes{DEFAULT_MAX_REQUEST_BYTES};

    std::size_t tick_ms{DEFAULT_TICK};
    // 0 means draining waits as long as the workers need
    std::size_t graceful_timeout_ms{};

    std::string file_log;
    LogFormat format_log;
};

void apply_json(Config &cfg, const Json::Value &json);

Config parse_config_json(const Json::Value &json);

Config parse_config(const std::filesystem::path &path);

// Returns std::nullopt when --help was requested
std::optional<Config> parse_args(int argc, char **argv);

std::string usage(std::string_view program);
