#include "config.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <fstream>
#include <getopt.h>
#include <iostream>
#include <limits>

#include <fmt/format.h>

LogFormat::Variable LogFormat::string_to_variable(const std::string_view str) {
    if (str == "client_addr") {
        return Variable::CLIENT_ADDR;
    } else if (str == "bytes_sent") {
        return Variable::BYTES_SENT;
    } else if (str == "processing_time") {
        return Variable::PROCESSING_TIME;
    } else if (str == "request_uri") {
        return Variable::REQUEST_URI;
    } else if (str == "status") {
        return Variable::STATUS;
    } else if (str == "http_user_agent") {
        return Variable::HTTP_USER_AGENT;
    } else if (str == "request_method") {
        return Variable::REQUEST_METHOD;
    } else if (str == "worker_pid") {
        return Variable::WORKER_PID;
    } else {
        throw ConfigError("Invalid variable string: " + std::string(str));
    }
}

std::string LogFormat::variable_to_string(const Variable var) {
    switch (var) {
        case Variable::CLIENT_ADDR:
            return "client_addr";
        case Variable::BYTES_SENT:
            return "bytes_sent";
        case Variable::PROCESSING_TIME:
            return "processing_time";
        case Variable::REQUEST_URI:
            return "request_uri";
        case Variable::STATUS:
            return "status";
        case Variable::HTTP_USER_AGENT:
            return "http_user_agent";
        case Variable::REQUEST_METHOD:
            return "request_method";
        case Variable::WORKER_PID:
            return "worker_pid";
    }
    throw ConfigError("Not implemented");
}

std::unordered_set<LogFormat::Variable> parse_variables(std::string_view format) {
    std::unordered_set<LogFormat::Variable> result;
    std::size_t var_start_pos = format.find('$');
    while (var_start_pos != std::string_view::npos) {
        var_start_pos += 1; // After $

        const auto non_alpha_pos = std::find_if(format.begin() + static_cast<std::ptrdiff_t>(var_start_pos),
                                                format.end(), [](const char el) {
                                                    return !std::isalpha(static_cast<unsigned char>(el)) && el != '_';
                                                });
        const auto var_end_pos = static_cast<std::size_t>(std::distance(format.begin(), non_alpha_pos));

        const std::string_view var_name = format.substr(var_start_pos, var_end_pos - var_start_pos);
        result.insert(LogFormat::string_to_variable(var_name));

        var_start_pos = format.find('$', var_end_pos);
    }
    return result;
}

Config::Config() {
    format_log.format = DEFAULT_FORMAT_LOG;
    format_log.used_vars = parse_variables(format_log.format);
}

namespace {
    std::size_t get_unsigned(const Json::Value &json, const char *key, const std::size_t fallback) {
        if (!json.isMember(key)) {
            return fallback;
        }
        const auto &value = json[key];
        if (!value.isUInt64()) {
            throw ConfigError(fmt::format("'{}' must be a non-negative integer", key));
        }
        return static_cast<std::size_t>(value.asUInt64());
    }

    bool get_bool(const Json::Value &json, const char *key, const bool fallback) {
        if (!json.isMember(key)) {
            return fallback;
        }
        if (!json[key].isBool()) {
            throw ConfigError(fmt::format("'{}' must be a boolean", key));
        }
        return json[key].asBool();
    }

    std::string get_string(const Json::Value &json, const char *key, const std::string &fallback) {
        if (!json.isMember(key)) {
            return fallback;
        }
        if (!json[key].isString()) {
            throw ConfigError(fmt::format("'{}' must be a string", key));
        }
        return json[key].asString();
    }

    unsigned short to_port(const std::size_t value) {
        if (value > std::numeric_limits<unsigned short>::max()) {
            throw ConfigError(fmt::format("Port {} is out of range", value));
        }
        return static_cast<unsigned short>(value);
    }

    std::size_t to_number(const std::string_view option, const std::string_view text) {
        std::size_t value{};
        const auto *end = text.data() + text.size();
        const auto [ptr, errc] = std::from_chars(text.data(), end, value);
        if (errc != std::errc{} || ptr != end) {
            throw ConfigError(fmt::format("Option --{} expects a number, got '{}'", option, text));
        }
        return value;
    }

    void validate(const Config &cfg) {
        if (cfg.worker_count < 1) {
            throw ConfigError("worker_count must be at least 1");
        }
        if (cfg.backlog < 1) {
            throw ConfigError("backlog must be at least 1");
        }
        if (cfg.address.empty()) {
            throw ConfigError("address is empty");
        }
        if (cfg.tick_ms == 0) {
            throw ConfigError("tick_ms must be positive");
        }
        if (cfg.max_request_bytes == 0 || cfg.max_request_bytes > std::numeric_limits<std::uint32_t>::max()) {
            throw ConfigError("max_request_bytes is out of range");
        }
    }
}

void apply_json(Config &cfg, const Json::Value &json) {
    if (!json.isObject()) {
        throw ConfigError("Root JSON is not an object");
    }

    cfg.worker_count = get_unsigned(json, "worker_count", cfg.worker_count);
    cfg.address = get_string(json, "address", cfg.address);
    cfg.port = to_port(get_unsigned(json, "port", cfg.port));
    const auto backlog = get_unsigned(json, "backlog", static_cast<std::size_t>(cfg.backlog));
    if (backlog > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
        throw ConfigError("backlog is out of range");
    }
    cfg.backlog = static_cast<int>(backlog);
    cfg.debug = get_bool(json, "debug", cfg.debug);

    cfg.timeout_ms = get_unsigned(json, "timeout_ms", cfg.timeout_ms);
    cfg.max_request_bytes = get_unsigned(json, "max_request_bytes", cfg.max_request_bytes);
    cfg.tick_ms = get_unsigned(json, "tick_ms", cfg.tick_ms);
    cfg.graceful_timeout_ms = get_unsigned(json, "graceful_timeout_ms", cfg.graceful_timeout_ms);

    // Logs stuff
    cfg.file_log = get_string(json, "file_log", cfg.file_log);
    cfg.format_log.format = get_string(json, "format_log", cfg.format_log.format);
    cfg.format_log.used_vars = parse_variables(cfg.format_log.format);

    validate(cfg);
}

Config parse_config_json(const Json::Value &json) {
    Config result;
    apply_json(result, json);
    return result;
}

Config parse_config(const std::filesystem::path &path) {
    std::ifstream file{path};
    if (!file.is_open()) {
        throw ConfigError(fmt::format("Config file {} is not opened", path.string()));
    }

    Json::Value json;
    Json::CharReaderBuilder const builder;
    JSONCPP_STRING errs;
    if (!Json::parseFromStream(builder, file, &json, &errs)) {
        throw ConfigError(fmt::format("Was unable to parse JSON config: {}", errs));
    }
    return parse_config_json(json);
}

std::string usage(const std::string_view program) {
    return fmt::format("Usage: {} [options]\n"
                       "Run a pre-fork worker HTTP server\n\n"
                       "  -w, --worker_count N   number of worker processes (default {})\n"
                       "  -p, --port N           port to listen for requests on (default {})\n"
                       "  -d, --debug            enable debug level logs\n"
                       "  -c, --config PATH      JSON config file, flags override it\n"
                       "  -h, --help             print this message\n",
                       program, DEFAULT_WORKER_COUNT, DEFAULT_PORT);
}

std::optional<Config> parse_args(int argc, char **argv) {
    static const option long_options[] = {
        {"worker_count", required_argument, nullptr, 'w'},
        {"port", required_argument, nullptr, 'p'},
        {"debug", no_argument, nullptr, 'd'},
        {"config", required_argument, nullptr, 'c'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    std::optional<std::size_t> worker_count;
    std::optional<unsigned short> port;
    std::optional<std::string> config_path;
    bool debug = false;

    optind = 0; // Full rescan, parse_args may be called more than once
    opterr = 0;
    int opt{};
    while ((opt = getopt_long(argc, argv, ":w:p:dc:h", long_options, nullptr)) != -1) {
        switch (opt) {
            case 'w':
                worker_count = to_number("worker_count", optarg);
                break;
            case 'p':
                port = to_port(to_number("port", optarg));
                break;
            case 'd':
                debug = true;
                break;
            case 'c':
                config_path = optarg;
                break;
            case 'h':
                std::cout << usage(argv[0]);
                return std::nullopt;
            case ':':
                throw ConfigError(fmt::format("Option {} requires a value", argv[optind - 1]));
            default:
                if (optopt != 0) {
                    throw ConfigError(fmt::format("Unknown option -{}", static_cast<char>(optopt)));
                }
                throw ConfigError(fmt::format("Unknown option {}", argv[optind - 1]));
        }
    }
    if (optind < argc) {
        throw ConfigError(fmt::format("Unexpected argument {}", argv[optind]));
    }

    Config cfg = config_path.has_value() ? parse_config(*config_path) : Config{};
    if (worker_count.has_value()) {
        cfg.worker_count = *worker_count;
    }
    if (port.has_value()) {
        cfg.port = *port;
    }
    cfg.debug = cfg.debug || debug;

    validate(cfg);
    return cfg;
}
