#include "logger.hpp"

#include <cerrno>
#include <cstring>
#include <ctime>
#include <fcntl.h>
#include <unistd.h>

#include <fmt/chrono.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

Logger::Logger(const std::filesystem::path &path) {
    m_file = open(path.c_str(), O_APPEND | O_CREAT | O_WRONLY | O_CLOEXEC, 0644);
    if (m_file < 0) {
        throw std::runtime_error(fmt::format("Was not able to open a log file {}: {}", path.string(),
                                             std::strerror(errno)));
    }
}

Logger::~Logger() {
    close(m_file);
}

void replace_variable(std::string &log_msg, LogFormat::Variable var, const std::string &replace_to) {
    const std::string var_name = '$' + LogFormat::variable_to_string(var);
    auto var_pos = log_msg.find(var_name);
    while (var_pos != std::string::npos) {
        log_msg.replace(var_pos, var_name.size(), replace_to);
        var_pos = log_msg.find(var_name, var_pos + replace_to.size());
    }
}

void Logger::write(std::string_view msg) {
    const std::string final_msg = fmt::format("[{:%Y-%m-%d %H:%M:%S}]: {}\n", fmt::localtime(std::time(nullptr)), msg);

    // One write per line, the kernel keeps O_APPEND writes whole
    const auto res = ::write(m_file, final_msg.c_str(), final_msg.size());
    if (res < 0) {
        spdlog::warn("Access log write failed: {}", std::strerror(errno));
    }
}

void setup_logging(const bool debug) {
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [pid %P] [%^%l%$] %v");
    spdlog::set_level(debug ? spdlog::level::debug : spdlog::level::info);
    spdlog::flush_on(spdlog::level::info);
}
