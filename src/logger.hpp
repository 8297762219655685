#ifndef PREFORK_LOGGER_HPP
#define PREFORK_LOGGER_HPP

#include <filesystem>
#include <string>
#include <string_view>

#include "config.hpp"

// Access log. Every worker opens its own descriptor with O_APPEND, so lines
// written by different processes land whole.
class Logger {
public:
    explicit Logger(const std::filesystem::path &path);

    ~Logger();

    Logger(const Logger &) = delete;

    Logger(Logger &&) = delete;

    Logger &operator=(const Logger &) = delete;

    Logger &operator=(Logger &&) = delete;

    void write(std::string_view msg);

private:
    int m_file{-1};
};

void replace_variable(std::string &log_msg, LogFormat::Variable var, const std::string &replace_to);

// Diagnostic log for master and workers
void setup_logging(bool debug);

#endif// PREFORK_LOGGER_HPP
