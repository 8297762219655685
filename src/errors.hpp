#ifndef PREFORK_ERRORS_HPP
#define PREFORK_ERRORS_HPP

#include <stdexcept>
#include <string>

// Invalid configuration, fatal before anything is bound
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Listening socket could not be set up, fatal before any worker is spawned
class BindError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// fork() failed, the supervisor retries on its next tick
class ForkError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Request handler failed, stays inside the connection that raised it
class HandlerError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

#endif //PREFORK_ERRORS_HPP
