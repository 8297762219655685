#include "signal_router.hpp"

#include <csignal>
#include <cstring>
#include <spdlog/spdlog.h>

SignalAction classify_signal(const int sig_n) {
    switch (sig_n) {
        case SIGINT:
        case SIGTERM:
            return SignalAction::GRACEFUL_STOP;
        case SIGQUIT:
            return SignalAction::IMMEDIATE_STOP;
        case SIGCHLD:
            return SignalAction::CHILD_EXITED;
        default:
            return SignalAction::LOG_ONLY;
    }
}

std::string_view action_to_string(const SignalAction action) {
    switch (action) {
        case SignalAction::GRACEFUL_STOP:
            return "graceful stop";
        case SignalAction::IMMEDIATE_STOP:
            return "immediate stop";
        case SignalAction::CHILD_EXITED:
            return "child exited";
        case SignalAction::LOG_ONLY:
            return "log only";
    }
    return "unknown";
}

SignalRouter::SignalRouter(boost::asio::io_context &ctx, SignalTarget &target)
    : signals_(ctx), target_(target) {
}

void SignalRouter::start() {
    if (running_) {
        return;
    }
    signals_.add(SIGINT);
    signals_.add(SIGTERM);
    signals_.add(SIGQUIT);
    signals_.add(SIGCHLD);
    signals_.add(SIGHUP);
    running_ = true;
    wait();
}

void SignalRouter::stop() {
    running_ = false;
    boost::system::error_code ignored;
    signals_.cancel(ignored);
    signals_.clear(ignored);
}

void SignalRouter::detach() {
    stop();
}

void SignalRouter::wait() {
    signals_.async_wait([this](const boost::system::error_code &errc, const int sig_n) {
        if (errc || !running_) {
            return; // Cancelled
        }
        dispatch(sig_n);
        if (running_) {
            wait();
        }
    });
}

void SignalRouter::dispatch(const int sig_n) {
    const auto action = classify_signal(sig_n);
    spdlog::debug("Signal {} ({}) routed to {}", sig_n, strsignal(sig_n), action_to_string(action));

    switch (action) {
        case SignalAction::GRACEFUL_STOP: {
            if (graceful_seen_) {
                spdlog::info("Graceful shutdown already in progress, ignoring {}", strsignal(sig_n));
                return;
            }
            graceful_seen_ = true;
            target_.on_graceful_stop(sig_n);
            break;
        }
        case SignalAction::IMMEDIATE_STOP: {
            target_.on_immediate_stop(sig_n);
            break;
        }
        case SignalAction::CHILD_EXITED: {
            target_.on_child_exited();
            break;
        }
        case SignalAction::LOG_ONLY: {
            spdlog::info("Got {}, nothing to do", strsignal(sig_n));
            break;
        }
    }
}
