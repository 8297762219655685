#ifndef PREFORK_SIGNAL_ROUTER_HPP
#define PREFORK_SIGNAL_ROUTER_HPP

#include <string_view>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

enum class SignalAction {
    GRACEFUL_STOP,  // SIGINT, SIGTERM
    IMMEDIATE_STOP, // SIGQUIT
    CHILD_EXITED,   // SIGCHLD
    LOG_ONLY,       // SIGHUP and anything else
};

SignalAction classify_signal(int sig_n);

std::string_view action_to_string(SignalAction action);

// Receives routed signals, always on the io_context thread
class SignalTarget {
public:
    SignalTarget() = default;

    virtual ~SignalTarget() = default;

    SignalTarget(const SignalTarget &) = delete;

    SignalTarget &operator=(const SignalTarget &) = delete;

    SignalTarget(SignalTarget &&) = delete;

    SignalTarget &operator=(SignalTarget &&) = delete;

    virtual void on_graceful_stop(int sig_n) = 0;

    virtual void on_immediate_stop(int sig_n) = 0;

    virtual void on_child_exited() = 0;
};

// Turns asynchronous process signals into handler calls inside the master's
// single io_context loop.
class SignalRouter {
public:
    SignalRouter(boost::asio::io_context &ctx, SignalTarget &target);

    SignalRouter(const SignalRouter &) = delete;

    SignalRouter &operator=(const SignalRouter &) = delete;

    SignalRouter(SignalRouter &&) = delete;

    SignalRouter &operator=(SignalRouter &&) = delete;

    void start();

    void stop();

    // Called in a freshly forked worker, which installs its own handlers
    void detach();

    void dispatch(int sig_n);

    [[nodiscard]] bool graceful_seen() const {
        return graceful_seen_;
    }

private:
    void wait();

    boost::asio::signal_set signals_;
    SignalTarget &target_;
    bool running_{false};
    bool graceful_seen_{false};
};

#endif //PREFORK_SIGNAL_ROUTER_HPP
