#ifndef PREFORK_WORKER_HPP
#define PREFORK_WORKER_HPP

#include <memory>
#include <optional>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include "config.hpp"
#include "connection.hpp"
#include "handler.hpp"
#include "listener.hpp"
#include "logger.hpp"

// Code run inside a forked worker: one accept loop over the shared listener,
// one connection at a time.
class WorkerRuntime {
public:
    WorkerRuntime(ListeningSocket &listener, RequestHandler &handler, const Config &cfg);

    WorkerRuntime(const WorkerRuntime &) = delete;

    WorkerRuntime(WorkerRuntime &&) = delete;

    WorkerRuntime &operator=(const WorkerRuntime &) = delete;

    WorkerRuntime &operator=(WorkerRuntime &&) = delete;

    // Blocks until SIGINT/SIGTERM arrives and the in-flight connection (if any) is done
    int run();

    [[nodiscard]] std::size_t served() const {
        return served_;
    }

private:
    void do_accept();

    void on_accept(const boost::system::error_code &errc, boost::asio::ip::tcp::socket socket);

    void on_connection_done();

    void wait_signal();

    void on_signal(const boost::system::error_code &errc, int sig_n);

    void shutdown();

    boost::asio::io_context &ctx_;
    ListeningSocket &listener_;
    RequestHandler &handler_;
    const Config &cfg_;

    boost::asio::signal_set signals_;
    std::optional<Logger> access_log_;
    std::shared_ptr<Connection> current_;

    bool stopping_{false};
    std::size_t served_{0};
};

/**
 * Worker entry point, never returns.
 * Adopts the inherited listening socket on a fresh io_context, serves until told
 * to stop and exits the process with the worker's status.
 */
[[noreturn]] void serve(ListeningSocket &inherited, const Config &cfg, RequestHandler &handler);

#endif //PREFORK_WORKER_HPP
