#include "worker.hpp"

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <pthread.h>
#include <unistd.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

WorkerRuntime::WorkerRuntime(ListeningSocket &listener, RequestHandler &handler, const Config &cfg)
    : ctx_(static_cast<boost::asio::io_context &>(listener.get_executor().context())), listener_(listener),
      handler_(handler), cfg_(cfg), signals_(ctx_, SIGINT, SIGTERM) {
    if (!cfg_.file_log.empty()) { access_log_.emplace(cfg_.file_log); }
}

int WorkerRuntime::run() {
    spdlog::info("Worker started");

    wait_signal();
    // The master forks with SIGINT/SIGTERM blocked, anything pending lands in signals_ now
    sigset_t stop_signals;
    sigemptyset(&stop_signals);
    sigaddset(&stop_signals, SIGINT);
    sigaddset(&stop_signals, SIGTERM);
    pthread_sigmask(SIG_UNBLOCK, &stop_signals, nullptr);

    do_accept();
    ctx_.run(); // Worker stays at this point while processing requests

    spdlog::info("Worker exiting, served {} connection(s)", served_);
    return EXIT_SUCCESS;
}

void WorkerRuntime::do_accept() {
    listener_.async_accept([this](const boost::system::error_code &errc, boost::asio::ip::tcp::socket socket) {
        on_accept(errc, std::move(socket));
    });
}

void WorkerRuntime::on_accept(const boost::system::error_code &errc, boost::asio::ip::tcp::socket socket) {
    if (errc) {
        if (stopping_) {
            return;
        }
        spdlog::warn("Accept failed: {}", errc.message());
        do_accept();
        return;
    }

    // Accepted before the stop signal got here, it still gets served
    current_ = std::make_shared<Connection>(std::move(socket), handler_, cfg_,
                                            access_log_.has_value() ? &access_log_.value() : nullptr,
                                            [this]() {
                                                on_connection_done();
                                            });
    current_->run();
}

void WorkerRuntime::on_connection_done() {
    ++served_;
    current_.reset();

    if (stopping_) {
        shutdown();
    } else {
        do_accept();
    }
}

void WorkerRuntime::wait_signal() {
    signals_.async_wait([this](const boost::system::error_code &errc, const int sig_n) {
        on_signal(errc, sig_n);
    });
}

void WorkerRuntime::on_signal(const boost::system::error_code &errc, const int sig_n) {
    if (errc) {
        return;
    }
    if (stopping_) {
        spdlog::debug("Already stopping, ignoring signal {}", sig_n);
        wait_signal();
        return;
    }

    stopping_ = true;
    spdlog::debug("Got signal {}, stopping", sig_n);

    boost::system::error_code ignored;
    listener_.cancel(ignored); // No new connections for this worker
    if (current_) {
        wait_signal(); // The in-flight connection finishes first
    } else {
        shutdown();
    }
}

void WorkerRuntime::shutdown() {
    boost::system::error_code ignored;
    signals_.cancel(ignored);
    listener_.close(ignored);
    ctx_.stop();
}

void serve(ListeningSocket &inherited, const Config &cfg, RequestHandler &handler) {
    int status = EXIT_FAILURE;
    try {
        boost::asio::io_context ctx;

        // Same kernel socket, owned by this process' io_context from now on
        const auto protocol = inherited.local_endpoint().protocol();
        const int fd = ::dup(inherited.native_handle());
        if (fd < 0) {
            throw std::runtime_error(fmt::format("dup of the listening socket failed: {}",
                                                 std::strerror(errno))); // NOLINT(concurrency-mt-unsafe)
        }
        boost::system::error_code ignored;
        inherited.close(ignored);

        ListeningSocket listener{ctx, protocol, fd};
        WorkerRuntime worker{listener, handler, cfg};
        status = worker.run();
    } catch (const std::exception &ex) {
        spdlog::critical("Worker failed: {}", ex.what());
    }

    spdlog::default_logger()->flush();
    _exit(status);
}
