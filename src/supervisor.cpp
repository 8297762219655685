#include "supervisor.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <pthread.h>
#include <unistd.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace {
    std::string describe_exit(const siginfo_t &child_info) {
        if (child_info.si_code == CLD_EXITED) {
            return fmt::format("exited with status {}", child_info.si_status);
        }
        return fmt::format("was killed by signal {} ({})", child_info.si_status,
                           strsignal(child_info.si_status)); // NOLINT(concurrency-mt-unsafe)
    }
}

std::string_view state_to_string(const WorkerState state) {
    switch (state) {
        case WorkerState::STARTING:
            return "starting";
        case WorkerState::RUNNING:
            return "running";
        case WorkerState::EXITING:
            return "exiting";
        case WorkerState::REAPED:
            return "reaped";
    }
    return "unknown";
}

std::string_view phase_to_string(const Phase phase) {
    switch (phase) {
        case Phase::INIT:
            return "init";
        case Phase::SPAWNING:
            return "spawning";
        case Phase::MONITORING:
            return "monitoring";
        case Phase::DRAINING:
            return "draining";
        case Phase::TERMINATED:
            return "terminated";
    }
    return "unknown";
}

Supervisor::Supervisor(boost::asio::io_context &ctx, const Config &cfg, WorkerEntry entry)
    : ctx_(ctx), cfg_(cfg), entry_(std::move(entry)),
      listener_(bind_listener(ctx, cfg.address, cfg.port, cfg.backlog)), router_(ctx, *this),
      tick_timer_(ctx), drain_timer_(ctx) {
    workers_.reserve(cfg_.worker_count);
}

void Supervisor::start() {
    if (phase_ != Phase::INIT) {
        return;
    }

    // Signals first, so an early worker death is not missed
    router_.start();

    phase_ = Phase::SPAWNING;
    spawn_missing();

    phase_ = Phase::MONITORING;
    spdlog::info("Master is monitoring {} of {} worker(s)", running_count(), cfg_.worker_count);
    schedule_tick();
}

int Supervisor::run() {
    start();
    ctx_.run(); // Master stays here until it is terminated
    return exit_status_;
}

std::size_t Supervisor::running_count() const {
    return static_cast<std::size_t>(std::ranges::count_if(workers_, [](const WorkerRecord &worker) {
        return worker.state == WorkerState::STARTING || worker.state == WorkerState::RUNNING;
    }));
}

pid_t Supervisor::spawn_worker() {
    spdlog::default_logger()->flush();

    // Stop signals stay pending in the child until the worker has its own handlers
    sigset_t stop_signals;
    sigset_t old_mask;
    sigemptyset(&stop_signals);
    sigaddset(&stop_signals, SIGINT);
    sigaddset(&stop_signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &stop_signals, &old_mask);

    ctx_.notify_fork(boost::asio::execution_context::fork_prepare);
    pid_t const result = fork_fn_();
    const int err = errno;
    if (result != 0) {
        pthread_sigmask(SIG_SETMASK, &old_mask, nullptr);
    }
    if (result == -1) {
        ctx_.notify_fork(boost::asio::execution_context::fork_parent);
        throw ForkError(fmt::format("Failed to start a worker: {}", std::strerror(err))); // NOLINT(concurrency-mt-unsafe)
    }

    if (result == 0) {
        // Child
        ctx_.notify_fork(boost::asio::execution_context::fork_child);
        router_.detach();
        tick_timer_.cancel();
        drain_timer_.cancel();

        try {
            entry_(listener_);
        } catch (const std::exception &ex) {
            spdlog::critical("Worker entry failed: {}", ex.what());
        }
        spdlog::default_logger()->flush();
        _exit(EXIT_FAILURE); // The entry point never returns on success
    }

    // Parent
    ctx_.notify_fork(boost::asio::execution_context::fork_parent);

    auto &record = workers_.emplace_back(WorkerRecord{result, std::chrono::steady_clock::now(), WorkerState::STARTING});
    notify(record);
    record.state = WorkerState::RUNNING;
    notify(record);
    return result;
}

void Supervisor::spawn_missing() {
    while (!shutdown_requested_ && running_count() < cfg_.worker_count) {
        try {
            const pid_t worker_pid = spawn_worker();
            spdlog::info("Spawned a worker, PID: {}", worker_pid);
        } catch (const ForkError &ex) {
            spdlog::error("{}, retrying in {}ms", ex.what(), cfg_.tick_ms);
            return;
        }
    }
}

void Supervisor::reap() {
    siginfo_t child_info{};
    while (true) {
        child_info.si_pid = 0; // clear this, so there won't be an inf. loop
        const int res = waitid(P_ALL, 0, &child_info, WEXITED | WNOHANG);
        if (res < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno != ECHILD) {
                spdlog::error("waitid failed: {}", std::strerror(errno)); // NOLINT(concurrency-mt-unsafe)
            }
            return;
        }
        if (child_info.si_pid == 0) {
            return; // Nothing else has exited
        }
        handle_exit(child_info);
    }
}

void Supervisor::handle_exit(const siginfo_t &child_info) {
    const pid_t pid = child_info.si_pid;
    const auto worker_iter = std::ranges::find_if(workers_, [pid](const WorkerRecord &worker) {
        return worker.pid == pid;
    });
    if (worker_iter == workers_.end()) {
        spdlog::debug("Reaped unknown child {}, it {}", pid, describe_exit(child_info));
        return;
    }

    if (shutdown_requested_) {
        spdlog::info("Worker {} {}", pid, describe_exit(child_info));
    } else {
        spdlog::warn("Worker {} {} unexpectedly", pid, describe_exit(child_info));
    }

    worker_iter->state = WorkerState::REAPED;
    notify(*worker_iter);
    workers_.erase(worker_iter);

    if (!shutdown_requested_) {
        // One-for-one replacement
        try {
            const pid_t worker_pid = spawn_worker();
            spdlog::info("Respawned a worker, PID: {}", worker_pid);
        } catch (const ForkError &ex) {
            spdlog::error("{}, retrying in {}ms", ex.what(), cfg_.tick_ms);
        }
    } else if (phase_ == Phase::DRAINING && workers_.empty()) {
        terminate(EXIT_SUCCESS);
    }
}

void Supervisor::on_graceful_stop(const int sig_n) {
    if (shutdown_requested_ || phase_ == Phase::TERMINATED) {
        spdlog::debug("Shutdown already requested, ignoring {}", strsignal(sig_n)); // NOLINT(concurrency-mt-unsafe)
        return;
    }
    spdlog::info("Got {}, shutting down gracefully", strsignal(sig_n)); // NOLINT(concurrency-mt-unsafe)
    begin_draining();
}

void Supervisor::on_immediate_stop(const int sig_n) {
    if (phase_ == Phase::TERMINATED) {
        return;
    }
    spdlog::warn("Got {}, killing workers immediately", strsignal(sig_n)); // NOLINT(concurrency-mt-unsafe)
    shutdown_requested_ = true;
    kill_all(SIGKILL);
    terminate(128 + sig_n); // By convention exit status is 128 + signal number
}

void Supervisor::on_child_exited() {
    reap();
}

void Supervisor::begin_draining() {
    shutdown_requested_ = true;
    phase_ = Phase::DRAINING;

    // Each worker gets the graceful stop exactly once
    for (auto &worker: workers_) {
        if (worker.state != WorkerState::STARTING && worker.state != WorkerState::RUNNING) {
            continue;
        }
        if (kill(worker.pid, SIGTERM) < 0 && errno != ESRCH) {
            spdlog::error("kill {} failed: {}", worker.pid, std::strerror(errno)); // NOLINT(concurrency-mt-unsafe)
        }
        worker.state = WorkerState::EXITING;
        notify(worker);
    }
    spdlog::info("Draining {} worker(s)", workers_.size());

    if (cfg_.graceful_timeout_ms > 0) {
        drain_timer_.expires_after(std::chrono::milliseconds(cfg_.graceful_timeout_ms));
        drain_timer_.async_wait([this](const boost::system::error_code &errc) {
            on_drain_timeout(errc);
        });
    }

    reap();
    if (phase_ == Phase::DRAINING && workers_.empty()) {
        terminate(EXIT_SUCCESS);
    }
}

void Supervisor::kill_all(const int sig_n) {
    for (auto &worker: workers_) {
        if (kill(worker.pid, sig_n) < 0 && errno != ESRCH) {
            spdlog::error("kill {} failed: {}", worker.pid, std::strerror(errno)); // NOLINT(concurrency-mt-unsafe)
        }
        worker.state = WorkerState::EXITING;
        notify(worker);
    }

    for (auto &worker: workers_) {
        siginfo_t siginfo{};
        int res{};

        // Need this loop to avoid other signals interrupting the 'waitid' call
        do { // NOLINT(cppcoreguidelines-avoid-do-while)
            res = waitid(P_PID, static_cast<id_t>(worker.pid), &siginfo, WEXITED);
        } while (res < 0 && errno == EINTR);

        if (res < 0) {
            spdlog::error("waitid {} failed: {}", worker.pid, std::strerror(errno)); // NOLINT(concurrency-mt-unsafe)
        } else {
            spdlog::info("Worker {} {}", worker.pid, describe_exit(siginfo));
        }
        worker.state = WorkerState::REAPED;
        notify(worker);
    }
    workers_.clear();
}

void Supervisor::terminate(const int status) {
    if (phase_ == Phase::TERMINATED) {
        return;
    }
    phase_ = Phase::TERMINATED;
    exit_status_ = status;

    router_.stop();
    tick_timer_.cancel();
    drain_timer_.cancel();

    boost::system::error_code ignored;
    listener_.close(ignored);

    spdlog::info("Master terminated with status {}", status);
    ctx_.stop();
}

void Supervisor::schedule_tick() {
    tick_timer_.expires_after(std::chrono::milliseconds(cfg_.tick_ms));
    tick_timer_.async_wait([this](const boost::system::error_code &errc) {
        on_tick(errc);
    });
}

void Supervisor::on_tick(const boost::system::error_code &errc) {
    if (errc || phase_ == Phase::TERMINATED) {
        return;
    }

    // SIGCHLD coalesces, the tick picks up whatever it missed
    reap();
    if (phase_ == Phase::MONITORING && !shutdown_requested_) {
        spawn_missing();
    }
    if (phase_ != Phase::TERMINATED) {
        schedule_tick();
    }
}

void Supervisor::on_drain_timeout(const boost::system::error_code &errc) {
    if (errc || phase_ != Phase::DRAINING) {
        return;
    }
    spdlog::warn("{} worker(s) still running after {}ms, killing them", workers_.size(), cfg_.graceful_timeout_ms);
    for (const auto &worker: workers_) {
        if (kill(worker.pid, SIGKILL) < 0 && errno != ESRCH) {
            spdlog::error("kill {} failed: {}", worker.pid, std::strerror(errno)); // NOLINT(concurrency-mt-unsafe)
        }
    }
}

void Supervisor::notify(const WorkerRecord &record) const {
    spdlog::debug("Worker {} is {}", record.pid, state_to_string(record.state));
    if (observer_) {
        observer_(record);
    }
}
