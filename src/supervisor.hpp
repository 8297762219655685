#ifndef PREFORK_SUPERVISOR_HPP
#define PREFORK_SUPERVISOR_HPP

#include <chrono>
#include <cstdlib>
#include <functional>
#include <string_view>
#include <vector>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "config.hpp"
#include "listener.hpp"
#include "signal_router.hpp"

enum class WorkerState {
    STARTING,
    RUNNING,
    EXITING,
    REAPED,
};

std::string_view state_to_string(WorkerState state);

struct WorkerRecord {
    pid_t pid{};
    std::chrono::steady_clock::time_point spawn_time;
    WorkerState state{WorkerState::STARTING};
};

enum class Phase {
    INIT,
    SPAWNING,
    MONITORING,
    DRAINING,
    TERMINATED,
};

std::string_view phase_to_string(Phase phase);

/**
 * Master process. Binds the listener, keeps worker_count workers alive with
 * one-for-one replacement and coordinates shutdown.
 *
 * All state is mutated on the io_context thread only: signals come in through
 * SignalRouter, exits are collected with waitid() on SIGCHLD and on every tick.
 */
class Supervisor : public SignalTarget {
public:
    // Runs in the forked child and must not return
    using WorkerEntry = std::function<void(ListeningSocket &)>;
    // Called on every record transition
    using WorkerObserver = std::function<void(const WorkerRecord &)>;
    // Process creation, ::fork unless replaced
    using ForkFn = std::function<pid_t()>;

    /**
     * @throws BindError if the listener can't be set up, no worker is spawned then
     */
    Supervisor(boost::asio::io_context &ctx, const Config &cfg, WorkerEntry entry);

    ~Supervisor() override = default;

    // Spawning -> Monitoring. Fork failures are logged and retried on the tick
    void start();

    // start() and block in the io_context until Terminated, returns the exit status
    int run();

    void on_graceful_stop(int sig_n) override;

    void on_immediate_stop(int sig_n) override;

    void on_child_exited() override;

    void set_observer(WorkerObserver observer) {
        observer_ = std::move(observer);
    }

    void set_fork(ForkFn fork_fn) {
        fork_fn_ = std::move(fork_fn);
    }

    [[nodiscard]] Phase phase() const {
        return phase_;
    }

    [[nodiscard]] bool shutdown_requested() const {
        return shutdown_requested_;
    }

    [[nodiscard]] const std::vector<WorkerRecord> &workers() const {
        return workers_;
    }

    [[nodiscard]] std::size_t running_count() const;

    [[nodiscard]] std::size_t target_worker_count() const {
        return cfg_.worker_count;
    }

    [[nodiscard]] int exit_status() const {
        return exit_status_;
    }

    [[nodiscard]] const ListeningSocket &listener() const {
        return listener_;
    }

    [[nodiscard]] SignalRouter &router() {
        return router_;
    }

private:
    pid_t spawn_worker();

    void spawn_missing();

    void reap();

    void handle_exit(const siginfo_t &child_info);

    void begin_draining();

    void kill_all(int sig_n);

    void terminate(int status);

    void schedule_tick();

    void on_tick(const boost::system::error_code &errc);

    void on_drain_timeout(const boost::system::error_code &errc);

    void notify(const WorkerRecord &record) const;

    boost::asio::io_context &ctx_;
    Config cfg_;
    WorkerEntry entry_;
    WorkerObserver observer_;
    ForkFn fork_fn_{::fork};

    ListeningSocket listener_;
    SignalRouter router_;
    boost::asio::steady_timer tick_timer_;
    boost::asio::steady_timer drain_timer_;

    std::vector<WorkerRecord> workers_;
    Phase phase_{Phase::INIT};
    bool shutdown_requested_{false};
    int exit_status_{EXIT_SUCCESS};
};

#endif //PREFORK_SUPERVISOR_HPP
