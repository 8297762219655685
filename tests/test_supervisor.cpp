#include <gtest/gtest.h>
#include <algorithm>
#include <array>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <future>
#include <memory>
#include <set>
#include <string>
#include <thread>
#include <vector>
#include <pthread.h>
#include <unistd.h>
#include <boost/asio.hpp>
#include "../src/supervisor.hpp"
#include "../src/worker.hpp"
#include "test_util.hpp"

namespace {
    class SupervisorTest : public ::testing::Test {
    protected:
        SupervisorTest() {
            cfg_.address = "127.0.0.1";
            cfg_.port = 0;
            cfg_.worker_count = 3;
            cfg_.tick_ms = 50;
        }

        void TearDown() override {
            // Never leave workers behind, whatever the test did
            if (master_ && master_->phase() != Phase::TERMINATED) {
                master_->on_immediate_stop(SIGQUIT);
            }
        }

        Supervisor &make_master() {
            master_ = std::make_unique<Supervisor>(ctx_, cfg_, [this](ListeningSocket &listener) {
                HelloHandler handler;
                serve(listener, cfg_, handler);
            });
            master_->set_observer([this](const WorkerRecord &record) {
                events_.emplace_back(record.pid, record.state, master_->shutdown_requested());
            });
            return *master_;
        }

        [[nodiscard]] unsigned short port() const {
            return master_->listener().local_endpoint().port();
        }

        [[nodiscard]] std::size_t count_events(WorkerState state) const {
            return static_cast<std::size_t>(std::ranges::count_if(events_, [state](const Event &event) {
                return event.state == state;
            }));
        }

        [[nodiscard]] bool has_pid(pid_t pid) const {
            return std::ranges::any_of(master_->workers(), [pid](const WorkerRecord &worker) {
                return worker.pid == pid;
            });
        }

        struct Event {
            Event(pid_t p, WorkerState s, bool shutdown) : pid(p), state(s), after_shutdown(shutdown) {
            }

            pid_t pid;
            WorkerState state;
            bool after_shutdown;
        };

        boost::asio::io_context ctx_;
        Config cfg_;
        std::unique_ptr<Supervisor> master_;
        std::vector<Event> events_;
    };
}

TEST_F(SupervisorTest, SpawnsTargetCount) {
    auto &master = make_master();
    ASSERT_EQ(master.phase(), Phase::INIT);
    ASSERT_TRUE(master.workers().empty());

    master.start();

    ASSERT_EQ(master.phase(), Phase::MONITORING);
    ASSERT_EQ(master.workers().size(), 3);
    ASSERT_EQ(master.running_count(), 3);
    for (const auto &worker: master.workers()) {
        ASSERT_EQ(worker.state, WorkerState::RUNNING);
        ASSERT_GT(worker.pid, 0);
    }
    ASSERT_EQ(count_events(WorkerState::STARTING), 3);
}

TEST_F(SupervisorTest, SingleWorker) {
    cfg_.worker_count = 1;
    auto &master = make_master();
    master.start();

    ASSERT_EQ(master.running_count(), 1);
    ASSERT_TRUE(fetch(port(), get_request("/")).starts_with("HTTP/1.1 200 OK\r\n"));
}

TEST_F(SupervisorTest, ReplacesKilledWorker) {
    auto &master = make_master();
    master.start();

    const pid_t victim = master.workers().front().pid;
    ASSERT_EQ(kill(victim, SIGKILL), 0);

    ASSERT_TRUE(run_until(ctx_, [&] {
        return !has_pid(victim) && master.running_count() == 3;
    }, std::chrono::seconds(5)));

    ASSERT_EQ(master.workers().size(), 3);
    ASSERT_EQ(count_events(WorkerState::REAPED), 1);
    ASSERT_EQ(count_events(WorkerState::STARTING), 4);
    ASSERT_EQ(master.phase(), Phase::MONITORING);
}

TEST_F(SupervisorTest, ReplacesWorkerThatExitedCleanly) {
    auto &master = make_master();
    master.start();
    ASSERT_TRUE(fetch(port(), get_request("/")).starts_with("HTTP/1.1 200"));

    // A worker stopped from outside exits 0, the pool still has to stay full
    const pid_t victim = master.workers().back().pid;
    ASSERT_EQ(kill(victim, SIGTERM), 0);

    ASSERT_TRUE(run_until(ctx_, [&] {
        return !has_pid(victim) && master.running_count() == 3;
    }, std::chrono::seconds(5)));
}

TEST_F(SupervisorTest, GracefulShutdownDrains) {
    auto &master = make_master();
    master.start();
    ASSERT_TRUE(fetch(port(), get_request("/")).starts_with("HTTP/1.1 200"));

    std::set<pid_t> spawned;
    for (const auto &worker: master.workers()) {
        spawned.insert(worker.pid);
    }

    ASSERT_EQ(::raise(SIGTERM), 0);
    ASSERT_TRUE(run_until(ctx_, [&] { return master.phase() == Phase::TERMINATED; }, std::chrono::seconds(10)));

    ASSERT_TRUE(master.shutdown_requested());
    ASSERT_EQ(master.exit_status(), EXIT_SUCCESS);
    ASSERT_TRUE(master.workers().empty());
    ASSERT_FALSE(master.listener().is_open());

    // Nothing spawned after the request, every worker reaped
    for (const auto &event: events_) {
        if (event.after_shutdown) {
            ASSERT_NE(event.state, WorkerState::STARTING);
        }
    }
    std::set<pid_t> reaped;
    for (const auto &event: events_) {
        if (event.state == WorkerState::REAPED) {
            reaped.insert(event.pid);
        }
    }
    ASSERT_EQ(reaped, spawned);
}

TEST_F(SupervisorTest, GracefulShutdownIsIdempotent) {
    auto &master = make_master();
    master.start();
    ASSERT_TRUE(fetch(port(), get_request("/")).starts_with("HTTP/1.1 200"));

    master.router().dispatch(SIGTERM);
    master.router().dispatch(SIGTERM);
    master.on_graceful_stop(SIGINT); // Even past the router

    ASSERT_EQ(master.phase() == Phase::DRAINING || master.phase() == Phase::TERMINATED, true);
    ASSERT_EQ(count_events(WorkerState::EXITING), 3); // One stop per worker

    ASSERT_TRUE(run_until(ctx_, [&] { return master.phase() == Phase::TERMINATED; }, std::chrono::seconds(10)));
    ASSERT_EQ(master.exit_status(), EXIT_SUCCESS);
    ASSERT_TRUE(master.workers().empty());
    ASSERT_EQ(count_events(WorkerState::REAPED), 3);
    ASSERT_EQ(count_events(WorkerState::STARTING), 3);
}

TEST_F(SupervisorTest, ImmediateStop) {
    auto &master = make_master();
    master.start();

    master.router().dispatch(SIGQUIT);

    ASSERT_EQ(master.phase(), Phase::TERMINATED);
    ASSERT_EQ(master.exit_status(), 128 + SIGQUIT);
    ASSERT_TRUE(master.workers().empty());
    ASSERT_EQ(count_events(WorkerState::REAPED), 3);
    ASSERT_FALSE(master.listener().is_open());
}

TEST_F(SupervisorTest, DrainDeadlineKillsStragglers) {
    cfg_.worker_count = 1;
    cfg_.graceful_timeout_ms = 200;
    cfg_.timeout_ms = 0; // The stuck client never times out on its own
    auto &master = make_master();
    master.start();
    ASSERT_TRUE(fetch(port(), get_request("/")).starts_with("HTTP/1.1 200"));

    // Keep the only worker busy with a request that never completes
    boost::asio::io_context client_ctx;
    boost::asio::ip::tcp::socket sock{client_ctx};
    sock.connect({boost::asio::ip::make_address("127.0.0.1"), port()});
    boost::asio::write(sock, boost::asio::buffer(std::string{"GET / HTTP/1.1\r\n"}));
    std::this_thread::sleep_for(std::chrono::milliseconds(300));

    master.router().dispatch(SIGTERM);
    ASSERT_TRUE(run_until(ctx_, [&] { return master.phase() == Phase::TERMINATED; }, std::chrono::seconds(10)));
    ASSERT_EQ(master.exit_status(), EXIT_SUCCESS);
}

TEST_F(SupervisorTest, ConcurrentClientsGetIndependentResponses) {
    cfg_.worker_count = 2;
    auto &master = make_master();
    master.start();

    auto first = std::async(std::launch::async, [port = port()] {
        return fetch(port, get_request("/first"));
    });
    auto second = std::async(std::launch::async, [port = port()] {
        return fetch(port, get_request("/second"));
    });

    const std::string expected_body = "<html><body>Hello!</body></html>";
    for (auto *client: {&first, &second}) {
        const auto response = client->get();
        ASSERT_TRUE(response.starts_with("HTTP/1.1 200 OK\r\n")) << response;
        ASSERT_TRUE(response.ends_with(expected_body)) << response;
        // Exactly one response per connection
        ASSERT_EQ(response.find("HTTP/1.1", 1), std::string::npos) << response;
    }
}

TEST_F(SupervisorTest, ForkFailureAtStartIsRetriedOnTick) {
    auto &master = make_master();
    int failures_left = 2;
    master.set_fork([&failures_left]() -> pid_t {
        if (failures_left > 0) {
            --failures_left;
            errno = EAGAIN;
            return -1;
        }
        return ::fork();
    });

    ASSERT_NO_THROW(master.start());
    ASSERT_EQ(master.phase(), Phase::MONITORING);
    ASSERT_EQ(master.running_count(), 0);
    ASSERT_EQ(failures_left, 1); // Gave up until the next tick

    ASSERT_TRUE(run_until(ctx_, [&] { return master.running_count() == 3; }, std::chrono::seconds(5)));
    ASSERT_EQ(failures_left, 0);
    ASSERT_EQ(master.phase(), Phase::MONITORING);
    ASSERT_TRUE(fetch(port(), get_request("/")).starts_with("HTTP/1.1 200"));
}

TEST_F(SupervisorTest, FailedRespawnIsRetriedOnTick) {
    auto &master = make_master();
    int failures_left = 0;
    master.set_fork([&failures_left]() -> pid_t {
        if (failures_left > 0) {
            --failures_left;
            errno = EAGAIN;
            return -1;
        }
        return ::fork();
    });
    master.start();
    ASSERT_EQ(master.running_count(), 3);

    failures_left = 1;
    const pid_t victim = master.workers().front().pid;
    ASSERT_EQ(kill(victim, SIGKILL), 0);

    // The replacement fork fails, the pool is short until a tick fills it
    ASSERT_TRUE(run_until(ctx_, [&] { return !has_pid(victim); }, std::chrono::seconds(5)));
    ASSERT_TRUE(run_until(ctx_, [&] { return master.running_count() == 3; }, std::chrono::seconds(5)));
    ASSERT_EQ(failures_left, 0);
    ASSERT_EQ(count_events(WorkerState::REAPED), 1);
    ASSERT_EQ(count_events(WorkerState::STARTING), 4);
    ASSERT_EQ(master.phase(), Phase::MONITORING);
}

TEST_F(SupervisorTest, WorkersStartWithStopSignalsHeld) {
    std::array<int, 2> fds{};
    ASSERT_EQ(pipe(fds.data()), 0);

    auto &master = make_master();
    // Each child reports its signal mask as seen right after fork
    master.set_fork([write_fd = fds[1], read_fd = fds[0]]() -> pid_t {
        const pid_t pid = ::fork();
        if (pid == 0) {
            sigset_t mask;
            pthread_sigmask(SIG_BLOCK, nullptr, &mask);
            const char held = sigismember(&mask, SIGINT) == 1 && sigismember(&mask, SIGTERM) == 1 ? 'y' : 'n';
            [[maybe_unused]] const auto written = write(write_fd, &held, 1);
            close(write_fd);
            close(read_fd);
        }
        return pid;
    });
    master.start();
    close(fds[1]);

    std::string held;
    char c{};
    while (read(fds[0], &c, 1) == 1) {
        held.push_back(c);
    }
    close(fds[0]);
    ASSERT_EQ(held, "yyy");

    // The master itself gets its mask back
    sigset_t mask;
    pthread_sigmask(SIG_BLOCK, nullptr, &mask);
    ASSERT_EQ(sigismember(&mask, SIGINT), 0);
    ASSERT_EQ(sigismember(&mask, SIGTERM), 0);

    // And the workers still stop cleanly once they run
    ASSERT_TRUE(fetch(port(), get_request("/")).starts_with("HTTP/1.1 200"));
    ASSERT_EQ(::raise(SIGTERM), 0);
    ASSERT_TRUE(run_until(ctx_, [&] { return master.phase() == Phase::TERMINATED; }, std::chrono::seconds(10)));
    ASSERT_EQ(master.exit_status(), EXIT_SUCCESS);
}

TEST_F(SupervisorTest, BindFailureSpawnsNothing) {
    auto busy = bind_listener(ctx_, "127.0.0.1", 0, 16);
    cfg_.port = busy.local_endpoint().port();

    bool entered = false;
    EXPECT_THROW(Supervisor(ctx_, cfg_, [&entered](ListeningSocket &) { entered = true; }), BindError);
    ASSERT_FALSE(entered);
    ASSERT_EQ(master_, nullptr);
}

TEST_F(SupervisorTest, ScenarioKillOneThenShutdown) {
    auto &master = make_master();
    master.start();
    ASSERT_EQ(master.running_count(), 3);

    const pid_t victim = master.workers()[1].pid;
    ASSERT_EQ(kill(victim, SIGKILL), 0);
    ASSERT_TRUE(run_until(ctx_, [&] {
        return !has_pid(victim) && master.running_count() == 3;
    }, std::chrono::seconds(5)));
    ASSERT_EQ(master.workers().size(), 3);
    ASSERT_TRUE(fetch(port(), get_request("/")).starts_with("HTTP/1.1 200"));

    ASSERT_EQ(::raise(SIGINT), 0);
    ASSERT_TRUE(run_until(ctx_, [&] { return master.phase() == Phase::TERMINATED; }, std::chrono::seconds(10)));
    ASSERT_EQ(master.exit_status(), EXIT_SUCCESS);
    ASSERT_TRUE(master.workers().empty());
    ASSERT_EQ(count_events(WorkerState::REAPED), 4);
}
