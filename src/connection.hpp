#ifndef PREFORK_CONNECTION_HPP
#define PREFORK_CONNECTION_HPP

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http.hpp>

#include "config.hpp"
#include "handler.hpp"
#include "logger.hpp"

enum class WaitState {
    READ,
    WRITE,
};

// One accepted socket, one request, one response, then close
class Connection : public std::enable_shared_from_this<Connection> {
public:
    using Completion = std::function<void()>;

    Connection(boost::asio::ip::tcp::socket socket, RequestHandler &handler, const Config &cfg, Logger *access_log,
               Completion on_done);

    Connection(const Connection &) = delete;

    Connection(Connection &&) = delete;

    Connection &operator=(const Connection &) = delete;

    Connection &operator=(Connection &&) = delete;

    void run();

    // Completion is reported exactly once, whatever way the exchange ends
    [[nodiscard]] bool done() const {
        return done_;
    }

private:
    void prepare_timer(WaitState state);

    void handle_timer(const boost::system::error_code &errc, WaitState state);

    void on_read(const boost::system::error_code &errc, std::size_t bytes_tf);

    void respond(Response &&res);

    void on_write(const boost::system::error_code &errc, std::size_t bytes_tf);

    void finish();

    void log();

    boost::asio::ip::tcp::socket socket_;
    boost::asio::steady_timer timer_;
    boost::beast::flat_buffer buffer_;
    std::optional<boost::beast::http::request_parser<boost::beast::http::string_body> > parser_;
    Response response_;

    RequestHandler &handler_;
    const Config &cfg_;
    Logger *access_log_;
    Completion on_done_;

    bool done_{false};
    bool timed_out_{false};

    // Access log data
    std::chrono::steady_clock::time_point start_time_;
    std::string client_addr_{"-"};
    std::string request_method_{"-"};
    std::string request_uri_{"-"};
    std::string user_agent_{"-"};
    std::size_t bytes_sent_{};
};

#endif //PREFORK_CONNECTION_HPP
