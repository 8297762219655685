#include "connection.hpp"

#include <cstdint>
#include <exception>
#include <unistd.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "errors.hpp"

namespace http = boost::beast::http;

namespace {
    bool is_parse_error(const boost::system::error_code &errc) {
        return errc.category() == http::make_error_code(http::error::bad_version).category();
    }

    std::string to_std_string(const boost::beast::string_view sv) {
        return {sv.data(), sv.size()};
    }
}

Connection::Connection(boost::asio::ip::tcp::socket socket, RequestHandler &handler, const Config &cfg,
                       Logger *access_log, Completion on_done)
    : socket_(std::move(socket)), timer_(socket_.get_executor()), handler_(handler), cfg_(cfg),
      access_log_(access_log), on_done_(std::move(on_done)) {
    boost::system::error_code errc;
    const auto endpoint = socket_.remote_endpoint(errc);
    if (!errc) {
        client_addr_ = endpoint.address().to_string();
    }
}

void Connection::run() {
    start_time_ = std::chrono::steady_clock::now();

    parser_.emplace();
    parser_->header_limit(static_cast<std::uint32_t>(cfg_.max_request_bytes));
    parser_->body_limit(cfg_.max_request_bytes);

    prepare_timer(WaitState::READ);
    http::async_read(socket_, buffer_, *parser_,
                     [self = shared_from_this()](const boost::system::error_code &errc, std::size_t bytes_tf) {
                         self->on_read(errc, bytes_tf);
                     });
}

void Connection::prepare_timer(const WaitState state) {
    if (cfg_.timeout_ms == 0) {
        return;
    }
    timer_.expires_after(std::chrono::milliseconds(cfg_.timeout_ms));
    timer_.async_wait([weak = weak_from_this(), state](const boost::system::error_code &errc) {
        if (auto self = weak.lock()) {
            self->handle_timer(errc, state);
        }
    });
}

void Connection::handle_timer(const boost::system::error_code &errc, const WaitState state) {
    if (errc || done_) {
        return; // Cancelled or rearmed
    }
    timed_out_ = true;
    spdlog::debug("Connection from {} timed out while {}", client_addr_,
                  state == WaitState::READ ? "reading the request" : "writing the response");

    boost::system::error_code ignored;
    socket_.close(ignored); // Pending operation completes with operation_aborted
}

void Connection::on_read(const boost::system::error_code &errc, [[maybe_unused]] std::size_t bytes_tf) {
    if (errc) {
        if (timed_out_) {
            finish();
        } else if (errc == http::error::end_of_stream) {
            finish(); // Client went away without sending anything
        } else if (errc == http::error::header_limit || errc == http::error::body_limit) {
            spdlog::debug("Request from {} is too large", client_addr_);
            respond(make_error_response(http::status::payload_too_large, 11));
        } else if (is_parse_error(errc)) {
            spdlog::debug("Malformed request from {}: {}", client_addr_, errc.message());
            respond(make_error_response(http::status::bad_request, 11));
        } else {
            spdlog::debug("Reading request from {} failed: {}", client_addr_, errc.message());
            finish();
        }
        return;
    }

    Request request = parser_->release();
    request_method_ = to_std_string(request.method_string());
    request_uri_ = to_std_string(request.target());
    if (const auto it = request.find(http::field::user_agent); it != request.end()) {
        user_agent_ = to_std_string(it->value());
    }

    Response res;
    try {
        res = handler_.handle(request);
    } catch (const HandlerError &ex) {
        spdlog::error("Handler failed on {} {}: {}", request_method_, request_uri_, ex.what());
        res = make_error_response(http::status::internal_server_error, request.version());
    } catch (const std::exception &ex) {
        spdlog::error("Handler threw on {} {}: {}", request_method_, request_uri_, ex.what());
        res = make_error_response(http::status::internal_server_error, request.version());
    }
    respond(std::move(res));
}

void Connection::respond(Response &&res) {
    response_ = std::move(res);
    // No keep-alive, one exchange per connection
    response_.keep_alive(false);
    response_.prepare_payload();

    prepare_timer(WaitState::WRITE);
    http::async_write(socket_, response_,
                      [self = shared_from_this()](const boost::system::error_code &errc, std::size_t bytes_tf) {
                          self->on_write(errc, bytes_tf);
                      });
}

void Connection::on_write(const boost::system::error_code &errc, const std::size_t bytes_tf) {
    bytes_sent_ = bytes_tf;
    if (errc) {
        spdlog::debug("Writing response to {} failed: {}", client_addr_, errc.message());
    } else {
        boost::system::error_code ignored;
        socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored);
    }
    log();
    finish();
}

void Connection::finish() {
    if (done_) {
        return;
    }
    done_ = true;

    timer_.cancel();
    boost::system::error_code ignored;
    socket_.close(ignored);

    if (on_done_) {
        on_done_();
    }
}

void Connection::log() {
    if (access_log_ == nullptr) {
        return;
    }

    std::string log_msg = cfg_.format_log.format;
    for (const auto var: cfg_.format_log.used_vars) {
        switch (var) {
            case LogFormat::Variable::CLIENT_ADDR: {
                replace_variable(log_msg, var, client_addr_);
                break;
            }
            case LogFormat::Variable::BYTES_SENT: {
                replace_variable(log_msg, var, std::to_string(bytes_sent_));
                break;
            }
            case LogFormat::Variable::PROCESSING_TIME: {
                auto diff = std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::steady_clock::now() - start_time_);
                replace_variable(log_msg, var, fmt::format("{}ms", diff.count()));
                break;
            }
            case LogFormat::Variable::REQUEST_URI: {
                replace_variable(log_msg, var, request_uri_);
                break;
            }
            case LogFormat::Variable::STATUS: {
                replace_variable(log_msg, var, std::to_string(response_.result_int()));
                break;
            }
            case LogFormat::Variable::HTTP_USER_AGENT: {
                replace_variable(log_msg, var, user_agent_);
                break;
            }
            case LogFormat::Variable::REQUEST_METHOD: {
                replace_variable(log_msg, var, request_method_);
                break;
            }
            case LogFormat::Variable::WORKER_PID: {
                replace_variable(log_msg, var, std::to_string(getpid()));
                break;
            }
        }
    }
    access_log_->write(log_msg);
}
