#ifndef PREFORK_HANDLER_HPP
#define PREFORK_HANDLER_HPP

#include <boost/beast/http.hpp>

using Request = boost::beast::http::request<boost::beast::http::string_body>;
using Response = boost::beast::http::response<boost::beast::http::string_body>;

class RequestHandler {
public:
    RequestHandler() = default;

    virtual ~RequestHandler() = default;

    RequestHandler(const RequestHandler &) = delete;

    RequestHandler &operator=(const RequestHandler &) = delete;

    RequestHandler(RequestHandler &&) = delete;

    RequestHandler &operator=(RequestHandler &&) = delete;

    // Runs synchronously inside the worker. May throw HandlerError
    virtual Response handle(const Request &request) = 0;
};

// Serves the same static page for every request
class HelloHandler : public RequestHandler {
public:
    Response handle(const Request &request) override;
};

Response make_error_response(boost::beast::http::status status, unsigned version);

inline constexpr const char *SERVER_NAME = "prefork";

#endif //PREFORK_HANDLER_HPP
