#include "handler.hpp"

#include <sstream>
#include <spdlog/spdlog.h>

namespace http = boost::beast::http;

namespace {
    std::string dump(const auto &msg) {
        std::ostringstream out;
        out << msg;
        return out.str();
    }
}

Response HelloHandler::handle(const Request &request) {
    spdlog::debug("Request:\n{}", dump(request));

    Response res{http::status::ok, request.version()};
    res.set(http::field::server, SERVER_NAME);
    res.set(http::field::content_type, "text/html");
    res.body() = "<html><body>Hello!</body></html>";
    res.keep_alive(false);
    res.prepare_payload();

    spdlog::debug("Response:\n{}", dump(res));
    return res;
}

Response make_error_response(const http::status status, const unsigned version) {
    Response res{status, version};
    res.set(http::field::server, SERVER_NAME);
    res.set(http::field::content_type, "text/html");
    const auto reason = http::obsolete_reason(status);
    res.body() = "<html><body>" + std::string(reason.data(), reason.size()) + "</body></html>";
    res.keep_alive(false);
    res.prepare_payload();
    return res;
}
