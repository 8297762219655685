#include "listener.hpp"

#include <boost/system/system_error.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace {
    boost::asio::ip::tcp::endpoint resolve_endpoint(boost::asio::io_context &ctx, const std::string &address,
                                                    unsigned short port) {
        boost::system::error_code errc;
        const auto ip = boost::asio::ip::make_address_v4(address, errc);
        if (!errc) {
            return {ip, port};
        }

        boost::asio::ip::tcp::resolver resolver{ctx};
        const auto results = resolver.resolve(boost::asio::ip::tcp::v4(), address, std::to_string(port),
                                              boost::asio::ip::tcp::resolver::passive, errc);
        if (errc || results.empty()) {
            throw BindError(fmt::format("Can't resolve {}: {}", address,
                                        errc ? errc.message() : std::string{"no addresses"}));
        }
        return results.begin()->endpoint();
    }
}

ListeningSocket bind_listener(boost::asio::io_context &ctx, const std::string &address, const unsigned short port,
                              const int backlog) {
    const auto endpoint = resolve_endpoint(ctx, address, port);

    ListeningSocket acceptor{ctx};
    try {
        acceptor.open(endpoint.protocol());
        // A restarted master must not trip over the previous one's TIME_WAIT sockets
        acceptor.set_option(boost::asio::ip::tcp::acceptor::reuse_address{true});
        acceptor.set_option(boost::asio::ip::tcp::no_delay{true});
        acceptor.bind(endpoint);
        acceptor.listen(backlog);
    } catch (const boost::system::system_error &ex) {
        throw BindError(fmt::format("Can't listen on {}:{}: {}", endpoint.address().to_string(), endpoint.port(),
                                    ex.code().message()));
    }

    spdlog::info("Listening on {}:{}", acceptor.local_endpoint().address().to_string(),
                 acceptor.local_endpoint().port());
    return acceptor;
}
