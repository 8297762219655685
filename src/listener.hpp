#ifndef PREFORK_LISTENER_HPP
#define PREFORK_LISTENER_HPP

#include <string>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include "errors.hpp"

// Opened once by the master, inherited by every worker through fork
using ListeningSocket = boost::asio::ip::tcp::acceptor;

/**
 * Opens a TCP listening socket with SO_REUSEADDR and TCP_NODELAY set.
 * The address may be an IPv4 literal or a host name, port 0 picks an ephemeral port.
 * @throws BindError if the address doesn't resolve, is in use or permission is denied
 */
ListeningSocket bind_listener(boost::asio::io_context &ctx, const std::string &address, unsigned short port,
                              int backlog);

#endif //PREFORK_LISTENER_HPP
