#include <boost/asio/io_context.hpp>
#include <cstdlib>
#include <exception>
#include <spdlog/spdlog.h>

#include "config.hpp"
#include "errors.hpp"
#include "handler.hpp"
#include "logger.hpp"
#include "supervisor.hpp"
#include "worker.hpp"

int main(int argc, char **argv) {
    try {
        const auto cfg = parse_args(argc, argv);
        if (!cfg.has_value()) {
            return EXIT_SUCCESS; // --help
        }
        setup_logging(cfg->debug);

        boost::asio::io_context ctx;
        Supervisor master{ctx, *cfg, [&cfg](ListeningSocket &listener) {
            HelloHandler handler;
            serve(listener, *cfg, handler);
        }};
        return master.run();
    } catch (const ConfigError &ex) {
        spdlog::critical("Invalid configuration: {}", ex.what());
    } catch (const BindError &ex) {
        spdlog::critical("Failed to bind the listener: {}", ex.what());
    } catch (const std::exception &ex) {
        spdlog::critical("Something went wrong: {}", ex.what());
    }
    return EXIT_FAILURE;
}
