#include <iostream>
#include <string>

#include "respkv/core/store.hpp"
#include "respkv/net/server/server.hpp"
#include "respkv/util/config.hpp"
#include "respkv/util/logger.hpp"
#include "respkv/util/signal_handler.hpp"

int main(int argc, char* argv[]) {
    try {
        respkv::util::Config defaults;
        respkv::util::Config file_config = defaults;

        // load config file if specified
        if (auto path = respkv::util::Config::config_path(argc, argv)) {
            auto loaded = respkv::util::Config::load_file(*path);
            if (loaded) {
                file_config = *loaded;
            } else {
                std::cerr << "Warning: Could not load config file: " << *path << std::endl;
            }
        }

        auto cli_result = respkv::util::Config::parse_args(argc, argv);
        if (!cli_result) {
            return 0;  // --help was shown
        }

        // CLI > file > defaults
        auto config = respkv::util::Config::merge(file_config, *cli_result, defaults);

        respkv::util::Logger::instance().set_level(config.log_level);

        respkv::core::Store store;

        respkv::net::server::ServerOptions server_opts;
        server_opts.host = config.host;
        server_opts.port = config.port;
        server_opts.max_connections = config.max_connections;
        server_opts.client_timeout_seconds = config.client_timeout_seconds;
        server_opts.sweep_interval = respkv::util::Duration(config.sweep_interval_ms);

        respkv::net::server::Server server(store, server_opts);

        respkv::util::SignalHandler::install();

        server.start();

        LOG_INFO("Press Ctrl+C to shutdown");

        respkv::util::SignalHandler::wait_for_shutdown();

        server.stop();

        LOG_INFO("Shutdown complete");
        return 0;

    } catch (const std::exception& e) {
        LOG_ERROR("fatal error: " + std::string(e.what()));
        return 1;
    }
}
