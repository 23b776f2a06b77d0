#include <iostream>

#include "hostwatch/server/command_store.hpp"
#include "hostwatch/server/server.hpp"
#include "hostwatch/storage/sqlite_store.hpp"
#include "hostwatch/util/config.hpp"
#include "hostwatch/util/logger.hpp"
#include "hostwatch/util/signal_handler.hpp"

int main(int argc, char* argv[]) {
    try {
        hostwatch::util::Config defaults;
        hostwatch::util::Config file_config = defaults;

        //first pass: find config_path
        std::filesystem::path config_path;
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
                config_path = argv[++i];
                break;
            }
        }

        if (!config_path.empty()) {
            auto loaded = hostwatch::util::Config::load_file(config_path);
            if (loaded) {
                file_config = *loaded;
            } else {
                std::cerr << "Warning: Could not load config file: " << config_path << std::endl;
            }
        }

        auto cli_result = hostwatch::util::Config::parse_args(argc, argv);
        if (!cli_result) {
            return 0;  //--help was shown
        }

        //Merge: CLI > file > defaults
        auto config = hostwatch::util::Config::merge(file_config, *cli_result, defaults);

        hostwatch::util::Logger::instance().set_level(config.log_level);

        hostwatch::storage::SqliteStoreOptions store_opts;
        store_opts.path = config.database_path;
        store_opts.pool_size = config.db_pool_size;
        hostwatch::storage::SqliteMetricsStore store(store_opts);

        hostwatch::server::CommandStore commands;

        hostwatch::server::ServerOptions server_opts;
        server_opts.host = config.host;
        server_opts.port = config.port;
        server_opts.max_connections = config.max_connections;
        server_opts.client_timeout_seconds = config.client_timeout_seconds;
        server_opts.admin_enabled = config.admin_enabled;

        hostwatch::server::Server server(store, commands, server_opts);

        hostwatch::util::SignalHandler::install();

        server.start();

        LOG_INFO("Press Ctrl+C to shutdown");

        hostwatch::util::SignalHandler::wait_for_shutdown();

        server.stop();

        LOG_INFO("Shutdown complete");
        return 0;

    } catch (const std::exception& e) {
        LOG_ERROR("fatal error: " + std::string(e.what()));
        return 1;
    }
}
