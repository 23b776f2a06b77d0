#ifndef HOSTWATCH_UTIL_CONFIG_HPP
#define HOSTWATCH_UTIL_CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "hostwatch/util/logger.hpp"

namespace hostwatch::util {

/*
    shared by hostwatch-server and hostwatch-agent. each binary reads the keys it cares about,
    the rest are ignored. agent and server must agree on host/port out of band.
*/
struct Config {
    // network (server binds, agent connects)
    std::string host = "127.0.0.1";
    uint16_t port = 9004;

    // server
    std::size_t max_connections = 1000;
    int client_timeout_seconds = 300;
    std::filesystem::path database_path = "./data/telemetry.db";
    std::size_t db_pool_size = 4;
    bool admin_enabled = true;

    // agent
    std::filesystem::path identity_path = "./collector.id";
    int sample_interval_ms = 1000;
    int response_timeout_seconds = 30;
    std::size_t max_queued_frames = 0;  // 0 = unbounded

    // logging
    LogLevel log_level = LogLevel::Info;

    // Load from file (key = value format)
    static std::optional<Config> load_file(const std::filesystem::path& path);

    // parse CLI args, returns nullopt on --help
    static std::optional<Config> parse_args(int argc, char* argv[]);

    // merge: CLI overrides file
    static Config merge(const Config& file_config, const Config& cli_config,
                        const Config& defaults);
};

}  // namespace hostwatch::util

#endif
