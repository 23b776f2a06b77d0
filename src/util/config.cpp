#include "hostwatch/util/config.hpp"

#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace hostwatch::util {

namespace {
std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

bool parse_bool(const std::string& s) {
    return s == "true" || s == "1" || s == "yes";
}

// the helpers below throw std::invalid_argument / std::out_of_range; main reports it as fatal

uint16_t parse_port(const std::string& value) {
    long long port = std::stoll(value);
    if (port < 0 || port > 65535) {
        throw std::out_of_range("port out of range: " + value);
    }
    return static_cast<uint16_t>(port);
}

// periods and pool sizes; zero would spin the sampler or leave no capacity
long long parse_positive(const std::string& key, const std::string& value) {
    long long n = std::stoll(value);
    if (n <= 0) {
        throw std::invalid_argument(key + " must be positive, got " + value);
    }
    return n;
}

long long parse_non_negative(const std::string& key, const std::string& value) {
    long long n = std::stoll(value);
    if (n < 0) {
        throw std::invalid_argument(key + " must not be negative, got " + value);
    }
    return n;
}

}  // namespace

std::optional<Config> Config::load_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    Config config;
    std::string line;

    while (std::getline(file, line)) {
        line = trim(line);

        if (line.empty() || line[0] == '#') {
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }

        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));

        //remove quotes if present
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.size() - 2);
        }

        if (key == "host") {
            config.host = value;
        } else if (key == "port") {
            config.port = parse_port(value);
        } else if (key == "max_connections") {
            config.max_connections = static_cast<std::size_t>(parse_positive(key, value));
        } else if (key == "client_timeout_seconds") {
            config.client_timeout_seconds = static_cast<int>(parse_non_negative(key, value));
        } else if (key == "database_path") {
            config.database_path = value;
        } else if (key == "db_pool_size") {
            config.db_pool_size = static_cast<std::size_t>(parse_positive(key, value));
        } else if (key == "admin_enabled") {
            config.admin_enabled = parse_bool(value);
        } else if (key == "identity_path") {
            config.identity_path = value;
        } else if (key == "sample_interval_ms") {
            config.sample_interval_ms = static_cast<int>(parse_positive(key, value));
        } else if (key == "response_timeout_seconds") {
            config.response_timeout_seconds = static_cast<int>(parse_non_negative(key, value));
        } else if (key == "max_queued_frames") {
            config.max_queued_frames = static_cast<std::size_t>(parse_non_negative(key, value));
        } else if (key == "log_level") {
            config.log_level = parse_log_level(value);
        }
    }

    return config;
}

std::optional<Config> Config::parse_args(int argc, char* argv[]) {
    Config config;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            std::cout << "Usage: " << argv[0] << " [options]\n"
                      << "Options:\n"
                      << "  -c, --config FILE             Config file path\n"
                      << "  -H, --host HOST               Collector address (default: 127.0.0.1)\n"
                      << "  -p, --port PORT               Collector port (default: 9004)\n"
                      << "  -l, --log-level LEVEL         Log level: debug, info, warn, error, none\n"
                      << "Server:\n"
                      << "  -d, --database FILE           SQLite database (default: ./data/telemetry.db)\n"
                      << "  --pool-size N                 Database connections (default: 4)\n"
                      << "  --max-connections N           Max agent connections (default: 1000)\n"
                      << "  --client-timeout SEC          Idle connection timeout (default: 300)\n"
                      << "  --no-admin                    Disable admin text sessions\n"
                      << "Agent:\n"
                      << "  -i, --identity FILE           Collector identity file (default: ./collector.id)\n"
                      << "  --interval MS                 Sample period (default: 1000)\n"
                      << "  --response-timeout SEC        Wait for server response (default: 30)\n"
                      << "  --max-queued N                Queue cap, drops oldest (default: 0 = unbounded)\n"
                      << "  -h, --help                    Show this help\n";
            return std::nullopt;
        }
        if ((arg == "-H" || arg == "--host") && i + 1 < argc) {
            config.host = argv[++i];
        } else if ((arg == "-p" || arg == "--port") && i + 1 < argc) {
            config.port = parse_port(argv[++i]);
        } else if ((arg == "-l" || arg == "--log-level") && i + 1 < argc) {
            config.log_level = parse_log_level(argv[++i]);
        } else if ((arg == "-d" || arg == "--database") && i + 1 < argc) {
            config.database_path = argv[++i];
        } else if (arg == "--pool-size" && i + 1 < argc) {
            config.db_pool_size = static_cast<std::size_t>(parse_positive("--pool-size", argv[++i]));
        } else if (arg == "--max-connections" && i + 1 < argc) {
            config.max_connections = static_cast<std::size_t>(parse_positive("--max-connections", argv[++i]));
        } else if (arg == "--client-timeout" && i + 1 < argc) {
            config.client_timeout_seconds = static_cast<int>(parse_non_negative("--client-timeout", argv[++i]));
        } else if (arg == "--no-admin") {
            config.admin_enabled = false;
        } else if ((arg == "-i" || arg == "--identity") && i + 1 < argc) {
            config.identity_path = argv[++i];
        } else if (arg == "--interval" && i + 1 < argc) {
            config.sample_interval_ms = static_cast<int>(parse_positive("--interval", argv[++i]));
        } else if (arg == "--response-timeout" && i + 1 < argc) {
            config.response_timeout_seconds = static_cast<int>(parse_non_negative("--response-timeout", argv[++i]));
        } else if (arg == "--max-queued" && i + 1 < argc) {
            config.max_queued_frames = static_cast<std::size_t>(parse_non_negative("--max-queued", argv[++i]));
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            // Config file handled separately in main
            ++i;
        }
    }

    return config;
}

Config Config::merge(const Config& file_config, const Config& cli_config, const Config& defaults) {
    Config result = defaults;

    // later sources win when they differ from the defaults
    for (const Config* src : {&file_config, &cli_config}) {
        if (src->host != defaults.host) result.host = src->host;
        if (src->port != defaults.port) result.port = src->port;
        if (src->max_connections != defaults.max_connections) result.max_connections = src->max_connections;
        if (src->client_timeout_seconds != defaults.client_timeout_seconds) result.client_timeout_seconds = src->client_timeout_seconds;
        if (src->database_path != defaults.database_path) result.database_path = src->database_path;
        if (src->db_pool_size != defaults.db_pool_size) result.db_pool_size = src->db_pool_size;
        if (src->admin_enabled != defaults.admin_enabled) result.admin_enabled = src->admin_enabled;
        if (src->identity_path != defaults.identity_path) result.identity_path = src->identity_path;
        if (src->sample_interval_ms != defaults.sample_interval_ms) result.sample_interval_ms = src->sample_interval_ms;
        if (src->response_timeout_seconds != defaults.response_timeout_seconds) result.response_timeout_seconds = src->response_timeout_seconds;
        if (src->max_queued_frames != defaults.max_queued_frames) result.max_queued_frames = src->max_queued_frames;
        if (src->log_level != defaults.log_level) result.log_level = src->log_level;
    }

    return result;
}

}  // namespace hostwatch::util
