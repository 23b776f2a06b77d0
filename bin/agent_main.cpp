#include <chrono>
#include <iostream>

#include "hostwatch/agent/agent.hpp"
#include "hostwatch/agent/identity.hpp"
#include "hostwatch/agent/system_probe.hpp"
#include "hostwatch/util/config.hpp"
#include "hostwatch/util/logger.hpp"
#include "hostwatch/util/signal_handler.hpp"

int main(int argc, char* argv[]) {
    try {
        hostwatch::util::Config defaults;
        hostwatch::util::Config file_config = defaults;

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

        auto config = hostwatch::util::Config::merge(file_config, *cli_result, defaults);

        hostwatch::util::Logger::instance().set_level(config.log_level);

        auto collector_id = hostwatch::agent::load_or_create_identity(config.identity_path);

        hostwatch::agent::AgentOptions agent_opts;
        agent_opts.transport.host = config.host;
        agent_opts.transport.port = config.port;
        agent_opts.transport.response_timeout_seconds = config.response_timeout_seconds;
        agent_opts.sampler.period = std::chrono::milliseconds(config.sample_interval_ms);
        agent_opts.max_queued_frames = config.max_queued_frames;

        hostwatch::agent::ProcSystemProbe probe;
        hostwatch::agent::Agent agent(agent_opts, collector_id, probe);

        hostwatch::util::SignalHandler::install();

        auto reason = agent.run();
        if (reason == hostwatch::agent::StopReason::ShutdownTask) {
            LOG_INFO("Shutting down on server request");
        }
        return 0;

    } catch (const std::exception& e) {
        LOG_ERROR("fatal error: " + std::string(e.what()));
        return 1;
    }
}
