#include "netmapper/discovery_interface.hpp"
#include "netmapper/template_manager.hpp"
#include "components/connection/ssh_connection_client.hpp"
#include "components/credentials/credential_store.hpp"
#include "components/engine/discovery_config.hpp"
#include "components/engine/discovery_engine.hpp"
#include "components/export/result_json.hpp"
#include "components/parser/output_parser.hpp"
#include "components/reachability/tcp_reachability_probe.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <atomic>
#include <csignal>
#include <iostream>
#include <map>
#include <set>
#include <string>
#include <vector>

#ifndef NETMAPPER_TEMPLATE_DIR
#define NETMAPPER_TEMPLATE_DIR "templates"
#endif

using namespace netmapper;
using namespace netmapper::components;

namespace {

std::atomic<bool> g_stop_requested{false};

void signal_handler(int) {
    g_stop_requested = true;
}

struct CliOptions {
    std::string seeds;
    std::string creds_file = "creds.json";
    std::string templates_dir = NETMAPPER_TEMPLATE_DIR;
    std::string config_file;
    std::string output_file = "network_topology.json";
    std::string log_level;
    std::string log_file;
    std::map<std::string, std::string> overrides;
    bool show_help = false;
};

void print_usage(const char* program) {
    std::cout << "netmapper " << NETMAPPER_VERSION << " - CDP/LLDP network topology discovery over SSH\n\n"
              << "Usage: " << program << " --seed HOST,IP|IP[;...] [options]\n\n"
              << "Options:\n"
              << "  --seed LIST         Seed devices, ';'-separated, each HOST,IP or IP\n"
              << "  --max-hops N        Hop limit from the seeds (default 4)\n"
              << "  --creds-file FILE   Credentials JSON (default creds.json)\n"
              << "  --templates DIR     Template directory (default " << NETMAPPER_TEMPLATE_DIR << ")\n"
              << "  --exclude LIST      ','-separated hostname substrings not to crawl\n"
              << "  --config FILE       JSON settings file\n"
              << "  --output FILE       Topology output (default network_topology.json)\n"
              << "  --log-level LEVEL   trace|debug|info|warn|error (default info)\n"
              << "  --log-file FILE     Also write the log to FILE\n"
              << "  --help              Show this message\n";
}

CliOptions parse_arguments(int argc, char** argv) {
    CliOptions cli;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            cli.show_help = true;
            continue;
        }

        if (i + 1 >= argc) {
            throw ConfigError("missing value for " + arg);
        }
        std::string value = argv[++i];

        if (arg == "--seed") {
            cli.seeds = value;
        } else if (arg == "--max-hops") {
            cli.overrides["max_hops"] = value;
        } else if (arg == "--creds-file") {
            cli.creds_file = value;
        } else if (arg == "--templates") {
            cli.templates_dir = value;
        } else if (arg == "--exclude") {
            cli.overrides["exclusions"] = value;
        } else if (arg == "--config") {
            cli.config_file = value;
        } else if (arg == "--output") {
            cli.output_file = value;
        } else if (arg == "--log-level") {
            cli.log_level = value;
        } else if (arg == "--log-file") {
            cli.log_file = value;
        } else {
            throw ConfigError("unknown option " + arg);
        }
    }
    return cli;
}

std::shared_ptr<spdlog::logger> make_logger(const std::string& level_name, const std::string& log_file) {
    static const std::set<std::string> levels = {"trace", "debug", "info", "warn", "warning", "error", "critical", "off"};
    if (levels.count(level_name) == 0) {
        throw ConfigError("unknown log level '" + level_name + "'");
    }

    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    if (!log_file.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, true));
    }

    auto logger = std::make_shared<spdlog::logger>("netmapper", sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::from_str(level_name == "warning" ? "warn" : level_name));
    logger->flush_on(spdlog::level::warn);
    return logger;
}

void report_error(const std::shared_ptr<spdlog::logger>& logger, const std::string& message) {
    if (logger) {
        logger->error(message);
        logger->flush();
    } else {
        std::cerr << "error: " << message << std::endl;
    }
}

} // namespace

int main(int argc, char** argv) {
    CliOptions cli;
    try {
        cli = parse_arguments(argc, argv);
    } catch (const ConfigError& e) {
        std::cerr << "error: " << e.what() << "\n\n";
        print_usage(argv[0]);
        return 1;
    }

    if (cli.show_help) {
        print_usage(argv[0]);
        return 0;
    }

    std::shared_ptr<spdlog::logger> logger;
    try {
        std::map<std::string, std::string> config;
        if (!cli.config_file.empty()) {
            config = load_config_file(cli.config_file);
        }
        for (const auto& [key, value] : cli.overrides) {
            config[key] = value;
        }

        std::string level = cli.log_level;
        if (level.empty()) {
            auto it = config.find("log_level");
            level = it != config.end() ? it->second : "info";
        }
        logger = make_logger(level, cli.log_file);
        spdlog::set_default_logger(logger);

        std::string seed_text = cli.seeds;
        if (seed_text.empty()) {
            auto it = config.find("seeds");
            seed_text = it != config.end() ? it->second : std::string();
        }
        auto seeds = DiscoveryEngine::parse_seed_list(seed_text);
        if (seeds.empty()) {
            throw ConfigError("no seed devices given (use --seed)");
        }

        auto credentials = CredentialStore::load_file(cli.creds_file);
        if (credentials.empty()) {
            throw ConfigError("credentials file " + cli.creds_file + " holds no credentials");
        }
        logger->info("Loaded {} credential(s) from {}", credentials.size(), cli.creds_file);

        OutputParser parser(logger);
        TemplateManager templates(logger);
        templates.load_directory(cli.templates_dir, parser);

        TcpReachabilityProbe probe(22, logger);
        SshConnectionClient client(SshClientOptions(), logger);
        DiscoveryEngine engine(probe, client, parser, logger);
        engine.configure(config);
        probe.set_port(engine.options().ssh_port);

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        RunControl control;
        control.should_stop = [] { return g_stop_requested.load(); };
        control.on_progress = [&logger](const ProgressEvent& event) {
            if (event.error == ErrorKind::NONE) {
                logger->info("[{}] {} (hop {})", to_string(event.status), event.device_id, event.hop);
            } else {
                logger->info("[{}] {} (hop {}, {})", to_string(event.status), event.device_id, event.hop,
                             to_string(event.error));
            }
        };

        auto result = engine.run(seeds, credentials, control);
        if (!save_result(result, cli.output_file, logger)) {
            return 1;
        }

        logger->info("Summary: {} device(s), {} visited, {} failed, {} unreachable, {} edge(s){}",
                     result.devices.size(),
                     result.count_with_status(DeviceStatus::VISITED),
                     result.count_with_status(DeviceStatus::FAILED),
                     result.count_with_status(DeviceStatus::UNREACHABLE),
                     result.edges.size(),
                     result.cancelled ? ", cancelled" : "");
        if (result.mapped_device_count() == 0) {
            logger->warn("No device could be mapped; check reachability and credentials");
        }
        return 0;
    } catch (const ConfigError& e) {
        report_error(logger, std::string("configuration error: ") + e.what());
    } catch (const TemplateLoadError& e) {
        report_error(logger, std::string("template error: ") + e.what());
    } catch (const spdlog::spdlog_ex& e) {
        report_error(nullptr, std::string("logging setup failed: ") + e.what());
    }
    return 1;
}
