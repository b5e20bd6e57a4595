#include <iostream>
#include <string>
#include <exception>
#include "config_parser.hpp"
#include "application.hpp"
#include "http_server.hpp"
#include "errors.hpp"
#include "logger.hpp"

using namespace flowapi;

namespace {

struct CLIArgs {
    std::string config_path = "flowapi-server.yaml";
    bool check = false;
    bool help = false;
};

void print_usage(const char* program_name) {
    std::cerr << "FlowAPI Server v1.0.0\n\n";
    std::cerr << "Usage: " << program_name << " [options]\n\n";
    std::cerr << "Options:\n";
    std::cerr << "  --config, -c <path>   YAML or JSON configuration file\n";
    std::cerr << "                        (default: flowapi-server.yaml)\n";
    std::cerr << "  --check               Load and compile the configuration, print the\n";
    std::cerr << "                        route table and exit\n";
    std::cerr << "  --help, -h            Show this help message\n\n";
    std::cerr << "Examples:\n\n";
    std::cerr << "  " << program_name << " --config examples/flowapi-server.yaml\n";
    std::cerr << "  " << program_name << " -c service.json --check\n";
}

bool parse_args(int argc, char* argv[], CLIArgs& args) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            args.help = true;
            return true;
        } else if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--check") {
            args.check = true;
        } else {
            std::cerr << "Error: Unknown or incomplete argument: " << arg << "\n\n";
            return false;
        }
    }
    return true;
}

HttpServerOptions server_options(const Application& app) {
    const ServerConfig& config = app.config();

    HttpServerOptions options;
    options.address = config.address;
    options.port = config.port;
    options.io_threads = config.threads;
    options.pipeline_workers = config.pipeline_workers;
    options.body_limit = app.routes().max_body_size();
    return options;
}

} // namespace

int main(int argc, char* argv[]) {
    CLIArgs args;

    if (!parse_args(argc, argv, args)) {
        print_usage(argv[0]);
        return 1;
    }

    if (args.help) {
        print_usage(argv[0]);
        return 0;
    }

    try {
        ServerConfig config = parse_server_config_from_file(args.config_path);
        configure_logging(config.log);

        Application app(config);

        if (args.check) {
            std::cout << "Configuration OK: " << args.config_path << "\n";
            std::cout << "Node types:\n";
            for (const auto& type : app.registry().list_types()) {
                std::cout << "  " << type << "\n";
            }
            std::cout << "Routes:\n";
            for (const auto& route : app.routes().list_routes()) {
                std::cout << "  " << route << "\n";
            }
            return 0;
        }

        HttpServer server(app.dispatcher(), server_options(app));
        server.run();

    } catch (const FlowApiError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        Logger::get_instance().log_error(LogContext(), e.what());
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Fatal: " << e.what() << "\n";
        Logger::get_instance().log_error(LogContext(), e.what());
        return 1;
    }

    return 0;
}
