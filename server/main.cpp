// ============================================================
// server/main.cpp -- meshcp agent entry point
// ============================================================

#include "../common/platform.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include "../common/errors.hpp"
#include "agent_app.hpp"
#include <iostream>
#include <string>
#include <cstring>
#include <cstdlib>
#include <csignal>

static AgentApp* g_app = nullptr;

static void sig_handler(int /*sig*/) {
    if (g_app) g_app->stop();
}

static void print_usage(const char* prog) {
    std::cerr
        << "Usage: " << prog << " --url <agent_url> --catalog <catalog.json> [options]\n"
        << "\n"
        << "  --url URL        public URL of this agent, e.g. http://host:8989/meshcp\n"
        << "  --catalog FILE   catalog description {type, uri, login, password, owner}\n"
        << "\nOptions:\n"
        << "  --config FILE    agent configuration JSON (command line wins)\n"
        << "  --alias NAME     agent alias (default: T4_<host>_<uid>)\n"
        << "  --register URL   join the mesh through this agent\n"
        << "  --storage DIR    directory for received files (default: ./storage)\n"
        << "  --port N         listen port (default: 8989)\n"
        << "  --workers N      transfer workers (default: 4)\n"
        << "  --queue N        transfer queue size (default: 100)\n"
        << "  --interval N     metrics interval in seconds (default: 600)\n"
        << "  --log FILE       also write the log to FILE\n"
        << "  --transfer-log FILE  failed transfers (default: transfer_errors.log)\n"
        << "  --verbose        enable debug logging\n"
        << "\nExample:\n"
        << "  " << prog << " --url http://host1:8989/meshcp --catalog tfc.json\n"
        << "  " << prog << " --url http://host2:8989/meshcp --catalog tfc.json"
        << " --register http://host1:8989/meshcp\n";
}

int main(int argc, char* argv[]) {
    platform::init();

    AgentConfig cfg;
    bool verbose = false;

    // The config file is applied first so every other option overrides it
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            try {
                cfg.load_file(argv[++i]);
            } catch (const ConfigError& e) {
                std::cerr << "ERROR: " << e.what() << "\n";
                return 1;
            }
        }
    }

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            ++i;
        } else if (std::strcmp(argv[i], "--url") == 0 && i + 1 < argc) {
            cfg.url = argv[++i];
        } else if (std::strcmp(argv[i], "--alias") == 0 && i + 1 < argc) {
            cfg.name = argv[++i];
        } else if (std::strcmp(argv[i], "--register") == 0 && i + 1 < argc) {
            cfg.register_url = argv[++i];
        } else if (std::strcmp(argv[i], "--catalog") == 0 && i + 1 < argc) {
            cfg.catalog = argv[++i];
        } else if (std::strcmp(argv[i], "--storage") == 0 && i + 1 < argc) {
            cfg.storage = argv[++i];
        } else if (std::strcmp(argv[i], "--port") == 0 && i + 1 < argc) {
            int port_int = std::atoi(argv[++i]);
            if (!utils::validate_port(port_int)) {
                std::cerr << "ERROR: Invalid port: " << argv[i] << "\n";
                return 1;
            }
            cfg.port = (u16)port_int;
        } else if (std::strcmp(argv[i], "--workers") == 0 && i + 1 < argc) {
            cfg.workers = std::atoi(argv[++i]);
        } else if (std::strcmp(argv[i], "--queue") == 0 && i + 1 < argc) {
            cfg.queue_size = std::atoi(argv[++i]);
        } else if (std::strcmp(argv[i], "--interval") == 0 && i + 1 < argc) {
            cfg.minterval = std::atoi(argv[++i]);
        } else if (std::strcmp(argv[i], "--log") == 0 && i + 1 < argc) {
            cfg.logfile = argv[++i];
        } else if (std::strcmp(argv[i], "--transfer-log") == 0 && i + 1 < argc) {
            cfg.transfer_log = argv[++i];
        } else if (std::strcmp(argv[i], "--verbose") == 0) {
            verbose = true;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    try {
        cfg.finalize();
    } catch (const ConfigError& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        print_usage(argv[0]);
        return 1;
    }

    Logger::get().set_level(verbose ? LogLevel::DEBUG : LogLevel::INFO);
    if (!cfg.logfile.empty()) Logger::get().set_log_file(cfg.logfile);
    if (!cfg.transfer_log.empty()) Logger::get().set_transfer_log(cfg.transfer_log);

    try {
        AgentApp app(std::move(cfg));
        g_app = &app;

        std::signal(SIGINT,  sig_handler);
        std::signal(SIGTERM, sig_handler);

        int rc = app.run();
        g_app = nullptr;
        return rc;
    } catch (const std::exception& e) {
        g_app = nullptr;
        std::cerr << "FATAL: " << e.what() << "\n";
        return 2;
    }
}
