// ============================================================
// client/main.cpp -- meshcp client entry point
// ============================================================

#include "../common/platform.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include "client_app.hpp"
#include <iostream>
#include <string>
#include <cstdlib>
#include <cstring>
#include <csignal>

static ClientApp* g_app = nullptr;

static void sig_handler(int /*sig*/) {
    if (g_app) g_app->stop();
}

static void print_usage(const char* prog) {
    std::cerr
        << "Usage: " << prog << " --agent <url> <command> [options]\n"
        << "\nCommands:\n"
        << "  status [--job N]       agent identity, dispatcher load, recent jobs\n"
        << "  agents                 mesh membership table\n"
        << "  files | tfc            catalog query (LFNs or full records)\n"
        << "  dump                   catalog dump\n"
        << "  request --src ALIAS    ask the agent (or --dst ALIAS) to fetch files\n"
        << "  add FILE.json          register catalog entries\n"
        << "  upload FILE            push a local file into the agent\n"
        << "  protocol --protocol P  register the backend transfer tool\n"
        << "\nOptions:\n"
        << "  --dataset D --block B --lfn L   catalog filter / upload identity\n"
        << "  --backend B --tool T --toolopts O   protocol details\n"
        << "  --timeout MS    per-call timeout (default: 10000)\n"
        << "  --retry N       seconds to retry while the agent is down or busy (default: 30)\n"
        << "  --verbose       enable debug logging\n"
        << "\nExamples:\n"
        << "  " << prog << " --agent http://host1:8989/meshcp status\n"
        << "  " << prog << " --agent http://host2:8989/meshcp request --src T1_A --dataset /a/b/c\n"
        << "  " << prog << " --agent http://host1:8989/meshcp upload a.txt"
        << " --lfn /store/a.txt --dataset /a/b/c --block /a/b/c#1\n";
}

int main(int argc, char* argv[]) {
    platform::init();

    ClientOptions opts;
    bool verbose = false;

    for (int i = 1; i < argc; ++i) {
        const char* a = argv[i];
        bool has_value = i + 1 < argc;
        if (std::strcmp(a, "--agent") == 0 && has_value) {
            opts.agent = argv[++i];
        } else if (std::strcmp(a, "--dataset") == 0 && has_value) {
            opts.dataset = argv[++i];
        } else if (std::strcmp(a, "--block") == 0 && has_value) {
            opts.block = argv[++i];
        } else if (std::strcmp(a, "--lfn") == 0 && has_value) {
            opts.lfn = argv[++i];
        } else if (std::strcmp(a, "--src") == 0 && has_value) {
            opts.src_alias = argv[++i];
        } else if (std::strcmp(a, "--dst") == 0 && has_value) {
            opts.dst_alias = argv[++i];
        } else if (std::strcmp(a, "--job") == 0 && has_value) {
            opts.job = argv[++i];
        } else if (std::strcmp(a, "--protocol") == 0 && has_value) {
            opts.protocol.protocol = argv[++i];
        } else if (std::strcmp(a, "--backend") == 0 && has_value) {
            opts.protocol.backend = argv[++i];
        } else if (std::strcmp(a, "--tool") == 0 && has_value) {
            opts.protocol.tool = argv[++i];
        } else if (std::strcmp(a, "--toolopts") == 0 && has_value) {
            opts.protocol.tool_opts = argv[++i];
        } else if (std::strcmp(a, "--timeout") == 0 && has_value) {
            opts.timeout_ms = std::atoi(argv[++i]);
        } else if (std::strcmp(a, "--retry") == 0 && has_value) {
            opts.retry_secs = std::atoi(argv[++i]);
        } else if (std::strcmp(a, "--verbose") == 0) {
            verbose = true;
        } else if (a[0] == '-') {
            std::cerr << "Unknown option: " << a << "\n";
            print_usage(argv[0]);
            return 1;
        } else if (opts.command.empty()) {
            opts.command = a;
        } else if (opts.path.empty()) {
            opts.path = a;
        } else {
            std::cerr << "Unexpected argument: " << a << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (opts.agent.empty() || opts.command.empty()) {
        print_usage(argv[0]);
        return 1;
    }
    try {
        utils::parse_url(opts.agent);
    } catch (const std::invalid_argument& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 1;
    }
    if ((opts.command == "add" || opts.command == "upload") && !utils::validate_path(opts.path)) {
        std::cerr << "ERROR: " << opts.command << " needs a local file\n";
        return 1;
    }
    if (opts.timeout_ms < 100) {
        std::cerr << "ERROR: --timeout must be at least 100 ms\n";
        return 1;
    }

    Logger::get().set_level(verbose ? LogLevel::DEBUG : LogLevel::INFO);

    try {
        ClientApp app(std::move(opts));
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
