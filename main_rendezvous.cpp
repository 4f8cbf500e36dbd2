/*
* @license
* (C) zachbabanov
*
*/

#include <peerlink/rendezvous_server.hpp>
#include <peerlink/logger.hpp>

#include <csignal>
#include <iostream>
#include <fstream>
#include <string>
#include <vector>

using namespace peerlink::log;
using namespace peerlink::rendezvous;

static RendezvousServer *g_server = nullptr;

static void on_signal(int) {
    if (g_server) g_server->requestStop();
}

static void print_usage(const char *prog) {
    std::cerr << "Usage: " << prog << " [--log <log_file>] [--log-level trace|debug|info|warn|error] [--ping-interval <sec>] [--idle-timeout <sec>] [tcp_port]\n";
    std::cerr << "Example: " << prog << " --log rendezvous.log --log-level info 8787\n";
}

int main(int argc, char **argv) {
    std::string log_file;
    std::string log_level_str;
    ServerConfig cfg;
    std::vector<std::string> pos;

    // parse flags, rest are positional
    for (int i = 1; i < argc; ++i) {
        std::string a(argv[i]);
        if (a == "--log") {
            if (i + 1 >= argc) { std::cerr << "--log requires a path\n"; return 1; }
            log_file = argv[++i];
        } else if (a == "--log-level") {
            if (i + 1 >= argc) { std::cerr << "--log-level requires a value\n"; return 1; }
            log_level_str = argv[++i];
        } else if (a == "--port" || a == "--ping-interval" || a == "--idle-timeout") {
            if (i + 1 >= argc) { std::cerr << a << " requires a value\n"; return 1; }
            std::string v(argv[++i]);
            int n = 0;
            try {
                n = std::stoi(v);
            } catch (const std::exception &) {
                std::cerr << "Invalid value for " << a << ": " << v << "\n";
                return 1;
            }
            if (a == "--port") pos.insert(pos.begin(), v);
            else if (a == "--ping-interval") cfg.pingInterval = std::chrono::seconds(n);
            else cfg.idleTimeout = std::chrono::seconds(n);
        } else if (a == "--help" || a == "-h") {
            print_usage(argv[0]);
            return 0;
        } else {
            pos.push_back(a);
        }
    }

    if (!pos.empty()) {
        try {
            cfg.port = std::stoi(pos[0]);
        } catch (const std::exception &) {
            std::cerr << "Invalid port: " << pos[0] << "\n";
            return 1;
        }
        if (cfg.port < 0 || cfg.port > 65535) {
            std::cerr << "Invalid port: " << pos[0] << "\n";
            return 1;
        }
    }
    if (cfg.idleTimeout <= cfg.pingInterval) {
        std::cerr << "--idle-timeout must be larger than --ping-interval\n";
        return 1;
    }

    Level desired_level = Level::INFO;
    if (!log_level_str.empty() && !parse_level(log_level_str, desired_level)) {
        std::cerr << "Warning: unknown log level '" << log_level_str << "', using default.\n";
        desired_level = Level::INFO;
    }
    Logger::instance().set_level(desired_level);

    // If user provided a log file, test opening it first for append/writability
    if (!log_file.empty()) {
        std::ofstream ofs(log_file.c_str(), std::ios::app);
        if (!ofs) {
            std::cerr << "Warning: could not open log file '" << log_file << "' for append, continuing without file logging\n";
        } else {
            ofs.close();
            Logger::instance().open_logfile(log_file);
        }
    }

    RendezvousServer srv(cfg);
    if (!srv.start()) {
        LOG_GEN_ERROR("Rendezvous server failed to start");
        return 1;
    }

    g_server = &srv;
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);
    std::signal(SIGPIPE, SIG_IGN);

    srv.runLoop();
    g_server = nullptr;
    LOG_GEN_INFO("Rendezvous server stopped");
    return 0;
}
