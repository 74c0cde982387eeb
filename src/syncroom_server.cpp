/**
 * @file syncroom_server.cpp
 * @brief Standalone entry point for the room synchronization server.
 * @details Runs a RoomServer without the Python layer. Log entries are echoed to stderr because
 *          nothing drains the in-process log queue here.
 */
#include "sync_engine/server/room_server.h"
#include "sync_engine/configuration/settings_loader.h"
#include "sync_engine/utils/cpp_logger.h"

#include <getopt.h>

#include <atomic>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <string>

using namespace syncroom::engine;

namespace {

std::atomic<bool> g_stop_requested{false};

void signal_handler(int) {
    g_stop_requested = true;
}

void print_usage(const char* argv0) {
    std::fprintf(stderr,
                 "Usage: %s [--port N] [--bind ADDR] [--settings FILE] [--verbose]\n"
                 "  -p, --port N         WebSocket port (default 8080)\n"
                 "  -b, --bind ADDR      Address to bind (default: all interfaces)\n"
                 "  -s, --settings FILE  JSON settings overrides\n"
                 "  -v, --verbose        Log at DEBUG level\n"
                 "  -h, --help           Show this help\n",
                 argv0);
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    int port = 8080;
    std::string bind_address;
    std::string settings_path;
    bool verbose = false;

    static const struct option long_options[] = {
        {"port", required_argument, nullptr, 'p'},
        {"bind", required_argument, nullptr, 'b'},
        {"settings", required_argument, nullptr, 's'},
        {"verbose", no_argument, nullptr, 'v'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0}
    };

    int opt;
    while ((opt = getopt_long(argc, argv, "p:b:s:vh", long_options, nullptr)) != -1) {
        switch (opt) {
            case 'p': {
                char* end = nullptr;
                long value = std::strtol(optarg, &end, 10);
                if (!end || *end != '\0' || value < 0 || value > 65535) {
                    std::fprintf(stderr, "Invalid port: %s\n", optarg);
                    return 1;
                }
                port = static_cast<int>(value);
                break;
            }
            case 'b':
                bind_address = optarg;
                break;
            case 's':
                settings_path = optarg;
                break;
            case 'v':
                verbose = true;
                break;
            case 'h':
                print_usage(argv[0]);
                return 0;
            default:
                print_usage(argv[0]);
                return 1;
        }
    }

    logging::set_cpp_log_console_echo(true);
    logging::set_cpp_log_level(verbose ? logging::LogLevel::DEBUG : logging::LogLevel::INFO);

    std::shared_ptr<SyncEngineSettings> settings;
    if (!settings_path.empty()) {
        settings = config::load_settings_file(settings_path);
        if (!settings) {
            return 1;
        }
    } else {
        settings = std::make_shared<SyncEngineSettings>();
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    std::signal(SIGPIPE, SIG_IGN);

    RoomServer server(settings);
    if (!server.initialize(port, bind_address)) {
        LOG_CPP_ERROR("Failed to start room server.");
        logging::shutdown_cpp_logger();
        return 1;
    }

    // Entries are already echoed; drain the queue so it does not fill with stale entries.
    while (!g_stop_requested) {
        logging::retrieve_log_entries(200);
    }

    LOG_CPP_INFO("Stop requested, shutting down.");
    server.shutdown();
    logging::shutdown_cpp_logger();
    return 0;
}
