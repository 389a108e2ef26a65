#include "Application.hpp"

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iostream>

namespace {

std::atomic<bool> g_running(true);

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_running = false;  // Only set flag, cleanup happens in main()
    }
}

} // namespace

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        ncf::Application app(argc, argv);
        if (app.exitRequested()) {
            return EXIT_SUCCESS;
        }

        app.initialize();
        int rc = app.run(g_running);
        app.shutdown();
        return rc;

    } catch (const ncf::ConfigError& e) {
        NCF_LOG_FATAL("Configuration error: " << e.what());
        return EXIT_FAILURE;
    } catch (const std::exception& e) {
        NCF_LOG_FATAL("Fatal error: " << e.what());
        return EXIT_FAILURE;
    }
}
