#include "LedgerApp.hpp"
#include <iostream>
#include <csignal>

// Global pointer for signal handler
ledger::LedgerApp* g_app = nullptr;

void signalHandler(int signal) {
    if (g_app) {
        g_app->stop();
    }
    (void)signal;
}

int main(int argc, char* argv[]) {
    try {
        ledger::LedgerApp app;
        g_app = &app;

        // Signal handlers для graceful shutdown в Kubernetes
        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        std::cout << "========================================" << std::endl;
        std::cout << "  Ledger Service v1.0.0 Starting" << std::endl;
        std::cout << "  Press Ctrl+C to stop" << std::endl;
        std::cout << "========================================" << std::endl;

        // Template Method вызывает:
        // 1. loadEnvironment()
        // 2. configureInjection()
        // 3. serve() или разовую команду health / heal
        int code = app.run(argc, argv);

        g_app = nullptr;
        std::cout << "[main] Ledger Service stopped" << std::endl;
        return code;

    } catch (const std::exception& e) {
        std::cerr << "[main] Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
