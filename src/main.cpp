#include "GatewayApp.hpp"
#include <iostream>
#include <csignal>

// Global pointer for signal handler
GatewayApp* g_app = nullptr;

void signalHandler(int signal) {
    std::cout << "\n[main] Received signal " << signal << ", shutting down..." << std::endl;
    if (g_app) {
        g_app->stop();
    }
}

int main(int argc, char* argv[]) {
    try {
        GatewayApp app;
        g_app = &app;

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        std::cout << "========================================" << std::endl;
        std::cout << "  Session Gateway v1.0.0 Starting" << std::endl;
        std::cout << "========================================" << std::endl;

        app.run(argc, argv);

        g_app = nullptr;
        std::cout << "[main] Session Gateway stopped" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "[main] Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
