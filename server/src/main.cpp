#include "FleetNetServer.h"
#include "Logger.h"
#include "ServerConfig.h"
#include <asio.hpp>
#include <algorithm>
#include <iostream>
#include <string>
#include <thread>
#include <vector>
#include <csignal>

// Re-register after each delivery so a second Ctrl+C during drain is still
// handled here instead of by the default OS handler.
static void ArmSignals(asio::signal_set& signals, asio::io_context& io_context, FleetNet::FleetNetServer& server) {
    signals.async_wait([&signals, &io_context, &server](const std::error_code& ec, int signo) {
        if (ec) return;
        FleetNet::ControlTrace::log("step=server_shutdown status=graceful signal="
            + std::to_string(signo));
        server.Stop();
        io_context.stop();
        ArmSignals(signals, io_context, server);
        });
}

int main(int argc, char* argv[]) {
    FleetNet::ServerConfig config;
    if (argc > 1) {
        std::string error;
        if (!config.LoadFromFile(argv[1], error)) {
            std::cerr << "Invalid configuration " << argv[1] << ": " << error << "\n";
            return 2;
        }
    }

    try {
        FleetNet::ControlTrace::init(config.traceFile, config.traceEnabled);
        asio::io_context io_context;
        FleetNet::FleetNetServer server(io_context, config);

        asio::signal_set signals(io_context, SIGINT, SIGTERM);
        ArmSignals(signals, io_context, server);

        // The control plane is I/O-bound; more threads than this only add
        // contention on the directory lock.
        unsigned int thread_count = std::thread::hardware_concurrency();
        if (thread_count == 0) thread_count = 4;
        thread_count = std::min(thread_count, config.maxThreads);

        std::cout << "FleetNet Server " << config.serverVersion
            << " control on " << config.controlPort
            << ", voice on " << config.voicePort
            << " with " << thread_count << " threads...\n";

        std::vector<std::thread> threads;
        threads.reserve(thread_count);
        for (unsigned int i = 0; i < thread_count; ++i)
            threads.emplace_back([&io_context] { io_context.run(); });
        for (auto& t : threads) t.join();
    }
    catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        FleetNet::ControlTrace::shutdown();
        return 1;
    }
    FleetNet::ControlTrace::shutdown();
    return 0;
}
