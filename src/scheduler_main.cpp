#include "flagrun/config.h"
#include "flagrun/scheduler.h"

#include <atomic>
#include <csignal>
#include <iostream>
#include <thread>

using namespace flagrun;

namespace {

std::atomic<bool> g_stop{false};

void on_signal(int) {
    g_stop = true;
}

} // namespace

int main(int argc, char* argv[]) {
    SchedulerConfig config;
    try {
        config = SchedulerConfig::from_env();

        // Parse command line
        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];
            if (arg == "--port" && i + 1 < argc) {
                config.port = parse_int(argv[++i], "--port");
            } else {
                std::cerr << "Usage: " << argv[0] << " [--port N]" << std::endl;
                return 1;
            }
        }
    } catch (const ConfigError& e) {
        std::cerr << "❌ " << e.what() << std::endl;
        return 1;
    }

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    std::cout << "🏁 flagrun scheduler" << std::endl;
    std::cout << "------------------------------------------------" << std::endl;
    std::cout << "Broker: " << config.broker.host << ":" << config.broker.port
              << " vhost " << config.broker.vhost << std::endl;
    std::cout << "Queues: " << config.broker.task_queue << " -> " << config.broker.results_queue
              << std::endl;
    std::cout << "Execution timeout: " << config.execution_timeout_seconds << "s" << std::endl;
    std::cout << "------------------------------------------------" << std::endl;

    Scheduler scheduler(config);
    std::atomic<bool> failed{false};

    std::thread server_thread([&] {
        try {
            scheduler.run();
        } catch (const std::exception& e) {
            std::cerr << "❌ Scheduler failed: " << e.what() << std::endl;
            failed = true;
            g_stop = true;
        }
    });

    while (!g_stop) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cout << "[Scheduler] Shutting down" << std::endl;
    scheduler.stop();
    server_thread.join();
    return failed ? 1 : 0;
}
