#include "flagrun/config.h"
#include "flagrun/feeder.h"
#include "flagrun/piston_client.h"

#include <atomic>
#include <csignal>
#include <iostream>

using namespace flagrun;

namespace {

std::atomic<bool> g_stop{false};

void on_signal(int) {
    g_stop = true;
}

} // namespace

int main(int argc, char* argv[]) {
    FeederConfig config;
    try {
        config = FeederConfig::from_env();

        // Parse command line
        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];
            if (arg == "--piston-url" && i + 1 < argc) {
                config.piston_url = argv[++i];
            } else if (arg == "--prefetch" && i + 1 < argc) {
                config.prefetch_count = parse_int(argv[++i], "--prefetch");
            } else {
                std::cerr << "Usage: " << argv[0] << " [--piston-url URL] [--prefetch N]" << std::endl;
                return 1;
            }
        }
        if (config.prefetch_count <= 0 || config.prefetch_count > 65535) {
            throw ConfigError("--prefetch must be between 1 and 65535");
        }
    } catch (const ConfigError& e) {
        std::cerr << "❌ " << e.what() << std::endl;
        return 1;
    }

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    std::cout << "⚙️  flagrun feeder" << std::endl;
    std::cout << "------------------------------------------------" << std::endl;
    std::cout << "Execution engine: " << config.piston_url << std::endl;
    std::cout << "Broker: " << config.broker.host << ":" << config.broker.port
              << " vhost " << config.broker.vhost << std::endl;
    std::cout << "Prefetch: " << config.prefetch_count << std::endl;
    std::cout << "------------------------------------------------" << std::endl;

    try {
        PistonClient engine(config.piston_url);
        RuntimeRegistry runtimes = load_runtimes(engine, config.runtime_fetch_attempts);

        ExecutionDefaults defaults;
        defaults.memory_limit_mb = config.default_memory_limit_mb;
        defaults.compile_timeout_ms = config.default_compile_timeout_ms;
        defaults.run_timeout_ms = config.default_run_timeout_ms;
        TaskProcessor processor(engine, runtimes, defaults);

        Feeder feeder(config, processor);
        int code = feeder.run(g_stop);
        std::cout << "[Feeder] Stopped" << std::endl;
        return code;
    } catch (const std::exception& e) {
        std::cerr << "❌ Feeder failed: " << e.what() << std::endl;
        return 1;
    }
}
