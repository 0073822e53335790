#include "core/main_system.h"
#include "common/logger.h"
#include <cstring>
#include <iostream>

namespace {

void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " <feed_sources_file> [options]\n"
              << "  --single-source     show one feed as-is instead of fusing\n"
              << "  --log <file>        also write the log to <file>\n"
              << "  --debug             log debug messages\n";
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    skyview::AppConfig config;
    for (int i = 2; i < argc; ++i) {
        if (std::strcmp(argv[i], "--single-source") == 0) {
            config.fusion_mode = skyview::FusionMode::SINGLE_SOURCE;
        } else if (std::strcmp(argv[i], "--log") == 0 && i + 1 < argc) {
            skyview::Logger::getInstance().setLogFile(argv[++i]);
        } else if (std::strcmp(argv[i], "--debug") == 0) {
            skyview::Logger::getInstance().setMinimumLevel(skyview::LogLevel::DEBUG);
        } else {
            printUsage(argv[0]);
            return 1;
        }
    }

    try {
        skyview::MainSystem system(config);

        // Sources must be known before initialize() creates the feeds
        if (!system.loadFeedSources(argv[1])) {
            std::cerr << "Failed to load feed sources" << std::endl;
            return 1;
        }

        if (!system.initialize()) {
            std::cerr << "System initialization failed" << std::endl;
            return 1;
        }

        system.run();
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
