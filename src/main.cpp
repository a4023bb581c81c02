/**
 * docfetch - resilient document downloader
 *
 * Command-line entry point around DownloadEngine.
 *
 * @version 1.0.0
 */

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "core/CancellationToken.hpp"
#include "core/Config.hpp"
#include "core/Logger.hpp"
#include "core/downloader/DownloadEngine.hpp"
#include "core/downloader/HttpTransport.hpp"
#include "utils/FileUtils.hpp"
#include "utils/HttpClient.hpp"
#include "utils/StringUtils.hpp"

namespace fs = std::filesystem;

using docfetch::core::CancellationToken;
using docfetch::core::Config;
using docfetch::core::Logger;
using docfetch::utils::StringUtils;
namespace downloader = docfetch::core::downloader;

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

// Written from the signal handler, read by the watcher thread
volatile std::sig_atomic_t g_signalReceived = 0;

void signalHandler(int signal) {
    g_signalReceived = signal;
}

/**
 * Setup signal handlers for cancellation
 */
void setupSignalHandlers() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
}

void printUsage(const char* program) {
    std::cerr << "docfetch - resilient document downloader\n"
              << "\nUsage: " << program << " <url> <destination-dir> [options]\n"
              << "\nOptions:\n"
              << "  --filename NAME    Name of the saved file (default: from URL)\n"
              << "  --retries N        Retries after the first attempt, 0-10 (default: 3)\n"
              << "  --delay SECONDS    Base retry delay, 0.1-60 (default: 5)\n"
              << "  --timeout SECONDS  Per-attempt timeout, 5-300 (default: 30)\n"
              << "  --sha256 HEX       Expected SHA-256 of the file\n"
              << "  --json             Print the result as JSON\n"
              << "  -d, --debug        Enable debug logging\n"
              << "  -h, --help         Show this help message\n"
              << "  -v, --version      Show version information\n"
              << std::endl;
}

struct CommandLine {
    downloader::DownloadRequest request;
    bool json{false};
    bool debug{false};
    bool help{false};
    bool version{false};
};

/**
 * Parse argv; returns false with a message on usage errors
 */
bool parseCommandLine(int argc, char* argv[], CommandLine& cli, std::string& error) {
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);

        auto nextValue = [&](std::string& out) {
            if (i + 1 >= argc) {
                error = "Missing value for " + arg;
                return false;
            }
            out = argv[++i];
            return true;
        };

        if (arg == "--help" || arg == "-h") {
            cli.help = true;
        } else if (arg == "--version" || arg == "-v") {
            cli.version = true;
        } else if (arg == "--debug" || arg == "-d") {
            cli.debug = true;
        } else if (arg == "--json") {
            cli.json = true;
        } else if (arg == "--filename" || arg == "--sha256") {
            std::string value;
            if (!nextValue(value)) return false;
            if (arg == "--filename") {
                cli.request.filename = value;
            } else {
                cli.request.expectedSha256 = value;
            }
        } else if (arg == "--retries") {
            std::string value;
            if (!nextValue(value)) return false;
            auto parsed = StringUtils::parseLong(value);
            if (!parsed) {
                error = "Invalid retry count: " + value;
                return false;
            }
            cli.request.maxRetries = static_cast<int>(*parsed);
        } else if (arg == "--delay" || arg == "--timeout") {
            std::string value;
            if (!nextValue(value)) return false;
            auto parsed = StringUtils::parseDouble(value);
            if (!parsed) {
                error = "Invalid number for " + arg + ": " + value;
                return false;
            }
            if (arg == "--delay") {
                cli.request.baseRetryDelaySeconds = *parsed;
            } else {
                cli.request.timeoutSeconds = *parsed;
            }
        } else if (StringUtils::startsWith(arg, "-") && arg.size() > 1) {
            error = "Unknown option: " + arg;
            return false;
        } else {
            positional.push_back(arg);
        }
    }

    if (cli.help || cli.version) {
        return true;
    }
    if (positional.size() != 2) {
        error = "Expected <url> and <destination-dir>";
        return false;
    }

    cli.request.url = positional[0];
    cli.request.destinationDirectory = positional[1];
    return true;
}

/**
 * Load defaults, the optional DOCFETCH_CONFIG file and environment overrides
 */
void loadConfiguration() {
    auto& config = Config::instance();
    config.setDefaults();

    if (const char* path = std::getenv("DOCFETCH_CONFIG"); path && *path) {
        if (!config.load(path)) {
            std::cerr << "Warning: could not read configuration file " << path << std::endl;
        }
    }

    config.loadEnvironment();
}

} // namespace

/**
 * Main application entry point
 */
int main(int argc, char* argv[]) {
    CommandLine cli;
    std::string usageError;
    if (!parseCommandLine(argc, argv, cli, usageError)) {
        std::cerr << "Error: " << usageError << "\n\n";
        printUsage(argv[0]);
        return kExitUsage;
    }
    if (cli.help) {
        printUsage(argv[0]);
        return kExitSuccess;
    }
    if (cli.version) {
        std::cout << "docfetch v1.0.0" << std::endl;
        return kExitSuccess;
    }

    loadConfiguration();
    auto& config = Config::instance();

    // Initialize logger
    auto level = Logger::parseLevel(config.get<std::string>("logging.level", "info"));
    if (cli.debug) {
        level = docfetch::core::LogLevel::Debug;
    }
    Logger::instance().initialize(level, config.get<std::string>("logging.directory", ""));
    auto& logger = Logger::instance();

    docfetch::utils::CurlGlobalInit::init();

    fs::path destination(cli.request.destinationDirectory);
    if (!docfetch::utils::FileUtils::directoryExists(destination)) {
        if (!docfetch::utils::FileUtils::createDirectories(destination)) {
            logger.warn("Could not create directory: {}", destination.string());
        } else {
            logger.debug("Created directory: {}", destination.string());
        }
    }

    CancellationToken token;
    setupSignalHandlers();

    std::atomic<bool> finished{false};
    std::thread watcher([&] {
        while (!finished.load()) {
            if (g_signalReceived != 0) {
                logger.warn("Received signal {}, cancelling download...", static_cast<int>(g_signalReceived));
                token.cancel();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });

    downloader::DownloadEngine engine(
        std::make_shared<downloader::HttpTransport>(),
        downloader::EngineSettings::fromConfig(config));

    downloader::DownloadOutcome outcome = engine.run(cli.request, token);

    finished = true;
    watcher.join();

    if (cli.json) {
        std::cout << outcome.toJson().dump(2) << std::endl;
    } else {
        std::cout << outcome.summary() << std::endl;
    }

    logger.flush();
    return outcome.success ? kExitSuccess : kExitFailure;
}
