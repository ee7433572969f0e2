/**
 * BulkFetch - catalog downloader
 *
 * Main entry point. Reads the run settings from an optional JSON config
 * file and the command line, loads the catalog and downloads it.
 *
 * Exit status:
 *   0  run completed (per-file failures are listed in the failure report)
 *   1  invalid configuration or catalog source type
 *   2  catalog could not be loaded
 *   3  --strict was given and at least one file failed
 *   4  the failure report could not be written
 */

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

#include "core/Config.hpp"
#include "core/Logger.hpp"
#include "core/downloader/BatchScheduler.hpp"
#include "core/downloader/CatalogLoader.hpp"
#include "core/downloader/Errors.hpp"
#include "core/downloader/RunConfig.hpp"
#include "utils/HttpClient.hpp"
#include "utils/PathUtils.hpp"

namespace fs = std::filesystem;
namespace dl = bulkfetch::core::downloader;

namespace {

constexpr const char* kVersion = "1.0.0";

enum ExitCode {
    kExitOk = 0,
    kExitConfig = 1,
    kExitCatalog = 2,
    kExitFailures = 3,
    kExitReport = 4
};

/**
 * Command-line values; unset optionals keep the config file's value
 */
struct CommandLine {
    std::string sourceType;
    std::string catalog;
    std::optional<std::string> mainUrl;
    std::optional<std::string> version;
    std::optional<bool> multi;
    std::optional<int> connections;
    std::optional<int> maxFiles;
    std::optional<std::string> baseDir;
    std::string configPath;
    bool strict{false};
    bool debug{false};
    bool quiet{false};
};

void printUsage(const char* program) {
    std::cout << "BulkFetch - download and verify a catalog of files\n"
              << "\nUsage: " << program << " --source url|file --catalog <location>"
              << " --main-url <url> --version-name <name> [options]\n"
              << "\nOptions:\n"
              << "  --source <url|file>      Where the catalog JSON comes from\n"
              << "  --catalog <location>     Catalog URL or file path\n"
              << "  --main-url <url>         Base URL the catalog's dest paths are relative to\n"
              << "  --version-name <name>    Folder name under download/ and failed/\n"
              << "  --multi                  Split each file into several range requests\n"
              << "  --single                 Download each file over one connection\n"
              << "  --connections <n>        Range requests per file (with --multi)\n"
              << "  --max-files <n>          Files downloaded at the same time\n"
              << "  --base-dir <dir>         Root of download/, failed/ and logs/\n"
              << "  --config <file>          JSON settings file\n"
              << "  --strict                 Exit with status 3 when any file fails\n"
              << "  -d, --debug              Debug logging\n"
              << "  -q, --quiet              Only log warnings and errors\n"
              << "  -h, --help               Show this help message\n"
              << "  -v, --version            Show version information\n"
              << std::endl;
}

int parseCount(const std::string& flag, const std::string& value) {
    try {
        size_t consumed = 0;
        int parsed = std::stoi(value, &consumed);
        if (consumed != value.size()) {
            throw dl::ConfigError(flag + " expects an integer, got '" + value + "'");
        }
        return parsed;
    } catch (const std::logic_error&) {
        throw dl::ConfigError(flag + " expects an integer, got '" + value + "'");
    }
}

/**
 * Returns nullopt after --help/--version. Throws ConfigError on bad input.
 */
std::optional<CommandLine> parseCommandLine(int argc, char* argv[]) {
    CommandLine cli;

    auto value = [&](int& i, const std::string& flag) -> std::string {
        if (i + 1 >= argc) {
            throw dl::ConfigError(flag + " requires a value");
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);
        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return std::nullopt;
        } else if (arg == "--version" || arg == "-v") {
            std::cout << "BulkFetch v" << kVersion << std::endl;
            return std::nullopt;
        } else if (arg == "--source") {
            cli.sourceType = value(i, arg);
        } else if (arg == "--catalog") {
            cli.catalog = value(i, arg);
        } else if (arg == "--main-url") {
            cli.mainUrl = value(i, arg);
        } else if (arg == "--version-name") {
            cli.version = value(i, arg);
        } else if (arg == "--multi") {
            cli.multi = true;
        } else if (arg == "--single") {
            cli.multi = false;
        } else if (arg == "--connections") {
            cli.connections = parseCount(arg, value(i, arg));
        } else if (arg == "--max-files") {
            cli.maxFiles = parseCount(arg, value(i, arg));
        } else if (arg == "--base-dir") {
            cli.baseDir = value(i, arg);
        } else if (arg == "--config") {
            cli.configPath = value(i, arg);
        } else if (arg == "--strict") {
            cli.strict = true;
        } else if (arg == "--debug" || arg == "-d") {
            cli.debug = true;
        } else if (arg == "--quiet" || arg == "-q") {
            cli.quiet = true;
        } else {
            throw dl::ConfigError("unknown option " + arg);
        }
    }

    if (cli.sourceType.empty()) {
        throw dl::ConfigError("--source is required (url or file)");
    }
    if (cli.catalog.empty()) {
        throw dl::ConfigError("--catalog is required");
    }
    return cli;
}

dl::RunConfig buildRunConfig(const CommandLine& cli) {
    auto& config = bulkfetch::core::Config::instance();
    if (cli.baseDir) {
        config.set("paths.baseDir", *cli.baseDir);
    }

    dl::RunConfig run = dl::RunConfig::fromConfig(config);
    if (cli.mainUrl) run.mainUrl = *cli.mainUrl;
    if (cli.version) run.version = *cli.version;
    if (cli.multi) run.useMultiConnection = *cli.multi;
    if (cli.connections) run.numConnections = *cli.connections;
    if (cli.maxFiles) run.maxConcurrentFiles = *cli.maxFiles;
    return run;
}

void initializeLogging(const CommandLine& cli, const fs::path& baseDir) {
    auto& config = bulkfetch::core::Config::instance();
    using bulkfetch::core::LogLevel;

    LogLevel level = bulkfetch::core::Logger::parseLevel(config.get<std::string>("log.level", "info"));
    if (cli.debug) level = LogLevel::Debug;
    if (cli.quiet) level = LogLevel::Warn;

    std::string logDir = config.get<std::string>("log.directory", "");
    if (logDir.empty()) {
        logDir = bulkfetch::utils::PathUtils::getLogsPath(baseDir).string();
    }

    bulkfetch::core::Logger::instance().initialize(level, logDir);
}

} // namespace

/**
 * Main application entry point
 */
int main(int argc, char* argv[]) {
    std::optional<CommandLine> cli;
    try {
        cli = parseCommandLine(argc, argv);
    } catch (const dl::ConfigError& e) {
        std::cerr << "Error: " << e.what() << "\n\n";
        printUsage(argv[0]);
        return kExitConfig;
    }
    if (!cli) {
        return kExitOk;
    }

    auto& config = bulkfetch::core::Config::instance();
    if (!cli->configPath.empty() && !config.load(cli->configPath)) {
        std::cerr << "Error: cannot load configuration from " << cli->configPath << std::endl;
        return kExitConfig;
    }

    dl::RunConfig run;
    try {
        run = buildRunConfig(*cli);
    } catch (const fs::filesystem_error& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return kExitConfig;
    }

    initializeLogging(*cli, run.baseDir);
    auto& logger = bulkfetch::core::Logger::instance();
    logger.info("BulkFetch v{} starting", kVersion);

    try {
        run.validate();
    } catch (const dl::ConfigError& e) {
        logger.critical("Invalid configuration: {}", e.what());
        return kExitConfig;
    }

    bulkfetch::utils::HttpClient client(run.httpOptions());

    dl::Catalog catalog;
    try {
        dl::CatalogLoader loader(client, run.httpOptions());
        catalog = loader.load(cli->sourceType, cli->catalog);
    } catch (const dl::ConfigError& e) {
        logger.critical("Invalid input: {}", e.what());
        return kExitConfig;
    } catch (const dl::ManifestLoadError& e) {
        logger.critical("Cannot load catalog: {}", e.what());
        return kExitCatalog;
    }

    try {
        dl::BatchScheduler scheduler(client, run);
        dl::BatchReport report = scheduler.run(catalog);

        logger.info("{} of {} files ready ({} downloaded, {} already valid), {} failed",
                    report.succeeded + report.skipped, report.total,
                    report.succeeded, report.skipped, report.failed);
        logger.flush();

        if (cli->strict && !report.allSucceeded()) {
            return kExitFailures;
        }
        return kExitOk;

    } catch (const dl::ConfigError& e) {
        logger.critical("Invalid configuration: {}", e.what());
        return kExitConfig;
    } catch (const dl::LocalIOError& e) {
        logger.critical("Cannot write failure report: {}", e.what());
        return kExitReport;
    }
}
