#include <csignal>
#include <chrono>
#include <iostream>
#include <memory>
#include <pthread.h>
#include <string>
#include <thread>
#include <vector>

// Core
#include "analysis/AddressClassifier.hpp"
#include "pipeline/ExtractionPipeline.hpp"

// Persistence
#include "store/SqliteResultStore.hpp"

// Service
#include "service/AppConfig.hpp"
#include "service/ExtractionJob.hpp"
#include "service/RunLoop.hpp"

// Utils
#include "utils/ConfigLoader.hpp"
#include "utils/Logger.hpp"
#include "utils/StringUtils.hpp"

// -------------------------
// CLI
// -------------------------
struct CliOptions
{
    std::string inputFile;
    std::string configFile = "config/ipsift.conf";
    std::string storeUri;
    std::string interval;
    bool verbose = false;
    bool once = false;
    bool show = false;
    bool help = false;
    std::vector<std::string> errors;
};

static CliOptions parseArgs(int argc, char *argv[])
{
    CliOptions opts;

    auto needValue = [&](int &i, const std::string &flag, std::string &target) {
        if (++i < argc)
            target = argv[i];
        else
            opts.errors.push_back(flag + " requires a value");
    };

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];

        if (arg == "--config" || arg == "-c")
        {
            needValue(i, arg, opts.configFile);
        }
        else if (arg == "--store")
        {
            needValue(i, arg, opts.storeUri);
        }
        else if (arg == "--interval")
        {
            needValue(i, arg, opts.interval);
        }
        else if (arg == "--verbose" || arg == "-v")
        {
            opts.verbose = true;
        }
        else if (arg == "--once")
        {
            opts.once = true;
        }
        else if (arg == "--show")
        {
            opts.show = true;
        }
        else if (arg == "--help" || arg == "-h")
        {
            opts.help = true;
        }
        else if (!arg.empty() && arg[0] != '-')
        {
            opts.inputFile = arg;
        }
        else
        {
            opts.errors.push_back("unknown option: " + arg);
        }
    }

    return opts;
}

static void printUsage(const char *progName)
{
    std::cout
        << "Usage: " << progName << " [OPTIONS] [input.log]\n\n"
        << "Periodically extracts IPv4 addresses from a log file and stores the\n"
        << "private and public sets.\n\n"
        << "OPTIONS:\n"
        << "  -c, --config FILE        Config file (default: config/ipsift.conf)\n"
        << "  --store URI              Store connection URI (overrides config)\n"
        << "  --interval SECONDS       Delay between cycles (overrides config)\n"
        << "  --once                   Run a single cycle and exit\n"
        << "  --show                   Print the stored collections and exit\n"
        << "  -v, --verbose            Verbose logging\n"
        << "  -h, --help               Show this help\n\n";
}

static int showCollections(const IpSift::Service::AppConfig &cfg)
{
    IpSift::Store::SqliteResultStore store(cfg.storeConnectionURI, cfg.databaseName);
    try
    {
        store.connect();
        for (const auto &name : {cfg.privateCollectionName, cfg.publicCollectionName})
        {
            const auto addresses = store.listAddresses(name);
            std::cout << name << " (" << addresses.size() << ")\n";
            for (const auto &a : addresses)
                std::cout << "  " << a << "\n";
        }
    }
    catch (const IpSift::Store::StoreError &e)
    {
        IpSift::Utils::getLogger().error(e.what());
        return 1;
    }
    return 0;
}

int main(int argc, char *argv[])
{
    const auto opts = parseArgs(argc, argv);

    if (opts.help)
    {
        printUsage(argv[0]);
        return 0;
    }
    if (!opts.errors.empty())
    {
        for (const auto &e : opts.errors)
            std::cerr << "Error: " << e << "\n";
        std::cerr << "\n";
        printUsage(argv[0]);
        return 2;
    }

    auto &logger = IpSift::Utils::getLogger();

    // Configuration: file, then environment, then command line.
    IpSift::Utils::ConfigLoader loader;
    if (!loader.loadFromFile(opts.configFile))
        logger.warn("Config file not found, using defaults: " + opts.configFile);
    loader.applyEnvironment(IpSift::Service::AppConfig::environmentOverrides());
    if (!opts.inputFile.empty())
        loader.set(IpSift::Service::ConfigKeys::FilePath, opts.inputFile);
    if (!opts.storeUri.empty())
        loader.set(IpSift::Service::ConfigKeys::StoreConnectionURI, opts.storeUri);
    if (!opts.interval.empty())
        loader.set(IpSift::Service::ConfigKeys::RunIntervalSeconds, opts.interval);

    std::vector<std::string> problems;
    const auto cfg = IpSift::Service::AppConfig::fromLoader(loader, &problems);
    for (auto &p : cfg.validate())
        problems.push_back(std::move(p));
    if (!problems.empty())
    {
        for (const auto &p : problems)
            logger.critical("Invalid configuration: " + p);
        return 2;
    }

    logger.setLevel(opts.verbose ? IpSift::Utils::LogLevel::DEBUG
                                 : *IpSift::Utils::parseLogLevel(cfg.logLevel));
    if (!cfg.logFile.empty() && !logger.setFile(cfg.logFile))
        logger.warn("Cannot open log file: " + cfg.logFile);

    if (opts.show)
        return showCollections(cfg);

    logger.info("Starting IP extraction service");
    logger.info("Input: " + cfg.filePath);
    logger.info("Store: " + cfg.storeConnectionURI + " (" + cfg.databaseName + ")");

    IpSift::Pipeline::PipelineOptions pipelineOptions;
    pipelineOptions.chunkSizeBytes = static_cast<std::size_t>(cfg.chunkSizeBytes);
    pipelineOptions.workerCount = static_cast<std::size_t>(cfg.workerCount);

    const IpSift::Pipeline::ExtractionPipeline pipeline(
        IpSift::Analysis::AddressClassifier::withDefaultRanges(), pipelineOptions);

    IpSift::Service::JobSettings settings;
    settings.filePath = cfg.filePath;
    settings.privateCollection = cfg.privateCollectionName;
    settings.publicCollection = cfg.publicCollectionName;

    IpSift::Service::ExtractionJob job(
        pipeline,
        [&cfg]() -> std::unique_ptr<IpSift::Store::ResultStore> {
            return std::make_unique<IpSift::Store::SqliteResultStore>(cfg.storeConnectionURI,
                                                                      cfg.databaseName);
        },
        settings);

    bool lastCycleOk = false;
    const auto cycle = [&]() { lastCycleOk = false; lastCycleOk = job.runOnce(); };

    IpSift::Service::RunLoop loop(std::chrono::seconds(cfg.runIntervalSeconds));

    if (opts.once)
    {
        const auto failures = loop.runCycles(1, cycle);
        return (failures == 0 && lastCycleOk) ? 0 : 1;
    }

    // SIGINT/SIGTERM are blocked in every thread and consumed by a dedicated
    // waiter, so stopping goes through the loop's mutex instead of a handler.
    sigset_t stopSignals;
    sigemptyset(&stopSignals);
    sigaddset(&stopSignals, SIGINT);
    sigaddset(&stopSignals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &stopSignals, nullptr);

    std::thread signalWaiter([&loop, &logger, stopSignals]() {
        int sig = 0;
        if (sigwait(&stopSignals, &sig) == 0)
            logger.info("Received signal " + std::to_string(sig) + ", stopping after current cycle");
        loop.requestStop();
    });

    // Returns only once the waiter has requested the stop.
    loop.runForever(cycle);
    signalWaiter.join();

    logger.info("IP extraction service stopped");
    return 0;
}
