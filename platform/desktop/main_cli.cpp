#include "PahoMqttClient.hpp"
#include "CurlGeocodingClient.hpp"
#include "IClock.hpp"
#include "JsonCodec.hpp"
#include "Log.hpp"
#include "TomlConfig.hpp"
#include "Timeframe.hpp"
#include "adapters/DefaultPolicies.hpp"
#include "adapters/InMemoryCacheStore.hpp"
#include "adapters/InMemoryTrackingRepository.hpp"
#include "adapters/InMemoryUserDirectory.hpp"
#include "adapters/MqttIngestAdapter.hpp"
#include "domain/AddressResolutionStage.hpp"
#include "domain/EventBus.hpp"
#include "domain/GeocodeResolver.hpp"
#include "domain/IngestionPipeline.hpp"
#include "domain/TrackingService.hpp"
#include <iostream>
#include <fstream>
#include <filesystem>
#include <optional>
#include <thread>
#include <chrono>
#include <signal.h>

using namespace triplog;

/// Global flag for graceful shutdown of the listener loop
static volatile bool g_running = true;

void signalHandler(int signal) {
    (void)signal;
    g_running = false;
}

void printUsage(const char* programName) {
    std::cout << "Usage: " << programName << " [options]\n"
              << "Options:\n"
              << "  --config <file>          Configuration file (default: triplog.toml if present)\n"
              << "  --users <file>           User directory JSON array\n"
              << "  --ingest <file>          Ingest JSON-lines location samples\n"
              << "  --backfill [limit]       Resolve addresses of unresolved points\n"
              << "  --report <owner>         Print a tracking report\n"
              << "  --timeframe <name>       today, yesterday, this_week, last_week,\n"
              << "                           this_month, last_month or custom\n"
              << "  --start <YYYY-MM-DD>     Custom range start\n"
              << "  --end <YYYY-MM-DD>       Custom range end\n"
              << "  --daily <owner> <date>   Print the daily report for one UTC date\n"
              << "  --listen                 Ingest samples from MQTT until interrupted\n"
              << "  --log-level <level>      debug, info, warn, error or off\n"
              << "  --help                   Show this help message\n"
              << "\nEnvironment: GOOGLE_MAPS_API_KEY, GOOGLE_MAPS_CLIENT_SECRET,\n"
              << "             MQTT_HOST, MQTT_PORT, TRIPLOG_LOG_LEVEL\n"
              << std::endl;
}

struct CliOptions {
    std::string configFile;
    std::string usersFile;
    std::string ingestFile;
    std::optional<size_t> backfillLimit;
    bool backfill = false;
    std::optional<OwnerId> reportOwner;
    std::string timeframe = "today";
    std::string startDate;
    std::string endDate;
    std::optional<OwnerId> dailyOwner;
    std::string dailyDate;
    bool listen = false;
    std::string logLevel;
};

static bool hasValue(int i, int argc, char* argv[]) {
    return i + 1 < argc && argv[i + 1][0] != '-';
}

static OwnerId parseOwner(const std::string& text) {
    size_t used = 0;
    long long id = std::stoll(text, &used);
    if (used != text.size()) {
        throw std::invalid_argument("Invalid owner id: " + text);
    }
    return static_cast<OwnerId>(id);
}

static TimePoint parseDateArg(const std::string& text) {
    auto parsed = parseIso8601(text);
    if (!parsed) {
        throw std::invalid_argument("Invalid date: " + text);
    }
    return *parsed;
}

static void printResult(const domain::ReportResult& result) {
    if (!result.success) {
        std::cerr << "Error: " << result.message << std::endl;
        return;
    }
    std::cout << result.data.dump(2) << std::endl;
}

static size_t ingestFile(const std::string& path, domain::IngestionPipeline& pipeline) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open ingest file: " + path);
    }

    size_t stored = 0;
    size_t lineNumber = 0;
    std::string line;
    while (std::getline(file, line)) {
        ++lineNumber;
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }
        IngestResult result = pipeline.ingestJson(line);
        if (result.stored) {
            ++stored;
        }
        std::cout << lineNumber << ": " << JsonCodec::serialize(result) << std::endl;
    }
    return stored;
}

int main(int argc, char* argv[]) {
    signal(SIGINT, signalHandler);
    signal(SIGTERM, signalHandler);

    CliOptions options;
    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "--help") {
                printUsage(argv[0]);
                return 0;
            } else if (arg == "--config" && hasValue(i, argc, argv)) {
                options.configFile = argv[++i];
            } else if (arg == "--users" && hasValue(i, argc, argv)) {
                options.usersFile = argv[++i];
            } else if (arg == "--ingest" && hasValue(i, argc, argv)) {
                options.ingestFile = argv[++i];
            } else if (arg == "--backfill") {
                options.backfill = true;
                if (hasValue(i, argc, argv)) {
                    options.backfillLimit = static_cast<size_t>(std::stoul(argv[++i]));
                }
            } else if (arg == "--report" && hasValue(i, argc, argv)) {
                options.reportOwner = parseOwner(argv[++i]);
            } else if (arg == "--timeframe" && hasValue(i, argc, argv)) {
                options.timeframe = argv[++i];
            } else if (arg == "--start" && hasValue(i, argc, argv)) {
                options.startDate = argv[++i];
            } else if (arg == "--end" && hasValue(i, argc, argv)) {
                options.endDate = argv[++i];
            } else if (arg == "--daily" && i + 2 < argc) {
                options.dailyOwner = parseOwner(argv[++i]);
                options.dailyDate = argv[++i];
            } else if (arg == "--listen") {
                options.listen = true;
            } else if (arg == "--log-level" && hasValue(i, argc, argv)) {
                options.logLevel = argv[++i];
            } else {
                std::cerr << "Unknown or incomplete option: " << arg << std::endl;
                printUsage(argv[0]);
                return 1;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    EngineConfig config;
    try {
        if (!options.configFile.empty()) {
            config = TomlConfig::loadFromFile(options.configFile);
        } else if (std::filesystem::exists("triplog.toml")) {
            config = TomlConfig::loadFromFile("triplog.toml");
        }
        TomlConfig::applyEnvironment(config);
    } catch (const std::exception& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 1;
    }

    LogLevel level = LogLevel::Info;
    const std::string levelText = options.logLevel.empty() ? config.logLevel : options.logLevel;
    if (!Log::parseLevel(levelText, level)) {
        std::cerr << "Unknown log level: " << levelText << std::endl;
        return 1;
    }
    Log::setLevel(level);

    if (config.geocoding.apiKey.empty()) {
        Log::warn("CLI", "GOOGLE_MAPS_API_KEY not set, addresses will use coordinate fallbacks");
    }

    try {
        auto clock = std::make_shared<SystemClock>();
        auto cache = std::make_shared<adapters::InMemoryCacheStore>(clock);
        auto repository = std::make_shared<adapters::InMemoryTrackingRepository>();
        auto directory = options.usersFile.empty()
                             ? std::make_shared<adapters::InMemoryUserDirectory>()
                             : adapters::InMemoryUserDirectory::loadFromFile(options.usersFile);
        auto eventBus = std::make_shared<domain::EventBus>();
        auto policies = std::make_shared<adapters::DefaultPolicyEngine>(config.geocoding);
        auto geocoder = std::make_shared<CurlGeocodingClient>(config.geocoding);

        auto resolver = std::make_shared<domain::GeocodeResolver>(geocoder, cache, policies, clock, config.geocoding);
        auto pipeline = std::make_shared<domain::IngestionPipeline>(repository, directory, cache, eventBus, clock, config);
        domain::AddressResolutionStage addressStage(repository, resolver, eventBus, cache);
        domain::TrackingService service(repository, directory, cache, resolver, clock, config);

        addressStage.start();

        if (!options.ingestFile.empty()) {
            size_t stored = ingestFile(options.ingestFile, *pipeline);
            eventBus->processEvents();
            BackfillSummary summary = addressStage.processPending();
            Log::info("CLI", "Stored " + std::to_string(stored) + " samples, resolved " +
                      std::to_string(summary.resolvedPoints) + " addresses");
        }

        if (options.backfill) {
            printResult(service.bulkBackfill(std::nullopt, options.backfillLimit.value_or(config.geocoding.bulkLimit)));
        }

        if (options.reportOwner) {
            auto timeframe = stringToTimeframe(options.timeframe);
            if (!timeframe) {
                std::cerr << "Unknown timeframe: " << options.timeframe << std::endl;
                return 1;
            }
            TrackingQuery query;
            query.timeframe = *timeframe;
            if (!options.startDate.empty()) query.startDate = parseDateArg(options.startDate);
            if (!options.endDate.empty()) query.endDate = parseDateArg(options.endDate);
            printResult(service.getTrackingReport(*options.reportOwner, query));
        }

        if (options.dailyOwner) {
            printResult(service.getDailyTracking(*options.dailyOwner, parseDateArg(options.dailyDate)));
        }

        if (options.listen) {
            auto mqttClient = std::make_shared<PahoMqttClient>();
            adapters::MqttIngestAdapter listener(mqttClient, pipeline, config.mqtt);
            if (!listener.start()) {
                return 1;
            }

            Log::info("CLI", "Listening on " + config.mqtt.topicFilter + ". Press Ctrl+C to stop.");
            while (g_running) {
                eventBus->processEvents();
                addressStage.processPending();
                std::this_thread::sleep_for(std::chrono::milliseconds(1000));
            }

            Log::info("CLI", "Stopping listener after " + std::to_string(listener.receivedCount()) + " messages");
            listener.stop();
            eventBus->processEvents();
            addressStage.processPending();
        }

        addressStage.stop();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
