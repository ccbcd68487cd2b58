#include <memory>
#include <string>
#include <vector>
#include <iostream>
#include <csignal>
#include <thread>
#include <atomic>
#include <chrono>
#include <cerrno>
#include <cstdlib>
#include "streamstats/common/logger.h"
#include <spdlog/spdlog.h>
#include "streamstats/api/control_api.h"
#include "streamstats/collector/endpoint_tester.h"
#include "streamstats/collector/stream_collector.h"
#include "streamstats/core/config.h"
#include "streamstats/core/duration.h"
#include "streamstats/distribution/distribution.h"
#include "streamstats/endpoints/endpoint_registry.h"
#include "streamstats/endpoints/endpoint_spec.h"
#include "streamstats/server/http_server.h"
#include "streamstats/sink/sample_sink.h"
#include "streamstats/stream/tcp_stream.h"

// Global flag for shutdown
std::atomic<bool> g_running(true);

void SignalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_running.store(false);
    }
}

namespace streamstats {

struct Options {
    core::CollectorConfig collector;
    core::SinkConfig sink;
    server::ServerConfig server;
    std::vector<std::string> endpoint_specs;
    std::vector<std::string> endpoint_files;
    bool test_endpoints = false;
    bool strict = false;
};

class StreamStatsApp {
public:
    explicit StreamStatsApp(Options options) : options_(std::move(options)) {}

    bool Start() {
        auto sampler_result = sampler_.Set(options_.collector.restart_delay);
        if (!sampler_result.ok()) {
            STREAMSTATS_ERROR("{}", sampler_result.error());
            return false;
        }
        STREAMSTATS_INFO("Restart delay distribution: {}", sampler_.ToString());

        if (!LoadEndpoints()) {
            return false;
        }

        auto sink = sink::MakeSampleSink(options_.sink);
        if (!sink.ok()) {
            STREAMSTATS_ERROR("{}", sink.error());
            return false;
        }
        sink_ = sink.take_value();

        factory_ = std::make_unique<stream::TcpStreamFactory>(options_.collector.stream_timeout);
        if (options_.test_endpoints) {
            RunEndpointTest();
        }

        collector_ = std::make_unique<collector::StreamCollector>(
            options_.collector, registry_, *factory_, sampler_, sink_.get());
        control_api_ = std::make_unique<api::ControlApi>(registry_, *collector_);

        if (options_.server.port != 0) {
            http_server_ = std::make_unique<server::HttpServer>(options_.server);
            control_api_->RegisterRoutes(*http_server_);
            http_server_->Start();
        } else {
            STREAMSTATS_INFO("Control API disabled");
        }

        collector_->Start(options_.collector.initial_streams);
        return true;
    }

    void Wait() {
        while (g_running.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
        STREAMSTATS_INFO("Shutting down...");
        Stop();
    }

    void Stop() {
        if (http_server_) {
            http_server_->Stop();
        }
        if (collector_) {
            collector_->Stop();
        }
    }

private:
    bool LoadEndpoints() {
        std::vector<std::string> specs = options_.endpoint_specs;
        for (const auto& path : options_.endpoint_files) {
            auto loaded = endpoints::LoadEndpointSpecs(path);
            if (!loaded.ok()) {
                STREAMSTATS_ERROR("{}", loaded.error());
                return false;
            }
            specs.insert(specs.end(), loaded.value().begin(), loaded.value().end());
        }

        if (specs.empty()) {
            STREAMSTATS_INFO("No streaming endpoints defined. Cannot request streams. "
                             "Use /api/endpoints to add streaming endpoints.");
            return true;
        }

        size_t parsed = 0;
        for (const auto& spec : specs) {
            auto result = endpoints::ParseEndpointSpec(spec);
            for (const auto& error : result.errors) {
                STREAMSTATS_ERROR("Error handling streaming endpoint {}: {}", spec, error);
            }
            if (!result.endpoints.empty()) {
                STREAMSTATS_INFO("For host {} added {} streaming endpoint(s) from {}",
                                 result.host, result.endpoints.size(), spec);
                parsed += result.endpoints.size();
                registry_.AddEndpoints(result.host, std::move(result.endpoints));
            }
        }

        if (parsed == 0) {
            if (options_.strict) {
                STREAMSTATS_CRITICAL("None of the {} endpoint spec(s) could be parsed", specs.size());
                return false;
            }
            STREAMSTATS_WARN("None of the {} endpoint spec(s) could be parsed, "
                             "use /api/endpoints to add streaming endpoints", specs.size());
        }
        return true;
    }

    void RunEndpointTest() {
        if (registry_.Empty()) {
            STREAMSTATS_WARN("No endpoints to test");
            return;
        }
        auto summary = collector::TestEndpoints(registry_, *factory_);
        STREAMSTATS_INFO("Endpoint connection test summary: {}.", summary.ToString());
        for (const auto& error : summary.errors) {
            STREAMSTATS_ERROR("{}", error);
        }
    }

    Options options_;
    endpoints::EndpointRegistry registry_;
    distribution::DistributionSampler sampler_;
    std::unique_ptr<sink::SampleSink> sink_;
    std::unique_ptr<stream::TcpStreamFactory> factory_;
    std::unique_ptr<collector::StreamCollector> collector_;
    std::unique_ptr<api::ControlApi> control_api_;
    std::unique_ptr<server::HttpServer> http_server_;
};

namespace {

bool ParseMillis(const std::string& flag, const std::string& value, std::chrono::milliseconds* out) {
    auto parsed = core::ParseNonNegativeDuration(value);
    if (!parsed.ok()) {
        std::cerr << "Invalid value for " << flag << ": " << parsed.error() << std::endl;
        return false;
    }
    *out = std::chrono::duration_cast<std::chrono::milliseconds>(parsed.value());
    return true;
}

bool ParseInteger(const std::string& flag, const std::string& value, long long min, long long max,
                  long long* out) {
    errno = 0;
    char* end = nullptr;
    long long parsed = std::strtoll(value.c_str(), &end, 10);
    if (errno == ERANGE || end == value.c_str() || *end != '\0' || parsed < min || parsed > max) {
        std::cerr << "Invalid value for " << flag << ": " << value << std::endl;
        return false;
    }
    *out = parsed;
    return true;
}

void PrintUsage(const char* program) {
    std::cout << "Usage: " << program << " [OPTIONS] [ENDPOINT ...]" << std::endl;
    std::cout << "Endpoints are URLs, optionally with one {{min max}} range token and a pixels=N query parameter."
              << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -n N                       Number of parallel streams (default: 1)" << std::endl;
    std::cout << "  --restart-delay SPEC       Delay before (re)opening a stream: const:D, equal:MIN,MAX or"
              << std::endl;
    std::cout << "                             norm:MEAN,STDDEV (default: const:0ms)" << std::endl;
    std::cout << "  --sink-interval DUR        Interval between emitted samples (default: 1s)" << std::endl;
    std::cout << "  --timeout DUR              Connect and inactivity timeout per stream (default: 5s)" << std::endl;
    std::cout << "  --no-endpoints-backoff DUR Sleep while no endpoint is configured (default: 5s)" << std::endl;
    std::cout << "  --endpoints-file PATH      Read endpoints from a file, one per line (repeatable)" << std::endl;
    std::cout << "  --test                     Test the connection to every endpoint at startup" << std::endl;
    std::cout << "  --strict                   Fail when endpoints are given but none can be parsed" << std::endl;
    std::cout << "  --output PATH              Sample output file, - for stdout (default: -)" << std::endl;
    std::cout << "  --format FORMAT            Sample format: csv or json (default: csv)" << std::endl;
    std::cout << "  --api-address ADDRESS      Control API listen address (default: 0.0.0.0)" << std::endl;
    std::cout << "  --api-port PORT            Control API port, 0 to disable (default: 7888)" << std::endl;
    std::cout << "  --log-level LEVEL          Log level (trace, debug, info, warn, error, off)" << std::endl;
    std::cout << "  --help, -h                 Show this help message" << std::endl;
}

} // namespace
} // namespace streamstats

int main(int argc, char* argv[]) {
    using namespace streamstats;

    common::Logger::Init();

    // Set up signal handling
    std::signal(SIGINT, SignalHandler);
    std::signal(SIGTERM, SignalHandler);

    Options options;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        bool has_value = i + 1 < argc;
        if (arg == "-n" && has_value) {
            long long n = 0;
            if (!ParseInteger(arg, argv[++i], 0, collector::kMaxPoolSize, &n)) return 1;
            options.collector.initial_streams = static_cast<int>(n);
        } else if (arg == "--restart-delay" && has_value) {
            options.collector.restart_delay = argv[++i];
        } else if (arg == "--sink-interval" && has_value) {
            if (!ParseMillis(arg, argv[++i], &options.collector.sink_interval)) return 1;
        } else if (arg == "--timeout" && has_value) {
            if (!ParseMillis(arg, argv[++i], &options.collector.stream_timeout)) return 1;
        } else if (arg == "--no-endpoints-backoff" && has_value) {
            if (!ParseMillis(arg, argv[++i], &options.collector.no_endpoints_backoff)) return 1;
        } else if (arg == "--endpoints-file" && has_value) {
            options.endpoint_files.push_back(argv[++i]);
        } else if (arg == "--test") {
            options.test_endpoints = true;
        } else if (arg == "--strict") {
            options.strict = true;
        } else if (arg == "--output" && has_value) {
            options.sink.path = argv[++i];
        } else if (arg == "--format" && has_value) {
            options.sink.format = argv[++i];
        } else if (arg == "--api-address" && has_value) {
            options.server.listen_address = argv[++i];
        } else if (arg == "--api-port" && has_value) {
            long long port = 0;
            if (!ParseInteger(arg, argv[++i], 0, 65535, &port)) return 1;
            options.server.port = static_cast<uint16_t>(port);
        } else if (arg == "--log-level" && has_value) {
            std::string level_str = argv[++i];
            auto level = common::Logger::ParseLevel(level_str);
            if (level) common::Logger::SetLevel(*level);
            else std::cerr << "Unknown log level: " << level_str << ". Using default (info)." << std::endl;
        } else if (arg == "--help" || arg == "-h") {
            PrintUsage(argv[0]);
            return 0;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << std::endl;
            std::cerr << "Use --help for usage information" << std::endl;
            return 1;
        } else {
            options.endpoint_specs.push_back(arg);
        }
    }

    auto collector_valid = options.collector.Validate();
    if (!collector_valid.ok()) {
        std::cerr << collector_valid.error() << std::endl;
        return 1;
    }
    auto sink_valid = options.sink.Validate();
    if (!sink_valid.ok()) {
        std::cerr << sink_valid.error() << std::endl;
        return 1;
    }

    try {
        StreamStatsApp app(std::move(options));
        if (!app.Start()) {
            app.Stop();
            return 1;
        }
        STREAMSTATS_INFO("streamstats running. Press Ctrl+C to stop.");
        app.Wait();
        return 0;
    } catch (const std::exception& e) {
        STREAMSTATS_CRITICAL("Fatal error: {}", e.what());
        return 1;
    }
}
