#include "streamstats/api/control_api.h"

#include <cerrno>
#include <cstdlib>
#include <sstream>

#include "streamstats/common/logger.h"

namespace streamstats {
namespace api {

namespace {

const char* const kEmptyBodyMessage = "Request body must define at least one non-empty URL";

std::string JoinUrls(const std::vector<endpoints::Endpoint>& endpoints) {
    std::string out = "[";
    for (size_t i = 0; i < endpoints.size(); ++i) {
        if (i > 0) out += " ";
        out += endpoints[i].ToString();
    }
    return out + "]";
}

// Groups parsed endpoints by host, keeping the order in which hosts first appear
std::vector<endpoints::HostEndpoints> GroupByHost(const std::vector<endpoints::EndpointSpecResult>& entries) {
    std::vector<endpoints::HostEndpoints> hosts;
    for (const auto& entry : entries) {
        if (entry.endpoints.empty()) {
            continue;
        }
        endpoints::HostEndpoints* target = nullptr;
        for (auto& h : hosts) {
            if (h.name == entry.host) {
                target = &h;
                break;
            }
        }
        if (target == nullptr) {
            hosts.push_back(endpoints::HostEndpoints{entry.host, {}});
            target = &hosts.back();
        }
        target->endpoints.insert(target->endpoints.end(), entry.endpoints.begin(), entry.endpoints.end());
    }
    return hosts;
}

} // namespace

std::string EndpointUpdateReport::ToText() const {
    std::ostringstream out;
    for (const auto& entry : entries) {
        if (!entry.endpoints.empty() && applied) {
            out << "For host " << entry.host << " successfully added following URLs as streaming endpoints: "
                << JoinUrls(entry.endpoints) << "\n";
        }
        for (const auto& error : entry.errors) {
            out << "Error handling streaming endpoint " << entry.spec << ": " << error << "\n";
        }
    }
    if (!applied) {
        out << "No streaming endpoint could be parsed, endpoints left unchanged\n";
    }
    return out.str();
}

ControlApi::ControlApi(endpoints::EndpointRegistry& registry, collector::StreamCollector& collector)
    : registry_(registry), collector_(collector) {}

core::Result<EndpointUpdateReport> ControlApi::SetEndpoints(EndpointUpdateMode mode,
                                                            const std::vector<std::string>& specs) {
    if (specs.empty()) {
        return core::Result<EndpointUpdateReport>::error(kEmptyBodyMessage, core::Error::Code::INVALID_ARGUMENT);
    }

    EndpointUpdateReport report;
    report.mode = mode;
    for (const auto& spec : specs) {
        auto parsed = endpoints::ParseEndpointSpec(spec);
        for (const auto& error : parsed.errors) {
            STREAMSTATS_ERROR("Error handling streaming endpoint {}: {}", spec, error);
        }
        report.added += parsed.endpoints.size();
        report.entries.push_back(std::move(parsed));
    }

    if (report.added == 0) {
        return core::Result<EndpointUpdateReport>(std::move(report));
    }

    auto hosts = GroupByHost(report.entries);
    if (mode == EndpointUpdateMode::REPLACE) {
        registry_.ReplaceAll(std::move(hosts));
    } else {
        for (auto& host : hosts) {
            registry_.AddEndpoints(host.name, std::move(host.endpoints));
        }
    }
    report.applied = true;
    STREAMSTATS_INFO("{} {} streaming endpoint(s), registry now holds {} endpoint(s) on {} host(s)",
                     mode == EndpointUpdateMode::REPLACE ? "Set" : "Added", report.added,
                     registry_.EndpointCount(), registry_.HostCount());
    return core::Result<EndpointUpdateReport>(std::move(report));
}

core::Result<EndpointUpdateReport> ControlApi::SetEndpointsFromBody(EndpointUpdateMode mode,
                                                                    const std::string& body) {
    return SetEndpoints(mode, endpoints::SplitSpecLines(body));
}

core::Result<collector::ResizeResult> ControlApi::SetPoolSize(const std::string& value) {
    using ResultT = core::Result<collector::ResizeResult>;
    if (value.empty()) {
        return ResultT::error("Form or query parameter 'num' not defined", core::Error::Code::INVALID_ARGUMENT);
    }

    errno = 0;
    char* end = nullptr;
    long long num = std::strtoll(value.c_str(), &end, 10);
    if (errno == ERANGE || end == value.c_str() || *end != '\0') {
        return ResultT::error("Failed to parse value of form/query parameter 'num' ('" + value + "')",
                              core::Error::Code::INVALID_ARGUMENT);
    }
    if (num > collector::kMaxPoolSize) {
        return ResultT::error("Value of form/query parameter 'num' must not exceed " +
                              std::to_string(collector::kMaxPoolSize) + " ('" + value + "')",
                              core::Error::Code::INVALID_ARGUMENT);
    }
    return ResultT(collector_.Resize(static_cast<int64_t>(num)));
}

std::string ControlApi::DescribeEndpoints() const {
    std::ostringstream out;
    auto hosts = registry_.Snapshot();
    size_t total = 0;
    for (const auto& host : hosts) {
        total += host.endpoints.size();
    }
    out << "Number of hosts: " << hosts.size() << ", number of endpoints: " << total << "\n";
    for (const auto& host : hosts) {
        out << host.name << "\n";
        for (const auto& endpoint : host.endpoints) {
            out << "  " << endpoint.ToString();
            if (endpoint.pixels) {
                out << " (pixels " << *endpoint.pixels << ")";
            }
            out << "\n";
        }
    }
    return out.str();
}

std::string ControlApi::DescribeStreams() const {
    return "Number of active streams: " + std::to_string(collector_.Size()) + "\n";
}

void ControlApi::HandleEndpoints(const server::Request& request, server::Response& response) {
    if (request.method == "GET") {
        response.SetText(200, DescribeEndpoints());
        return;
    }

    auto mode = request.method == "POST" ? EndpointUpdateMode::REPLACE : EndpointUpdateMode::APPEND;
    auto result = SetEndpointsFromBody(mode, request.body);
    if (!result.ok()) {
        response.SetText(400, result.error() + "\n");
        return;
    }
    const auto& report = result.value();
    response.SetText(report.applied ? 200 : 400, report.ToText());
}

void ControlApi::HandleStreams(const server::Request& request, server::Response& response) {
    if (request.method == "GET") {
        response.SetText(200, DescribeStreams());
        return;
    }

    auto result = SetPoolSize(request.GetParam("num"));
    if (!result.ok()) {
        response.SetText(400, result.error() + "\n");
        return;
    }
    response.SetText(200, "Number of active streams set from " + std::to_string(result.value().previous) +
                          " to " + std::to_string(result.value().current) + "\n");
}

void ControlApi::RegisterRoutes(server::HttpServer& server) {
    server.RegisterHandler("/api/endpoints", {"GET", "POST", "PUT"},
                           [this](const server::Request& req, server::Response& res) { HandleEndpoints(req, res); });
    server.RegisterHandler("/api/streams", {"GET", "POST", "PUT"},
                           [this](const server::Request& req, server::Response& res) { HandleStreams(req, res); });
}

} // namespace api
} // namespace streamstats
