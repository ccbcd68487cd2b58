#include "streamstats/server/http_server.h"
#include "streamstats/server/request.h"
#include "streamstats/common/logger.h"
#include <httplib.h>
#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>
#include <mutex>
#include <thread>
#include <unordered_map>

namespace streamstats {
namespace server {

core::Result<void> ServerConfig::Validate() const {
    if (listen_address.empty()) {
        return core::Result<void>::error("Listen address must not be empty", core::Error::Code::INVALID_ARGUMENT);
    }
    if (num_threads == 0) {
        return core::Result<void>::error("Server needs at least one thread", core::Error::Code::INVALID_ARGUMENT);
    }
    if (timeout_seconds <= 0) {
        return core::Result<void>::error("Server timeout must be positive", core::Error::Code::INVALID_ARGUMENT);
    }
    return core::Result<void>();
}

class HttpServer::Impl {
public:
    explicit Impl(const ServerConfig& config)
        : config_(config), server_(std::make_unique<httplib::Server>()),
          request_count_(0), active_requests_(0), server_errors_(0) {

        auto valid = config_.Validate();
        if (!valid.ok()) {
            throw ServerError(valid.error());
        }

        size_t threads = config_.num_threads;
        server_->new_task_queue = [threads] { return new httplib::ThreadPool(threads); };
        server_->set_read_timeout(config_.timeout_seconds, 0);
        server_->set_write_timeout(config_.timeout_seconds, 0);

        // Set up default handlers
        server_->Get("/health", [](const httplib::Request&, httplib::Response& res) {
            res.set_content("{\"status\":\"up\"}", "application/json");
        });

        server_->Get("/metrics", [this](const httplib::Request&, httplib::Response& res) {
            res.set_content(GetMetricsJson(), "application/json");
        });

        server_->set_logger([](const httplib::Request& req, const httplib::Response& res) {
            STREAMSTATS_DEBUG("{} {} -> {}", req.method, req.path, res.status);
        });
    }

    void Start() {
        if (server_thread_.joinable()) {
            throw ServerError("Server is already running");
        }

        // Bind synchronously so that bind failures reach the caller
        if (config_.port == 0) {
            bound_port_ = server_->bind_to_any_port(config_.listen_address);
            if (bound_port_ < 0) {
                throw ServerError("Failed to bind " + config_.listen_address + " to any port");
            }
        } else {
            if (!server_->bind_to_port(config_.listen_address, config_.port)) {
                throw ServerError("Failed to bind " + config_.listen_address + ":" +
                                  std::to_string(config_.port));
            }
            bound_port_ = config_.port;
        }

        server_thread_ = std::thread([this]() {
            if (!server_->listen_after_bind()) {
                STREAMSTATS_ERROR("HTTP server on port {} stopped listening unexpectedly", bound_port_);
            }
        });
        STREAMSTATS_INFO("Serving control API on {}:{}", config_.listen_address, bound_port_);
    }

    void Stop() {
        if (server_thread_.joinable()) {
            server_->stop();
            server_thread_.join();
        }
    }

    int Port() const { return bound_port_; }

    void RegisterHandler(const std::string& path, const std::vector<std::string>& methods,
                         RequestHandler handler) {
        {
            std::lock_guard<std::mutex> lock(handlers_mutex_);
            handlers_[path] = std::move(handler);
        }

        auto handle_req = [this, path](const httplib::Request& req, httplib::Response& res) {
            active_requests_++;
            request_count_++;
            try {
                Request request;
                request.method = req.method;
                request.path = req.path;
                request.body = req.body;
                for (const auto& param : req.params) {
                    request.params.insert({param.first, param.second});
                }
                for (const auto& header : req.headers) {
                    request.headers[header.first] = header.second;
                }

                RequestHandler current;
                {
                    std::lock_guard<std::mutex> lock(handlers_mutex_);
                    current = handlers_[path];
                }
                Response response;
                current(request, response);
                res.status = response.status;
                res.set_content(response.body, response.content_type.c_str());
            } catch (const std::exception& e) {
                server_errors_++;
                STREAMSTATS_ERROR("Handler for {} {} failed: {}", req.method, path, e.what());
                res.status = 500;
                res.set_content(CreateErrorJson(e.what()), "application/json");
            }
            active_requests_--;
        };

        for (const auto& method : methods) {
            if (method == "GET") {
                server_->Get(path.c_str(), handle_req);
            } else if (method == "POST") {
                server_->Post(path.c_str(), handle_req);
            } else if (method == "PUT") {
                server_->Put(path.c_str(), handle_req);
            } else if (method == "DELETE") {
                server_->Delete(path.c_str(), handle_req);
            } else {
                throw ServerError("Unsupported method " + method + " for " + path);
            }
        }
    }

    std::string GetMetricsJson() const {
        rapidjson::Document doc;
        doc.SetObject();
        auto& allocator = doc.GetAllocator();

        doc.AddMember("active_requests", active_requests_.load(), allocator);
        doc.AddMember("total_requests", request_count_.load(), allocator);
        doc.AddMember("server_errors", server_errors_.load(), allocator);

        rapidjson::StringBuffer buffer;
        rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
        doc.Accept(writer);

        return buffer.GetString();
    }

private:
    ServerConfig config_;
    std::unique_ptr<httplib::Server> server_;
    std::thread server_thread_;
    int bound_port_ = -1;
    std::unordered_map<std::string, RequestHandler> handlers_;
    mutable std::mutex handlers_mutex_;
    std::atomic<uint64_t> request_count_;
    std::atomic<uint64_t> active_requests_;
    std::atomic<uint64_t> server_errors_;

    std::string CreateErrorJson(const std::string& message) const {
        rapidjson::Document doc;
        doc.SetObject();
        auto& allocator = doc.GetAllocator();

        doc.AddMember("error",
                     rapidjson::Value(message.c_str(), allocator).Move(),
                     allocator);

        rapidjson::StringBuffer buffer;
        rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
        doc.Accept(writer);

        return buffer.GetString();
    }
};

HttpServer::HttpServer(const ServerConfig& config)
    : impl_(std::make_unique<Impl>(config)) {}

HttpServer::~HttpServer() {
    Stop();
}

void HttpServer::Start() {
    if (running_) {
        throw ServerError("Server is already running");
    }
    impl_->Start();
    running_ = true;
}

void HttpServer::Stop() {
    if (running_) {
        impl_->Stop();
        running_ = false;
    }
}

bool HttpServer::IsRunning() const {
    return running_;
}

int HttpServer::Port() const {
    return impl_->Port();
}

void HttpServer::RegisterHandler(const std::string& path, const std::vector<std::string>& methods,
                                 RequestHandler handler) {
    impl_->RegisterHandler(path, methods, std::move(handler));
}

std::string HttpServer::GetMetrics() const {
    return impl_->GetMetricsJson();
}

} // namespace server
} // namespace streamstats
