#include <gtest/gtest.h>
#include "streamstats/server/http_server.h"

#include <httplib.h>
#include <rapidjson/document.h>

#include <stdexcept>

namespace streamstats {
namespace server {
namespace {

class HttpServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.listen_address = "127.0.0.1";
        config_.port = 0;
        config_.num_threads = 2;
    }

    std::unique_ptr<httplib::Client> Connect(const HttpServer& server) {
        auto client = std::make_unique<httplib::Client>("127.0.0.1", server.Port());
        client->set_connection_timeout(5, 0);
        client->set_read_timeout(5, 0);
        return client;
    }

    ServerConfig config_;
};

TEST_F(HttpServerTest, ConfigValidation) {
    EXPECT_TRUE(ServerConfig().Validate().ok());

    ServerConfig config;
    config.listen_address = "";
    EXPECT_FALSE(config.Validate().ok());

    config = ServerConfig();
    config.num_threads = 0;
    EXPECT_FALSE(config.Validate().ok());

    config = ServerConfig();
    config.timeout_seconds = 0;
    EXPECT_FALSE(config.Validate().ok());
    EXPECT_THROW(HttpServer server(config), ServerError);
}

TEST_F(HttpServerTest, BindsEphemeralPort) {
    HttpServer server(config_);
    EXPECT_FALSE(server.IsRunning());
    server.Start();
    EXPECT_TRUE(server.IsRunning());
    EXPECT_GT(server.Port(), 0);
    EXPECT_THROW(server.Start(), ServerError);

    auto client = Connect(server);
    auto res = client->Get("/health");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_EQ(res->body, "{\"status\":\"up\"}");

    server.Stop();
    EXPECT_FALSE(server.IsRunning());
    server.Stop();
}

TEST_F(HttpServerTest, DispatchesRegisteredHandlers) {
    HttpServer server(config_);
    server.RegisterHandler("/api/echo", {"GET", "POST"}, [](const Request& req, Response& res) {
        res.SetText(req.method == "POST" ? 201 : 200, req.method + " " + req.GetParam("num") + " " + req.body);
    });
    server.Start();
    auto client = Connect(server);

    auto get = client->Get("/api/echo?num=7");
    ASSERT_TRUE(get);
    EXPECT_EQ(get->status, 200);
    EXPECT_EQ(get->body, "GET 7 ");

    auto post = client->Post("/api/echo", "payload", "text/plain");
    ASSERT_TRUE(post);
    EXPECT_EQ(post->status, 201);
    EXPECT_EQ(post->body, "POST  payload");

    // Method not registered for this path
    auto put = client->Put("/api/echo", "payload", "text/plain");
    ASSERT_TRUE(put);
    EXPECT_EQ(put->status, 404);

    rapidjson::Document metrics;
    metrics.Parse(server.GetMetrics().c_str());
    ASSERT_FALSE(metrics.HasParseError());
    EXPECT_EQ(metrics["total_requests"].GetUint64(), 2u);
    EXPECT_EQ(metrics["active_requests"].GetUint64(), 0u);
    EXPECT_EQ(metrics["server_errors"].GetUint64(), 0u);
}

TEST_F(HttpServerTest, FormParametersReachHandler) {
    HttpServer server(config_);
    server.RegisterHandler("/api/streams", {"PUT"}, [](const Request& req, Response& res) {
        res.SetText(200, req.GetParam("num"));
    });
    server.Start();
    auto client = Connect(server);

    httplib::Params params{{"num", "12"}};
    auto res = client->Put("/api/streams", params);
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_EQ(res->body, "12");
}

TEST_F(HttpServerTest, HandlerExceptionBecomes500) {
    HttpServer server(config_);
    server.RegisterHandler("/api/fail", {"GET"}, [](const Request&, Response&) {
        throw std::runtime_error("handler broke");
    });
    server.Start();
    auto client = Connect(server);

    auto res = client->Get("/api/fail");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 500);

    rapidjson::Document body;
    body.Parse(res->body.c_str());
    ASSERT_FALSE(body.HasParseError());
    EXPECT_STREQ(body["error"].GetString(), "handler broke");

    auto metrics = client->Get("/metrics");
    ASSERT_TRUE(metrics);
    rapidjson::Document doc;
    doc.Parse(metrics->body.c_str());
    ASSERT_FALSE(doc.HasParseError());
    EXPECT_EQ(doc["server_errors"].GetUint64(), 1u);
}

TEST_F(HttpServerTest, RejectsUnknownMethod) {
    HttpServer server(config_);
    EXPECT_THROW(server.RegisterHandler("/api/x", {"PATCH"}, [](const Request&, Response&) {}), ServerError);
}

} // namespace
} // namespace server
} // namespace streamstats
