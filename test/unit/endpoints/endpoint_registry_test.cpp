#include <gtest/gtest.h>
#include "streamstats/endpoints/endpoint_registry.h"

#include <atomic>
#include <map>
#include <set>
#include <thread>

namespace streamstats {
namespace endpoints {
namespace {

Endpoint MakeEndpoint(const std::string& url) {
    auto result = ParseEndpoint(url);
    EXPECT_TRUE(result.ok()) << url;
    return result.take_value();
}

class EndpointRegistryTest : public ::testing::Test {
protected:
    EndpointRegistryTest() : registry_(12345) {}

    void AddHost(const std::string& host, int count) {
        std::vector<Endpoint> endpoints;
        for (int i = 0; i < count; ++i) {
            endpoints.push_back(MakeEndpoint("rtmp://" + host + "/live/s" + std::to_string(i)));
        }
        registry_.AddEndpoints(host, std::move(endpoints));
    }

    EndpointRegistry registry_;
};

TEST_F(EndpointRegistryTest, EmptyRegistrySignalsNoEndpoints) {
    EXPECT_TRUE(registry_.Empty());
    auto selected = registry_.SelectNext();
    ASSERT_FALSE(selected.ok());
    EXPECT_EQ(selected.code(), core::Error::Code::NO_ENDPOINTS);
    EXPECT_EQ(selected.error(), "No URLs available for streaming");
}

TEST_F(EndpointRegistryTest, AddAppendsToExistingHost) {
    AddHost("a", 2);
    AddHost("b", 1);
    registry_.AddEndpoints("a", {MakeEndpoint("rtmp://a/live/extra")});

    EXPECT_EQ(registry_.HostCount(), 2u);
    EXPECT_EQ(registry_.EndpointCount(), 4u);
    auto snapshot = registry_.Snapshot();
    ASSERT_EQ(snapshot.size(), 2u);
    EXPECT_EQ(snapshot[0].name, "a");
    EXPECT_EQ(snapshot[0].endpoints.size(), 3u);
    EXPECT_EQ(snapshot[0].endpoints.back().stream_name, "extra");
}

TEST_F(EndpointRegistryTest, EmptyListDoesNotCreateHost) {
    registry_.AddEndpoints("ghost", {});
    EXPECT_EQ(registry_.HostCount(), 0u);
}

TEST_F(EndpointRegistryTest, ReplaceAllDropsPreviousHosts) {
    AddHost("old", 3);
    std::vector<HostEndpoints> hosts;
    hosts.push_back(HostEndpoints{"new", {MakeEndpoint("rtmp://new/live/one")}});
    registry_.ReplaceAll(std::move(hosts));

    auto snapshot = registry_.Snapshot();
    ASSERT_EQ(snapshot.size(), 1u);
    EXPECT_EQ(snapshot[0].name, "new");
    auto selected = registry_.SelectNext();
    ASSERT_TRUE(selected.ok());
    EXPECT_EQ(selected.value().url.host, "new");
}

TEST_F(EndpointRegistryTest, ClearEmptiesRegistry) {
    AddHost("a", 2);
    registry_.Clear();
    EXPECT_TRUE(registry_.Empty());
    auto selected = registry_.SelectNext();
    ASSERT_FALSE(selected.ok());
    EXPECT_EQ(selected.code(), core::Error::Code::NO_ENDPOINTS);
    EXPECT_EQ(selected.error(), "No URLs available for streaming");
}

TEST_F(EndpointRegistryTest, RoundRobinOverHosts) {
    AddHost("a", 1);
    AddHost("b", 5);
    AddHost("c", 2);
    const size_t hosts = registry_.HostCount();

    std::map<std::string, int> visits;
    std::string previous;
    for (size_t i = 0; i < 2 * hosts; ++i) {
        auto selected = registry_.SelectNext();
        ASSERT_TRUE(selected.ok());
        const std::string host = selected.value().url.host;
        EXPECT_NE(host, previous);
        previous = host;
        visits[host]++;
    }
    EXPECT_EQ(visits.size(), hosts);
    for (const auto& entry : visits) {
        EXPECT_GE(entry.second, 2) << entry.first;
    }
}

TEST_F(EndpointRegistryTest, RandomWithinHostCoversAllEndpoints) {
    AddHost("only", 4);
    std::set<std::string> seen;
    for (int i = 0; i < 400; ++i) {
        auto selected = registry_.SelectNext();
        ASSERT_TRUE(selected.ok());
        seen.insert(selected.value().stream_name);
    }
    EXPECT_EQ(seen.size(), 4u);
}

TEST_F(EndpointRegistryTest, ConcurrentSelectAndUpdate) {
    AddHost("a", 3);
    std::atomic<bool> done{false};
    std::thread writer([this, &done] {
        for (int i = 0; i < 200; ++i) {
            AddHost("h" + std::to_string(i % 5), 1);
            if (i % 50 == 0) {
                registry_.Clear();
            }
        }
        done = true;
    });
    int selections = 0;
    while (!done.load()) {
        auto selected = registry_.SelectNext();
        if (selected.ok()) {
            EXPECT_FALSE(selected.value().stream_name.empty());
        }
        ++selections;
    }
    writer.join();
    EXPECT_GT(selections, 0);
}

} // namespace
} // namespace endpoints
} // namespace streamstats
