#include <gtest/gtest.h>
#include "streamstats/api/control_api.h"
#include "test_util/scripted_stream.h"

namespace streamstats {
namespace api {
namespace {

class ControlApiTest : public ::testing::Test {
protected:
    ControlApiTest()
        : registry_(11),
          collector_(MakeConfig(), registry_, factory_, sampler_, nullptr),
          api_(registry_, collector_) {
        factory_.SetScript({stream::ReceiveResult::Data(1)}, true);
    }

    ~ControlApiTest() override { collector_.Stop(); }

    static core::CollectorConfig MakeConfig() {
        core::CollectorConfig config;
        config.no_endpoints_backoff = std::chrono::milliseconds(20);
        return config;
    }

    testutil::ScriptedStreamFactory factory_;
    distribution::DistributionSampler sampler_;
    endpoints::EndpointRegistry registry_;
    collector::StreamCollector collector_;
    ControlApi api_;
};

TEST_F(ControlApiTest, ReplaceSetsRegistry) {
    registry_.AddEndpoints("old:1935", {endpoints::ParseEndpoint("rtmp://old:1935/live/a").take_value()});

    auto result = api_.SetEndpointsFromBody(EndpointUpdateMode::REPLACE,
                                            "rtmp://a:1935/live/s{{1 2}}\n\nrtmp://b/app/x?pixels=100\n");
    ASSERT_TRUE(result.ok()) << result.error();
    const auto& report = result.value();
    EXPECT_TRUE(report.applied);
    EXPECT_EQ(report.added, 3u);
    EXPECT_EQ(registry_.HostCount(), 2u);
    EXPECT_EQ(registry_.EndpointCount(), 3u);

    auto hosts = registry_.Snapshot();
    EXPECT_EQ(hosts[0].name, "a:1935");
    EXPECT_EQ(hosts[1].name, "b");
    EXPECT_EQ(report.ToText(),
              "For host a:1935 successfully added following URLs as streaming endpoints: "
              "[rtmp://a:1935/live/s1 rtmp://a:1935/live/s2]\n"
              "For host b successfully added following URLs as streaming endpoints: [rtmp://b/app/x]\n");
}

TEST_F(ControlApiTest, AppendKeepsExistingEndpoints) {
    ASSERT_TRUE(api_.SetEndpoints(EndpointUpdateMode::REPLACE, {"rtmp://a/live/one"}).ok());
    auto result = api_.SetEndpoints(EndpointUpdateMode::APPEND, {"rtmp://a/live/two", "rtmp://c/live/three"});
    ASSERT_TRUE(result.ok()) << result.error();
    EXPECT_EQ(registry_.HostCount(), 2u);
    EXPECT_EQ(registry_.EndpointCount(), 3u);
    EXPECT_EQ(registry_.Snapshot()[0].endpoints.size(), 2u);
}

TEST_F(ControlApiTest, EmptyBodyIsRejected) {
    auto result = api_.SetEndpointsFromBody(EndpointUpdateMode::REPLACE, "\n  \n# comment\n");
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.code(), core::Error::Code::INVALID_ARGUMENT);
    EXPECT_EQ(result.error(), "Request body must define at least one non-empty URL");
}

TEST_F(ControlApiTest, ReplaceWithNothingParsedLeavesRegistryUnchanged) {
    ASSERT_TRUE(api_.SetEndpoints(EndpointUpdateMode::REPLACE, {"rtmp://a/live/one"}).ok());

    auto result = api_.SetEndpoints(EndpointUpdateMode::REPLACE, {"not a url", "rtmp://a/nostream"});
    ASSERT_TRUE(result.ok());
    const auto& report = result.value();
    EXPECT_FALSE(report.applied);
    EXPECT_EQ(report.added, 0u);
    EXPECT_EQ(registry_.EndpointCount(), 1u);

    std::string text = report.ToText();
    EXPECT_NE(text.find("Error handling streaming endpoint not a url: "), std::string::npos);
    EXPECT_NE(text.find("Error handling streaming endpoint rtmp://a/nostream: "), std::string::npos);
    EXPECT_NE(text.find("No streaming endpoint could be parsed, endpoints left unchanged"), std::string::npos);
}

TEST_F(ControlApiTest, PartialUpdateAppliesParsedSpecs) {
    auto result = api_.SetEndpoints(EndpointUpdateMode::REPLACE, {"rtmp://a/live/one", "ftp//broken"});
    ASSERT_TRUE(result.ok());
    EXPECT_TRUE(result.value().applied);
    EXPECT_EQ(result.value().added, 1u);
    EXPECT_EQ(registry_.EndpointCount(), 1u);
    EXPECT_NE(result.value().ToText().find("Error handling streaming endpoint ftp//broken"), std::string::npos);
}

TEST_F(ControlApiTest, PoolSizeParsing) {
    auto missing = api_.SetPoolSize("");
    ASSERT_FALSE(missing.ok());
    EXPECT_EQ(missing.error(), "Form or query parameter 'num' not defined");

    auto bad = api_.SetPoolSize("3x");
    ASSERT_FALSE(bad.ok());
    EXPECT_EQ(bad.error(), "Failed to parse value of form/query parameter 'num' ('3x')");
    EXPECT_EQ(collector_.Size(), 0);
}

TEST_F(ControlApiTest, PoolSizeAboveLimitIsRejected) {
    ASSERT_TRUE(api_.SetPoolSize("1").ok());

    auto huge = api_.SetPoolSize("9223372036854775807");
    ASSERT_FALSE(huge.ok());
    EXPECT_EQ(huge.code(), core::Error::Code::INVALID_ARGUMENT);
    EXPECT_EQ(huge.error(),
              "Value of form/query parameter 'num' must not exceed 1000000 ('9223372036854775807')");

    auto above = api_.SetPoolSize(std::to_string(collector::kMaxPoolSize + 1));
    ASSERT_FALSE(above.ok());
    EXPECT_EQ(collector_.Size(), 1);
}

TEST_F(ControlApiTest, PoolSizeResizesCollector) {
    auto grown = api_.SetPoolSize("3");
    ASSERT_TRUE(grown.ok());
    EXPECT_EQ(grown.value().previous, 0);
    EXPECT_EQ(grown.value().current, 3);
    EXPECT_EQ(api_.DescribeStreams(), "Number of active streams: 3\n");

    auto cleared = api_.SetPoolSize("-1");
    ASSERT_TRUE(cleared.ok());
    EXPECT_EQ(cleared.value().previous, 3);
    EXPECT_EQ(cleared.value().current, 0);
}

TEST_F(ControlApiTest, DescribeEndpoints) {
    EXPECT_EQ(api_.DescribeEndpoints(), "Number of hosts: 0, number of endpoints: 0\n");

    ASSERT_TRUE(api_.SetEndpoints(EndpointUpdateMode::REPLACE,
                                  {"rtmp://a/live/one?pixels=2073600", "rtmp://b:1936/live/two"}).ok());
    EXPECT_EQ(api_.DescribeEndpoints(),
              "Number of hosts: 2, number of endpoints: 2\n"
              "a\n"
              "  rtmp://a/live/one (pixels 2073600)\n"
              "b:1936\n"
              "  rtmp://b:1936/live/two\n");
}

} // namespace
} // namespace api
} // namespace streamstats
