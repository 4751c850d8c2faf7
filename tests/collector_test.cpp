#include <curl/curl.h>
#include <gtest/gtest.h>
#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <sstream>
#include <string>
#include <thread>

#include "src/volley/collector/collector.hpp"

using namespace volley;

namespace {
    RequestOutcome response_outcome(int index, long status, std::string body) {
        http::model::Response response;
        response.status_ = status;
        response.body_ = std::move(body);
        return RequestOutcome{.sequence_index_ = index, .response_ = std::move(response)};
    }

    size_t occurrences(const std::string& haystack, const std::string& needle) {
        size_t count = 0;
        for (size_t pos = haystack.find(needle); pos != std::string::npos; pos = haystack.find(needle, pos + needle.size())) {
            ++count;
        }
        return count;
    }
}  // namespace

// Routes the default logger into a string for the duration of each test.
class CollectorTest : public ::testing::Test {
   protected:
    void SetUp() override {
        previous_ = spdlog::default_logger();
        auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(output_);
        auto capture = std::make_shared<spdlog::logger>("collector_capture", sink);
        capture->set_pattern("%l|%v");
        capture->set_level(spdlog::level::trace);
        spdlog::set_default_logger(capture);
    }

    void TearDown() override { spdlog::set_default_logger(previous_); }

    [[nodiscard]] std::string logged() const { return output_.str(); }

   private:
    std::ostringstream output_;
    std::shared_ptr<spdlog::logger> previous_;
};

TEST_F(CollectorTest, DrainObservesEverythingPublishedBeforeClose) {
    OutcomeChannel channel;
    Collector collector(CollectorKind::SUCCESS, 1, false);

    std::thread producer([&channel]() {
        for (int i = 1; i <= 50; ++i) {
            channel.send(response_outcome(i, 200, "{}"));
        }
        channel.close();
    });

    const size_t observed = collector.drain(channel);
    producer.join();

    EXPECT_EQ(observed, 50U);
    EXPECT_EQ(collector.observed(), 50U);
    EXPECT_EQ(occurrences(logged(), ">> http status response 200"), 50U);
}

TEST_F(CollectorTest, SuccessLinesFollowASingleBufferHeader) {
    OutcomeChannel channel;
    channel.send(response_outcome(1, 200, "{}"));
    channel.send(response_outcome(2, 201, "{}"));
    channel.close();

    Collector collector(CollectorKind::SUCCESS, 3, false);
    collector.drain(channel);

    const std::string out = logged();
    EXPECT_EQ(out.rfind("info|buffer # 3\n", 0), 0U);
    EXPECT_EQ(occurrences(out, "buffer #"), 1U);
    EXPECT_NE(out.find("info|request #1 >> http status response 200\n"), std::string::npos);
    EXPECT_NE(out.find("info|request #2 >> http status response 201\n"), std::string::npos);
    EXPECT_EQ(out.find(">> response:"), std::string::npos);
}

TEST_F(CollectorTest, VerboseSuccessPrettyPrintsJsonBodies) {
    OutcomeChannel channel;
    channel.send(response_outcome(1, 200, R"({"ok":true})"));
    channel.close();

    Collector collector(CollectorKind::SUCCESS, 1, true);
    collector.drain(channel);

    EXPECT_NE(logged().find("info|request #1 >> response: {\n  \"ok\": true\n}"), std::string::npos);
}

TEST_F(CollectorTest, VerboseSuccessToleratesNonJsonBodies) {
    OutcomeChannel channel;
    channel.send(response_outcome(1, 200, "plain text, not json"));
    channel.send(response_outcome(2, 204, ""));
    channel.close();

    Collector collector(CollectorKind::SUCCESS, 4, true);
    EXPECT_NO_THROW(collector.drain(channel));
    EXPECT_EQ(collector.observed(), 2U);

    const std::string out = logged();
    EXPECT_NE(out.find("warning|request #1 >> response is not JSON"), std::string::npos);
    EXPECT_NE(out.find("plain text, not json"), std::string::npos);
    EXPECT_NE(out.find("info|request #2 >> http status response 204"), std::string::npos);
}

TEST_F(CollectorTest, ErrorCollectorLogsTransportAndStatusFailures) {
    OutcomeChannel channel;
    channel.send(RequestOutcome{.sequence_index_ = 1, .error_ = http::http_error::TransportError(7, "http://127.0.0.1:1/", "Connection refused")});
    channel.send(response_outcome(2, 500, "{\"error\":\"boom\"}"));
    channel.close();

    Collector collector(CollectorKind::FAILURE, 2, true);
    EXPECT_EQ(collector.drain(channel), 2U);

    const std::string out = logged();
    EXPECT_EQ(out.rfind("info|buffer # 2\n", 0), 0U);
    EXPECT_NE(out.find("error|error on request #1 >> Connection refused\n"), std::string::npos);
    EXPECT_NE(out.find("error|error on request #2 >> http status code: 500\n"), std::string::npos);
    EXPECT_NE(out.find("info|request #2 >> response: {\"error\":\"boom\"}"), std::string::npos);
}

TEST_F(CollectorTest, CancelledRequestsAreReportedAsShutdownWarnings) {
    OutcomeChannel channel;
    channel.send(RequestOutcome{.sequence_index_ = 4, .error_ = http::http_error::TransportError(static_cast<int>(CURLE_ABORTED_BY_CALLBACK), "http://example.test/post", "Callback aborted")});
    channel.close();

    Collector collector(CollectorKind::FAILURE, 1, false);
    collector.drain(channel);

    EXPECT_NE(logged().find("warning|error on request #4 >> cancelled at shutdown"), std::string::npos);
}

TEST_F(CollectorTest, DrainReturnsImmediatelyForAnEmptyClosedChannel) {
    OutcomeChannel channel;
    channel.close();

    Collector collector(CollectorKind::FAILURE, 1, false);
    EXPECT_EQ(collector.drain(channel), 0U);
    EXPECT_TRUE(logged().empty());
}
