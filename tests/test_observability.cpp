#include "observability/logger.hpp"
#include "observability/metrics.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <sstream>
#include <string>
#include <vector>

using namespace settlement;
using namespace settlement::observability;

class LoggerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    Logger::getInstance().setOutputStream(output_);
    Logger::getInstance().setLogLevel(LogLevel::DEBUG);
  }

  void TearDown() override {
    Logger::getInstance().setContextField("network", "");
    Logger::getInstance().setLogLevel(LogLevel::INFO);
    Logger::getInstance().setOutputStream(std::cout);
  }

  std::vector<nlohmann::json> lines() {
    std::vector<nlohmann::json> out;
    std::istringstream in(output_.str());
    std::string line;
    while (std::getline(in, line)) {
      out.push_back(nlohmann::json::parse(line));
    }
    return out;
  }

  std::ostringstream output_;
};

// Logger tests
TEST_F(LoggerTest, WritesOneJsonObjectPerLine) {
  SETTLEMENT_LOG_INFO("Monitor started");
  SETTLEMENT_LOG_WARN("Mirror node slow");

  auto entries = lines();
  ASSERT_EQ(entries.size(), 2u);
  EXPECT_EQ(entries[0]["level"], "INFO");
  EXPECT_EQ(entries[0]["message"], "Monitor started");
  EXPECT_TRUE(entries[0].contains("timestamp"));
  EXPECT_TRUE(entries[0].contains("thread"));
  EXPECT_EQ(entries[0]["component"], "TestBody");
  EXPECT_EQ(entries[1]["level"], "WARN");
}

TEST_F(LoggerTest, BuilderCarriesCorrelationAndFields) {
  SETTLEMENT_LOG_BUILDER(LogLevel::INFO, "Invoice marked as paid")
      .correlation("hedera_0.0.5363033-1769582713-055549545")
      .field("invoice_id", "INV-7")
      .field("attempt", 3)
      .field("retryable", false)
      .field("memo", std::string("quote \" and\nnewline"));

  auto entries = lines();
  ASSERT_EQ(entries.size(), 1u);
  EXPECT_EQ(entries[0]["correlation_id"], "hedera_0.0.5363033-1769582713-055549545");
  EXPECT_EQ(entries[0]["invoice_id"], "INV-7");
  EXPECT_EQ(entries[0]["attempt"], 3);
  EXPECT_EQ(entries[0]["retryable"], false);
  EXPECT_EQ(entries[0]["memo"], "quote \" and\nnewline");
}

TEST_F(LoggerTest, FiltersBelowMinimumLevel) {
  Logger::getInstance().setLogLevel(LogLevel::WARN);
  EXPECT_FALSE(Logger::getInstance().isEnabled(LogLevel::INFO));

  SETTLEMENT_LOG_DEBUG("dropped");
  SETTLEMENT_LOG_INFO("dropped");
  SETTLEMENT_LOG_ERROR("kept");

  auto entries = lines();
  ASSERT_EQ(entries.size(), 1u);
  EXPECT_EQ(entries[0]["message"], "kept");
}

TEST_F(LoggerTest, ContextFieldsAppearOnEveryLine) {
  Logger::getInstance().setContextField("network", "testnet");
  SETTLEMENT_LOG_INFO("first");
  Logger::getInstance().setContextField("network", "");
  SETTLEMENT_LOG_INFO("second");

  auto entries = lines();
  ASSERT_EQ(entries.size(), 2u);
  EXPECT_EQ(entries[0]["network"], "testnet");
  EXPECT_FALSE(entries[1].contains("network"));
}

TEST_F(LoggerTest, InvalidUtf8IsReplaced) {
  SETTLEMENT_LOG_BUILDER(LogLevel::INFO, "Memo received").field("memo", std::string("pay\xff"));

  auto entries = lines();
  ASSERT_EQ(entries.size(), 1u);
  EXPECT_EQ(entries[0]["memo"].get<std::string>().substr(0, 3), "pay");
}

TEST(LogLevelTest, ParsesNames) {
  EXPECT_EQ(parseLogLevel("debug"), LogLevel::DEBUG);
  EXPECT_EQ(parseLogLevel("Warning"), LogLevel::WARN);
  EXPECT_EQ(parseLogLevel("ERROR"), LogLevel::ERROR);
  EXPECT_EQ(parseLogLevel("fatal"), LogLevel::FATAL);
  EXPECT_EQ(parseLogLevel("verbose"), LogLevel::INFO);
  EXPECT_STREQ(logLevelName(LogLevel::WARN), "WARN");
}

// Metrics tests
TEST(MetricsTest, CountersAreKeptPerLabelSet) {
  MetricsCollector metrics;
  metrics.incrementCounter("settlement_posted_total", {{"token", "USDC"}});
  metrics.incrementCounter("settlement_posted_total", {{"token", "USDC"}});
  metrics.incrementCounter("settlement_posted_total", {{"token", "HBAR"}});
  metrics.incrementCounter("settlement_posted_total", -5.0);

  EXPECT_DOUBLE_EQ(metrics.getCounter("settlement_posted_total", {{"token", "USDC"}}), 2.0);
  EXPECT_DOUBLE_EQ(metrics.getCounter("settlement_posted_total", {{"token", "HBAR"}}), 1.0);
  EXPECT_DOUBLE_EQ(metrics.getCounter("settlement_posted_total"), 0.0);
  EXPECT_DOUBLE_EQ(metrics.getCounterTotal("settlement_posted_total"), 3.0);
  EXPECT_DOUBLE_EQ(metrics.getCounter("missing_total"), 0.0);
}

TEST(MetricsTest, GaugesMoveBothWays) {
  MetricsCollector metrics;
  metrics.setGauge("settlement_queue_depth", 4);
  metrics.addGauge("settlement_queue_depth", -1);
  EXPECT_DOUBLE_EQ(metrics.getGauge("settlement_queue_depth"), 3.0);
}

TEST(MetricsTest, PrometheusExportAccumulatesBuckets) {
  MetricsCollector metrics;
  metrics.describe("mirror_query_seconds", "Mirror node request latency");
  metrics.observeHistogram("mirror_query_seconds", 0.2);
  metrics.observeHistogram("mirror_query_seconds", 0.4);
  metrics.observeHistogram("mirror_query_seconds", 120.0);
  metrics.incrementCounter("matcher_checks_total", {{"token", "HBAR"}});

  std::string text = metrics.exportPrometheus();
  EXPECT_NE(text.find("# HELP mirror_query_seconds Mirror node request latency"), std::string::npos);
  EXPECT_NE(text.find("# TYPE mirror_query_seconds histogram"), std::string::npos);
  EXPECT_NE(text.find("mirror_query_seconds_bucket{le=\"0.25\"} 1"), std::string::npos);
  EXPECT_NE(text.find("mirror_query_seconds_bucket{le=\"0.5\"} 2"), std::string::npos);
  EXPECT_NE(text.find("mirror_query_seconds_bucket{le=\"+Inf\"} 3"), std::string::npos);
  EXPECT_NE(text.find("mirror_query_seconds_count 3"), std::string::npos);
  EXPECT_NE(text.find("matcher_checks_total{token=\"HBAR\"} 1"), std::string::npos);
  EXPECT_EQ(metrics.getHistogramCount("mirror_query_seconds"), 3u);
}

TEST(MetricsTest, TimerRecordsIntoHistogram) {
  MetricsCollector metrics;
  {
    MetricsCollector::Timer timer(metrics, "mirror_query_seconds", {{"network", "testnet"}});
    EXPECT_GE(timer.elapsedSeconds(), 0.0);
  }
  EXPECT_EQ(metrics.getHistogramCount("mirror_query_seconds", {{"network", "testnet"}}), 1u);
}

TEST(MetricsTest, SnapshotAndReset) {
  MetricsCollector metrics;
  metrics.incrementCounter("settlement_duplicate_total", {{"token", "USDT"}});

  nlohmann::json snapshot = metrics.snapshot();
  ASSERT_EQ(snapshot["counters"].size(), 1u);
  EXPECT_EQ(snapshot["counters"][0]["name"], "settlement_duplicate_total");
  EXPECT_EQ(snapshot["counters"][0]["labels"]["token"], "USDT");
  EXPECT_EQ(snapshot["counters"][0]["value"], 1.0);

  metrics.reset();
  EXPECT_TRUE(metrics.snapshot()["counters"].empty());
}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
