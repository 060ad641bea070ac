#include "config/settlement_config.hpp"

#include <gtest/gtest.h>

#include <cstdlib>

using namespace settlement;
using namespace settlement::config;

namespace {

const char* kVariables[] = {
  "HEDERA_NETWORK", "HEDERA_MERCHANT_ACCOUNT_ID", "MIRROR_NODE_URL",
  "DATABASE_HOST", "DATABASE_PORT", "DATABASE_NAME", "DATABASE_USER", "DATABASE_PASSWORD",
  "SETTLEMENT_WORKERS", "LOG_LEVEL",
};

}  // namespace

class SettlementConfigTest : public ::testing::Test {
 protected:
  void SetUp() override { clearEnvironment(); }
  void TearDown() override { clearEnvironment(); }

  static void clearEnvironment() {
    for (const char* name : kVariables) {
      unsetenv(name);
    }
  }
};

TEST_F(SettlementConfigTest, DefaultsWithoutEnvironment) {
  SettlementConfig config = SettlementConfig::fromEnvironment();

  EXPECT_EQ(config.network, hedera::Network::TESTNET);
  EXPECT_TRUE(config.merchant_account_id.empty());
  EXPECT_EQ(config.database.host, "localhost");
  EXPECT_EQ(config.database.port, 5432);
  EXPECT_EQ(config.database.name, "settlement");
  EXPECT_EQ(config.worker_threads, 4u);
  EXPECT_EQ(config.log_level, observability::LogLevel::INFO);
  EXPECT_EQ(config.effectiveMirrorUrl(), hedera::mirrorNodeUrl(hedera::Network::TESTNET));

  std::string error;
  EXPECT_FALSE(config.validate(&error));
  EXPECT_EQ(error, "HEDERA_MERCHANT_ACCOUNT_ID is not set");
}

TEST_F(SettlementConfigTest, ReadsEnvironment) {
  setenv("HEDERA_NETWORK", "mainnet", 1);
  setenv("HEDERA_MERCHANT_ACCOUNT_ID", "0.0.7001", 1);
  setenv("MIRROR_NODE_URL", "http://localhost:5551", 1);
  setenv("DATABASE_HOST", "db.internal", 1);
  setenv("DATABASE_PORT", "6543", 1);
  setenv("DATABASE_USER", "payments", 1);
  setenv("SETTLEMENT_WORKERS", "8", 1);
  setenv("LOG_LEVEL", "DEBUG", 1);

  SettlementConfig config = SettlementConfig::fromEnvironment();

  EXPECT_EQ(config.network, hedera::Network::MAINNET);
  EXPECT_EQ(config.merchant_account_id, "0.0.7001");
  EXPECT_EQ(config.effectiveMirrorUrl(), "http://localhost:5551");
  EXPECT_EQ(config.database.host, "db.internal");
  EXPECT_EQ(config.database.port, 6543);
  EXPECT_EQ(config.database.user, "payments");
  EXPECT_EQ(config.worker_threads, 8u);
  EXPECT_EQ(config.log_level, observability::LogLevel::DEBUG);
  EXPECT_TRUE(config.validate());
}

TEST_F(SettlementConfigTest, MalformedValuesKeepDefaults) {
  setenv("HEDERA_NETWORK", "moonnet", 1);
  setenv("DATABASE_PORT", "54x32", 1);
  setenv("SETTLEMENT_WORKERS", "-3", 1);

  SettlementConfig config = SettlementConfig::fromEnvironment();

  EXPECT_EQ(config.network, hedera::Network::TESTNET);
  EXPECT_EQ(config.database.port, 5432);
  EXPECT_EQ(config.worker_threads, 4u);
}

TEST_F(SettlementConfigTest, ValidatesMerchantAccountFormat) {
  SettlementConfig config;
  std::string error;

  config.merchant_account_id = "merchant";
  EXPECT_FALSE(config.validate(&error));
  EXPECT_EQ(error, "Merchant account id must look like 0.0.12345");

  config.merchant_account_id = "0.0.7001";
  EXPECT_TRUE(config.validate(&error));

  config.database.port = 70000;
  EXPECT_FALSE(config.validate(&error));
  EXPECT_EQ(error, "DATABASE_PORT is out of range");

  config.database.port = 5432;
  config.worker_threads = 0;
  EXPECT_FALSE(config.validate(&error));
}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
