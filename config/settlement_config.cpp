#include "settlement_config.hpp"

#include <cstdlib>
#include <regex>
#include <stdexcept>

namespace settlement {
namespace config {

namespace {

std::string readEnv(const char* name) {
  const char* value = std::getenv(name);
  return value ? std::string(value) : std::string();
}

int readIntEnv(const char* name, int fallback) {
  std::string value = readEnv(name);
  if (value.empty()) return fallback;

  try {
    size_t consumed = 0;
    int parsed = std::stoi(value, &consumed);
    if (consumed != value.size()) {
      throw std::invalid_argument("trailing characters");
    }
    return parsed;
  } catch (const std::exception& e) {
    SETTLEMENT_LOG_WARN(std::string("Ignoring ") + name + "=" + value + ": " + e.what());
    return fallback;
  }
}

}  // namespace

SettlementConfig SettlementConfig::fromEnvironment() {
  SettlementConfig config;

  std::string network = readEnv("HEDERA_NETWORK");
  if (!network.empty()) {
    if (auto parsed = hedera::parseNetwork(network)) {
      config.network = *parsed;
    } else {
      SETTLEMENT_LOG_WARN("Unknown HEDERA_NETWORK " + network + ", using " +
                          hedera::networkName(config.network));
    }
  }

  config.merchant_account_id = readEnv("HEDERA_MERCHANT_ACCOUNT_ID");
  config.mirror_node_url = readEnv("MIRROR_NODE_URL");

  std::string db_host = readEnv("DATABASE_HOST");
  if (!db_host.empty()) config.database.host = db_host;
  config.database.port = readIntEnv("DATABASE_PORT", config.database.port);
  std::string db_name = readEnv("DATABASE_NAME");
  if (!db_name.empty()) config.database.name = db_name;
  std::string db_user = readEnv("DATABASE_USER");
  if (!db_user.empty()) config.database.user = db_user;
  config.database.password = readEnv("DATABASE_PASSWORD");

  int workers = readIntEnv("SETTLEMENT_WORKERS", static_cast<int>(config.worker_threads));
  if (workers > 0) {
    config.worker_threads = static_cast<size_t>(workers);
  }

  std::string level = readEnv("LOG_LEVEL");
  if (!level.empty()) {
    config.log_level = observability::parseLogLevel(level);
  }

  return config;
}

std::string SettlementConfig::effectiveMirrorUrl() const {
  if (!mirror_node_url.empty()) {
    return mirror_node_url;
  }
  return hedera::mirrorNodeUrl(network);
}

bool SettlementConfig::validate(std::string* error) const {
  static const std::regex account_pattern(R"(^\d+\.\d+\.\d+$)");

  auto fail = [error](const std::string& reason) {
    if (error) *error = reason;
    return false;
  };

  if (merchant_account_id.empty()) {
    return fail("HEDERA_MERCHANT_ACCOUNT_ID is not set");
  }
  if (!std::regex_match(merchant_account_id, account_pattern)) {
    return fail("Merchant account id must look like 0.0.12345");
  }
  if (worker_threads == 0) {
    return fail("At least one settlement worker is required");
  }
  if (database.port <= 0 || database.port > 65535) {
    return fail("DATABASE_PORT is out of range");
  }
  return true;
}

}  // namespace config
}  // namespace settlement
