#ifndef SETTLEMENT_CONFIG_HPP_
#define SETTLEMENT_CONFIG_HPP_

#include "../hedera/token_config.hpp"
#include "../observability/logger.hpp"

#include <cstddef>
#include <string>

namespace settlement {
namespace config {

struct DatabaseSettings {
  std::string host = "localhost";
  int port = 5432;
  std::string name = "settlement";
  std::string user = "settlement_user";
  std::string password = "";

  bool enabled() const { return !host.empty() && !user.empty(); }
};

/**
 * Runtime settings for the settlement monitor.
 */
struct SettlementConfig {
  hedera::Network network = hedera::Network::TESTNET;
  std::string merchant_account_id;
  std::string mirror_node_url;  // empty: public mirror of `network`
  std::string network_prefix = "hedera";
  DatabaseSettings database;
  size_t worker_threads = 4;
  observability::LogLevel log_level = observability::LogLevel::INFO;
  int mirror_timeout_ms = 7000;
  int monitor_interval_ms = 5000;
  int monitor_max_attempts = 60;
  int monitor_timeout_ms = 300000;

  /**
   * Read HEDERA_NETWORK, HEDERA_MERCHANT_ACCOUNT_ID, MIRROR_NODE_URL,
   * DATABASE_HOST/PORT/NAME/USER/PASSWORD, SETTLEMENT_WORKERS and
   * LOG_LEVEL. Unset or malformed values keep their defaults.
   */
  static SettlementConfig fromEnvironment();

  std::string effectiveMirrorUrl() const;

  /**
   * False with a reason when a required setting is missing.
   */
  bool validate(std::string* error = nullptr) const;
};

}  // namespace config
}  // namespace settlement

#endif  // SETTLEMENT_CONFIG_HPP_
