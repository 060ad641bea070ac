#ifndef MIRROR_NODE_CLIENT_HPP_
#define MIRROR_NODE_CLIENT_HPP_

#include "ledger_query_service.hpp"

#include <string>

namespace settlement {
namespace network {

/**
 * Raw result of one HTTP exchange.
 */
struct HttpResponse {
  int curl_code = 0;   // CURLcode, 0 on success
  long status = 0;     // HTTP status, 0 when no response arrived
  bool timed_out = false;
  std::string body;
  std::string error_message;
};

/**
 * LedgerQueryService backed by a Hedera mirror node REST API over libcurl.
 * Every request is bounded by Config::timeout_ms so a single check cannot
 * hold a caller past its timeout.
 */
class MirrorNodeClient : public LedgerQueryService {
 public:
  struct Config {
    std::string base_url = "https://testnet.mirrornode.hedera.com";
    long timeout_ms = 7000;
    long connect_timeout_ms = 3000;
    std::string user_agent = "settlement-core/1.0";
  };

  explicit MirrorNodeClient(const Config& config);
  ~MirrorNodeClient() override = default;

  // Non-copyable
  MirrorNodeClient(const MirrorNodeClient&) = delete;
  MirrorNodeClient& operator=(const MirrorNodeClient&) = delete;

  TransactionPage queryTransactions(const TransactionQuery& query) override;
  std::optional<MirrorTransaction> getTransaction(const std::string& transaction_id) override;
  std::optional<AccountBalance> getAccountBalance(const std::string& account_id) override;
  std::optional<std::vector<TokenAssociation>> getTokenAssociations(
      const std::string& account_id) override;

  const Config& config() const { return config_; }

 private:
  HttpResponse httpGet(const std::string& path) const;

  Config config_;
};

}  // namespace network
}  // namespace settlement

#endif  // MIRROR_NODE_CLIENT_HPP_
