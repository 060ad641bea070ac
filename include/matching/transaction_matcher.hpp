#ifndef TRANSACTION_MATCHER_HPP_
#define TRANSACTION_MATCHER_HPP_

#include "../hedera/token_config.hpp"
#include "../network/ledger_query_service.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace settlement {
namespace matching {

/**
 * What a payment for one invoice is expected to look like on the ledger.
 */
struct CheckOptions {
  std::string invoice_id;
  std::string merchant_account_id;
  std::optional<std::string> payer_account_id;
  hedera::Network network = hedera::Network::TESTNET;
  hedera::TokenType token = hedera::TokenType::HBAR;
  double expected_amount = 0.0;
  std::optional<std::string> memo;
  int time_window_minutes = 15;
  int page_limit = 20;
};

/**
 * A ledger transaction that satisfied every supplied predicate.
 */
struct MatchedTransaction {
  std::string transaction_id;  // as served by the mirror node
  hedera::TokenType token = hedera::TokenType::HBAR;
  int64_t amount_smallest_unit = 0;
  std::string amount;          // canonical decimal, e.g. "50.01"
  std::string sender;          // "unknown" when no outbound leg exists
  std::string consensus_timestamp;
  std::optional<std::string> memo;
  std::string merchant_account_id;
};

/**
 * Outcome of one bounded check. found == false with an empty error means
 * "not found yet"; callers re-check on their own schedule.
 */
struct CheckResult {
  bool found = false;
  std::optional<MatchedTransaction> match;
  std::string error;
  size_t transactions_checked = 0;
};

/**
 * Single-shot matcher against the public ledger. One query per call, bounded
 * by the ledger client's timeout; errors never propagate.
 */
class TransactionMatcher {
 public:
  using Clock = std::function<std::chrono::system_clock::time_point()>;

  explicit TransactionMatcher(network::LedgerQueryService& ledger,
                              Clock clock = Clock());

  // Non-copyable
  TransactionMatcher(const TransactionMatcher&) = delete;
  TransactionMatcher& operator=(const TransactionMatcher&) = delete;

  /**
   * Query transfers into the merchant account within the time window,
   * newest first, and return the first one matching sender, memo and amount.
   */
  CheckResult checkForTransaction(const CheckOptions& options) const;

  /**
   * Query filter for the options: merchant account, page limit, descending
   * order, window start, and the transaction types for the asset.
   */
  network::TransactionQuery buildQuery(const CheckOptions& options) const;

  /**
   * Evaluate one candidate. Predicates apply in order: payer, memo, amount.
   */
  static std::optional<MatchedTransaction> matchTransaction(
      const network::MirrorTransaction& transaction, const CheckOptions& options);

  /**
   * Decoded memo of a transaction, or nullopt when absent or undecodable.
   */
  static std::optional<std::string> extractMemo(const network::MirrorTransaction& transaction);

 private:
  network::LedgerQueryService& ledger_;
  Clock clock_;
};

}  // namespace matching
}  // namespace settlement

#endif  // TRANSACTION_MATCHER_HPP_
