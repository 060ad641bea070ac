#ifndef LEDGER_QUERY_SERVICE_HPP_
#define LEDGER_QUERY_SERVICE_HPP_

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace settlement {
namespace network {

/**
 * One leg of a native (HBAR) transfer list, in tinybars.
 */
struct TransferLeg {
  std::string account;
  int64_t amount = 0;
};

/**
 * One leg of a fungible token transfer list, in token smallest units.
 */
struct TokenTransferLeg {
  std::string token_id;
  std::string account;
  int64_t amount = 0;
};

/**
 * Transaction as reported by the mirror node.
 */
struct MirrorTransaction {
  std::string transaction_id;       // account-seconds-nanos as served
  std::string consensus_timestamp;  // "seconds.nanos"
  std::string memo_base64;
  std::string result;               // "SUCCESS" once reached consensus
  std::string name;                 // CRYPTOTRANSFER, TOKENTRANSFER, ...
  std::vector<TransferLeg> transfers;
  std::vector<TokenTransferLeg> token_transfers;
};

/**
 * Filter for GET /api/v1/transactions.
 */
struct TransactionQuery {
  std::string account_id;
  int limit = 20;
  std::string order = "desc";
  std::optional<int64_t> timestamp_gte;  // unix seconds
  std::vector<std::string> transaction_types;
};

enum class QueryStatus {
  OK,
  TIMEOUT,
  NETWORK_ERROR,
  HTTP_ERROR,
  PARSE_ERROR
};

struct TransactionPage {
  QueryStatus status = QueryStatus::OK;
  std::string error;
  std::vector<MirrorTransaction> transactions;

  bool ok() const { return status == QueryStatus::OK; }
};

/**
 * Balance snapshot of an account. Token balances are keyed by token id.
 */
struct AccountBalance {
  int64_t tinybars = 0;
  std::map<std::string, int64_t> tokens;
};

struct TokenAssociation {
  std::string token_id;
  int64_t balance = 0;
};

/**
 * Read-only view of the settlement network's public ledger.
 * Implementations must never throw; failures are reported through the
 * returned values.
 */
class LedgerQueryService {
 public:
  virtual ~LedgerQueryService() = default;

  /**
   * GET /transactions?account.id=..&limit=..&order=..&timestamp=gte:..&transactionType=..
   */
  virtual TransactionPage queryTransactions(const TransactionQuery& query) = 0;

  /**
   * GET /transactions/{id}. Returns the first transaction of the response.
   */
  virtual std::optional<MirrorTransaction> getTransaction(const std::string& transaction_id) = 0;

  /**
   * GET /accounts/{id}.
   */
  virtual std::optional<AccountBalance> getAccountBalance(const std::string& account_id) = 0;

  /**
   * GET /accounts/{id}/tokens.
   */
  virtual std::optional<std::vector<TokenAssociation>> getTokenAssociations(
      const std::string& account_id) = 0;
};

/**
 * Path and query string for a transaction search, relative to the mirror
 * base URL: "/api/v1/transactions?account.id=0.0.5&limit=20&...".
 */
std::string buildTransactionsPath(const TransactionQuery& query);

/**
 * Reached consensus with a SUCCESS result.
 */
bool isTransactionConfirmed(const MirrorTransaction& transaction);

// Response body parsers; throw std::runtime_error on malformed documents
std::vector<MirrorTransaction> parseTransactionsJson(const std::string& body);
AccountBalance parseAccountBalanceJson(const std::string& body);
std::vector<TokenAssociation> parseTokenAssociationsJson(const std::string& body);

std::string queryStatusToString(QueryStatus status);

}  // namespace network
}  // namespace settlement

#endif  // LEDGER_QUERY_SERVICE_HPP_
