#include "transaction_matcher.hpp"
#include "payment_validator.hpp"
#include "hedera/amount_codec.hpp"
#include "hedera/base64.hpp"
#include "observability/logger.hpp"
#include "observability/metrics.hpp"

#include <stdexcept>

namespace settlement {
namespace matching {

using observability::LogLevel;

TransactionMatcher::TransactionMatcher(network::LedgerQueryService& ledger, Clock clock)
    : ledger_(ledger), clock_(std::move(clock)) {
  if (!clock_) {
    clock_ = [] { return std::chrono::system_clock::now(); };
  }
}

network::TransactionQuery TransactionMatcher::buildQuery(const CheckOptions& options) const {
  network::TransactionQuery query;
  query.account_id = options.merchant_account_id;
  query.limit = options.page_limit;
  query.order = "desc";

  auto window_start = clock_() - std::chrono::minutes(options.time_window_minutes);
  query.timestamp_gte = std::chrono::duration_cast<std::chrono::seconds>(
      window_start.time_since_epoch()).count();

  if (options.token == hedera::TokenType::HBAR) {
    query.transaction_types = {"CRYPTOTRANSFER"};
  } else {
    query.transaction_types = {"CRYPTOTRANSFER", "TOKENTRANSFER"};
  }
  return query;
}

CheckResult TransactionMatcher::checkForTransaction(const CheckOptions& options) const {
  CheckResult result;
  auto start = std::chrono::steady_clock::now();
  observability::getGlobalMetrics().incrementCounter(
      "matcher_checks_total", {{"token", hedera::tokenSymbol(options.token)}});

  try {
    if (options.merchant_account_id.empty()) {
      throw std::invalid_argument("Merchant account id is required");
    }
    if (!(options.expected_amount > 0.0)) {
      throw std::invalid_argument("Expected amount must be positive");
    }

    SETTLEMENT_LOG_BUILDER(LogLevel::INFO, "Checking for transaction")
        .field("invoice_id", options.invoice_id)
        .field("merchant_account_id", options.merchant_account_id)
        .field("token", hedera::tokenSymbol(options.token))
        .field("expected_amount", options.expected_amount)
        .field("time_window_minutes", options.time_window_minutes);

    network::TransactionPage page = ledger_.queryTransactions(buildQuery(options));

    if (page.status == network::QueryStatus::TIMEOUT) {
      SETTLEMENT_LOG_BUILDER(LogLevel::WARN, "Transaction check timed out")
          .field("invoice_id", options.invoice_id);
      result.error = "Timeout";
      return result;
    }
    if (!page.ok()) {
      throw std::runtime_error(page.error.empty()
                                   ? network::queryStatusToString(page.status)
                                   : page.error);
    }

    result.transactions_checked = page.transactions.size();
    for (const auto& transaction : page.transactions) {
      auto match = matchTransaction(transaction, options);
      if (match) {
        result.found = true;
        result.match = std::move(match);

        SETTLEMENT_LOG_BUILDER(LogLevel::INFO, "Matching transaction found")
            .field("invoice_id", options.invoice_id)
            .field("transaction_id", result.match->transaction_id)
            .field("amount", result.match->amount)
            .field("sender", result.match->sender);
        return result;
      }
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    SETTLEMENT_LOG_BUILDER(LogLevel::INFO, "No matching transaction found")
        .field("invoice_id", options.invoice_id)
        .field("transactions_checked", result.transactions_checked)
        .field("duration_ms", static_cast<int64_t>(elapsed.count()));
    return result;

  } catch (const std::exception& e) {
    SETTLEMENT_LOG_BUILDER(LogLevel::ERROR, "Failed to check for transaction")
        .field("invoice_id", options.invoice_id)
        .field("error", e.what());
    result.found = false;
    result.error = e.what();
    return result;
  }
}

std::optional<std::string> TransactionMatcher::extractMemo(
    const network::MirrorTransaction& transaction) {
  if (transaction.memo_base64.empty()) return std::nullopt;
  return hedera::decodeBase64(transaction.memo_base64);
}

std::optional<MatchedTransaction> TransactionMatcher::matchTransaction(
    const network::MirrorTransaction& transaction, const CheckOptions& options) {
  const hedera::TokenInfo& info = hedera::tokenInfo(options.token);

  int64_t inbound = 0;
  std::string sender = "unknown";
  bool found = false;

  if (info.is_native) {
    for (const auto& leg : transaction.transfers) {
      if (leg.account == options.merchant_account_id && leg.amount > 0) {
        inbound = leg.amount;
        found = true;
        break;
      }
    }
    if (!found) return std::nullopt;

    for (const auto& leg : transaction.transfers) {
      if (leg.amount < 0) {
        sender = leg.account;
        break;
      }
    }
  } else {
    auto token_id = hedera::tokenId(options.token, options.network);
    if (!token_id) return std::nullopt;

    for (const auto& leg : transaction.token_transfers) {
      if (leg.token_id == *token_id && leg.account == options.merchant_account_id &&
          leg.amount > 0) {
        inbound = leg.amount;
        found = true;
        break;
      }
    }
    if (!found) return std::nullopt;

    for (const auto& leg : transaction.token_transfers) {
      if (leg.token_id == *token_id && leg.amount < 0) {
        sender = leg.account;
        break;
      }
    }
  }

  if (options.payer_account_id && !options.payer_account_id->empty() &&
      sender != *options.payer_account_id) {
    SETTLEMENT_LOG_BUILDER(LogLevel::DEBUG, "Transaction payer mismatch")
        .field("transaction_id", transaction.transaction_id)
        .field("expected", *options.payer_account_id)
        .field("actual", sender);
    return std::nullopt;
  }

  std::optional<std::string> memo = extractMemo(transaction);
  if (options.memo && !options.memo->empty() && !transaction.memo_base64.empty()) {
    if (!memo || memo->find(*options.memo) == std::string::npos) {
      SETTLEMENT_LOG_BUILDER(LogLevel::DEBUG, "Transaction memo mismatch")
          .field("transaction_id", transaction.transaction_id)
          .field("expected", *options.memo)
          .field("actual", memo.value_or(""));
      return std::nullopt;
    }
  }

  const double amount = hedera::toDecimal(inbound, info.decimals);
  if (!isWithinTolerance(options.expected_amount, amount, options.token)) {
    AcceptableRange range = getAcceptableRange(options.expected_amount, options.token);
    SETTLEMENT_LOG_BUILDER(LogLevel::DEBUG, "Transaction amount mismatch")
        .field("transaction_id", transaction.transaction_id)
        .field("expected", options.expected_amount)
        .field("actual", amount)
        .field("min_accepted", range.min)
        .field("max_accepted", range.max);
    return std::nullopt;
  }

  MatchedTransaction match;
  match.transaction_id = transaction.transaction_id;
  match.token = options.token;
  match.amount_smallest_unit = inbound;
  match.amount = hedera::formatAmount(hedera::fromSmallestUnit(inbound, info.decimals));
  match.sender = sender;
  match.consensus_timestamp = transaction.consensus_timestamp;
  match.memo = memo;
  match.merchant_account_id = options.merchant_account_id;
  return match;
}

}  // namespace matching
}  // namespace settlement
