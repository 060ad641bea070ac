#ifndef SETTLEMENT_POSTER_HPP_
#define SETTLEMENT_POSTER_HPP_

#include "../hedera/token_config.hpp"
#include "advisory_lock.hpp"
#include "invoice_store.hpp"
#include "sync_queue.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace settlement {
namespace posting {

/**
 * A matched on-chain payment to be settled against an invoice.
 */
struct ConfirmationRequest {
  std::string invoice_id;
  std::string transaction_id;   // either wire format
  hedera::TokenType token = hedera::TokenType::HBAR;
  std::string amount_received;  // decimal string in token units
  std::string sender;
  std::string consensus_timestamp;
  std::optional<std::string> memo;
  std::string merchant_account_id;
  hedera::Network network = hedera::Network::TESTNET;
  std::string mirror_url;
  std::string network_prefix = "hedera";
};

enum class SettlementStatus {
  POSTED,           // status, event and ledger entries written
  DUPLICATE,        // already settled; nothing written
  REJECTED,         // invoice not payable
  LOCK_CONTENTION,  // another request holds the invoice
  LEDGER_PENDING,   // confirmed, ledger posting failed and awaits retry
  FAILED
};

std::string settlementStatusToString(SettlementStatus status);

struct SettlementResult {
  SettlementStatus status = SettlementStatus::FAILED;
  bool success = false;
  bool retryable = false;
  std::string payment_event_id;
  std::string correlation_id;
  std::string normalized_transaction_id;
  std::string message;
};

struct PaymentAttemptCheck {
  bool allowed = false;
  std::string reason;
  std::optional<InvoiceStatus> current_status;
  std::string suggested_action;
};

struct LedgerPostingResult {
  bool success = false;
  bool already_posted = false;
  std::string error;
  std::vector<LedgerEntry> entries;
};

struct BatchItemResult {
  std::string invoice_id;
  std::string transaction_id;
  SettlementResult result;
};

/**
 * Posts matched payments exactly once per invoice.
 *
 * Every write path for an invoice runs under the same advisory lock, taken
 * with a non-blocking attempt. Within the lock the invoice transition and
 * the confirmation event are written atomically; ledger entries follow and
 * a ledger failure leaves the payment confirmed for a later
 * retryLedgerPosting.
 */
class SettlementPoster {
 public:
  using Clock = std::function<std::chrono::system_clock::time_point()>;

  SettlementPoster(InvoiceStore& store, AdvisoryLock& lock, SyncQueue& sync_queue,
                   Clock clock = Clock());
  ~SettlementPoster() = default;

  // Non-copyable
  SettlementPoster(const SettlementPoster&) = delete;
  SettlementPoster& operator=(const SettlementPoster&) = delete;

  /**
   * Settle one matched payment. Never throws.
   */
  SettlementResult confirmPayment(const ConfirmationRequest& request);

  /**
   * Settle a list of payments one by one, reporting each outcome.
   */
  std::vector<BatchItemResult> batchConfirm(const std::vector<ConfirmationRequest>& requests);

  /**
   * Whether the invoice can accept a payment now. Moves an OPEN invoice
   * whose expiry has passed to EXPIRED.
   */
  PaymentAttemptCheck validatePaymentAttempt(const std::string& invoice_id);

  /**
   * Existing confirmation for either transaction id format or the
   * correlation id.
   */
  std::optional<PaymentEvent> findDuplicate(const std::string& invoice_id,
                                            const std::string& normalized_transaction_id,
                                            const std::string& raw_transaction_id,
                                            const std::string& correlation_id);

  bool hasLedgerEntries(const std::string& invoice_id);

  /**
   * Post the ledger entries of an already confirmed invoice from its latest
   * confirmation event. No-op when entries exist. Takes the invoice lock.
   */
  LedgerPostingResult retryLedgerPosting(const std::string& invoice_id);

  /**
   * True when debits equal credits per currency and every amount parses.
   */
  static bool validatePostingBalance(const std::vector<LedgerEntry>& entries,
                                     std::string* error = nullptr);

 private:
  LedgerPostingResult postLedgerEntries(const Invoice& invoice, const PaymentEvent& event,
                                        hedera::TokenType token);
  void enqueueSync(const Invoice& invoice, const std::string& correlation_id);
  PaymentEvent buildEvent(const ConfirmationRequest& request,
                          const std::string& normalized_transaction_id,
                          const std::string& correlation_id) const;

  InvoiceStore& store_;
  AdvisoryLock& lock_;
  SyncQueue& sync_queue_;
  Clock clock_;
};

}  // namespace posting
}  // namespace settlement

#endif  // SETTLEMENT_POSTER_HPP_
