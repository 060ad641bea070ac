#ifndef INVOICE_STORE_HPP_
#define INVOICE_STORE_HPP_

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace settlement {
namespace posting {

/**
 * Invoice lifecycle. PAID, EXPIRED and CANCELED are terminal.
 */
enum class InvoiceStatus {
  DRAFT,
  OPEN,
  PAID,
  EXPIRED,
  CANCELED
};

std::string invoiceStatusToString(InvoiceStatus status);
std::optional<InvoiceStatus> parseInvoiceStatus(const std::string& name);
bool isTerminalStatus(InvoiceStatus status);

struct Invoice {
  std::string id;
  std::string organization_id;
  std::string amount;    // decimal string, e.g. "50.00"
  std::string currency;  // invoice currency code
  InvoiceStatus status = InvoiceStatus::DRAFT;
  std::optional<std::chrono::system_clock::time_point> expires_at;
};

/**
 * Append-only confirmation record, one per (invoice id, correlation id).
 */
struct PaymentEvent {
  std::string id;
  std::string invoice_id;
  std::string event_type = "PAYMENT_CONFIRMED";
  std::string transaction_id;  // normalized
  std::string amount_received;
  std::string currency_received;
  std::string correlation_id;
  std::map<std::string, std::string> metadata;
  std::chrono::system_clock::time_point created_at;
};

struct LedgerAccount {
  std::string id;
  std::string organization_id;
  std::string code;
  std::string name;
  std::string account_type = "ASSET";
};

enum class EntryType {
  DEBIT,
  CREDIT
};

std::string entryTypeToString(EntryType type);

struct LedgerEntry {
  std::string id;
  std::string invoice_id;
  std::string organization_id;
  std::string account_id;
  std::string account_code;
  EntryType entry_type = EntryType::DEBIT;
  std::string amount;  // decimal string
  std::string currency;
  std::string description;
  std::string idempotency_key;
};

/**
 * Invoice record store consumed by the settlement poster. Methods report
 * failure through their return values and do not throw.
 */
class InvoiceStore {
 public:
  virtual ~InvoiceStore() = default;

  virtual std::optional<Invoice> getInvoice(const std::string& invoice_id) = 0;

  /**
   * Compare-and-set status change. False when the current status is not
   * `from` or the invoice does not exist.
   */
  virtual bool transitionStatus(const std::string& invoice_id,
                                InvoiceStatus from, InvoiceStatus to) = 0;

  /**
   * Confirmation event of the invoice whose transaction id is any of
   * `transaction_ids`, or whose correlation id equals `correlation_id`.
   */
  virtual std::optional<PaymentEvent> findConfirmationEvent(
      const std::string& invoice_id,
      const std::vector<std::string>& transaction_ids,
      const std::string& correlation_id) = 0;

  virtual std::optional<PaymentEvent> latestConfirmationEvent(const std::string& invoice_id) = 0;

  /**
   * Atomically move the invoice OPEN -> PAID and append `event`.
   * Returns the stored event id, or nullopt if nothing was written.
   */
  virtual std::optional<std::string> markPaidWithEvent(const std::string& invoice_id,
                                                       const PaymentEvent& event) = 0;

  /**
   * Insert or fetch the account identified by (organization id, code).
   */
  virtual std::optional<LedgerAccount> upsertLedgerAccount(const LedgerAccount& account) = 0;

  /**
   * Insert all entries in one transaction. Entries whose idempotency key
   * already exists are skipped.
   */
  virtual bool insertLedgerEntries(const std::vector<LedgerEntry>& entries) = 0;

  virtual std::vector<LedgerEntry> ledgerEntriesFor(const std::string& invoice_id) = 0;
};

}  // namespace posting
}  // namespace settlement

#endif  // INVOICE_STORE_HPP_
