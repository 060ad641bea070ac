#ifndef IN_MEMORY_INVOICE_STORE_HPP_
#define IN_MEMORY_INVOICE_STORE_HPP_

#include "invoice_store.hpp"

#include <atomic>
#include <cstdint>
#include <shared_mutex>
#include <unordered_map>

namespace settlement {
namespace posting {

/**
 * Thread-safe InvoiceStore kept in process memory. Used by the monitor when
 * no database is configured, and by tests.
 */
class InMemoryInvoiceStore : public InvoiceStore {
 public:
  InMemoryInvoiceStore() = default;
  ~InMemoryInvoiceStore() override = default;

  // Non-copyable
  InMemoryInvoiceStore(const InMemoryInvoiceStore&) = delete;
  InMemoryInvoiceStore& operator=(const InMemoryInvoiceStore&) = delete;

  void addInvoice(const Invoice& invoice);

  std::optional<Invoice> getInvoice(const std::string& invoice_id) override;
  bool transitionStatus(const std::string& invoice_id,
                        InvoiceStatus from, InvoiceStatus to) override;
  std::optional<PaymentEvent> findConfirmationEvent(
      const std::string& invoice_id,
      const std::vector<std::string>& transaction_ids,
      const std::string& correlation_id) override;
  std::optional<PaymentEvent> latestConfirmationEvent(const std::string& invoice_id) override;
  std::optional<std::string> markPaidWithEvent(const std::string& invoice_id,
                                               const PaymentEvent& event) override;
  std::optional<LedgerAccount> upsertLedgerAccount(const LedgerAccount& account) override;
  bool insertLedgerEntries(const std::vector<LedgerEntry>& entries) override;
  std::vector<LedgerEntry> ledgerEntriesFor(const std::string& invoice_id) override;

  std::vector<PaymentEvent> eventsFor(const std::string& invoice_id) const;
  std::vector<LedgerAccount> ledgerAccounts() const;
  size_t totalLedgerEntries() const;

 private:
  std::string nextId(const std::string& prefix);

  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, Invoice> invoices_;
  std::vector<PaymentEvent> events_;
  std::unordered_map<std::string, LedgerAccount> accounts_;  // key: org|code
  std::vector<LedgerEntry> entries_;
  std::atomic<uint64_t> id_counter_{0};
};

}  // namespace posting
}  // namespace settlement

#endif  // IN_MEMORY_INVOICE_STORE_HPP_
