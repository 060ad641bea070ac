#include "in_memory_invoice_store.hpp"

#include <algorithm>
#include <mutex>
#include <unordered_set>

namespace settlement {
namespace posting {

std::string InMemoryInvoiceStore::nextId(const std::string& prefix) {
  return prefix + "_" + std::to_string(id_counter_.fetch_add(1) + 1);
}

void InMemoryInvoiceStore::addInvoice(const Invoice& invoice) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  invoices_[invoice.id] = invoice;
}

std::optional<Invoice> InMemoryInvoiceStore::getInvoice(const std::string& invoice_id) {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto it = invoices_.find(invoice_id);
  if (it == invoices_.end()) return std::nullopt;
  return it->second;
}

bool InMemoryInvoiceStore::transitionStatus(const std::string& invoice_id,
                                            InvoiceStatus from, InvoiceStatus to) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  auto it = invoices_.find(invoice_id);
  if (it == invoices_.end() || it->second.status != from) return false;
  it->second.status = to;
  return true;
}

std::optional<PaymentEvent> InMemoryInvoiceStore::findConfirmationEvent(
    const std::string& invoice_id,
    const std::vector<std::string>& transaction_ids,
    const std::string& correlation_id) {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  for (const auto& event : events_) {
    if (event.invoice_id != invoice_id || event.event_type != "PAYMENT_CONFIRMED") continue;

    bool same_tx = std::find(transaction_ids.begin(), transaction_ids.end(),
                             event.transaction_id) != transaction_ids.end();
    bool same_correlation = !correlation_id.empty() && event.correlation_id == correlation_id;
    if (same_tx || same_correlation) {
      return event;
    }
  }
  return std::nullopt;
}

std::optional<PaymentEvent> InMemoryInvoiceStore::latestConfirmationEvent(
    const std::string& invoice_id) {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  for (auto it = events_.rbegin(); it != events_.rend(); ++it) {
    if (it->invoice_id == invoice_id && it->event_type == "PAYMENT_CONFIRMED") {
      return *it;
    }
  }
  return std::nullopt;
}

std::optional<std::string> InMemoryInvoiceStore::markPaidWithEvent(const std::string& invoice_id,
                                                                   const PaymentEvent& event) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  auto it = invoices_.find(invoice_id);
  if (it == invoices_.end() || it->second.status != InvoiceStatus::OPEN) {
    return std::nullopt;
  }

  for (const auto& existing : events_) {
    if (existing.invoice_id == invoice_id && existing.correlation_id == event.correlation_id) {
      return std::nullopt;
    }
  }

  PaymentEvent stored = event;
  stored.id = nextId("evt");
  stored.invoice_id = invoice_id;
  it->second.status = InvoiceStatus::PAID;
  events_.push_back(stored);
  return stored.id;
}

std::optional<LedgerAccount> InMemoryInvoiceStore::upsertLedgerAccount(
    const LedgerAccount& account) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  const std::string key = account.organization_id + "|" + account.code;

  auto it = accounts_.find(key);
  if (it != accounts_.end()) {
    return it->second;
  }

  LedgerAccount stored = account;
  stored.id = nextId("acct");
  accounts_[key] = stored;
  return stored;
}

bool InMemoryInvoiceStore::insertLedgerEntries(const std::vector<LedgerEntry>& entries) {
  std::unique_lock<std::shared_mutex> lock(mutex_);

  std::unordered_set<std::string> existing;
  for (const auto& entry : entries_) {
    existing.insert(entry.idempotency_key);
  }

  for (const auto& entry : entries) {
    if (existing.count(entry.idempotency_key) > 0) continue;
    LedgerEntry stored = entry;
    stored.id = nextId("le");
    entries_.push_back(stored);
    existing.insert(stored.idempotency_key);
  }
  return true;
}

std::vector<LedgerEntry> InMemoryInvoiceStore::ledgerEntriesFor(const std::string& invoice_id) {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  std::vector<LedgerEntry> result;
  for (const auto& entry : entries_) {
    if (entry.invoice_id == invoice_id) result.push_back(entry);
  }
  return result;
}

std::vector<PaymentEvent> InMemoryInvoiceStore::eventsFor(const std::string& invoice_id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  std::vector<PaymentEvent> result;
  for (const auto& event : events_) {
    if (event.invoice_id == invoice_id) result.push_back(event);
  }
  return result;
}

std::vector<LedgerAccount> InMemoryInvoiceStore::ledgerAccounts() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  std::vector<LedgerAccount> result;
  for (const auto& [key, account] : accounts_) {
    result.push_back(account);
  }
  return result;
}

size_t InMemoryInvoiceStore::totalLedgerEntries() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return entries_.size();
}

}  // namespace posting
}  // namespace settlement
