#ifndef POSTGRES_INVOICE_STORE_HPP_
#define POSTGRES_INVOICE_STORE_HPP_

#include "postgres_connection.hpp"
#include "../settlement/invoice_store.hpp"

#include <memory>
#include <string>

namespace settlement {
namespace database {

/**
 * InvoiceStore backed by PostgreSQL (see database/schema.sql).
 *
 * Amounts are stored as NUMERIC and read back as trimmed decimal text.
 * Event metadata is kept in a JSONB column.
 */
class PostgresInvoiceStore : public posting::InvoiceStore {
 public:
  explicit PostgresInvoiceStore(std::shared_ptr<PostgresConnection> conn);
  ~PostgresInvoiceStore() override = default;

  // Non-copyable
  PostgresInvoiceStore(const PostgresInvoiceStore&) = delete;
  PostgresInvoiceStore& operator=(const PostgresInvoiceStore&) = delete;

  /**
   * Run the schema file against the connection.
   */
  bool initializeSchema(const std::string& schema_path = "database/schema.sql");

  std::optional<posting::Invoice> getInvoice(const std::string& invoice_id) override;
  bool transitionStatus(const std::string& invoice_id,
                        posting::InvoiceStatus from, posting::InvoiceStatus to) override;
  std::optional<posting::PaymentEvent> findConfirmationEvent(
      const std::string& invoice_id,
      const std::vector<std::string>& transaction_ids,
      const std::string& correlation_id) override;
  std::optional<posting::PaymentEvent> latestConfirmationEvent(
      const std::string& invoice_id) override;
  std::optional<std::string> markPaidWithEvent(const std::string& invoice_id,
                                               const posting::PaymentEvent& event) override;
  std::optional<posting::LedgerAccount> upsertLedgerAccount(
      const posting::LedgerAccount& account) override;
  bool insertLedgerEntries(const std::vector<posting::LedgerEntry>& entries) override;
  std::vector<posting::LedgerEntry> ledgerEntriesFor(const std::string& invoice_id) override;

  /**
   * Create or replace an invoice row. Used by tooling and integration setups.
   */
  bool saveInvoice(const posting::Invoice& invoice);

 private:
  std::shared_ptr<PostgresConnection> conn_;
};

}  // namespace database
}  // namespace settlement

#endif  // POSTGRES_INVOICE_STORE_HPP_
