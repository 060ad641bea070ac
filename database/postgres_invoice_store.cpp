#include "postgres_invoice_store.hpp"
#include "observability/logger.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

namespace settlement {
namespace database {

using posting::EntryType;
using posting::Invoice;
using posting::InvoiceStatus;
using posting::LedgerAccount;
using posting::LedgerEntry;
using posting::PaymentEvent;

namespace {

constexpr const char* kEventColumns =
    "id::text, invoice_id, event_type, transaction_id, trim_scale(amount_received)::text, "
    "currency_received, correlation_id, metadata::text, "
    "(EXTRACT(EPOCH FROM created_at) * 1000)::bigint";

std::chrono::system_clock::time_point fromEpochMillis(const char* value) {
  return std::chrono::system_clock::time_point(std::chrono::milliseconds(std::stoll(value)));
}

std::string toEpochMillis(std::chrono::system_clock::time_point tp) {
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
  return std::to_string(ms);
}

std::string metadataToJson(const std::map<std::string, std::string>& metadata) {
  nlohmann::json doc = nlohmann::json::object();
  for (const auto& [key, value] : metadata) {
    doc[key] = value;
  }
  return doc.dump();
}

std::map<std::string, std::string> metadataFromJson(const char* text) {
  std::map<std::string, std::string> metadata;
  auto doc = nlohmann::json::parse(text, nullptr, false);
  if (!doc.is_object()) {
    return metadata;
  }
  for (auto it = doc.begin(); it != doc.end(); ++it) {
    metadata[it.key()] = it.value().is_string() ? it.value().get<std::string>()
                                                : it.value().dump();
  }
  return metadata;
}

PaymentEvent eventFromRow(PGresult* result, int row) {
  PaymentEvent event;
  event.id = PQgetvalue(result, row, 0);
  event.invoice_id = PQgetvalue(result, row, 1);
  event.event_type = PQgetvalue(result, row, 2);
  event.transaction_id = PQgetvalue(result, row, 3);
  event.amount_received = PQgetvalue(result, row, 4);
  event.currency_received = PQgetvalue(result, row, 5);
  event.correlation_id = PQgetvalue(result, row, 6);
  event.metadata = metadataFromJson(PQgetvalue(result, row, 7));
  event.created_at = fromEpochMillis(PQgetvalue(result, row, 8));
  return event;
}

}  // namespace

PostgresInvoiceStore::PostgresInvoiceStore(std::shared_ptr<PostgresConnection> conn)
    : conn_(std::move(conn)) {
}

bool PostgresInvoiceStore::initializeSchema(const std::string& schema_path) {
  std::ifstream schema_file(schema_path);
  if (!schema_file.is_open()) {
    SETTLEMENT_LOG_ERROR("Could not open schema file: " + schema_path);
    return false;
  }

  std::stringstream buffer;
  buffer << schema_file.rdbuf();

  if (!conn_->executeQuery(buffer.str())) {
    SETTLEMENT_LOG_ERROR("Schema initialization failed: " + conn_->getLastError());
    return false;
  }

  SETTLEMENT_LOG_INFO("Database schema initialized from " + schema_path);
  return true;
}

std::optional<Invoice> PostgresInvoiceStore::getInvoice(const std::string& invoice_id) {
  try {
    std::string query = R"(
      SELECT id, organization_id, trim_scale(amount)::text, currency, status,
             (EXTRACT(EPOCH FROM expires_at) * 1000)::bigint
      FROM invoices
      WHERE id = $1
    )";

    auto result = conn_->executeParameterized(query, {invoice_id});
    if (!result || PQntuples(result.get()) == 0) {
      return std::nullopt;
    }

    auto status = posting::parseInvoiceStatus(PQgetvalue(result.get(), 0, 4));
    if (!status) {
      SETTLEMENT_LOG_ERROR("Invoice " + invoice_id + " has unknown status " +
                           PQgetvalue(result.get(), 0, 4));
      return std::nullopt;
    }

    Invoice invoice;
    invoice.id = PQgetvalue(result.get(), 0, 0);
    invoice.organization_id = PQgetvalue(result.get(), 0, 1);
    invoice.amount = PQgetvalue(result.get(), 0, 2);
    invoice.currency = PQgetvalue(result.get(), 0, 3);
    invoice.status = *status;
    if (!PQgetisnull(result.get(), 0, 5)) {
      invoice.expires_at = fromEpochMillis(PQgetvalue(result.get(), 0, 5));
    }
    return invoice;
  } catch (const std::exception& e) {
    SETTLEMENT_LOG_ERROR("Failed to load invoice " + invoice_id + ": " + e.what());
    return std::nullopt;
  }
}

bool PostgresInvoiceStore::transitionStatus(const std::string& invoice_id,
                                            InvoiceStatus from, InvoiceStatus to) {
  std::string query = R"(
    UPDATE invoices
    SET status = $3, updated_at = CURRENT_TIMESTAMP
    WHERE id = $1 AND status = $2
  )";

  auto result = conn_->executeParameterized(
      query, {invoice_id, posting::invoiceStatusToString(from), posting::invoiceStatusToString(to)});
  if (!result) return false;

  return std::string(PQcmdTuples(result.get())) == "1";
}

std::optional<PaymentEvent> PostgresInvoiceStore::findConfirmationEvent(
    const std::string& invoice_id,
    const std::vector<std::string>& transaction_ids,
    const std::string& correlation_id) {
  try {
    std::vector<std::string> params = {invoice_id, correlation_id};
    std::stringstream query;
    query << "SELECT " << kEventColumns
          << " FROM payment_events"
          << " WHERE invoice_id = $1 AND event_type = 'PAYMENT_CONFIRMED'"
          << " AND (correlation_id = $2";
    for (const auto& txid : transaction_ids) {
      params.push_back(txid);
      query << " OR transaction_id = $" << params.size();
    }
    query << ") ORDER BY created_at ASC LIMIT 1";

    auto result = conn_->executeParameterized(query.str(), params);
    if (!result || PQntuples(result.get()) == 0) {
      return std::nullopt;
    }
    return eventFromRow(result.get(), 0);
  } catch (const std::exception& e) {
    SETTLEMENT_LOG_ERROR("Duplicate lookup failed for invoice " + invoice_id + ": " + e.what());
    return std::nullopt;
  }
}

std::optional<PaymentEvent> PostgresInvoiceStore::latestConfirmationEvent(
    const std::string& invoice_id) {
  try {
    std::string query = std::string("SELECT ") + kEventColumns +
                        " FROM payment_events"
                        " WHERE invoice_id = $1 AND event_type = 'PAYMENT_CONFIRMED'"
                        " ORDER BY created_at DESC, id DESC LIMIT 1";

    auto result = conn_->executeParameterized(query, {invoice_id});
    if (!result || PQntuples(result.get()) == 0) {
      return std::nullopt;
    }
    return eventFromRow(result.get(), 0);
  } catch (const std::exception& e) {
    SETTLEMENT_LOG_ERROR("Failed to load confirmation for invoice " + invoice_id + ": " + e.what());
    return std::nullopt;
  }
}

std::optional<std::string> PostgresInvoiceStore::markPaidWithEvent(const std::string& invoice_id,
                                                                   const PaymentEvent& event) {
  try {
    TransactionGuard transaction(*conn_);

    std::string update = R"(
      UPDATE invoices
      SET status = 'PAID', updated_at = CURRENT_TIMESTAMP
      WHERE id = $1 AND status = 'OPEN'
    )";

    auto result = conn_->executeParameterized(update, {invoice_id});
    if (!result || std::string(PQcmdTuples(result.get())) != "1") {
      return std::nullopt;
    }

    std::string insert = R"(
      INSERT INTO payment_events (invoice_id, event_type, transaction_id, amount_received,
                                  currency_received, correlation_id, metadata, created_at)
      VALUES ($1, $2, $3, $4::numeric, $5, $6, $7::jsonb,
              to_timestamp($8::double precision / 1000))
      ON CONFLICT (invoice_id, correlation_id) DO NOTHING
      RETURNING id::text
    )";

    result = conn_->executeParameterized(insert, {
        invoice_id,
        event.event_type,
        event.transaction_id,
        event.amount_received,
        event.currency_received,
        event.correlation_id,
        metadataToJson(event.metadata),
        toEpochMillis(event.created_at)});
    if (!result || PQntuples(result.get()) == 0) {
      return std::nullopt;
    }

    std::string event_id = PQgetvalue(result.get(), 0, 0);
    if (!transaction.commit()) {
      return std::nullopt;
    }
    return event_id;
  } catch (const std::exception& e) {
    SETTLEMENT_LOG_ERROR("Failed to mark invoice " + invoice_id + " paid: " + e.what());
    return std::nullopt;
  }
}

std::optional<LedgerAccount> PostgresInvoiceStore::upsertLedgerAccount(
    const LedgerAccount& account) {
  std::string query = R"(
    INSERT INTO ledger_accounts (organization_id, code, name, account_type)
    VALUES ($1, $2, $3, $4)
    ON CONFLICT (organization_id, code) DO UPDATE SET name = ledger_accounts.name
    RETURNING id::text, organization_id, code, name, account_type
  )";

  auto result = conn_->executeParameterized(
      query, {account.organization_id, account.code, account.name, account.account_type});
  if (!result || PQntuples(result.get()) == 0) {
    return std::nullopt;
  }

  LedgerAccount stored;
  stored.id = PQgetvalue(result.get(), 0, 0);
  stored.organization_id = PQgetvalue(result.get(), 0, 1);
  stored.code = PQgetvalue(result.get(), 0, 2);
  stored.name = PQgetvalue(result.get(), 0, 3);
  stored.account_type = PQgetvalue(result.get(), 0, 4);
  return stored;
}

bool PostgresInvoiceStore::insertLedgerEntries(const std::vector<LedgerEntry>& entries) {
  try {
    TransactionGuard transaction(*conn_);

    std::string query = R"(
      INSERT INTO ledger_entries (invoice_id, organization_id, account_id, entry_type,
                                  amount, currency, description, idempotency_key)
      VALUES ($1, $2, $3::bigint, $4, $5::numeric, $6, $7, $8)
      ON CONFLICT (idempotency_key) DO NOTHING
    )";

    for (const auto& entry : entries) {
      auto result = conn_->executeParameterized(query, {
          entry.invoice_id,
          entry.organization_id,
          entry.account_id,
          posting::entryTypeToString(entry.entry_type),
          entry.amount,
          entry.currency,
          entry.description,
          entry.idempotency_key});
      if (!result) {
        return false;
      }
    }

    return transaction.commit();
  } catch (const std::exception& e) {
    SETTLEMENT_LOG_ERROR(std::string("Failed to insert ledger entries: ") + e.what());
    return false;
  }
}

std::vector<LedgerEntry> PostgresInvoiceStore::ledgerEntriesFor(const std::string& invoice_id) {
  std::vector<LedgerEntry> entries;

  std::string query = R"(
    SELECT e.id::text, e.invoice_id, e.organization_id, e.account_id::text, a.code,
           e.entry_type, trim_scale(e.amount)::text, e.currency, e.description,
           e.idempotency_key
    FROM ledger_entries e
    JOIN ledger_accounts a ON a.id = e.account_id
    WHERE e.invoice_id = $1
    ORDER BY e.id
  )";

  auto result = conn_->executeParameterized(query, {invoice_id});
  if (!result) return entries;

  int rows = PQntuples(result.get());
  for (int i = 0; i < rows; ++i) {
    LedgerEntry entry;
    entry.id = PQgetvalue(result.get(), i, 0);
    entry.invoice_id = PQgetvalue(result.get(), i, 1);
    entry.organization_id = PQgetvalue(result.get(), i, 2);
    entry.account_id = PQgetvalue(result.get(), i, 3);
    entry.account_code = PQgetvalue(result.get(), i, 4);
    entry.entry_type = std::string(PQgetvalue(result.get(), i, 5)) == "CREDIT"
                           ? EntryType::CREDIT : EntryType::DEBIT;
    entry.amount = PQgetvalue(result.get(), i, 6);
    entry.currency = PQgetvalue(result.get(), i, 7);
    entry.description = PQgetvalue(result.get(), i, 8);
    entry.idempotency_key = PQgetvalue(result.get(), i, 9);
    entries.push_back(std::move(entry));
  }
  return entries;
}

bool PostgresInvoiceStore::saveInvoice(const Invoice& invoice) {
  std::string query = R"(
    INSERT INTO invoices (id, organization_id, amount, currency, status, expires_at)
    VALUES ($1, $2, $3::numeric, $4, $5,
            to_timestamp(NULLIF($6::text, '')::double precision / 1000))
    ON CONFLICT (id) DO UPDATE SET
      organization_id = EXCLUDED.organization_id,
      amount = EXCLUDED.amount,
      currency = EXCLUDED.currency,
      status = EXCLUDED.status,
      expires_at = EXCLUDED.expires_at,
      updated_at = CURRENT_TIMESTAMP
  )";

  std::string expires = invoice.expires_at ? toEpochMillis(*invoice.expires_at) : "";
  auto result = conn_->executeParameterized(query, {
      invoice.id,
      invoice.organization_id,
      invoice.amount,
      invoice.currency,
      posting::invoiceStatusToString(invoice.status),
      expires});
  return result != nullptr;
}

}  // namespace database
}  // namespace settlement
