#include "settlement_poster.hpp"
#include "account_mapping.hpp"
#include "hedera/amount_codec.hpp"
#include "hedera/transaction_id.hpp"
#include "observability/logger.hpp"
#include "observability/metrics.hpp"

#include <algorithm>
#include <ctime>
#include <limits>
#include <map>
#include <stdexcept>

namespace settlement {
namespace posting {

using observability::LogLevel;

namespace {

SettlementResult makeResult(SettlementStatus status, bool success, bool retryable,
                            const std::string& message) {
  SettlementResult result;
  result.status = status;
  result.success = success;
  result.retryable = retryable;
  result.message = message;
  return result;
}

std::string isoTimestamp(std::chrono::system_clock::time_point time) {
  auto seconds = std::chrono::system_clock::to_time_t(time);
  std::tm utc{};
  gmtime_r(&seconds, &utc);
  char buffer[32];
  std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utc);
  return buffer;
}

}  // namespace

std::string settlementStatusToString(SettlementStatus status) {
  switch (status) {
    case SettlementStatus::POSTED: return "POSTED";
    case SettlementStatus::DUPLICATE: return "DUPLICATE";
    case SettlementStatus::REJECTED: return "REJECTED";
    case SettlementStatus::LOCK_CONTENTION: return "LOCK_CONTENTION";
    case SettlementStatus::LEDGER_PENDING: return "LEDGER_PENDING";
    case SettlementStatus::FAILED: return "FAILED";
    default: return "UNKNOWN";
  }
}

SettlementPoster::SettlementPoster(InvoiceStore& store, AdvisoryLock& lock,
                                   SyncQueue& sync_queue, Clock clock)
    : store_(store), lock_(lock), sync_queue_(sync_queue), clock_(std::move(clock)) {
  if (!clock_) {
    clock_ = [] { return std::chrono::system_clock::now(); };
  }
}

std::optional<PaymentEvent> SettlementPoster::findDuplicate(
    const std::string& invoice_id, const std::string& normalized_transaction_id,
    const std::string& raw_transaction_id, const std::string& correlation_id) {
  std::vector<std::string> ids = {normalized_transaction_id};
  if (raw_transaction_id != normalized_transaction_id) {
    ids.push_back(raw_transaction_id);
  }
  return store_.findConfirmationEvent(invoice_id, ids, correlation_id);
}

PaymentAttemptCheck SettlementPoster::validatePaymentAttempt(const std::string& invoice_id) {
  PaymentAttemptCheck check;
  auto invoice = store_.getInvoice(invoice_id);

  if (!invoice) {
    check.reason = "Payment link not found";
    check.suggested_action = "Contact merchant for a new payment link";
    return check;
  }

  check.current_status = invoice->status;

  switch (invoice->status) {
    case InvoiceStatus::PAID:
      SETTLEMENT_LOG_BUILDER(LogLevel::WARN, "Payment attempt on already paid invoice")
          .field("invoice_id", invoice_id);
      check.reason = "This payment link has already been paid";
      check.suggested_action = "Contact merchant if you believe this is an error";
      return check;

    case InvoiceStatus::CANCELED:
      SETTLEMENT_LOG_BUILDER(LogLevel::WARN, "Payment attempt on canceled invoice")
          .field("invoice_id", invoice_id);
      check.reason = "This payment link has been canceled";
      check.suggested_action = "Request a new payment link from the merchant";
      return check;

    case InvoiceStatus::EXPIRED:
      check.reason = "This payment link has expired";
      check.suggested_action = "Request a new payment link from the merchant";
      return check;

    case InvoiceStatus::DRAFT:
      check.reason = "Payment link status is DRAFT, expected OPEN";
      check.suggested_action = "Ask the merchant to publish the payment link";
      return check;

    case InvoiceStatus::OPEN:
      break;
  }

  if (invoice->expires_at && *invoice->expires_at < clock_()) {
    SETTLEMENT_LOG_BUILDER(LogLevel::WARN, "Payment attempt on expired invoice")
        .field("invoice_id", invoice_id);
    if (!store_.transitionStatus(invoice_id, InvoiceStatus::OPEN, InvoiceStatus::EXPIRED)) {
      SETTLEMENT_LOG_WARN("Could not move invoice " + invoice_id + " to EXPIRED");
    }
    check.current_status = InvoiceStatus::EXPIRED;
    check.reason = "This payment link has expired";
    check.suggested_action = "Request a new payment link from the merchant";
    return check;
  }

  check.allowed = true;
  return check;
}

PaymentEvent SettlementPoster::buildEvent(const ConfirmationRequest& request,
                                          const std::string& normalized_transaction_id,
                                          const std::string& correlation_id) const {
  PaymentEvent event;
  event.invoice_id = request.invoice_id;
  event.event_type = "PAYMENT_CONFIRMED";
  event.transaction_id = normalized_transaction_id;
  event.amount_received = request.amount_received;
  event.currency_received = hedera::tokenSymbol(request.token);
  event.correlation_id = correlation_id;
  event.created_at = clock_();

  event.metadata["token"] = hedera::tokenSymbol(request.token);
  event.metadata["raw_transaction_id"] = request.transaction_id;
  event.metadata["normalized_transaction_id"] = normalized_transaction_id;
  event.metadata["sender"] = request.sender;
  event.metadata["consensus_timestamp"] = request.consensus_timestamp;
  event.metadata["merchant_account"] = request.merchant_account_id;
  event.metadata["network"] = hedera::networkName(request.network);
  event.metadata["mirror_url"] = request.mirror_url.empty()
                                     ? hedera::mirrorNodeUrl(request.network)
                                     : request.mirror_url;
  event.metadata["confirmed_at"] = isoTimestamp(event.created_at);
  if (request.memo) {
    event.metadata["memo"] = *request.memo;
  }
  return event;
}

SettlementResult SettlementPoster::confirmPayment(const ConfirmationRequest& request) {
  auto& metrics = observability::getGlobalMetrics();
  const observability::Labels token_label{{"token", hedera::tokenSymbol(request.token)}};
  const std::string normalized = hedera::normalize(request.transaction_id);
  const std::string correlation_id = hedera::correlationId(request.network_prefix, normalized);

  auto finish = [&](SettlementResult result) {
    result.correlation_id = correlation_id;
    result.normalized_transaction_id = normalized;
    return result;
  };

  SETTLEMENT_LOG_BUILDER(LogLevel::INFO, "Starting payment confirmation")
      .correlation(correlation_id)
      .field("invoice_id", request.invoice_id)
      .field("raw_transaction_id", request.transaction_id)
      .field("token", hedera::tokenSymbol(request.token))
      .field("amount_received", request.amount_received);

  try {
    // Duplicate check before any side effect
    if (auto existing = findDuplicate(request.invoice_id, normalized,
                                      request.transaction_id, correlation_id)) {
      metrics.incrementCounter("settlement_duplicate_total", token_label);
      SETTLEMENT_LOG_BUILDER(LogLevel::INFO, "Payment already processed")
          .correlation(correlation_id)
          .field("existing_event_id", existing->id);
      auto result = makeResult(SettlementStatus::DUPLICATE, true, false,
                               "Payment already processed");
      result.payment_event_id = existing->id;
      return finish(result);
    }

    PaymentAttemptCheck attempt = validatePaymentAttempt(request.invoice_id);
    if (!attempt.allowed) {
      // A concurrent settlement of this same transaction may have just landed
      if (attempt.current_status == InvoiceStatus::PAID) {
        if (auto existing = findDuplicate(request.invoice_id, normalized,
                                          request.transaction_id, correlation_id)) {
          metrics.incrementCounter("settlement_duplicate_total", token_label);
          auto result = makeResult(SettlementStatus::DUPLICATE, true, false,
                                   "Payment already processed");
          result.payment_event_id = existing->id;
          return finish(result);
        }
      }
      return finish(makeResult(SettlementStatus::REJECTED, false, false, attempt.reason));
    }

    AdvisoryLockGuard guard(lock_, invoiceLockKey(request.invoice_id));
    if (!guard.ownsLock()) {
      metrics.incrementCounter("settlement_lock_contention_total", token_label);
      SETTLEMENT_LOG_BUILDER(LogLevel::WARN, "Invoice is locked by another settlement")
          .correlation(correlation_id)
          .field("invoice_id", request.invoice_id);
      return finish(makeResult(SettlementStatus::LOCK_CONTENTION, false, true,
                               "Payment is being processed by another request, "
                               "try again shortly"));
    }

    // State may have moved between the pre-checks and the lock
    if (auto existing = findDuplicate(request.invoice_id, normalized,
                                      request.transaction_id, correlation_id)) {
      metrics.incrementCounter("settlement_duplicate_total", token_label);
      auto result = makeResult(SettlementStatus::DUPLICATE, true, false,
                               "Payment already processed");
      result.payment_event_id = existing->id;
      return finish(result);
    }

    auto invoice = store_.getInvoice(request.invoice_id);
    if (!invoice) {
      return finish(makeResult(SettlementStatus::REJECTED, false, false,
                               "Payment link not found"));
    }
    if (invoice->status == InvoiceStatus::PAID) {
      return finish(makeResult(SettlementStatus::REJECTED, false, false,
                               "This payment link has already been paid"));
    }
    if (invoice->status != InvoiceStatus::OPEN) {
      return finish(makeResult(SettlementStatus::REJECTED, false, false,
                               "Payment link status is " +
                                   invoiceStatusToString(invoice->status) +
                                   ", expected OPEN"));
    }

    PaymentEvent event = buildEvent(request, normalized, correlation_id);
    auto event_id = store_.markPaidWithEvent(request.invoice_id, event);
    if (!event_id) {
      SETTLEMENT_LOG_BUILDER(LogLevel::ERROR, "Failed to record payment confirmation")
          .correlation(correlation_id)
          .field("invoice_id", request.invoice_id);
      return finish(makeResult(SettlementStatus::FAILED, false, true,
                               "Failed to record payment confirmation"));
    }
    event.id = *event_id;

    SETTLEMENT_LOG_BUILDER(LogLevel::INFO, "Invoice marked as paid")
        .correlation(correlation_id)
        .field("invoice_id", request.invoice_id)
        .field("payment_event_id", event.id);

    LedgerPostingResult posting = postLedgerEntries(*invoice, event, request.token);
    if (!posting.success) {
      auto result = makeResult(SettlementStatus::LEDGER_PENDING, true, true,
                               "Payment confirmed; ledger posting pending: " + posting.error);
      result.payment_event_id = event.id;
      return finish(result);
    }

    enqueueSync(*invoice, correlation_id);

    metrics.incrementCounter("settlement_posted_total", token_label);
    auto result = makeResult(SettlementStatus::POSTED, true, false, "Payment confirmed");
    result.payment_event_id = event.id;
    return finish(result);

  } catch (const std::exception& e) {
    SETTLEMENT_LOG_BUILDER(LogLevel::ERROR, "Payment confirmation failed")
        .correlation(correlation_id)
        .field("invoice_id", request.invoice_id)
        .field("error", e.what());
    return finish(makeResult(SettlementStatus::FAILED, false, true, e.what()));
  }
}

LedgerPostingResult SettlementPoster::postLedgerEntries(const Invoice& invoice,
                                                        const PaymentEvent& event,
                                                        hedera::TokenType token) {
  LedgerPostingResult result;

  try {
    auto clearing = store_.upsertLedgerAccount(clearingAccountFor(invoice.organization_id, token));
    auto receivables = store_.upsertLedgerAccount(receivablesAccountFor(invoice.organization_id));
    if (!clearing || !receivables) {
      throw std::runtime_error("Ledger accounts could not be provisioned");
    }
    validateTokenAccountMapping(token, clearing->code);

    const std::string description = hedera::tokenSymbol(token) + " payment received - " +
                                    event.transaction_id;

    LedgerEntry debit;
    debit.invoice_id = invoice.id;
    debit.organization_id = invoice.organization_id;
    debit.account_id = clearing->id;
    debit.account_code = clearing->code;
    debit.entry_type = EntryType::DEBIT;
    debit.amount = invoice.amount;
    debit.currency = invoice.currency;
    debit.description = description;
    debit.idempotency_key = event.correlation_id + "-debit";

    LedgerEntry credit = debit;
    credit.account_id = receivables->id;
    credit.account_code = receivables->code;
    credit.entry_type = EntryType::CREDIT;
    credit.idempotency_key = event.correlation_id + "-credit";

    std::vector<LedgerEntry> entries = {debit, credit};

    std::string balance_error;
    if (!validatePostingBalance(entries, &balance_error)) {
      throw std::runtime_error(balance_error);
    }

    if (!store_.insertLedgerEntries(entries)) {
      throw std::runtime_error("Ledger entries could not be written");
    }

    SETTLEMENT_LOG_BUILDER(LogLevel::INFO, "Ledger entries posted")
        .correlation(event.correlation_id)
        .field("invoice_id", invoice.id)
        .field("amount", invoice.amount)
        .field("currency", invoice.currency)
        .field("clearing_account", clearing->code);

    result.success = true;
    result.entries = std::move(entries);
  } catch (const std::exception& e) {
    SETTLEMENT_LOG_BUILDER(LogLevel::ERROR, "Ledger posting failed after confirmation")
        .correlation(event.correlation_id)
        .field("invoice_id", invoice.id)
        .field("error", e.what());
    result.error = e.what();
  }
  return result;
}

void SettlementPoster::enqueueSync(const Invoice& invoice, const std::string& correlation_id) {
  SyncJob job;
  job.invoice_id = invoice.id;
  job.organization_id = invoice.organization_id;
  job.correlation_id = correlation_id;

  try {
    if (!sync_queue_.enqueue(job)) {
      SETTLEMENT_LOG_BUILDER(LogLevel::ERROR, "Failed to enqueue ledger sync")
          .correlation(correlation_id)
          .field("invoice_id", invoice.id);
    }
  } catch (const std::exception& e) {
    SETTLEMENT_LOG_BUILDER(LogLevel::ERROR, "Failed to enqueue ledger sync")
        .correlation(correlation_id)
        .field("invoice_id", invoice.id)
        .field("error", e.what());
  }
}

bool SettlementPoster::hasLedgerEntries(const std::string& invoice_id) {
  return !store_.ledgerEntriesFor(invoice_id).empty();
}

LedgerPostingResult SettlementPoster::retryLedgerPosting(const std::string& invoice_id) {
  LedgerPostingResult result;

  AdvisoryLockGuard guard(lock_, invoiceLockKey(invoice_id));
  if (!guard.ownsLock()) {
    result.error = "Payment is being processed by another request";
    return result;
  }

  if (hasLedgerEntries(invoice_id)) {
    SETTLEMENT_LOG_INFO("Ledger entries already exist for invoice " + invoice_id);
    result.success = true;
    result.already_posted = true;
    return result;
  }

  auto invoice = store_.getInvoice(invoice_id);
  if (!invoice) {
    result.error = "Payment link not found";
    return result;
  }
  if (invoice->status != InvoiceStatus::PAID) {
    result.error = "Invoice is not paid";
    return result;
  }

  auto event = store_.latestConfirmationEvent(invoice_id);
  if (!event) {
    result.error = "No PAYMENT_CONFIRMED event found";
    return result;
  }

  auto token_name = event->metadata.find("token");
  std::optional<hedera::TokenType> token =
      hedera::parseTokenType(token_name != event->metadata.end() ? token_name->second
                                                                 : event->currency_received);
  if (!token) {
    result.error = "Unknown token on confirmation event";
    return result;
  }

  SETTLEMENT_LOG_BUILDER(LogLevel::INFO, "Retrying ledger posting")
      .correlation(event->correlation_id)
      .field("invoice_id", invoice_id);
  result = postLedgerEntries(*invoice, *event, *token);
  if (result.success && !result.already_posted) {
    enqueueSync(*invoice, event->correlation_id);
  }
  return result;
}

bool SettlementPoster::validatePostingBalance(const std::vector<LedgerEntry>& entries,
                                              std::string* error) {
  auto fail = [error](const std::string& message) {
    if (error) *error = message;
    return false;
  };

  if (entries.empty()) {
    return fail("No ledger entries to post");
  }

  int decimals = 0;
  for (const auto& entry : entries) {
    decimals = std::max(decimals, hedera::fractionDigits(entry.amount));
  }
  if (decimals > hedera::kMaxDecimals) {
    return fail("Ledger amount precision exceeds 18 decimal places");
  }

  std::map<std::string, std::pair<int64_t, int64_t>> totals;  // currency -> (debit, credit)
  try {
    for (const auto& entry : entries) {
      int64_t units = hedera::toSmallestUnit(entry.amount, decimals);
      auto& total = totals[entry.currency];
      int64_t& side = entry.entry_type == EntryType::DEBIT ? total.first : total.second;
      if (side > std::numeric_limits<int64_t>::max() - units) {
        return fail("Ledger totals overflow");
      }
      side += units;
    }
  } catch (const std::exception& e) {
    return fail(std::string("Invalid ledger amount: ") + e.what());
  }

  for (const auto& [currency, total] : totals) {
    if (total.first != total.second) {
      return fail("Unbalanced posting in " + currency + ": debits " +
                  hedera::fromSmallestUnit(total.first, decimals) + " != credits " +
                  hedera::fromSmallestUnit(total.second, decimals));
    }
  }
  return true;
}

std::vector<BatchItemResult> SettlementPoster::batchConfirm(
    const std::vector<ConfirmationRequest>& requests) {
  std::vector<BatchItemResult> results;
  results.reserve(requests.size());

  for (const auto& request : requests) {
    results.push_back({request.invoice_id, request.transaction_id, confirmPayment(request)});
  }
  return results;
}

}  // namespace posting
}  // namespace settlement
