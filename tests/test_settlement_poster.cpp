#include "settlement/settlement_poster.hpp"
#include "settlement/account_mapping.hpp"
#include "settlement/in_memory_invoice_store.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace settlement;
using namespace settlement::posting;

namespace {

const char* kOrg = "org-1";
const char* kAtId = "0.0.5363033@1769582713.055549545";
const char* kDashId = "0.0.5363033-1769582713-055549545";

std::chrono::system_clock::time_point fixedNow() {
  return std::chrono::system_clock::time_point(std::chrono::seconds(1769582800));
}

// Counts acquisitions so tests can tell whether the lock was reached
class CountingLock : public AdvisoryLock {
 public:
  bool tryAcquire(const std::string& key) override {
    ++acquisitions;
    return inner_.tryAcquire(key);
  }
  void release(const std::string& key) override { inner_.release(key); }

  std::atomic<int> acquisitions{0};

 private:
  KeyedMutexLock inner_;
};

class AlwaysLockedLock : public AdvisoryLock {
 public:
  bool tryAcquire(const std::string&) override { return false; }
  void release(const std::string&) override {}
};

// Ledger writes fail until `healthy` is set
class FlakyLedgerStore : public InMemoryInvoiceStore {
 public:
  bool insertLedgerEntries(const std::vector<LedgerEntry>& entries) override {
    if (!healthy) return false;
    return InMemoryInvoiceStore::insertLedgerEntries(entries);
  }

  std::atomic<bool> healthy{false};
};

Invoice openInvoice(const std::string& id, const std::string& amount = "50.00") {
  Invoice invoice;
  invoice.id = id;
  invoice.organization_id = kOrg;
  invoice.amount = amount;
  invoice.currency = "USD";
  invoice.status = InvoiceStatus::OPEN;
  return invoice;
}

ConfirmationRequest usdcConfirmation(const std::string& invoice_id,
                                     const std::string& transaction_id = kAtId) {
  ConfirmationRequest request;
  request.invoice_id = invoice_id;
  request.transaction_id = transaction_id;
  request.token = hedera::TokenType::USDC;
  request.amount_received = "50.00";
  request.sender = "0.0.5363033";
  request.consensus_timestamp = "1769582714.000000001";
  request.merchant_account_id = "0.0.7001";
  request.network = hedera::Network::TESTNET;
  return request;
}

}  // namespace

class SettlementPosterTest : public ::testing::Test {
 protected:
  void SetUp() override {
    store_.addInvoice(openInvoice("INV-001"));
  }

  InMemoryInvoiceStore store_;
  CountingLock lock_;
  InMemorySyncQueue sync_queue_;
  SettlementPoster poster_{store_, lock_, sync_queue_, fixedNow};
};

// Basic posting tests

TEST_F(SettlementPosterTest, PostsBalancedEntriesForStablecoinPayment) {
  SettlementResult result = poster_.confirmPayment(usdcConfirmation("INV-001"));

  EXPECT_EQ(result.status, SettlementStatus::POSTED);
  EXPECT_TRUE(result.success);
  EXPECT_FALSE(result.retryable);
  EXPECT_EQ(result.normalized_transaction_id, kDashId);
  EXPECT_EQ(result.correlation_id, std::string("hedera_") + kDashId);
  EXPECT_FALSE(result.payment_event_id.empty());

  EXPECT_EQ(store_.getInvoice("INV-001")->status, InvoiceStatus::PAID);

  auto entries = store_.ledgerEntriesFor("INV-001");
  ASSERT_EQ(entries.size(), 2u);
  EXPECT_EQ(entries[0].entry_type, EntryType::DEBIT);
  EXPECT_EQ(entries[0].account_code, "1052");
  EXPECT_EQ(entries[0].amount, "50.00");
  EXPECT_EQ(entries[0].currency, "USD");
  EXPECT_EQ(entries[0].idempotency_key, result.correlation_id + "-debit");
  EXPECT_EQ(entries[1].entry_type, EntryType::CREDIT);
  EXPECT_EQ(entries[1].account_code, kAccountsReceivableCode);
  EXPECT_EQ(entries[1].amount, "50.00");
  EXPECT_TRUE(SettlementPoster::validatePostingBalance(entries));

  auto events = store_.eventsFor("INV-001");
  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(events[0].transaction_id, kDashId);
  EXPECT_EQ(events[0].currency_received, "USDC");
  EXPECT_EQ(events[0].metadata["raw_transaction_id"], kAtId);
  EXPECT_EQ(events[0].metadata["network"], "testnet");

  auto job = sync_queue_.dequeue();
  ASSERT_TRUE(job.has_value());
  EXPECT_EQ(job->invoice_id, "INV-001");
  EXPECT_EQ(job->organization_id, kOrg);
  EXPECT_EQ(job->correlation_id, result.correlation_id);
}

TEST_F(SettlementPosterTest, EitherIdFormatIsTheSamePayment) {
  ASSERT_EQ(poster_.confirmPayment(usdcConfirmation("INV-001", kAtId)).status,
            SettlementStatus::POSTED);

  SettlementResult again = poster_.confirmPayment(usdcConfirmation("INV-001", kDashId));
  EXPECT_EQ(again.status, SettlementStatus::DUPLICATE);
  EXPECT_TRUE(again.success);
  EXPECT_EQ(again.message, "Payment already processed");

  EXPECT_EQ(store_.eventsFor("INV-001").size(), 1u);
  EXPECT_EQ(store_.totalLedgerEntries(), 2u);
  EXPECT_EQ(sync_queue_.size(), 1u);
}

TEST_F(SettlementPosterTest, SecondTransactionOnPaidInvoiceIsRejectedBeforeLock) {
  ASSERT_EQ(poster_.confirmPayment(usdcConfirmation("INV-001")).status,
            SettlementStatus::POSTED);
  int acquisitions = lock_.acquisitions.load();

  SettlementResult other = poster_.confirmPayment(
      usdcConfirmation("INV-001", "0.0.5363033@1769582799.000000001"));
  EXPECT_EQ(other.status, SettlementStatus::REJECTED);
  EXPECT_FALSE(other.success);
  EXPECT_EQ(other.message, "This payment link has already been paid");
  EXPECT_EQ(lock_.acquisitions.load(), acquisitions);
}

TEST_F(SettlementPosterTest, RejectsUnpayableInvoices) {
  Invoice canceled = openInvoice("INV-CANCELED");
  canceled.status = InvoiceStatus::CANCELED;
  store_.addInvoice(canceled);
  Invoice draft = openInvoice("INV-DRAFT");
  draft.status = InvoiceStatus::DRAFT;
  store_.addInvoice(draft);

  EXPECT_EQ(poster_.confirmPayment(usdcConfirmation("INV-MISSING")).message,
            "Payment link not found");
  EXPECT_EQ(poster_.confirmPayment(usdcConfirmation("INV-CANCELED")).message,
            "This payment link has been canceled");
  EXPECT_EQ(poster_.confirmPayment(usdcConfirmation("INV-DRAFT")).message,
            "Payment link status is DRAFT, expected OPEN");
  EXPECT_EQ(lock_.acquisitions.load(), 0);
  EXPECT_EQ(store_.totalLedgerEntries(), 0u);
}

TEST_F(SettlementPosterTest, ExpiredInvoiceTransitionsAndRejects) {
  Invoice stale = openInvoice("INV-STALE");
  stale.expires_at = fixedNow() - std::chrono::minutes(1);
  store_.addInvoice(stale);

  PaymentAttemptCheck check = poster_.validatePaymentAttempt("INV-STALE");
  EXPECT_FALSE(check.allowed);
  EXPECT_EQ(check.reason, "This payment link has expired");
  EXPECT_EQ(store_.getInvoice("INV-STALE")->status, InvoiceStatus::EXPIRED);

  SettlementResult result = poster_.confirmPayment(usdcConfirmation("INV-STALE"));
  EXPECT_EQ(result.status, SettlementStatus::REJECTED);

  Invoice fresh = openInvoice("INV-FRESH");
  fresh.expires_at = fixedNow() + std::chrono::minutes(10);
  store_.addInvoice(fresh);
  EXPECT_TRUE(poster_.validatePaymentAttempt("INV-FRESH").allowed);
}

TEST_F(SettlementPosterTest, ContendedLockIsRetryable) {
  AlwaysLockedLock locked;
  SettlementPoster poster(store_, locked, sync_queue_, fixedNow);

  SettlementResult result = poster.confirmPayment(usdcConfirmation("INV-001"));
  EXPECT_EQ(result.status, SettlementStatus::LOCK_CONTENTION);
  EXPECT_FALSE(result.success);
  EXPECT_TRUE(result.retryable);
  EXPECT_EQ(store_.getInvoice("INV-001")->status, InvoiceStatus::OPEN);
}

// Advisory lock tests

TEST(KeyedMutexLockTest, ReleasedKeysAreForgotten) {
  KeyedMutexLock lock;
  EXPECT_TRUE(lock.tryAcquire("invoice:A"));
  EXPECT_FALSE(lock.tryAcquire("invoice:A"));
  EXPECT_TRUE(lock.tryAcquire("invoice:B"));
  EXPECT_EQ(lock.heldKeys(), 2u);

  lock.release("invoice:A");
  EXPECT_EQ(lock.heldKeys(), 1u);
  EXPECT_TRUE(lock.tryAcquire("invoice:A"));
  lock.release("invoice:A");
  lock.release("invoice:B");
  EXPECT_EQ(lock.heldKeys(), 0u);
}

TEST(KeyedMutexLockTest, TableDoesNotGrowWithSettledInvoices) {
  InMemoryInvoiceStore store;
  KeyedMutexLock lock;
  InMemorySyncQueue sync_queue;
  SettlementPoster poster(store, lock, sync_queue, fixedNow);

  for (int i = 0; i < 50; ++i) {
    const std::string invoice_id = "INV-" + std::to_string(i);
    store.addInvoice(openInvoice(invoice_id));
    const std::string transaction_id =
        "0.0.5363033@17695827" + std::to_string(10 + i) + ".055549545";
    EXPECT_EQ(poster.confirmPayment(usdcConfirmation(invoice_id, transaction_id)).status,
              SettlementStatus::POSTED);
    EXPECT_EQ(lock.heldKeys(), 0u);
  }
  EXPECT_EQ(sync_queue.size(), 50u);
}

// Ledger recovery tests

TEST(SettlementLedgerTest, LedgerFailureLeavesPaymentConfirmed) {
  FlakyLedgerStore store;
  store.addInvoice(openInvoice("INV-002", "120.50"));
  KeyedMutexLock lock;
  InMemorySyncQueue sync_queue;
  SettlementPoster poster(store, lock, sync_queue, fixedNow);

  SettlementResult result = poster.confirmPayment(usdcConfirmation("INV-002"));
  EXPECT_EQ(result.status, SettlementStatus::LEDGER_PENDING);
  EXPECT_TRUE(result.success);
  EXPECT_TRUE(result.retryable);
  EXPECT_EQ(store.getInvoice("INV-002")->status, InvoiceStatus::PAID);
  EXPECT_EQ(store.eventsFor("INV-002").size(), 1u);
  EXPECT_FALSE(poster.hasLedgerEntries("INV-002"));
  EXPECT_EQ(sync_queue.size(), 0u);

  // Same payment again is a duplicate, not a second confirmation
  EXPECT_EQ(poster.confirmPayment(usdcConfirmation("INV-002")).status,
            SettlementStatus::DUPLICATE);

  LedgerPostingResult still_failing = poster.retryLedgerPosting("INV-002");
  EXPECT_FALSE(still_failing.success);

  store.healthy = true;
  LedgerPostingResult retried = poster.retryLedgerPosting("INV-002");
  ASSERT_TRUE(retried.success);
  EXPECT_FALSE(retried.already_posted);
  ASSERT_EQ(retried.entries.size(), 2u);
  EXPECT_EQ(retried.entries[0].amount, "120.50");
  EXPECT_EQ(retried.entries[0].account_code, "1052");
  ASSERT_EQ(sync_queue.size(), 1u);

  LedgerPostingResult again = poster.retryLedgerPosting("INV-002");
  EXPECT_TRUE(again.success);
  EXPECT_TRUE(again.already_posted);
  EXPECT_EQ(store.totalLedgerEntries(), 2u);
  EXPECT_EQ(sync_queue.size(), 1u);

  auto job = sync_queue.dequeue();
  ASSERT_TRUE(job.has_value());
  EXPECT_EQ(job->invoice_id, "INV-002");
  EXPECT_EQ(job->correlation_id, store.eventsFor("INV-002")[0].correlation_id);
}

TEST(SettlementLedgerTest, RetryRequiresPaidInvoice) {
  InMemoryInvoiceStore store;
  store.addInvoice(openInvoice("INV-003"));
  KeyedMutexLock lock;
  InMemorySyncQueue sync_queue;
  SettlementPoster poster(store, lock, sync_queue, fixedNow);

  EXPECT_EQ(poster.retryLedgerPosting("INV-003").error, "Invoice is not paid");
  EXPECT_EQ(poster.retryLedgerPosting("INV-404").error, "Payment link not found");
}

TEST(SettlementLedgerTest, PostingBalanceValidation) {
  LedgerEntry debit;
  debit.entry_type = EntryType::DEBIT;
  debit.amount = "10.5";
  debit.currency = "USD";
  LedgerEntry credit = debit;
  credit.entry_type = EntryType::CREDIT;
  credit.amount = "10.50";

  std::string error;
  EXPECT_TRUE(SettlementPoster::validatePostingBalance({debit, credit}, &error));

  credit.amount = "10.49";
  EXPECT_FALSE(SettlementPoster::validatePostingBalance({debit, credit}, &error));
  EXPECT_EQ(error, "Unbalanced posting in USD: debits 10.50 != credits 10.49");

  credit.amount = "ten";
  EXPECT_FALSE(SettlementPoster::validatePostingBalance({debit, credit}, &error));
  EXPECT_FALSE(SettlementPoster::validatePostingBalance({}, &error));
  EXPECT_EQ(error, "No ledger entries to post");
}

TEST(AccountMappingTest, EachTokenHasItsOwnClearingAccount) {
  EXPECT_EQ(clearingAccountCode(hedera::TokenType::HBAR), "1051");
  EXPECT_EQ(clearingAccountCode(hedera::TokenType::USDC), "1052");
  EXPECT_EQ(clearingAccountCode(hedera::TokenType::USDT), "1053");
  EXPECT_EQ(clearingAccountCode(hedera::TokenType::AUDD), "1054");
  EXPECT_EQ(tokenFromClearingAccount("1053").value(), hedera::TokenType::USDT);
  EXPECT_FALSE(isCryptoClearingAccount(kAccountsReceivableCode));
  EXPECT_THROW(validateTokenAccountMapping(hedera::TokenType::USDC, "1051"),
               std::invalid_argument);
  EXPECT_NO_THROW(validateTokenAccountMapping(hedera::TokenType::HBAR, "1051"));
}

// Concurrency tests

TEST_F(SettlementPosterTest, ConcurrentConfirmationsPostExactlyOnce) {
  const int num_threads = 8;
  std::vector<std::thread> threads;
  std::atomic<int> posted{0};
  std::atomic<int> duplicates{0};
  std::atomic<int> unexpected{0};

  for (int i = 0; i < num_threads; ++i) {
    // Half the callers report the id in dash form
    const std::string id = (i % 2 == 0) ? kAtId : kDashId;
    threads.emplace_back([this, id, &posted, &duplicates, &unexpected]() {
      for (int attempt = 0; attempt < 100; ++attempt) {
        SettlementResult result = poster_.confirmPayment(usdcConfirmation("INV-001", id));
        if (result.status == SettlementStatus::LOCK_CONTENTION) {
          std::this_thread::sleep_for(std::chrono::milliseconds(1));
          continue;
        }
        if (result.status == SettlementStatus::POSTED) {
          ++posted;
        } else if (result.status == SettlementStatus::DUPLICATE) {
          ++duplicates;
        } else {
          ++unexpected;
        }
        return;
      }
      ++unexpected;
    });
  }

  for (auto& t : threads) {
    t.join();
  }

  EXPECT_EQ(posted.load(), 1);
  EXPECT_EQ(duplicates.load(), num_threads - 1);
  EXPECT_EQ(unexpected.load(), 0);
  EXPECT_EQ(store_.eventsFor("INV-001").size(), 1u);
  EXPECT_EQ(store_.totalLedgerEntries(), 2u);
  EXPECT_EQ(store_.ledgerAccounts().size(), 2u);
}

TEST_F(SettlementPosterTest, BatchConfirmReportsEachOutcome) {
  store_.addInvoice(openInvoice("INV-004"));

  std::vector<ConfirmationRequest> requests = {
    usdcConfirmation("INV-001"),
    usdcConfirmation("INV-001"),
    usdcConfirmation("INV-004", "0.0.5363033@1769582713.1"),
    usdcConfirmation("INV-MISSING", "0.0.5363033@1769582713.2"),
  };

  auto results = poster_.batchConfirm(requests);
  ASSERT_EQ(results.size(), 4u);
  EXPECT_EQ(results[0].result.status, SettlementStatus::POSTED);
  EXPECT_EQ(results[1].result.status, SettlementStatus::DUPLICATE);
  EXPECT_EQ(results[2].result.status, SettlementStatus::POSTED);
  EXPECT_EQ(results[3].result.status, SettlementStatus::REJECTED);
  EXPECT_EQ(results[2].invoice_id, "INV-004");
}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
