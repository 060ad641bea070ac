#include "wallet/wallet_session_manager.hpp"
#include "wallet/convergence_poll.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace settlement;
using namespace settlement::wallet;
using namespace std::chrono_literals;

namespace {

const char* kPayer = "0.0.5363033";

class FakeWalletConnector : public WalletConnector {
 public:
  enum class SendMode { RESPOND, REJECT, HANG };

  std::vector<PairingRecord> savedPairings() override {
    std::lock_guard<std::mutex> lock(mutex_);
    return saved_;
  }

  void init() override {
    ++init_calls;
    std::this_thread::sleep_for(init_delay);
    if (init_failures > 0) {
      --init_failures;
      throw std::runtime_error("Relay connection refused");
    }
  }

  void openPairingModal() override {
    ++modal_calls;
    if (uri_missing_failures > 0) {
      --uri_missing_failures;
      throw std::runtime_error("Pairing URI missing");
    }
    if (!modal_error.empty()) {
      throw std::runtime_error(modal_error);
    }
    if (pair_on_open) {
      emitPairing(pairingRecord());
    }
  }

  void disconnect(const std::string& pairing_topic) override {
    std::lock_guard<std::mutex> lock(mutex_);
    disconnected_topics.push_back(pairing_topic);
  }

  std::vector<RegistryEntry> sessionRegistry() override {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_;
  }

  std::vector<RegistryEntry> signClientRegistry() override {
    std::lock_guard<std::mutex> lock(mutex_);
    return sign_client_;
  }

  std::future<nlohmann::json> sendTransaction(const std::string& session_topic,
                                              const std::vector<uint8_t>& transaction_bytes,
                                              const std::string& signer_account_id) override {
    std::lock_guard<std::mutex> lock(mutex_);
    last_send_topic = session_topic;
    last_send_bytes = transaction_bytes.size();
    last_signer = signer_account_id;

    std::promise<nlohmann::json> promise;
    std::future<nlohmann::json> future = promise.get_future();
    switch (send_mode) {
      case SendMode::RESPOND:
        promise.set_value(response);
        break;
      case SendMode::REJECT:
        promise.set_exception(std::make_exception_ptr(std::runtime_error("User rejected")));
        break;
      case SendMode::HANG:
        unanswered_.push_back(std::move(promise));
        break;
    }
    return future;
  }

  void onPairing(PairingHandler handler) override {
    ++pairing_registrations;
    pairing_handler_ = std::move(handler);
  }
  void onConnectionStatusChange(StatusHandler handler) override {
    ++status_registrations;
    status_handler_ = std::move(handler);
  }
  void onDisconnection(DisconnectHandler handler) override {
    ++disconnect_registrations;
    disconnect_handler_ = std::move(handler);
  }

  bool eachListenerRegisteredOnce() const {
    return pairing_registrations.load() == 1 && status_registrations.load() == 1 &&
           disconnect_registrations.load() == 1;
  }

  void emitPairing(const PairingRecord& record) {
    if (pairing_handler_) pairing_handler_(record);
  }
  void emitStatus(const std::string& status) {
    if (status_handler_) status_handler_(status);
  }
  void emitDisconnection() {
    if (disconnect_handler_) disconnect_handler_();
  }

  void setSaved(std::vector<PairingRecord> saved) {
    std::lock_guard<std::mutex> lock(mutex_);
    saved_ = std::move(saved);
  }

  void setRegistries(std::vector<RegistryEntry> sessions, std::vector<RegistryEntry> sign_client) {
    std::lock_guard<std::mutex> lock(mutex_);
    sessions_ = std::move(sessions);
    sign_client_ = std::move(sign_client);
  }

  static PairingRecord pairingRecord() {
    return PairingRecord{"pairing-topic-1", {kPayer}, "testnet"};
  }

  std::atomic<int> init_calls{0};
  std::atomic<int> init_failures{0};
  std::chrono::milliseconds init_delay{0};
  std::atomic<int> modal_calls{0};
  std::atomic<int> uri_missing_failures{0};
  std::string modal_error;
  bool pair_on_open = false;
  std::atomic<int> pairing_registrations{0};
  std::atomic<int> status_registrations{0};
  std::atomic<int> disconnect_registrations{0};

  SendMode send_mode = SendMode::RESPOND;
  nlohmann::json response;
  std::string last_send_topic;
  size_t last_send_bytes = 0;
  std::string last_signer;
  std::vector<std::string> disconnected_topics;

 private:
  std::mutex mutex_;
  std::vector<PairingRecord> saved_;
  std::vector<RegistryEntry> sessions_;
  std::vector<RegistryEntry> sign_client_;
  std::vector<std::promise<nlohmann::json>> unanswered_;
  PairingHandler pairing_handler_;
  StatusHandler status_handler_;
  DisconnectHandler disconnect_handler_;
};

class FakeBalanceLedger : public network::LedgerQueryService {
 public:
  network::TransactionPage queryTransactions(const network::TransactionQuery&) override {
    return {};
  }
  std::optional<network::MirrorTransaction> getTransaction(const std::string&) override {
    return std::nullopt;
  }
  std::optional<network::AccountBalance> getAccountBalance(const std::string& account_id) override {
    if (account_id != kPayer) return std::nullopt;
    network::AccountBalance balance;
    balance.tinybars = 250000000;
    balance.tokens["0.0.429274"] = 1500000;
    return balance;
  }
  std::optional<std::vector<network::TokenAssociation>> getTokenAssociations(
      const std::string&) override {
    return std::nullopt;
  }
};

RegistryEntry hederaSession(const std::string& topic, bool acknowledged = true) {
  return RegistryEntry{topic, {"hedera"}, acknowledged};
}

}  // namespace

class WalletSessionManagerTest : public ::testing::Test {
 protected:
  WalletSessionManagerTest() {
    config_.pairing_retry_delay = 1ms;
    config_.session_topic_max_retries = 3;
    config_.session_topic_delay = 1ms;
    config_.send_timeout = 200ms;
  }

  void pairViaSavedSession() {
    connector_.setSaved({FakeWalletConnector::pairingRecord()});
    connector_.setRegistries({hederaSession("session-topic-1")}, {hederaSession("session-topic-1")});
  }

  FakeWalletConnector connector_;
  WalletSessionManager::Config config_;
};

// Initialization tests

TEST_F(WalletSessionManagerTest, ConcurrentInitializeRunsHandshakeOnce) {
  connector_.init_delay = 50ms;
  WalletSessionManager manager(connector_, config_);

  std::vector<std::thread> threads;
  std::atomic<int> successes{0};
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&manager, &successes] {
      if (manager.initialize()) ++successes;
    });
  }
  for (auto& t : threads) t.join();

  EXPECT_EQ(successes.load(), 8);
  EXPECT_EQ(connector_.init_calls.load(), 1);
  EXPECT_EQ(manager.state(), SessionState::READY);
  EXPECT_TRUE(connector_.eachListenerRegisteredOnce());

  EXPECT_TRUE(manager.initialize());
  EXPECT_EQ(connector_.init_calls.load(), 1);
  EXPECT_TRUE(connector_.eachListenerRegisteredOnce());
}

TEST_F(WalletSessionManagerTest, FailedInitializeCanBeRetried) {
  connector_.init_failures = 1;
  WalletSessionManager manager(connector_, config_);

  EXPECT_FALSE(manager.initialize());
  EXPECT_EQ(manager.state(), SessionState::UNINITIALIZED);
  EXPECT_EQ(manager.snapshot().error, "Relay connection refused");
  // Listeners go in before init() throws
  EXPECT_TRUE(connector_.eachListenerRegisteredOnce());

  EXPECT_TRUE(manager.initialize());
  EXPECT_EQ(manager.state(), SessionState::READY);
  EXPECT_EQ(connector_.init_calls.load(), 2);
  EXPECT_EQ(connector_.pairing_registrations.load(), 1);
  EXPECT_EQ(connector_.status_registrations.load(), 1);
  EXPECT_EQ(connector_.disconnect_registrations.load(), 1);
}

TEST_F(WalletSessionManagerTest, RehydratesSavedPairing) {
  connector_.setSaved({FakeWalletConnector::pairingRecord()});
  WalletSessionManager manager(connector_, config_);

  ASSERT_TRUE(manager.initialize());
  EXPECT_EQ(manager.state(), SessionState::PAIRED);
  EXPECT_TRUE(manager.isPaired());
  EXPECT_EQ(manager.accountId().value_or(""), kPayer);
  EXPECT_EQ(connector_.init_calls.load(), 0);

  // Already paired: no prompt is shown
  EXPECT_EQ(manager.connectWallet(10ms).value_or(""), kPayer);
  EXPECT_EQ(connector_.modal_calls.load(), 0);
}

// Pairing tests

TEST_F(WalletSessionManagerTest, ConnectWalletReturnsPairedAccount) {
  connector_.pair_on_open = true;
  WalletSessionManager manager(connector_, config_);

  auto account = manager.connectWallet(1000ms);
  ASSERT_TRUE(account.has_value());
  EXPECT_EQ(*account, kPayer);

  WalletSnapshot snap = manager.snapshot();
  EXPECT_EQ(snap.state, SessionState::PAIRED);
  EXPECT_TRUE(snap.connected);
  EXPECT_EQ(snap.network, "testnet");
  ASSERT_TRUE(snap.pairing.has_value());
  EXPECT_EQ(snap.pairing->topic, "pairing-topic-1");
}

TEST_F(WalletSessionManagerTest, ReconnectAfterDisconnectKeepsListeners) {
  connector_.pair_on_open = true;
  WalletSessionManager manager(connector_, config_);

  ASSERT_TRUE(manager.connectWallet(1000ms).has_value());
  ASSERT_TRUE(manager.disconnect());
  EXPECT_EQ(manager.state(), SessionState::DISCONNECTED);

  auto account = manager.connectWallet(1000ms);
  ASSERT_TRUE(account.has_value());
  EXPECT_EQ(*account, kPayer);
  EXPECT_EQ(manager.state(), SessionState::PAIRED);
  EXPECT_EQ(connector_.modal_calls.load(), 2);
  EXPECT_EQ(connector_.init_calls.load(), 1);
  EXPECT_EQ(connector_.pairing_registrations.load(), 1);
  EXPECT_EQ(connector_.status_registrations.load(), 1);
  EXPECT_EQ(connector_.disconnect_registrations.load(), 1);

  // The one registered handler still drives the manager
  connector_.emitDisconnection();
  EXPECT_EQ(manager.state(), SessionState::DISCONNECTED);
}

TEST_F(WalletSessionManagerTest, ConnectWalletTimesOut) {
  WalletSessionManager manager(connector_, config_);

  EXPECT_FALSE(manager.connectWallet(50ms).has_value());
  EXPECT_EQ(manager.state(), SessionState::READY);
  EXPECT_EQ(manager.snapshot().error, "Wallet connection timeout");
}

TEST_F(WalletSessionManagerTest, RetriesPairingPromptOnceWhenUriMissing) {
  connector_.uri_missing_failures = 1;
  WalletSessionManager manager(connector_, config_);

  EXPECT_TRUE(manager.openPairingModal());
  EXPECT_EQ(connector_.modal_calls.load(), 2);
  EXPECT_EQ(manager.state(), SessionState::PAIRING);
}

TEST_F(WalletSessionManagerTest, RestoresStateWhenPairingPromptFails) {
  connector_.uri_missing_failures = 2;
  WalletSessionManager manager(connector_, config_);

  EXPECT_FALSE(manager.openPairingModal());
  EXPECT_EQ(connector_.modal_calls.load(), 2);
  EXPECT_EQ(manager.state(), SessionState::READY);
  EXPECT_EQ(manager.snapshot().error, "Pairing URI missing");

  connector_.modal_error = "Modal closed";
  EXPECT_FALSE(manager.openPairingModal());
  EXPECT_EQ(connector_.modal_calls.load(), 3);
  EXPECT_EQ(manager.state(), SessionState::READY);
}

// Session topic tests

TEST(ConvergencePollTest, TopicMustBeAcknowledgedInBothRegistries) {
  std::vector<RegistryEntry> sessions = {hederaSession("a"), hederaSession("b")};

  EXPECT_FALSE(findConvergedTopic(sessions, {}).has_value());
  EXPECT_FALSE(findConvergedTopic(sessions, {hederaSession("c")}).has_value());
  EXPECT_FALSE(findConvergedTopic(sessions, {hederaSession("b", false)}).has_value());
  EXPECT_FALSE(findConvergedTopic(sessions, {RegistryEntry{"b", {"eip155"}, true}}).has_value());
  EXPECT_EQ(findConvergedTopic(sessions, {hederaSession("b")}).value_or(""), "b");
}

TEST(ConvergencePollTest, StopsAtMaxAttempts) {
  int calls = 0;
  ConvergencePoll<std::string> poll([&calls]() -> std::optional<std::string> {
    ++calls;
    return std::nullopt;
  }, 4, 1ms);

  std::vector<ConvergenceOutcome> outcomes;
  poll.setAttemptObserver([&outcomes](int, ConvergenceOutcome outcome) {
    outcomes.push_back(outcome);
  });

  EXPECT_EQ(poll.run(), ConvergenceOutcome::EXHAUSTED);
  EXPECT_EQ(calls, 4);
  EXPECT_EQ(poll.attempts(), 4);
  EXPECT_EQ(outcomes.back(), ConvergenceOutcome::EXHAUSTED);
  EXPECT_EQ(outcomes.front(), ConvergenceOutcome::NOT_YET_CONVERGED);
  EXPECT_FALSE(poll.value().has_value());
}

TEST(ConvergencePollTest, BacksOffLinearlyUpToCap) {
  ConvergencePoll<std::string> poll([]() -> std::optional<std::string> {
    return std::nullopt;
  }, 5, 2ms, 6ms);

  std::vector<std::chrono::milliseconds> delays;
  poll.setAttemptObserver([&poll, &delays](int, ConvergenceOutcome outcome) {
    if (outcome == ConvergenceOutcome::NOT_YET_CONVERGED) delays.push_back(poll.nextDelay());
  });

  auto start = std::chrono::steady_clock::now();
  EXPECT_EQ(poll.run(), ConvergenceOutcome::EXHAUSTED);
  auto elapsed = std::chrono::steady_clock::now() - start;

  std::vector<std::chrono::milliseconds> expected = {2ms, 4ms, 6ms, 6ms};
  EXPECT_EQ(delays, expected);
  EXPECT_GE(elapsed, 18ms);
}

TEST(ConvergencePollTest, ReturnsFirstValue) {
  int calls = 0;
  ConvergencePoll<std::string> poll([&calls]() -> std::optional<std::string> {
    return ++calls == 3 ? std::optional<std::string>("topic") : std::nullopt;
  }, 10, 1ms);

  EXPECT_EQ(poll.run(), ConvergenceOutcome::CONVERGED);
  EXPECT_EQ(poll.attempts(), 3);
  EXPECT_EQ(poll.value().value_or(""), "topic");
  EXPECT_EQ(poll.attempt(), ConvergenceOutcome::CONVERGED);
  EXPECT_EQ(calls, 3);
}

TEST_F(WalletSessionManagerTest, SessionTopicNeedsBothRegistries) {
  connector_.setRegistries({hederaSession("session-topic-1")}, {});
  WalletSessionManager manager(connector_, config_);

  EXPECT_FALSE(manager.getSessionTopic().has_value());

  connector_.setRegistries({hederaSession("session-topic-1")}, {hederaSession("session-topic-1")});
  EXPECT_EQ(manager.getSessionTopic().value_or(""), "session-topic-1");
}

// Signing tests

TEST_F(WalletSessionManagerTest, SendRequiresPairing) {
  WalletSessionManager manager(connector_, config_);
  ASSERT_TRUE(manager.initialize());

  SendResult result = manager.sendTransaction({1, 2, 3}, kPayer);
  EXPECT_EQ(result.status, SendStatus::NOT_PAIRED);
  EXPECT_EQ(result.error, "Wallet not connected");
}

TEST_F(WalletSessionManagerTest, SendFailsWithoutSigningSession) {
  connector_.setSaved({FakeWalletConnector::pairingRecord()});
  connector_.setRegistries({hederaSession("session-topic-1")}, {});
  WalletSessionManager manager(connector_, config_);
  ASSERT_TRUE(manager.initialize());

  SendResult result = manager.sendTransaction({1, 2, 3}, kPayer);
  EXPECT_EQ(result.status, SendStatus::SESSION_NOT_ESTABLISHED);
  EXPECT_EQ(result.error, "Signing session not established. Please reconnect your wallet.");
}

TEST_F(WalletSessionManagerTest, SendUsesSessionTopicNotPairingTopic) {
  pairViaSavedSession();
  connector_.response = {{"transactionId", "0.0.5363033@1769582713.055549545"}};
  WalletSessionManager manager(connector_, config_);
  ASSERT_TRUE(manager.initialize());

  SendResult result = manager.sendTransaction({1, 2, 3, 4}, kPayer);
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(result.response["transactionId"], "0.0.5363033@1769582713.055549545");
  EXPECT_EQ(connector_.last_send_topic, "session-topic-1");
  EXPECT_EQ(connector_.last_send_bytes, 4u);
  EXPECT_EQ(connector_.last_signer, kPayer);
}

TEST_F(WalletSessionManagerTest, SendTimeoutKeepsSessionPaired) {
  pairViaSavedSession();
  connector_.send_mode = FakeWalletConnector::SendMode::HANG;
  config_.send_timeout = 30ms;
  WalletSessionManager manager(connector_, config_);
  ASSERT_TRUE(manager.initialize());

  SendResult result = manager.sendTransaction({1}, kPayer);
  EXPECT_EQ(result.status, SendStatus::TIMEOUT);
  EXPECT_EQ(result.error, "Wallet did not respond in time");
  EXPECT_EQ(manager.state(), SessionState::PAIRED);
  EXPECT_TRUE(manager.isPaired());
}

TEST_F(WalletSessionManagerTest, SendReportsWalletRejection) {
  pairViaSavedSession();
  connector_.send_mode = FakeWalletConnector::SendMode::REJECT;
  WalletSessionManager manager(connector_, config_);
  ASSERT_TRUE(manager.initialize());

  SendResult result = manager.sendTransaction({1}, kPayer);
  EXPECT_EQ(result.status, SendStatus::FAILED);
  EXPECT_EQ(result.error, "User rejected");
}

// Balance and subscription tests

TEST_F(WalletSessionManagerTest, DisconnectResetsBalances) {
  pairViaSavedSession();
  WalletSessionManager manager(connector_, config_);
  ASSERT_TRUE(manager.initialize());

  FakeBalanceLedger ledger;
  ASSERT_TRUE(manager.refreshBalances(ledger));
  WalletSnapshot loaded = manager.snapshot();
  EXPECT_EQ(loaded.balances["HBAR"], "2.50000000");
  EXPECT_EQ(loaded.balances["USDC"], "1.500000");
  EXPECT_EQ(loaded.balances["USDT"], "0.000000");

  ASSERT_TRUE(manager.disconnect());
  WalletSnapshot after = manager.snapshot();
  EXPECT_EQ(after.state, SessionState::DISCONNECTED);
  EXPECT_FALSE(after.account_id.has_value());
  EXPECT_FALSE(after.connected);
  EXPECT_EQ(after.balances["HBAR"], "0.00000000");
  EXPECT_EQ(after.balances["USDC"], "0.000000");
  ASSERT_EQ(connector_.disconnected_topics.size(), 1u);
  EXPECT_EQ(connector_.disconnected_topics[0], "pairing-topic-1");

  EXPECT_FALSE(manager.refreshBalances(ledger));
}

TEST_F(WalletSessionManagerTest, SubscribersSeeStateChanges) {
  WalletSessionManager manager(connector_, config_);

  std::vector<SessionState> seen;
  int id = manager.subscribe([&seen](const WalletSnapshot& snap) { seen.push_back(snap.state); });
  EXPECT_EQ(id, 1);
  ASSERT_EQ(seen.size(), 1u);
  EXPECT_EQ(seen[0], SessionState::UNINITIALIZED);

  ASSERT_TRUE(manager.initialize());
  EXPECT_EQ(seen.back(), SessionState::READY);

  connector_.emitPairing(FakeWalletConnector::pairingRecord());
  EXPECT_EQ(seen.back(), SessionState::PAIRED);

  connector_.emitStatus("connected");
  EXPECT_EQ(manager.snapshot().connection_status, "connected");

  connector_.emitDisconnection();
  EXPECT_EQ(seen.back(), SessionState::DISCONNECTED);
  EXPECT_FALSE(manager.isPaired());

  EXPECT_TRUE(manager.unsubscribe(id));
  EXPECT_FALSE(manager.unsubscribe(id));
  size_t count = seen.size();
  connector_.emitPairing(FakeWalletConnector::pairingRecord());
  EXPECT_EQ(seen.size(), count);
  EXPECT_TRUE(manager.isPaired());
}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
