#include "wallet_session_manager.hpp"
#include "convergence_poll.hpp"
#include "hedera/amount_codec.hpp"
#include "observability/logger.hpp"
#include "observability/metrics.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <thread>

namespace settlement {
namespace wallet {

namespace {

// The wallet extension reports this while it is still starting up
bool isUriMissingError(const std::string& message) {
  std::string lower = message;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return lower.find("uri missing") != std::string::npos ||
         lower.find("missing uri") != std::string::npos;
}

}  // namespace

std::string sessionStateToString(SessionState state) {
  switch (state) {
    case SessionState::UNINITIALIZED: return "UNINITIALIZED";
    case SessionState::INITIALIZING: return "INITIALIZING";
    case SessionState::READY: return "READY";
    case SessionState::PAIRING: return "PAIRING";
    case SessionState::PAIRED: return "PAIRED";
    case SessionState::DISCONNECTED: return "DISCONNECTED";
  }
  return "UNKNOWN";
}

WalletSessionManager::WalletSessionManager(WalletConnector& connector)
    : WalletSessionManager(connector, Config()) {
}

WalletSessionManager::WalletSessionManager(WalletConnector& connector, const Config& config)
    : connector_(connector),
      config_(config),
      state_(SessionState::UNINITIALIZED),
      listeners_registered_(false),
      next_subscription_id_(1) {
  resetBalancesLocked();
}

bool WalletSessionManager::initialize() {
  std::shared_future<void> pending;
  std::promise<void> promise;
  bool owner = false;

  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (init_future_.valid()) {
      pending = init_future_;
    } else {
      init_future_ = promise.get_future().share();
      pending = init_future_;
      owner = true;
      state_ = SessionState::INITIALIZING;
      last_error_.clear();
    }
  }

  if (owner) {
    notifyListeners();
    try {
      runInitialization();
      promise.set_value();
    } catch (const std::exception& e) {
      SETTLEMENT_LOG_ERROR(std::string("Wallet initialization failed: ") + e.what());
      {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = SessionState::UNINITIALIZED;
        last_error_ = e.what();
        // Allow a later call to retry
        init_future_ = std::shared_future<void>();
      }
      promise.set_exception(std::current_exception());
      notifyListeners();
    }
  } else {
    SETTLEMENT_LOG_DEBUG("Wallet initialization already started, waiting on it");
  }

  try {
    pending.get();
    return true;
  } catch (const std::exception& e) {
    if (!owner) {
      SETTLEMENT_LOG_WARN(std::string("Shared wallet initialization failed: ") + e.what());
    }
    return false;
  }
}

void WalletSessionManager::runInitialization() {
  auto saved = connector_.savedPairings();

  registerListeners();

  if (!saved.empty() && !saved.front().account_ids.empty()) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      pairing_ = saved.front();
      account_id_ = saved.front().account_ids.front();
      state_ = SessionState::PAIRED;
    }
    SETTLEMENT_LOG_BUILDER(observability::LogLevel::INFO, "Rehydrated existing wallet pairing")
        .field("account_id", saved.front().account_ids.front());
  } else {
    connector_.init();
    {
      std::lock_guard<std::mutex> lock(mutex_);
      // A pairing event may already have arrived during init()
      if (state_ == SessionState::INITIALIZING) {
        state_ = SessionState::READY;
      }
    }
    SETTLEMENT_LOG_INFO("Wallet connector initialized");
  }

  state_changed_.notify_all();
  notifyListeners();
}

void WalletSessionManager::registerListeners() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (listeners_registered_) return;
    listeners_registered_ = true;
  }

  connector_.onPairing([this](const PairingRecord& record) { handlePairing(record); });
  connector_.onConnectionStatusChange(
      [this](const std::string& status) { handleConnectionStatus(status); });
  connector_.onDisconnection([this]() { handleDisconnection(); });
}

bool WalletSessionManager::openPairingModal() {
  if (!initialize()) {
    return false;
  }

  SessionState previous;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == SessionState::PAIRED) {
      return true;
    }
    previous = state_;
    state_ = SessionState::PAIRING;
    last_error_.clear();
  }
  notifyListeners();

  try {
    try {
      connector_.openPairingModal();
    } catch (const std::runtime_error& e) {
      if (!isUriMissingError(e.what())) {
        throw;
      }
      SETTLEMENT_LOG_WARN("Pairing URI missing, retrying once");
      std::this_thread::sleep_for(config_.pairing_retry_delay);
      connector_.openPairingModal();
    }
    return true;
  } catch (const std::exception& e) {
    SETTLEMENT_LOG_ERROR(std::string("Failed to open pairing modal: ") + e.what());
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (state_ == SessionState::PAIRING) {
        state_ = previous;
      }
      last_error_ = e.what();
    }
    notifyListeners();
    return false;
  }
}

std::optional<std::string> WalletSessionManager::connectWallet() {
  return connectWallet(config_.connect_timeout);
}

std::optional<std::string> WalletSessionManager::connectWallet(std::chrono::milliseconds timeout) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == SessionState::PAIRED && account_id_) {
      return account_id_;
    }
  }

  if (!openPairingModal()) {
    return std::nullopt;
  }

  std::unique_lock<std::mutex> lock(mutex_);
  bool paired = state_changed_.wait_for(lock, timeout, [this] {
    return state_ == SessionState::PAIRED && account_id_.has_value();
  });

  if (!paired) {
    if (state_ == SessionState::PAIRING) {
      state_ = SessionState::READY;
    }
    last_error_ = "Wallet connection timeout";
    lock.unlock();
    SETTLEMENT_LOG_WARN("Wallet connection timed out waiting for pairing");
    notifyListeners();
    return std::nullopt;
  }

  return account_id_;
}

bool WalletSessionManager::disconnect() {
  std::optional<std::string> topic;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == SessionState::UNINITIALIZED) {
      return true;
    }
    if (pairing_ && !pairing_->topic.empty()) {
      topic = pairing_->topic;
    }
  }

  if (topic) {
    try {
      connector_.disconnect(*topic);
    } catch (const std::exception& e) {
      SETTLEMENT_LOG_ERROR(std::string("Failed to disconnect wallet: ") + e.what());
      std::lock_guard<std::mutex> lock(mutex_);
      last_error_ = e.what();
      return false;
    }
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    clearPairingLocked();
    state_ = SessionState::DISCONNECTED;
  }
  state_changed_.notify_all();
  notifyListeners();

  SETTLEMENT_LOG_INFO("Wallet disconnected");
  return true;
}

int WalletSessionManager::subscribe(Listener listener) {
  int id;
  {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    id = next_subscription_id_++;
    listeners_[id] = listener;
  }

  listener(snapshot());
  return id;
}

bool WalletSessionManager::unsubscribe(int subscription_id) {
  std::lock_guard<std::mutex> lock(listeners_mutex_);
  return listeners_.erase(subscription_id) > 0;
}

std::optional<std::string> WalletSessionManager::getSessionTopic() {
  return getSessionTopic(config_.session_topic_max_retries, config_.session_topic_delay);
}

std::optional<std::string> WalletSessionManager::getSessionTopic(int max_retries,
                                                                 std::chrono::milliseconds delay) {
  ConvergencePoll<std::string> poll(
      [this]() -> std::optional<std::string> {
        try {
          return findConvergedTopic(connector_.sessionRegistry(), connector_.signClientRegistry());
        } catch (const std::exception& e) {
          SETTLEMENT_LOG_WARN(std::string("Session registry read failed: ") + e.what());
          return std::nullopt;
        }
      },
      max_retries, delay, config_.session_topic_max_delay);

  auto& metrics = observability::getGlobalMetrics();
  poll.setAttemptObserver([&metrics](int attempt, ConvergenceOutcome outcome) {
    metrics.incrementCounter("wallet_session_topic_attempts");
    SETTLEMENT_LOG_BUILDER(observability::LogLevel::DEBUG, "Session topic lookup")
        .field("attempt", attempt)
        .field("outcome", convergenceOutcomeToString(outcome));
  });

  if (poll.run() == ConvergenceOutcome::CONVERGED) {
    return poll.value();
  }

  SETTLEMENT_LOG_WARN("Signing session not established after " +
                      std::to_string(poll.attempts()) + " attempts");
  return std::nullopt;
}

SendResult WalletSessionManager::sendTransaction(const std::vector<uint8_t>& transaction_bytes,
                                                 const std::string& signer_account_id) {
  SendResult result;

  if (!isPaired()) {
    result.status = SendStatus::NOT_PAIRED;
    result.error = "Wallet not connected";
    return result;
  }

  auto topic = getSessionTopic();
  if (!topic) {
    result.status = SendStatus::SESSION_NOT_ESTABLISHED;
    result.error = "Signing session not established. Please reconnect your wallet.";
    return result;
  }

  std::future<nlohmann::json> pending;
  try {
    pending = connector_.sendTransaction(*topic, transaction_bytes, signer_account_id);
  } catch (const std::exception& e) {
    result.status = SendStatus::FAILED;
    result.error = e.what();
    return result;
  }

  if (!pending.valid()) {
    result.status = SendStatus::FAILED;
    result.error = "Wallet returned no response";
    return result;
  }

  if (pending.wait_for(config_.send_timeout) != std::future_status::ready) {
    SETTLEMENT_LOG_BUILDER(observability::LogLevel::WARN, "Wallet did not answer the signing request")
        .field("timeout_ms", static_cast<int64_t>(config_.send_timeout.count()))
        .field("signer", signer_account_id);
    result.status = SendStatus::TIMEOUT;
    result.error = "Wallet did not respond in time";
    return result;
  }

  try {
    result.response = pending.get();
    result.status = SendStatus::OK;
  } catch (const std::exception& e) {
    result.status = SendStatus::FAILED;
    result.error = e.what();
  }
  return result;
}

bool WalletSessionManager::refreshBalances(network::LedgerQueryService& ledger) {
  auto account = accountId();
  if (!account) {
    return false;
  }

  auto balance = ledger.getAccountBalance(*account);
  if (!balance) {
    SETTLEMENT_LOG_WARN("Could not load balances for " + *account);
    return false;
  }

  std::map<std::string, std::string> updated;
  for (hedera::TokenType token : hedera::allTokens()) {
    const auto& info = hedera::tokenInfo(token);

    int64_t units = 0;
    if (info.is_native) {
      units = balance->tinybars;
    } else if (auto id = hedera::tokenId(token, config_.network)) {
      auto it = balance->tokens.find(*id);
      if (it != balance->tokens.end()) {
        units = it->second;
      }
    }

    try {
      updated[info.symbol] = hedera::fromSmallestUnit(units, info.decimals);
    } catch (const std::exception& e) {
      SETTLEMENT_LOG_WARN("Ignoring " + info.symbol + " balance: " + e.what());
      updated[info.symbol] = hedera::fromSmallestUnit(0, info.decimals);
    }
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    balances_ = std::move(updated);
  }
  notifyListeners();
  return true;
}

WalletSnapshot WalletSessionManager::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return snapshotLocked();
}

SessionState WalletSessionManager::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

std::optional<std::string> WalletSessionManager::accountId() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return account_id_;
}

bool WalletSessionManager::isPaired() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_ == SessionState::PAIRED && account_id_.has_value();
}

void WalletSessionManager::handlePairing(const PairingRecord& record) {
  if (record.account_ids.empty()) {
    SETTLEMENT_LOG_WARN("Pairing event without account ids ignored");
    return;
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    pairing_ = record;
    account_id_ = record.account_ids.front();
    state_ = SessionState::PAIRED;
    last_error_.clear();
  }

  SETTLEMENT_LOG_BUILDER(observability::LogLevel::INFO, "Wallet paired")
      .field("account_id", record.account_ids.front())
      .field("network", record.network);

  state_changed_.notify_all();
  notifyListeners();
}

void WalletSessionManager::handleConnectionStatus(const std::string& status) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    connection_status_ = status;
  }
  SETTLEMENT_LOG_DEBUG("Wallet connection status: " + status);
  notifyListeners();
}

void WalletSessionManager::handleDisconnection() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    clearPairingLocked();
    state_ = SessionState::DISCONNECTED;
  }
  SETTLEMENT_LOG_INFO("Wallet disconnected by peer");

  state_changed_.notify_all();
  notifyListeners();
}

void WalletSessionManager::clearPairingLocked() {
  pairing_.reset();
  account_id_.reset();
  last_error_.clear();
  resetBalancesLocked();
}

void WalletSessionManager::resetBalancesLocked() {
  balances_.clear();
  for (hedera::TokenType token : hedera::allTokens()) {
    const auto& info = hedera::tokenInfo(token);
    balances_[info.symbol] = hedera::fromSmallestUnit(0, info.decimals);
  }
}

WalletSnapshot WalletSessionManager::snapshotLocked() const {
  WalletSnapshot snap;
  snap.state = state_;
  snap.connected = state_ == SessionState::PAIRED && account_id_.has_value();
  snap.account_id = account_id_;
  snap.network = (pairing_ && !pairing_->network.empty()) ? pairing_->network
                                                          : hedera::networkName(config_.network);
  snap.pairing = pairing_;
  snap.connection_status = connection_status_;
  snap.balances = balances_;
  snap.error = last_error_;
  return snap;
}

void WalletSessionManager::notifyListeners() {
  WalletSnapshot current = snapshot();

  std::vector<Listener> targets;
  {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    targets.reserve(listeners_.size());
    for (const auto& entry : listeners_) {
      targets.push_back(entry.second);
    }
  }

  for (const auto& listener : targets) {
    try {
      listener(current);
    } catch (const std::exception& e) {
      SETTLEMENT_LOG_ERROR(std::string("Wallet state listener failed: ") + e.what());
    }
  }
}

}  // namespace wallet
}  // namespace settlement
