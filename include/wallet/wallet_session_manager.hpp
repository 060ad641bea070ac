#ifndef WALLET_SESSION_MANAGER_HPP_
#define WALLET_SESSION_MANAGER_HPP_

#include "wallet_connector.hpp"
#include "../hedera/token_config.hpp"
#include "../network/ledger_query_service.hpp"

#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace settlement {
namespace wallet {

enum class SessionState {
  UNINITIALIZED,
  INITIALIZING,
  READY,         // initialized, not paired
  PAIRING,
  PAIRED,
  DISCONNECTED
};

std::string sessionStateToString(SessionState state);

/**
 * Copy of the session state handed to subscribers.
 */
struct WalletSnapshot {
  SessionState state = SessionState::UNINITIALIZED;
  bool connected = false;
  std::optional<std::string> account_id;
  std::string network;
  std::optional<PairingRecord> pairing;
  std::string connection_status;
  std::map<std::string, std::string> balances;  // symbol -> decimal string
  std::string error;
};

enum class SendStatus {
  OK,
  NOT_PAIRED,
  SESSION_NOT_ESTABLISHED,
  TIMEOUT,
  FAILED
};

struct SendResult {
  SendStatus status = SendStatus::FAILED;
  nlohmann::json response;
  std::string error;

  bool ok() const { return status == SendStatus::OK; }
};

/**
 * Owns the signing session with the external wallet.
 *
 * Constructed once at the application boundary and injected where needed.
 * State changes are published to subscribers after the internal lock is
 * released, so listeners may call back into the manager.
 */
class WalletSessionManager {
 public:
  struct Config {
    hedera::Network network = hedera::Network::TESTNET;
    std::chrono::milliseconds pairing_retry_delay{500};
    std::chrono::milliseconds connect_timeout{60000};
    std::chrono::milliseconds send_timeout{120000};
    int session_topic_max_retries = 10;
    std::chrono::milliseconds session_topic_delay{500};
    std::chrono::milliseconds session_topic_max_delay{2000};
  };

  using Listener = std::function<void(const WalletSnapshot&)>;

  explicit WalletSessionManager(WalletConnector& connector);
  WalletSessionManager(WalletConnector& connector, const Config& config);
  ~WalletSessionManager() = default;

  // Non-copyable
  WalletSessionManager(const WalletSessionManager&) = delete;
  WalletSessionManager& operator=(const WalletSessionManager&) = delete;

  /**
   * Initialize once. Concurrent callers wait on the same in-flight
   * initialization. Rehydrates a saved pairing when the connector has one.
   * Returns false if initialization failed; a later call retries.
   */
  bool initialize();

  /**
   * Open the pairing prompt, retrying once on a "URI missing" failure.
   * On failure the previous state is restored.
   */
  bool openPairingModal();

  /**
   * Open the pairing prompt and wait for the pairing event.
   * Returns the paired account id, or nullopt on failure or timeout.
   */
  std::optional<std::string> connectWallet();
  std::optional<std::string> connectWallet(std::chrono::milliseconds timeout);

  /**
   * Drop the pairing and reset balances. Listener registration survives.
   */
  bool disconnect();

  /**
   * Register a state listener; it is called immediately with the current
   * snapshot. Returns the id for unsubscribe().
   */
  int subscribe(Listener listener);
  bool unsubscribe(int subscription_id);

  /**
   * Poll both registries until they agree on an acknowledged hedera session.
   * Returns nullopt once retries are exhausted. Never throws.
   */
  std::optional<std::string> getSessionTopic();
  std::optional<std::string> getSessionTopic(int max_retries, std::chrono::milliseconds delay);

  /**
   * Submit serialized transaction bytes for signature on the session topic.
   * A timeout leaves the session PAIRED.
   */
  SendResult sendTransaction(const std::vector<uint8_t>& transaction_bytes,
                             const std::string& signer_account_id);

  /**
   * Load native and token balances of the paired account. Balances stay at
   * zero on error.
   */
  bool refreshBalances(network::LedgerQueryService& ledger);

  WalletSnapshot snapshot() const;
  SessionState state() const;
  std::optional<std::string> accountId() const;
  bool isPaired() const;

 private:
  void runInitialization();
  void registerListeners();

  void handlePairing(const PairingRecord& record);
  void handleConnectionStatus(const std::string& status);
  void handleDisconnection();

  // Callers hold mutex_
  void clearPairingLocked();
  void resetBalancesLocked();
  WalletSnapshot snapshotLocked() const;

  void notifyListeners();

  WalletConnector& connector_;
  Config config_;

  mutable std::mutex mutex_;
  std::condition_variable state_changed_;
  SessionState state_;
  std::optional<PairingRecord> pairing_;
  std::optional<std::string> account_id_;
  std::string connection_status_;
  std::map<std::string, std::string> balances_;
  std::string last_error_;

  std::shared_future<void> init_future_;
  bool listeners_registered_;

  std::mutex listeners_mutex_;
  std::map<int, Listener> listeners_;
  int next_subscription_id_;
};

}  // namespace wallet
}  // namespace settlement

#endif  // WALLET_SESSION_MANAGER_HPP_
