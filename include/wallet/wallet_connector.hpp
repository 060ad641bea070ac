#ifndef WALLET_CONNECTOR_HPP_
#define WALLET_CONNECTOR_HPP_

#include <nlohmann/json.hpp>

#include <cstdint>
#include <functional>
#include <future>
#include <string>
#include <vector>

namespace settlement {
namespace wallet {

/**
 * Wallet-dApp relationship established by the pairing handshake.
 * The pairing topic is NOT valid for signing.
 */
struct PairingRecord {
  std::string topic;
  std::vector<std::string> account_ids;
  std::string network;
};

/**
 * One session as seen by one of the wallet library's internal registries.
 */
struct RegistryEntry {
  std::string topic;
  std::vector<std::string> namespaces;  // e.g. {"hedera"}
  bool acknowledged = false;
};

/**
 * External wallet library (pairing, signing sessions, submission).
 *
 * Calls that fail throw std::runtime_error with the library's message.
 * Event handlers may be invoked from any thread.
 */
class WalletConnector {
 public:
  using PairingHandler = std::function<void(const PairingRecord&)>;
  using StatusHandler = std::function<void(const std::string&)>;
  using DisconnectHandler = std::function<void()>;

  virtual ~WalletConnector() = default;

  /**
   * Pairings persisted by the library from an earlier run.
   */
  virtual std::vector<PairingRecord> savedPairings() = 0;

  /**
   * Fresh handshake setup (metadata, relay connection).
   */
  virtual void init() = 0;

  /**
   * Show the pairing prompt. May fail with "URI missing" while the wallet
   * extension is still starting.
   */
  virtual void openPairingModal() = 0;

  virtual void disconnect(const std::string& pairing_topic) = 0;

  // Snapshots of the two registries that must agree on a signing session
  virtual std::vector<RegistryEntry> sessionRegistry() = 0;
  virtual std::vector<RegistryEntry> signClientRegistry() = 0;

  /**
   * Ask the wallet to sign and submit `transaction_bytes` on the signing
   * session `session_topic`. The future resolves to the wallet's response
   * document, or holds a std::runtime_error on rejection. It must not block
   * in its destructor.
   */
  virtual std::future<nlohmann::json> sendTransaction(const std::string& session_topic,
                                                      const std::vector<uint8_t>& transaction_bytes,
                                                      const std::string& signer_account_id) = 0;

  virtual void onPairing(PairingHandler handler) = 0;
  virtual void onConnectionStatusChange(StatusHandler handler) = 0;
  virtual void onDisconnection(DisconnectHandler handler) = 0;
};

}  // namespace wallet
}  // namespace settlement

#endif  // WALLET_CONNECTOR_HPP_
