#ifndef PAYMENT_REQUEST_BUILDER_HPP_
#define PAYMENT_REQUEST_BUILDER_HPP_

#include "wallet_session_manager.hpp"
#include "../hedera/token_config.hpp"
#include "../network/ledger_query_service.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace settlement {
namespace wallet {

/**
 * What the payer is asked to send.
 */
struct PaymentRequest {
  std::string merchant_account_id;
  hedera::TokenType token = hedera::TokenType::HBAR;
  std::string amount;  // decimal string in token units
  std::string memo;
};

/**
 * Transfer ready for signature. HBAR payments carry native legs in
 * tinybars; token payments carry token legs in smallest units.
 */
struct UnsignedTransfer {
  std::string transaction_id;  // account@seconds.nanos
  std::string payer_account_id;
  std::string merchant_account_id;
  hedera::TokenType token = hedera::TokenType::HBAR;
  std::string memo;
  std::vector<network::TransferLeg> hbar_transfers;
  std::vector<network::TokenTransferLeg> token_transfers;
};

nlohmann::json transferToJson(const UnsignedTransfer& transfer);
std::vector<uint8_t> serializeTransfer(const UnsignedTransfer& transfer);

// Shapes in which wallets report the submitted transaction id
struct TopLevelTransactionId { std::string transaction_id; };        // {"transactionId": ..}
struct ReceiptTransactionId { std::string transaction_id; };         // {"receipt": {"transactionId": ..}}
struct NestedResponseTransactionId { std::string transaction_id; };  // {"response": {"transactionId": ..}}
struct PlainTransactionId { std::string transaction_id; };           // ".."
struct UnrecognizedResponse {};

using WalletResponse = std::variant<TopLevelTransactionId,
                                    ReceiptTransactionId,
                                    NestedResponseTransactionId,
                                    PlainTransactionId,
                                    UnrecognizedResponse>;

WalletResponse parseWalletResponse(const nlohmann::json& response);
std::optional<std::string> extractTransactionId(const WalletResponse& response);

enum class PaymentErrorClass {
  NONE,
  USER_REJECTED,
  TOKEN_NOT_ASSOCIATED,
  INSUFFICIENT_BALANCE,
  TIMEOUT,
  SESSION_NOT_ESTABLISHED,
  NOT_PAIRED,
  INVALID_REQUEST,
  TRANSIENT
};

std::string paymentErrorClassToString(PaymentErrorClass error_class);

struct ErrorClassification {
  PaymentErrorClass error_class = PaymentErrorClass::TRANSIENT;
  bool retryable = true;
  std::string message;  // shown to the payer
};

/**
 * Classify a wallet failure message.
 */
ErrorClassification classifyWalletError(const std::string& message, hedera::TokenType token);

struct SubmissionResult {
  bool success = false;
  std::optional<std::string> transaction_id;  // as reported by the wallet
  std::string client_transaction_id;          // id the transfer was built with
  PaymentErrorClass error_class = PaymentErrorClass::NONE;
  bool retryable = false;
  std::string error;         // raw failure message
  std::string user_message;

  bool rejected() const { return error_class == PaymentErrorClass::USER_REJECTED; }
};

/**
 * Builds payer-to-merchant transfers and submits them through the wallet
 * session.
 */
class PaymentRequestBuilder {
 public:
  using Clock = std::function<std::chrono::system_clock::time_point()>;

  PaymentRequestBuilder(WalletSessionManager& session, hedera::Network network,
                        Clock clock = Clock());

  /**
   * Build the unsigned transfer from `payer_account_id`.
   * Throws std::invalid_argument for a bad amount or a token that is not
   * deployed on the network.
   */
  UnsignedTransfer buildTransfer(const PaymentRequest& request,
                                 const std::string& payer_account_id) const;

  /**
   * Build, sign and submit. Failures come back classified, never thrown.
   */
  SubmissionResult submitPayment(const PaymentRequest& request);

 private:
  WalletSessionManager& session_;
  hedera::Network network_;
  Clock clock_;
};

}  // namespace wallet
}  // namespace settlement

#endif  // PAYMENT_REQUEST_BUILDER_HPP_
