#include "payment_request_builder.hpp"
#include "hedera/amount_codec.hpp"
#include "hedera/transaction_id.hpp"
#include "observability/logger.hpp"

#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <stdexcept>

namespace settlement {
namespace wallet {

namespace {

std::string toLower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}

bool containsAny(const std::string& text, std::initializer_list<const char*> needles) {
  for (const char* needle : needles) {
    if (text.find(needle) != std::string::npos) return true;
  }
  return false;
}

std::optional<std::string> stringField(const nlohmann::json& object, const char* key) {
  if (!object.is_object()) return std::nullopt;
  auto it = object.find(key);
  if (it == object.end() || !it->is_string()) return std::nullopt;
  std::string value = it->get<std::string>();
  if (value.empty()) return std::nullopt;
  return value;
}

struct TransactionIdVisitor {
  std::optional<std::string> operator()(const TopLevelTransactionId& r) const { return r.transaction_id; }
  std::optional<std::string> operator()(const ReceiptTransactionId& r) const { return r.transaction_id; }
  std::optional<std::string> operator()(const NestedResponseTransactionId& r) const { return r.transaction_id; }
  std::optional<std::string> operator()(const PlainTransactionId& r) const { return r.transaction_id; }
  std::optional<std::string> operator()(const UnrecognizedResponse&) const { return std::nullopt; }
};

ErrorClassification makeClassification(PaymentErrorClass error_class, bool retryable,
                                        std::string message) {
  ErrorClassification classification;
  classification.error_class = error_class;
  classification.retryable = retryable;
  classification.message = std::move(message);
  return classification;
}

}  // namespace

nlohmann::json transferToJson(const UnsignedTransfer& transfer) {
  nlohmann::json doc;
  doc["type"] = hedera::tokenInfo(transfer.token).is_native ? "CRYPTOTRANSFER" : "TOKENTRANSFER";
  doc["transactionId"] = transfer.transaction_id;
  doc["payerAccountId"] = transfer.payer_account_id;
  doc["memo"] = transfer.memo;

  nlohmann::json hbar = nlohmann::json::array();
  for (const auto& leg : transfer.hbar_transfers) {
    hbar.push_back({{"accountId", leg.account}, {"amount", leg.amount}});
  }
  doc["hbarTransfers"] = hbar;

  nlohmann::json tokens = nlohmann::json::array();
  for (const auto& leg : transfer.token_transfers) {
    tokens.push_back({{"tokenId", leg.token_id}, {"accountId", leg.account}, {"amount", leg.amount}});
  }
  doc["tokenTransfers"] = tokens;
  return doc;
}

std::vector<uint8_t> serializeTransfer(const UnsignedTransfer& transfer) {
  std::string text = transferToJson(transfer).dump();
  return std::vector<uint8_t>(text.begin(), text.end());
}

WalletResponse parseWalletResponse(const nlohmann::json& response) {
  if (response.is_string()) {
    std::string value = response.get<std::string>();
    if (!value.empty()) return PlainTransactionId{value};
    return UnrecognizedResponse{};
  }

  if (auto id = stringField(response, "transactionId")) {
    return TopLevelTransactionId{*id};
  }
  if (response.is_object() && response.contains("receipt")) {
    if (auto id = stringField(response["receipt"], "transactionId")) {
      return ReceiptTransactionId{*id};
    }
  }
  if (response.is_object() && response.contains("response")) {
    if (auto id = stringField(response["response"], "transactionId")) {
      return NestedResponseTransactionId{*id};
    }
  }
  return UnrecognizedResponse{};
}

std::optional<std::string> extractTransactionId(const WalletResponse& response) {
  return std::visit(TransactionIdVisitor{}, response);
}

std::string paymentErrorClassToString(PaymentErrorClass error_class) {
  switch (error_class) {
    case PaymentErrorClass::NONE: return "NONE";
    case PaymentErrorClass::USER_REJECTED: return "USER_REJECTED";
    case PaymentErrorClass::TOKEN_NOT_ASSOCIATED: return "TOKEN_NOT_ASSOCIATED";
    case PaymentErrorClass::INSUFFICIENT_BALANCE: return "INSUFFICIENT_BALANCE";
    case PaymentErrorClass::TIMEOUT: return "TIMEOUT";
    case PaymentErrorClass::SESSION_NOT_ESTABLISHED: return "SESSION_NOT_ESTABLISHED";
    case PaymentErrorClass::NOT_PAIRED: return "NOT_PAIRED";
    case PaymentErrorClass::INVALID_REQUEST: return "INVALID_REQUEST";
    case PaymentErrorClass::TRANSIENT: return "TRANSIENT";
  }
  return "UNKNOWN";
}

ErrorClassification classifyWalletError(const std::string& message, hedera::TokenType token) {
  const std::string lower = toLower(message);
  const std::string symbol = hedera::tokenSymbol(token);

  if (containsAny(lower, {"reject", "cancel", "denied", "user declined"})) {
    return makeClassification(PaymentErrorClass::USER_REJECTED, false,
                              "Transaction rejected. You can try again when ready.");
  }
  if (containsAny(lower, {"not associated", "token_not_associated"})) {
    return makeClassification(
        PaymentErrorClass::TOKEN_NOT_ASSOCIATED, false,
        "Your wallet needs to be associated with " + symbol +
            ". Open your wallet, go to Tokens, and associate " + symbol + " first.");
  }
  if (lower.find("insufficient") != std::string::npos) {
    return makeClassification(
        PaymentErrorClass::INSUFFICIENT_BALANCE, false,
        "Insufficient balance. Make sure you have enough " + symbol +
            " and a small amount of HBAR for network fees.");
  }
  if (containsAny(lower, {"timeout", "timed out", "did not respond"})) {
    return makeClassification(PaymentErrorClass::TIMEOUT, true,
                              "The wallet did not respond in time. Please try again.");
  }
  return makeClassification(PaymentErrorClass::TRANSIENT, true, "Transaction failed: " + message);
}

PaymentRequestBuilder::PaymentRequestBuilder(WalletSessionManager& session,
                                             hedera::Network network, Clock clock)
    : session_(session), network_(network), clock_(std::move(clock)) {
  if (!clock_) {
    clock_ = [] { return std::chrono::system_clock::now(); };
  }
}

UnsignedTransfer PaymentRequestBuilder::buildTransfer(const PaymentRequest& request,
                                                      const std::string& payer_account_id) const {
  if (request.merchant_account_id.empty()) {
    throw std::invalid_argument("Merchant account is required");
  }
  if (request.merchant_account_id == payer_account_id) {
    throw std::invalid_argument("Payer and merchant accounts must differ");
  }

  int64_t units = hedera::toSmallestUnit(request.amount, request.token);
  if (units <= 0) {
    throw std::invalid_argument("Payment amount must be greater than zero");
  }

  UnsignedTransfer transfer;
  transfer.transaction_id = hedera::generateTransactionId(payer_account_id, clock_());
  transfer.payer_account_id = payer_account_id;
  transfer.merchant_account_id = request.merchant_account_id;
  transfer.token = request.token;
  transfer.memo = request.memo;

  if (hedera::tokenInfo(request.token).is_native) {
    transfer.hbar_transfers.push_back({payer_account_id, -units});
    transfer.hbar_transfers.push_back({request.merchant_account_id, units});
  } else {
    auto token_id = hedera::tokenId(request.token, network_);
    if (!token_id) {
      throw std::invalid_argument(hedera::tokenSymbol(request.token) + " is not available on " +
                                  hedera::networkName(network_));
    }
    transfer.token_transfers.push_back({*token_id, payer_account_id, -units});
    transfer.token_transfers.push_back({*token_id, request.merchant_account_id, units});
  }
  return transfer;
}

SubmissionResult PaymentRequestBuilder::submitPayment(const PaymentRequest& request) {
  SubmissionResult result;

  auto payer = session_.accountId();
  if (!session_.isPaired() || !payer) {
    result.error_class = PaymentErrorClass::NOT_PAIRED;
    result.error = "Wallet not connected";
    result.user_message = "Wallet not connected. Please connect your wallet first.";
    return result;
  }

  UnsignedTransfer transfer;
  try {
    transfer = buildTransfer(request, *payer);
  } catch (const std::exception& e) {
    SETTLEMENT_LOG_WARN(std::string("Rejected payment request: ") + e.what());
    result.error_class = PaymentErrorClass::INVALID_REQUEST;
    result.error = e.what();
    result.user_message = e.what();
    return result;
  }
  result.client_transaction_id = transfer.transaction_id;

  SETTLEMENT_LOG_BUILDER(observability::LogLevel::INFO, "Submitting payment to wallet")
      .field("transaction_id", transfer.transaction_id)
      .field("token", hedera::tokenSymbol(request.token))
      .field("amount", request.amount)
      .field("merchant", request.merchant_account_id);

  SendResult sent = session_.sendTransaction(serializeTransfer(transfer), *payer);

  switch (sent.status) {
    case SendStatus::OK: {
      result.success = true;
      result.transaction_id = extractTransactionId(parseWalletResponse(sent.response));
      if (!result.transaction_id) {
        SETTLEMENT_LOG_WARN("Transaction id not found in wallet response: " + sent.response.dump());
      }
      return result;
    }
    case SendStatus::NOT_PAIRED:
      result.error_class = PaymentErrorClass::NOT_PAIRED;
      result.user_message = "Wallet not connected. Please connect your wallet first.";
      break;
    case SendStatus::SESSION_NOT_ESTABLISHED:
      result.error_class = PaymentErrorClass::SESSION_NOT_ESTABLISHED;
      result.user_message = "Signing session not established. Please reconnect your wallet.";
      break;
    case SendStatus::TIMEOUT:
      result.error_class = PaymentErrorClass::TIMEOUT;
      result.retryable = true;
      result.user_message = "The wallet did not respond in time. Please try again.";
      break;
    case SendStatus::FAILED: {
      auto classification = classifyWalletError(sent.error, request.token);
      result.error_class = classification.error_class;
      result.retryable = classification.retryable;
      result.user_message = classification.message;
      break;
    }
  }
  result.error = sent.error;

  SETTLEMENT_LOG_BUILDER(observability::LogLevel::WARN, "Payment submission failed")
      .field("transaction_id", transfer.transaction_id)
      .field("error_class", paymentErrorClassToString(result.error_class))
      .field("error", result.error);
  return result;
}

}  // namespace wallet
}  // namespace settlement
