#ifndef PAYMENT_VALIDATOR_HPP_
#define PAYMENT_VALIDATOR_HPP_

#include "../hedera/token_config.hpp"

#include <string>

namespace settlement {
namespace matching {

/**
 * Verdict for a received amount against the amount an invoice requires.
 * Underpayment and overpayment are outcomes, not errors.
 */
struct PaymentValidation {
  bool is_valid = false;
  double required_amount = 0.0;
  double received_amount = 0.0;
  double difference = 0.0;          // received - required
  double difference_percent = 0.0;
  double tolerance_percent = 0.0;
  bool is_underpayment = false;
  bool is_overpayment = false;
  double shortfall = 0.0;           // > 0 only for underpayment
  double excess = 0.0;              // > 0 only for overpayment
  hedera::TokenType token = hedera::TokenType::HBAR;
  std::string message;
};

struct AcceptableRange {
  double min = 0.0;
  double max = 0.0;
  double tolerance_percent = 0.0;
};

struct TokenTypeCheck {
  bool is_valid = true;
  std::string message;
};

enum class UnderpaymentAction {
  MANUAL_REVIEW,    // under 1% short, usually rounding or fees
  RETRY,            // 1% to 10% short
  CONTACT_SUPPORT   // 10% or more short
};

struct UnderpaymentAssessment {
  bool can_retry = true;
  double shortfall = 0.0;
  double shortfall_percent = 0.0;
  UnderpaymentAction action = UnderpaymentAction::RETRY;
  std::string message;
};

struct OverpaymentAssessment {
  bool is_acceptable = true;   // up to 20% over
  bool requires_review = false;  // more than 10% over
  double excess = 0.0;
  double excess_percent = 0.0;
  std::string message;
};

/**
 * Classify `received` against `required` using the tolerance of `token`.
 * Accepts anything in [required * (1 - tol), required * (1 + tol)].
 */
PaymentValidation validatePaymentAmount(double required, double received,
                                        hedera::TokenType token);

TokenTypeCheck validateTokenType(hedera::TokenType expected, hedera::TokenType received);

double getToleranceForToken(hedera::TokenType token);

AcceptableRange getAcceptableRange(double required, hedera::TokenType token);

bool isWithinTolerance(double required, double received, hedera::TokenType token);

/**
 * Short customer-facing text for a verdict.
 */
std::string formatValidationError(const PaymentValidation& validation);

/**
 * Step-by-step instructions to top up an underpayment. Empty unless the
 * verdict is an underpayment.
 */
std::string getRetryInstructions(const PaymentValidation& validation,
                                 const std::string& merchant_account_id);

UnderpaymentAssessment assessUnderpayment(double required, double received,
                                          hedera::TokenType token);

OverpaymentAssessment assessOverpayment(double required, double received,
                                        hedera::TokenType token);

std::string underpaymentActionToString(UnderpaymentAction action);

/**
 * Fixed-point rendering used in all validator messages, e.g. "99.00000000".
 */
std::string formatFixed(double value, int precision = 8);

}  // namespace matching
}  // namespace settlement

#endif  // PAYMENT_VALIDATOR_HPP_
