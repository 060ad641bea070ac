#include "payment_validator.hpp"
#include "observability/logger.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace settlement {
namespace matching {

namespace {

std::string formatPlain(double value) {
  std::stringstream ss;
  ss << value;
  return ss.str();
}

void checkRequired(double required) {
  if (!(required > 0.0) || std::isinf(required)) {
    throw std::invalid_argument("Required amount must be a positive number");
  }
}

}  // namespace

std::string formatFixed(double value, int precision) {
  std::stringstream ss;
  ss << std::fixed << std::setprecision(precision) << value;
  return ss.str();
}

double getToleranceForToken(hedera::TokenType token) {
  return hedera::tokenInfo(token).tolerance;
}

AcceptableRange getAcceptableRange(double required, hedera::TokenType token) {
  const double tolerance = getToleranceForToken(token);
  return {required * (1 - tolerance), required * (1 + tolerance), tolerance * 100};
}

bool isWithinTolerance(double required, double received, hedera::TokenType token) {
  const AcceptableRange range = getAcceptableRange(required, token);
  return received >= range.min && received <= range.max;
}

PaymentValidation validatePaymentAmount(double required, double received,
                                        hedera::TokenType token) {
  checkRequired(required);

  const std::string symbol = hedera::tokenSymbol(token);
  const AcceptableRange range = getAcceptableRange(required, token);

  PaymentValidation v;
  v.token = token;
  v.required_amount = required;
  v.received_amount = received;
  v.difference = received - required;
  v.difference_percent = (v.difference / required) * 100;
  v.tolerance_percent = range.tolerance_percent;
  v.is_underpayment = received < range.min;
  v.is_overpayment = received > range.max;
  v.is_valid = !v.is_underpayment && !v.is_overpayment;

  if (v.is_underpayment) {
    v.shortfall = required - received;
    v.message = "Underpayment: Received " + formatFixed(received) + " " + symbol +
                ", required " + formatFixed(required) + " " + symbol +
                ", short " + formatFixed(v.shortfall) + " " + symbol +
                " (tolerance: " + formatPlain(v.tolerance_percent) + "%)";
  } else if (v.is_overpayment) {
    v.excess = received - required;
    v.message = "Overpayment: Received " + formatFixed(received) + " " + symbol +
                ", required " + formatFixed(required) + " " + symbol +
                " (+" + formatFixed(v.difference_percent, 2) + "% over tolerance)";
  } else {
    v.message = "Valid payment: " + formatFixed(received) + " " + symbol;
  }

  SETTLEMENT_LOG_BUILDER(observability::LogLevel::INFO, "Payment validation completed")
      .field("token", symbol)
      .field("required", required)
      .field("received", received)
      .field("difference_percent", v.difference_percent)
      .field("is_valid", v.is_valid);

  return v;
}

TokenTypeCheck validateTokenType(hedera::TokenType expected, hedera::TokenType received) {
  if (expected == received) return {};

  const std::string want = hedera::tokenSymbol(expected);
  return {false, "Wrong token: Expected " + want + " but received " +
                     hedera::tokenSymbol(received) + ". Please send payment using " +
                     want + "."};
}

std::string formatValidationError(const PaymentValidation& validation) {
  if (validation.is_valid) {
    return "Payment validated successfully";
  }

  if (validation.is_underpayment) {
    return "Payment incomplete: Missing " + formatFixed(validation.shortfall) + " " +
           hedera::tokenSymbol(validation.token) + ". Please send the remaining amount.";
  }

  if (validation.is_overpayment) {
    return "Payment received exceeds requested amount by " +
           formatFixed(std::fabs(validation.difference_percent), 2) +
           "%. The excess will be accepted but may be subject to review.";
  }

  return "Payment validation failed. Please contact support.";
}

std::string getRetryInstructions(const PaymentValidation& validation,
                                 const std::string& merchant_account_id) {
  if (!validation.is_underpayment) {
    return "";
  }

  std::stringstream ss;
  ss << "To complete this payment:\n\n"
     << "1. Send an additional " << formatFixed(validation.shortfall) << " "
     << hedera::tokenSymbol(validation.token) << "\n"
     << "2. To the same account: " << merchant_account_id << "\n"
     << "3. Include the same memo if provided\n\n"
     << "The system will automatically detect and validate your payment.";
  return ss.str();
}

UnderpaymentAssessment assessUnderpayment(double required, double received,
                                          hedera::TokenType token) {
  checkRequired(required);

  UnderpaymentAssessment result;
  result.shortfall = required - received;
  result.shortfall_percent = (result.shortfall / required) * 100;

  const std::string symbol = hedera::tokenSymbol(token);
  if (result.shortfall_percent < 1) {
    result.action = UnderpaymentAction::MANUAL_REVIEW;
    result.message = "Payment was " + formatFixed(result.shortfall_percent, 4) +
                     "% short. This will be reviewed manually.";
  } else if (result.shortfall_percent < 10) {
    result.action = UnderpaymentAction::RETRY;
    result.message = "Payment was " + formatFixed(result.shortfall_percent, 2) +
                     "% short. Please send an additional " + formatFixed(result.shortfall) +
                     " " + symbol + ".";
  } else {
    result.action = UnderpaymentAction::CONTACT_SUPPORT;
    result.message = "Payment was significantly short (" +
                     formatFixed(result.shortfall_percent, 2) +
                     "%). Please contact support for assistance.";
  }

  SETTLEMENT_LOG_BUILDER(observability::LogLevel::WARN, "Underpayment detected")
      .field("token", symbol)
      .field("shortfall", result.shortfall)
      .field("shortfall_percent", result.shortfall_percent)
      .field("action", underpaymentActionToString(result.action));
  return result;
}

OverpaymentAssessment assessOverpayment(double required, double received,
                                        hedera::TokenType token) {
  checkRequired(required);

  OverpaymentAssessment result;
  result.excess = received - required;
  result.excess_percent = (result.excess / required) * 100;
  result.requires_review = result.excess_percent > 10;
  result.is_acceptable = result.excess_percent <= 20;

  const std::string percent = formatFixed(result.excess_percent, 2);
  if (result.excess_percent < 1) {
    result.message = "Payment received with " + formatFixed(result.excess_percent, 4) +
                     "% excess. This is normal and has been accepted.";
  } else if (result.excess_percent <= 10) {
    result.message = "Payment received with " + percent +
                     "% excess. This has been accepted and will be processed normally.";
  } else if (result.excess_percent <= 20) {
    result.message = "Payment received with " + percent +
                     "% excess. This requires manual review but will be processed.";
  } else {
    result.message = "Payment received with " + percent +
                     "% excess. This is unusual and requires manual investigation.";
  }

  SETTLEMENT_LOG_BUILDER(observability::LogLevel::INFO, "Overpayment detected")
      .field("token", hedera::tokenSymbol(token))
      .field("excess", result.excess)
      .field("excess_percent", result.excess_percent)
      .field("requires_review", result.requires_review);
  return result;
}

std::string underpaymentActionToString(UnderpaymentAction action) {
  switch (action) {
    case UnderpaymentAction::MANUAL_REVIEW: return "manual_review";
    case UnderpaymentAction::RETRY: return "retry";
    case UnderpaymentAction::CONTACT_SUPPORT: return "contact_support";
    default: return "unknown";
  }
}

}  // namespace matching
}  // namespace settlement
