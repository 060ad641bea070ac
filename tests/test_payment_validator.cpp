#include "matching/payment_validator.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace settlement;
using namespace settlement::matching;
using hedera::TokenType;

// Tolerance tests

TEST(PaymentValidatorTest, ToleranceDependsOnToken) {
  EXPECT_DOUBLE_EQ(getToleranceForToken(TokenType::HBAR), 0.005);
  EXPECT_DOUBLE_EQ(getToleranceForToken(TokenType::USDC), 0.001);
  EXPECT_DOUBLE_EQ(getToleranceForToken(TokenType::USDT), 0.001);
  EXPECT_DOUBLE_EQ(getToleranceForToken(TokenType::AUDD), 0.001);

  AcceptableRange range = getAcceptableRange(100.0, TokenType::HBAR);
  EXPECT_NEAR(range.min, 99.5, 1e-9);
  EXPECT_NEAR(range.max, 100.5, 1e-9);
  EXPECT_NEAR(range.tolerance_percent, 0.5, 1e-9);
}

TEST(PaymentValidatorTest, ExactAndNearPaymentsAreValid) {
  PaymentValidation exact = validatePaymentAmount(50.0, 50.0, TokenType::USDC);
  EXPECT_TRUE(exact.is_valid);
  EXPECT_FALSE(exact.is_underpayment);
  EXPECT_FALSE(exact.is_overpayment);
  EXPECT_EQ(exact.message, "Valid payment: 50.00000000 USDC");

  EXPECT_TRUE(validatePaymentAmount(100.0, 99.6, TokenType::HBAR).is_valid);
  EXPECT_TRUE(validatePaymentAmount(100.0, 100.05, TokenType::USDC).is_valid);
  EXPECT_TRUE(isWithinTolerance(100.0, 100.4, TokenType::HBAR));
  EXPECT_FALSE(isWithinTolerance(100.0, 100.4, TokenType::USDC));
}

// Underpayment and overpayment tests

TEST(PaymentValidatorTest, HbarUnderpaymentReportsShortfall) {
  PaymentValidation v = validatePaymentAmount(100.0, 99.0, TokenType::HBAR);
  EXPECT_FALSE(v.is_valid);
  EXPECT_TRUE(v.is_underpayment);
  EXPECT_FALSE(v.is_overpayment);
  EXPECT_NEAR(v.shortfall, 1.0, 1e-9);
  EXPECT_NEAR(v.difference_percent, -1.0, 1e-9);
  EXPECT_NE(v.message.find("short 1.00000000 HBAR"), std::string::npos) << v.message;
  EXPECT_NE(v.message.find("tolerance: 0.5%"), std::string::npos) << v.message;

  EXPECT_EQ(formatValidationError(v),
            "Payment incomplete: Missing 1.00000000 HBAR. Please send the remaining amount.");
}

TEST(PaymentValidatorTest, StablecoinOverpaymentIsFlagged) {
  PaymentValidation v = validatePaymentAmount(100.0, 100.2, TokenType::USDC);
  EXPECT_FALSE(v.is_valid);
  EXPECT_TRUE(v.is_overpayment);
  EXPECT_FALSE(v.is_underpayment);
  EXPECT_NEAR(v.excess, 0.2, 1e-9);
  EXPECT_DOUBLE_EQ(v.shortfall, 0.0);
  EXPECT_NE(formatValidationError(v).find("exceeds requested amount by 0.20%"),
            std::string::npos);
}

TEST(PaymentValidatorTest, RequiredAmountMustBePositive) {
  EXPECT_THROW(validatePaymentAmount(0.0, 1.0, TokenType::HBAR), std::invalid_argument);
  EXPECT_THROW(validatePaymentAmount(-5.0, 1.0, TokenType::USDC), std::invalid_argument);
  EXPECT_THROW(assessUnderpayment(0.0, 1.0, TokenType::USDC), std::invalid_argument);
}

TEST(PaymentValidatorTest, TokenMismatchIsReported) {
  EXPECT_TRUE(validateTokenType(TokenType::USDC, TokenType::USDC).is_valid);

  TokenTypeCheck check = validateTokenType(TokenType::USDC, TokenType::HBAR);
  EXPECT_FALSE(check.is_valid);
  EXPECT_EQ(check.message,
            "Wrong token: Expected USDC but received HBAR. Please send payment using USDC.");
}

TEST(PaymentValidatorTest, RetryInstructionsOnlyForUnderpayment) {
  PaymentValidation under = validatePaymentAmount(10.0, 9.0, TokenType::USDT);
  std::string steps = getRetryInstructions(under, "0.0.7777");
  EXPECT_NE(steps.find("Send an additional 1.00000000 USDT"), std::string::npos);
  EXPECT_NE(steps.find("0.0.7777"), std::string::npos);

  PaymentValidation ok = validatePaymentAmount(10.0, 10.0, TokenType::USDT);
  EXPECT_TRUE(getRetryInstructions(ok, "0.0.7777").empty());
}

// Assessment tests

TEST(PaymentValidatorTest, UnderpaymentActionScalesWithShortfall) {
  EXPECT_EQ(assessUnderpayment(100.0, 99.5, TokenType::HBAR).action,
            UnderpaymentAction::MANUAL_REVIEW);
  EXPECT_EQ(assessUnderpayment(100.0, 95.0, TokenType::HBAR).action,
            UnderpaymentAction::RETRY);
  EXPECT_EQ(assessUnderpayment(100.0, 50.0, TokenType::HBAR).action,
            UnderpaymentAction::CONTACT_SUPPORT);
  EXPECT_EQ(underpaymentActionToString(UnderpaymentAction::CONTACT_SUPPORT), "contact_support");
}

TEST(PaymentValidatorTest, OverpaymentReviewThresholds) {
  OverpaymentAssessment small = assessOverpayment(100.0, 105.0, TokenType::USDC);
  EXPECT_TRUE(small.is_acceptable);
  EXPECT_FALSE(small.requires_review);

  OverpaymentAssessment review = assessOverpayment(100.0, 115.0, TokenType::USDC);
  EXPECT_TRUE(review.is_acceptable);
  EXPECT_TRUE(review.requires_review);

  OverpaymentAssessment unusual = assessOverpayment(100.0, 150.0, TokenType::USDC);
  EXPECT_FALSE(unusual.is_acceptable);
  EXPECT_NE(unusual.message.find("manual investigation"), std::string::npos);
}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
