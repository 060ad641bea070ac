#include "hedera/transaction_id.hpp"

#include <gtest/gtest.h>

#include <chrono>

using namespace settlement::hedera;

TEST(TransactionIdTest, NormalizesAtFormatWithNanosPadding) {
  EXPECT_EQ(normalize("0.0.5363033@1769582713.055549545"),
            "0.0.5363033-1769582713-055549545");
  EXPECT_EQ(normalize("0.0.123@1700000000.5"), "0.0.123-1700000000-000000005");
  EXPECT_EQ(normalize("0.0.123@1700000000.000000000"), "0.0.123-1700000000-000000000");
}

TEST(TransactionIdTest, DashFormatIsIdempotent) {
  const std::string dash = "0.0.5363033-1769582713-055549545";
  EXPECT_EQ(normalize(dash), dash);
  EXPECT_EQ(normalize(normalize("0.0.42@1700000001.25")), normalize("0.0.42@1700000001.25"));
  EXPECT_TRUE(isNormalizedFormat(dash));
  EXPECT_FALSE(isNormalizedFormat("0.0.5363033@1769582713.055549545"));
}

TEST(TransactionIdTest, BothSpellingsOfOneTransactionConverge) {
  EXPECT_EQ(normalize("0.0.5363033@1769582713.055549545"),
            normalize("0.0.5363033-1769582713-055549545"));
}

TEST(TransactionIdTest, UnrecognizedIdsPassThrough) {
  EXPECT_EQ(normalize("not-a-transaction"), "not-a-transaction");
  EXPECT_EQ(normalize(""), "");
  EXPECT_EQ(normalize("0.0.1@abc.def"), "0.0.1@abc.def");
  EXPECT_FALSE(isNormalizedFormat("not-a-transaction"));
}

TEST(TransactionIdTest, ConvertsBackToAtFormat) {
  EXPECT_EQ(toAtFormat("0.0.123-1700000000-000000005"), "0.0.123@1700000000.000000005");
  EXPECT_EQ(toAtFormat("0.0.123@1700000000.5"), "0.0.123@1700000000.5");
  EXPECT_EQ(normalize(toAtFormat("0.0.9-1700000000-123456789")), "0.0.9-1700000000-123456789");
}

TEST(TransactionIdTest, BuildsCorrelationIdFromPrefix) {
  EXPECT_EQ(correlationId("hedera", normalize("0.0.5363033@1769582713.055549545")),
            "hedera_0.0.5363033-1769582713-055549545");
}

TEST(TransactionIdTest, GeneratesAtFormatIdFromValidStart) {
  std::chrono::system_clock::time_point start{std::chrono::duration_cast<
      std::chrono::system_clock::duration>(std::chrono::seconds(1700000000) +
                                           std::chrono::microseconds(5))};
  const std::string id = generateTransactionId("0.0.1001", start);
  EXPECT_EQ(id, "0.0.1001@1700000000.000005000");
  EXPECT_EQ(normalize(id), "0.0.1001-1700000000-000005000");
}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
