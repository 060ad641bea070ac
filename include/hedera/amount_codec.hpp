#ifndef AMOUNT_CODEC_HPP_
#define AMOUNT_CODEC_HPP_

#include "token_config.hpp"

#include <cstdint>
#include <string>

namespace settlement {
namespace hedera {

constexpr int kMaxDecimals = 18;

/**
 * Convert a decimal amount ("12.5") to smallest units at the given precision,
 * returned as a digit string without leading zeros ("1250000000" at 8).
 * Exact for every precision in [0, 18] and any magnitude; conversion is done
 * on the digit string, never by float multiplication.
 *
 * Throws std::invalid_argument for negative, empty or malformed input, for
 * more fractional digits than `decimals`, and for decimals outside [0, 18].
 */
std::string toSmallestUnitDigits(const std::string& amount, int decimals);

/**
 * Exact inverse of toSmallestUnitDigits: "150000000" at 8 decimals is
 * "1.50000000". Throws std::invalid_argument for a negative or non-digit
 * value or decimals out of range.
 */
std::string fromSmallestUnitDigits(const std::string& digits, int decimals);

/**
 * toSmallestUnitDigits narrowed to int64_t, the width of a Hedera transfer
 * leg. Same validation, plus std::overflow_error when the value does not fit.
 */
int64_t toSmallestUnit(const std::string& amount, int decimals);

/**
 * Double overload. The value is rendered in its shortest fixed notation
 * first, so 0.1 converts as "0.1". NaN and infinities are rejected.
 */
int64_t toSmallestUnit(double amount, int decimals);

int64_t toSmallestUnit(const std::string& amount, TokenType token);

/**
 * Inverse of toSmallestUnit: 150000000 at 8 decimals is "1.50000000".
 * With zero decimals the whole number is returned without a point.
 * Throws std::invalid_argument for negative input or decimals out of range.
 */
std::string fromSmallestUnit(int64_t value, int decimals);

std::string fromSmallestUnit(int64_t value, TokenType token);

/**
 * Trim insignificant trailing zeros: "50.010000" -> "50.01", "3.000" -> "3".
 */
std::string formatAmount(const std::string& decimal);

/**
 * Smallest units as a floating value for tolerance arithmetic and display.
 */
double toDecimal(int64_t value, int decimals);

/**
 * Number of digits after the decimal point in a plain decimal string.
 */
int fractionDigits(const std::string& decimal);

}  // namespace hedera
}  // namespace settlement

#endif  // AMOUNT_CODEC_HPP_
