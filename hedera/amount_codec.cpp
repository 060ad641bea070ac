#include "amount_codec.hpp"

#include <charconv>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace settlement {
namespace hedera {

namespace {

void checkDecimals(int decimals) {
  if (decimals < 0 || decimals > kMaxDecimals) {
    throw std::invalid_argument("Decimals must be between 0 and 18");
  }
}

bool allDigits(const std::string& value) {
  if (value.empty()) return false;
  for (char c : value) {
    if (c < '0' || c > '9') return false;
  }
  return true;
}

std::string stripLeadingZeros(const std::string& digits) {
  auto first = digits.find_first_not_of('0');
  return first == std::string::npos ? "0" : digits.substr(first);
}

}  // namespace

std::string toSmallestUnitDigits(const std::string& amount, int decimals) {
  checkDecimals(decimals);

  if (amount.empty()) {
    throw std::invalid_argument("Amount must not be empty");
  }
  if (amount[0] == '-') {
    throw std::invalid_argument("Amount cannot be negative: " + amount);
  }
  if (amount.find_first_of("eE") != std::string::npos) {
    throw std::invalid_argument("Scientific notation is not supported: " + amount);
  }

  std::string whole = amount;
  std::string fraction;
  auto dot = amount.find('.');
  if (dot != std::string::npos) {
    whole = amount.substr(0, dot);
    fraction = amount.substr(dot + 1);
    if (!allDigits(fraction)) {
      throw std::invalid_argument("Invalid amount format: " + amount);
    }
  }
  if (!allDigits(whole)) {
    throw std::invalid_argument("Invalid amount format: " + amount);
  }

  if (static_cast<int>(fraction.size()) > decimals) {
    throw std::invalid_argument("Amount " + amount + " has more than " +
                                std::to_string(decimals) + " decimal places");
  }

  fraction.append(static_cast<size_t>(decimals) - fraction.size(), '0');
  return stripLeadingZeros(whole + fraction);
}

int64_t toSmallestUnit(const std::string& amount, int decimals) {
  const std::string digits = toSmallestUnitDigits(amount, decimals);

  int64_t result = 0;
  const int64_t max = std::numeric_limits<int64_t>::max();
  for (char c : digits) {
    int64_t digit = c - '0';
    if (result > (max - digit) / 10) {
      throw std::overflow_error("Amount " + amount + " at " + std::to_string(decimals) +
                                " decimals does not fit a ledger transfer");
    }
    result = result * 10 + digit;
  }
  return result;
}

int64_t toSmallestUnit(double amount, int decimals) {
  if (std::isnan(amount) || std::isinf(amount)) {
    throw std::invalid_argument("Amount must be a finite number");
  }
  if (amount < 0) {
    throw std::invalid_argument("Amount cannot be negative");
  }

  char buffer[400];
  auto [end, ec] = std::to_chars(buffer, buffer + sizeof(buffer), amount,
                                 std::chars_format::fixed);
  if (ec != std::errc()) {
    throw std::invalid_argument("Amount could not be formatted");
  }
  return toSmallestUnit(std::string(buffer, end), decimals);
}

int64_t toSmallestUnit(const std::string& amount, TokenType token) {
  return toSmallestUnit(amount, tokenInfo(token).decimals);
}

std::string fromSmallestUnitDigits(const std::string& digits, int decimals) {
  checkDecimals(decimals);
  if (!digits.empty() && digits[0] == '-') {
    throw std::invalid_argument("Smallest unit value cannot be negative");
  }
  if (!allDigits(digits)) {
    throw std::invalid_argument("Invalid smallest unit value: " + digits);
  }

  std::string padded = stripLeadingZeros(digits);
  if (decimals == 0) return padded;

  if (padded.size() < static_cast<size_t>(decimals) + 1) {
    padded.insert(0, static_cast<size_t>(decimals) + 1 - padded.size(), '0');
  }

  const size_t split = padded.size() - static_cast<size_t>(decimals);
  return padded.substr(0, split) + "." + padded.substr(split);
}

std::string fromSmallestUnit(int64_t value, int decimals) {
  checkDecimals(decimals);
  if (value < 0) {
    throw std::invalid_argument("Smallest unit value cannot be negative");
  }
  return fromSmallestUnitDigits(std::to_string(value), decimals);
}

std::string fromSmallestUnit(int64_t value, TokenType token) {
  return fromSmallestUnit(value, tokenInfo(token).decimals);
}

std::string formatAmount(const std::string& decimal) {
  if (decimal.find('.') == std::string::npos) return decimal;

  std::string trimmed = decimal;
  while (!trimmed.empty() && trimmed.back() == '0') {
    trimmed.pop_back();
  }
  if (!trimmed.empty() && trimmed.back() == '.') {
    trimmed.pop_back();
  }
  return trimmed.empty() ? "0" : trimmed;
}

double toDecimal(int64_t value, int decimals) {
  return std::stod(fromSmallestUnit(value, decimals));
}

int fractionDigits(const std::string& decimal) {
  auto dot = decimal.find('.');
  if (dot == std::string::npos) return 0;
  return static_cast<int>(decimal.size() - dot - 1);
}

}  // namespace hedera
}  // namespace settlement
