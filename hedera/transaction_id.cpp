#include "transaction_id.hpp"
#include "observability/logger.hpp"

#include <iomanip>
#include <regex>
#include <sstream>

namespace settlement {
namespace hedera {

namespace {

const std::regex& dashPattern() {
  static const std::regex pattern(R"(^(0\.0\.\d+)-(\d+)-(\d+)$)");
  return pattern;
}

const std::regex& atPattern() {
  static const std::regex pattern(R"(^(0\.0\.\d+)@(\d+)\.(\d+)$)");
  return pattern;
}

std::string padNanos(const std::string& nanos) {
  if (nanos.size() >= 9) return nanos;
  return std::string(9 - nanos.size(), '0') + nanos;
}

}  // namespace

std::string normalize(const std::string& transaction_id) {
  if (std::regex_match(transaction_id, dashPattern())) {
    return transaction_id;
  }

  std::smatch match;
  if (std::regex_match(transaction_id, match, atPattern())) {
    return match[1].str() + "-" + match[2].str() + "-" + padNanos(match[3].str());
  }

  SETTLEMENT_LOG_BUILDER(observability::LogLevel::WARN,
                         "Unrecognized transaction id format, storing as received")
      .field("transaction_id", transaction_id);
  return transaction_id;
}

bool isNormalizedFormat(const std::string& transaction_id) {
  return std::regex_match(transaction_id, dashPattern());
}

std::string toAtFormat(const std::string& transaction_id) {
  std::smatch match;
  if (std::regex_match(transaction_id, match, dashPattern())) {
    return match[1].str() + "@" + match[2].str() + "." + match[3].str();
  }
  return transaction_id;
}

std::string correlationId(const std::string& network_prefix,
                          const std::string& normalized_transaction_id) {
  return network_prefix + "_" + normalized_transaction_id;
}

std::string generateTransactionId(const std::string& account_id,
                                  std::chrono::system_clock::time_point valid_start) {
  auto nanos_since_epoch = std::chrono::duration_cast<std::chrono::nanoseconds>(
      valid_start.time_since_epoch()).count();

  std::stringstream ss;
  ss << account_id << "@" << nanos_since_epoch / 1000000000LL << "."
     << std::setw(9) << std::setfill('0') << nanos_since_epoch % 1000000000LL;
  return ss.str();
}

}  // namespace hedera
}  // namespace settlement
