#include "account_mapping.hpp"

#include <stdexcept>

namespace settlement {
namespace posting {

std::string clearingAccountCode(hedera::TokenType token) {
  return hedera::tokenInfo(token).clearing_account_code;
}

std::string clearingAccountName(hedera::TokenType token) {
  return "Crypto Clearing - " + hedera::tokenSymbol(token);
}

std::vector<std::string> allClearingAccountCodes() {
  std::vector<std::string> codes;
  for (auto token : hedera::allTokens()) {
    codes.push_back(clearingAccountCode(token));
  }
  return codes;
}

bool isCryptoClearingAccount(const std::string& code) {
  return tokenFromClearingAccount(code).has_value();
}

std::optional<hedera::TokenType> tokenFromClearingAccount(const std::string& code) {
  for (auto token : hedera::allTokens()) {
    if (clearingAccountCode(token) == code) return token;
  }
  return std::nullopt;
}

void validateTokenAccountMapping(hedera::TokenType token, const std::string& code) {
  const std::string expected = clearingAccountCode(token);
  if (code != expected) {
    throw std::invalid_argument("Invalid clearing account " + code + " for " +
                                hedera::tokenSymbol(token) + ", expected " + expected);
  }
}

LedgerAccount clearingAccountFor(const std::string& organization_id, hedera::TokenType token) {
  LedgerAccount account;
  account.organization_id = organization_id;
  account.code = clearingAccountCode(token);
  account.name = clearingAccountName(token);
  account.account_type = "ASSET";
  return account;
}

LedgerAccount receivablesAccountFor(const std::string& organization_id) {
  LedgerAccount account;
  account.organization_id = organization_id;
  account.code = kAccountsReceivableCode;
  account.name = kAccountsReceivableName;
  account.account_type = "ASSET";
  return account;
}

}  // namespace posting
}  // namespace settlement
