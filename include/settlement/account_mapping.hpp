#ifndef ACCOUNT_MAPPING_HPP_
#define ACCOUNT_MAPPING_HPP_

#include "../hedera/token_config.hpp"
#include "invoice_store.hpp"

#include <optional>
#include <string>
#include <vector>

namespace settlement {
namespace posting {

// Chart of accounts codes used by settlement postings
constexpr const char* kAccountsReceivableCode = "1200";
constexpr const char* kAccountsReceivableName = "Accounts Receivable";

std::string clearingAccountCode(hedera::TokenType token);
std::string clearingAccountName(hedera::TokenType token);

std::vector<std::string> allClearingAccountCodes();
bool isCryptoClearingAccount(const std::string& code);
std::optional<hedera::TokenType> tokenFromClearingAccount(const std::string& code);

/**
 * Throws std::invalid_argument when `code` is not the clearing account of
 * `token`.
 */
void validateTokenAccountMapping(hedera::TokenType token, const std::string& code);

LedgerAccount clearingAccountFor(const std::string& organization_id, hedera::TokenType token);
LedgerAccount receivablesAccountFor(const std::string& organization_id);

}  // namespace posting
}  // namespace settlement

#endif  // ACCOUNT_MAPPING_HPP_
