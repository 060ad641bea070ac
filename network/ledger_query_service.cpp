#include "ledger_query_service.hpp"

#include <nlohmann/json.hpp>

#include <sstream>
#include <stdexcept>

namespace settlement {
namespace network {

using json = nlohmann::json;

namespace {

std::string stringField(const json& object, const char* key) {
  auto it = object.find(key);
  if (it == object.end() || !it->is_string()) return "";
  return it->get<std::string>();
}

int64_t integerField(const json& object, const char* key) {
  auto it = object.find(key);
  if (it == object.end() || !it->is_number_integer()) return 0;
  return it->get<int64_t>();
}

json parseBody(const std::string& body) {
  try {
    return json::parse(body);
  } catch (const json::parse_error& e) {
    throw std::runtime_error(std::string("Invalid mirror node response: ") + e.what());
  }
}

MirrorTransaction parseTransaction(const json& item) {
  MirrorTransaction tx;
  tx.transaction_id = stringField(item, "transaction_id");
  tx.consensus_timestamp = stringField(item, "consensus_timestamp");
  tx.memo_base64 = stringField(item, "memo_base64");
  tx.result = stringField(item, "result");
  tx.name = stringField(item, "name");

  auto transfers = item.find("transfers");
  if (transfers != item.end() && transfers->is_array()) {
    for (const auto& leg : *transfers) {
      tx.transfers.push_back({stringField(leg, "account"), integerField(leg, "amount")});
    }
  }

  auto token_transfers = item.find("token_transfers");
  if (token_transfers != item.end() && token_transfers->is_array()) {
    for (const auto& leg : *token_transfers) {
      tx.token_transfers.push_back({stringField(leg, "token_id"),
                                    stringField(leg, "account"),
                                    integerField(leg, "amount")});
    }
  }
  return tx;
}

}  // namespace

std::string buildTransactionsPath(const TransactionQuery& query) {
  std::stringstream ss;
  ss << "/api/v1/transactions?account.id=" << query.account_id
     << "&limit=" << query.limit
     << "&order=" << query.order;

  if (query.timestamp_gte) {
    ss << "&timestamp=gte:" << *query.timestamp_gte;
  }

  if (!query.transaction_types.empty()) {
    ss << "&transactionType=";
    for (size_t i = 0; i < query.transaction_types.size(); ++i) {
      if (i > 0) ss << ",";
      ss << query.transaction_types[i];
    }
  }
  return ss.str();
}

bool isTransactionConfirmed(const MirrorTransaction& transaction) {
  return transaction.result == "SUCCESS" && !transaction.consensus_timestamp.empty();
}

std::vector<MirrorTransaction> parseTransactionsJson(const std::string& body) {
  json document = parseBody(body);
  if (!document.is_object()) {
    throw std::runtime_error("Invalid mirror node response: expected an object");
  }

  std::vector<MirrorTransaction> transactions;
  auto list = document.find("transactions");
  if (list == document.end() || !list->is_array()) {
    return transactions;
  }

  for (const auto& item : *list) {
    if (item.is_object()) {
      transactions.push_back(parseTransaction(item));
    }
  }
  return transactions;
}

AccountBalance parseAccountBalanceJson(const std::string& body) {
  json document = parseBody(body);
  AccountBalance balance;

  auto outer = document.find("balance");
  if (outer == document.end() || !outer->is_object()) {
    throw std::runtime_error("Invalid account response: missing balance");
  }

  balance.tinybars = integerField(*outer, "balance");

  auto tokens = outer->find("tokens");
  if (tokens != outer->end() && tokens->is_array()) {
    for (const auto& token : *tokens) {
      balance.tokens[stringField(token, "token_id")] = integerField(token, "balance");
    }
  }
  return balance;
}

std::vector<TokenAssociation> parseTokenAssociationsJson(const std::string& body) {
  json document = parseBody(body);
  std::vector<TokenAssociation> associations;

  auto tokens = document.find("tokens");
  if (tokens == document.end() || !tokens->is_array()) {
    return associations;
  }

  for (const auto& token : *tokens) {
    associations.push_back({stringField(token, "token_id"), integerField(token, "balance")});
  }
  return associations;
}

std::string queryStatusToString(QueryStatus status) {
  switch (status) {
    case QueryStatus::OK: return "OK";
    case QueryStatus::TIMEOUT: return "TIMEOUT";
    case QueryStatus::NETWORK_ERROR: return "NETWORK_ERROR";
    case QueryStatus::HTTP_ERROR: return "HTTP_ERROR";
    case QueryStatus::PARSE_ERROR: return "PARSE_ERROR";
    default: return "UNKNOWN";
  }
}

}  // namespace network
}  // namespace settlement
