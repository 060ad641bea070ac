#include "mirror_node_client.hpp"
#include "hedera/transaction_id.hpp"
#include "observability/logger.hpp"
#include "observability/metrics.hpp"

#include <curl/curl.h>

#include <stdexcept>

namespace settlement {
namespace network {

namespace {

size_t writeToString(void* contents, size_t size, size_t nmemb, void* userp) {
  auto* buffer = static_cast<std::string*>(userp);
  buffer->append(static_cast<char*>(contents), size * nmemb);
  return size * nmemb;
}

}  // namespace

MirrorNodeClient::MirrorNodeClient(const Config& config) : config_(config) {
  while (!config_.base_url.empty() && config_.base_url.back() == '/') {
    config_.base_url.pop_back();
  }
}

HttpResponse MirrorNodeClient::httpGet(const std::string& path) const {
  HttpResponse response;
  const std::string url = config_.base_url + path;

  CURL* curl = curl_easy_init();
  if (!curl) {
    response.curl_code = CURLE_FAILED_INIT;
    response.error_message = "Failed to init curl";
    return response;
  }

  struct curl_slist* header_list = nullptr;
  header_list = curl_slist_append(header_list, "Accept: application/json");

  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeToString);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
  curl_easy_setopt(curl, CURLOPT_USERAGENT, config_.user_agent.c_str());
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, config_.timeout_ms);
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, config_.connect_timeout_ms);
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
  curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);

  CURLcode code;
  {
    observability::MetricsCollector::Timer timer(observability::getGlobalMetrics(),
                                                 "mirror_query_seconds");
    code = curl_easy_perform(curl);
  }

  response.curl_code = code;
  if (code != CURLE_OK) {
    response.error_message = curl_easy_strerror(code);
    response.timed_out = (code == CURLE_OPERATION_TIMEDOUT);
  } else {
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
  }

  curl_slist_free_all(header_list);
  curl_easy_cleanup(curl);

  SETTLEMENT_LOG_BUILDER(observability::LogLevel::DEBUG, "Mirror node request completed")
      .field("url", url)
      .field("status", static_cast<int>(response.status))
      .field("timed_out", response.timed_out);
  return response;
}

TransactionPage MirrorNodeClient::queryTransactions(const TransactionQuery& query) {
  TransactionPage page;
  HttpResponse response = httpGet(buildTransactionsPath(query));

  if (response.timed_out) {
    page.status = QueryStatus::TIMEOUT;
    page.error = "Timeout";
    return page;
  }
  if (response.curl_code != CURLE_OK) {
    page.status = QueryStatus::NETWORK_ERROR;
    page.error = response.error_message;
    return page;
  }
  if (response.status < 200 || response.status >= 300) {
    page.status = QueryStatus::HTTP_ERROR;
    page.error = "Mirror node returned " + std::to_string(response.status);
    return page;
  }

  try {
    page.transactions = parseTransactionsJson(response.body);
  } catch (const std::exception& e) {
    page.status = QueryStatus::PARSE_ERROR;
    page.error = e.what();
  }
  return page;
}

std::optional<MirrorTransaction> MirrorNodeClient::getTransaction(
    const std::string& transaction_id) {
  HttpResponse response = httpGet("/api/v1/transactions/" + hedera::normalize(transaction_id));

  if (response.curl_code != CURLE_OK || response.status != 200) {
    SETTLEMENT_LOG_BUILDER(observability::LogLevel::WARN, "Transaction lookup failed")
        .field("transaction_id", transaction_id)
        .field("status", static_cast<int>(response.status))
        .field("error", response.error_message);
    return std::nullopt;
  }

  try {
    auto transactions = parseTransactionsJson(response.body);
    if (transactions.empty()) return std::nullopt;
    return transactions.front();
  } catch (const std::exception& e) {
    SETTLEMENT_LOG_ERROR("Failed to parse transaction " + transaction_id + ": " + e.what());
    return std::nullopt;
  }
}

std::optional<AccountBalance> MirrorNodeClient::getAccountBalance(const std::string& account_id) {
  HttpResponse response = httpGet("/api/v1/accounts/" + account_id);

  if (response.curl_code != CURLE_OK || response.status != 200) {
    SETTLEMENT_LOG_BUILDER(observability::LogLevel::WARN, "Account balance lookup failed")
        .field("account_id", account_id)
        .field("status", static_cast<int>(response.status))
        .field("error", response.error_message);
    return std::nullopt;
  }

  try {
    return parseAccountBalanceJson(response.body);
  } catch (const std::exception& e) {
    SETTLEMENT_LOG_ERROR("Failed to parse account " + account_id + ": " + e.what());
    return std::nullopt;
  }
}

std::optional<std::vector<TokenAssociation>> MirrorNodeClient::getTokenAssociations(
    const std::string& account_id) {
  HttpResponse response = httpGet("/api/v1/accounts/" + account_id + "/tokens");

  if (response.curl_code != CURLE_OK || response.status != 200) {
    SETTLEMENT_LOG_BUILDER(observability::LogLevel::WARN, "Token association lookup failed")
        .field("account_id", account_id)
        .field("status", static_cast<int>(response.status))
        .field("error", response.error_message);
    return std::nullopt;
  }

  try {
    return parseTokenAssociationsJson(response.body);
  } catch (const std::exception& e) {
    SETTLEMENT_LOG_ERROR("Failed to parse token associations for " + account_id + ": " + e.what());
    return std::nullopt;
  }
}

}  // namespace network
}  // namespace settlement
