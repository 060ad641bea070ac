#include "concurrent/settlement_processor.hpp"
#include "config/settlement_config.hpp"
#include "database/postgres_advisory_lock.hpp"
#include "database/postgres_connection.hpp"
#include "database/postgres_invoice_store.hpp"
#include "database/postgres_sync_queue.hpp"
#include "hedera/amount_codec.hpp"
#include "matching/payment_validator.hpp"
#include "matching/transaction_matcher.hpp"
#include "matching/transaction_monitor.hpp"
#include "network/mirror_node_client.hpp"
#include "observability/logger.hpp"
#include "observability/metrics.hpp"

#include <curl/curl.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <future>
#include <iostream>
#include <memory>
#include <thread>

using namespace settlement;

std::atomic<bool> running{true};

void signalHandler(int) {
  running = false;
}

namespace {

void printUsage(const char* program) {
  std::cerr << "Usage: " << program
            << " <invoice_id> <token> <amount> [memo] [merchant_account] [network]" << std::endl;
  std::cerr << "  token: HBAR | USDC | USDT | AUDD" << std::endl;
  std::cerr << "  environment: HEDERA_NETWORK, HEDERA_MERCHANT_ACCOUNT_ID, MIRROR_NODE_URL," << std::endl;
  std::cerr << "               DATABASE_HOST/PORT/NAME/USER/PASSWORD, SETTLEMENT_WORKERS, LOG_LEVEL"
            << std::endl;
}

// Owns the curl global state for the lifetime of main()
struct CurlGlobal {
  CurlGlobal() { curl_global_init(CURL_GLOBAL_DEFAULT); }
  ~CurlGlobal() { curl_global_cleanup(); }
};

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 4) {
    printUsage(argv[0]);
    return 1;
  }

  config::SettlementConfig settings = config::SettlementConfig::fromEnvironment();

  std::string invoice_id = argv[1];
  auto token = hedera::parseTokenType(argv[2]);
  std::string amount = argv[3];
  std::optional<std::string> memo;
  if (argc >= 5 && std::string(argv[4]).size() > 0) memo = std::string(argv[4]);
  if (argc >= 6) settings.merchant_account_id = argv[5];
  if (argc >= 7) {
    auto network = hedera::parseNetwork(argv[6]);
    if (!network) {
      std::cerr << "Unknown network: " << argv[6] << std::endl;
      return 1;
    }
    settings.network = *network;
  }

  if (!token) {
    std::cerr << "Unsupported token: " << argv[2] << std::endl;
    printUsage(argv[0]);
    return 1;
  }

  std::string config_error;
  if (!settings.validate(&config_error)) {
    std::cerr << "Invalid configuration: " << config_error << std::endl;
    return 1;
  }

  double expected_amount = 0.0;
  try {
    expected_amount = hedera::toDecimal(hedera::toSmallestUnit(amount, *token),
                                        hedera::tokenInfo(*token).decimals);
  } catch (const std::exception& e) {
    std::cerr << "Invalid amount " << amount << ": " << e.what() << std::endl;
    return 1;
  }

  auto& logger = observability::Logger::getInstance();
  logger.setLogLevel(settings.log_level);
  logger.setContextField("network", hedera::networkName(settings.network));
  logger.setContextField("merchant_account_id", settings.merchant_account_id);

  std::cout << "=== Settlement Monitor ===" << std::endl;
  std::cout << "Invoice: " << invoice_id << std::endl;
  std::cout << "Expecting: " << amount << " " << hedera::tokenSymbol(*token) << std::endl;
  std::cout << "Merchant account: " << settings.merchant_account_id << std::endl;
  std::cout << "Network: " << hedera::networkName(settings.network) << std::endl;
  std::cout << "Mirror node: " << settings.effectiveMirrorUrl() << std::endl;
  std::cout << "Database: " << settings.database.user << "@" << settings.database.host << ":"
            << settings.database.port << "/" << settings.database.name << std::endl;
  std::cout << "Worker threads: " << settings.worker_threads << std::endl;
  std::cout << "==========================" << std::endl;

  signal(SIGINT, signalHandler);
  signal(SIGTERM, signalHandler);

  CurlGlobal curl;
  auto& metrics = observability::getGlobalMetrics();
  metrics.describe("settlement_posted_total", "Invoices settled and posted to the ledger");
  metrics.describe("settlement_duplicate_total", "Settlement requests answered as duplicates");
  metrics.describe("settlement_lock_contention_total", "Settlement attempts that lost the invoice lock");
  metrics.describe("mirror_query_seconds", "Mirror node request latency");
  metrics.describe("matcher_checks_total", "Transaction matcher checks");

  try {
    database::PostgresConnection::Config db_config;
    db_config.host = settings.database.host;
    db_config.port = settings.database.port;
    db_config.database = settings.database.name;
    db_config.username = settings.database.user;
    db_config.password = settings.database.password;

    auto connection = std::make_shared<database::PostgresConnection>(db_config);
    if (!connection->connect()) {
      std::cerr << "Failed to connect to database" << std::endl;
      return 1;
    }

    database::PostgresInvoiceStore store(connection);
    if (!store.initializeSchema()) {
      std::cerr << "Failed to initialize database schema" << std::endl;
      return 1;
    }
    database::PostgresAdvisoryLock lock(connection);
    database::PostgresSyncQueue sync_queue(connection);
    posting::SettlementPoster poster(store, lock, sync_queue);

    network::MirrorNodeClient::Config mirror_config;
    mirror_config.base_url = settings.effectiveMirrorUrl();
    mirror_config.timeout_ms = settings.mirror_timeout_ms;
    network::MirrorNodeClient mirror(mirror_config);

    matching::TransactionMatcher matcher(mirror);
    matching::TransactionMonitor::Config monitor_config;
    monitor_config.interval_ms = settings.monitor_interval_ms;
    monitor_config.max_attempts = settings.monitor_max_attempts;
    monitor_config.timeout_ms = settings.monitor_timeout_ms;
    matching::TransactionMonitor monitor(matcher, monitor_config);
    monitor.setAttemptCallback([](int attempt, const matching::CheckResult& result) {
      std::cout << "Check " << attempt << ": " << result.transactions_checked
                << " transactions scanned"
                << (result.error.empty() ? "" : " (" + result.error + ")") << std::endl;
    });

    matching::CheckOptions options;
    options.invoice_id = invoice_id;
    options.merchant_account_id = settings.merchant_account_id;
    options.network = settings.network;
    options.token = *token;
    options.expected_amount = expected_amount;
    options.memo = memo;

    auto pending = std::async(std::launch::async, [&monitor, &options] {
      return monitor.monitorForPayment(options);
    });

    while (pending.wait_for(std::chrono::milliseconds(200)) != std::future_status::ready) {
      if (!running && !monitor.isStopped()) {
        std::cout << "\nShutting down..." << std::endl;
        monitor.stop();
      }
    }

    matching::TransactionMonitor::Result watched = pending.get();
    if (!watched.found || !watched.match) {
      std::cout << "No payment found after " << watched.attempts << " checks"
                << (watched.stopped ? " (stopped)" : watched.timed_out ? " (timed out)" : "")
                << std::endl;
      return watched.stopped ? 0 : 2;
    }

    const matching::MatchedTransaction& match = *watched.match;
    std::cout << "Payment found: " << match.transaction_id << " for " << match.amount << " "
              << hedera::tokenSymbol(match.token) << " from " << match.sender << std::endl;

    double received = hedera::toDecimal(match.amount_smallest_unit,
                                        hedera::tokenInfo(match.token).decimals);
    matching::PaymentValidation validation =
        matching::validatePaymentAmount(expected_amount, received, match.token);
    if (!validation.is_valid) {
      std::cout << matching::formatValidationError(validation) << std::endl;
      return 2;
    }

    concurrent::SettlementProcessor processor(poster, settings.worker_threads);
    std::promise<posting::SettlementResult> settled;
    processor.setResultCallback(
        [&settled](const concurrent::SettlementJob&, const posting::SettlementResult& result) {
          settled.set_value(result);
        });
    processor.start();

    posting::ConfirmationRequest request;
    request.invoice_id = invoice_id;
    request.transaction_id = match.transaction_id;
    request.token = match.token;
    request.amount_received = match.amount;
    request.sender = match.sender;
    request.consensus_timestamp = match.consensus_timestamp;
    request.memo = match.memo;
    request.merchant_account_id = match.merchant_account_id;
    request.network = settings.network;
    request.mirror_url = settings.effectiveMirrorUrl();
    request.network_prefix = settings.network_prefix;
    processor.submit(request);

    posting::SettlementResult result = settled.get_future().get();
    processor.stop();

    std::cout << "Settlement: " << posting::settlementStatusToString(result.status)
              << " (" << result.message << ")" << std::endl;
    std::cout << "Correlation id: " << result.correlation_id << std::endl;

    SETTLEMENT_LOG_BUILDER(observability::LogLevel::DEBUG, "Metrics at exit")
        .field("metrics", metrics.snapshot());
    return result.success ? 0 : 3;

  } catch (const std::exception& e) {
    std::cerr << "Monitor error: " << e.what() << std::endl;
    return 1;
  }
}
