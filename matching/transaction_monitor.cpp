#include "transaction_monitor.hpp"
#include "observability/logger.hpp"

#include <chrono>

namespace settlement {
namespace matching {

using observability::LogLevel;

TransactionMonitor::TransactionMonitor(const TransactionMatcher& matcher, const Config& config)
    : matcher_(matcher), config_(config), stop_requested_(false) {
}

void TransactionMonitor::setAttemptCallback(AttemptCallback callback) {
  on_attempt_ = std::move(callback);
}

void TransactionMonitor::stop() {
  {
    std::lock_guard<std::mutex> lock(wait_mutex_);
    stop_requested_ = true;
  }
  wait_cv_.notify_all();
}

void TransactionMonitor::reset() {
  std::lock_guard<std::mutex> lock(wait_mutex_);
  stop_requested_ = false;
}

TransactionMonitor::Result TransactionMonitor::monitorForPayment(const CheckOptions& options) {
  Result result;
  const auto deadline = std::chrono::steady_clock::now() +
                        std::chrono::milliseconds(config_.timeout_ms);

  SETTLEMENT_LOG_BUILDER(LogLevel::INFO, "Starting payment monitoring")
      .field("invoice_id", options.invoice_id)
      .field("merchant_account_id", options.merchant_account_id)
      .field("max_attempts", config_.max_attempts)
      .field("interval_ms", config_.interval_ms);

  while (result.attempts < config_.max_attempts) {
    if (stop_requested_) {
      result.stopped = true;
      break;
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      result.timed_out = true;
      break;
    }

    ++result.attempts;
    CheckResult check = matcher_.checkForTransaction(options);
    if (on_attempt_) {
      on_attempt_(result.attempts, check);
    }

    if (check.found) {
      result.found = true;
      result.match = check.match;
      SETTLEMENT_LOG_BUILDER(LogLevel::INFO, "Payment detected by monitor")
          .field("invoice_id", options.invoice_id)
          .field("attempts", result.attempts)
          .field("transaction_id", check.match->transaction_id);
      return result;
    }
    if (!check.error.empty()) {
      result.last_error = check.error;
    }

    if (result.attempts >= config_.max_attempts) break;

    std::unique_lock<std::mutex> lock(wait_mutex_);
    wait_cv_.wait_for(lock, std::chrono::milliseconds(config_.interval_ms),
                      [this] { return stop_requested_.load(); });
  }

  if (stop_requested_ && !result.timed_out) {
    result.stopped = true;
  }

  SETTLEMENT_LOG_BUILDER(LogLevel::WARN, "Payment monitoring ended without a match")
      .field("invoice_id", options.invoice_id)
      .field("attempts", result.attempts)
      .field("stopped", result.stopped)
      .field("timed_out", result.timed_out);
  return result;
}

}  // namespace matching
}  // namespace settlement
