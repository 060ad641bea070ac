#ifndef TRANSACTION_MONITOR_HPP_
#define TRANSACTION_MONITOR_HPP_

#include "transaction_matcher.hpp"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>

namespace settlement {
namespace matching {

/**
 * Background polling loop over TransactionMatcher for batch use.
 * Polls at a fixed interval until a match, the attempt limit, the overall
 * timeout, or stop().
 */
class TransactionMonitor {
 public:
  struct Config {
    int interval_ms = 5000;
    int max_attempts = 60;
    int timeout_ms = 300000;  // 5 minutes
  };

  struct Result {
    bool found = false;
    std::optional<MatchedTransaction> match;
    int attempts = 0;
    bool stopped = false;
    bool timed_out = false;
    std::string last_error;
  };

  using AttemptCallback = std::function<void(int attempt, const CheckResult& result)>;

  TransactionMonitor(const TransactionMatcher& matcher, const Config& config);
  ~TransactionMonitor() = default;

  // Non-copyable
  TransactionMonitor(const TransactionMonitor&) = delete;
  TransactionMonitor& operator=(const TransactionMonitor&) = delete;

  /**
   * Poll until a payment matching `options` is found. Blocks the caller.
   */
  Result monitorForPayment(const CheckOptions& options);

  /**
   * Interrupt a running monitorForPayment between iterations. Safe to call
   * from any thread.
   */
  void stop();

  /**
   * Allow monitorForPayment to run again after stop().
   */
  void reset();

  bool isStopped() const { return stop_requested_.load(); }

  void setAttemptCallback(AttemptCallback callback);

 private:
  const TransactionMatcher& matcher_;
  Config config_;
  std::atomic<bool> stop_requested_;
  std::mutex wait_mutex_;
  std::condition_variable wait_cv_;
  AttemptCallback on_attempt_;
};

}  // namespace matching
}  // namespace settlement

#endif  // TRANSACTION_MONITOR_HPP_
