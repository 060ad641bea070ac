#ifndef SETTLEMENT_PROCESSOR_HPP_
#define SETTLEMENT_PROCESSOR_HPP_

#include "lockfree_queue.hpp"
#include "../settlement/settlement_poster.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <thread>
#include <vector>

namespace settlement {
namespace concurrent {

/**
 * Queued settlement work. A job with an empty invoice id stops the worker
 * that dequeues it.
 */
struct SettlementJob {
  posting::ConfirmationRequest request;
  int attempt = 0;
};

/**
 * Settles matched payments on a pool of worker threads.
 * Jobs that lose the invoice lock are re-queued up to `max_lock_retries`
 * times; every other outcome is final and reported through the callback.
 */
class SettlementProcessor {
 public:
  using ResultCallback = std::function<void(const SettlementJob&, const posting::SettlementResult&)>;

  SettlementProcessor(posting::SettlementPoster& poster,
                      size_t num_worker_threads = 4,
                      int max_lock_retries = 3,
                      std::chrono::milliseconds retry_delay = std::chrono::milliseconds(50));
  ~SettlementProcessor();

  // Non-copyable
  SettlementProcessor(const SettlementProcessor&) = delete;
  SettlementProcessor& operator=(const SettlementProcessor&) = delete;

  bool start();

  /**
   * Stop after the workers drain their current job. Queued jobs stay queued.
   */
  void stop();

  bool isRunning() const { return running_.load(); }

  /**
   * Queue a matched payment for settlement.
   */
  void submit(const posting::ConfirmationRequest& request);

  void setResultCallback(ResultCallback callback);

  size_t getQueueSize() const;

  struct Stats {
    size_t jobs_processed = 0;
    size_t jobs_queued = 0;
    size_t posted = 0;
    size_t duplicates = 0;
    size_t rejected = 0;
    size_t ledger_pending = 0;
    size_t lock_retries = 0;
    size_t failed = 0;
    double avg_processing_time_ms = 0.0;
  };
  Stats getStats() const;

 private:
  void workerThread();
  void processJob(SettlementJob job);

  posting::SettlementPoster& poster_;
  size_t num_workers_;
  int max_lock_retries_;
  std::chrono::milliseconds retry_delay_;

  LockFreeQueue<SettlementJob> job_queue_;
  std::vector<std::unique_ptr<std::thread>> worker_threads_;
  std::atomic<bool> running_;

  ResultCallback callback_;

  // Statistics
  std::atomic<size_t> jobs_processed_;
  std::atomic<size_t> posted_;
  std::atomic<size_t> duplicates_;
  std::atomic<size_t> rejected_;
  std::atomic<size_t> ledger_pending_;
  std::atomic<size_t> lock_retries_;
  std::atomic<size_t> failed_;
  std::atomic<size_t> total_processing_time_us_;
};

}  // namespace concurrent
}  // namespace settlement

#endif  // SETTLEMENT_PROCESSOR_HPP_
