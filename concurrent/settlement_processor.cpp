#include "settlement_processor.hpp"
#include "observability/logger.hpp"
#include "observability/metrics.hpp"

#include <chrono>

namespace settlement {
namespace concurrent {

using posting::SettlementResult;
using posting::SettlementStatus;

SettlementProcessor::SettlementProcessor(posting::SettlementPoster& poster,
                                         size_t num_worker_threads,
                                         int max_lock_retries,
                                         std::chrono::milliseconds retry_delay)
    : poster_(poster),
      num_workers_(num_worker_threads == 0 ? 1 : num_worker_threads),
      max_lock_retries_(max_lock_retries),
      retry_delay_(retry_delay),
      running_(false),
      jobs_processed_(0),
      posted_(0),
      duplicates_(0),
      rejected_(0),
      ledger_pending_(0),
      lock_retries_(0),
      failed_(0),
      total_processing_time_us_(0) {
}

SettlementProcessor::~SettlementProcessor() {
  stop();
}

bool SettlementProcessor::start() {
  if (running_) return true;

  running_ = true;

  for (size_t i = 0; i < num_workers_; ++i) {
    worker_threads_.emplace_back(
        std::make_unique<std::thread>(&SettlementProcessor::workerThread, this));
  }

  SETTLEMENT_LOG_INFO("Settlement processor started with " + std::to_string(num_workers_) +
                      " worker threads");
  return true;
}

void SettlementProcessor::stop() {
  if (!running_) return;

  running_ = false;

  // Wake up workers with shutdown jobs
  for (size_t i = 0; i < num_workers_; ++i) {
    job_queue_.enqueue(SettlementJob{});
  }

  for (auto& thread : worker_threads_) {
    if (thread && thread->joinable()) {
      thread->join();
    }
  }
  worker_threads_.clear();

  SETTLEMENT_LOG_INFO("Settlement processor stopped");
}

void SettlementProcessor::submit(const posting::ConfirmationRequest& request) {
  if (request.invoice_id.empty()) {
    SETTLEMENT_LOG_WARN("Ignoring settlement job without invoice id");
    return;
  }
  SettlementJob job;
  job.request = request;
  job_queue_.enqueue(std::move(job));
}

void SettlementProcessor::setResultCallback(ResultCallback callback) {
  callback_ = std::move(callback);
}

size_t SettlementProcessor::getQueueSize() const {
  return job_queue_.size();
}

SettlementProcessor::Stats SettlementProcessor::getStats() const {
  Stats stats;
  stats.jobs_processed = jobs_processed_.load();
  stats.jobs_queued = job_queue_.size();
  stats.posted = posted_.load();
  stats.duplicates = duplicates_.load();
  stats.rejected = rejected_.load();
  stats.ledger_pending = ledger_pending_.load();
  stats.lock_retries = lock_retries_.load();
  stats.failed = failed_.load();

  size_t total_time = total_processing_time_us_.load();
  if (stats.jobs_processed > 0) {
    stats.avg_processing_time_ms = static_cast<double>(total_time) /
                                   stats.jobs_processed / 1000.0;
  }
  return stats;
}

void SettlementProcessor::workerThread() {
  while (running_) {
    auto job_opt = job_queue_.dequeue();
    if (!job_opt.has_value()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
      continue;
    }

    // Empty job signals shutdown
    if (job_opt->request.invoice_id.empty()) {
      break;
    }

    auto start_time = std::chrono::steady_clock::now();
    processJob(std::move(*job_opt));
    auto end_time = std::chrono::steady_clock::now();

    auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end_time - start_time);
    total_processing_time_us_.fetch_add(static_cast<size_t>(duration.count()));
  }
}

void SettlementProcessor::processJob(SettlementJob job) {
  SettlementResult result = poster_.confirmPayment(job.request);

  if (result.status == SettlementStatus::LOCK_CONTENTION && job.attempt < max_lock_retries_ &&
      running_) {
    lock_retries_.fetch_add(1);
    ++job.attempt;
    SETTLEMENT_LOG_BUILDER(observability::LogLevel::DEBUG, "Re-queueing settlement after lock contention")
        .correlation(result.correlation_id)
        .field("invoice_id", job.request.invoice_id)
        .field("attempt", job.attempt);
    std::this_thread::sleep_for(retry_delay_ * job.attempt);
    job_queue_.enqueue(std::move(job));
    return;
  }

  jobs_processed_.fetch_add(1);
  switch (result.status) {
    case SettlementStatus::POSTED:
      posted_.fetch_add(1);
      break;
    case SettlementStatus::DUPLICATE:
      duplicates_.fetch_add(1);
      break;
    case SettlementStatus::REJECTED:
      rejected_.fetch_add(1);
      break;
    case SettlementStatus::LEDGER_PENDING:
      ledger_pending_.fetch_add(1);
      break;
    case SettlementStatus::LOCK_CONTENTION:
    case SettlementStatus::FAILED:
      failed_.fetch_add(1);
      break;
  }
  observability::getGlobalMetrics().incrementCounter("settlement_jobs_processed_total");

  if (callback_) {
    try {
      callback_(job, result);
    } catch (const std::exception& e) {
      SETTLEMENT_LOG_ERROR(std::string("Settlement result callback failed: ") + e.what());
    }
  }
}

}  // namespace concurrent
}  // namespace settlement
