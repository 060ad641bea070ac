#ifndef SYNC_QUEUE_HPP_
#define SYNC_QUEUE_HPP_

#include "../concurrent/lockfree_queue.hpp"

#include <optional>
#include <string>

namespace settlement {
namespace posting {

/**
 * External-ledger synchronization request produced after a posting.
 */
struct SyncJob {
  std::string invoice_id;
  std::string organization_id;
  std::string correlation_id;
  std::string provider = "hedera";
};

/**
 * Outbound, fire-and-forget queue. A false return is logged by the caller
 * and never undoes the settlement.
 */
class SyncQueue {
 public:
  virtual ~SyncQueue() = default;

  virtual bool enqueue(const SyncJob& job) = 0;
};

/**
 * SyncQueue held in memory; a downstream consumer drains it.
 */
class InMemorySyncQueue : public SyncQueue {
 public:
  InMemorySyncQueue() = default;
  ~InMemorySyncQueue() override = default;

  bool enqueue(const SyncJob& job) override;

  std::optional<SyncJob> dequeue();
  size_t size() const;

 private:
  concurrent::LockFreeQueue<SyncJob> queue_;
};

}  // namespace posting
}  // namespace settlement

#endif  // SYNC_QUEUE_HPP_
