#include "sync_queue.hpp"

namespace settlement {
namespace posting {

bool InMemorySyncQueue::enqueue(const SyncJob& job) {
  if (job.invoice_id.empty() || job.organization_id.empty()) {
    return false;
  }
  queue_.enqueue(job);
  return true;
}

std::optional<SyncJob> InMemorySyncQueue::dequeue() {
  return queue_.dequeue();
}

size_t InMemorySyncQueue::size() const {
  return queue_.size();
}

}  // namespace posting
}  // namespace settlement
