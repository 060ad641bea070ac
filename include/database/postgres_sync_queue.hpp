#ifndef POSTGRES_SYNC_QUEUE_HPP_
#define POSTGRES_SYNC_QUEUE_HPP_

#include "postgres_connection.hpp"
#include "../settlement/sync_queue.hpp"

#include <memory>

namespace settlement {
namespace database {

/**
 * SyncQueue persisted as PENDING rows in the xero_sync_queue table.
 */
class PostgresSyncQueue : public posting::SyncQueue {
 public:
  explicit PostgresSyncQueue(std::shared_ptr<PostgresConnection> conn);
  ~PostgresSyncQueue() override = default;

  bool enqueue(const posting::SyncJob& job) override;

  /**
   * Number of jobs not yet picked up by the sync worker.
   */
  size_t pendingCount();

 private:
  std::shared_ptr<PostgresConnection> conn_;
};

}  // namespace database
}  // namespace settlement

#endif  // POSTGRES_SYNC_QUEUE_HPP_
