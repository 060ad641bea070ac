#include "postgres_sync_queue.hpp"
#include "observability/logger.hpp"

#include <string>

namespace settlement {
namespace database {

PostgresSyncQueue::PostgresSyncQueue(std::shared_ptr<PostgresConnection> conn)
    : conn_(std::move(conn)) {
}

bool PostgresSyncQueue::enqueue(const posting::SyncJob& job) {
  std::string query = R"(
    INSERT INTO xero_sync_queue (invoice_id, organization_id, correlation_id, provider, status)
    VALUES ($1, $2, $3, $4, 'PENDING')
  )";

  auto result = conn_->executeParameterized(
      query, {job.invoice_id, job.organization_id, job.correlation_id, job.provider});
  if (!result) {
    SETTLEMENT_LOG_WARN("Failed to enqueue sync job for invoice " + job.invoice_id);
    return false;
  }
  return true;
}

size_t PostgresSyncQueue::pendingCount() {
  auto result = conn_->executeParameterized(
      "SELECT COUNT(*) FROM xero_sync_queue WHERE status = 'PENDING'", {});
  if (!result || PQntuples(result.get()) == 0) {
    return 0;
  }

  try {
    return static_cast<size_t>(std::stoull(PQgetvalue(result.get(), 0, 0)));
  } catch (const std::exception& e) {
    SETTLEMENT_LOG_ERROR(std::string("Bad pending count: ") + e.what());
    return 0;
  }
}

}  // namespace database
}  // namespace settlement
