#include "postgres_advisory_lock.hpp"
#include "observability/logger.hpp"

namespace settlement {
namespace database {

PostgresAdvisoryLock::PostgresAdvisoryLock(std::shared_ptr<PostgresConnection> conn)
    : conn_(std::move(conn)) {
}

bool PostgresAdvisoryLock::tryAcquire(const std::string& key) {
  std::lock_guard<std::mutex> lock(held_mutex_);

  if (held_keys_.count(key) > 0) {
    return false;
  }

  auto result = conn_->executeParameterized("SELECT pg_try_advisory_lock(hashtext($1))", {key});
  if (!result || PQntuples(result.get()) == 0) {
    SETTLEMENT_LOG_ERROR("Advisory lock query failed for " + key);
    return false;
  }

  bool acquired = std::string(PQgetvalue(result.get(), 0, 0)) == "t";
  if (acquired) {
    held_keys_.insert(key);
  }
  return acquired;
}

void PostgresAdvisoryLock::release(const std::string& key) {
  std::lock_guard<std::mutex> lock(held_mutex_);

  if (held_keys_.erase(key) == 0) {
    return;
  }

  auto result = conn_->executeParameterized("SELECT pg_advisory_unlock(hashtext($1))", {key});
  if (!result || PQntuples(result.get()) == 0 ||
      std::string(PQgetvalue(result.get(), 0, 0)) != "t") {
    SETTLEMENT_LOG_WARN("Advisory lock " + key + " was not held at release");
  }
}

}  // namespace database
}  // namespace settlement
