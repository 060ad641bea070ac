#ifndef POSTGRES_ADVISORY_LOCK_HPP_
#define POSTGRES_ADVISORY_LOCK_HPP_

#include "postgres_connection.hpp"
#include "../settlement/advisory_lock.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>

namespace settlement {
namespace database {

/**
 * AdvisoryLock using PostgreSQL session advisory locks
 * (pg_try_advisory_lock on hashtext(key)), so settlement workers in other
 * processes are excluded too.
 *
 * Session locks are re-entrant within one session, and this process shares
 * a single session, so keys held locally are tracked and refused here first.
 */
class PostgresAdvisoryLock : public posting::AdvisoryLock {
 public:
  explicit PostgresAdvisoryLock(std::shared_ptr<PostgresConnection> conn);
  ~PostgresAdvisoryLock() override = default;

  // Non-copyable
  PostgresAdvisoryLock(const PostgresAdvisoryLock&) = delete;
  PostgresAdvisoryLock& operator=(const PostgresAdvisoryLock&) = delete;

  bool tryAcquire(const std::string& key) override;
  void release(const std::string& key) override;

 private:
  std::shared_ptr<PostgresConnection> conn_;
  std::mutex held_mutex_;
  std::unordered_set<std::string> held_keys_;
};

}  // namespace database
}  // namespace settlement

#endif  // POSTGRES_ADVISORY_LOCK_HPP_
