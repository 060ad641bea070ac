#ifndef ADVISORY_LOCK_HPP_
#define ADVISORY_LOCK_HPP_

#include <mutex>
#include <string>
#include <unordered_set>

namespace settlement {
namespace posting {

/**
 * Keyed mutual exclusion with a non-blocking acquire. A key is held by at
 * most one caller at a time; contenders fail immediately.
 */
class AdvisoryLock {
 public:
  virtual ~AdvisoryLock() = default;

  virtual bool tryAcquire(const std::string& key) = 0;
  virtual void release(const std::string& key) = 0;
};

/**
 * In-process AdvisoryLock. A key is tracked only while it is held, so the
 * table stays as small as the number of settlements in flight.
 */
class KeyedMutexLock : public AdvisoryLock {
 public:
  KeyedMutexLock() = default;
  ~KeyedMutexLock() override = default;

  // Non-copyable
  KeyedMutexLock(const KeyedMutexLock&) = delete;
  KeyedMutexLock& operator=(const KeyedMutexLock&) = delete;

  bool tryAcquire(const std::string& key) override;
  void release(const std::string& key) override;

  size_t heldKeys() const;

 private:
  mutable std::mutex mutex_;
  std::unordered_set<std::string> held_;
};

/**
 * RAII holder for an AdvisoryLock key. Tries once on construction and
 * releases on destruction if the key was acquired.
 */
class AdvisoryLockGuard {
 public:
  AdvisoryLockGuard(AdvisoryLock& lock, std::string key);
  ~AdvisoryLockGuard();

  // Non-copyable
  AdvisoryLockGuard(const AdvisoryLockGuard&) = delete;
  AdvisoryLockGuard& operator=(const AdvisoryLockGuard&) = delete;

  bool ownsLock() const { return owns_; }

 private:
  AdvisoryLock& lock_;
  std::string key_;
  bool owns_;
};

/**
 * Lock key used for every write path touching an invoice's settlement.
 */
std::string invoiceLockKey(const std::string& invoice_id);

}  // namespace posting
}  // namespace settlement

#endif  // ADVISORY_LOCK_HPP_
