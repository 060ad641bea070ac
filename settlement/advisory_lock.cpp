#include "advisory_lock.hpp"
#include "observability/logger.hpp"

#include <exception>

namespace settlement {
namespace posting {

bool KeyedMutexLock::tryAcquire(const std::string& key) {
  std::lock_guard<std::mutex> lock(mutex_);
  return held_.insert(key).second;
}

void KeyedMutexLock::release(const std::string& key) {
  std::lock_guard<std::mutex> lock(mutex_);
  held_.erase(key);
}

size_t KeyedMutexLock::heldKeys() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return held_.size();
}

AdvisoryLockGuard::AdvisoryLockGuard(AdvisoryLock& lock, std::string key)
    : lock_(lock), key_(std::move(key)), owns_(false) {
  owns_ = lock_.tryAcquire(key_);
}

AdvisoryLockGuard::~AdvisoryLockGuard() {
  if (!owns_) return;
  try {
    lock_.release(key_);
  } catch (const std::exception& e) {
    SETTLEMENT_LOG_ERROR("Failed to release advisory lock " + key_ + ": " + e.what());
  }
}

std::string invoiceLockKey(const std::string& invoice_id) {
  return "invoice:" + invoice_id;
}

}  // namespace posting
}  // namespace settlement
