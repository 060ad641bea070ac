#include "lockfree_queue.hpp"
#include "settlement_processor.hpp"
#include "settlement/sync_queue.hpp"

#include <string>

namespace settlement {
namespace concurrent {

template<typename T>
LockFreeQueue<T>::LockFreeQueue() : size_(0) {
  Node* dummy = new Node(T{});
  head_.store(dummy);
  tail_.store(dummy);
}

template<typename T>
LockFreeQueue<T>::~LockFreeQueue() {
  clear();
  delete head_.load();
}

template<typename T>
void LockFreeQueue<T>::enqueue(T item) {
  Node* new_node = new Node(std::move(item));
  Node* old_tail = tail_.exchange(new_node, std::memory_order_acq_rel);

  // A consumer sees the node only after this store
  old_tail->next.store(new_node, std::memory_order_release);
  size_.fetch_add(1);
}

template<typename T>
std::optional<T> LockFreeQueue<T>::dequeue() {
  std::lock_guard<std::mutex> lock(consumer_mutex_);

  Node* head = head_.load(std::memory_order_relaxed);
  Node* next = head->next.load(std::memory_order_acquire);
  if (next == nullptr) {
    return std::nullopt;
  }

  T result = std::move(next->data);
  head_.store(next, std::memory_order_relaxed);
  delete head;
  size_.fetch_sub(1);
  return result;
}

template<typename T>
bool LockFreeQueue<T>::empty() const {
  Node* head = head_.load(std::memory_order_acquire);
  return head->next.load(std::memory_order_acquire) == nullptr;
}

template<typename T>
size_t LockFreeQueue<T>::size() const {
  return size_.load();
}

template<typename T>
void LockFreeQueue<T>::clear() {
  while (dequeue().has_value()) {
  }
}

// Explicit template instantiations for the queued types
template class LockFreeQueue<int>;
template class LockFreeQueue<std::string>;
template class LockFreeQueue<posting::SyncJob>;
template class LockFreeQueue<SettlementJob>;

}  // namespace concurrent
}  // namespace settlement
