#ifndef LOCKFREE_QUEUE_HPP_
#define LOCKFREE_QUEUE_HPP_

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>

namespace settlement {
namespace concurrent {

/**
 * Multiple producer queue with a lock-free enqueue path.
 * Producers only exchange the tail pointer. Consumers are serialized by a
 * mutex so several worker threads may drain the same queue.
 * T must be default constructible (the queue keeps a dummy head node).
 */
template<typename T>
class LockFreeQueue {
 private:
  struct Node {
    T data;
    std::atomic<Node*> next;

    explicit Node(T value) : data(std::move(value)), next(nullptr) {}
  };

 public:
  LockFreeQueue();
  ~LockFreeQueue();

  // Non-copyable
  LockFreeQueue(const LockFreeQueue&) = delete;
  LockFreeQueue& operator=(const LockFreeQueue&) = delete;

  /**
   * Enqueue an item (thread-safe for multiple producers).
   */
  void enqueue(T item);

  /**
   * Dequeue an item. Returns empty optional if queue is empty.
   */
  std::optional<T> dequeue();

  bool empty() const;

  /**
   * Approximate size, for monitoring only.
   */
  size_t size() const;

  void clear();

 private:
  std::atomic<Node*> head_;
  std::atomic<Node*> tail_;
  std::atomic<size_t> size_;
  std::mutex consumer_mutex_;
};

}  // namespace concurrent
}  // namespace settlement

#endif  // LOCKFREE_QUEUE_HPP_
