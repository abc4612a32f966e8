#ifndef WALLET_LOCKFREE_QUEUE_HPP_
#define WALLET_LOCKFREE_QUEUE_HPP_

#include <atomic>
#include <cstddef>
#include <optional>
#include <vector>

namespace wallet {
namespace concurrent {

/**
 * Lock-free Multiple Producer Single Consumer (MPSC) queue.
 * Producers never block each other; only one thread may dequeue.
 * T must be default-constructible (a dummy node heads the list).
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
  LockFreeQueue() : size_(0) {
    Node* dummy = new Node(T{});
    head_.store(dummy);
    tail_.store(dummy);
  }

  ~LockFreeQueue() {
    clear();
    delete head_.load();
  }

  // Non-copyable
  LockFreeQueue(const LockFreeQueue&) = delete;
  LockFreeQueue& operator=(const LockFreeQueue&) = delete;

  /**
   * Enqueue an item (thread-safe for multiple producers).
   */
  void enqueue(T item) {
    Node* new_node = new Node(std::move(item));
    // Counted before it becomes visible, so the consumer never drives size_ below zero
    size_.fetch_add(1);
    Node* old_tail = tail_.exchange(new_node);

    // Link the old tail to the new node
    old_tail->next.store(new_node);
  }

  /**
   * Dequeue an item (single consumer only).
   * Returns empty optional if queue is empty.
   */
  std::optional<T> dequeue() {
    Node* head = head_.load();
    Node* next = head->next.load();

    if (next == nullptr) {
      return std::nullopt;
    }

    head_.store(next);
    T result = std::move(next->data);
    delete head;
    size_.fetch_sub(1);
    return result;
  }

  /**
   * Dequeue up to `max_items` items in FIFO order (single consumer only).
   */
  std::vector<T> dequeueBatch(std::size_t max_items) {
    std::vector<T> batch;
    while (batch.size() < max_items) {
      auto item = dequeue();
      if (!item) {
        break;
      }
      batch.push_back(std::move(*item));
    }
    return batch;
  }

  /**
   * Check if queue is empty (consumer side only).
   */
  bool empty() const {
    return head_.load()->next.load() == nullptr;
  }

  /**
   * Get approximate size (for monitoring only).
   */
  std::size_t size() const {
    return size_.load();
  }

  /**
   * Clear all elements from the queue (consumer side only).
   */
  void clear() {
    while (dequeue()) {
    }
  }

 private:
  std::atomic<Node*> head_;
  std::atomic<Node*> tail_;
  std::atomic<std::size_t> size_;
};

}  // namespace concurrent
}  // namespace wallet

#endif  // WALLET_LOCKFREE_QUEUE_HPP_
