#ifndef __FSN_MAILBOX__
#define __FSN_MAILBOX__

#include "Headers.hpp"

namespace fsn {
/**
 * @brief Bounded queue of messages for one subscriber.
 *
 * A mailbox is the handle a subscriber registers in the SubscriberDirectory.
 * Producers never block: when the mailbox is full the message is dropped and
 * counted, so a stalled subscriber cannot hold up the helper read loop.
 */
class Mailbox {
 public:
  /** @brief Messages buffered before new ones are dropped. */
  static constexpr size_t DEFAULT_CAPACITY = 1024;

  explicit Mailbox(size_t _capacity = DEFAULT_CAPACITY)
      : capacity(_capacity), dropped(0) {}

  /**
   * @brief Queues a copy of `message` unless the mailbox is full.
   * @return false when the message was dropped.
   */
  bool tryPush(const SubscriberMessage &message) {
    {
      lock_guard<mutex> guard(mailboxMutex);
      if (pending.size() >= capacity) {
        dropped++;
        return false;
      }
      pending.push_back(message);
    }
    mailboxCv.notify_one();
    return true;
  }

  /**
   * @brief Waits up to `timeout` for a message.
   * @return false if nothing arrived in time.
   */
  bool pop(SubscriberMessage *message, std::chrono::milliseconds timeout) {
    unique_lock<mutex> lock(mailboxMutex);
    if (!mailboxCv.wait_for(lock, timeout,
                            [this] { return !pending.empty(); })) {
      return false;
    }
    *message = pending.front();
    pending.pop_front();
    return true;
  }

  /** @brief Takes the next message if one is queued. */
  bool tryPop(SubscriberMessage *message) {
    lock_guard<mutex> guard(mailboxMutex);
    if (pending.empty()) {
      return false;
    }
    *message = pending.front();
    pending.pop_front();
    return true;
  }

  /** @brief Number of queued messages. */
  size_t size() {
    lock_guard<mutex> guard(mailboxMutex);
    return pending.size();
  }

  /** @brief Number of messages rejected because the mailbox was full. */
  uint64_t droppedCount() {
    lock_guard<mutex> guard(mailboxMutex);
    return dropped;
  }

  size_t getCapacity() const { return capacity; }

 private:
  const size_t capacity;
  std::deque<SubscriberMessage> pending;
  uint64_t dropped;
  mutex mailboxMutex;
  condition_variable mailboxCv;
};
}  // namespace fsn

#endif  // __FSN_MAILBOX__
