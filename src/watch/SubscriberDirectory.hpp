#ifndef __FSN_SUBSCRIBER_DIRECTORY__
#define __FSN_SUBSCRIBER_DIRECTORY__

#include "Headers.hpp"
#include "Mailbox.hpp"

namespace fsn {
/**
 * @brief Process-wide multimap from monitor name to subscriber mailboxes.
 *
 * Membership is keyed by name, not by monitor instance, so subscribers stay
 * registered while a monitor stops and a new one starts under the same name.
 * Mailboxes are held weakly; a mailbox destroyed without unsubscribing is
 * pruned on the next dispatch to its name.
 *
 * The shared instance is created on first use by `get()` and is never torn
 * down implicitly. Separate instances can be constructed for isolation.
 */
class SubscriberDirectory {
 public:
  SubscriberDirectory() {}

  /** @brief Returns the process-wide directory, creating it if needed. */
  static shared_ptr<SubscriberDirectory> get();

  /**
   * @brief Registers `subscriber` for messages from monitor `name`.
   *
   * Registering a mailbox that is already present adds another entry;
   * dispatch still delivers one copy.
   */
  void subscribe(const string& name, shared_ptr<Mailbox> subscriber);
  /** @brief Removes every registration of `subscriber` under `name`. */
  void unsubscribe(const string& name, shared_ptr<Mailbox> subscriber);

  /**
   * @brief Delivers `message` once to each distinct live subscriber of
   * `name` without blocking.
   * @return Number of mailboxes that accepted the message.
   */
  int dispatch(const string& name, const SubscriberMessage& message);

  /** @brief Distinct live subscribers of `name`. */
  vector<shared_ptr<Mailbox>> getSubscribers(const string& name);

  /** @brief Number of registrations (duplicates included) under `name`. */
  size_t numRegistrations(const string& name);

 protected:
  /** @brief Snapshot of live mailboxes for `name`, duplicates removed. */
  vector<shared_ptr<Mailbox>> snapshot(const string& name);

  mutex directoryMutex;
  unordered_map<string, vector<weak_ptr<Mailbox>>> members;
};
}  // namespace fsn

#endif  // __FSN_SUBSCRIBER_DIRECTORY__
