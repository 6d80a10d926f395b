#include "SubscriberDirectory.hpp"

namespace fsn {
namespace {
mutex instanceMutex;
shared_ptr<SubscriberDirectory> instance;
}  // namespace

shared_ptr<SubscriberDirectory> SubscriberDirectory::get() {
  lock_guard<mutex> guard(instanceMutex);
  if (!instance) {
    VLOG(1) << "Creating the process-wide subscriber directory";
    instance.reset(new SubscriberDirectory());
  }
  return instance;
}

void SubscriberDirectory::subscribe(const string& name,
                                    shared_ptr<Mailbox> subscriber) {
  lock_guard<mutex> guard(directoryMutex);
  members[name].push_back(subscriber);
  VLOG(1) << "Subscribed " << subscriber.get() << " to " << name;
}

void SubscriberDirectory::unsubscribe(const string& name,
                                      shared_ptr<Mailbox> subscriber) {
  lock_guard<mutex> guard(directoryMutex);
  auto it = members.find(name);
  if (it == members.end()) {
    return;
  }
  auto& entries = it->second;
  entries.erase(std::remove_if(entries.begin(), entries.end(),
                               [&subscriber](const weak_ptr<Mailbox>& entry) {
                                 auto live = entry.lock();
                                 return !live || live == subscriber;
                               }),
                entries.end());
  if (entries.empty()) {
    members.erase(it);
  }
  VLOG(1) << "Unsubscribed " << subscriber.get() << " from " << name;
}

vector<shared_ptr<Mailbox>> SubscriberDirectory::snapshot(const string& name) {
  vector<shared_ptr<Mailbox>> live;
  lock_guard<mutex> guard(directoryMutex);
  auto it = members.find(name);
  if (it == members.end()) {
    return live;
  }
  auto& entries = it->second;
  std::unordered_set<Mailbox*> seen;
  auto entry = entries.begin();
  while (entry != entries.end()) {
    auto mailbox = entry->lock();
    if (!mailbox) {
      entry = entries.erase(entry);
      continue;
    }
    if (seen.insert(mailbox.get()).second) {
      live.push_back(mailbox);
    }
    ++entry;
  }
  if (entries.empty()) {
    members.erase(it);
  }
  return live;
}

int SubscriberDirectory::dispatch(const string& name,
                                  const SubscriberMessage& message) {
  // Mailboxes are filled outside the directory lock.
  vector<shared_ptr<Mailbox>> subscribers = snapshot(name);
  int delivered = 0;
  for (auto& mailbox : subscribers) {
    if (mailbox->tryPush(message)) {
      delivered++;
    } else {
      LOG_EVERY_N(100, WARNING)
          << "Subscriber mailbox for " << name << " is full, dropping";
    }
  }
  VLOG(2) << "Dispatched to " << delivered << "/" << subscribers.size()
          << " subscribers of " << name;
  return delivered;
}

vector<shared_ptr<Mailbox>> SubscriberDirectory::getSubscribers(
    const string& name) {
  return snapshot(name);
}

size_t SubscriberDirectory::numRegistrations(const string& name) {
  lock_guard<mutex> guard(directoryMutex);
  auto it = members.find(name);
  if (it == members.end()) {
    return 0;
  }
  return it->second.size();
}
}  // namespace fsn
