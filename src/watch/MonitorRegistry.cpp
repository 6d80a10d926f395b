#include "MonitorRegistry.hpp"

#include "FsNotifyErrors.hpp"
#include "UnixSocketHandler.hpp"

namespace fsn {
MonitorRegistry::MonitorRegistry(shared_ptr<SubscriberDirectory> _directory,
                                 shared_ptr<SubprocessUtils> _subprocessUtils,
                                 shared_ptr<SocketHandler> _socketHandler)
    : directory(_directory),
      subprocessUtils(_subprocessUtils),
      socketHandler(_socketHandler) {}

MonitorRegistry::MonitorRegistry()
    : MonitorRegistry(SubscriberDirectory::get(),
                      make_shared<SubprocessUtils>(),
                      make_shared<UnixSocketHandler>()) {}

MonitorRegistry::~MonitorRegistry() { shutdown(); }

void MonitorRegistry::start(const MonitorOptions& options) {
  const string& name = options.name();
  PendingStop previousStop;
  {
    lock_guard<mutex> guard(registryMutex);
    auto it = monitors.find(name);
    if (it != monitors.end()) {
      if (it->second->isRunning()) {
        throw MonitorStartError("A monitor named " + name +
                                " is already running");
      }
      monitors.erase(it);
    }
    if (!starting.insert(name).second) {
      throw MonitorStartError("A monitor named " + name +
                              " is already starting");
    }
    auto stopIt = pendingStops.find(name);
    if (stopIt != pendingStops.end()) {
      previousStop = std::move(stopIt->second);
      pendingStops.erase(stopIt);
    }
  }
  if (previousStop.worker) {
    // The old monitor must send its stop notification before the new one
    // is visible to subscribers.
    VLOG(1) << "Waiting for the previous " << name << " monitor to stop";
    previousStop.worker->join();
  }
  joinFinishedStops();

  auto monitor =
      make_shared<Monitor>(options, directory, subprocessUtils, socketHandler);
  try {
    monitor->start();
  } catch (const std::runtime_error&) {
    lock_guard<mutex> guard(registryMutex);
    starting.erase(name);
    throw;
  }

  lock_guard<mutex> guard(registryMutex);
  starting.erase(name);
  monitors[name] = monitor;
}

shared_ptr<Monitor> MonitorRegistry::find(const string& name) {
  shared_ptr<Monitor> stale;
  {
    lock_guard<mutex> guard(registryMutex);
    auto it = monitors.find(name);
    if (it == monitors.end()) {
      return nullptr;
    }
    if (it->second->isRunning()) {
      return it->second;
    }
    VLOG(1) << "Dropping stopped monitor " << name;
    stale = it->second;
    monitors.erase(it);
  }
  // Joins the dead monitor's read loop outside the registry lock.
  stale->stop();
  return nullptr;
}

CommandReply MonitorRegistry::noMonitor(const string& name) {
  return CommandReply(CommandReply::NO_MONITOR,
                      "no monitor named " + name + " is running");
}

CommandReply MonitorRegistry::addWatch(const string& name,
                                       const string& path) {
  auto monitor = find(name);
  if (!monitor) {
    return noMonitor(name);
  }
  return monitor->addWatch(path);
}

CommandReply MonitorRegistry::remove(const string& name, const string& path) {
  auto monitor = find(name);
  if (!monitor) {
    return noMonitor(name);
  }
  return monitor->remove(path);
}

CommandReply MonitorRegistry::watchList(const string& name,
                                        vector<string>* paths) {
  auto monitor = find(name);
  if (!monitor) {
    return noMonitor(name);
  }
  return monitor->watchList(paths);
}

bool MonitorRegistry::stop(const string& name) {
  joinFinishedStops();
  lock_guard<mutex> guard(registryMutex);
  auto it = monitors.find(name);
  if (it == monitors.end()) {
    return false;
  }
  shared_ptr<Monitor> monitor = it->second;
  monitors.erase(it);

  // A name is only restarted after its pending teardown was joined, so at
  // most one teardown per name is in flight.
  PendingStop& pendingStop = pendingStops[name];
  pendingStop.done = make_shared<std::atomic<bool>>(false);
  auto done = pendingStop.done;
  pendingStop.worker.reset(new thread([monitor, name, done]() {
    el::Helpers::setThreadName("fsn-stop-" + name);
    monitor->stop();
    *done = true;
  }));
  return true;
}

void MonitorRegistry::joinFinishedStops() {
  vector<unique_ptr<thread>> finished;
  {
    lock_guard<mutex> guard(registryMutex);
    for (auto it = pendingStops.begin(); it != pendingStops.end();) {
      if (*(it->second.done)) {
        finished.push_back(std::move(it->second.worker));
        it = pendingStops.erase(it);
      } else {
        ++it;
      }
    }
  }
  for (auto& it : finished) {
    it->join();
  }
  if (!finished.empty()) {
    VLOG(1) << "Joined " << finished.size() << " finished monitor stops";
  }
}

size_t MonitorRegistry::numPendingStops() {
  lock_guard<mutex> guard(registryMutex);
  return pendingStops.size();
}

void MonitorRegistry::subscribe(const string& name,
                                shared_ptr<Mailbox> subscriber) {
  directory->subscribe(name, subscriber);
}

void MonitorRegistry::unsubscribe(const string& name,
                                  shared_ptr<Mailbox> subscriber) {
  directory->unsubscribe(name, subscriber);
}

bool MonitorRegistry::isRunning(const string& name) {
  return find(name) != nullptr;
}

vector<string> MonitorRegistry::getMonitorNames() {
  vector<string> names;
  lock_guard<mutex> guard(registryMutex);
  for (auto& it : monitors) {
    if (it.second->isRunning()) {
      names.push_back(it.first);
    }
  }
  return names;
}

void MonitorRegistry::shutdown() {
  unordered_map<string, shared_ptr<Monitor>> remaining;
  unordered_map<string, PendingStop> pending;
  {
    lock_guard<mutex> guard(registryMutex);
    remaining.swap(monitors);
    pending.swap(pendingStops);
  }
  for (auto& it : remaining) {
    it.second->stop();
  }

  for (auto& it : pending) {
    it.second.worker->join();
  }
  if (!remaining.empty() || !pending.empty()) {
    LOG(INFO) << "Registry shut down " << remaining.size()
              << " monitors and joined " << pending.size()
              << " background stops";
  }
}
}  // namespace fsn
