#ifndef __FSN_MONITOR_REGISTRY__
#define __FSN_MONITOR_REGISTRY__

#include "Headers.hpp"
#include "Mailbox.hpp"
#include "Monitor.hpp"
#include "SocketHandler.hpp"
#include "SubprocessUtils.hpp"
#include "SubscriberDirectory.hpp"

namespace fsn {
/**
 * @brief Host facing API: monitors addressed by name.
 *
 * Commands for a name with no running monitor return NO_MONITOR. Monitors
 * that stopped because their helper died are dropped the next time their
 * name is looked up.
 */
class MonitorRegistry {
 public:
  MonitorRegistry(shared_ptr<SubscriberDirectory> _directory,
                  shared_ptr<SubprocessUtils> _subprocessUtils,
                  shared_ptr<SocketHandler> _socketHandler);
  /** @brief Uses the process-wide directory and real subprocesses. */
  MonitorRegistry();

  virtual ~MonitorRegistry();

  /**
   * @brief Starts a monitor named `options.name()`.
   *
   * If a monitor of the same name is still being torn down, waits for its
   * stop notification to go out first.
   * @throws MonitorStartError if startup fails or the name is taken.
   */
  void start(const MonitorOptions& options);

  CommandReply addWatch(const string& name, const string& path);
  CommandReply remove(const string& name, const string& path);
  CommandReply watchList(const string& name, vector<string>* paths);

  /**
   * @brief Removes the monitor and tears it down on a background thread.
   *
   * The name stays reserved for `start` until the teardown has finished.
   * @return false if no monitor was running under `name`.
   */
  bool stop(const string& name);

  void subscribe(const string& name, shared_ptr<Mailbox> subscriber);
  void unsubscribe(const string& name, shared_ptr<Mailbox> subscriber);

  bool isRunning(const string& name);
  vector<string> getMonitorNames();
  /** @brief Teardowns started by `stop` that have not been joined yet. */
  size_t numPendingStops();

  /** @brief Stops every monitor and waits for pending teardowns. */
  void shutdown();

  shared_ptr<SubscriberDirectory> getDirectory() { return directory; }

 protected:
  /** @brief A teardown running on its own thread. */
  struct PendingStop {
    unique_ptr<thread> worker;
    shared_ptr<std::atomic<bool>> done;
  };

  /** @brief Running monitor for `name`, or null. */
  shared_ptr<Monitor> find(const string& name);
  CommandReply noMonitor(const string& name);
  /** @brief Joins teardowns that have already finished. */
  void joinFinishedStops();

  shared_ptr<SubscriberDirectory> directory;
  shared_ptr<SubprocessUtils> subprocessUtils;
  shared_ptr<SocketHandler> socketHandler;

  /** @brief Guards `monitors`, `starting` and `pendingStops`. */
  mutex registryMutex;
  unordered_map<string, shared_ptr<Monitor>> monitors;
  /** @brief Names reserved by a `start` that has not finished. */
  unordered_set<string> starting;
  /** @brief Teardowns started by `stop`, by monitor name. */
  unordered_map<string, PendingStop> pendingStops;
};
}  // namespace fsn

#endif  // __FSN_MONITOR_REGISTRY__
