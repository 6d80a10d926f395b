#ifndef __FSN_MONITOR__
#define __FSN_MONITOR__

#include "BroadcastDispatcher.hpp"
#include "CorrelationMultiplexer.hpp"
#include "Headers.hpp"
#include "SocketHandler.hpp"
#include "SubprocessUtils.hpp"
#include "SubscriberDirectory.hpp"
#include "WatchCommandInterface.hpp"

namespace fsn {
enum class MonitorState {
  STARTING,
  RUNNING,
  STOPPING,
  STOPPED,
};

string monitorStateName(MonitorState state);

/**
 * @brief Owns one helper subprocess and the stream to it.
 *
 * The helper is spawned by `start`, which also applies the initial watch
 * list. The monitor stops either through `stop` or on its own when the read
 * loop loses the helper (end-of-stream, framing or protocol error). Either
 * way the helper is reaped and subscribers receive exactly one stop
 * notification. A monitor is not restartable.
 */
class Monitor {
 public:
  Monitor(const MonitorOptions& _options,
          shared_ptr<SubscriberDirectory> _directory,
          shared_ptr<SubprocessUtils> _subprocessUtils,
          shared_ptr<SocketHandler> _socketHandler);

  /** @brief Stops the helper if it is still running. */
  virtual ~Monitor();

  /**
   * @brief Spawns the helper and applies the initial watches in order.
   *
   * Any failure tears everything down again without a stop notification.
   * @throws MonitorStartError
   */
  void start();

  CommandReply addWatch(const string& path);
  CommandReply remove(const string& path);
  CommandReply watchList(vector<string>* paths);

  /**
   * @brief Stops the helper and notifies subscribers.
   *
   * Idempotent. When the monitor is already stopping on another thread this
   * waits for that teardown to finish.
   */
  void stop();

  /** @brief Waits until the monitor reaches STOPPED. */
  bool waitUntilStopped(std::chrono::milliseconds timeout);

  MonitorState getState();
  bool isRunning() { return getState() == MonitorState::RUNNING; }
  const string& getName() const { return options.name(); }
  pid_t getHelperPid() const { return helperPid; }

 protected:
  /** @brief Read loop callback for id 0 frames. */
  void onBroadcast(const string& payload);
  /** @brief Read loop callback once the helper stream is gone. */
  void onDisconnect(const string& reason);
  /** @brief Undoes a partial start. Never broadcasts a stop. */
  void abortStart(const string& reason);
  /** @brief Terminates and reaps the helper, logging how it ended. */
  void reapHelper();
  /** @brief Joins the read loop and closes our end of the stream. */
  void closeStream();
  void setState(MonitorState newState);
  /** @brief Returns NO_MONITOR unless the monitor is running. */
  bool checkRunning(CommandReply* reply);

  MonitorOptions options;
  shared_ptr<SubscriberDirectory> directory;
  shared_ptr<SubprocessUtils> subprocessUtils;
  shared_ptr<SocketHandler> socketHandler;
  BroadcastDispatcher dispatcher;

  shared_ptr<CorrelationMultiplexer> multiplexer;
  shared_ptr<WatchCommandInterface> commands;
  pid_t helperPid;
  int fd;
  /** @brief Guards `fd` and the join in `closeStream`. */
  mutex streamMutex;

  mutex stateMutex;
  condition_variable stateCv;
  MonitorState state;
  /** @brief Why the helper went away while starting, if it did. */
  string startFailure;
};
}  // namespace fsn

#endif  // __FSN_MONITOR__
