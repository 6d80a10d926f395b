#include "Monitor.hpp"

#include "FsNotifyErrors.hpp"

namespace fsn {
string monitorStateName(MonitorState state) {
  switch (state) {
    case MonitorState::STARTING:
      return "starting";
    case MonitorState::RUNNING:
      return "running";
    case MonitorState::STOPPING:
      return "stopping";
    case MonitorState::STOPPED:
      return "stopped";
  }
  return "unknown";
}

Monitor::Monitor(const MonitorOptions& _options,
                 shared_ptr<SubscriberDirectory> _directory,
                 shared_ptr<SubprocessUtils> _subprocessUtils,
                 shared_ptr<SocketHandler> _socketHandler)
    : options(_options),
      directory(_directory),
      subprocessUtils(_subprocessUtils),
      socketHandler(_socketHandler),
      dispatcher(_options.name(), _directory),
      helperPid(-1),
      fd(-1),
      state(MonitorState::STARTING) {}

Monitor::~Monitor() { stop(); }

void Monitor::start() {
  {
    lock_guard<mutex> guard(stateMutex);
    if (state != MonitorState::STARTING || helperPid != -1) {
      throw MonitorStartError("Monitor " + options.name() +
                              " cannot be started twice");
    }
  }
  if (options.name().empty()) {
    setState(MonitorState::STOPPED);
    throw MonitorStartError("Monitor name must not be empty");
  }

  LOG(INFO) << "Starting monitor " << options.name() << " with helper "
            << options.helper_path();
  vector<string> args(options.helper_args().begin(),
                      options.helper_args().end());
  int hostFd = -1;
  try {
    helperPid = subprocessUtils->spawnWithDuplexStdio(
        socketHandler, options.helper_path(), args, &hostFd);
  } catch (const std::runtime_error& re) {
    setState(MonitorState::STOPPED);
    throw MonitorStartError("Could not start helper for " + options.name() +
                            ": " + re.what());
  }
  {
    lock_guard<mutex> guard(streamMutex);
    fd = hostFd;
  }

  multiplexer.reset(new CorrelationMultiplexer(
      socketHandler, hostFd,
      [this](const string& payload) { onBroadcast(payload); },
      [this](const string& reason) { onDisconnect(reason); },
      std::chrono::milliseconds(options.command_timeout_ms())));
  commands.reset(new WatchCommandInterface(multiplexer));
  multiplexer->start();

  for (const auto& path : options.watches()) {
    CommandReply reply = commands->addWatch(path);
    if (!reply.ok()) {
      string reason = "initial watch on " + path + " failed (" +
                      commandStatusName(reply.status) + "): " + reply.message;
      abortStart(reason);
      throw MonitorStartError("Monitor " + options.name() + ": " + reason);
    }
    VLOG(1) << options.name() << ": watching " << path;
  }

  string failure;
  {
    lock_guard<mutex> guard(stateMutex);
    if (startFailure.empty()) {
      state = MonitorState::RUNNING;
    } else {
      failure = startFailure;
    }
  }
  if (!failure.empty()) {
    abortStart(failure);
    throw MonitorStartError("Helper for " + options.name() +
                            " exited during startup: " + failure);
  }
  stateCv.notify_all();
  LOG(INFO) << "Monitor " << options.name() << " running, helper pid "
            << helperPid;
}

void Monitor::abortStart(const string& reason) {
  LOG(ERROR) << "Aborting start of " << options.name() << ": " << reason;
  closeStream();
  reapHelper();
  setState(MonitorState::STOPPED);
}

bool Monitor::checkRunning(CommandReply* reply) {
  MonitorState current = getState();
  if (current == MonitorState::RUNNING) {
    return true;
  }
  *reply = CommandReply(CommandReply::NO_MONITOR,
                        "monitor " + options.name() + " is " +
                            monitorStateName(current));
  return false;
}

CommandReply Monitor::addWatch(const string& path) {
  CommandReply reply;
  if (!checkRunning(&reply)) {
    return reply;
  }
  return commands->addWatch(path);
}

CommandReply Monitor::remove(const string& path) {
  CommandReply reply;
  if (!checkRunning(&reply)) {
    return reply;
  }
  return commands->remove(path);
}

CommandReply Monitor::watchList(vector<string>* paths) {
  CommandReply reply;
  if (!checkRunning(&reply)) {
    return reply;
  }
  return commands->watchList(paths);
}

void Monitor::onBroadcast(const string& payload) {
  // A ProtocolError escapes to the read loop, which ends the monitor.
  dispatcher.dispatchPayload(payload);
}

void Monitor::onDisconnect(const string& reason) {
  {
    lock_guard<mutex> guard(stateMutex);
    if (state == MonitorState::STARTING) {
      startFailure = reason;
      return;
    }
    if (state != MonitorState::RUNNING) {
      // An explicit stop is already tearing things down.
      return;
    }
    state = MonitorState::STOPPING;
  }
  LOG(WARNING) << "Lost helper for monitor " << options.name() << ": "
               << reason;
  // Runs on the read thread: the stream is shut down here but closed by
  // whoever joins the thread.
  multiplexer->shutdown();
  reapHelper();
  dispatcher.dispatchStop();
  setState(MonitorState::STOPPED);
}

void Monitor::stop() {
  bool owner = false;
  {
    unique_lock<mutex> lock(stateMutex);
    if (state == MonitorState::STARTING && helperPid == -1) {
      state = MonitorState::STOPPED;
    } else if (state == MonitorState::RUNNING) {
      state = MonitorState::STOPPING;
      owner = true;
    } else {
      stateCv.wait(lock, [this] { return state == MonitorState::STOPPED; });
    }
  }
  if (owner) {
    LOG(INFO) << "Stopping monitor " << options.name();
    closeStream();
    reapHelper();
    dispatcher.dispatchStop();
    setState(MonitorState::STOPPED);
    return;
  }
  closeStream();
}

bool Monitor::waitUntilStopped(std::chrono::milliseconds timeout) {
  unique_lock<mutex> lock(stateMutex);
  return stateCv.wait_for(lock, timeout,
                          [this] { return state == MonitorState::STOPPED; });
}

void Monitor::reapHelper() {
  if (helperPid == -1) {
    return;
  }
  int status =
      subprocessUtils->terminateAndReap(helperPid, HELPER_TERMINATE_GRACE_MS);
  LOG(INFO) << "Helper " << helperPid << " for " << options.name()
            << " ended with " << SubprocessUtils::describeStatus(status);
}

void Monitor::closeStream() {
  lock_guard<mutex> guard(streamMutex);
  if (fd == -1) {
    return;
  }
  if (multiplexer) {
    multiplexer->shutdown();
  }
  socketHandler->close(fd);
  fd = -1;
}

MonitorState Monitor::getState() {
  lock_guard<mutex> guard(stateMutex);
  return state;
}

void Monitor::setState(MonitorState newState) {
  {
    lock_guard<mutex> guard(stateMutex);
    state = newState;
  }
  stateCv.notify_all();
}
}  // namespace fsn
