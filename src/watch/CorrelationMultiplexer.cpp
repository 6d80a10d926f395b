#include "CorrelationMultiplexer.hpp"

#include "FsNotifyErrors.hpp"

namespace fsn {
CorrelationMultiplexer::CorrelationMultiplexer(
    shared_ptr<SocketHandler> _socketHandler, int _fd,
    BroadcastHandler _broadcastHandler, DisconnectHandler _disconnectHandler,
    std::chrono::milliseconds _commandTimeout)
    : socketHandler(_socketHandler),
      codec(_socketHandler),
      fd(_fd),
      broadcastHandler(_broadcastHandler),
      disconnectHandler(_disconnectHandler),
      commandTimeout(_commandTimeout),
      connected(true),
      idCounter(0),
      shuttingDown(false) {}

CorrelationMultiplexer::~CorrelationMultiplexer() {
  shutdown();
  if (readThread && readThread->joinable()) {
    // Only reachable when the last owner lets go on the read thread.
    STERROR << "Multiplexer destroyed from its own read loop, detaching";
    readThread->detach();
  }
}

void CorrelationMultiplexer::start() {
  if (readThread) {
    STFATAL << "Read loop started twice on fd " << fd;
  }
  readThread.reset(new thread(&CorrelationMultiplexer::readLoop, this));
}

uint64_t CorrelationMultiplexer::nextCorrelationId() {
  uint64_t id;
  do {
    id = ++idCounter;
  } while (id == BROADCAST_CORRELATION_ID);
  return id;
}

uint64_t CorrelationMultiplexer::send(const string& command) {
  if (command.length() > Frame::MAX_PAYLOAD_SIZE) {
    throw FramingError("Command of " + to_string(command.length()) +
                       " bytes does not fit in a frame");
  }
  uint64_t id = nextCorrelationId();
  auto pending = make_shared<PendingCommand>(std::chrono::steady_clock::now() +
                                             commandTimeout);
  {
    lock_guard<mutex> guard(waiterMutex);
    waiters[id] = pending;
    if (!connected) {
      pending->done = true;
      pending->response =
          CommandResponse(CommandResponse::CONNECTION_LOST, disconnectReason);
      return id;
    }
  }

  unique_lock<timed_mutex> writeLock(writeMutex, std::defer_lock);
  if (!writeLock.try_lock_until(pending->deadline)) {
    // Still queued behind another writer; `await` reports the timeout.
    LOG(WARNING) << "Command " << id << " not sent before its deadline";
    return id;
  }
  try {
    Frame frame(id, command);
    VLOG(2) << "Sending command " << id << ": " << command;
    size_t written = codec.writeFrameUntil(fd, frame, pending->deadline);
    if (written == frame.length() + Frame::LENGTH_SIZE) {
      return id;
    }
    if (written == 0) {
      LOG(WARNING) << "Command " << id
                   << " not sent before its deadline, helper is not reading";
      return id;
    }
    writeLock.unlock();
    abortStream("write of command " + to_string(id) + " stalled after " +
                to_string(written) + " bytes");
  } catch (const std::runtime_error& re) {
    writeLock.unlock();
    LOG(WARNING) << "Could not send command " << id << ": " << re.what();
    abortStream(string("write failed: ") + re.what());
  }
  return id;
}

void CorrelationMultiplexer::abortStream(const string& reason) {
  {
    lock_guard<mutex> guard(waiterMutex);
    if (!abortReason.empty() || !connected) {
      return;
    }
    abortReason = reason;
  }
  LOG(ERROR) << "Abandoning stream on fd " << fd << ": " << reason;
  failAllPending(reason);
  socketHandler->shutdownSocket(fd);
}

CommandResponse CorrelationMultiplexer::await(uint64_t id) {
  unique_lock<mutex> lock(waiterMutex);
  auto it = waiters.find(id);
  if (it == waiters.end()) {
    STERROR << "Awaiting a command that was never sent: " << id;
    return CommandResponse(CommandResponse::CONNECTION_LOST,
                           "unknown command id");
  }
  shared_ptr<PendingCommand> pending = it->second;
  bool done = waiterCv.wait_until(lock, pending->deadline,
                                  [&pending] { return pending->done; });
  // Removing the entry makes any later reply for this id a no-op.
  waiters.erase(id);
  if (!done) {
    LOG(WARNING) << "Command " << id << " timed out after "
                 << commandTimeout.count() << " ms";
    return CommandResponse(CommandResponse::TIMED_OUT, "timeout");
  }
  return pending->response;
}

CommandResponse CorrelationMultiplexer::call(const string& command) {
  return await(send(command));
}

bool CorrelationMultiplexer::resolve(uint64_t id,
                                     const CommandResponse& response) {
  {
    lock_guard<mutex> guard(waiterMutex);
    auto it = waiters.find(id);
    if (it == waiters.end() || it->second->done) {
      return false;
    }
    it->second->done = true;
    it->second->response = response;
  }
  waiterCv.notify_all();
  return true;
}

void CorrelationMultiplexer::failAllPending(const string& reason) {
  int failed = 0;
  {
    lock_guard<mutex> guard(waiterMutex);
    connected = false;
    disconnectReason = reason;
    for (auto& it : waiters) {
      if (!it.second->done) {
        it.second->done = true;
        it.second->response =
            CommandResponse(CommandResponse::CONNECTION_LOST, reason);
        failed++;
      }
    }
  }
  waiterCv.notify_all();
  if (failed) {
    LOG(INFO) << "Failed " << failed << " pending commands: " << reason;
  }
}

void CorrelationMultiplexer::readLoop() {
  el::Helpers::setThreadName("fsn-reader-" + to_string(fd));
  string reason;
  bool cleanEnd = false;
  try {
    while (true) {
      Frame frame;
      if (!codec.readFrame(fd, &frame)) {
        cleanEnd = true;
        reason = shuttingDown ? "stream closed" : "helper closed the stream";
        break;
      }
      if (frame.isBroadcast()) {
        broadcastHandler(frame.getPayload());
        continue;
      }
      if (!resolve(frame.getCorrelationId(),
                   CommandResponse(CommandResponse::RESOLVED,
                                   frame.getPayload()))) {
        VLOG(1) << "Dropping reply for unknown or expired command "
                << frame.getCorrelationId();
      }
    }
  } catch (const FramingError& fe) {
    reason = string("framing error: ") + fe.what();
  } catch (const ProtocolError& pe) {
    reason = string("protocol error: ") + pe.what();
  } catch (const std::runtime_error& re) {
    reason = string("read failed: ") + re.what();
  }

  {
    lock_guard<mutex> guard(waiterMutex);
    if (!abortReason.empty()) {
      reason = abortReason;
      cleanEnd = false;
    }
  }
  if (cleanEnd || shuttingDown) {
    LOG(INFO) << "Read loop on fd " << fd << " finished: " << reason;
  } else {
    LOG(ERROR) << "Read loop on fd " << fd << " failed: " << reason;
  }
  failAllPending(reason);
  if (disconnectHandler) {
    disconnectHandler(reason);
  }
}

void CorrelationMultiplexer::shutdown() {
  if (!shuttingDown.exchange(true)) {
    VLOG(1) << "Shutting down multiplexer on fd " << fd;
    socketHandler->shutdownSocket(fd);
  }
  if (!readThread || readThread->get_id() == std::this_thread::get_id()) {
    // The read loop exits on its own once it sees end-of-stream.
    return;
  }
  lock_guard<mutex> guard(joinMutex);
  if (readThread->joinable()) {
    readThread->join();
  }
}

bool CorrelationMultiplexer::isConnected() {
  lock_guard<mutex> guard(waiterMutex);
  return connected;
}

size_t CorrelationMultiplexer::numPending() {
  lock_guard<mutex> guard(waiterMutex);
  size_t count = 0;
  for (auto& it : waiters) {
    if (!it.second->done) {
      count++;
    }
  }
  return count;
}
}  // namespace fsn
