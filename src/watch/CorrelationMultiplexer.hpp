#ifndef __FSN_CORRELATION_MULTIPLEXER__
#define __FSN_CORRELATION_MULTIPLEXER__

#include "FrameCodec.hpp"
#include "Headers.hpp"
#include "SocketHandler.hpp"

namespace fsn {
/**
 * @brief Outcome of waiting for one command.
 */
struct CommandResponse {
  enum Status {
    /** @brief The helper answered; `payload` holds the reply. */
    RESOLVED,
    /** @brief No reply arrived before the deadline. */
    TIMED_OUT,
    /** @brief The stream ended or failed before a reply arrived. */
    CONNECTION_LOST,
  };

  CommandResponse() : status(CONNECTION_LOST) {}
  CommandResponse(Status _status, const string& _payload)
      : status(_status), payload(_payload) {}

  Status status;
  /** @brief Reply payload, or the reason for a non-resolved status. */
  string payload;
};

/**
 * @brief Shares one helper stream between concurrent commands and the
 * helper's unsolicited broadcasts.
 *
 * Every command gets a fresh nonzero correlation id and a slot in the waiter
 * table. A single read loop thread owns the read side: frames with id 0 go to
 * the broadcast handler, anything else resolves the waiter with that id.
 * Writers are serialized by their own mutex so frames never interleave.
 */
class CorrelationMultiplexer {
 public:
  /** @brief Receives the payload of every id 0 frame, on the read thread. */
  typedef std::function<void(const string& payload)> BroadcastHandler;
  /** @brief Runs once on the read thread when the stream is gone. */
  typedef std::function<void(const string& reason)> DisconnectHandler;

  CorrelationMultiplexer(shared_ptr<SocketHandler> _socketHandler, int _fd,
                         BroadcastHandler _broadcastHandler,
                         DisconnectHandler _disconnectHandler,
                         std::chrono::milliseconds _commandTimeout =
                             std::chrono::milliseconds(
                                 DEFAULT_COMMAND_TIMEOUT_MS));

  /** @brief Shuts the stream down and joins the read loop. */
  virtual ~CorrelationMultiplexer();

  /** @brief Launches the read loop thread. */
  void start();

  /**
   * @brief Registers a pending command and writes its frame.
   *
   * The write is bounded by the command's deadline. A command that could not
   * be written at all before then times out. A frame cut off mid-write, or
   * a failed write, leaves the stream unusable: every pending command
   * resolves as CONNECTION_LOST and the read loop winds down.
   * @throws FramingError if `command` does not fit in a frame.
   * @return The correlation id to pass to `await`.
   */
  uint64_t send(const string& command);

  /**
   * @brief Blocks until the read loop resolves `id` or the command timeout
   * elapses. A reply arriving after the timeout is discarded.
   */
  CommandResponse await(uint64_t id);

  /** @brief `send` followed by `await`. */
  CommandResponse call(const string& command);

  /**
   * @brief Wakes the read loop with end-of-stream and waits for it to exit.
   *
   * Safe to call more than once and from the read loop itself (which then
   * skips the join).
   */
  void shutdown();

  /** @brief True until the read loop has observed the end of the stream. */
  bool isConnected();

  /** @brief Number of commands still waiting for a reply. */
  size_t numPending();

  std::chrono::milliseconds getCommandTimeout() const { return commandTimeout; }

 protected:
  struct PendingCommand {
    explicit PendingCommand(std::chrono::steady_clock::time_point _deadline)
        : deadline(_deadline), done(false) {}

    std::chrono::steady_clock::time_point deadline;
    bool done;
    CommandResponse response;
  };

  /** @brief Loop body of the read thread. */
  void readLoop();
  /** @brief Returns the next id, never 0. */
  uint64_t nextCorrelationId();
  /** @brief Completes and removes the waiter for `id`, if any. */
  bool resolve(uint64_t id, const CommandResponse& response);
  /** @brief Completes every waiter with CONNECTION_LOST. */
  void failAllPending(const string& reason);
  /**
   * @brief Fails everything pending and shuts the stream down after a write
   * left it unusable. Does not join the read loop.
   */
  void abortStream(const string& reason);

  shared_ptr<SocketHandler> socketHandler;
  FrameCodec codec;
  int fd;
  BroadcastHandler broadcastHandler;
  DisconnectHandler disconnectHandler;
  std::chrono::milliseconds commandTimeout;

  /** @brief Guards `waiters` and `connected`. */
  mutex waiterMutex;
  condition_variable waiterCv;
  unordered_map<uint64_t, shared_ptr<PendingCommand>> waiters;
  bool connected;
  /** @brief Reason the stream went away, for commands sent afterwards. */
  string disconnectReason;
  /** @brief Set when a write broke the stream; reported by the read loop. */
  string abortReason;

  /** @brief Serializes frame writes; waited on only until a deadline. */
  timed_mutex writeMutex;
  std::atomic<uint64_t> idCounter;

  unique_ptr<thread> readThread;
  /** @brief Serializes joins of `readThread`; never taken by the read loop. */
  mutex joinMutex;
  std::atomic<bool> shuttingDown;
};
}  // namespace fsn

#endif  // __FSN_CORRELATION_MULTIPLEXER__
