#ifndef __FSN_WATCH_COMMAND_INTERFACE__
#define __FSN_WATCH_COMMAND_INTERFACE__

#include "CorrelationMultiplexer.hpp"
#include "Headers.hpp"
#include "JsonLib.hpp"

namespace fsn {
/**
 * @brief Outcome of one watch command.
 */
struct CommandReply {
  enum CommandStatus {
    OK,
    /** @brief The helper answered with `{"Err": ...}`. */
    COMMAND_ERROR,
    TIMEOUT,
    CONNECTION_LOST,
    /** @brief The helper answered with something we cannot decode. */
    UNRECOGNIZED_REPLY,
    /** @brief No running monitor has the requested name. */
    NO_MONITOR,
  };

  CommandReply() : status(OK) {}
  CommandReply(CommandStatus _status, const string& _message)
      : status(_status), message(_message) {}

  bool ok() const { return status == OK; }

  CommandStatus status;
  /** @brief Error text; empty on success. */
  string message;
  /** @brief Value carried by an `{"OK": ...}` reply, null otherwise. */
  json value;
};

/** @brief Name of a status for logs and CLI output. */
string commandStatusName(CommandReply::CommandStatus status);

/**
 * @brief Typed watch commands on top of a CorrelationMultiplexer.
 *
 * Each call blocks until the helper answers or the multiplexer's command
 * timeout elapses.
 */
class WatchCommandInterface {
 public:
  explicit WatchCommandInterface(
      shared_ptr<CorrelationMultiplexer> _multiplexer);

  /** @brief Asks the helper to start watching `path`. */
  CommandReply addWatch(const string& path);
  /** @brief Asks the helper to stop watching `path`. */
  CommandReply remove(const string& path);
  /**
   * @brief Fetches the paths the helper is watching, in no particular order.
   * @param paths Filled only when the reply is OK.
   */
  CommandReply watchList(vector<string>* paths);

  /**
   * @brief Decodes a reply payload.
   *
   * `"ok"` and `{"OK": v}` are success, `{"Err": m}` is a command error,
   * anything else is unrecognized.
   */
  static CommandReply decodeReply(const string& payload);
  /**
   * @brief Decodes a `watch_list` reply, which may also be a bare array of
   * paths or null.
   */
  static CommandReply decodeWatchListReply(const string& payload,
                                           vector<string>* paths);

 protected:
  /** @brief Sends `command` and maps transport failures to a status. */
  bool execute(const string& command, CommandReply* reply, string* payload);

  shared_ptr<CorrelationMultiplexer> multiplexer;
};
}  // namespace fsn

#endif  // __FSN_WATCH_COMMAND_INTERFACE__
