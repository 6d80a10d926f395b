#include "WatchCommandInterface.hpp"

#include "FsNotifyErrors.hpp"

namespace fsn {
namespace {
bool pathsFromJson(const json& value, vector<string>* paths) {
  if (value.is_null()) {
    paths->clear();
    return true;
  }
  if (!value.is_array()) {
    return false;
  }
  vector<string> result;
  for (const auto& entry : value) {
    if (!entry.is_string()) {
      return false;
    }
    result.push_back(entry.get<string>());
  }
  *paths = result;
  return true;
}
}  // namespace

string commandStatusName(CommandReply::CommandStatus status) {
  switch (status) {
    case CommandReply::OK:
      return "ok";
    case CommandReply::COMMAND_ERROR:
      return "command error";
    case CommandReply::TIMEOUT:
      return "timeout";
    case CommandReply::CONNECTION_LOST:
      return "connection lost";
    case CommandReply::UNRECOGNIZED_REPLY:
      return "unrecognized reply";
    case CommandReply::NO_MONITOR:
      return "no monitor";
  }
  return "unknown";
}

WatchCommandInterface::WatchCommandInterface(
    shared_ptr<CorrelationMultiplexer> _multiplexer)
    : multiplexer(_multiplexer) {}

CommandReply WatchCommandInterface::addWatch(const string& path) {
  CommandReply reply;
  string payload;
  if (!execute("add_watch " + path, &reply, &payload)) {
    return reply;
  }
  return decodeReply(payload);
}

CommandReply WatchCommandInterface::remove(const string& path) {
  CommandReply reply;
  string payload;
  if (!execute("remove " + path, &reply, &payload)) {
    return reply;
  }
  return decodeReply(payload);
}

CommandReply WatchCommandInterface::watchList(vector<string>* paths) {
  CommandReply reply;
  string payload;
  if (!execute("watch_list", &reply, &payload)) {
    return reply;
  }
  return decodeWatchListReply(payload, paths);
}

bool WatchCommandInterface::execute(const string& command, CommandReply* reply,
                                    string* payload) {
  CommandResponse response;
  try {
    response = multiplexer->call(command);
  } catch (const FramingError& fe) {
    *reply = CommandReply(CommandReply::COMMAND_ERROR, fe.what());
    return false;
  }
  switch (response.status) {
    case CommandResponse::RESOLVED:
      *payload = response.payload;
      return true;
    case CommandResponse::TIMED_OUT:
      *reply = CommandReply(CommandReply::TIMEOUT,
                            "no reply to \"" + command + "\" within " +
                                to_string(multiplexer->getCommandTimeout()
                                              .count()) +
                                " ms");
      return false;
    case CommandResponse::CONNECTION_LOST:
      *reply = CommandReply(CommandReply::CONNECTION_LOST, response.payload);
      return false;
  }
  STFATAL << "Invalid command response status: " << int(response.status);
  return false;
}

CommandReply WatchCommandInterface::decodeReply(const string& payload) {
  json j;
  if (!tryParseJson(payload, &j)) {
    LOG(WARNING) << "Reply is not JSON: " << payload;
    return CommandReply(CommandReply::UNRECOGNIZED_REPLY,
                        "unrecognized reply: " + payload);
  }
  if (j.is_string() && j.get<string>() == "ok") {
    return CommandReply();
  }
  if (j.is_object()) {
    if (j.contains("Err")) {
      return CommandReply(CommandReply::COMMAND_ERROR, jsonToMessage(j["Err"]));
    }
    if (j.contains("OK")) {
      CommandReply reply;
      reply.value = j["OK"];
      return reply;
    }
  }
  LOG(WARNING) << "Unrecognized reply: " << payload;
  return CommandReply(CommandReply::UNRECOGNIZED_REPLY,
                      "unrecognized reply: " + payload);
}

CommandReply WatchCommandInterface::decodeWatchListReply(
    const string& payload, vector<string>* paths) {
  json j;
  if (tryParseJson(payload, &j) && (j.is_array() || j.is_null())) {
    if (pathsFromJson(j, paths)) {
      return CommandReply();
    }
    return CommandReply(CommandReply::UNRECOGNIZED_REPLY,
                        "watch list holds a non-string entry: " + payload);
  }
  CommandReply reply = decodeReply(payload);
  if (!reply.ok()) {
    return reply;
  }
  if (!pathsFromJson(reply.value, paths)) {
    return CommandReply(CommandReply::UNRECOGNIZED_REPLY,
                        "watch list is not an array of paths: " + payload);
  }
  return reply;
}
}  // namespace fsn
