#include "BroadcastDispatcher.hpp"

#include "FsNotifyErrors.hpp"
#include "JsonLib.hpp"
#include "WatchOps.hpp"

namespace fsn {
BroadcastDispatcher::BroadcastDispatcher(
    const string& _monitorName, shared_ptr<SubscriberDirectory> _directory)
    : monitorName(_monitorName), directory(_directory) {}

SubscriberMessage BroadcastDispatcher::decodeBroadcast(
    const string& monitorName, const string& payload) {
  json j;
  if (!tryParseJson(payload, &j) || !j.is_object()) {
    throw ProtocolError("Broadcast is not a JSON object: " + payload);
  }

  SubscriberMessage message;
  message.set_monitor(monitorName);
  if (j.contains("Name") && j.contains("Op")) {
    if (!j["Name"].is_string() || !j["Op"].is_number_unsigned()) {
      throw ProtocolError("Malformed watch event: " + payload);
    }
    uint64_t mask = j["Op"].get<uint64_t>();
    WatchEvent* event = message.mutable_event();
    event->set_path(j["Name"].get<string>());
    // Keep only the defined bits; decodeWatchOps logs anything above them.
    event->set_ops(encodeWatchOps(decodeWatchOps(mask)));
    return message;
  }
  if (j.contains("Err")) {
    message.mutable_error()->set_message(jsonToMessage(j["Err"]));
    return message;
  }
  throw ProtocolError("Unrecognized broadcast: " + payload);
}

int BroadcastDispatcher::dispatchPayload(const string& payload) {
  SubscriberMessage message = decodeBroadcast(monitorName, payload);
  if (message.has_event()) {
    VLOG(1) << monitorName << ": " << message.event().path() << " "
            << watchOpsToString(decodeWatchOps(message.event().ops()));
  } else {
    LOG(WARNING) << monitorName
                 << ": watcher error: " << message.error().message();
  }
  return directory->dispatch(monitorName, message);
}

int BroadcastDispatcher::dispatchStop() {
  SubscriberMessage message;
  message.set_monitor(monitorName);
  message.mutable_stop()->set_name(monitorName);
  int delivered = directory->dispatch(monitorName, message);
  LOG(INFO) << "Sent stop notification for " << monitorName << " to "
            << delivered << " subscribers";
  return delivered;
}
}  // namespace fsn
