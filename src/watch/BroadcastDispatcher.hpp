#ifndef __FSN_BROADCAST_DISPATCHER__
#define __FSN_BROADCAST_DISPATCHER__

#include "Headers.hpp"
#include "SubscriberDirectory.hpp"

namespace fsn {
/**
 * @brief Turns helper broadcasts into subscriber messages for one monitor
 * name and hands them to the SubscriberDirectory.
 */
class BroadcastDispatcher {
 public:
  BroadcastDispatcher(const string& _monitorName,
                      shared_ptr<SubscriberDirectory> _directory);

  /**
   * @brief Decodes a broadcast payload and delivers it.
   *
   * `{"Name": path, "Op": mask}` becomes an event, `{"Err": message}` an
   * error.
   * @throws ProtocolError for any other payload.
   * @return Number of subscribers reached.
   */
  int dispatchPayload(const string& payload);

  /** @brief Sends the stop notification for this monitor. */
  int dispatchStop();

  /**
   * @brief Decodes a broadcast payload without delivering it.
   * @throws ProtocolError if the payload is not an event or an error.
   */
  static SubscriberMessage decodeBroadcast(const string& monitorName,
                                           const string& payload);

  const string& getMonitorName() const { return monitorName; }

 protected:
  string monitorName;
  shared_ptr<SubscriberDirectory> directory;
};
}  // namespace fsn

#endif  // __FSN_BROADCAST_DISPATCHER__
