#include "WatchOps.hpp"

namespace fsn {
bool hasUnknownWatchOps(uint64_t mask) {
  return (mask & ~uint64_t(WATCH_OP_MASK)) != 0;
}

WatchOpSet decodeWatchOps(uint64_t mask) {
  if (hasUnknownWatchOps(mask)) {
    LOG(WARNING) << "Ignoring unknown op bits in mask " << mask;
  }
  WatchOpSet ops;
  for (auto op : ALL_WATCH_OPS) {
    if (mask & uint64_t(op)) {
      ops.insert(op);
    }
  }
  return ops;
}

uint32_t encodeWatchOps(const WatchOpSet& ops) {
  uint32_t mask = 0;
  for (auto op : ops) {
    mask |= uint32_t(op);
  }
  return mask;
}

string watchOpName(WatchOp op) {
  switch (op) {
    case WatchOp::CREATE:
      return "create";
    case WatchOp::WRITE:
      return "write";
    case WatchOp::REMOVE:
      return "remove";
    case WatchOp::RENAME:
      return "rename";
    case WatchOp::CHMOD:
      return "chmod";
  }
  return "unknown";
}

string watchOpsToString(const WatchOpSet& ops) {
  if (ops.empty()) {
    return "none";
  }
  string s;
  for (auto op : ops) {
    if (!s.empty()) {
      s += "|";
    }
    s += watchOpName(op);
  }
  return s;
}
}  // namespace fsn
