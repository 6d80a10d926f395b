#ifndef __FSN_WATCH_OPS_H__
#define __FSN_WATCH_OPS_H__

#include "Headers.hpp"

namespace fsn {
/**
 * @brief Kinds of change the helper reports, one bit each.
 *
 * The helper sends them packed in a 5-bit integer. From the most significant
 * bit down the order is chmod, rename, remove, write, create, so `create` is
 * bit 0 and `chmod` is bit 4.
 */
enum class WatchOp : uint8_t {
  CREATE = 1 << 0,
  WRITE = 1 << 1,
  REMOVE = 1 << 2,
  RENAME = 1 << 3,
  CHMOD = 1 << 4,
};

/** @brief Mask covering every defined op bit. */
const uint32_t WATCH_OP_MASK = 0x1F;

/** @brief All ops in bit order, lowest first. */
const array<WatchOp, 5> ALL_WATCH_OPS = {WatchOp::CREATE, WatchOp::WRITE,
                                         WatchOp::REMOVE, WatchOp::RENAME,
                                         WatchOp::CHMOD};

typedef set<WatchOp> WatchOpSet;

/**
 * @brief Expands an op mask into the set of ops whose bit is set.
 *
 * Bits above the five defined ones are ignored.
 */
WatchOpSet decodeWatchOps(uint64_t mask);

/** @brief True when `mask` sets any bit outside WATCH_OP_MASK. */
bool hasUnknownWatchOps(uint64_t mask);

/** @brief Packs a set of ops back into the helper's mask layout. */
uint32_t encodeWatchOps(const WatchOpSet& ops);

/** @brief Lower-case name of an op ("create", "write", ...). */
string watchOpName(WatchOp op);

/** @brief Renders a set as "create|write"; empty sets render as "none". */
string watchOpsToString(const WatchOpSet& ops);
}  // namespace fsn

#endif  // __FSN_WATCH_OPS_H__
