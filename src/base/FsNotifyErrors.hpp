#ifndef __FSN_ERRORS__
#define __FSN_ERRORS__

#include <stdexcept>
#include <string>

namespace fsn {
/**
 * @brief Raised when the byte stream does not hold a well formed frame.
 *
 * Covers a stream that ends in the middle of a frame, a declared length that
 * cannot hold a correlation id, and payloads too large to encode. Fatal to the
 * monitor that owns the stream.
 */
class FramingError : public std::runtime_error {
 public:
  explicit FramingError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief Raised when a well framed message cannot be understood.
 *
 * Used for broadcast payloads that are neither an event nor an error. Treated
 * like a FramingError by the read loop.
 */
class ProtocolError : public std::runtime_error {
 public:
  explicit ProtocolError(const std::string& what)
      : std::runtime_error(what) {}
};

/**
 * @brief Raised when a monitor could not be brought to the running state.
 */
class MonitorStartError : public std::runtime_error {
 public:
  explicit MonitorStartError(const std::string& what)
      : std::runtime_error(what) {}
};
}  // namespace fsn

#endif  // __FSN_ERRORS__
