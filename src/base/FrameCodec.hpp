#ifndef __FSN_FRAME_CODEC_H__
#define __FSN_FRAME_CODEC_H__

#include "Frame.hpp"
#include "Headers.hpp"
#include "SocketHandler.hpp"

namespace fsn {
/**
 * @brief Reads and writes whole frames on a stream descriptor.
 *
 * Every call resolves exactly one frame or fails; no partial frame is kept
 * between calls.
 */
class FrameCodec {
 public:
  explicit FrameCodec(shared_ptr<SocketHandler> _socketHandler);

  /** @brief Returns the wire bytes for `payload` tagged with `id`. */
  static string encode(uint64_t id, const string& payload);
  /**
   * @brief Parses one complete encoded frame held in memory.
   * @throws FramingError when the declared length does not match.
   */
  static Frame decode(const string& bytes);

  /**
   * @brief Blocks until one frame has been read from fd.
   * @return false on a clean end-of-stream at a frame boundary.
   * @throws FramingError when the stream ends inside a frame or declares an
   * impossible length.
   */
  bool readFrame(int fd, Frame* frame);
  /**
   * @brief Writes the frame in one call to the socket handler.
   * @throws FramingError if the payload is too large, std::runtime_error if
   * the write fails.
   */
  void writeFrame(int fd, const Frame& frame);
  /**
   * @brief Writes the frame, giving up once `deadline` passes.
   * @return Number of wire bytes written. Zero means the stream is untouched;
   * anything short of the full frame leaves the stream mid-frame.
   */
  size_t writeFrameUntil(int fd, const Frame& frame,
                         std::chrono::steady_clock::time_point deadline);

 protected:
  shared_ptr<SocketHandler> socketHandler;
};
}  // namespace fsn

#endif  // __FSN_FRAME_CODEC_H__
