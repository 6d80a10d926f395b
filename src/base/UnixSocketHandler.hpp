#ifndef __FSN_UNIX_SOCKET_HANDLER__
#define __FSN_UNIX_SOCKET_HANDLER__

#include "SocketHandler.hpp"

namespace fsn {
/**
 * @brief Default SocketHandler implementation using POSIX stream sockets with
 * mutex guards.
 */
class UnixSocketHandler : public SocketHandler {
 public:
  UnixSocketHandler();
  virtual ~UnixSocketHandler() {}

  /** @brief Reads up to `count` bytes while holding the per-socket mutex. */
  virtual ssize_t read(int fd, void* buf, size_t count);
  /**
   * @brief Writes as much of `count` bytes as the socket buffer takes without
   * blocking.
   */
  virtual ssize_t write(int fd, const void* buf, size_t count);
  /** @brief Wraps socketpair(AF_UNIX, SOCK_STREAM). */
  virtual pair<int, int> createPair();
  /** @brief Tracks an inherited descriptor and makes it non-blocking. */
  virtual void adopt(int fd);
  /** @brief Calls shutdown(SHUT_RDWR) so pending reads return 0. */
  virtual void shutdownSocket(int fd);
  /** @brief Closes the descriptor and removes it from the tracked set. */
  virtual void close(int fd);
  /** @brief Returns all actively tracked sockets. */
  virtual vector<int> getActiveSockets();

 protected:
  /**
   * @brief Ensures that a descriptor is tracked and has its own mutex.
   */
  void addToActiveSockets(int fd);
  /**
   * @brief Performs per-socket initialization (non-blocking, signal handling).
   */
  virtual void initSocket(int fd);

  /** @brief Mutex per active socket to ensure serial read/write. */
  map<int, shared_ptr<recursive_mutex>> activeSocketMutexes;
  /** @brief Guards access to the active socket map. */
  recursive_mutex globalMutex;
};
}  // namespace fsn

#endif  // __FSN_UNIX_SOCKET_HANDLER__
