#ifndef __FSN_HEADERS__
#define __FSN_HEADERS__

#if __APPLE__
#include <sys/ucred.h>
#endif

#include <paths.h>
#include <poll.h>
#include <pthread.h>
#include <sys/ioctl.h>
#include <sys/socket.h>
#include <sys/wait.h>
#include <unistd.h>

#include <errno.h>
#include <fcntl.h>
#include <google/protobuf/message_lite.h>
#include <signal.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <time.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <ctime>
#include <deque>
#include <exception>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <sstream>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "FsNotify.pb.h"
#include "easylogging++.h"
#include "ust.hpp"

using namespace std;
namespace fs = std::filesystem;

// Correlation id reserved for frames the helper sends on its own
static const uint64_t BROADCAST_CORRELATION_ID = 0;

// Default time a caller waits for the helper to answer a command
static const int DEFAULT_COMMAND_TIMEOUT_MS = 1000;

// Time the helper gets to exit after SIGTERM before it is killed
static const int HELPER_TERMINATE_GRACE_MS = 2000;

#define STFATAL LOG(FATAL) << "Stack Trace: " << endl << ust::generate()

#define STERROR LOG(ERROR) << "Stack Trace: " << endl << ust::generate()

inline int GetErrno() { return errno; }

#define FATAL_FAIL(X) \
  if (((X) == -1))    \
    STFATAL << "Error: (" << GetErrno() << "): " << strerror(GetErrno());

// On BSD/OSX we can get EINVAL if the remote side has closed the connection
// before we have initialized it.
#define FATAL_FAIL_UNLESS_EINVAL(X)        \
  if (((X) == -1) && GetErrno() != EINVAL) \
    STFATAL << "Error: (" << GetErrno() << "): " << strerror(GetErrno());

#ifndef FSN_VERSION
#define FSN_VERSION "unknown"
#endif

namespace fsn {
template <typename Out>
inline void split(const std::string &s, char delim, Out result) {
  std::stringstream ss;
  ss.str(s);
  std::string item;
  while (std::getline(ss, item, delim)) {
    *(result++) = item;
  }
}

inline std::vector<std::string> split(const std::string &s, char delim) {
  std::vector<std::string> elems;
  split(s, delim, std::back_inserter(elems));
  return elems;
}

inline std::string trim(const std::string &s) {
  const char *whitespace = " \t\r\n";
  auto start = s.find_first_not_of(whitespace);
  if (start == std::string::npos) {
    return "";
  }
  auto end = s.find_last_not_of(whitespace);
  return s.substr(start, end - start + 1);
}

inline bool waitOnSocketEvent(int fd, short events, int timeoutMs) {
  pollfd pfd;
  pfd.fd = fd;
  pfd.events = events;
  pfd.revents = 0;
  int rc = poll(&pfd, 1, timeoutMs);
  if (rc == -1 && GetErrno() == EINTR) {
    return false;
  }
  FATAL_FAIL(rc);
  // Errors and hangups are reported too so the caller's next read or write
  // sees them.
  return rc > 0 && (pfd.revents & (events | POLLERR | POLLHUP)) != 0;
}

inline bool waitOnSocketData(int fd) {
  VLOG(4) << "Before polling sockFd";
  return waitOnSocketEvent(fd, POLLIN, 1000);
}

inline bool waitOnSocketWritable(int fd, int timeoutMs) {
  return waitOnSocketEvent(fd, POLLOUT, timeoutMs);
}

inline string GetTempDirectory() {
  string tmpDir = _PATH_TMP;
  return tmpDir;
}

inline void HandleTerminate() {
  static bool first = true;
  if (first) {
    first = false;
  } else {
    // If we are recursively terminating, just bail
    return;
  }
  std::set_terminate([]() -> void {
    std::exception_ptr eptr = std::current_exception();
    if (eptr) {
      try {
        std::rethrow_exception(eptr);
      } catch (const std::exception &e) {
        STFATAL << "Uncaught c++ exception: " << e.what();
      }
    } else {
      STFATAL << "Uncaught c++ exception (unknown)";
    }
  });
}
}  // namespace fsn

#endif
