#include "SubprocessUtils.hpp"

namespace fsn {
pid_t SubprocessUtils::spawnWithDuplexStdio(
    shared_ptr<SocketHandler> socketHandler, const string& command,
    const vector<string>& args, int* hostFd) {
  if (::access(command.c_str(), X_OK) != 0) {
    throw std::runtime_error("Helper is not executable: " + command + " (" +
                             strerror(GetErrno()) + ")");
  }

  // Build argv before forking: the child may only call async-signal-safe
  // functions.
  vector<string> argStrings;
  argStrings.push_back(command);
  argStrings.insert(argStrings.end(), args.begin(), args.end());
  vector<char*> argv;
  for (auto& it : argStrings) {
    argv.push_back(&it[0]);
  }
  argv.push_back(NULL);

  pair<int, int> fds = socketHandler->createPair();
  int childFd = fds.second;

  pid_t pid = fork();
  if (pid == 0) {
    // child process
    dup2(childFd, STDIN_FILENO);
    dup2(childFd, STDOUT_FILENO);
    if (childFd > STDOUT_FILENO) {
      ::close(childFd);
    }
    // The helper expects ordinary blocking stdio.
    int opts = fcntl(STDIN_FILENO, F_GETFL);
    if (opts != -1) {
      fcntl(STDIN_FILENO, F_SETFL, opts & ~O_NONBLOCK);
    }
    execvp(argv[0], argv.data());

    static const char execFailed[] = "fsnotify: execvp of helper failed\n";
    ssize_t ignored = ::write(STDERR_FILENO, execFailed, sizeof(execFailed) - 1);
    (void)ignored;
    _exit(127);
  } else if (pid > 0) {
    // parent process
    socketHandler->close(childFd);
    *hostFd = fds.first;
    LOG(INFO) << "Spawned helper " << command << " as pid " << pid
              << " on fd " << *hostFd;
    return pid;
  } else {
    auto localErrno = GetErrno();
    socketHandler->close(fds.first);
    socketHandler->close(fds.second);
    throw std::runtime_error(string("Failed to fork helper: ") +
                             strerror(localErrno));
  }
}

void SubprocessUtils::terminate(pid_t pid, bool force) {
  int sig = force ? SIGKILL : SIGTERM;
  VLOG(1) << "Sending signal " << sig << " to helper " << pid;
  if (::kill(pid, sig) == -1 && GetErrno() != ESRCH) {
    LOG(WARNING) << "Could not signal helper " << pid << ": "
                 << strerror(GetErrno());
  }
}

bool SubprocessUtils::reap(pid_t pid, int timeoutMs, int* exitStatus) {
  auto deadline =
      std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
  while (true) {
    int status = 0;
    pid_t rc = ::waitpid(pid, &status, WNOHANG);
    if (rc == pid) {
      *exitStatus = status;
      return true;
    }
    if (rc == -1) {
      if (GetErrno() == EINTR) {
        continue;
      }
      // ECHILD: somebody else already reaped it.
      LOG(WARNING) << "waitpid on helper " << pid
                   << " failed: " << strerror(GetErrno());
      *exitStatus = 0;
      return true;
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      return false;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
}

int SubprocessUtils::terminateAndReap(pid_t pid, int graceMs) {
  int status = -1;
  if (reap(pid, 0, &status)) {
    return status;
  }
  terminate(pid, false);
  if (reap(pid, graceMs, &status)) {
    return status;
  }
  LOG(WARNING) << "Helper " << pid << " ignored SIGTERM, killing";
  terminate(pid, true);
  if (!reap(pid, graceMs, &status)) {
    STERROR << "Helper " << pid << " could not be reaped";
    return -1;
  }
  return status;
}

string SubprocessUtils::describeStatus(int status) {
  if (status == -1) {
    return "unknown status";
  }
  if (WIFEXITED(status)) {
    return "exit code " + to_string(WEXITSTATUS(status));
  }
  if (WIFSIGNALED(status)) {
    return "signal " + to_string(WTERMSIG(status));
  }
  return "status " + to_string(status);
}
}  // namespace fsn
