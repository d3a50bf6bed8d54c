#include "bounded_execution.h"
#include <cerrno>
#include <climits>
#include <cstdint>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#ifdef __APPLE__
#include <mach-o/dyld.h>
#endif

extern char **environ;

namespace {

// pipe() 与 FD_CLOEXEC 之间不是原子的, 串行化创建子进程,
// 避免并发的子进程继承别的调用的管道端
std::mutex g_spawn_mutex;
std::once_flag g_sigpipe_once;

void closeFd(int &fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

bool setNonBlocking(int fd) {
  int flags = ::fcntl(fd, F_GETFL);
  return flags >= 0 && ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

void killAndReap(pid_t pid) {
  ::kill(pid, SIGKILL);
  int status = 0;
  while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
  }
}

pid_t spawnWorker(const IsolatedCommand &command, int &stdin_fd,
                  int &stdout_fd, std::string &detail) {
  std::lock_guard<std::mutex> lock(g_spawn_mutex);

  int in_pipe[2];
  int out_pipe[2];
  if (::pipe(in_pipe) != 0) {
    detail = std::string("pipe failed: ") + std::strerror(errno);
    return -1;
  }
  if (::pipe(out_pipe) != 0) {
    detail = std::string("pipe failed: ") + std::strerror(errno);
    ::close(in_pipe[0]);
    ::close(in_pipe[1]);
    return -1;
  }
  for (int fd : {in_pipe[0], in_pipe[1], out_pipe[0], out_pipe[1]}) {
    ::fcntl(fd, F_SETFD, FD_CLOEXEC);
  }

  posix_spawn_file_actions_t actions;
  posix_spawn_file_actions_init(&actions);
  posix_spawn_file_actions_adddup2(&actions, in_pipe[0], STDIN_FILENO);
  posix_spawn_file_actions_adddup2(&actions, out_pipe[1], STDOUT_FILENO);

  // 父进程忽略 SIGPIPE, 子进程恢复默认处理
  posix_spawnattr_t attr;
  posix_spawnattr_init(&attr);
  sigset_t defaults;
  sigemptyset(&defaults);
  sigaddset(&defaults, SIGPIPE);
  posix_spawnattr_setsigdefault(&attr, &defaults);
  posix_spawnattr_setflags(&attr, POSIX_SPAWN_SETSIGDEF);

  std::vector<char *> argv;
  argv.push_back(const_cast<char *>(command.program.c_str()));
  for (const auto &arg : command.args)
    argv.push_back(const_cast<char *>(arg.c_str()));
  argv.push_back(nullptr);

  pid_t pid = -1;
  int rc = ::posix_spawn(&pid, command.program.c_str(), &actions, &attr,
                         argv.data(), environ);
  posix_spawnattr_destroy(&attr);
  posix_spawn_file_actions_destroy(&actions);
  ::close(in_pipe[0]);
  ::close(out_pipe[1]);

  if (rc != 0) {
    detail = "posix_spawn " + command.program + " failed: " +
             std::strerror(rc);
    ::close(in_pipe[1]);
    ::close(out_pipe[0]);
    return -1;
  }
  stdin_fd = in_pipe[1];
  stdout_fd = out_pipe[0];
  return pid;
}

} // namespace

std::string currentExecutablePath() {
#ifdef __APPLE__
  char raw[PATH_MAX];
  uint32_t size = sizeof(raw);
  if (_NSGetExecutablePath(raw, &size) != 0)
    return std::string();
  char resolved[PATH_MAX];
  if (!::realpath(raw, resolved))
    return std::string(raw);
  return std::string(resolved);
#else
  char buf[PATH_MAX];
  ssize_t n = ::readlink("/proc/self/exe", buf, sizeof(buf) - 1);
  if (n <= 0)
    return std::string();
  return std::string(buf, static_cast<size_t>(n));
#endif
}

IsolatedOutcome runIsolated(const IsolatedCommand &command,
                            const std::string &input,
                            std::chrono::milliseconds timeout) {
  IsolatedOutcome outcome;
  std::call_once(g_sigpipe_once, []() { std::signal(SIGPIPE, SIG_IGN); });

  if (command.program.empty()) {
    outcome.detail = "no worker program configured";
    return outcome;
  }

  int stdin_fd = -1;
  int stdout_fd = -1;
  pid_t pid = spawnWorker(command, stdin_fd, stdout_fd, outcome.detail);
  if (pid < 0)
    return outcome;

  const auto deadline = std::chrono::steady_clock::now() + timeout;
  auto timedOut = [&]() {
    closeFd(stdin_fd);
    closeFd(stdout_fd);
    killAndReap(pid);
    outcome.status = IsolatedStatus::TimedOut;
    outcome.detail =
        "deadline of " + std::to_string(timeout.count()) + "ms exceeded";
    return outcome;
  };
  auto failed = [&](const std::string &what) {
    int err = errno;
    closeFd(stdin_fd);
    closeFd(stdout_fd);
    killAndReap(pid);
    outcome.detail = what + ": " + std::strerror(err);
    return outcome;
  };

  if (!setNonBlocking(stdin_fd))
    return failed("fcntl failed");
  size_t written = 0;
  if (input.empty())
    closeFd(stdin_fd);

  // 同时写入请求并读取结果, 任一方向都不能阻塞另一方向
  std::string buffer;
  char chunk[65536];
  bool eof = false;
  while (!eof) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0)
      return timedOut();

    struct pollfd pfds[2];
    pfds[0].fd = stdout_fd;
    pfds[0].events = POLLIN;
    pfds[0].revents = 0;
    nfds_t count = 1;
    if (stdin_fd >= 0) {
      pfds[1].fd = stdin_fd;
      pfds[1].events = POLLOUT;
      pfds[1].revents = 0;
      count = 2;
    }

    int ready = ::poll(pfds, count, static_cast<int>(remaining.count()));
    if (ready < 0) {
      if (errno == EINTR)
        continue;
      return failed("poll failed");
    }
    if (ready == 0)
      continue; // 超时在下一轮循环处理

    if (count == 2 && pfds[1].revents != 0) {
      if (pfds[1].revents & (POLLERR | POLLHUP)) {
        closeFd(stdin_fd); // 子进程不再读取, 由退出码说明原因
      } else {
        ssize_t n = ::write(stdin_fd, input.data() + written,
                            input.size() - written);
        if (n > 0) {
          written += static_cast<size_t>(n);
          if (written == input.size())
            closeFd(stdin_fd);
        } else if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK &&
                   errno != EINTR) {
          closeFd(stdin_fd);
        }
      }
    }

    if (pfds[0].revents != 0) {
      ssize_t n = ::read(stdout_fd, chunk, sizeof(chunk));
      if (n > 0) {
        buffer.append(chunk, static_cast<size_t>(n));
      } else if (n == 0) {
        eof = true;
      } else if (errno != EINTR && errno != EAGAIN) {
        return failed("read failed");
      }
    }
  }
  closeFd(stdin_fd);
  closeFd(stdout_fd);

  // stdout 已关闭, 等待子进程退出, 同样受截止时间约束
  int status = 0;
  while (true) {
    pid_t waited = ::waitpid(pid, &status, WNOHANG);
    if (waited == pid)
      break;
    if (waited < 0 && errno != EINTR) {
      outcome.detail = std::string("waitpid failed: ") + std::strerror(errno);
      return outcome;
    }
    if (std::chrono::steady_clock::now() >= deadline)
      return timedOut();
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }

  if (WIFSIGNALED(status)) {
    outcome.detail = "worker terminated by signal " +
                     std::to_string(WTERMSIG(status));
    return outcome;
  }
  if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
    outcome.detail =
        "worker exited with status " + std::to_string(WEXITSTATUS(status));
    return outcome;
  }

  outcome.status = IsolatedStatus::Completed;
  outcome.payload = std::move(buffer);
  return outcome;
}
