#include "../include/processrunner.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <system_error>

namespace {

void appendLimited(std::string &dst, const char *src, ssize_t n,
                   std::size_t limit, bool &truncated) {
  if (n <= 0) return;
  const std::size_t avail = dst.size() < limit ? limit - dst.size() : 0;
  const std::size_t take =
      std::min<std::size_t>(static_cast<std::size_t>(n), avail);
  dst.append(src, take);
  if (take < static_cast<std::size_t>(n)) truncated = true;
}

// Читает всё доступное без блокировки; false: канал закрыт
bool drain(int fd, std::string &dst, std::size_t limit, bool &truncated) {
  char buf[4096];
  while (true) {
    const ssize_t n = read(fd, buf, sizeof(buf));
    if (n > 0) {
      appendLimited(dst, buf, n, limit, truncated);
      continue;
    }
    if (n == 0) return false;
    if (errno == EINTR) continue;
    return errno == EAGAIN || errno == EWOULDBLOCK;
  }
}

void closePipe(int fds[2]) {
  if (fds[0] != -1) close(fds[0]);
  if (fds[1] != -1) close(fds[1]);
}

}  // namespace

ProcessSpec shellCommand(const std::string &script,
                         std::chrono::milliseconds timeout) {
  ProcessSpec spec;
  spec.command = "/bin/bash";
  spec.argv = {"-c", script};
  spec.timeout = timeout;
  return spec;
}

ProcessResult runProcess(const ProcessSpec &spec,
                         const std::atomic<bool> *cancel,
                         const std::function<void()> &onTick) {
  ProcessResult result;

  int outPipe[2] = {-1, -1};
  int errPipe[2] = {-1, -1};
  if (pipe2(outPipe, O_CLOEXEC) != 0) {
    throw std::system_error(errno, std::system_category(), "pipe failed");
  }
  if (pipe2(errPipe, O_CLOEXEC) != 0) {
    const int err = errno;
    closePipe(outPipe);
    throw std::system_error(err, std::system_category(), "pipe failed");
  }

  std::vector<std::string> all = {spec.command};
  all.insert(all.end(), spec.argv.begin(), spec.argv.end());
  std::vector<char *> argv;
  argv.reserve(all.size() + 1);
  for (auto &s : all) argv.push_back(s.data());
  argv.push_back(nullptr);

  const pid_t pid = fork();
  if (pid < 0) {
    const int err = errno;
    closePipe(outPipe);
    closePipe(errPipe);
    throw std::system_error(err, std::system_category(), "fork failed");
  }

  if (pid == 0) {
    // Маска сигналов наследуется от потока агента, где они заблокированы
    sigset_t empty;
    sigemptyset(&empty);
    sigprocmask(SIG_SETMASK, &empty, nullptr);

    setsid();
    dup2(outPipe[1], STDOUT_FILENO);
    dup2(errPipe[1], STDERR_FILENO);
    int devnull = open("/dev/null", O_RDONLY);
    if (devnull != -1) {
      dup2(devnull, STDIN_FILENO);
      close(devnull);
    }
    execv(spec.command.c_str(), argv.data());
    _exit(127);
  }

  close(outPipe[1]);
  close(errPipe[1]);
  fcntl(outPipe[0], F_SETFL, O_NONBLOCK);
  fcntl(errPipe[0], F_SETFL, O_NONBLOCK);

  const bool bounded = spec.timeout.count() > 0;
  const auto deadline = std::chrono::steady_clock::now() + spec.timeout;

  bool outOpen = true;
  bool errOpen = true;
  int status = 0;
  bool exited = false;

  while (!exited) {
    pollfd fds[2] = {{outPipe[0], POLLIN, 0}, {errPipe[0], POLLIN, 0}};
    poll(fds, 2, 50);

    if (outOpen) {
      outOpen = drain(outPipe[0], result.stdoutText, spec.maxOutputBytes,
                      result.stdoutTruncated);
    }
    if (errOpen) {
      errOpen = drain(errPipe[0], result.stderrText, spec.maxOutputBytes,
                      result.stderrTruncated);
    }

    const pid_t w = waitpid(pid, &status, WNOHANG);
    if (w == pid) {
      exited = true;
      break;
    }

    const bool cancelled = cancel && cancel->load();
    const bool expired = bounded && std::chrono::steady_clock::now() >= deadline;
    if (cancelled || expired) {
      kill(-pid, SIGKILL);
      kill(pid, SIGKILL);
      waitpid(pid, &status, 0);
      result.cancelled = cancelled;
      result.timedOut = !cancelled;
      exited = true;
      break;
    }

    if (onTick) onTick();
  }

  if (outOpen) {
    drain(outPipe[0], result.stdoutText, spec.maxOutputBytes,
          result.stdoutTruncated);
  }
  if (errOpen) {
    drain(errPipe[0], result.stderrText, spec.maxOutputBytes,
          result.stderrTruncated);
  }
  close(outPipe[0]);
  close(errPipe[0]);

  if (result.stdoutTruncated) result.stdoutText += "(truncated)";
  if (result.stderrTruncated) result.stderrText += "(truncated)";

  if (result.timedOut) {
    result.exitCode = 124;
  } else if (WIFEXITED(status)) {
    result.exitCode = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.exitCode = 128 + WTERMSIG(status);
  }
  return result;
}
