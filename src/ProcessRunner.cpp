#include "ProcessRunner.hpp"
#include <cerrno>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <system_error>
#include <unistd.h>

namespace nassync {

namespace {

// Closes the descriptor on scope exit.
struct Fd {
  int fd = -1;
  Fd() = default;
  explicit Fd(int f) : fd(f) {}
  Fd(const Fd &) = delete;
  Fd &operator=(const Fd &) = delete;
  ~Fd() { reset(); }
  void reset() {
    if (fd >= 0)
      ::close(fd);
    fd = -1;
  }
};

void makePipe(Fd &readEnd, Fd &writeEnd) {
  int fds[2];
  if (::pipe2(fds, O_CLOEXEC) != 0)
    throw std::system_error(errno, std::generic_category(), "pipe2");
  readEnd.fd = fds[0];
  writeEnd.fd = fds[1];
}

int waitForChild(pid_t pid) {
  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR)
      throw std::system_error(errno, std::generic_category(), "waitpid");
  }
  if (WIFEXITED(status))
    return WEXITSTATUS(status);
  if (WIFSIGNALED(status))
    return 128 + WTERMSIG(status);
  return -1;
}

} // namespace

std::string joinCommandLine(const std::vector<std::string> &argv) {
  std::string line;
  for (size_t i = 0; i < argv.size(); ++i) {
    if (i > 0)
      line += ' ';
    line += argv[i];
  }
  return line;
}

CommandResult runCommand(const std::vector<std::string> &argv) {
  if (argv.empty())
    throw std::system_error(EINVAL, std::generic_category(), "empty command");

  std::vector<char *> args;
  for (const auto &s : argv)
    args.push_back(const_cast<char *>(s.c_str()));
  args.push_back(nullptr);

  Fd outRead, outWrite, errRead, errWrite, execRead, execWrite;
  makePipe(outRead, outWrite);
  makePipe(errRead, errWrite);
  makePipe(execRead, execWrite);

  pid_t pid = ::fork();
  if (pid < 0)
    throw std::system_error(errno, std::generic_category(), "fork");

  if (pid == 0) {
    // Only async-signal-safe calls from here on.
    ::dup2(outWrite.fd, STDOUT_FILENO);
    ::dup2(errWrite.fd, STDERR_FILENO);
    int devNull = ::open("/dev/null", O_RDONLY);
    if (devNull >= 0) {
      ::dup2(devNull, STDIN_FILENO);
      if (devNull != STDIN_FILENO)
        ::close(devNull);
    }
    ::execvp(args[0], args.data());
    int err = errno;
    ssize_t ignored = ::write(execWrite.fd, &err, sizeof(err));
    (void)ignored;
    ::_exit(127);
  }

  outWrite.reset();
  errWrite.reset();
  execWrite.reset();

  // The exec pipe closes on a successful exec (O_CLOEXEC); otherwise the
  // child reports errno through it.
  int execErr = 0;
  ssize_t n;
  do {
    n = ::read(execRead.fd, &execErr, sizeof(execErr));
  } while (n < 0 && errno == EINTR);
  if (n == static_cast<ssize_t>(sizeof(execErr))) {
    waitForChild(pid);
    throw std::system_error(execErr, std::generic_category(),
                            "cannot execute " + argv[0]);
  }

  CommandResult result;
  pollfd fds[2] = {{outRead.fd, POLLIN, 0}, {errRead.fd, POLLIN, 0}};
  std::string *sinks[2] = {&result.stdoutText, &result.stderrText};
  int openStreams = 2;
  char buffer[4096];
  while (openStreams > 0) {
    if (::poll(fds, 2, -1) < 0) {
      if (errno == EINTR)
        continue;
      int err = errno;
      waitForChild(pid);
      throw std::system_error(err, std::generic_category(), "poll");
    }
    for (int i = 0; i < 2; ++i) {
      if (fds[i].fd < 0 || fds[i].revents == 0)
        continue;
      ssize_t got = ::read(fds[i].fd, buffer, sizeof(buffer));
      if (got > 0) {
        sinks[i]->append(buffer, static_cast<size_t>(got));
      } else if (got == 0 || errno != EINTR) {
        // EOF or hard error: stop watching this stream.
        fds[i].fd = -1;
        --openStreams;
      }
    }
  }

  result.exitCode = waitForChild(pid);
  return result;
}

} // namespace nassync
