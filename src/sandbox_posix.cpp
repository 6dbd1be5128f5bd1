#ifndef _WIN32

#include "shapeforge/sandbox.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>

#include "shapeforge/config.hpp"
#include "shapeforge/log.hpp"
#include "shapeforge/types.hpp"

extern char **environ;

namespace shapeforge {

namespace {

using Clock = std::chrono::steady_clock;

class Pipe {
public:
  Pipe() {
    if (pipe(fds_) != 0)
      throw Error(ErrorCode::spawn_failed,
                  std::string("pipe: ") + std::strerror(errno));
  }
  Pipe(const Pipe &) = delete;
  Pipe &operator=(const Pipe &) = delete;
  ~Pipe() {
    close_read();
    close_write();
  }

  int read_fd() const { return fds_[0]; }
  int write_fd() const { return fds_[1]; }
  void close_read() { close_fd(fds_[0]); }
  void close_write() { close_fd(fds_[1]); }

private:
  static void close_fd(int &fd) {
    if (fd >= 0)
      close(fd);
    fd = -1;
  }
  int fds_[2]{-1, -1};
};

// NUL-terminated views over owned strings, built before fork so the child
// only calls async-signal-safe functions.
struct CStringArray {
  std::vector<std::string> storage;
  std::vector<char *> ptrs;

  void seal() {
    ptrs.clear();
    ptrs.reserve(storage.size() + 1);
    for (auto &s : storage)
      ptrs.push_back(s.data());
    ptrs.push_back(nullptr);
  }
};

CStringArray child_argv(const ProcessSpec &spec) {
  CStringArray out;
  out.storage.push_back(spec.command);
  out.storage.insert(out.storage.end(), spec.argv.begin(), spec.argv.end());
  out.seal();
  return out;
}

CStringArray child_env(const ProcessSpec &spec) {
  std::map<std::string, std::string> merged;
  if (spec.inherit_env) {
    for (char **e = environ; e && *e; ++e) {
      const char *eq = std::strchr(*e, '=');
      if (eq)
        merged[std::string(*e, static_cast<std::size_t>(eq - *e))] = eq + 1;
    }
  }
  for (const auto &[k, v] : spec.env)
    merged[k] = v;
  CStringArray out;
  for (const auto &[k, v] : merged)
    out.storage.push_back(k + "=" + v);
  out.seal();
  return out;
}

class OutputSink {
public:
  OutputSink(std::string &dst, std::size_t limit, bool &truncated)
      : dst_(dst), limit_(limit), truncated_(truncated) {}

  // Returns false once the read end reports EOF or an error.
  bool pump(int fd) {
    char buf[4096];
    const ssize_t n = read(fd, buf, sizeof(buf));
    if (n > 0) {
      append(buf, static_cast<std::size_t>(n));
      return true;
    }
    return n < 0 && (errno == EAGAIN || errno == EINTR);
  }

private:
  void append(const char *src, std::size_t n) {
    if (limit_ == 0) {
      dst_.append(src, n);
      return;
    }
    const std::size_t room = dst_.size() < limit_ ? limit_ - dst_.size() : 0;
    dst_.append(src, std::min(n, room));
    if (n > room)
      truncated_ = true;
  }

  std::string &dst_;
  std::size_t limit_;
  bool &truncated_;
};

[[noreturn]] void exec_child(const ProcessSpec &spec, Pipe &out,
                             CStringArray &argv, CStringArray &envp) {
  setsid();
  dup2(out.write_fd(), STDOUT_FILENO);
  dup2(out.write_fd(), STDERR_FILENO);
  out.close_read();
  out.close_write();
  if (!spec.cwd.empty() && chdir(spec.cwd.c_str()) != 0)
    _exit(127);
  execve(spec.command.c_str(), argv.ptrs.data(), envp.ptrs.data());
  _exit(127);
}

int decode_status(int status) {
  if (WIFEXITED(status))
    return WEXITSTATUS(status);
  if (WIFSIGNALED(status))
    return 128 + WTERMSIG(status);
  return -1;
}

} // namespace

ProcessResult run_process(const ProcessSpec &spec) {
  ProcessResult result;
  const auto started = Clock::now();

  Pipe out;
  CStringArray argv = child_argv(spec);
  CStringArray envp = child_env(spec);

  const pid_t pid = fork();
  if (pid < 0)
    throw Error(ErrorCode::spawn_failed,
                std::string("fork: ") + std::strerror(errno));
  if (pid == 0)
    exec_child(spec, out, argv, envp);

  out.close_write();
  fcntl(out.read_fd(), F_SETFL, O_NONBLOCK);
  OutputSink sink(result.output, spec.max_output_bytes,
                  result.output_truncated);

  const bool bounded = spec.timeout_ms > 0;
  const auto deadline = started + std::chrono::milliseconds(spec.timeout_ms);
  bool open = true;
  int status = 0;
  while (true) {
    int wait_ms = 50;
    if (bounded) {
      const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
          deadline - Clock::now());
      wait_ms = static_cast<int>(std::clamp<long long>(left.count(), 0, 50));
    }
    if (open) {
      pollfd pfd{out.read_fd(), POLLIN, 0};
      if (poll(&pfd, 1, wait_ms) > 0)
        open = sink.pump(out.read_fd());
    } else {
      poll(nullptr, 0, wait_ms);
    }

    if (waitpid(pid, &status, WNOHANG) == pid)
      break;
    if (bounded && Clock::now() >= deadline) {
      kill(-pid, SIGKILL);
      kill(pid, SIGKILL);
      waitpid(pid, &status, 0);
      result.timed_out = true;
      break;
    }
  }

  // Whatever is still buffered in the pipe after the child is gone.
  while (open && sink.pump(out.read_fd())) {
    pollfd pfd{out.read_fd(), POLLIN, 0};
    if (poll(&pfd, 1, 0) <= 0)
      break;
  }

  if (result.output_truncated)
    result.output += "(truncated)";
  result.exit_code = result.timed_out ? 124 : decode_status(status);
  result.duration_ns = static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(Clock::now() -
                                                           started)
          .count());
  return result;
}

ProcessResult run_shell_command(const std::string &command,
                                const std::string &cwd) {
  ProcessSpec spec;
  spec.command = "/bin/sh";
  spec.argv = {"-c", command};
  spec.cwd = cwd;
  spec.timeout_ms = global_harness_config().timeout_ms;
  log_debug("sandbox", "running `" + command + "` in " + cwd);
  ProcessResult result = run_process(spec);
  if (result.timed_out)
    log_warn("sandbox", "`" + command + "` timed out after " +
                            std::to_string(spec.timeout_ms) + "ms");
  return result;
}

} // namespace shapeforge

#endif
