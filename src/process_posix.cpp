#if defined(_WIN32)
#error "process_posix.cpp should not be compiled on Windows builds"
#else

#include "process.h"

#include "platform.h"

#include <array>
#include <chrono>
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char **environ;

namespace rtpack {
namespace {

constexpr int kChildErrorExit{ 127 };
constexpr int kSignalExitBase{ 128 };
constexpr int kPostKillPollMs{ 50 };
constexpr std::chrono::milliseconds kPostKillDrain{ 1000 };

class fd_cleanup {
 public:
  explicit fd_cleanup(int fd) : fd_{ fd } {}
  ~fd_cleanup() {
    if (fd_ == -1) { return; }
    close_with_retry();
  }

  fd_cleanup(fd_cleanup const &) = delete;
  fd_cleanup &operator=(fd_cleanup const &) = delete;
  fd_cleanup(fd_cleanup &&other) noexcept : fd_{ other.fd_ } { other.fd_ = -1; }

  fd_cleanup &operator=(fd_cleanup &&other) noexcept {
    if (this == &other) { return *this; }
    if (fd_ != -1) { close_with_retry(); }
    fd_ = other.fd_;
    other.fd_ = -1;
    return *this;
  }

  int get() const { return fd_; }

  void release() {
    if (fd_ == -1) { return; }
    close_with_retry();
    fd_ = -1;
  }

 private:
  void close_with_retry() {
    for (int attempts{ 0 }; attempts < 3 && ::close(fd_) == -1; ++attempts) {
      if (errno != EINTR) { break; }
    }
  }

  int fd_{ -1 };
};

struct pipe_state {
  fd_cleanup read_fd;
  std::string pending;
  bool closed;
};

void emit_line(process_run_cfg const &cfg, std::string_view line) {
  if (!line.empty() && line.back() == '\r') { line.remove_suffix(1); }
  if (cfg.on_output_line) { cfg.on_output_line(line); }
}

struct stream_outcome {
  bool killed{ false };
  std::optional<int> reaped_status;  // set when the killed child was reaped here
};

// Drains both pipes until they close. Once the deadline kills the child, polling
// continues in short slices and stops as soon as the child is reaped, even if a
// grandchild still holds the pipes open.
stream_outcome stream_pipes(std::array<pipe_state, 2> &pipes,
                            process_run_cfg const &cfg,
                            pid_t child) {
  std::array<pollfd, 2> poll_fds{};
  std::string chunk(4096, '\0');
  size_t closed_count{ 0 };
  stream_outcome outcome;

  std::optional<std::chrono::steady_clock::time_point> deadline;
  if (cfg.timeout) { deadline = std::chrono::steady_clock::now() + *cfg.timeout; }

  for (size_t i{ 0 }; i < pipes.size(); ++i) {
    poll_fds[i].fd = pipes[i].closed ? -1 : pipes[i].read_fd.get();
    poll_fds[i].events = pipes[i].closed ? 0 : POLLIN;
    poll_fds[i].revents = 0;
  }

  while (closed_count < pipes.size()) {
    int wait_ms{ -1 };
    if (deadline && !outcome.killed) {
      auto const remaining{ std::chrono::duration_cast<std::chrono::milliseconds>(
          *deadline - std::chrono::steady_clock::now()) };
      if (remaining.count() <= 0) {
        ::kill(child, SIGKILL);
        outcome.killed = true;
        deadline = std::chrono::steady_clock::now() + kPostKillDrain;
      } else {
        wait_ms = static_cast<int>(remaining.count());
      }
    }
    if (outcome.killed) { wait_ms = kPostKillPollMs; }

    int const poll_result{ ::poll(poll_fds.data(), poll_fds.size(), wait_ms) };
    if (poll_result == -1) {
      if (errno == EINTR) { continue; }
      throw std::system_error(errno, std::generic_category(), "poll failed");
    }

    if (outcome.killed && !outcome.reaped_status) {
      int status{ 0 };
      if (::waitpid(child, &status, WNOHANG) == child) { outcome.reaped_status = status; }
    }
    if (outcome.reaped_status &&
        (poll_result == 0 || std::chrono::steady_clock::now() >= *deadline)) {
      break;  // orphaned pipe holders are abandoned
    }
    if (poll_result == 0) { continue; }  // deadline check at loop head

    for (size_t i{ 0 }; i < pipes.size(); ++i) {
      if (pipes[i].closed) { continue; }

      short const revents{ poll_fds[i].revents };
      if (revents == 0) { continue; }
      if (revents & (POLLERR | POLLNVAL)) {
        throw std::runtime_error("poll failed on child pipe");
      }

      ssize_t const read_bytes{
        ::read(pipes[i].read_fd.get(), chunk.data(), chunk.size())
      };

      if (read_bytes == -1) {
        if (errno == EINTR) { continue; }
        throw std::system_error(errno, std::generic_category(), "read failed");
      }

      if (read_bytes == 0) {
        if (!pipes[i].pending.empty()) {
          emit_line(cfg, pipes[i].pending);
          pipes[i].pending.clear();
        }

        pipes[i].closed = true;
        ++closed_count;

        poll_fds[i].fd = -1;
        poll_fds[i].events = 0;
        poll_fds[i].revents = 0;
        continue;
      }

      pipes[i].pending.append(chunk.data(), static_cast<size_t>(read_bytes));

      size_t newline{ 0 };
      while ((newline = pipes[i].pending.find('\n')) != std::string::npos) {
        emit_line(cfg, std::string_view{ pipes[i].pending }.substr(0, newline));
        pipes[i].pending.erase(0, newline + 1);
      }
    }
  }

  for (auto &pipe : pipes) {
    if (!pipe.closed && !pipe.pending.empty()) {
      emit_line(cfg, pipe.pending);
      pipe.pending.clear();
    }
  }

  return outcome;
}

process_result decode_wait_status(int status) {
  if (WIFEXITED(status)) {
    return { .exit_code = WEXITSTATUS(status), .signal = std::nullopt };
  }

  if (WIFSIGNALED(status)) {
    int const sig{ WTERMSIG(status) };
    return { .exit_code = kSignalExitBase + sig, .signal = sig };
  }

  return { .exit_code = status, .signal = std::nullopt };
}

process_result wait_for_child(pid_t child) {
  int status{ 0 };
  while (true) {
    pid_t const result = ::waitpid(child, &status, 0);
    if (result == -1 && errno == EINTR) { continue; }
    if (result == -1) {
      throw std::system_error(errno, std::generic_category(), "waitpid failed");
    }
    break;
  }
  return decode_wait_status(status);
}

[[noreturn]] void exec_child_process(fd_cleanup &stdout_read,
                                     fd_cleanup &stdout_write,
                                     fd_cleanup &stderr_read,
                                     fd_cleanup &stderr_write,
                                     std::optional<std::filesystem::path> const &cwd,
                                     std::string const &executable,
                                     std::vector<char *> const &argv) {
  stdout_read.release();
  stderr_read.release();

  int const null_fd{ ::open("/dev/null", O_RDONLY) };
  if (null_fd == -1) {
    std::perror("open /dev/null");
    _exit(kChildErrorExit);
  }

  std::array<std::pair<int, int>, 3> const fd_mappings{
    std::pair{ null_fd, STDIN_FILENO },
    std::pair{ stdout_write.get(), STDOUT_FILENO },
    std::pair{ stderr_write.get(), STDERR_FILENO },
  };

  for (auto const &[src, dst] : fd_mappings) {
    if (::dup2(src, dst) == -1) {
      std::perror("dup2");
      _exit(kChildErrorExit);
    }
  }

  if (null_fd != STDIN_FILENO) { ::close(null_fd); }
  stdout_write.release();
  stderr_write.release();

  if (cwd) {
    if (::chdir(cwd->c_str()) == -1) {
      std::perror("chdir");
      _exit(kChildErrorExit);
    }
  }

  ::execve(executable.c_str(), argv.data(), environ);
  std::perror("execve");
  _exit(kChildErrorExit);
}

}  // namespace

process_result process_run(std::vector<std::string> const &argv,
                           process_run_cfg const &cfg) {
  if (argv.empty() || argv[0].empty()) {
    throw std::invalid_argument("process_run: argv must be non-empty");
  }

  auto const executable{ platform::find_on_path(argv[0]) };
  if (!executable) {
    throw std::runtime_error("process_run: executable not found: " + argv[0]);
  }
  std::string const executable_str{ executable->string() };

  std::vector<char *> argv_ptrs;
  argv_ptrs.reserve(argv.size() + 1);
  for (auto const &arg : argv) { argv_ptrs.push_back(const_cast<char *>(arg.c_str())); }
  argv_ptrs.push_back(nullptr);

  int stdout_pipefd[2];
  if (::pipe(stdout_pipefd) == -1) {
    throw std::system_error(errno, std::generic_category(), "pipe failed");
  }
  fd_cleanup stdout_read_end{ stdout_pipefd[0] };
  fd_cleanup stdout_write_end{ stdout_pipefd[1] };

  int stderr_pipefd[2];
  if (::pipe(stderr_pipefd) == -1) {
    throw std::system_error(errno, std::generic_category(), "pipe failed");
  }
  fd_cleanup stderr_read_end{ stderr_pipefd[0] };
  fd_cleanup stderr_write_end{ stderr_pipefd[1] };

  pid_t const child{ ::fork() };
  if (child == -1) {
    throw std::system_error(errno, std::generic_category(), "fork failed");
  }

  if (child == 0) {  // child process exits in exec_child_process
    exec_child_process(stdout_read_end,
                       stdout_write_end,
                       stderr_read_end,
                       stderr_write_end,
                       cfg.cwd,
                       executable_str,
                       argv_ptrs);
  }

  stdout_write_end.release();  // Parent: close write ends and stream output
  stderr_write_end.release();

  process_result result{};
  try {
    std::array<pipe_state, 2> pipes{
      pipe_state{ std::move(stdout_read_end), {}, false },
      pipe_state{ std::move(stderr_read_end), {}, false },
    };

    auto const streamed{ stream_pipes(pipes, cfg, child) };
    result = streamed.reaped_status ? decode_wait_status(*streamed.reaped_status)
                                    : wait_for_child(child);
    result.timed_out = streamed.killed;
  } catch (...) {
    ::kill(child, SIGKILL);
    wait_for_child(child);
    throw;
  }

  return result;
}

}  // namespace rtpack

#endif  // POSIX implementation
