#include "stabcheck/collect/docker.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace stabcheck::collect {

namespace {

constexpr int EXEC_FAILED_EXIT = 127;

class Pipe {
public:
  Pipe() {
    if (pipe(fds_) != 0) {
      fds_[0] = -1;
      fds_[1] = -1;
    }
  }
  ~Pipe() {
    close_read();
    close_write();
  }
  Pipe(const Pipe &) = delete;
  Pipe &operator=(const Pipe &) = delete;

  [[nodiscard]] bool valid() const { return fds_[0] >= 0 && fds_[1] >= 0; }
  [[nodiscard]] int read_fd() const { return fds_[0]; }
  [[nodiscard]] int write_fd() const { return fds_[1]; }

  void close_read() { close_fd(fds_[0]); }
  void close_write() { close_fd(fds_[1]); }

private:
  static void close_fd(int &fd) {
    if (fd >= 0) {
      close(fd);
      fd = -1;
    }
  }

  int fds_[2] = {-1, -1};
};

void set_non_blocking(const int fd) {
  const int flags = fcntl(fd, F_GETFL, 0);
  if (flags >= 0) {
    (void)fcntl(fd, F_SETFL, flags | O_NONBLOCK);
  }
}

void read_into_buffer(const int fd, std::string &buffer, const std::size_t limit, bool &truncated) {
  std::array<char, 4096> chunk{};
  while (true) {
    const ssize_t bytes = read(fd, chunk.data(), chunk.size());
    if (bytes > 0) {
      const auto count = static_cast<std::size_t>(bytes);
      if (buffer.size() < limit) {
        const std::size_t room = limit - buffer.size();
        buffer.append(chunk.data(), count < room ? count : room);
        truncated = truncated || count > room;
      } else {
        truncated = true;
      }
      continue;
    }
    if (bytes < 0 && errno == EINTR) {
      continue;
    }
    return;
  }
}

std::string join_args(const std::vector<std::string> &args) {
  std::string out;
  for (const auto &arg : args) {
    if (!out.empty()) {
      out.push_back(' ');
    }
    out += arg;
  }
  return out;
}

} // namespace

common::Result<DockerProcessResult>
DockerCliRunner::run(const std::vector<std::string> &args, const DockerCommandOptions &options) {
  if (args.empty()) {
    return common::Result<DockerProcessResult>::failure("docker command is empty");
  }

  Pipe stdout_pipe;
  Pipe stderr_pipe;
  if (!stdout_pipe.valid() || !stderr_pipe.valid()) {
    return common::Result<DockerProcessResult>::failure("failed to create pipes for docker");
  }

  std::vector<char *> argv;
  argv.reserve(args.size() + 2);
  argv.push_back(const_cast<char *>("docker"));
  for (const auto &arg : args) {
    argv.push_back(const_cast<char *>(arg.c_str()));
  }
  argv.push_back(nullptr);

  const pid_t pid = fork();
  if (pid < 0) {
    return common::Result<DockerProcessResult>::failure("failed to fork docker process");
  }

  if (pid == 0) {
    (void)dup2(stdout_pipe.write_fd(), STDOUT_FILENO);
    (void)dup2(stderr_pipe.write_fd(), STDERR_FILENO);
    close(stdout_pipe.read_fd());
    close(stdout_pipe.write_fd());
    close(stderr_pipe.read_fd());
    close(stderr_pipe.write_fd());
    execvp("docker", argv.data());
    _exit(EXEC_FAILED_EXIT);
  }

  stdout_pipe.close_write();
  stderr_pipe.close_write();
  set_non_blocking(stdout_pipe.read_fd());
  set_non_blocking(stderr_pipe.read_fd());

  DockerProcessResult result;
  int status = 0;
  bool timed_out = false;
  const auto started = std::chrono::steady_clock::now();

  while (true) {
    read_into_buffer(stdout_pipe.read_fd(), result.stdout_text, options.max_output_bytes,
                     result.truncated);
    read_into_buffer(stderr_pipe.read_fd(), result.stderr_text, options.max_output_bytes,
                     result.truncated);

    const pid_t waited = waitpid(pid, &status, WNOHANG);
    if (waited == pid) {
      break;
    }

    const auto elapsed = std::chrono::steady_clock::now() - started;
    if (elapsed > options.timeout) {
      timed_out = true;
      (void)kill(pid, SIGKILL);
      (void)waitpid(pid, &status, 0);
      break;
    }

    struct pollfd poll_fds[2] = {
        {.fd = stdout_pipe.read_fd(), .events = POLLIN, .revents = 0},
        {.fd = stderr_pipe.read_fd(), .events = POLLIN, .revents = 0},
    };
    (void)poll(poll_fds, 2, 50);
  }

  read_into_buffer(stdout_pipe.read_fd(), result.stdout_text, options.max_output_bytes,
                   result.truncated);
  read_into_buffer(stderr_pipe.read_fd(), result.stderr_text, options.max_output_bytes,
                   result.truncated);
  result.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;

  if (timed_out) {
    result.exit_code = -1;
    if (!options.allow_failure) {
      return common::Result<DockerProcessResult>::failure("docker command timed out: " +
                                                           join_args(args));
    }
  }

  if (result.exit_code == EXEC_FAILED_EXIT && !options.allow_failure) {
    return common::Result<DockerProcessResult>::failure("docker executable not found");
  }

  if (result.exit_code != 0 && !options.allow_failure) {
    const std::string message = result.stderr_text.empty()
                                    ? "docker command failed: " + join_args(args)
                                    : result.stderr_text;
    return common::Result<DockerProcessResult>::failure(message);
  }

  return common::Result<DockerProcessResult>::success(std::move(result));
}

} // namespace stabcheck::collect
