#include "gitrelay/subprocess.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <stdexcept>

#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char **environ;

namespace gitrelay::proc {

namespace {

// Closes the descriptor on scope exit.
class Fd {
public:
  Fd() = default;
  explicit Fd(int fd) : fd_(fd) {}
  ~Fd() { reset(); }
  Fd(const Fd&) = delete;
  Fd& operator=(const Fd&) = delete;

  [[nodiscard]] int get() const { return fd_; }
  void reset(int fd = -1) {
    if (fd_ >= 0) {
      ::close(fd_);
    }
    fd_ = fd;
  }

private:
  int fd_ = -1;
};

struct Pipe {
  Fd read;
  Fd write;
};

// O_CLOEXEC so concurrent children never inherit each other's pipe ends.
void open_pipe(Pipe &p) {
  std::array<int, 2> fds{};
  if (::pipe2(fds.data(), O_CLOEXEC) != 0) {
    throw std::runtime_error(std::string("pipe failed: ") + std::strerror(errno));
  }
  p.read.reset(fds[0]);
  p.write.reset(fds[1]);
}

bool drain(int fd, std::vector<std::uint8_t> &sink) {
  std::array<std::uint8_t, 8192> buf{};
  const ssize_t n = ::read(fd, buf.data(), buf.size());
  if (n > 0) {
    sink.insert(sink.end(), buf.begin(), buf.begin() + n);
    return true;
  }
  if (n < 0 && (errno == EINTR || errno == EAGAIN)) {
    return true;
  }
  return false; // EOF or hard error
}

} // namespace

Result run(const std::vector<std::string> &argv, std::span<const std::uint8_t> input) {
  if (argv.empty()) {
    throw std::runtime_error("command cannot be empty");
  }
  std::vector<char *> cargv;
  cargv.reserve(argv.size() + 1);
  for (const auto &a : argv) {
    cargv.push_back(const_cast<char *>(a.c_str()));
  }
  cargv.push_back(nullptr);

  Pipe in;
  Pipe out;
  Pipe err;
  open_pipe(in);
  open_pipe(out);
  open_pipe(err);

  // posix_spawnp rather than fork + exec: callers are multi-threaded.
  // The pipe ends carry O_CLOEXEC; dup2 clears it on the child's copies.
  posix_spawn_file_actions_t actions;
  if (const int rc = ::posix_spawn_file_actions_init(&actions); rc != 0) {
    throw std::runtime_error(std::string("posix_spawn_file_actions_init: ") + std::strerror(rc));
  }
  int rc = ::posix_spawn_file_actions_adddup2(&actions, in.read.get(), STDIN_FILENO);
  if (rc == 0) {
    rc = ::posix_spawn_file_actions_adddup2(&actions, out.write.get(), STDOUT_FILENO);
  }
  if (rc == 0) {
    rc = ::posix_spawn_file_actions_adddup2(&actions, err.write.get(), STDERR_FILENO);
  }
  pid_t pid = -1;
  if (rc == 0) {
    rc = ::posix_spawnp(&pid, cargv[0], &actions, nullptr, cargv.data(), environ);
  }
  ::posix_spawn_file_actions_destroy(&actions);
  if (rc != 0) {
    throw std::runtime_error("failed to execute '" + argv[0] + "': " + std::strerror(rc));
  }

  in.read.reset();
  out.write.reset();
  err.write.reset();

  if (input.empty()) {
    in.write.reset();
  } else {
    ::fcntl(in.write.get(), F_SETFL, ::fcntl(in.write.get(), F_GETFL) | O_NONBLOCK);
  }

  Result result;
  std::vector<std::uint8_t> err_bytes;
  std::size_t written = 0;
  bool out_open = true;
  bool err_open = true;

  while (out_open || err_open || in.write.get() >= 0) {
    std::array<pollfd, 3> fds{};
    nfds_t count = 0;
    int out_idx = -1;
    int err_idx = -1;
    int in_idx = -1;
    if (out_open) {
      out_idx = static_cast<int>(count);
      fds[count++] = pollfd{out.read.get(), POLLIN, 0};
    }
    if (err_open) {
      err_idx = static_cast<int>(count);
      fds[count++] = pollfd{err.read.get(), POLLIN, 0};
    }
    if (in.write.get() >= 0) {
      in_idx = static_cast<int>(count);
      fds[count++] = pollfd{in.write.get(), POLLOUT, 0};
    }

    if (::poll(fds.data(), count, -1) < 0) {
      if (errno == EINTR) {
        continue;
      }
      break;
    }

    if (out_idx >= 0 && (fds[out_idx].revents & (POLLIN | POLLHUP | POLLERR)) != 0) {
      out_open = drain(out.read.get(), result.out);
    }
    if (err_idx >= 0 && (fds[err_idx].revents & (POLLIN | POLLHUP | POLLERR)) != 0) {
      err_open = drain(err.read.get(), err_bytes);
    }
    if (in_idx >= 0 && fds[in_idx].revents != 0) {
      if ((fds[in_idx].revents & POLLOUT) != 0) {
        const ssize_t n = ::write(in.write.get(), input.data() + written, input.size() - written);
        if (n > 0) {
          written += static_cast<std::size_t>(n);
        } else if (n < 0 && errno != EAGAIN && errno != EINTR) {
          in.write.reset(); // child stopped reading (EPIPE)
        }
      } else {
        in.write.reset();
      }
      if (written == input.size()) {
        in.write.reset();
      }
    }
  }

  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      throw std::runtime_error("waitpid failed for '" + argv[0] + "': " + std::strerror(errno));
    }
  }
  if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.exit_code = 128 + WTERMSIG(status);
  } else {
    result.exit_code = -1;
  }
  result.err.assign(err_bytes.begin(), err_bytes.end());
  // libcs that exec after reporting success signal a failed exec with 127
  if (result.exit_code == 127 && result.out.empty() && result.err.empty()) {
    throw std::runtime_error("failed to execute '" + argv[0] + "'");
  }
  return result;
}

} // namespace gitrelay::proc
