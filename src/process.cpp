#include "repocheck/process.hpp"

#include "repocheck/consts.hpp"

#include <algorithm>
#include <array>
#include <climits>
#include <cerrno>
#include <csignal>
#include <fcntl.h>
#include <poll.h>
#include <stdexcept>
#include <string_view>
#include <sys/types.h>
#include <sys/wait.h>
#include <system_error>
#include <thread>
#include <unistd.h>

extern char **environ;

namespace {

class UniqueFd {
public:
  UniqueFd() = default;
  explicit UniqueFd(int fd) noexcept : fd_{fd} {}

  UniqueFd(const UniqueFd &) = delete;
  auto operator=(const UniqueFd &) -> UniqueFd & = delete;

  UniqueFd(UniqueFd &&other) noexcept : fd_{other.fd_} { other.fd_ = -1; }
  auto operator=(UniqueFd &&other) noexcept -> UniqueFd & {
    if (this != &other) {
      reset();
      fd_ = other.fd_;
      other.fd_ = -1;
    }
    return *this;
  }

  ~UniqueFd() { reset(); }

  [[nodiscard]] auto valid() const noexcept -> bool { return fd_ != -1; }
  [[nodiscard]] auto get() const noexcept -> int { return fd_; }

  void reset() noexcept {
    if (fd_ != -1) {
      ::close(fd_);
      fd_ = -1;
    }
  }

private:
  int fd_{-1};
};

struct Pipe {
  UniqueFd read;
  UniqueFd write;
};

[[noreturn]] void throw_errno(const char *what) {
  throw std::system_error(errno, std::generic_category(), what);
}

// Every descriptor is close-on-exec so children spawned concurrently from
// other threads never inherit another child's pipe ends.
auto make_pipe() -> Pipe {
  std::array<int, 2> fds{};
  if (::pipe2(fds.data(), O_CLOEXEC) != 0)
    throw_errno("pipe2");
  return Pipe{.read = UniqueFd{fds[0]}, .write = UniqueFd{fds[1]}};
}

// Drain whatever is readable; returns false on EOF.
auto drain(int fd, std::string &sink) -> bool {
  std::array<char, 4096> buf{};
  while (true) {
    const ssize_t n = ::read(fd, buf.data(), buf.size());
    if (n > 0) {
      sink.append(buf.data(), static_cast<std::size_t>(n));
      if (static_cast<std::size_t>(n) < buf.size())
        return true;
      continue;
    }
    if (n == 0)
      return false;
    if (errno == EINTR)
      continue;
    if (errno == EAGAIN || errno == EWOULDBLOCK)
      return true;
    return false;
  }
}

void decode_wait_status(int status, repocheck::ProcessResult &res) {
  if (WIFEXITED(status))
    res.exit_code = WEXITSTATUS(status);
  else if (WIFSIGNALED(status))
    res.term_signal = WTERMSIG(status);
}

auto wait_blocking(pid_t pid) -> int {
  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR)
      throw_errno("waitpid");
  }
  return status;
}

void kill_group(pid_t pid) {
  // best effort; the group may already be gone
  ::kill(-pid, SIGKILL);
  ::kill(pid, SIGKILL);
}

// Inherited environment with `env` applied, in the form execve expects.
auto build_environment(const std::vector<repocheck::EnvOverride> &env) -> std::vector<std::string> {
  std::vector<std::string> out;
  for (char **e = environ; e && *e; ++e) {
    const std::string_view entry{*e};
    const auto name = entry.substr(0, entry.find('='));
    const bool overridden = std::ranges::any_of(
        env, [&](const repocheck::EnvOverride &o) { return o.name == name; });
    if (!overridden)
      out.emplace_back(entry);
  }
  for (const auto &o : env) {
    if (o.value)
      out.push_back(o.name + "=" + *o.value);
  }
  return out;
}

} // namespace

namespace repocheck {

auto run_process(const std::vector<std::string> &argv, std::chrono::milliseconds timeout,
                 const std::vector<EnvOverride> &env) -> ProcessResult {
  if (argv.empty())
    throw std::invalid_argument("run_process: empty argv");

  using clock = std::chrono::steady_clock;
  const auto deadline = clock::now() + std::clamp(timeout, std::chrono::milliseconds::zero(),
                                                  std::chrono::milliseconds{consts::kMaxTimeout});

  // Everything the child touches is prepared before fork.
  std::vector<char *> cargv;
  cargv.reserve(argv.size() + 1);
  for (const auto &a : argv)
    cargv.push_back(const_cast<char *>(a.c_str()));
  cargv.push_back(nullptr);

  const std::vector<std::string> environment = build_environment(env);
  std::vector<char *> cenv;
  cenv.reserve(environment.size() + 1);
  for (const auto &e : environment)
    cenv.push_back(const_cast<char *>(e.c_str()));
  cenv.push_back(nullptr);

  UniqueFd devnull{::open("/dev/null", O_RDONLY | O_CLOEXEC)};
  if (!devnull.valid())
    throw_errno("open /dev/null");
  Pipe out = make_pipe();
  Pipe err = make_pipe();
  Pipe exec_status = make_pipe();

  const pid_t pid = ::fork();
  if (pid < 0)
    throw_errno("fork");

  if (pid == 0) {
    ::setpgid(0, 0);
    if (::dup2(devnull.get(), STDIN_FILENO) < 0 || ::dup2(out.write.get(), STDOUT_FILENO) < 0 ||
        ::dup2(err.write.get(), STDERR_FILENO) < 0) {
      const int e = errno;
      (void)!::write(exec_status.write.get(), &e, sizeof(e));
      ::_exit(127);
    }
    ::execvpe(cargv[0], cargv.data(), cenv.data());
    const int e = errno;
    (void)!::write(exec_status.write.get(), &e, sizeof(e));
    ::_exit(127);
  }

  ::setpgid(pid, pid); // also done in the child; whichever runs first wins
  out.write.reset();
  err.write.reset();
  exec_status.write.reset();

  ProcessResult res;

  // The status pipe closes on a successful exec, or carries errno.
  int child_errno = 0;
  ssize_t got = 0;
  do {
    got = ::read(exec_status.read.get(), &child_errno, sizeof(child_errno));
  } while (got < 0 && errno == EINTR);
  if (got == static_cast<ssize_t>(sizeof(child_errno))) {
    decode_wait_status(wait_blocking(pid), res);
    res.exec_failed = true;
    res.exec_errno = child_errno;
    return res;
  }

  ::fcntl(out.read.get(), F_SETFL, O_NONBLOCK);
  ::fcntl(err.read.get(), F_SETFL, O_NONBLOCK);

  bool out_open = true;
  bool err_open = true;
  while (out_open || err_open) {
    const auto now = clock::now();
    if (now >= deadline) {
      kill_group(pid);
      decode_wait_status(wait_blocking(pid), res);
      res.timed_out = true;
      return res;
    }
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    std::array<pollfd, 2> pfds{};
    pfds[0] = pollfd{.fd = out_open ? out.read.get() : -1, .events = POLLIN, .revents = 0};
    pfds[1] = pollfd{.fd = err_open ? err.read.get() : -1, .events = POLLIN, .revents = 0};
    const auto wait_ms = std::min<long long>(left.count() + 1, INT_MAX);
    const int rc = ::poll(pfds.data(), pfds.size(), static_cast<int>(wait_ms));
    if (rc < 0) {
      if (errno == EINTR)
        continue;
      kill_group(pid);
      wait_blocking(pid);
      throw_errno("poll");
    }
    if (out_open && (pfds[0].revents & (POLLIN | POLLHUP | POLLERR)))
      out_open = drain(out.read.get(), res.out);
    if (err_open && (pfds[1].revents & (POLLIN | POLLHUP | POLLERR)))
      err_open = drain(err.read.get(), res.err);
  }

  // Output is closed; the child should be exiting. Still honor the deadline.
  while (true) {
    int status = 0;
    const pid_t w = ::waitpid(pid, &status, WNOHANG);
    if (w == pid) {
      decode_wait_status(status, res);
      return res;
    }
    if (w < 0 && errno != EINTR)
      throw_errno("waitpid");
    if (clock::now() >= deadline) {
      kill_group(pid);
      decode_wait_status(wait_blocking(pid), res);
      res.timed_out = true;
      return res;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
}

} // namespace repocheck
