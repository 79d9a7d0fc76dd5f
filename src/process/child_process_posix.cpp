#include "codexbridge/process/child_process.hpp"

#include "codexbridge/observability/global.hpp"

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <mutex>
#include <sys/types.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

extern char **environ;

namespace codexbridge::process {

namespace {

constexpr auto REAP_POLL = std::chrono::milliseconds(10);
constexpr auto DESTRUCTOR_GRACE = std::chrono::milliseconds(500);

void close_fd(int &fd) {
  if (fd >= 0) {
    close(fd);
    fd = -1;
  }
}

bool make_pipe(int fds[2]) {
  if (pipe(fds) != 0) {
    return false;
  }
  (void)fcntl(fds[0], F_SETFD, FD_CLOEXEC);
  (void)fcntl(fds[1], F_SETFD, FD_CLOEXEC);
  return true;
}

std::optional<std::string> resolve_executable(const std::string &name) {
  if (name.find('/') != std::string::npos) {
    return access(name.c_str(), X_OK) == 0 ? std::optional<std::string>(name) : std::nullopt;
  }
  const char *path_env = std::getenv("PATH");
  const std::string search = path_env != nullptr ? path_env : "/usr/local/bin:/usr/bin:/bin";
  std::size_t start = 0;
  while (start <= search.size()) {
    const auto end = search.find(':', start);
    std::string dir = search.substr(start, end == std::string::npos ? std::string::npos : end - start);
    if (dir.empty()) {
      dir = ".";
    }
    const std::string candidate = dir + "/" + name;
    if (access(candidate.c_str(), X_OK) == 0) {
      return candidate;
    }
    if (end == std::string::npos) {
      break;
    }
    start = end + 1;
  }
  return std::nullopt;
}

std::vector<std::string> build_environment(const SpawnOptions &options) {
  std::vector<std::string> env;
  for (char **entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
    const std::string value(*entry);
    const auto eq = value.find('=');
    const std::string key = value.substr(0, eq);
    bool overridden = false;
    for (const auto &[override_key, override_value] : options.environment) {
      (void)override_value;
      if (override_key == key) {
        overridden = true;
        break;
      }
    }
    if (!overridden) {
      env.push_back(value);
    }
  }
  for (const auto &[key, value] : options.environment) {
    env.push_back(key + "=" + value);
  }
  return env;
}

std::vector<char *> as_c_array(std::vector<std::string> &values) {
  std::vector<char *> out;
  out.reserve(values.size() + 1);
  for (auto &value : values) {
    out.push_back(value.data());
  }
  out.push_back(nullptr);
  return out;
}

void ignore_sigpipe_once() {
  static std::once_flag flag;
  std::call_once(flag, [] { std::signal(SIGPIPE, SIG_IGN); });
}

} // namespace

struct ChildProcess::Impl {
  pid_t pid = -1;
  int stdin_fd = -1;
  std::unique_ptr<FdLineChannel> out;
  std::unique_ptr<FdLineChannel> err;

  std::mutex mutex;
  std::optional<int> exit_code;
  bool terminate_requested = false;
  bool group_cleaned = false;

  void record_status(const int status) {
    if (WIFEXITED(status)) {
      exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
      exit_code = -WTERMSIG(status);
    } else {
      exit_code = -1;
    }
  }

  bool try_reap() {
    if (exit_code.has_value()) {
      return true;
    }
    int status = 0;
    const pid_t done = waitpid(pid, &status, WNOHANG);
    if (done == pid) {
      record_status(status);
      return true;
    }
    if (done < 0 && errno == ECHILD) {
      exit_code = -1;
      return true;
    }
    return false;
  }

  bool reap_within(const std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!try_reap()) {
      if (std::chrono::steady_clock::now() >= deadline) {
        return false;
      }
      std::this_thread::sleep_for(REAP_POLL);
    }
    return true;
  }
};

common::Result<std::unique_ptr<ChildProcess>> ChildProcess::spawn(const SpawnOptions &options) {
  using R = common::Result<std::unique_ptr<ChildProcess>>;
  if (options.argv.empty()) {
    return R::failure("empty command line");
  }
  ignore_sigpipe_once();

  const auto executable = resolve_executable(options.argv.front());
  if (!executable.has_value()) {
    return R::failure("executable not found: " + options.argv.front());
  }

  std::vector<std::string> argv_storage = options.argv;
  std::vector<char *> argv = as_c_array(argv_storage);
  std::vector<std::string> env_storage = build_environment(options);
  std::vector<char *> envp = as_c_array(env_storage);

  int in_pipe[2] = {-1, -1};
  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  int exec_pipe[2] = {-1, -1};
  const auto close_all = [&] {
    for (int *fds : {in_pipe, out_pipe, err_pipe, exec_pipe}) {
      close_fd(fds[0]);
      close_fd(fds[1]);
    }
  };
  if (!make_pipe(in_pipe) || !make_pipe(out_pipe) || !make_pipe(err_pipe) ||
      !make_pipe(exec_pipe)) {
    close_all();
    return R::failure(std::string("failed to create pipes: ") + std::strerror(errno));
  }

  const pid_t pid = fork();
  if (pid < 0) {
    const int saved = errno;
    close_all();
    return R::failure(std::string("failed to fork: ") + std::strerror(saved));
  }

  if (pid == 0) {
    // Only async-signal-safe calls from here on.
    (void)setsid();
    dup2(in_pipe[0], STDIN_FILENO);
    dup2(out_pipe[1], STDOUT_FILENO);
    dup2(err_pipe[1], STDERR_FILENO);
    if (!options.working_directory.empty() && chdir(options.working_directory.c_str()) != 0) {
      const int code = errno;
      (void)!write(exec_pipe[1], &code, sizeof(code));
      _exit(127);
    }
    execve(executable->c_str(), argv.data(), envp.data());
    const int code = errno;
    (void)!write(exec_pipe[1], &code, sizeof(code));
    _exit(127);
  }

  close_fd(in_pipe[0]);
  close_fd(out_pipe[1]);
  close_fd(err_pipe[1]);
  close_fd(exec_pipe[1]);

  int child_errno = 0;
  ssize_t got = 0;
  do {
    got = read(exec_pipe[0], &child_errno, sizeof(child_errno));
  } while (got < 0 && errno == EINTR);
  close_fd(exec_pipe[0]);
  if (got == static_cast<ssize_t>(sizeof(child_errno))) {
    int status = 0;
    (void)waitpid(pid, &status, 0);
    close_all();
    return R::failure("failed to start " + options.argv.front() + " in '" +
                      options.working_directory + "': " + std::strerror(child_errno));
  }

  auto impl = std::make_unique<Impl>();
  impl->pid = pid;
  impl->stdin_fd = in_pipe[1];
  impl->out = std::make_unique<FdLineChannel>(out_pipe[0]);
  impl->err = std::make_unique<FdLineChannel>(err_pipe[0]);
  return R::success(std::make_unique<ChildProcess>(Token{}, std::move(impl)));
}

ChildProcess::ChildProcess(Token, std::unique_ptr<Impl> impl) : impl_(std::move(impl)) {}

ChildProcess::~ChildProcess() {
  close_input();
  terminate_tree(DESTRUCTOR_GRACE);
}

common::Status ChildProcess::write_input(const std::string &payload) {
  if (impl_->stdin_fd < 0) {
    return common::Status::error("stdin already closed");
  }
  std::size_t written = 0;
  while (written < payload.size()) {
    const ssize_t n =
        write(impl_->stdin_fd, payload.data() + written, payload.size() - written);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      if (errno == EPIPE) {
        observability::log_debug("process", "child closed stdin before reading all input");
        break;
      }
      const int saved = errno;
      close_input();
      return common::Status::error(std::string("failed to write prompt: ") + std::strerror(saved));
    }
    written += static_cast<std::size_t>(n);
  }
  close_input();
  return common::Status::success();
}

void ChildProcess::close_input() { close_fd(impl_->stdin_fd); }

LineChannel &ChildProcess::stdout_channel() { return *impl_->out; }

LineChannel &ChildProcess::stderr_channel() { return *impl_->err; }

std::int64_t ChildProcess::pid() const { return impl_->pid; }

std::optional<int> ChildProcess::wait_for_exit(const std::chrono::milliseconds timeout) {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  (void)impl_->reap_within(timeout);
  return impl_->exit_code;
}

std::optional<int> ChildProcess::exit_code() const {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  return impl_->exit_code;
}

void ChildProcess::terminate_tree(const std::chrono::milliseconds grace) {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  if (impl_->pid <= 0 || impl_->group_cleaned) {
    return;
  }
  impl_->group_cleaned = true;

  if (impl_->try_reap()) {
    // Leader is gone; clear out anything it left behind in its group.
    if (kill(-impl_->pid, 0) == 0) {
      (void)kill(-impl_->pid, SIGKILL);
    }
    return;
  }

  impl_->terminate_requested = true;
  (void)kill(-impl_->pid, SIGTERM);
  bool forced = false;
  if (!impl_->reap_within(grace)) {
    forced = true;
    (void)kill(-impl_->pid, SIGKILL);
    int status = 0;
    pid_t done = 0;
    do {
      done = waitpid(impl_->pid, &status, 0);
    } while (done < 0 && errno == EINTR);
    if (done == impl_->pid) {
      impl_->record_status(status);
    } else {
      impl_->exit_code = -SIGKILL;
    }
  } else {
    (void)kill(-impl_->pid, SIGKILL);
  }
  observability::record_process_terminated(impl_->pid, forced);
}

bool ChildProcess::terminated_by_us() const {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  return impl_->terminate_requested;
}

} // namespace codexbridge::process
