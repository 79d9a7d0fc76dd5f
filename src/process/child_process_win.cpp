#include "codexbridge/process/child_process.hpp"

#include "codexbridge/observability/global.hpp"

#include <mutex>
#include <thread>

namespace codexbridge::process {

namespace {

constexpr auto DESTRUCTOR_GRACE = std::chrono::milliseconds(500);
constexpr DWORD TERMINATED_EXIT_CODE = 1;

void close_handle(HANDLE &handle) {
  if (handle != nullptr && handle != INVALID_HANDLE_VALUE) {
    CloseHandle(handle);
  }
  handle = nullptr;
}

std::wstring widen(const std::string &value) {
  if (value.empty()) {
    return {};
  }
  const int size = MultiByteToWideChar(CP_UTF8, 0, value.data(), static_cast<int>(value.size()),
                                       nullptr, 0);
  std::wstring out(static_cast<std::size_t>(size), L'\0');
  MultiByteToWideChar(CP_UTF8, 0, value.data(), static_cast<int>(value.size()), out.data(), size);
  return out;
}

std::string last_error_message() { return "Win32 error " + std::to_string(GetLastError()); }

// CommandLineToArgvW-compatible quoting.
std::wstring quote_argument(const std::wstring &arg) {
  if (!arg.empty() && arg.find_first_of(L" \t\n\v\"") == std::wstring::npos) {
    return arg;
  }
  std::wstring out = L"\"";
  std::size_t backslashes = 0;
  for (const wchar_t ch : arg) {
    if (ch == L'\\') {
      ++backslashes;
      continue;
    }
    if (ch == L'"') {
      out.append(backslashes * 2 + 1, L'\\');
    } else {
      out.append(backslashes, L'\\');
    }
    backslashes = 0;
    out.push_back(ch);
  }
  out.append(backslashes * 2, L'\\');
  out.push_back(L'"');
  return out;
}

std::wstring build_environment_block(const SpawnOptions &options) {
  std::wstring block;
  LPWCH current = GetEnvironmentStringsW();
  if (current != nullptr) {
    for (LPWCH entry = current; *entry != L'\0'; entry += wcslen(entry) + 1) {
      const std::wstring value(entry);
      const auto eq = value.find(L'=', 1);
      const std::wstring key = value.substr(0, eq);
      bool overridden = false;
      for (const auto &[override_key, override_value] : options.environment) {
        (void)override_value;
        if (_wcsicmp(widen(override_key).c_str(), key.c_str()) == 0) {
          overridden = true;
          break;
        }
      }
      if (!overridden) {
        block.append(value);
        block.push_back(L'\0');
      }
    }
    FreeEnvironmentStringsW(current);
  }
  for (const auto &[key, value] : options.environment) {
    block.append(widen(key + "=" + value));
    block.push_back(L'\0');
  }
  block.push_back(L'\0');
  return block;
}

} // namespace

struct ChildProcess::Impl {
  HANDLE process = nullptr;
  HANDLE job = nullptr;
  DWORD process_id = 0;
  HANDLE stdin_handle = nullptr;
  bool shares_console = false;
  std::unique_ptr<HandleLineChannel> out;
  std::unique_ptr<HandleLineChannel> err;

  std::mutex mutex;
  std::optional<int> exit_code;
  bool terminate_requested = false;
  bool cleaned = false;

  bool reap_within(const std::chrono::milliseconds timeout) {
    if (exit_code.has_value()) {
      return true;
    }
    if (WaitForSingleObject(process, static_cast<DWORD>(timeout.count())) != WAIT_OBJECT_0) {
      return false;
    }
    DWORD code = 0;
    GetExitCodeProcess(process, &code);
    exit_code = static_cast<int>(code);
    return true;
  }

  ~Impl() {
    close_handle(stdin_handle);
    close_handle(process);
    close_handle(job);
  }
};

common::Result<std::unique_ptr<ChildProcess>> ChildProcess::spawn(const SpawnOptions &options) {
  using R = common::Result<std::unique_ptr<ChildProcess>>;
  if (options.argv.empty()) {
    return R::failure("empty command line");
  }

  SECURITY_ATTRIBUTES sa{};
  sa.nLength = sizeof(sa);
  sa.bInheritHandle = TRUE;

  HANDLE in_read = nullptr, in_write = nullptr;
  HANDLE out_read = nullptr, out_write = nullptr;
  HANDLE err_read = nullptr, err_write = nullptr;
  const auto close_all = [&] {
    for (HANDLE *h : {&in_read, &in_write, &out_read, &out_write, &err_read, &err_write}) {
      close_handle(*h);
    }
  };
  if (!CreatePipe(&in_read, &in_write, &sa, 0) || !CreatePipe(&out_read, &out_write, &sa, 0) ||
      !CreatePipe(&err_read, &err_write, &sa, 0)) {
    close_all();
    return R::failure("failed to create pipes: " + last_error_message());
  }
  SetHandleInformation(in_write, HANDLE_FLAG_INHERIT, 0);
  SetHandleInformation(out_read, HANDLE_FLAG_INHERIT, 0);
  SetHandleInformation(err_read, HANDLE_FLAG_INHERIT, 0);

  HANDLE job = CreateJobObjectW(nullptr, nullptr);
  if (job == nullptr) {
    close_all();
    return R::failure("failed to create job object: " + last_error_message());
  }
  JOBOBJECT_EXTENDED_LIMIT_INFORMATION limits{};
  limits.BasicLimitInformation.LimitFlags = JOB_OBJECT_LIMIT_KILL_ON_JOB_CLOSE;
  SetInformationJobObject(job, JobObjectExtendedLimitInformation, &limits, sizeof(limits));

  std::wstring command_line;
  for (const auto &arg : options.argv) {
    if (!command_line.empty()) {
      command_line.push_back(L' ');
    }
    command_line.append(quote_argument(widen(arg)));
  }
  std::wstring environment = build_environment_block(options);
  const std::wstring cwd = widen(options.working_directory);

  STARTUPINFOW startup{};
  startup.cb = sizeof(startup);
  startup.dwFlags = STARTF_USESTDHANDLES;
  startup.hStdInput = in_read;
  startup.hStdOutput = out_write;
  startup.hStdError = err_write;

  PROCESS_INFORMATION info{};
  // A child that shares our console can receive CTRL_BREAK_EVENT. Without a console of our
  // own it gets a hidden one and can only be stopped through the job.
  const bool shares_console = GetConsoleWindow() != nullptr;
  DWORD flags = CREATE_NEW_PROCESS_GROUP | CREATE_SUSPENDED | CREATE_UNICODE_ENVIRONMENT;
  if (!shares_console) {
    flags |= CREATE_NO_WINDOW;
  }
  const BOOL created = CreateProcessW(
      nullptr, command_line.data(), nullptr, nullptr, TRUE, flags, environment.data(),
      cwd.empty() ? nullptr : cwd.c_str(), &startup, &info);
  if (!created) {
    const std::string message = last_error_message();
    close_all();
    CloseHandle(job);
    return R::failure("failed to start " + options.argv.front() + ": " + message);
  }

  AssignProcessToJobObject(job, info.hProcess);
  ResumeThread(info.hThread);
  CloseHandle(info.hThread);

  close_handle(in_read);
  close_handle(out_write);
  close_handle(err_write);

  auto impl = std::make_unique<Impl>();
  impl->process = info.hProcess;
  impl->process_id = info.dwProcessId;
  impl->job = job;
  impl->shares_console = shares_console;
  impl->stdin_handle = in_write;
  impl->out = std::make_unique<HandleLineChannel>(out_read);
  impl->err = std::make_unique<HandleLineChannel>(err_read);
  return R::success(std::make_unique<ChildProcess>(Token{}, std::move(impl)));
}

ChildProcess::ChildProcess(Token, std::unique_ptr<Impl> impl) : impl_(std::move(impl)) {}

ChildProcess::~ChildProcess() {
  close_input();
  terminate_tree(DESTRUCTOR_GRACE);
}

common::Status ChildProcess::write_input(const std::string &payload) {
  if (impl_->stdin_handle == nullptr) {
    return common::Status::error("stdin already closed");
  }
  std::size_t written = 0;
  while (written < payload.size()) {
    DWORD chunk = 0;
    const DWORD want = static_cast<DWORD>(payload.size() - written);
    if (!WriteFile(impl_->stdin_handle, payload.data() + written, want, &chunk, nullptr)) {
      const DWORD error = GetLastError();
      if (error == ERROR_BROKEN_PIPE || error == ERROR_NO_DATA) {
        observability::log_debug("process", "child closed stdin before reading all input");
        break;
      }
      close_input();
      return common::Status::error("failed to write prompt: Win32 error " + std::to_string(error));
    }
    written += chunk;
  }
  FlushFileBuffers(impl_->stdin_handle);
  close_input();
  return common::Status::success();
}

void ChildProcess::close_input() { close_handle(impl_->stdin_handle); }

LineChannel &ChildProcess::stdout_channel() { return *impl_->out; }

LineChannel &ChildProcess::stderr_channel() { return *impl_->err; }

std::int64_t ChildProcess::pid() const { return impl_->process_id; }

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
  if (impl_->process == nullptr || impl_->cleaned) {
    return;
  }
  impl_->cleaned = true;

  if (impl_->reap_within(std::chrono::milliseconds(0))) {
    TerminateJobObject(impl_->job, TERMINATED_EXIT_CODE);
    return;
  }

  impl_->terminate_requested = true;
  if (impl_->shares_console &&
      !GenerateConsoleCtrlEvent(CTRL_BREAK_EVENT, impl_->process_id)) {
    observability::log_debug("process", "CTRL_BREAK_EVENT failed: " + last_error_message());
  }
  (void)impl_->reap_within(grace);
  const bool forced = !impl_->exit_code.has_value();
  TerminateJobObject(impl_->job, TERMINATED_EXIT_CODE);
  (void)impl_->reap_within(std::chrono::milliseconds(INFINITE));
  observability::record_process_terminated(static_cast<std::int64_t>(impl_->process_id), forced);
}

bool ChildProcess::terminated_by_us() const {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  return impl_->terminate_requested;
}

} // namespace codexbridge::process
