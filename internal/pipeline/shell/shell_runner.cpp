#include "shell_runner.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <stdexcept>
#include <system_error>

#include "internal/observability/logging.hpp"

extern char** environ;

namespace shopstack::pipeline::shell {

using observability::IntField;
using observability::StringField;

namespace {

constexpr int kPollIntervalMs = 100;
constexpr int kSignalExitBase = 128;
// Output kept per command for error messages.
constexpr size_t kMaxCapturedOutput = 64 * 1024;

class FdGuard {
 public:
  explicit FdGuard(int fd = -1) : fd_(fd) {
  }
  ~FdGuard() {
    Reset();
  }

  FdGuard(const FdGuard&)            = delete;
  FdGuard& operator=(const FdGuard&) = delete;

  int get() const {
    return fd_;
  }

  void Reset() {
    if (fd_ != -1) {
      while (::close(fd_) == -1 && errno == EINTR) {
      }
      fd_ = -1;
    }
  }

 private:
  int fd_;
};

std::vector<std::string> MergedEnvironment(const Environment& overlay) {
  Environment merged;
  for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
    std::string kv(*entry);
    const auto  eq = kv.find('=');
    if (eq == std::string::npos) continue;
    merged[kv.substr(0, eq)] = kv.substr(eq + 1);
  }
  for (const auto& [key, value] : overlay) {
    merged[key] = value;
  }

  std::vector<std::string> out;
  out.reserve(merged.size());
  for (const auto& [key, value] : merged) {
    out.push_back(key + "=" + value);
  }
  return out;
}

int WaitForChild(pid_t child) {
  int status = 0;
  while (::waitpid(child, &status, 0) == -1) {
    if (errno != EINTR) {
      throw std::system_error(errno, std::generic_category(), "waitpid failed");
    }
  }
  if (WIFEXITED(status)) return WEXITSTATUS(status);
  if (WIFSIGNALED(status)) return kSignalExitBase + WTERMSIG(status);
  return status;
}

void Append(std::string& output, const char* data, size_t size) {
  if (output.size() >= kMaxCapturedOutput) return;
  output.append(data, std::min(size, kMaxCapturedOutput - output.size()));
}

} // namespace

CommandResult Run(const std::string& command, const Environment& env, const CancellationToken& token) {
  ThrowIfCancelled(token, "command");

  int fds[2];
  if (::pipe2(fds, O_CLOEXEC) == -1) {
    throw std::system_error(errno, std::generic_category(), "pipe failed");
  }
  FdGuard read_end(fds[0]);
  FdGuard write_end(fds[1]);

  // Built before fork: the child must not allocate.
  const auto          env_strings = MergedEnvironment(env);
  std::vector<char*>  envp;
  for (const auto& kv : env_strings) envp.push_back(const_cast<char*>(kv.c_str()));
  envp.push_back(nullptr);
  const char* argv[] = {"/bin/sh", "-c", command.c_str(), nullptr};

  const pid_t child = ::fork();
  if (child == -1) {
    throw std::system_error(errno, std::generic_category(), "fork failed");
  }

  if (child == 0) {
    ::setpgid(0, 0);
    const int null_fd = ::open("/dev/null", O_RDONLY);
    if (null_fd != -1) ::dup2(null_fd, STDIN_FILENO);
    ::dup2(write_end.get(), STDOUT_FILENO);
    ::dup2(write_end.get(), STDERR_FILENO);
    ::execve("/bin/sh", const_cast<char* const*>(argv), envp.data());
    ::_exit(127);
  }

  ::setpgid(child, child);
  write_end.Reset();

  CommandResult result;
  bool          signalled = false;
  char          chunk[4096];

  for (;;) {
    if (!signalled && token.IsCancelled()) {
      ::kill(-child, SIGTERM);
      signalled = true;
    }

    pollfd pfd{read_end.get(), POLLIN, 0};
    const int ready = ::poll(&pfd, 1, kPollIntervalMs);
    if (ready == -1) {
      if (errno == EINTR) continue;
      ::kill(-child, SIGKILL);
      WaitForChild(child);
      throw std::system_error(errno, std::generic_category(), "poll failed");
    }
    if (ready == 0) continue;

    const ssize_t n = ::read(read_end.get(), chunk, sizeof(chunk));
    if (n == -1) {
      if (errno == EINTR) continue;
      break;
    }
    if (n == 0) break;
    Append(result.output, chunk, static_cast<size_t>(n));
  }

  result.exit_code = WaitForChild(child);

  if (signalled) {
    throw OperationCancelled(token.Reason(), "command interrupted: " + command);
  }
  return result;
}

std::string RunAll(const std::vector<std::string>& commands, const Environment& env, const CancellationToken& token) {
  std::string output;
  for (const auto& command : commands) {
    auto result = Run(command, env, token);
    output += result.output;
    if (result.exit_code != 0) {
      SHOPSTACK_LOG_ERROR("command failed", {StringField("command", command), IntField("exit_code", result.exit_code)});
      throw std::runtime_error("command '" + command + "' exited with " + std::to_string(result.exit_code) + ": " + result.output);
    }
    SHOPSTACK_LOG_DEBUG("command finished", {StringField("command", command)});
  }
  return output;
}

} // namespace shopstack::pipeline::shell
