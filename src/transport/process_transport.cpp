#include "mcphost/transport/process_transport.hpp"
#include "mcphost/utils/error.hpp"
#include "mcphost/utils/logging.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <map>
#include <poll.h>
#include <sys/wait.h>
#include <system_error>
#include <unistd.h>
#include <vector>

extern char **environ;

namespace mcphost {
namespace transport {

namespace {
constexpr std::chrono::milliseconds kReapPollInterval(10);
constexpr int kStderrPollMillis = 100;
constexpr size_t kReadChunk = 4096;

void closeFd(int &fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

std::error_code lastError() { return {errno, std::generic_category()}; }

// Writes to a pipe whose reader is gone must surface as EPIPE, not kill us
void ignoreSigpipe() {
  static std::once_flag once;
  std::call_once(once, [] { ::signal(SIGPIPE, SIG_IGN); });
}

ssize_t readRetry(int fd, void *buffer, size_t length) {
  ssize_t n;
  do {
    n = ::read(fd, buffer, length);
  } while (n < 0 && errno == EINTR);
  return n;
}

// Both ends are close-on-exec; dup2 onto 0/1/2 clears the flag in the child
struct Pipe {
  int fds[2] = {-1, -1};

  ~Pipe() {
    closeFd(fds[0]);
    closeFd(fds[1]);
  }

  void open(const std::string &what) {
    if (::pipe2(fds, O_CLOEXEC) != 0) {
      throw SpawnException("Failed to create " + what +
                           " pipe: " + std::strerror(errno));
    }
  }

  int release(int end) {
    int fd = fds[end];
    fds[end] = -1;
    return fd;
  }
};

std::vector<std::string>
mergeEnvironment(const std::map<std::string, std::string> &overrides) {
  std::map<std::string, std::string> merged;
  for (char **entry = environ; entry != nullptr && *entry != nullptr;
       ++entry) {
    std::string pair(*entry);
    auto pos = pair.find('=');
    if (pos == std::string::npos) {
      continue;
    }
    merged[pair.substr(0, pos)] = pair.substr(pos + 1);
  }

  for (const auto &[key, value] : overrides) {
    merged[key] = value;
  }

  std::vector<std::string> env;
  env.reserve(merged.size());
  for (const auto &[key, value] : merged) {
    env.push_back(key + "=" + value);
  }
  return env;
}

std::vector<char *> toPointers(std::vector<std::string> &strings) {
  std::vector<char *> pointers;
  pointers.reserve(strings.size() + 1);
  for (auto &s : strings) {
    pointers.push_back(s.data());
  }
  pointers.push_back(nullptr);
  return pointers;
}

std::string describeCommand(const types::ServerSpec &spec) {
  std::string description = spec.command;
  for (const auto &arg : spec.args) {
    description += " " + arg;
  }
  return description;
}

std::string describeWaitStatus(int status) {
  if (WIFEXITED(status)) {
    return "exited with code " + std::to_string(WEXITSTATUS(status));
  }
  if (WIFSIGNALED(status)) {
    return "killed by signal " + std::to_string(WTERMSIG(status));
  }
  return "stopped";
}
} // namespace

std::unique_ptr<ProcessTransport>
ProcessTransport::spawn(const types::ServerSpec &spec,
                        const TransportOptions &options) {
  const nlohmann::json details = {{"server", spec.name},
                                  {"command", spec.command}};

  if (spec.command.empty()) {
    throw SpawnException("Failed to spawn MCP server '" + spec.name +
                             "': no command given",
                         details);
  }

  if (options.ignore_sigpipe) {
    ignoreSigpipe();
  }

  Pipe in, out, err, status;
  in.open("stdin");
  out.open("stdout");
  if (options.forward_stderr) {
    err.open("stderr");
  }
  status.open("status");

  // Everything the child needs is prepared before fork
  std::vector<std::string> arg_strings;
  arg_strings.push_back(spec.command);
  arg_strings.insert(arg_strings.end(), spec.args.begin(), spec.args.end());
  std::vector<char *> argv = toPointers(arg_strings);

  std::vector<std::string> env_strings = mergeEnvironment(spec.env);
  std::vector<char *> envp = toPointers(env_strings);

  MCPHOST_SERVER_LOG_INFO(spec.name,
                          "Starting server: " + describeCommand(spec));

  pid_t pid = ::fork();
  if (pid < 0) {
    throw SpawnException("Failed to spawn MCP server '" + spec.name +
                             "': fork: " + std::strerror(errno),
                         details);
  }

  if (pid == 0) {
    // Child process: async-signal-safe calls only
    ::dup2(in.fds[0], STDIN_FILENO);
    ::dup2(out.fds[1], STDOUT_FILENO);
    if (err.fds[1] >= 0) {
      ::dup2(err.fds[1], STDERR_FILENO);
    }
    ::signal(SIGPIPE, SIG_DFL);

    // execvp resolves the command against the merged PATH
    environ = envp.data();
    ::execvp(argv[0], argv.data());

    int code = errno;
    ssize_t ignored = ::write(status.fds[1], &code, sizeof(code));
    (void)ignored;
    ::_exit(127);
  }

  // Parent: the status pipe reads EOF once exec succeeded
  closeFd(status.fds[1]);
  int exec_errno = 0;
  ssize_t n = readRetry(status.fds[0], &exec_errno, sizeof(exec_errno));
  if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
    int wait_status = 0;
    while (::waitpid(pid, &wait_status, 0) < 0 && errno == EINTR) {
    }

    nlohmann::json data = details;
    data["errno"] = exec_errno;
    throw SpawnException("Failed to spawn MCP server '" + spec.name +
                             "': " + spec.command + ": " +
                             std::strerror(exec_errno),
                         data);
  }

  std::unique_ptr<ProcessTransport> transport;
  try {
    transport.reset(new ProcessTransport(spec.name, pid, in.fds[1],
                                         out.fds[0], err.fds[0], options));
  } catch (const std::exception &e) {
    // The pipes are still owned here; only the child needs cleaning up
    ::kill(pid, SIGKILL);
    int wait_status = 0;
    while (::waitpid(pid, &wait_status, 0) < 0 && errno == EINTR) {
    }
    throw SpawnException("Failed to spawn MCP server '" + spec.name +
                             "': " + e.what(),
                         details);
  }
  in.release(1);
  out.release(0);
  err.release(0);

  MCPHOST_SERVER_LOG_DEBUG(spec.name,
                           "Server started with pid " + std::to_string(pid));
  return transport;
}

ProcessTransport::ProcessTransport(std::string name, pid_t pid, int stdin_fd,
                                   int stdout_fd, int stderr_fd,
                                   const TransportOptions &options)
    : name_(std::move(name)), pid_(pid), options_(options), stdin_fd_(stdin_fd),
      stdout_fd_(stdout_fd), stderr_fd_(stderr_fd), stderr_running_(false) {
  if (stderr_fd_ >= 0) {
    stderr_running_ = true;
    stderr_thread_ = std::thread(&ProcessTransport::stderrLoop, this);
  }
}

ProcessTransport::~ProcessTransport() {
  try {
    closeStdin();
    if (isAlive()) {
      terminate();
    }
  } catch (const std::exception &e) {
    MCPHOST_SERVER_LOG_ERROR(
        name_, "Error while releasing server process: " + std::string(e.what()));
  }

  stderr_running_ = false;
  if (stderr_thread_.joinable()) {
    stderr_thread_.join();
  }

  closeFd(stdout_fd_);
  closeFd(stderr_fd_);
}

void ProcessTransport::writeLine(const std::string &line) {
  std::lock_guard<std::mutex> lock(stdin_mutex_);

  if (stdin_fd_ < 0) {
    throw TransportException("Cannot write to server '" + name_ +
                             "': input already closed");
  }

  if (!isAlive()) {
    throw TransportException("Cannot write to server '" + name_ +
                             "': process has exited");
  }

  std::string data = line;
  if (data.empty() || data.back() != '\n') {
    data.push_back('\n');
  }

  size_t written = 0;
  while (written < data.size()) {
    ssize_t n =
        ::write(stdin_fd_, data.data() + written, data.size() - written);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      throw TransportException(lastError(),
                               "Failed to write to server '" + name_ + "'");
    }
    written += static_cast<size_t>(n);
  }
}

std::string ProcessTransport::readLine(std::chrono::milliseconds timeout) {
  const bool bounded = timeout > std::chrono::milliseconds::zero();
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  char buffer[kReadChunk];

  while (true) {
    auto pos = read_buffer_.find('\n');
    if (pos != std::string::npos) {
      std::string line = read_buffer_.substr(0, pos);
      read_buffer_.erase(0, pos + 1);
      if (!line.empty() && line.back() == '\r') {
        line.pop_back();
      }
      return line;
    }

    if (stdout_fd_ < 0) {
      throw TransportException("Connection closed by peer",
                               nlohmann::json{{"server", name_}});
    }

    int wait_millis = -1;
    if (bounded) {
      auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
          deadline - std::chrono::steady_clock::now());
      if (remaining.count() <= 0) {
        throw TimeoutException("No response from server '" + name_ +
                                   "' within " +
                                   std::to_string(timeout.count()) + "ms",
                               nlohmann::json{{"server", name_}});
      }
      wait_millis = static_cast<int>(remaining.count());
    }

    pollfd pfd{stdout_fd_, POLLIN, 0};
    int rc = ::poll(&pfd, 1, wait_millis);
    if (rc < 0) {
      if (errno == EINTR) {
        continue;
      }
      throw TransportException(lastError(), "Failed to poll server output");
    }
    if (rc == 0) {
      continue;
    }

    ssize_t n = readRetry(stdout_fd_, buffer, sizeof(buffer));
    if (n < 0) {
      throw TransportException(lastError(),
                               "Failed to read from server '" + name_ + "'");
    }
    if (n == 0) {
      throw TransportException("Connection closed by peer",
                               nlohmann::json{{"server", name_}});
    }
    read_buffer_.append(buffer, static_cast<size_t>(n));
  }
}

bool ProcessTransport::isAlive() { return !reap(false); }

bool ProcessTransport::closeStdinThenWait(std::chrono::milliseconds timeout) {
  closeStdin();

  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (!reap(false)) {
    if (std::chrono::steady_clock::now() >= deadline) {
      return false;
    }
    std::this_thread::sleep_for(kReapPollInterval);
  }
  return true;
}

void ProcessTransport::terminate() {
  if (reap(false)) {
    return;
  }

  MCPHOST_SERVER_LOG_DEBUG(name_,
                           "Sending SIGTERM to pid " + std::to_string(pid_));
  ::kill(pid_, SIGTERM);

  const auto deadline = std::chrono::steady_clock::now() + options_.kill_grace;
  while (!reap(false)) {
    if (std::chrono::steady_clock::now() >= deadline) {
      MCPHOST_SERVER_LOG_WARNING(name_,
                                 "Server did not exit after SIGTERM; sending "
                                 "SIGKILL");
      ::kill(pid_, SIGKILL);
      reap(true);
      return;
    }
    std::this_thread::sleep_for(kReapPollInterval);
  }
}

pid_t ProcessTransport::pid() const { return pid_; }

std::optional<int> ProcessTransport::exitStatus() const {
  std::lock_guard<std::mutex> lock(process_mutex_);
  return exit_status_;
}

bool ProcessTransport::reap(bool wait) {
  std::lock_guard<std::mutex> lock(process_mutex_);
  if (exit_status_) {
    return true;
  }

  int status = 0;
  pid_t rc;
  do {
    rc = ::waitpid(pid_, &status, wait ? 0 : WNOHANG);
  } while (rc < 0 && errno == EINTR);

  if (rc == 0) {
    return false;
  }

  if (rc < 0) {
    // ECHILD: nothing left to wait for
    exit_status_ = -1;
    return true;
  }

  exit_status_ = status;
  MCPHOST_SERVER_LOG_DEBUG(name_, "Server " + describeWaitStatus(status));
  return true;
}

void ProcessTransport::closeStdin() {
  std::lock_guard<std::mutex> lock(stdin_mutex_);
  closeFd(stdin_fd_);
}

void ProcessTransport::stderrLoop() {
  std::string pending;
  char buffer[kReadChunk];

  auto flush = [this](const std::string &line) {
    if (!line.empty()) {
      MCPHOST_SERVER_LOG_DEBUG(name_, "stderr: " + line);
    }
  };

  while (stderr_running_) {
    pollfd pfd{stderr_fd_, POLLIN, 0};
    int rc = ::poll(&pfd, 1, kStderrPollMillis);
    if (rc < 0) {
      if (errno == EINTR) {
        continue;
      }
      break;
    }
    if (rc == 0) {
      continue;
    }

    ssize_t n = readRetry(stderr_fd_, buffer, sizeof(buffer));
    if (n <= 0) {
      break;
    }

    pending.append(buffer, static_cast<size_t>(n));
    size_t pos;
    while ((pos = pending.find('\n')) != std::string::npos) {
      flush(pending.substr(0, pos));
      pending.erase(0, pos + 1);
    }
  }

  flush(pending);
}

TransportFactory makeProcessTransportFactory(const TransportOptions &options) {
  return [options](const types::ServerSpec &spec) -> std::unique_ptr<Transport> {
    return ProcessTransport::spawn(spec, options);
  };
}

} // namespace transport
} // namespace mcphost
