#ifndef MCPHOST_TRANSPORT_PROCESS_TRANSPORT_HPP_
#define MCPHOST_TRANSPORT_PROCESS_TRANSPORT_HPP_

#include "mcphost/transport/transport.hpp"
#include <atomic>
#include <mutex>
#include <optional>
#include <sys/types.h>
#include <thread>

namespace mcphost {
namespace transport {

/**
 * @brief Options for spawned server processes
 */
struct TransportOptions {
  /**
   * @brief How long terminate() waits after SIGTERM before sending SIGKILL
   */
  std::chrono::milliseconds kill_grace = std::chrono::milliseconds(500);

  /**
   * @brief Capture the server's stderr and forward it to the debug log
   *
   * When false the server inherits this process's stderr.
   */
  bool forward_stderr = true;

  /**
   * @brief Ignore SIGPIPE in this process before the first spawn
   *
   * The setting is process-wide. A write to a server that has exited then
   * fails with EPIPE instead of killing the host. Applications that manage
   * SIGPIPE themselves can turn this off.
   */
  bool ignore_sigpipe = true;
};

/**
 * @brief Transport implementation backed by a child process
 *
 * Spawns the server with pipes attached to its standard streams. The child's
 * environment is this process's environment overlaid with the spec's
 * overrides. The process is always reaped: on terminate(), or at the latest
 * when the transport is destroyed.
 */
class ProcessTransport : public Transport {
public:
  /**
   * @brief Start a server process
   *
   * Unless options.ignore_sigpipe is false, the first call sets SIGPIPE to
   * SIG_IGN for the whole process. Children get the default disposition.
   *
   * @param spec What to run
   * @param options Process handling options
   * @return std::unique_ptr<ProcessTransport> The running transport
   * @throws SpawnException if the executable cannot be started
   */
  static std::unique_ptr<ProcessTransport>
  spawn(const types::ServerSpec &spec,
        const TransportOptions &options = TransportOptions());

  /**
   * @brief Destructor; terminates the process if it is still running
   */
  ~ProcessTransport() override;

  ProcessTransport(const ProcessTransport &) = delete;
  ProcessTransport &operator=(const ProcessTransport &) = delete;

  // Transport interface implementation
  void writeLine(const std::string &line) override;
  std::string readLine(std::chrono::milliseconds timeout) override;
  bool isAlive() override;
  bool closeStdinThenWait(std::chrono::milliseconds timeout) override;
  void terminate() override;

  /**
   * @brief Process id of the server
   */
  pid_t pid() const;

  /**
   * @brief Raw wait status once the process has been reaped
   */
  std::optional<int> exitStatus() const;

private:
  ProcessTransport(std::string name, pid_t pid, int stdin_fd, int stdout_fd,
                   int stderr_fd, const TransportOptions &options);

  // Reap the child if it has exited; blocks when wait is true
  bool reap(bool wait);
  void closeStdin();
  void stderrLoop();

  std::string name_;
  pid_t pid_;
  TransportOptions options_;

  // Pipe ends owned by this side; -1 once closed
  int stdin_fd_;
  int stdout_fd_;
  int stderr_fd_;

  // Bytes read past the last returned line
  std::string read_buffer_;

  // Guards exit_status_ and waitpid calls
  mutable std::mutex process_mutex_;
  std::optional<int> exit_status_;

  std::mutex stdin_mutex_;

  std::thread stderr_thread_;
  std::atomic<bool> stderr_running_;
};

/**
 * @brief Factory that spawns a ProcessTransport for each spec
 */
TransportFactory
makeProcessTransportFactory(const TransportOptions &options = TransportOptions());

} // namespace transport
} // namespace mcphost

#endif // MCPHOST_TRANSPORT_PROCESS_TRANSPORT_HPP_
