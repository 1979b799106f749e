#ifndef MCPHOST_TRANSPORT_TRANSPORT_HPP_
#define MCPHOST_TRANSPORT_TRANSPORT_HPP_

#include "mcphost/types.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace mcphost {
namespace transport {

/**
 * @brief Abstract base class for line-oriented transports
 *
 * A transport owns the channel to exactly one server process. It moves whole
 * lines in both directions and knows nothing about JSON-RPC.
 */
class Transport {
public:
  /**
   * @brief Virtual destructor
   */
  virtual ~Transport() = default;

  /**
   * @brief Write one line to the server
   *
   * A newline is appended unless the line already ends with one.
   *
   * @param line The line to write
   * @throws TransportException if the input side is closed or the server
   * has exited
   */
  virtual void writeLine(const std::string &line) = 0;

  /**
   * @brief Read the next complete line from the server
   *
   * @param timeout How long to wait; zero waits indefinitely
   * @return std::string The line without its terminator
   * @throws TransportException if the stream ends before a full line
   * @throws TimeoutException if the timeout elapses first
   */
  virtual std::string
  readLine(std::chrono::milliseconds timeout = std::chrono::milliseconds::zero()) = 0;

  /**
   * @brief Check whether the server process is still running
   *
   * @return true if it has not exited yet
   */
  virtual bool isAlive() = 0;

  /**
   * @brief Close the server's input and wait for it to exit on its own
   *
   * @param timeout Maximum time to wait for exit
   * @return true if the process exited within the timeout
   */
  virtual bool closeStdinThenWait(std::chrono::milliseconds timeout) = 0;

  /**
   * @brief Terminate the server process and reap it
   */
  virtual void terminate() = 0;
};

/**
 * @brief Creates the transport for a server spec
 *
 * Connections obtain their transport through a factory so that tests can
 * substitute an in-memory implementation.
 */
using TransportFactory =
    std::function<std::unique_ptr<Transport>(const types::ServerSpec &)>;

} // namespace transport
} // namespace mcphost

#endif // MCPHOST_TRANSPORT_TRANSPORT_HPP_
