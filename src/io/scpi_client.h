#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include <utility>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>
#include "core/async_signal.h"

/**
 * Line-oriented SCPI session over one TCP connection.
 *
 * Commands are written as "<cmd>\n" and elicit no response; a query elicits
 * exactly one response, read back in request order. The protocol carries no
 * request ids, so only one request may be on the wire at a time: the async
 * calls queue up behind each other (FIFO), the blocking calls throw
 * std::logic_error when an async request is still outstanding or queued.
 *
 * The connection is opened on first use and kept. Any I/O failure, including
 * the peer closing the connection, is reported as ConnectionError from the
 * call in progress and closes the session; the next call opens a new one.
 * No timeouts beyond what the OS enforces.
 */
class ScpiClient {
public:
  ScpiClient(const boost::asio::any_io_executor& ex, std::string host, int port);
  ~ScpiClient();

  ScpiClient(const ScpiClient&) = delete;
  ScpiClient& operator=(const ScpiClient&) = delete;

  // blocking
  void connect();
  void send(const std::string& cmd);
  std::string query(const std::string& cmd);

  // suspending
  boost::asio::awaitable<void> asyncConnect();
  boost::asio::awaitable<void> asyncSend(std::string cmd);
  boost::asio::awaitable<std::string> asyncQuery(std::string cmd);
  // Query answered with an IEEE 488.2 definite-length block
  // "<prefix>#<n><len><data>" followed by `trailer` terminator bytes.
  boost::asio::awaitable<std::vector<uint8_t>> asyncQueryBlock(std::string cmd, std::size_t trailer = 1);

  void close();
  bool isOpen() const { return socket_.is_open(); }
  bool busy() const { return serving_ != next_ticket_; }

  const std::string& host() const { return host_; }
  int port() const { return port_; }

private:
  class WireLock;

  boost::asio::awaitable<void> acquireWire();
  void releaseWire();
  void checkIdle(const char* what) const;
  boost::asio::awaitable<void> ensureOpen();
  boost::asio::awaitable<void> writeLine(const std::string& cmd);
  boost::asio::awaitable<std::string> readLine();
  boost::asio::awaitable<void> fill(std::size_t n);
  std::string takeLine(std::size_t n);
  [[noreturn]] void raise(const std::string& what, const boost::system::error_code& ec);

  std::string host_;
  int port_;
  boost::asio::ip::tcp::socket socket_;
  std::string rx_;  // bytes received past the last consumed response
  std::uint64_t next_ticket_{0};
  std::uint64_t serving_{0};  // ticket that owns the wire
  AsyncSignal wire_free_;
};

// Numeric value of a response like "C1:VDIV 2.00E-01V" or "TDIV 1.00E-03S":
// the token after the header with any trailing unit letters removed.
// Throws ConnectionError when no finite number can be read.
double parse_scpi_number(const std::string& response);
