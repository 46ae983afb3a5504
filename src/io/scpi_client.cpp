#include "scpi_client.h"
#include "core/errors.h"

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <utility>
#include <boost/asio/connect.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>

namespace asio = boost::asio;
using asio::ip::tcp;

// Holds the wire for the lifetime of one request.
class ScpiClient::WireLock {
public:
  explicit WireLock(ScpiClient& c) : c_(c) {}
  ~WireLock() { c_.releaseWire(); }
  WireLock(const WireLock&) = delete;
  WireLock& operator=(const WireLock&) = delete;
private:
  ScpiClient& c_;
};

ScpiClient::ScpiClient(const asio::any_io_executor& ex, std::string host, int port)
  : host_(std::move(host)), port_(port), socket_(ex), wire_free_(ex) {
}

ScpiClient::~ScpiClient() {
  close();
}

// ---- blocking ---------------------------------------------------------------

void ScpiClient::connect() {
  checkIdle("connect");
  if (socket_.is_open()) return;

  std::cout << "[ScpiClient] connecting " << host_ << ":" << port_ << std::endl;
  boost::system::error_code ec;
  tcp::resolver resolver(socket_.get_executor());
  auto endpoints = resolver.resolve(host_, std::to_string(port_), ec);
  if (ec) raise("resolve", ec);
  asio::connect(socket_, endpoints, ec);
  if (ec) raise("connect", ec);
}

void ScpiClient::send(const std::string& cmd) {
  connect();
  const std::string line = cmd + "\n";
  boost::system::error_code ec;
  asio::write(socket_, asio::buffer(line), ec);
  if (ec) raise("send", ec);
}

std::string ScpiClient::query(const std::string& cmd) {
  send(cmd);
  boost::system::error_code ec;
  const std::size_t n = asio::read_until(socket_, asio::dynamic_buffer(rx_), '\n', ec);
  if (ec) raise("receive", ec);
  return takeLine(n);
}

// ---- suspending -------------------------------------------------------------

asio::awaitable<void> ScpiClient::asyncConnect() {
  co_await acquireWire();
  WireLock lock(*this);
  co_await ensureOpen();
}

asio::awaitable<void> ScpiClient::asyncSend(std::string cmd) {
  co_await acquireWire();
  WireLock lock(*this);
  co_await ensureOpen();
  co_await writeLine(cmd);
}

asio::awaitable<std::string> ScpiClient::asyncQuery(std::string cmd) {
  co_await acquireWire();
  WireLock lock(*this);
  co_await ensureOpen();
  co_await writeLine(cmd);
  co_return co_await readLine();
}

asio::awaitable<std::vector<uint8_t>> ScpiClient::asyncQueryBlock(std::string cmd, std::size_t trailer) {
  co_await acquireWire();
  WireLock lock(*this);
  co_await ensureOpen();
  co_await writeLine(cmd);

  // "<prefix>#" ... the response header echoes the command
  boost::system::error_code ec;
  const std::size_t n = co_await asio::async_read_until(socket_, asio::dynamic_buffer(rx_), '#',
                                                        asio::redirect_error(asio::use_awaitable, ec));
  if (ec) raise("receive", ec);
  rx_.erase(0, n);

  co_await fill(1);
  const char nd = rx_[0];
  if (nd < '1' || nd > '9') {
    close();
    throw ConnectionError("[ScpiClient] malformed block header from " + host_ + " (" + cmd + ")");
  }
  const std::size_t digits = static_cast<std::size_t>(nd - '0');
  co_await fill(1 + digits);

  std::size_t len = 0;
  for (std::size_t i = 1; i <= digits; ++i) {
    const char c = rx_[i];
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      close();
      throw ConnectionError("[ScpiClient] malformed block length from " + host_ + " (" + cmd + ")");
    }
    len = len * 10 + static_cast<std::size_t>(c - '0');
  }
  rx_.erase(0, 1 + digits);

  co_await fill(len + trailer);
  std::vector<uint8_t> data(rx_.begin(), rx_.begin() + static_cast<std::ptrdiff_t>(len));
  rx_.erase(0, len + trailer);
  co_return data;
}

void ScpiClient::close() {
  if (socket_.is_open()) {
    boost::system::error_code ec;  // best-effort
    socket_.shutdown(tcp::socket::shutdown_both, ec);
    socket_.close(ec);
    std::cout << "[ScpiClient] closed " << host_ << ":" << port_ << std::endl;
  }
  rx_.clear();
}

// ---- internals --------------------------------------------------------------

// Tickets are served in issue order, so a caller going straight from one
// request to the next queues behind whoever was already waiting.
asio::awaitable<void> ScpiClient::acquireWire() {
  const std::uint64_t ticket = next_ticket_++;
  while (ticket != serving_) {
    co_await wire_free_.wait();
  }
}

void ScpiClient::releaseWire() {
  ++serving_;
  wire_free_.notifyAll();
}

void ScpiClient::checkIdle(const char* what) const {
  if (busy()) {
    throw std::logic_error(std::string("[ScpiClient] blocking ") + what +
                           " while a request is outstanding on " + host_);
  }
}

asio::awaitable<void> ScpiClient::ensureOpen() {
  if (socket_.is_open()) co_return;

  std::cout << "[ScpiClient] connecting " << host_ << ":" << port_ << std::endl;
  boost::system::error_code ec;
  tcp::resolver resolver(socket_.get_executor());
  auto endpoints = co_await resolver.async_resolve(host_, std::to_string(port_),
                                                   asio::redirect_error(asio::use_awaitable, ec));
  if (ec) raise("resolve", ec);
  co_await asio::async_connect(socket_, endpoints, asio::redirect_error(asio::use_awaitable, ec));
  if (ec) raise("connect", ec);
}

asio::awaitable<void> ScpiClient::writeLine(const std::string& cmd) {
  const std::string line = cmd + "\n";
  boost::system::error_code ec;
  co_await asio::async_write(socket_, asio::buffer(line), asio::redirect_error(asio::use_awaitable, ec));
  if (ec) raise("send", ec);
}

asio::awaitable<std::string> ScpiClient::readLine() {
  boost::system::error_code ec;
  const std::size_t n = co_await asio::async_read_until(socket_, asio::dynamic_buffer(rx_), '\n',
                                                        asio::redirect_error(asio::use_awaitable, ec));
  if (ec) raise("receive", ec);
  co_return takeLine(n);
}

asio::awaitable<void> ScpiClient::fill(std::size_t n) {
  while (rx_.size() < n) {
    boost::system::error_code ec;
    co_await asio::async_read(socket_, asio::dynamic_buffer(rx_), asio::transfer_at_least(n - rx_.size()),
                              asio::redirect_error(asio::use_awaitable, ec));
    if (ec) raise("receive", ec);
  }
}

std::string ScpiClient::takeLine(std::size_t n) {
  std::string line = rx_.substr(0, n);
  rx_.erase(0, n);
  while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) line.pop_back();
  return line;
}

void ScpiClient::raise(const std::string& what, const boost::system::error_code& ec) {
  close();
  throw ConnectionError("[ScpiClient] " + what + " failed on " + host_ + ":" +
                        std::to_string(port_) + ": " + ec.message());
}

double parse_scpi_number(const std::string& response) {
  std::string tok = response;
  const auto sp = tok.find(' ');
  if (sp != std::string::npos) tok = tok.substr(sp + 1);
  while (!tok.empty() && std::isspace(static_cast<unsigned char>(tok.back()))) tok.pop_back();
  while (!tok.empty() && std::isalpha(static_cast<unsigned char>(tok.back()))) tok.pop_back();

  char* end = nullptr;
  const double v = std::strtod(tok.c_str(), &end);
  if (tok.empty() || end != tok.c_str() + tok.size() || !std::isfinite(v)) {
    throw ConnectionError("[ScpiClient] not a number: '" + response + "'");
  }
  return v;
}
