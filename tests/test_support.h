#pragma once
#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <utility>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>

#include "core/scheduler.h"
#include "sources/IDataSource.h"

namespace testing_support {

namespace asio = boost::asio;
using asio::ip::tcp;

// Spawns `task`, runs the scheduler until every task is done and rethrows
// whatever `task` threw.
inline void run_to_completion(Scheduler& sched, asio::awaitable<void> task) {
  std::exception_ptr err;
  asio::co_spawn(sched.executor(), std::move(task), [&](std::exception_ptr e) { err = e; });
  sched.run();
  if (err) std::rethrow_exception(err);
}

inline asio::awaitable<void> sleep_for(std::chrono::milliseconds d) {
  asio::steady_timer t(co_await asio::this_coro::executor, d);
  co_await t.async_wait(asio::use_awaitable);
}

inline std::vector<uint8_t> bytes_of(const Payload& p) {
  return std::get<std::vector<uint8_t>>(p);
}

// Hand-driven source. Every fetch returns one byte holding the call number
// (0, 1, 2, ...). on_fetch runs before the payload is produced and may throw.
class ScriptedSource : public IDataSource {
public:
  ScriptedSource(bool yields, std::vector<int> channels = {})
    : yields_(yields), channels_(std::move(channels)) {}

  std::string name() const override { return "ScriptedSource"; }
  bool yields() const override { return yields_; }
  std::vector<int> channels() const override { return channels_; }

  asio::awaitable<void> open() override { ++opened; co_return; }

  asio::awaitable<std::optional<Payload>> fetch(std::optional<int> channel) override {
    const int call = calls++;
    requested.push_back(channel);
    if (on_fetch) on_fetch(call);
    if (cooperative) co_await Scheduler::yield();
    co_return Payload{std::vector<uint8_t>{static_cast<uint8_t>(call)}};
  }

  void close() override { ++closed; }

  std::function<void(int)> on_fetch;
  bool cooperative{false};  // suspend once inside every fetch
  int calls{0};
  int opened{0};
  int closed{0};
  std::vector<std::optional<int>> requested;

private:
  bool yields_;
  std::vector<int> channels_;
};

/**
 * Loopback stand-in for a SCPI instrument. Accepts one connection on
 * 127.0.0.1 and answers each received line with whatever the handler returns
 * (nothing for commands), optionally after a delay. serve() ends when the
 * peer disconnects or the handler asks to hang up.
 */
class FakeInstrument {
public:
  struct Reply {
    std::string bytes;
    std::chrono::milliseconds delay{0};
    bool hang_up{false};  // close instead of answering
  };
  using Handler = std::function<std::optional<Reply>(const std::string& line)>;

  FakeInstrument(const asio::any_io_executor& ex, Handler handler)
    : acceptor_(ex, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0)),
      socket_(ex),
      handler_(std::move(handler)) {}

  int port() const { return acceptor_.local_endpoint().port(); }
  const std::vector<std::string>& received() const { return received_; }

  std::size_t count(const std::string& line) const {
    std::size_t n = 0;
    for (const auto& r : received_) n += (r == line);
    return n;
  }

  asio::awaitable<void> serve() {
    boost::system::error_code ec;
    socket_ = co_await acceptor_.async_accept(asio::redirect_error(asio::use_awaitable, ec));
    acceptor_.close();
    if (ec) co_return;

    std::string buf;
    for (;;) {
      const std::size_t n = co_await asio::async_read_until(socket_, asio::dynamic_buffer(buf), '\n',
                                                            asio::redirect_error(asio::use_awaitable, ec));
      if (ec) break;
      std::string line = buf.substr(0, n - 1);
      buf.erase(0, n);
      received_.push_back(line);

      std::optional<Reply> reply = handler_(line);
      if (!reply) continue;
      if (reply->delay.count() > 0) co_await sleep_for(reply->delay);
      if (reply->hang_up) break;
      co_await asio::async_write(socket_, asio::buffer(reply->bytes),
                                 asio::redirect_error(asio::use_awaitable, ec));
      if (ec) break;
    }
    socket_.close(ec);
  }

private:
  tcp::acceptor acceptor_;
  tcp::socket socket_;
  Handler handler_;
  std::vector<std::string> received_;
};

// A port on 127.0.0.1 that nothing listens on.
inline int unused_port(asio::io_context& ctx) {
  tcp::acceptor a(ctx, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
  const int port = a.local_endpoint().port();
  a.close();
  return port;
}

} // namespace testing_support
