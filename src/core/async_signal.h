#pragma once
#include <utility>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>

// Wait/notify point for coroutines on one scheduler. A timer that never
// expires parks the waiters; notifyAll() cancels it, which resumes them in
// the order they started waiting. Waiters re-check their condition on wakeup.
class AsyncSignal {
public:
  explicit AsyncSignal(const boost::asio::any_io_executor& ex);

  boost::asio::awaitable<void> wait();
  void notifyAll();

private:
  boost::asio::steady_timer timer_;
};
