#include "async_signal.h"

#include <utility>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

AsyncSignal::AsyncSignal(const boost::asio::any_io_executor& ex)
  : timer_(ex) {
  timer_.expires_at(boost::asio::steady_timer::time_point::max());
}

boost::asio::awaitable<void> AsyncSignal::wait() {
  boost::system::error_code ec;  // operation_aborted is the wakeup
  co_await timer_.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
}

void AsyncSignal::notifyAll() {
  timer_.cancel();
}
