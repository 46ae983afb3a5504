#include "request_pacer.h"
#include "core/errors.h"

#include <cmath>
#include <string>
#include <utility>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

RequestPacer::RequestPacer(const boost::asio::any_io_executor& ex, double factor)
  : timer_(ex), factor_(factor) {
  if (!(factor_ > 0.0)) {
    throw ConfigurationError("[RequestPacer] pacing factor must be > 0, got " + std::to_string(factor_));
  }
}

void RequestPacer::update(double seconds_per_div, int divisions) {
  if (!std::isfinite(seconds_per_div) || seconds_per_div < 0.0 || divisions <= 0) {
    throw AcquisitionError("[RequestPacer] invalid timebase " + std::to_string(seconds_per_div) +
                           " s/div x " + std::to_string(divisions));
  }
  seconds_per_div_ = seconds_per_div;
  divisions_ = divisions;
  min_interval_ = std::chrono::duration_cast<clock::duration>(
                    std::chrono::duration<double>(factor_ * seconds_per_div * divisions));
  stale_ = false;
}

boost::asio::awaitable<bool> RequestPacer::wait() {
  if (cancelled_) co_return false;

  if (last_) {
    const auto due = *last_ + min_interval_;
    if (clock::now() < due) {
      timer_.expires_at(due);
      boost::system::error_code ec;
      co_await timer_.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
      if (cancelled_) co_return false;
    }
  }
  last_ = clock::now();
  co_return true;
}

void RequestPacer::cancel() {
  cancelled_ = true;
  timer_.cancel();
}

void RequestPacer::reset() {
  cancelled_ = false;
  last_.reset();
}
