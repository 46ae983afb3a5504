#pragma once
#include <chrono>
#include <optional>
#include <utility>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>

/**
 * Spaces data-fetch requests to one instrument.
 *
 * A scope needs (time per division x division count) to fill one screen;
 * asking for a waveform sooner stalls it or returns garbage. The pacer keeps
 *   min_interval = factor * seconds_per_div * divisions
 * and the time of the last dispatched request, and wait() suspends the caller
 * for whatever is left of that interval.
 *
 * The timebase values are cached by the caller. stale() is true until the
 * first update() and again after invalidate(), which callers use to signal a
 * timebase change; the next update() re-derives the interval.
 */
class RequestPacer {
public:
  using clock = std::chrono::steady_clock;

  // Found by experiment on an SDS1202X-E; smaller values let it stall.
  static constexpr double kDefaultFactor = 4.0;

  explicit RequestPacer(const boost::asio::any_io_executor& ex, double factor = kDefaultFactor);

  void update(double seconds_per_div, int divisions);
  void invalidate() { stale_ = true; }
  bool stale() const { return stale_; }

  // Returns false, without waiting, once cancel() was called.
  boost::asio::awaitable<bool> wait();
  void cancel();
  // Clears cancellation and forgets the last request.
  void reset();

  double factor() const { return factor_; }
  double secondsPerDiv() const { return seconds_per_div_; }
  int divisions() const { return divisions_; }
  clock::duration minInterval() const { return min_interval_; }
  std::optional<clock::time_point> lastRequest() const { return last_; }

private:
  boost::asio::steady_timer timer_;
  double factor_;
  double seconds_per_div_{0.0};
  int divisions_{0};
  clock::duration min_interval_{clock::duration::zero()};
  std::optional<clock::time_point> last_;
  bool stale_{true};
  bool cancelled_{false};
};
