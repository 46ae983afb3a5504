#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>
#include <json/json.h>

struct RateSample {
  std::string id;
  uint64_t packets{0};   // produced since the previous sample
  double elapsed_s{0.0};
  double rate{0.0};      // packets per second

  Json::Value toJson() const;
};

/**
 * Throughput side channel for one loop.
 *
 * The loop calls count() for every packet it enqueues; run() wakes on a fixed
 * wall-clock schedule and hands a RateSample to the sink. The sink runs on the
 * scheduler thread and must not block. Exceptions it throws are logged and
 * dropped so reporting can never stop the acquisition path.
 */
class RateReporter {
public:
  using Sink = std::function<void(const RateSample&)>;

  RateReporter(const boost::asio::any_io_executor& ex, std::string id,
               std::chrono::milliseconds interval, Sink sink = {});

  void count(uint64_t n = 1) { pending_ += n; total_ += n; }

  boost::asio::awaitable<void> run();
  void stop();

  uint64_t total() const { return total_; }
  std::size_t reports() const { return reports_; }
  std::chrono::milliseconds interval() const { return interval_; }

  // Default sink: "[id] fps = N" on stdout.
  static void logSample(const RateSample& s);

private:
  void emit(std::chrono::steady_clock::duration elapsed);

  std::string id_;
  std::chrono::milliseconds interval_;
  Sink sink_;
  boost::asio::steady_timer timer_;
  bool stopping_{false};
  uint64_t pending_{0};
  uint64_t total_{0};
  std::size_t reports_{0};
};
