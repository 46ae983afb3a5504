#include "rate_reporter.h"
#include "errors.h"

#include <exception>
#include <iostream>
#include <utility>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

using clock_mono = std::chrono::steady_clock;

Json::Value RateSample::toJson() const {
  Json::Value j(Json::objectValue);
  j["id"] = id;
  j["packets"] = Json::UInt64(packets);
  j["elapsed_s"] = elapsed_s;
  j["rate"] = rate;
  return j;
}

RateReporter::RateReporter(const boost::asio::any_io_executor& ex, std::string id,
                           std::chrono::milliseconds interval, Sink sink)
  : id_(std::move(id)), interval_(interval), sink_(std::move(sink)), timer_(ex) {
  if (interval_.count() <= 0) {
    throw ConfigurationError("[RateReporter] interval must be > 0 ms (id=" + id_ + ")");
  }
  if (!sink_) sink_ = &RateReporter::logSample;
}

boost::asio::awaitable<void> RateReporter::run() {
  auto last = clock_mono::now();
  auto next_tick = last + interval_;

  while (!stopping_) {
    timer_.expires_at(next_tick);
    boost::system::error_code ec;
    co_await timer_.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    if (stopping_) break;

    const auto now = clock_mono::now();
    emit(now - last);
    last = now;
    // fixed schedule: a slow sink does not stretch the interval
    next_tick += interval_;
  }
}

void RateReporter::stop() {
  stopping_ = true;
  timer_.cancel();
}

void RateReporter::emit(clock_mono::duration elapsed) {
  RateSample s;
  s.id = id_;
  s.packets = pending_;
  s.elapsed_s = std::chrono::duration<double>(elapsed).count();
  s.rate = s.elapsed_s > 0.0 ? static_cast<double>(s.packets) / s.elapsed_s : 0.0;
  pending_ = 0;
  ++reports_;

  try {
    sink_(s);
  } catch (const std::exception& e) {
    std::cerr << "[RateReporter] sink failed (id=" << id_ << "): " << e.what() << std::endl;
  }
}

void RateReporter::logSample(const RateSample& s) {
  std::cout << "[" << s.id << "] fps = " << static_cast<int>(s.rate) << std::endl;
}
