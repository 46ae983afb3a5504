#include "scheduler.h"
#include "errors.h"

#include <iostream>
#include <utility>
#include <boost/asio/post.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace {
int concurrency_hint(SchedulerKind kind) {
  if (kind == SchedulerKind::single_threaded) return 1;
  return BOOST_ASIO_CONCURRENCY_HINT_DEFAULT;
}
}

SchedulerKind scheduler_kind_from_string(const std::string& name) {
  if (name == "standard") return SchedulerKind::standard;
  if (name == "single_threaded") return SchedulerKind::single_threaded;
  throw ConfigurationError("unknown scheduler: " + name);
}

std::string to_string(SchedulerKind kind) {
  return kind == SchedulerKind::single_threaded ? "single_threaded" : "standard";
}

Scheduler::Scheduler(SchedulerKind kind)
  : kind_(kind), ctx_(concurrency_hint(kind)) {
}

void Scheduler::run() {
  std::cout << "[Scheduler] running (" << to_string(kind_) << ")" << std::endl;
  if (ctx_.stopped()) ctx_.restart();
  ctx_.run();
  std::cout << "[Scheduler] idle" << std::endl;
}

void Scheduler::stop() {
  ctx_.stop();
}

boost::asio::awaitable<void> Scheduler::yield() {
  auto ex = co_await boost::asio::this_coro::executor;
  co_await boost::asio::post(ex, boost::asio::use_awaitable);
}
