#include "acquisition_loop.h"
#include "errors.h"

#include <iostream>
#include <stdexcept>
#include <utility>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/dispatch.hpp>

using clock_mono = std::chrono::steady_clock;
using std::chrono::nanoseconds;

namespace {
std::size_t checked_capacity(const LoopOptions& opts) {
  if (opts.max_queue_size < 0) {
    throw ConfigurationError("[AcquisitionLoop] max_queue_size must be >= 0, got " +
                             std::to_string(opts.max_queue_size));
  }
  return static_cast<std::size_t>(opts.max_queue_size);
}

std::string describe(std::exception_ptr e) {
  try {
    std::rethrow_exception(e);
  } catch (const std::exception& ex) {
    return ex.what();
  } catch (...) {
    return "unknown error";
  }
}
}

const char* to_string(AcquisitionLoop::State s) {
  switch (s) {
    case AcquisitionLoop::State::idle:    return "idle";
    case AcquisitionLoop::State::running: return "running";
    case AcquisitionLoop::State::stopped: return "stopped";
  }
  return "unknown";
}

AcquisitionLoop::AcquisitionLoop(Scheduler& sched, std::unique_ptr<IDataSource> source,
                                 LoopOptions opts, Consumer consumer)
  : sched_(sched),
    source_(std::move(source)),
    opts_(std::move(opts)),
    consumer_(std::move(consumer)),
    channel_(sched.executor(), checked_capacity(opts_)) {
  if (!source_) throw ConfigurationError("[AcquisitionLoop] data source is null");
  id_ = opts_.id.empty() ? source_->name() : opts_.id;
  yields_ = opts_.yields.value_or(source_->yields());
  if (opts_.report_rate) {
    reporter_ = std::make_unique<RateReporter>(sched.executor(), id_, opts_.report_interval,
                                               opts_.rate_sink);
  }
}

AcquisitionLoop::~AcquisitionLoop() {
  source_->close();
}

boost::asio::awaitable<void> AcquisitionLoop::run() {
  if (state_ != State::idle) {
    throw std::logic_error("[AcquisitionLoop] " + id_ + " was already started");
  }
  if (stop_requested_) {
    shutdown();
    co_return;
  }
  state_ = State::running;
  std::cout << "[AcquisitionLoop] started id=" << id_
            << " capacity=" << channel_.capacity()
            << " yields=" << (yields_ ? "true" : "false") << std::endl;

  auto ex = sched_.executor();
  if (reporter_) boost::asio::co_spawn(ex, reporter_->run(), boost::asio::detached);
  if (consumer_) boost::asio::co_spawn(ex, consume(), boost::asio::detached);

  try {
    co_await produce();
  } catch (const DaqError& e) {
    if (stop_requested_) {
      std::cout << "[AcquisitionLoop] " << id_ << " interrupted by stop: " << e.what() << std::endl;
    } else {
      fail(std::current_exception());
    }
  } catch (const std::exception& e) {
    if (stop_requested_) {
      std::cout << "[AcquisitionLoop] " << id_ << " interrupted by stop: " << e.what() << std::endl;
    } else {
      fail(std::make_exception_ptr(AcquisitionError(e.what())));
    }
  } catch (...) {
    if (stop_requested_) {
      std::cout << "[AcquisitionLoop] " << id_ << " interrupted by stop: unknown error" << std::endl;
    } else {
      fail(std::make_exception_ptr(AcquisitionError("unknown error")));
    }
  }

  shutdown();
  if (error_) std::rethrow_exception(error_);
}

void AcquisitionLoop::start(StoppedCallback on_stopped) {
  boost::asio::co_spawn(sched_.executor(), run(),
    [this, cb = std::move(on_stopped)](std::exception_ptr e) {
      if (e && !error_) error_ = e;  // e.g. a second start()
      if (cb) cb(e);
    });
}

void AcquisitionLoop::stop() {
  if (stop_requested_.exchange(true)) return;
  boost::asio::dispatch(sched_.executor(), [this] { interrupt(); });
}

boost::asio::awaitable<void> AcquisitionLoop::produce() {
  co_await source_->open();
  const std::vector<int> chans = source_->channels();

  while (!stop_requested_) {
    if (chans.empty()) {
      if (!co_await acquireOne(std::nullopt)) break;
    } else {
      bool go_on = true;
      for (int ch : chans) {
        if (!co_await acquireOne(ch)) { go_on = false; break; }
      }
      if (!go_on) break;
    }

    // a non-yielding source would otherwise starve every other task
    if (!yields_) co_await Scheduler::yield();
  }
}

boost::asio::awaitable<bool> AcquisitionLoop::acquireOne(std::optional<int> channel) {
  if (stop_requested_) co_return false;
  std::optional<Payload> payload = co_await source_->fetch(channel);
  if (stop_requested_) co_return false;
  if (!payload) co_return true;

  Packet p;
  p.payload = std::move(*payload);
  p.channel = channel;
  p.seq = seq_++;
  if (opts_.add_timestamp) {
    p.monotonic_ts_ns = std::chrono::duration_cast<nanoseconds>(
                          clock_mono::now().time_since_epoch()).count();
  }

  if (!co_await channel_.enqueue(std::move(p))) co_return false;
  ++produced_;
  if (reporter_) reporter_->count();
  co_return true;
}

boost::asio::awaitable<void> AcquisitionLoop::consume() {
  while (true) {
    std::optional<Packet> p = co_await channel_.dequeue();
    if (!p) break;
    ++delivered_;
    try {
      co_await consumer_(std::move(*p));
    } catch (const std::exception& e) {
      std::cerr << "[AcquisitionLoop] consumer failed id=" << id_ << ": " << e.what() << std::endl;
      fail(std::current_exception());
      stop();
      break;
    } catch (...) {
      std::cerr << "[AcquisitionLoop] consumer failed id=" << id_ << ": unknown error" << std::endl;
      fail(std::make_exception_ptr(AcquisitionError("unknown error")));
      stop();
      break;
    }
  }
}

void AcquisitionLoop::interrupt() {
  source_->close();
  channel_.close();
  if (reporter_) reporter_->stop();
}

void AcquisitionLoop::shutdown() {
  stop_requested_ = true;
  interrupt();
  state_ = State::stopped;
  std::cout << "[AcquisitionLoop] stopped id=" << id_ << " produced=" << produced_
            << " queued=" << channel_.size() << std::endl;
}

void AcquisitionLoop::fail(std::exception_ptr e) {
  if (error_) return;
  error_ = e;
  std::cerr << "[AcquisitionLoop] " << id_ << " failed: " << describe(e) << std::endl;
}

Json::Value AcquisitionLoop::statusAsJson() const {
  Json::Value s(Json::objectValue);
  s["id"] = id_;
  s["source"] = source_->name();
  s["state"] = to_string(state_);
  s["yields"] = yields_;
  s["capacity"] = Json::UInt64(channel_.capacity());
  s["queued"] = Json::UInt64(channel_.size());
  s["produced"] = Json::UInt64(produced_);
  s["delivered"] = Json::UInt64(delivered_);
  if (reporter_) s["report_interval_ms"] = Json::Int64(reporter_->interval().count());
  s["error"] = error_ ? Json::Value(describe(error_)) : Json::Value(Json::nullValue);
  return s;
}
