#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <json/json.h>
#include "core/channel.h"
#include "core/packet.h"
#include "core/rate_reporter.h"
#include "core/scheduler.h"
#include "sources/IDataSource.h"

struct LoopOptions {
  std::string id;                      // empty -> source name
  int max_queue_size{1};               // 0 = unbounded
  bool add_timestamp{false};
  std::optional<bool> yields;          // unset -> IDataSource::yields()
  bool report_rate{false};
  std::chrono::milliseconds report_interval{1000};
  RateReporter::Sink rate_sink;        // empty -> RateReporter::logSample
};

/**
 * Polls one data source and feeds its packets into a private Channel.
 *
 * Idle -> Running -> Stopped. Each iteration calls the source's fetch() once,
 * or once per channel for multi-channel sources, and enqueues every payload
 * as its own packet in channel order. A bounded channel suspends the loop
 * while full. When the source does not yield on its own the loop yields to
 * the scheduler after every iteration so other tasks keep running.
 *
 * stop() is observed at the top of each iteration, right after every fetch,
 * while waiting for channel space and inside the source's pacing wait. After
 * it nothing more is enqueued, the session is closed and the channel is
 * closed for producers; packets already queued stay there for the consumer.
 *
 * Any exception from the source ends the loop (no retry). It is kept in
 * error(), rethrown from run() and passed to the start() callback.
 *
 * The loop must outlive the scheduler's run(); its tasks refer to it.
 */
class AcquisitionLoop {
public:
  enum class State { idle, running, stopped };

  // Called once per dequeued packet, in FIFO order.
  using Consumer = std::function<boost::asio::awaitable<void>(Packet)>;
  using StoppedCallback = std::function<void(std::exception_ptr)>;

  AcquisitionLoop(Scheduler& sched, std::unique_ptr<IDataSource> source,
                  LoopOptions opts = {}, Consumer consumer = {});
  ~AcquisitionLoop();

  AcquisitionLoop(const AcquisitionLoop&) = delete;
  AcquisitionLoop& operator=(const AcquisitionLoop&) = delete;

  boost::asio::awaitable<void> run();
  void start(StoppedCallback on_stopped = {});
  void stop();

  State state() const { return state_; }
  bool stopRequested() const { return stop_requested_.load(); }
  const std::string& id() const { return id_; }
  bool yields() const { return yields_; }

  Channel& channel() { return channel_; }
  IDataSource& source() { return *source_; }
  const RateReporter* reporter() const { return reporter_.get(); }

  std::exception_ptr error() const { return error_; }
  uint64_t produced() const { return produced_; }
  uint64_t delivered() const { return delivered_; }

  Json::Value statusAsJson() const;

private:
  boost::asio::awaitable<void> produce();
  boost::asio::awaitable<bool> acquireOne(std::optional<int> channel);
  boost::asio::awaitable<void> consume();
  void interrupt();
  void shutdown();
  void fail(std::exception_ptr e);

  Scheduler& sched_;
  std::unique_ptr<IDataSource> source_;
  LoopOptions opts_;
  Consumer consumer_;
  std::string id_;
  bool yields_;
  Channel channel_;
  std::unique_ptr<RateReporter> reporter_;

  State state_{State::idle};
  std::atomic<bool> stop_requested_{false};
  std::exception_ptr error_;
  uint64_t seq_{0};
  uint64_t produced_{0};
  uint64_t delivered_{0};
};

const char* to_string(AcquisitionLoop::State s);
