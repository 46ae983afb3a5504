#pragma once
#include <string>
#include <utility>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>

// Event loop implementation. Both run tasks cooperatively on the thread that
// calls run(); single_threaded drops the context's internal locking.
enum class SchedulerKind { standard, single_threaded };

SchedulerKind scheduler_kind_from_string(const std::string& name);
std::string to_string(SchedulerKind kind);

/**
 * Cooperative scheduler handle.
 *
 * Every AcquisitionLoop receives one at construction instead of reaching for a
 * process-wide loop, so several loops (or isolated tests) can each own one.
 * All tasks spawned on it run on the thread inside run(); they interleave only
 * at co_await points. The ready queue is FIFO.
 */
class Scheduler {
public:
  using Executor = boost::asio::io_context::executor_type;

  explicit Scheduler(SchedulerKind kind = SchedulerKind::standard);

  Executor executor() { return ctx_.get_executor(); }
  boost::asio::io_context& context() { return ctx_; }
  SchedulerKind kind() const { return kind_; }

  // Runs until every task has finished or stop() is called. May be called again.
  void run();
  void stop();

  // Re-queues the calling task behind everything that is already ready.
  static boost::asio::awaitable<void> yield();

private:
  SchedulerKind kind_;
  boost::asio::io_context ctx_;
};
