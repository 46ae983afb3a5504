#pragma once
#include <cstddef>
#include <deque>
#include <optional>
#include <utility>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include "core/async_signal.h"
#include "core/packet.h"

/**
 * FIFO of packets between one producer task and one consumer task.
 *
 * capacity 0 means unbounded. With a bound, enqueue() suspends the producer
 * while the channel is full, so size() never exceeds capacity(); that
 * suspension is the only backpressure in the pipeline.
 *
 * close() ends production: pending and later enqueue() calls return false
 * without storing anything. Consumers keep draining what is left; dequeue()
 * yields std::nullopt once the channel is closed and empty.
 */
class Channel {
public:
  Channel(const boost::asio::any_io_executor& ex, std::size_t capacity);

  Channel(const Channel&) = delete;
  Channel& operator=(const Channel&) = delete;

  boost::asio::awaitable<bool> enqueue(Packet p);
  boost::asio::awaitable<std::optional<Packet>> dequeue();

  // Non-suspending variants. tryEnqueue fails when full or closed.
  bool tryEnqueue(Packet& p);
  std::optional<Packet> tryDequeue();

  void close();
  bool closed() const { return closed_; }

  std::size_t size() const { return items_.size(); }
  bool empty() const { return items_.empty(); }
  std::size_t capacity() const { return capacity_; }
  bool bounded() const { return capacity_ > 0; }
  bool full() const { return bounded() && items_.size() >= capacity_; }

private:
  std::size_t capacity_;
  bool closed_{false};
  std::deque<Packet> items_;
  AsyncSignal not_full_;
  AsyncSignal not_empty_;
};
