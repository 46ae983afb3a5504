#include "channel.h"

Channel::Channel(const boost::asio::any_io_executor& ex, std::size_t capacity)
  : capacity_(capacity), not_full_(ex), not_empty_(ex) {
}

boost::asio::awaitable<bool> Channel::enqueue(Packet p) {
  while (!closed_ && full()) {
    co_await not_full_.wait();
  }
  if (closed_) co_return false;
  items_.push_back(std::move(p));
  not_empty_.notifyAll();
  co_return true;
}

boost::asio::awaitable<std::optional<Packet>> Channel::dequeue() {
  while (items_.empty()) {
    if (closed_) co_return std::nullopt;
    co_await not_empty_.wait();
  }
  Packet p = std::move(items_.front());
  items_.pop_front();
  not_full_.notifyAll();
  co_return p;
}

bool Channel::tryEnqueue(Packet& p) {
  if (closed_ || full()) return false;
  items_.push_back(std::move(p));
  not_empty_.notifyAll();
  return true;
}

std::optional<Packet> Channel::tryDequeue() {
  if (items_.empty()) return std::nullopt;
  Packet p = std::move(items_.front());
  items_.pop_front();
  not_full_.notifyAll();
  return p;
}

void Channel::close() {
  if (closed_) return;
  closed_ = true;
  not_full_.notifyAll();
  not_empty_.notifyAll();
}
