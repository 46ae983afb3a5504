#pragma once
#include <cstdint>
#include <optional>
#include <variant>
#include <vector>

// Sampled signal: y[i] taken at t[i] (seconds).
struct Trace {
  std::vector<double> t;
  std::vector<double> y;
};

using Payload = std::variant<std::vector<uint8_t>, Trace>;

struct Packet {
  Payload payload;
  std::optional<uint64_t> monotonic_ts_ns;  // steady_clock, only with add_timestamp
  std::optional<int> channel;               // instrument channel (1-based) for multi-channel sources
  uint64_t seq{0};                          // per-loop sequence number
};
