#pragma once
#include <optional>
#include <string>
#include <vector>
#include <utility>
#include <boost/asio/awaitable.hpp>
#include "core/packet.h"

/**
 * Capability an AcquisitionLoop polls for data.
 *
 * fetch() is the data-source hook. A single-channel source returns an empty
 * channels() list and is called with std::nullopt once per iteration; a
 * multi-channel source is called once per entry of channels(), in order.
 * Returning std::nullopt means "nothing this time" and enqueues nothing.
 *
 * yields() declares whether fetch() suspends on its own (network I/O, timers).
 * A source that returns false runs to completion inside fetch(); the loop then
 * inserts the scheduler yield itself. A source that claims to yield but does
 * unbounded CPU work without suspending starves every other task on the
 * scheduler; that is the implementer's obligation, nothing detects it.
 */
class IDataSource {
public:
    virtual ~IDataSource() = default;

    virtual std::string name() const = 0;
    virtual bool yields() const { return true; }
    virtual std::vector<int> channels() const { return {}; }

    // Establishes the session, if any. Errors propagate as ConnectionError.
    virtual boost::asio::awaitable<void> open() { co_return; }
    virtual boost::asio::awaitable<std::optional<Payload>> fetch(std::optional<int> channel) = 0;
    // Closes the session and aborts outstanding waits. Idempotent.
    virtual void close() {}
};
