#include "SiglentSds.h"
#include "core/errors.h"

#include <cstdint>
#include <iostream>

SiglentSds::SiglentSds(const boost::asio::any_io_executor& ex, std::string host, int port,
                       std::vector<int> channels, double pacing_factor, int divisions)
    : channels_(std::move(channels)),
      divisions_(divisions),
      scpi_(ex, std::move(host), port),
      pacer_(ex, pacing_factor) {
    if (channels_.empty()) {
        throw ConfigurationError("[SiglentSds] at least one channel is required");
    }
    for (int ch : channels_) {
        if (ch < 1 || ch > kMaxChannel) {
            throw ConfigurationError("[SiglentSds] channel out of range: " + std::to_string(ch));
        }
    }
    if (divisions_ <= 0) {
        throw ConfigurationError("[SiglentSds] divisions must be > 0");
    }
}

SiglentSds::~SiglentSds() {
    close();
}

boost::asio::awaitable<void> SiglentSds::open() {
    pacer_.reset();
    co_await scpi_.asyncConnect();
    std::cout << "[SiglentSds] opened " << scpi_.host() << ":" << scpi_.port()
              << " channels=" << channels_.size() << std::endl;
}

boost::asio::awaitable<void> SiglentSds::refreshTimebase() {
    // "TDIV 1.00E-03S"
    const std::string resp = co_await scpi_.asyncQuery("TIME_DIV?");
    pacer_.update(parse_scpi_number(resp), divisions_);
    std::cout << "[SiglentSds] timebase " << pacer_.secondsPerDiv() << " s/div, min interval "
              << std::chrono::duration<double, std::milli>(pacer_.minInterval()).count()
              << " ms" << std::endl;
}

boost::asio::awaitable<std::optional<Payload>> SiglentSds::fetch(std::optional<int> channel) {
    const int ch = channel.value_or(channels_.front());
    const std::string cn = channelName(ch);

    if (pacer_.stale()) co_await refreshTimebase();
    if (!co_await pacer_.wait()) co_return std::nullopt;

    // "C1:WF DAT2,#9000001400<samples>\n\n"
    const std::vector<uint8_t> raw = co_await scpi_.asyncQueryBlock(cn + ":WF? DAT2", 2);
    // "C1:VDIV 2.00E-01V", "C1:OFST 0.00E+00V"
    const double vdiv = parse_scpi_number(co_await scpi_.asyncQuery(cn + ":VDIV?"));
    const double offs = parse_scpi_number(co_await scpi_.asyncQuery(cn + ":OFFSET?"));

    Trace tr;
    const std::size_t n = raw.size();
    const double span = pacer_.secondsPerDiv() * pacer_.divisions();
    tr.t.resize(n);
    tr.y.resize(n);
    for (std::size_t i = 0; i < n; ++i) {
        // signed screen code, 25 codes per vertical division
        const auto code = static_cast<int8_t>(raw[i]);
        tr.y[i] = code * vdiv / 25.0 - offs;
        tr.t[i] = span * static_cast<double>(i) / static_cast<double>(n);
    }
    co_return Payload{std::move(tr)};
}

void SiglentSds::close() {
    pacer_.cancel();
    scpi_.close();
}
