#pragma once
#include <string>
#include <vector>
#include <utility>
#include <boost/asio/any_io_executor.hpp>
#include "sources/IDataSource.h"
#include "io/request_pacer.h"
#include "io/scpi_client.h"

// Siglent SDS1000X-E / SDS2000X(-E) oscilloscope over its SCPI socket
// (usually port 5025). Only tested against an SDS1202X-E.
//
// Each fetch returns one channel's screen as a Trace in volts. Waveform
// requests go through a RequestPacer fed with the scope's timebase, which is
// queried once and cached until timebaseChanged().
class SiglentSds final : public IDataSource {
public:
    static constexpr int kDivisions = 14;  // horizontal divisions on the SDS screen
    static constexpr int kMaxChannel = 4;

    SiglentSds(const boost::asio::any_io_executor& ex, std::string host, int port,
               std::vector<int> channels,
               double pacing_factor = RequestPacer::kDefaultFactor,
               int divisions = kDivisions);
    ~SiglentSds() override;

    std::string name() const override { return "SiglentSds"; }
    bool yields() const override { return true; }
    std::vector<int> channels() const override { return channels_; }

    boost::asio::awaitable<void> open() override;
    boost::asio::awaitable<std::optional<Payload>> fetch(std::optional<int> channel) override;
    void close() override;

    // Call after changing the timebase on the scope.
    void timebaseChanged() { pacer_.invalidate(); }

    ScpiClient& scpi() { return scpi_; }
    RequestPacer& pacer() { return pacer_; }

    static std::string channelName(int ch) { return "C" + std::to_string(ch); }

private:
    boost::asio::awaitable<void> refreshTimebase();

    std::vector<int> channels_;
    int divisions_;
    ScpiClient scpi_;
    RequestPacer pacer_;
};
