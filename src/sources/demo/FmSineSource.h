#pragma once
#include <chrono>
#include <vector>
#include "sources/IDataSource.h"

// Synthetic FM-modulated sine for exercising a pipeline without hardware.
// fetch() computes the whole trace without suspending, so yields() is false.
class FmSineSource final : public IDataSource {
public:
    FmSineSource();

    std::string name() const override { return "FmSineSource"; }
    bool yields() const override { return false; }

    boost::asio::awaitable<std::optional<Payload>> fetch(std::optional<int> channel) override;

    Trace sample(double elapsed_s) const;

private:
    std::vector<double> t_;  // [-2, 2], 1000 points
    std::chrono::steady_clock::time_point t0_;
    double fc_{1.0};         // carrier [Hz]
    double f_mod_{3.0};      // modulation [Hz]
    double f_dev_{0.25};     // deviation [Hz]
  };
