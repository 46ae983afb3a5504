#include "FmSineSource.h"

#include <cmath>

namespace {
constexpr int kPoints = 1000;
constexpr double kTwoPi = 2.0 * M_PI;
}

FmSineSource::FmSineSource()
    : t0_(std::chrono::steady_clock::now()) {
    t_.resize(kPoints);
    for (int i = 0; i < kPoints; ++i) {
        t_[i] = -2.0 + 4.0 * static_cast<double>(i) / (kPoints - 1);
    }
    f_dev_ = fc_ / 4.0;
}

Trace FmSineSource::sample(double elapsed_s) const {
    const double xm = std::sin(kTwoPi * elapsed_s * f_mod_);  // baseband
    Trace tr;
    tr.t.resize(t_.size());
    tr.y.resize(t_.size());
    for (std::size_t i = 0; i < t_.size(); ++i) {
        tr.t[i] = t_[i] * kTwoPi;
        tr.y[i] = std::sin(kTwoPi * (fc_ + f_dev_ * xm) * t_[i]);
    }
    return tr;
}

boost::asio::awaitable<std::optional<Payload>> FmSineSource::fetch(std::optional<int>) {
    const double now = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0_).count();
    co_return Payload{sample(now)};
}
