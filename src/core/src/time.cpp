#include "core/time.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <iomanip>
#include <sstream>

namespace ek {

bool same_time(Seconds a, Seconds b) noexcept {
    return std::fabs(a - b) < kTimeEpsilon;
}

Seconds clamp_time(Seconds t, Seconds lo, Seconds hi) noexcept {
    if(hi < lo) return lo;
    return std::min(std::max(t, lo), hi);
}

std::string format_timecode(Seconds t, double frame_rate) {
    if(frame_rate <= 0.0) frame_rate = 30.0;
    if(t < 0.0) t = 0.0;

    auto total_seconds = static_cast<int64_t>(t);
    int64_t hours = total_seconds / 3600;
    int64_t minutes = (total_seconds % 3600) / 60;
    int64_t secs = total_seconds % 60;
    double fractional = t - static_cast<double>(total_seconds);
    auto frame = static_cast<int64_t>(std::floor(fractional * frame_rate + 0.5));

    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(2) << hours << ':'
        << std::setw(2) << minutes << ':'
        << std::setw(2) << secs << '.'
        << std::setw(2) << frame;
    return oss.str();
}

} // namespace ek
