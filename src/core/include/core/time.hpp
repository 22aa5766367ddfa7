#pragma once
#include <string>

namespace ek {

// Timeline positions and durations are seconds from the project origin.
using Seconds = double;

// Two times closer than this are the same keyframe slot.
inline constexpr Seconds kTimeEpsilon = 1e-6;

bool same_time(Seconds a, Seconds b) noexcept;

Seconds clamp_time(Seconds t, Seconds lo, Seconds hi) noexcept;

// HH:MM:SS.FF for log lines.
std::string format_timecode(Seconds t, double frame_rate = 30.0);

} // namespace ek
