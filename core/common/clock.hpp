#pragma once

#include <chrono>
#include <string>

namespace trustnet {

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;
using Millis = std::chrono::milliseconds;

inline Timestamp now() { return Clock::now(); }

/// Random identifier of the form "<prefix>-<16 hex digits>".
std::string generateId(const std::string& prefix);

} // namespace trustnet
