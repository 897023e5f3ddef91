#include "common/clock.hpp"

#include <cstdint>
#include <iomanip>
#include <mutex>
#include <random>
#include <sstream>

namespace trustnet {

std::string generateId(const std::string& prefix) {
    static std::mutex mutex;
    static std::mt19937_64 rng{std::random_device{}()};

    uint64_t bits;
    {
        std::lock_guard<std::mutex> lock(mutex);
        bits = rng();
    }
    std::ostringstream ss;
    ss << prefix << "-" << std::hex << std::setw(16) << std::setfill('0') << bits;
    return ss.str();
}

} // namespace trustnet
