#include "rateline/common/clock.hpp"

namespace rateline {
namespace common {

std::shared_ptr<Clock> SystemClock::shared() {
    static std::shared_ptr<Clock> instance = std::make_shared<SystemClock>();
    return instance;
}

std::chrono::steady_clock::time_point SystemClock::monotonicNow() const {
    return std::chrono::steady_clock::now();
}

std::chrono::system_clock::time_point SystemClock::wallNow() const {
    return std::chrono::system_clock::now();
}

}}
