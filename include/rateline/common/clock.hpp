#pragma once

#include <chrono>
#include <memory>

namespace rateline {
namespace common {

// Time source for the engine. Elapsed time comes from the monotonic clock,
// per-sample intervals from the wall clock.
class Clock {
public:
    virtual ~Clock() = default;
    
    virtual std::chrono::steady_clock::time_point monotonicNow() const = 0;
    virtual std::chrono::system_clock::time_point wallNow() const = 0;
};

class SystemClock : public Clock {
public:
    static std::shared_ptr<Clock> shared();
    
    std::chrono::steady_clock::time_point monotonicNow() const override;
    std::chrono::system_clock::time_point wallNow() const override;
};

inline double secondsBetween(std::chrono::steady_clock::time_point from,
                             std::chrono::steady_clock::time_point to) {
    return std::chrono::duration<double>(to - from).count();
}

inline double secondsBetween(std::chrono::system_clock::time_point from,
                             std::chrono::system_clock::time_point to) {
    return std::chrono::duration<double>(to - from).count();
}

}}
