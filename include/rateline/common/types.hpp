#pragma once

#include <string>
#include <cstdint>
#include <cstddef>

namespace rateline {
namespace common {

enum class EngineState {
    FRESH,
    WARMING,
    TUNED,
    FINISHED
};

// One render-worthy point in time. Produced by core::ProgressEngine,
// consumed by format::Renderer implementations.
struct Snapshot {
    double percent = 0.0;
    int64_t current = 0;
    int64_t total = 0;
    double elapsed_seconds = 0.0;
    double remaining_seconds = 0.0;
    double rate = 0.0;
    std::string label;
    double fill_fraction = 0.0;
    size_t previous_rendered_width = 0;
    EngineState state = EngineState::FRESH;

    bool isComplete() const { return total > 0 && current >= total; }
};

struct RateSample {
    double interval_seconds = 0.0;
    int64_t iterations = 0;
};

std::string to_string(EngineState state);

}}
