#include "rateline/common/types.hpp"

namespace rateline {
namespace common {

std::string to_string(EngineState state) {
    switch (state) {
        case EngineState::FRESH: return "FRESH";
        case EngineState::WARMING: return "WARMING";
        case EngineState::TUNED: return "TUNED";
        case EngineState::FINISHED: return "FINISHED";
        default: return "UNKNOWN";
    }
}

}}
