#include "level/level_error.hpp"

namespace aslmix {

const char* toString(ErrorCode code) {
    switch (code) {
        case ErrorCode::EmptySignal:      return "empty_signal";
        case ErrorCode::DegenerateSignal: return "degenerate_signal";
        case ErrorCode::NoCrossing:       return "no_crossing";
        case ErrorCode::ZeroPowerNoise:   return "zero_power_noise";
        case ErrorCode::InvalidInput:     return "invalid_input";
    }
    return "unknown";
}

} // namespace aslmix
