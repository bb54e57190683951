#pragma once
#include <stdexcept>
#include <string>

namespace aslmix {

enum class ErrorCode {
    EmptySignal,
    DegenerateSignal,
    NoCrossing,
    ZeroPowerNoise,
    InvalidInput
};

// Short reason code, as written to the run ledger.
const char* toString(ErrorCode code);

class LevelError : public std::runtime_error {
public:
    LevelError(ErrorCode code, const std::string& what)
        : std::runtime_error(what), code_(code) {}

    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

} // namespace aslmix
