#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace tollgate::engine {

enum class ErrorCode : uint8_t {
    None = 0,
    ZeroAddress,
    ZeroAmount,
    DeniedAccount,
    Unauthorized,
    InsufficientBalance,
    InsufficientAllowance,
    Reentrant,
    InvalidRate,
    FeeCeilingExceeded,
    ProtectedPair,
    InsufficientPool,
    Overflow,
    InsufficientLiquidity,
    InsufficientOutput,
    DeadlineExpired,
    TransferFailed,
    DepositFailed
};

enum class ErrorClass : uint8_t { None, Precondition, Invariant, External };

const char *error_code_name(ErrorCode code);
ErrorClass error_class(ErrorCode code);

class EngineError : public std::runtime_error {
  public:
    EngineError(ErrorCode code, const std::string &message)
        : std::runtime_error(std::string(error_code_name(code)) + ": " + message), code_(code) {}

    ErrorCode code() const { return code_; }
    ErrorClass kind() const { return error_class(code_); }

  private:
    ErrorCode code_;
};

}  // namespace tollgate::engine
