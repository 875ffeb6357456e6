#include "engine/errors.hpp"

namespace tollgate::engine {

const char *error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::None:
            return "none";
        case ErrorCode::ZeroAddress:
            return "zero_address";
        case ErrorCode::ZeroAmount:
            return "zero_amount";
        case ErrorCode::DeniedAccount:
            return "denied_account";
        case ErrorCode::Unauthorized:
            return "unauthorized";
        case ErrorCode::InsufficientBalance:
            return "insufficient_balance";
        case ErrorCode::InsufficientAllowance:
            return "insufficient_allowance";
        case ErrorCode::Reentrant:
            return "reentrant";
        case ErrorCode::InvalidRate:
            return "invalid_rate";
        case ErrorCode::FeeCeilingExceeded:
            return "fee_ceiling_exceeded";
        case ErrorCode::ProtectedPair:
            return "protected_pair";
        case ErrorCode::InsufficientPool:
            return "insufficient_pool";
        case ErrorCode::Overflow:
            return "overflow";
        case ErrorCode::InsufficientLiquidity:
            return "insufficient_liquidity";
        case ErrorCode::InsufficientOutput:
            return "insufficient_output";
        case ErrorCode::DeadlineExpired:
            return "deadline_expired";
        case ErrorCode::TransferFailed:
            return "transfer_failed";
        case ErrorCode::DepositFailed:
            return "deposit_failed";
    }
    return "unknown";
}

ErrorClass error_class(ErrorCode code) {
    switch (code) {
        case ErrorCode::None:
            return ErrorClass::None;
        case ErrorCode::ZeroAddress:
        case ErrorCode::ZeroAmount:
        case ErrorCode::DeniedAccount:
        case ErrorCode::Unauthorized:
        case ErrorCode::InsufficientBalance:
        case ErrorCode::InsufficientAllowance:
        case ErrorCode::Reentrant:
        case ErrorCode::InvalidRate:
            return ErrorClass::Precondition;
        case ErrorCode::FeeCeilingExceeded:
        case ErrorCode::ProtectedPair:
        case ErrorCode::InsufficientPool:
        case ErrorCode::Overflow:
            return ErrorClass::Invariant;
        case ErrorCode::InsufficientLiquidity:
        case ErrorCode::InsufficientOutput:
        case ErrorCode::DeadlineExpired:
        case ErrorCode::TransferFailed:
        case ErrorCode::DepositFailed:
            return ErrorClass::External;
    }
    return ErrorClass::None;
}

}  // namespace tollgate::engine
