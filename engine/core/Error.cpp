#include "Error.h"

namespace Arena {

std::string_view toString(ErrorCode code) {
    switch (code) {
        case ErrorCode::None: return "None";
        case ErrorCode::InvalidPosition: return "InvalidPosition";
        case ErrorCode::InvalidShopState: return "InvalidShopState";
        case ErrorCode::InsufficientFunds: return "InsufficientFunds";
        case ErrorCode::EmptySlot: return "EmptySlot";
        case ErrorCode::UnknownEntity: return "UnknownEntity";
        case ErrorCode::RosterTooLarge: return "RosterTooLarge";
        case ErrorCode::InvalidTier: return "InvalidTier";
        case ErrorCode::CascadeLimitExceeded: return "CascadeLimitExceeded";
    }
    return "Unknown";
}

}  // namespace Arena
