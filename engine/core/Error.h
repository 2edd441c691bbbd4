// Error codes reported by roster, shop and battle operations.
#pragma once

#include <optional>
#include <string_view>
#include <utility>

namespace Arena {

enum class ErrorCode {
    None,
    InvalidPosition,
    InvalidShopState,
    InsufficientFunds,
    EmptySlot,
    UnknownEntity,
    RosterTooLarge,
    InvalidTier,
    CascadeLimitExceeded
};

std::string_view toString(ErrorCode code);

// Value-or-error return used by fallible factories.
template <typename T>
struct Result {
    std::optional<T> value;
    ErrorCode error{ErrorCode::None};

    static Result success(T v) {
        Result r;
        r.value = std::move(v);
        return r;
    }
    static Result failure(ErrorCode code) {
        Result r;
        r.error = code;
        return r;
    }

    bool ok() const { return error == ErrorCode::None && value.has_value(); }
    explicit operator bool() const { return ok(); }
    T& operator*() { return *value; }
    const T& operator*() const { return *value; }
    T* operator->() { return &*value; }
    const T* operator->() const { return &*value; }
};

}  // namespace Arena
