#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>

namespace tw {

enum class [[nodiscard]] ErrorCode : uint8_t {
    Ok = 0,
    ShortBuffer,        // destination too small while writing
    CrcMismatch,
    InvalidMagic,
    UnsupportedVersion,
    UnexpectedEof,      // source too short while reading
    Overflow,           // size or shift bounds exceeded
    FlagConflict,       // reserved flag bits set
    DecodeInvariant,
    UnsupportedMsgType,
    InvalidVarint
};

// Fixed message per error kind, never allocates.
const char* describe(ErrorCode code) noexcept;

// Short snake_case identifier, used as a metric label.
const char* error_name(ErrorCode code) noexcept;

constexpr size_t ERROR_CODE_COUNT = static_cast<size_t>(ErrorCode::InvalidVarint) + 1;

inline bool ok(ErrorCode code) noexcept { return code == ErrorCode::Ok; }

template <typename T>
class Expected {
public:
    Expected(const T& value) : value_(value), error_(ErrorCode::Ok) {}
    Expected(T&& value) : value_(std::move(value)), error_(ErrorCode::Ok) {}
    Expected(ErrorCode error) : value_(std::nullopt), error_(error) {}

    [[nodiscard]] bool has_value() const { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const { return has_value(); }

    T& value() { return *value_; }
    const T& value() const { return *value_; }
    T* operator->() { return &*value_; }
    const T* operator->() const { return &*value_; }
    T& operator*() { return *value_; }
    const T& operator*() const { return *value_; }

    [[nodiscard]] ErrorCode error() const { return error_; }

private:
    std::optional<T> value_;
    ErrorCode error_;
};

} // namespace tw

// Early-return an ErrorCode from a function returning ErrorCode or Expected<T>
#define TW_TRY(expr)                          \
    do {                                      \
        ::tw::ErrorCode tw_rc_ = (expr);      \
        if (!::tw::ok(tw_rc_)) return tw_rc_; \
    } while (0)
