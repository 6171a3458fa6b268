#pragma once

#include <algorithm>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

namespace tw {

enum class MsgType : uint16_t {
    Trade = 1,
    Quote = 2
};

// Optional variable-length field; spans borrow from the caller's buffer.
using OptionalBytes = std::optional<std::span<const uint8_t>>;

// Content comparison; absent only equals absent.
inline bool same_bytes(const OptionalBytes& a, const OptionalBytes& b) {
    if (a.has_value() != b.has_value()) {
        return false;
    }
    return !a || std::ranges::equal(*a, *b);
}

inline std::span<const uint8_t> as_bytes(std::string_view text) {
    return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
}

inline std::string_view as_string_view(std::span<const uint8_t> bytes) {
    return {reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

} // namespace tw
