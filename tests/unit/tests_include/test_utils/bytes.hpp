#pragma once

#include <array>
#include <cstddef>
#include <span>
#include <string_view>
#include <vector>

using ByteVector = std::vector<std::byte>;

/// std::array of bytes from integer literals
template <typename... T>
constexpr std::array<std::byte, sizeof...(T)> bytes(T... vals) {
    return { static_cast<std::byte>(vals)... };
}

inline void append(ByteVector &target, std::span<const std::byte> data) {
    target.insert(target.end(), data.begin(), data.end());
}

inline void append(ByteVector &target, std::string_view data) {
    append(target, std::as_bytes(std::span { data }));
}
