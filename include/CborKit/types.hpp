#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

#include "config.hpp"

#if CBORKIT_ENABLE_ALLOC
#include <vector>
#endif

namespace CborKit {

// Explicit CBOR null, for models that carry it as a value.
struct Null {
    constexpr bool operator==(const Null&) const = default;
};

struct Undefined {
    constexpr bool operator==(const Undefined&) const = default;
};

// Simple value other than false/true/null/undefined.
struct Simple {
    std::uint8_t value = 0;
    constexpr bool operator==(const Simple&) const = default;
};

// Byte string contents. std::vector<std::uint8_t> on its own encodes as an
// array of integers; these wrappers select major type 2.
#if CBORKIT_ENABLE_ALLOC
struct ByteVec {
    std::vector<std::uint8_t> bytes;
    constexpr bool operator==(const ByteVec&) const = default;
};
#endif

// Borrows from the decoder input; only definite-length strings decode into it.
struct ByteSlice {
    std::span<const std::uint8_t> bytes;
    constexpr bool operator==(const ByteSlice& other) const {
        return std::ranges::equal(bytes, other.bytes);
    }
};

// Exactly N bytes on the wire.
template <std::size_t N>
struct ByteArray {
    std::array<std::uint8_t, N> bytes{};
    constexpr bool operator==(const ByteArray&) const = default;
};

// Tag number TagN followed by the encoding of T.
template <std::uint64_t TagN, class T>
struct Tagged {
    static constexpr std::uint64_t tag = TagN;
    using value_type = T;
    T value{};
    constexpr bool operator==(const Tagged&) const = default;
};

} // namespace CborKit
