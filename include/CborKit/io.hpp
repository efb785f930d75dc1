#pragma once

#include <cstdint>
#include <iterator>
#include <vector>

#include "config.hpp"

namespace CborKit {

// Sink: an output iterator accepting bytes, bounded by a sentinel.
// Reaching the sentinel is how a fixed-capacity sink rejects a write.
template <class It>
concept ByteOutputIterator =
    std::output_iterator<It, std::uint8_t>;

template <class Sent, class It>
concept ByteSentinelForOut =
    std::sentinel_for<Sent, It>;

#if CBORKIT_ENABLE_STD
namespace io_details {

using vector_sink = std::back_insert_iterator<std::vector<std::uint8_t>>;

// Never reached: a vector sink grows on demand.
struct limitless_sentinel {};

constexpr bool operator==(const vector_sink&, const limitless_sentinel&) noexcept {
    return false;
}

constexpr bool operator==(const limitless_sentinel&, const vector_sink&) noexcept {
    return false;
}

constexpr bool operator!=(const vector_sink& it, const limitless_sentinel& s) noexcept {
    return !(it == s);
}

constexpr bool operator!=(const limitless_sentinel& s, const vector_sink& it) noexcept {
    return !(it == s);
}

} // namespace io_details
#endif

} // namespace CborKit
