#pragma once

#include <bit>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string_view>

namespace CborKit {

enum class MajorType : std::uint8_t {
    unsigned_integer = 0,
    negative_integer = 1,
    byte_string      = 2,
    text_string      = 3,
    array            = 4,
    map              = 5,
    tag              = 6,
    simple           = 7
};

// Item kind as seen by Decoder::peek_type(), one level finer than MajorType.
enum class DataType : std::uint8_t {
    unsigned_integer,
    negative_integer,
    bytes,
    bytes_indef,
    text,
    text_indef,
    array,
    array_indef,
    map,
    map_indef,
    tag,
    boolean,
    null,
    undefined,
    simple,
    f16,
    f32,
    f64,
    break_marker
};

namespace grammar {

inline constexpr std::uint8_t max_immediate   = 23;
inline constexpr std::uint8_t ai_one_byte     = 24;
inline constexpr std::uint8_t ai_two_bytes    = 25;
inline constexpr std::uint8_t ai_four_bytes   = 26;
inline constexpr std::uint8_t ai_eight_bytes  = 27;
inline constexpr std::uint8_t ai_indefinite   = 31;

inline constexpr std::uint8_t break_byte      = 0xFF;

inline constexpr std::uint8_t simple_false     = 20;
inline constexpr std::uint8_t simple_true      = 21;
inline constexpr std::uint8_t simple_null      = 22;
inline constexpr std::uint8_t simple_undefined = 23;
// Simple values 24..31 are reserved and never well-formed.
inline constexpr std::uint8_t simple_reserved_first = 24;
inline constexpr std::uint8_t simple_reserved_last  = 31;

inline constexpr std::uint8_t initial_f16 = 0xF9;
inline constexpr std::uint8_t initial_f32 = 0xFA;
inline constexpr std::uint8_t initial_f64 = 0xFB;

constexpr std::uint8_t initial_byte(MajorType major, std::uint8_t additional_info) {
    return static_cast<std::uint8_t>((static_cast<std::uint8_t>(major) << 5) | (additional_info & 0x1Fu));
}

constexpr MajorType major_of(std::uint8_t initial) {
    return static_cast<MajorType>(initial >> 5);
}

constexpr std::uint8_t additional_info_of(std::uint8_t initial) {
    return static_cast<std::uint8_t>(initial & 0x1Fu);
}

// Number of bytes following the initial byte in the shortest encoding of n.
constexpr std::size_t argument_width(std::uint64_t n) {
    if (n <= max_immediate) return 0;
    if (n <= 0xFFu)         return 1;
    if (n <= 0xFFFFu)       return 2;
    if (n <= 0xFFFFFFFFu)   return 4;
    return 8;
}

constexpr std::uint8_t additional_info_for_width(std::size_t width) {
    switch (width) {
    case 1:  return ai_one_byte;
    case 2:  return ai_two_bytes;
    case 4:  return ai_four_bytes;
    default: return ai_eight_bytes;
    }
}

// Extra byte count announced by an additional-information value in 24..27.
constexpr std::size_t width_of_additional_info(std::uint8_t ai) {
    switch (ai) {
    case ai_one_byte:    return 1;
    case ai_two_bytes:   return 2;
    case ai_four_bytes:  return 4;
    case ai_eight_bytes: return 8;
    default:             return 0;
    }
}

constexpr bool may_be_indefinite(MajorType major) {
    return major == MajorType::byte_string || major == MajorType::text_string
           || major == MajorType::array || major == MajorType::map;
}

// IEEE 754 binary16 <-> binary32, bit exact and usable in constant expressions.
constexpr float half_to_float(std::uint16_t h) {
    const std::uint32_t sign = (static_cast<std::uint32_t>(h) & 0x8000u) << 16;
    const std::uint32_t exp  = (h >> 10) & 0x1Fu;
    std::uint32_t mant       = h & 0x3FFu;
    std::uint32_t bits       = 0;

    if (exp == 0) {
        if (mant == 0) {
            bits = sign;
        } else {
            int e = 1;
            while ((mant & 0x400u) == 0) {
                mant <<= 1;
                --e;
            }
            mant &= 0x3FFu;
            bits = sign | (static_cast<std::uint32_t>(e + 112) << 23) | (mant << 13);
        }
    } else if (exp == 0x1F) {
        bits = sign | 0x7F800000u | (mant << 13);
    } else {
        bits = sign | ((exp + 112) << 23) | (mant << 13);
    }
    return std::bit_cast<float>(bits);
}

// Round to nearest, ties to even. Overflow becomes infinity.
constexpr std::uint16_t float_to_half(float f) {
    const std::uint32_t x    = std::bit_cast<std::uint32_t>(f);
    const std::uint32_t sign = (x >> 16) & 0x8000u;
    const std::uint32_t exp  = (x >> 23) & 0xFFu;
    std::uint32_t mant       = x & 0x7FFFFFu;

    if (exp == 0xFF) {
        if (mant == 0) return static_cast<std::uint16_t>(sign | 0x7C00u);
        return static_cast<std::uint16_t>(sign | 0x7C00u | 0x200u | (mant >> 13));
    }

    const int e = static_cast<int>(exp) - 127 + 15;
    if (e >= 0x1F) {
        return static_cast<std::uint16_t>(sign | 0x7C00u);
    }
    if (e <= 0) {
        if (e < -10) return static_cast<std::uint16_t>(sign);
        mant |= 0x800000u;
        const int shift = 14 - e;
        std::uint32_t half_mant     = mant >> shift;
        const std::uint32_t rest    = mant & ((1u << shift) - 1u);
        const std::uint32_t halfway = 1u << (shift - 1);
        if (rest > halfway || (rest == halfway && (half_mant & 1u))) {
            ++half_mant;
        }
        return static_cast<std::uint16_t>(sign | half_mant);
    }

    std::uint32_t half      = sign | (static_cast<std::uint32_t>(e) << 10) | (mant >> 13);
    const std::uint32_t rest = mant & 0x1FFFu;
    if (rest > 0x1000u || (rest == 0x1000u && (half & 1u))) {
        ++half;
    }
    return static_cast<std::uint16_t>(half);
}

constexpr bool fits_half(float f) {
    return std::bit_cast<std::uint32_t>(half_to_float(float_to_half(f))) == std::bit_cast<std::uint32_t>(f);
}

constexpr bool fits_single(double d) {
    const std::uint64_t bits = std::bit_cast<std::uint64_t>(d);
    if (d != d) {
        // NaN survives only when the dropped payload bits are zero.
        return (bits & 0x1FFFFFFFull) == 0;
    }
    if (d == std::numeric_limits<double>::infinity() || d == -std::numeric_limits<double>::infinity()) {
        return true;
    }
    if (d > std::numeric_limits<float>::max() || d < -std::numeric_limits<float>::max()) {
        return false;
    }
    return std::bit_cast<std::uint64_t>(static_cast<double>(static_cast<float>(d))) == bits;
}

} // namespace grammar

constexpr std::string_view data_type_to_string(DataType t) {
    switch (t) {
    case DataType::unsigned_integer: return "unsigned integer";
    case DataType::negative_integer: return "negative integer";
    case DataType::bytes:            return "byte string";
    case DataType::bytes_indef:      return "indefinite byte string";
    case DataType::text:             return "text string";
    case DataType::text_indef:       return "indefinite text string";
    case DataType::array:            return "array";
    case DataType::array_indef:      return "indefinite array";
    case DataType::map:              return "map";
    case DataType::map_indef:        return "indefinite map";
    case DataType::tag:              return "tag";
    case DataType::boolean:          return "bool";
    case DataType::null:             return "null";
    case DataType::undefined:        return "undefined";
    case DataType::simple:           return "simple value";
    case DataType::f16:              return "f16";
    case DataType::f32:              return "f32";
    case DataType::f64:              return "f64";
    case DataType::break_marker:     return "break";
    }
    return "unknown";
}

} // namespace CborKit
