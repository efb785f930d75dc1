#pragma once

#include <cstdint>
#include <string_view>

namespace CborKit {

enum class DecodeError : std::uint8_t {
    NO_ERROR,
    UNEXPECTED_END_OF_DATA,
    TYPE_MISMATCH,
    INVALID_ENCODING,
    NON_CANONICAL_ENCODING,
    INVALID_UTF8,
    DEPTH_LIMIT_EXCEEDED,
    NUMERIC_VALUE_OUT_OF_RANGE,
    MISSING_FIELD,
    UNKNOWN_VARIANT,
    FIXED_SIZE_CONTAINER_LENGTH_MISMATCH,
    DUPLICATE_KEY_IN_MAP,
    EXCESS_DATA,
    CUSTOM_CODEC_ERROR
};

enum class EncodeError : std::uint8_t {
    NO_ERROR,
    SINK_ERROR,
    INVALID_ARGUMENT,
    LENGTH_MISMATCH,
    CUSTOM_CODEC_ERROR
};

constexpr std::string_view error_to_string(DecodeError e) {
    switch (e) {
    case DecodeError::NO_ERROR:                             return "NO_ERROR";
    case DecodeError::UNEXPECTED_END_OF_DATA:               return "UNEXPECTED_END_OF_DATA";
    case DecodeError::TYPE_MISMATCH:                        return "TYPE_MISMATCH";
    case DecodeError::INVALID_ENCODING:                     return "INVALID_ENCODING";
    case DecodeError::NON_CANONICAL_ENCODING:               return "NON_CANONICAL_ENCODING";
    case DecodeError::INVALID_UTF8:                         return "INVALID_UTF8";
    case DecodeError::DEPTH_LIMIT_EXCEEDED:                 return "DEPTH_LIMIT_EXCEEDED";
    case DecodeError::NUMERIC_VALUE_OUT_OF_RANGE:           return "NUMERIC_VALUE_OUT_OF_RANGE";
    case DecodeError::MISSING_FIELD:                        return "MISSING_FIELD";
    case DecodeError::UNKNOWN_VARIANT:                      return "UNKNOWN_VARIANT";
    case DecodeError::FIXED_SIZE_CONTAINER_LENGTH_MISMATCH: return "FIXED_SIZE_CONTAINER_LENGTH_MISMATCH";
    case DecodeError::DUPLICATE_KEY_IN_MAP:                 return "DUPLICATE_KEY_IN_MAP";
    case DecodeError::EXCESS_DATA:                          return "EXCESS_DATA";
    case DecodeError::CUSTOM_CODEC_ERROR:                   return "CUSTOM_CODEC_ERROR";
    }
    return "UNKNOWN_ERROR";
}

constexpr std::string_view error_to_string(EncodeError e) {
    switch (e) {
    case EncodeError::NO_ERROR:           return "NO_ERROR";
    case EncodeError::SINK_ERROR:         return "SINK_ERROR";
    case EncodeError::INVALID_ARGUMENT:   return "INVALID_ARGUMENT";
    case EncodeError::LENGTH_MISMATCH:    return "LENGTH_MISMATCH";
    case EncodeError::CUSTOM_CODEC_ERROR: return "CUSTOM_CODEC_ERROR";
    }
    return "UNKNOWN_ERROR";
}

} // namespace CborKit
