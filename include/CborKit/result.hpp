#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

#include "config.hpp"
#include "errors.hpp"

namespace CborKit {

struct PathElement {
    enum class Kind : std::uint8_t {
        array_item,   // position inside an array
        map_entry,    // position inside a map
        field,        // struct field wire index
        variant,      // variant index
        tag           // tag number
    };
    Kind kind = Kind::array_item;
    std::uint64_t value = 0;

    constexpr bool operator==(const PathElement&) const = default;
};

// Location of a failure inside the value tree. Steps deeper than Capacity are
// counted but not stored.
template <std::size_t Capacity>
class ErrorPath {
    std::array<PathElement, Capacity> items_{};
    std::size_t depth_ = 0;

public:
    constexpr void push(PathElement e) {
        if (depth_ < Capacity) items_[depth_] = e;
        ++depth_;
    }
    constexpr void pop() {
        if (depth_ > 0) --depth_;
    }
    constexpr void truncate(std::size_t depth) {
        if (depth < depth_) depth_ = depth;
    }
    constexpr void setTop(std::uint64_t value) {
        if (depth_ > 0 && depth_ <= Capacity) items_[depth_ - 1].value = value;
    }

    constexpr std::size_t depth() const { return depth_; }
    constexpr std::size_t storedDepth() const { return depth_ < Capacity ? depth_ : Capacity; }
    constexpr bool truncated() const { return depth_ > Capacity; }
    constexpr const PathElement& operator[](std::size_t i) const { return items_[i]; }
};

using error_path = ErrorPath<CBORKIT_ERROR_PATH_CAPACITY>;

class EncodeResult {
    EncodeError m_error = EncodeError::NO_ERROR;
    std::size_t m_bytesWritten = 0;
    error_path m_path;

public:
    constexpr EncodeResult(EncodeError err, std::size_t written, const error_path& path)
        : m_error(err), m_bytesWritten(written), m_path(path)
    {}
    constexpr operator bool() const {
        return m_error == EncodeError::NO_ERROR;
    }
    constexpr EncodeError error() const {
        return m_error;
    }
    constexpr std::size_t bytesWritten() const {
        return m_bytesWritten;
    }
    constexpr const error_path& errorPath() const {
        return m_path;
    }
};

class DecodeResult {
    DecodeError m_error = DecodeError::NO_ERROR;
    std::size_t m_offset = 0;
    std::uint64_t m_detail = 0;
    error_path m_path;

public:
    constexpr DecodeResult(DecodeError err, std::size_t offset, std::uint64_t detail, const error_path& path)
        : m_error(err), m_offset(offset), m_detail(detail), m_path(path)
    {}
    constexpr operator bool() const {
        return m_error == DecodeError::NO_ERROR;
    }
    constexpr DecodeError error() const {
        return m_error;
    }
    // Input offset of the item that failed, or of the end of the decoded
    // item on success.
    constexpr std::size_t offset() const {
        return m_offset;
    }
    // MISSING_FIELD: wire index of the field. UNKNOWN_VARIANT: the variant
    // number found on the wire.
    constexpr std::uint64_t detail() const {
        return m_detail;
    }
    constexpr const error_path& errorPath() const {
        return m_path;
    }
};

} // namespace CborKit
