#pragma once

#include "config.hpp"

#if CBORKIT_ENABLE_STD

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <format>
#include <span>
#include <string>

#include "errors.hpp"
#include "result.hpp"

namespace CborKit {

namespace error_formatting_detail {

inline std::string hex_window(std::span<const std::uint8_t> input, std::size_t offset, std::size_t window) {
    if (input.empty()) {
        return {};
    }
    const std::size_t pos   = std::min(offset, input.size());
    const std::size_t first = pos > window ? pos - window : 0;
    const std::size_t last  = std::min(input.size(), pos + window + 1);

    std::string out = first > 0 ? "..." : "";
    for (std::size_t i = first; i < last; ++i) {
        if (i != first) out += ' ';
        if (i == pos) {
            out += std::format("[{:02x}]", input[i]);
        } else {
            out += std::format("{:02x}", input[i]);
        }
    }
    if (pos == input.size()) {
        out += " [<end>]";
    } else if (last < input.size()) {
        out += "...";
    }
    return out;
}

} // namespace error_formatting_detail

// $ is the top-level item; [i] an array position, {i} a map entry, .i a
// struct field index, <i> a variant index, #n a tag.
inline std::string ErrorPathToString(const error_path& path) {
    std::string out = "$";
    for (std::size_t i = 0; i < path.storedDepth(); ++i) {
        const PathElement& e = path[i];
        switch (e.kind) {
        case PathElement::Kind::array_item: out += std::format("[{}]", e.value); break;
        case PathElement::Kind::map_entry:  out += std::format("{{{}}}", e.value); break;
        case PathElement::Kind::field:      out += std::format(".{}", e.value); break;
        case PathElement::Kind::variant:    out += std::format("<{}>", e.value); break;
        case PathElement::Kind::tag:        out += std::format("#{}", e.value); break;
        }
    }
    if (path.truncated()) {
        out += std::format("...({} more)", path.depth() - path.storedDepth());
    }
    return out;
}

inline std::string DecodeResultToString(const DecodeResult& res, std::span<const std::uint8_t> input,
                                        std::size_t window = 8) {
    if (res) {
        return std::format("decoded {} bytes", res.offset());
    }
    std::string detail;
    if (res.error() == DecodeError::MISSING_FIELD) {
        detail = std::format(" (field index {})", res.detail());
    } else if (res.error() == DecodeError::UNKNOWN_VARIANT) {
        detail = std::format(" (variant {})", res.detail());
    }
    std::string fragment;
    if (!input.empty()) {
        fragment = std::format(": '{}'", error_formatting_detail::hex_window(input, res.offset(), window));
    }
    return std::format("When decoding {}, decoding error '{}'{} at offset {}{}",
                       ErrorPathToString(res.errorPath()), error_to_string(res.error()), detail,
                       res.offset(), fragment);
}

inline std::string EncodeResultToString(const EncodeResult& res) {
    if (res) {
        return std::format("encoded {} bytes", res.bytesWritten());
    }
    return std::format("When encoding {}, encoding error '{}' after {} bytes",
                       ErrorPathToString(res.errorPath()), error_to_string(res.error()), res.bytesWritten());
}

} // namespace CborKit

#endif // CBORKIT_ENABLE_STD
