#pragma once

#include "config.hpp"

#if CBORKIT_ENABLE_STD

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <format>
#include <limits>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "decoder.hpp"
#include "errors.hpp"
#include "grammar.hpp"
#include "result.hpp"

namespace CborKit {

struct DiagnosticOptions {
    // One container element per line, indented.
    bool pretty = false;
    std::size_t indent = 2;
};

namespace diagnostic_detail {

inline void append_text_escaped(std::string& out, std::span<const std::uint8_t> s) {
    for (std::uint8_t b : s) {
        switch (b) {
        case '"':  out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        case '\n': out += "\\n"; break;
        case '\r': out += "\\r"; break;
        case '\t': out += "\\t"; break;
        default:
            if (b < 0x20 || b == 0x7F) {
                out += std::format("\\u{:04x}", b);
            } else {
                out += static_cast<char>(b);
            }
        }
    }
}

inline void append_hex(std::string& out, std::span<const std::uint8_t> s) {
    out += "h'";
    for (std::uint8_t b : s) {
        out += std::format("{:02x}", b);
    }
    out += '\'';
}

inline void append_float(std::string& out, double d) {
    if (std::isnan(d)) {
        out += "NaN";
    } else if (std::isinf(d)) {
        out += d < 0 ? "-Infinity" : "Infinity";
    } else if (d == std::trunc(d) && std::fabs(d) < 1e16) {
        out += std::format("{:.1f}", d);
    } else {
        out += std::format("{}", d);
    }
}

// Walks one item through the Decoder's public reads. Failures are left on the
// decoder.
class Printer {
public:
    Printer(Decoder& dec, std::string& out, const DiagnosticOptions& opts)
        : dec_(dec), out_(out), opts_(opts)
    {}

    bool item(std::size_t depth_budget, std::size_t level) {
        DataType type;
        if (!dec_.peek_type(type)) return false;

        switch (type) {
        case DataType::unsigned_integer: {
            std::uint64_t n = 0;
            if (!dec_.read_unsigned(n)) return false;
            out_ += std::format("{}", n);
            return true;
        }
        case DataType::negative_integer: {
            std::uint64_t n = 0;
            if (!dec_.read_negative(n)) return false;
            if (n == std::numeric_limits<std::uint64_t>::max()) {
                out_ += "-18446744073709551616";
            } else {
                out_ += std::format("-{}", n + 1);
            }
            return true;
        }
        case DataType::bytes: {
            std::span<const std::uint8_t> s;
            if (!dec_.read_bytes(s)) return false;
            append_hex(out_, s);
            return true;
        }
        case DataType::text: {
            std::span<const std::uint8_t> s;
            if (!dec_.read_text_bytes(s)) return false;
            out_ += '"';
            append_text_escaped(out_, s);
            out_ += '"';
            return true;
        }
        case DataType::bytes_indef:
        case DataType::text_indef: {
            const bool text = type == DataType::text_indef;
            bool first = true;
            out_ += "(_ ";
            auto chunk = [&](std::span<const std::uint8_t> s) {
                if (!first) out_ += ", ";
                first = false;
                if (text) {
                    out_ += '"';
                    append_text_escaped(out_, s);
                    out_ += '"';
                } else {
                    append_hex(out_, s);
                }
                return true;
            };
            const bool ok = text ? dec_.read_text_chunks(chunk) : dec_.read_bytes_chunks(chunk);
            if (!ok) return false;
            out_ += ')';
            return true;
        }
        case DataType::array:
        case DataType::array_indef:
            return container(false, depth_budget, level);
        case DataType::map:
        case DataType::map_indef:
            return container(true, depth_budget, level);
        case DataType::tag: {
            if (depth_budget == 0) return dec_.fail(DecodeError::DEPTH_LIMIT_EXCEEDED);
            std::uint64_t tag = 0;
            if (!dec_.read_tag(tag)) return false;
            out_ += std::format("{}(", tag);
            if (!item(depth_budget - 1, level)) return false;
            out_ += ')';
            return true;
        }
        case DataType::boolean: {
            bool b = false;
            if (!dec_.read_bool(b)) return false;
            out_ += b ? "true" : "false";
            return true;
        }
        case DataType::null:
            if (!dec_.read_null()) return false;
            out_ += "null";
            return true;
        case DataType::undefined:
            if (!dec_.read_undefined()) return false;
            out_ += "undefined";
            return true;
        case DataType::simple: {
            std::uint8_t v = 0;
            if (!dec_.read_simple(v)) return false;
            out_ += std::format("simple({})", v);
            return true;
        }
        case DataType::f16:
        case DataType::f32:
        case DataType::f64: {
            double d = 0;
            if (!dec_.read_f64(d)) return false;
            append_float(out_, d);
            return true;
        }
        case DataType::break_marker:
            return dec_.fail(DecodeError::INVALID_ENCODING);
        }
        return dec_.fail(DecodeError::INVALID_ENCODING);
    }

private:
    Decoder& dec_;
    std::string& out_;
    const DiagnosticOptions& opts_;

    void newline(std::size_t level) {
        out_ += '\n';
        out_.append(level * opts_.indent, ' ');
    }

    bool container(bool is_map, std::size_t depth_budget, std::size_t level) {
        if (depth_budget == 0) return dec_.fail(DecodeError::DEPTH_LIMIT_EXCEEDED);
        std::optional<std::uint64_t> len;
        if (!(is_map ? dec_.read_map(len) : dec_.read_array(len))) return false;

        out_ += is_map ? '{' : '[';
        if (!len) out_ += '_';

        std::uint64_t count = 0;
        while (true) {
            if (len) {
                if (count == *len) break;
            } else {
                if (dec_.is_break()) {
                    if (!dec_.read_break()) return false;
                    break;
                }
                if (dec_.at_end()) return dec_.fail(DecodeError::UNEXPECTED_END_OF_DATA);
            }
            if (count > 0) out_ += ',';
            if (opts_.pretty) {
                newline(level + 1);
            } else if (count > 0 || !len) {
                out_ += ' ';
            }
            if (!item(depth_budget - 1, level + 1)) return false;
            if (is_map) {
                out_ += ": ";
                if (!item(depth_budget - 1, level + 1)) return false;
            }
            ++count;
        }
        if (opts_.pretty && count > 0) newline(level);
        out_ += is_map ? '}' : ']';
        return true;
    }
};

} // namespace diagnostic_detail

// Appends one item in diagnostic notation and leaves the decoder after it.
// On failure the decoder carries the error and out holds a partial rendering.
inline bool DiagnosticItem(Decoder& dec, std::string& out, const DiagnosticOptions& opts = {}) {
    diagnostic_detail::Printer printer(dec, out, opts);
    return printer.item(dec.config().max_depth, 0);
}

// Renders a whole input holding exactly one item.
inline DecodeResult Diagnostic(std::span<const std::uint8_t> input, std::string& out,
                               const DecoderConfig& cfg = {}, const DiagnosticOptions& opts = {}) {
    Decoder dec(input, cfg);
    out.clear();
    if (!DiagnosticItem(dec, out, opts) || !dec.finish()) {
        return DecodeResult(dec.getError(), dec.position(), 0, error_path{});
    }
    return DecodeResult(DecodeError::NO_ERROR, dec.position(), 0, error_path{});
}

} // namespace CborKit

#endif // CBORKIT_ENABLE_STD
