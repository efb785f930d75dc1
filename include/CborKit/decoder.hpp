#pragma once

#include <bit>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <span>
#include <string_view>
#include <type_traits>

#include "config.hpp"
#include "errors.hpp"
#include "grammar.hpp"

namespace CborKit {

enum class TryParseStatus {
    no_match,   // not our case, cursor unchanged
    ok,         // parsed and consumed
    error       // malformed, decoder error is set
};

struct IterationStatus {
    TryParseStatus status = TryParseStatus::error;
    bool has_value = false;
};

namespace decoder_details {

// RFC 3629: no overlong forms, no surrogates, nothing above U+10FFFF.
constexpr bool utf8_valid(std::span<const std::uint8_t> s) {
    std::size_t i = 0;
    while (i < s.size()) {
        const std::uint8_t c = s[i];
        if (c < 0x80) {
            ++i;
            continue;
        }
        std::size_t n = 0;
        std::uint8_t lo = 0x80, hi = 0xBF;
        if (c >= 0xC2 && c <= 0xDF) {
            n = 1;
        } else if (c == 0xE0) {
            n = 2; lo = 0xA0;
        } else if (c == 0xED) {
            n = 2; hi = 0x9F;
        } else if ((c >= 0xE1 && c <= 0xEC) || c == 0xEE || c == 0xEF) {
            n = 2;
        } else if (c == 0xF0) {
            n = 3; lo = 0x90;
        } else if (c >= 0xF1 && c <= 0xF3) {
            n = 3;
        } else if (c == 0xF4) {
            n = 3; hi = 0x8F;
        } else {
            return false;
        }
        if (s.size() - i - 1 < n) return false;
        if (s[i + 1] < lo || s[i + 1] > hi) return false;
        for (std::size_t k = 2; k <= n; ++k) {
            if (s[i + k] < 0x80 || s[i + k] > 0xBF) return false;
        }
        i += n + 1;
    }
    return true;
}

} // namespace decoder_details

// Cursor-driven reader over a borrowed byte sequence.
// Every read works on a scratch cursor and commits it only on success, so a
// failed call leaves position() where it was.
class Decoder {
public:
    using error_type = DecodeError;

    struct ArrayFrame {
        std::uint64_t remaining  = 0;
        bool          indefinite = false;
    };

    struct MapFrame {
        std::uint64_t remaining_pairs = 0;
        bool          indefinite      = false;
    };

    constexpr explicit Decoder(std::span<const std::uint8_t> input, DecoderConfig cfg = {})
        : in_(input), cfg_(cfg)
    {}

    constexpr Decoder(const std::uint8_t* first, const std::uint8_t* last, DecoderConfig cfg = {})
        : in_(first, static_cast<std::size_t>(last - first)), cfg_(cfg)
    {}

    // ========= Introspection =========

    constexpr error_type getError() const { return err_; }
    constexpr const DecoderConfig & config() const { return cfg_; }
    constexpr std::span<const std::uint8_t> input() const { return in_; }
    constexpr std::size_t position() const { return pos_; }
    constexpr std::size_t remaining() const { return in_.size() - pos_; }
    constexpr bool at_end() const { return pos_ == in_.size(); }
    constexpr const std::uint8_t* current() const { return in_.data() + pos_; }

    // Rewinds (or advances) to a position saved earlier and clears the error.
    constexpr bool set_position(std::size_t pos) {
        if (pos > in_.size()) {
            return setError(DecodeError::UNEXPECTED_END_OF_DATA);
        }
        pos_ = pos;
        err_ = DecodeError::NO_ERROR;
        return true;
    }

    // Lets a structural codec record its own failure on the decoder.
    constexpr bool fail(DecodeError e) {
        return setError(e);
    }

    // ========= Probing =========

    constexpr bool peek_major(MajorType& out) {
        std::uint8_t ib = 0;
        if (!peek_initial(pos_, ib)) return false;
        out = grammar::major_of(ib);
        return true;
    }

    constexpr bool peek_type(DataType& out) {
        std::uint8_t ib = 0;
        if (!peek_initial(pos_, ib)) return false;
        const std::uint8_t ai = grammar::additional_info_of(ib);
        const bool indef = ai == grammar::ai_indefinite;
        if (ai > grammar::ai_eight_bytes && ai < grammar::ai_indefinite) {
            return setError(DecodeError::INVALID_ENCODING);
        }
        if (indef && !grammar::may_be_indefinite(grammar::major_of(ib)) && grammar::major_of(ib) != MajorType::simple) {
            return setError(DecodeError::INVALID_ENCODING);
        }
        switch (grammar::major_of(ib)) {
        case MajorType::unsigned_integer: out = DataType::unsigned_integer; return true;
        case MajorType::negative_integer: out = DataType::negative_integer; return true;
        case MajorType::byte_string:      out = indef ? DataType::bytes_indef : DataType::bytes; return true;
        case MajorType::text_string:      out = indef ? DataType::text_indef : DataType::text; return true;
        case MajorType::array:            out = indef ? DataType::array_indef : DataType::array; return true;
        case MajorType::map:              out = indef ? DataType::map_indef : DataType::map; return true;
        case MajorType::tag:              out = DataType::tag; return true;
        case MajorType::simple:
            switch (ai) {
            case grammar::simple_false:
            case grammar::simple_true:      out = DataType::boolean; return true;
            case grammar::simple_null:      out = DataType::null; return true;
            case grammar::simple_undefined: out = DataType::undefined; return true;
            case grammar::ai_two_bytes:     out = DataType::f16; return true;
            case grammar::ai_four_bytes:    out = DataType::f32; return true;
            case grammar::ai_eight_bytes:   out = DataType::f64; return true;
            case grammar::ai_indefinite:    out = DataType::break_marker; return true;
            default:                        out = DataType::simple; return true;
            }
        }
        return setError(DecodeError::INVALID_ENCODING);
    }

    constexpr bool is_break() const {
        return pos_ < in_.size() && in_[pos_] == grammar::break_byte;
    }

    constexpr bool read_break() {
        if (pos_ >= in_.size()) return setError(DecodeError::UNEXPECTED_END_OF_DATA);
        if (in_[pos_] != grammar::break_byte) return setError(DecodeError::TYPE_MISMATCH);
        ++pos_;
        return true;
    }

    // ========= Integers =========

    constexpr bool read_unsigned(std::uint64_t& out) {
        std::size_t p = pos_;
        Head h;
        if (!expect_major(p, MajorType::unsigned_integer, h)) return false;
        out = h.argument;
        pos_ = p;
        return true;
    }

    // Raw argument n of a negative integer, whose value is -1 - n.
    constexpr bool read_negative(std::uint64_t& out) {
        std::size_t p = pos_;
        Head h;
        if (!expect_major(p, MajorType::negative_integer, h)) return false;
        out = h.argument;
        pos_ = p;
        return true;
    }

    // Major type 0 or 1, range checked against Int.
    template<std::integral Int>
        requires (!std::is_same_v<Int, bool>)
    constexpr bool read_int(Int& out) {
        std::size_t p = pos_;
        std::uint8_t ib = 0;
        if (!peek_initial(p, ib)) return false;
        const MajorType major = grammar::major_of(ib);
        if (ib == grammar::break_byte) return setError(DecodeError::INVALID_ENCODING);
        if (major != MajorType::unsigned_integer && major != MajorType::negative_integer) {
            return setError(DecodeError::TYPE_MISMATCH);
        }
        Head h;
        if (!read_head(p, h)) return false;

        if (major == MajorType::unsigned_integer) {
            if (h.argument > static_cast<std::uint64_t>(std::numeric_limits<Int>::max())) {
                return setError(DecodeError::NUMERIC_VALUE_OUT_OF_RANGE);
            }
            out = static_cast<Int>(h.argument);
        } else {
            if constexpr (std::is_unsigned_v<Int>) {
                return setError(DecodeError::NUMERIC_VALUE_OUT_OF_RANGE);
            } else {
                // -1 - n >= min  <=>  n <= max
                if (h.argument > static_cast<std::uint64_t>(std::numeric_limits<Int>::max())) {
                    return setError(DecodeError::NUMERIC_VALUE_OUT_OF_RANGE);
                }
                out = static_cast<Int>(-1 - static_cast<std::int64_t>(h.argument));
            }
        }
        pos_ = p;
        return true;
    }

    // ========= Strings =========

    // Definite-length byte string, borrowed from the input.
    constexpr bool read_bytes(std::span<const std::uint8_t>& out) {
        std::size_t p = pos_;
        if (!read_definite_string(p, MajorType::byte_string, out)) return false;
        pos_ = p;
        return true;
    }

    // Definite-length text string as raw UTF-8 bytes, validated.
    constexpr bool read_text_bytes(std::span<const std::uint8_t>& out) {
        std::size_t p = pos_;
        std::span<const std::uint8_t> s;
        if (!read_definite_string(p, MajorType::text_string, s)) return false;
        if (!decoder_details::utf8_valid(s)) return setError(DecodeError::INVALID_UTF8);
        out = s;
        pos_ = p;
        return true;
    }

    // Definite-length text string, borrowed from the input.
    bool read_text(std::string_view& out) {
        std::span<const std::uint8_t> s;
        if (!read_text_bytes(s)) return false;
        out = std::string_view(reinterpret_cast<const char*>(s.data()), s.size());
        return true;
    }

    // Definite or indefinite byte string; consumer(span) is called per chunk
    // and returns false to abort.
    template<class Consumer>
    constexpr bool read_bytes_chunks(Consumer&& consumer) {
        return read_chunks(MajorType::byte_string, consumer);
    }

    template<class Consumer>
    constexpr bool read_text_chunks(Consumer&& consumer) {
        return read_chunks(MajorType::text_string, consumer);
    }

    // ========= Containers =========

    // Header only. std::nullopt means indefinite length; the caller then
    // watches for is_break().
    constexpr bool read_array(std::optional<std::uint64_t>& len) {
        return read_container_header(MajorType::array, len);
    }

    constexpr bool read_map(std::optional<std::uint64_t>& len) {
        return read_container_header(MajorType::map, len);
    }

    constexpr IterationStatus read_array_begin(ArrayFrame& frame) {
        std::optional<std::uint64_t> len;
        if (!read_array(len)) return {TryParseStatus::error, false};
        frame.indefinite = !len.has_value();
        frame.remaining  = len.value_or(0);
        return next_status(frame.indefinite, frame.remaining);
    }

    constexpr IterationStatus read_map_begin(MapFrame& frame) {
        std::optional<std::uint64_t> len;
        if (!read_map(len)) return {TryParseStatus::error, false};
        frame.indefinite      = !len.has_value();
        frame.remaining_pairs = len.value_or(0);
        return next_status(frame.indefinite, frame.remaining_pairs);
    }

    constexpr IterationStatus advance_after_value(ArrayFrame& frame) {
        if (!frame.indefinite) --frame.remaining;
        return next_status(frame.indefinite, frame.remaining);
    }

    constexpr IterationStatus advance_after_value(MapFrame& frame) {
        if (!frame.indefinite) --frame.remaining_pairs;
        return next_status(frame.indefinite, frame.remaining_pairs);
    }

    // ========= Simple values, floats, tags =========

    constexpr bool read_bool(bool& out) {
        std::uint8_t ib = 0;
        if (!peek_initial(pos_, ib)) return false;
        if (ib == grammar::initial_byte(MajorType::simple, grammar::simple_false)) {
            out = false;
        } else if (ib == grammar::initial_byte(MajorType::simple, grammar::simple_true)) {
            out = true;
        } else {
            return mismatch(ib);
        }
        ++pos_;
        return true;
    }

    constexpr bool read_null() {
        return read_fixed_simple(grammar::simple_null);
    }

    constexpr bool read_undefined() {
        return read_fixed_simple(grammar::simple_undefined);
    }

    // Consumes a null if one is next; anything else is no_match.
    constexpr TryParseStatus try_read_null() {
        std::uint8_t ib = 0;
        if (!peek_initial(pos_, ib)) return TryParseStatus::error;
        if (ib != grammar::initial_byte(MajorType::simple, grammar::simple_null)) return TryParseStatus::no_match;
        ++pos_;
        return TryParseStatus::ok;
    }

    constexpr bool read_simple(std::uint8_t& out) {
        std::size_t p = pos_;
        Head h;
        if (!expect_major(p, MajorType::simple, h)) return false;
        if (h.ai > grammar::ai_one_byte) {
            return setError(DecodeError::TYPE_MISMATCH);
        }
        out = static_cast<std::uint8_t>(h.argument);
        pos_ = p;
        return true;
    }

#if CBORKIT_ENABLE_HALF
    constexpr bool read_f16(float& out) {
        std::size_t p = pos_;
        Head h;
        if (!expect_major(p, MajorType::simple, h)) return false;
        if (h.ai != grammar::ai_two_bytes) return setError(DecodeError::TYPE_MISMATCH);
        out = grammar::half_to_float(static_cast<std::uint16_t>(h.argument));
        pos_ = p;
        return true;
    }
#endif

    // Accepts f16 (when enabled) and f32.
    constexpr bool read_f32(float& out) {
        std::size_t p = pos_;
        Head h;
        if (!expect_major(p, MajorType::simple, h)) return false;
        switch (h.ai) {
#if CBORKIT_ENABLE_HALF
        case grammar::ai_two_bytes:
            out = grammar::half_to_float(static_cast<std::uint16_t>(h.argument));
            break;
#endif
        case grammar::ai_four_bytes: {
            const float f = std::bit_cast<float>(static_cast<std::uint32_t>(h.argument));
            if (config::half_enabled() && cfg_.strict && grammar::fits_half(f)) {
                return setError(DecodeError::NON_CANONICAL_ENCODING);
            }
            out = f;
            break;
        }
        default:
            return setError(DecodeError::TYPE_MISMATCH);
        }
        pos_ = p;
        return true;
    }

    // Accepts f16 (when enabled), f32 and f64.
    constexpr bool read_f64(double& out) {
        std::size_t p = pos_;
        Head h;
        if (!expect_major(p, MajorType::simple, h)) return false;
        switch (h.ai) {
#if CBORKIT_ENABLE_HALF
        case grammar::ai_two_bytes:
            out = grammar::half_to_float(static_cast<std::uint16_t>(h.argument));
            break;
#endif
        case grammar::ai_four_bytes: {
            const float f = std::bit_cast<float>(static_cast<std::uint32_t>(h.argument));
            if (config::half_enabled() && cfg_.strict && grammar::fits_half(f)) {
                return setError(DecodeError::NON_CANONICAL_ENCODING);
            }
            out = f;
            break;
        }
        case grammar::ai_eight_bytes: {
            const double d = std::bit_cast<double>(h.argument);
            if (cfg_.strict && grammar::fits_single(d)) return setError(DecodeError::NON_CANONICAL_ENCODING);
            out = d;
            break;
        }
        default:
            return setError(DecodeError::TYPE_MISMATCH);
        }
        pos_ = p;
        return true;
    }

    constexpr bool read_tag(std::uint64_t& out) {
        std::size_t p = pos_;
        Head h;
        if (!expect_major(p, MajorType::tag, h)) return false;
        out = h.argument;
        pos_ = p;
        return true;
    }

    // ========= Skipping =========

#if CBORKIT_ENABLE_SKIP
    // Consumes one complete value of any shape without producing it.
    constexpr bool skip() {
        return skip_value(cfg_.max_depth);
    }

    // depth_budget: containers and tags that may still be entered.
    constexpr bool skip_value(std::size_t depth_budget) {
        std::size_t p = pos_;
        if (!skip_at(p, depth_budget)) return false;
        pos_ = p;
        return true;
    }
#endif

    // ========= Finalization =========

    constexpr bool finish() {
        if (pos_ != in_.size()) return setError(DecodeError::EXCESS_DATA);
        return true;
    }

private:
    struct Head {
        MajorType     major    = MajorType::unsigned_integer;
        std::uint8_t  ai       = 0;
        std::uint64_t argument = 0;
        constexpr bool indefinite() const { return ai == grammar::ai_indefinite; }
    };

    std::span<const std::uint8_t> in_;
    DecoderConfig cfg_;
    std::size_t pos_ = 0;
    error_type err_ = DecodeError::NO_ERROR;

    constexpr bool setError(error_type e) {
        err_ = e;
        return false;
    }

    constexpr bool peek_initial(std::size_t p, std::uint8_t& ib) {
        if (p >= in_.size()) return setError(DecodeError::UNEXPECTED_END_OF_DATA);
        ib = in_[p];
        return true;
    }

    constexpr bool mismatch(std::uint8_t ib) {
        if (ib == grammar::break_byte) return setError(DecodeError::INVALID_ENCODING);
        return setError(DecodeError::TYPE_MISMATCH);
    }

    // Initial byte and argument at p; advances p past them.
    constexpr bool read_head(std::size_t& p, Head& h) {
        std::uint8_t ib = 0;
        if (!peek_initial(p, ib)) return false;
        h.major    = grammar::major_of(ib);
        h.ai       = grammar::additional_info_of(ib);
        h.argument = 0;
        std::size_t q = p + 1;

        if (h.ai <= grammar::max_immediate) {
            h.argument = h.ai;
        } else if (h.ai <= grammar::ai_eight_bytes) {
            const std::size_t width = grammar::width_of_additional_info(h.ai);
            if (in_.size() - q < width) return setError(DecodeError::UNEXPECTED_END_OF_DATA);
            for (std::size_t i = 0; i < width; ++i) {
                h.argument = (h.argument << 8) | in_[q + i];
            }
            q += width;
            if (h.major == MajorType::simple) {
                if (h.ai == grammar::ai_one_byte && h.argument < 32) {
                    return setError(DecodeError::INVALID_ENCODING);
                }
            } else if (cfg_.strict && grammar::argument_width(h.argument) != width) {
                return setError(DecodeError::NON_CANONICAL_ENCODING);
            }
        } else if (h.ai == grammar::ai_indefinite) {
            if (!grammar::may_be_indefinite(h.major) && h.major != MajorType::simple) {
                return setError(DecodeError::INVALID_ENCODING);
            }
        } else {
            return setError(DecodeError::INVALID_ENCODING);
        }
        p = q;
        return true;
    }

    constexpr bool expect_major(std::size_t& p, MajorType major, Head& h) {
        std::uint8_t ib = 0;
        if (!peek_initial(p, ib)) return false;
        if (ib == grammar::break_byte) return setError(DecodeError::INVALID_ENCODING);
        if (grammar::major_of(ib) != major) return setError(DecodeError::TYPE_MISMATCH);
        return read_head(p, h);
    }

    constexpr bool read_fixed_simple(std::uint8_t value) {
        std::uint8_t ib = 0;
        if (!peek_initial(pos_, ib)) return false;
        if (ib != grammar::initial_byte(MajorType::simple, value)) return mismatch(ib);
        ++pos_;
        return true;
    }

    constexpr bool take(std::size_t& p, std::uint64_t len, std::span<const std::uint8_t>& out) {
        if (len > in_.size() - p) return setError(DecodeError::UNEXPECTED_END_OF_DATA);
        out = in_.subspan(p, static_cast<std::size_t>(len));
        p += static_cast<std::size_t>(len);
        return true;
    }

    constexpr bool read_definite_string(std::size_t& p, MajorType major, std::span<const std::uint8_t>& out) {
        Head h;
        if (!expect_major(p, major, h)) return false;
        if (h.indefinite()) return setError(DecodeError::TYPE_MISMATCH);
        return take(p, h.argument, out);
    }

    template<class Consumer>
    constexpr bool read_chunks(MajorType major, Consumer& consumer) {
        std::size_t p = pos_;
        Head h;
        if (!expect_major(p, major, h)) return false;
        const bool text = major == MajorType::text_string;

        auto deliver = [&](std::span<const std::uint8_t> chunk) {
            if (text && !decoder_details::utf8_valid(chunk)) return setError(DecodeError::INVALID_UTF8);
            if (!consumer(chunk)) return setError(DecodeError::CUSTOM_CODEC_ERROR);
            return true;
        };

        if (!h.indefinite()) {
            std::span<const std::uint8_t> chunk;
            if (!take(p, h.argument, chunk)) return false;
            if (!deliver(chunk)) return false;
            pos_ = p;
            return true;
        }

        while (true) {
            if (p >= in_.size()) return setError(DecodeError::UNEXPECTED_END_OF_DATA);
            if (in_[p] == grammar::break_byte) {
                ++p;
                break;
            }
            Head c;
            if (!read_head(p, c)) return false;
            // Chunks are definite strings of the same major type.
            if (c.major != major || c.indefinite()) return setError(DecodeError::INVALID_ENCODING);
            std::span<const std::uint8_t> chunk;
            if (!take(p, c.argument, chunk)) return false;
            if (!deliver(chunk)) return false;
        }
        pos_ = p;
        return true;
    }

    constexpr bool read_container_header(MajorType major, std::optional<std::uint64_t>& len) {
        std::size_t p = pos_;
        Head h;
        if (!expect_major(p, major, h)) return false;
        if (h.indefinite()) {
            len.reset();
        } else {
            len = h.argument;
        }
        pos_ = p;
        return true;
    }

    constexpr IterationStatus next_status(bool indefinite, std::uint64_t remaining) {
        if (!indefinite) {
            return {TryParseStatus::ok, remaining > 0};
        }
        if (pos_ >= in_.size()) {
            setError(DecodeError::UNEXPECTED_END_OF_DATA);
            return {TryParseStatus::error, false};
        }
        if (in_[pos_] == grammar::break_byte) {
            ++pos_;
            return {TryParseStatus::ok, false};
        }
        return {TryParseStatus::ok, true};
    }

#if CBORKIT_ENABLE_SKIP
    constexpr bool skip_at(std::size_t& p, std::size_t depth) {
        std::uint8_t ib = 0;
        if (!peek_initial(p, ib)) return false;
        if (ib == grammar::break_byte) return setError(DecodeError::INVALID_ENCODING);
        Head h;
        if (!read_head(p, h)) return false;

        switch (h.major) {
        case MajorType::unsigned_integer:
        case MajorType::negative_integer:
        case MajorType::simple:
            return true;

        case MajorType::byte_string:
        case MajorType::text_string: {
            std::span<const std::uint8_t> chunk;
            if (!h.indefinite()) return take(p, h.argument, chunk);
            while (true) {
                if (p >= in_.size()) return setError(DecodeError::UNEXPECTED_END_OF_DATA);
                if (in_[p] == grammar::break_byte) {
                    ++p;
                    return true;
                }
                Head c;
                if (!read_head(p, c)) return false;
                if (c.major != h.major || c.indefinite()) return setError(DecodeError::INVALID_ENCODING);
                if (!take(p, c.argument, chunk)) return false;
            }
        }

        case MajorType::array:
        case MajorType::map: {
            if (depth == 0) return setError(DecodeError::DEPTH_LIMIT_EXCEEDED);
            const std::uint64_t per_entry = h.major == MajorType::map ? 2 : 1;
            if (h.indefinite()) {
                while (true) {
                    if (p >= in_.size()) return setError(DecodeError::UNEXPECTED_END_OF_DATA);
                    if (in_[p] == grammar::break_byte) {
                        ++p;
                        return true;
                    }
                    for (std::uint64_t k = 0; k < per_entry; ++k) {
                        if (!skip_at(p, depth - 1)) return false;
                    }
                }
            }
            for (std::uint64_t i = 0; i < h.argument; ++i) {
                for (std::uint64_t k = 0; k < per_entry; ++k) {
                    if (!skip_at(p, depth - 1)) return false;
                }
            }
            return true;
        }

        case MajorType::tag:
            if (depth == 0) return setError(DecodeError::DEPTH_LIMIT_EXCEEDED);
            return skip_at(p, depth - 1);
        }
        return setError(DecodeError::INVALID_ENCODING);
    }
#endif
};

namespace decoder {

template<typename D>
concept DecoderLike = requires(D& d,
                               const D& cd,
                               std::uint64_t& u64,
                               bool& b,
                               float& f,
                               double& dbl,
                               DataType& dt,
                               std::optional<std::uint64_t>& len,
                               std::span<const std::uint8_t>& bytes,
                               std::size_t pos,
                               typename D::ArrayFrame& arrFrame,
                               typename D::MapFrame& mapFrame) {
    typename D::error_type;
    typename D::ArrayFrame;
    typename D::MapFrame;

    { cd.getError() } -> std::same_as<typename D::error_type>;
    { cd.position() } -> std::same_as<std::size_t>;
    { d.set_position(pos) } -> std::same_as<bool>;
    { d.peek_type(dt) } -> std::same_as<bool>;
    { d.read_unsigned(u64) } -> std::same_as<bool>;
    { d.read_negative(u64) } -> std::same_as<bool>;
    { d.read_bool(b) } -> std::same_as<bool>;
    { d.read_null() } -> std::same_as<bool>;
    { d.read_f32(f) } -> std::same_as<bool>;
    { d.read_f64(dbl) } -> std::same_as<bool>;
    { d.read_tag(u64) } -> std::same_as<bool>;
    { d.read_bytes(bytes) } -> std::same_as<bool>;
    { d.read_array(len) } -> std::same_as<bool>;
    { d.read_map(len) } -> std::same_as<bool>;
    { cd.is_break() } -> std::same_as<bool>;
    { d.read_break() } -> std::same_as<bool>;
    { d.read_array_begin(arrFrame) } -> std::same_as<IterationStatus>;
    { d.read_map_begin(mapFrame) } -> std::same_as<IterationStatus>;
    { d.advance_after_value(arrFrame) } -> std::same_as<IterationStatus>;
    { d.advance_after_value(mapFrame) } -> std::same_as<IterationStatus>;
    { d.finish() } -> std::same_as<bool>;
};

static_assert(DecoderLike<Decoder>);

} // namespace decoder

} // namespace CborKit
