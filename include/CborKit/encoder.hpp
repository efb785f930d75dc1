#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <span>
#include <string_view>
#include <type_traits>
#include <bit>

#include "config.hpp"
#include "errors.hpp"
#include "grammar.hpp"
#include "io.hpp"

namespace CborKit {

// Size passed to write_array_begin / write_map_begin to request the
// indefinite-length form.
inline constexpr std::size_t indefinite_length = std::numeric_limits<std::size_t>::max();

template <ByteOutputIterator It, ByteSentinelForOut<It> Sent>
class Encoder {
public:
    using iterator_type = It;
    using error_type    = EncodeError;

    struct ArrayFrame {
        std::size_t expected_size = 0;
        std::size_t written       = 0;
        bool        indefinite    = false;
    };

    struct MapFrame {
        std::size_t expected_pairs = 0;
        std::size_t written_pairs  = 0;
        bool        expecting_key  = true;
        bool        indefinite     = false;
    };

    constexpr Encoder(It first, Sent last, EncoderConfig cfg = {})
        : m_current(first), end_(last), cfg_(cfg)
    {}

    constexpr It & current() {
        return m_current;
    }

    constexpr error_type getError() const { return err_; }
    constexpr std::size_t bytesWritten() const { return written_; }
    constexpr const EncoderConfig & config() const { return cfg_; }

    // ========= Integers =========

    constexpr bool write_unsigned(std::uint64_t n) {
        return write_head(MajorType::unsigned_integer, n);
    }

    // Encodes the integer -1 - n.
    constexpr bool write_negative(std::uint64_t n) {
        return write_head(MajorType::negative_integer, n);
    }

    template<std::integral Int>
        requires (!std::is_same_v<Int, bool>)
    constexpr bool write_int(Int value) {
        if constexpr (std::is_signed_v<Int>) {
            if (value < 0) {
                // -1 - value without overflowing on the minimum value
                const std::uint64_t n = ~static_cast<std::uint64_t>(static_cast<std::int64_t>(value));
                return write_negative(n);
            }
        }
        return write_unsigned(static_cast<std::uint64_t>(value));
    }

    // ========= Strings =========

    constexpr bool write_bytes(std::span<const std::uint8_t> data) {
        if (!write_head(MajorType::byte_string, data.size())) return false;
        for (std::uint8_t b : data) {
            if (!write_byte(b)) return false;
        }
        return true;
    }

    constexpr bool write_text(std::string_view s) {
        if (!write_head(MajorType::text_string, s.size())) return false;
        for (char c : s) {
            if (!write_byte(static_cast<std::uint8_t>(c))) return false;
        }
        return true;
    }

    // ========= Containers =========

    // The caller emits exactly len items (2 * len for maps) afterwards.
    constexpr bool write_array_header(std::uint64_t len) {
        return write_head(MajorType::array, len);
    }

    constexpr bool write_map_header(std::uint64_t len) {
        return write_head(MajorType::map, len);
    }

    constexpr bool begin_array() { return write_byte(grammar::initial_byte(MajorType::array, grammar::ai_indefinite)); }
    constexpr bool begin_map()   { return write_byte(grammar::initial_byte(MajorType::map, grammar::ai_indefinite)); }
    constexpr bool begin_bytes() { return write_byte(grammar::initial_byte(MajorType::byte_string, grammar::ai_indefinite)); }
    constexpr bool begin_text()  { return write_byte(grammar::initial_byte(MajorType::text_string, grammar::ai_indefinite)); }

    // Break marker closing the innermost indefinite item.
    constexpr bool end() { return write_byte(grammar::break_byte); }

    // ========= Simple values, floats, tags =========

    constexpr bool write_bool(bool b) {
        return write_byte(grammar::initial_byte(MajorType::simple, b ? grammar::simple_true : grammar::simple_false));
    }

    constexpr bool write_null() {
        return write_byte(grammar::initial_byte(MajorType::simple, grammar::simple_null));
    }

    constexpr bool write_undefined() {
        return write_byte(grammar::initial_byte(MajorType::simple, grammar::simple_undefined));
    }

    constexpr bool write_simple(std::uint8_t value) {
        if (value >= grammar::simple_reserved_first && value <= grammar::simple_reserved_last) {
            setError(EncodeError::INVALID_ARGUMENT);
            return false;
        }
        if (value <= grammar::max_immediate) {
            return write_byte(grammar::initial_byte(MajorType::simple, value));
        }
        if (!write_byte(grammar::initial_byte(MajorType::simple, grammar::ai_one_byte))) return false;
        return write_byte(value);
    }

#if CBORKIT_ENABLE_HALF
    constexpr bool write_f16(float f) {
        if (!write_byte(grammar::initial_f16)) return false;
        return write_be(grammar::float_to_half(f), 2);
    }
#endif

    constexpr bool write_f32(float f) {
        if (!write_byte(grammar::initial_f32)) return false;
        return write_be(std::bit_cast<std::uint32_t>(f), 4);
    }

    constexpr bool write_f64(double d) {
        if (!write_byte(grammar::initial_f64)) return false;
        return write_be(std::bit_cast<std::uint64_t>(d), 8);
    }

    // Shortest float width that reproduces d exactly.
    constexpr bool write_float(double d) {
        if (grammar::fits_single(d)) {
            const float f = static_cast<float>(d);
#if CBORKIT_ENABLE_HALF
            if (grammar::fits_half(f)) {
                return write_f16(f);
            }
#endif
            return write_f32(f);
        }
        return write_f64(d);
    }

    // The caller emits exactly one item afterwards.
    constexpr bool write_tag(std::uint64_t tag) {
        return write_head(MajorType::tag, tag);
    }

    // ========= Counting frames =========

    constexpr bool write_array_begin(const std::size_t& size, ArrayFrame& frame) {
        frame = ArrayFrame{};
        if (size == indefinite_length) {
            frame.indefinite = true;
            return begin_array();
        }
        frame.expected_size = size;
        return write_array_header(size);
    }

    constexpr bool write_map_begin(const std::size_t& size, MapFrame& frame) {
        frame = MapFrame{};
        if (size == indefinite_length) {
            frame.indefinite = true;
            return begin_map();
        }
        frame.expected_pairs = size;
        return write_map_header(size);
    }

    constexpr bool advance_after_value(ArrayFrame& frame) {
        if (!frame.indefinite && frame.written >= frame.expected_size) {
            setError(EncodeError::LENGTH_MISMATCH);
            return false;
        }
        ++frame.written;
        return true;
    }

    // Key written, value comes next.
    constexpr bool move_to_value(MapFrame& frame) {
        if (!frame.expecting_key) {
            setError(EncodeError::LENGTH_MISMATCH);
            return false;
        }
        frame.expecting_key = false;
        return true;
    }

    constexpr bool advance_after_value(MapFrame& frame) {
        if (frame.expecting_key) {
            setError(EncodeError::LENGTH_MISMATCH);
            return false;
        }
        if (!frame.indefinite && frame.written_pairs >= frame.expected_pairs) {
            setError(EncodeError::LENGTH_MISMATCH);
            return false;
        }
        ++frame.written_pairs;
        frame.expecting_key = true;
        return true;
    }

    constexpr bool write_array_end(ArrayFrame& frame) {
        if (frame.indefinite) {
            return end();
        }
        if (frame.written != frame.expected_size) {
            setError(EncodeError::LENGTH_MISMATCH);
            return false;
        }
        return true;
    }

    constexpr bool write_map_end(MapFrame& frame) {
        if (!frame.expecting_key) {
            setError(EncodeError::LENGTH_MISMATCH);
            return false;
        }
        if (frame.indefinite) {
            return end();
        }
        if (frame.written_pairs != frame.expected_pairs) {
            setError(EncodeError::LENGTH_MISMATCH);
            return false;
        }
        return true;
    }

    // Lets a structural codec report its own failure through the encoder.
    constexpr bool fail(EncodeError e) {
        setError(e);
        return false;
    }

private:
    It m_current;
    Sent end_;
    EncoderConfig cfg_;
    std::size_t written_ = 0;
    error_type err_ = EncodeError::NO_ERROR;

    constexpr void setError(error_type e) {
        if (err_ == EncodeError::NO_ERROR) {
            err_ = e;
        }
    }

    constexpr bool write_byte(std::uint8_t b) {
        if (m_current == end_) {
            setError(EncodeError::SINK_ERROR);
            return false;
        }
        *m_current = b;
        ++m_current;
        ++written_;
        return true;
    }

    constexpr bool write_be(std::uint64_t v, std::size_t width) {
        for (std::size_t i = width; i > 0; --i) {
            if (!write_byte(static_cast<std::uint8_t>((v >> (8 * (i - 1))) & 0xFFu))) return false;
        }
        return true;
    }

    // Initial byte plus argument in its shortest form.
    constexpr bool write_head(MajorType major, std::uint64_t argument) {
        const std::size_t width = grammar::argument_width(argument);
        if (width == 0) {
            return write_byte(grammar::initial_byte(major, static_cast<std::uint8_t>(argument)));
        }
        if (!write_byte(grammar::initial_byte(major, grammar::additional_info_for_width(width)))) return false;
        return write_be(argument, width);
    }
};

template <class It, class Sent>
Encoder(It, Sent) -> Encoder<It, Sent>;

template <class It, class Sent>
Encoder(It, Sent, EncoderConfig) -> Encoder<It, Sent>;

namespace encoder {

template<class E>
concept EncoderLike = requires(E& e, const E& ce,
                               std::uint64_t u64, std::int64_t i64, bool b, float f, double dbl,
                               std::span<const std::uint8_t> bytes, std::string_view text,
                               std::size_t size,
                               typename E::ArrayFrame& arrFrame,
                               typename E::MapFrame& mapFrame) {
    typename E::iterator_type;
    typename E::error_type;

    { ce.getError() } -> std::same_as<typename E::error_type>;
    { ce.bytesWritten() } -> std::same_as<std::size_t>;
    { ce.config() } -> std::same_as<const EncoderConfig&>;
    { e.write_unsigned(u64) } -> std::same_as<bool>;
    { e.write_negative(u64) } -> std::same_as<bool>;
    { e.write_int(i64) } -> std::same_as<bool>;
    { e.write_bytes(bytes) } -> std::same_as<bool>;
    { e.write_text(text) } -> std::same_as<bool>;
    { e.write_array_header(u64) } -> std::same_as<bool>;
    { e.write_map_header(u64) } -> std::same_as<bool>;
    { e.begin_array() } -> std::same_as<bool>;
    { e.begin_map() } -> std::same_as<bool>;
    { e.begin_bytes() } -> std::same_as<bool>;
    { e.begin_text() } -> std::same_as<bool>;
    { e.end() } -> std::same_as<bool>;
    { e.write_bool(b) } -> std::same_as<bool>;
    { e.write_null() } -> std::same_as<bool>;
    { e.write_undefined() } -> std::same_as<bool>;
    { e.write_f32(f) } -> std::same_as<bool>;
    { e.write_f64(dbl) } -> std::same_as<bool>;
    { e.write_float(dbl) } -> std::same_as<bool>;
    { e.write_tag(u64) } -> std::same_as<bool>;
    { e.write_array_begin(size, arrFrame) } -> std::same_as<bool>;
    { e.write_map_begin(size, mapFrame) } -> std::same_as<bool>;
    { e.advance_after_value(arrFrame) } -> std::same_as<bool>;
    { e.move_to_value(mapFrame) } -> std::same_as<bool>;
    { e.advance_after_value(mapFrame) } -> std::same_as<bool>;
    { e.write_array_end(arrFrame) } -> std::same_as<bool>;
    { e.write_map_end(mapFrame) } -> std::same_as<bool>;
};

static_assert(EncoderLike<Encoder<std::uint8_t*, std::uint8_t*>>);

} // namespace encoder

} // namespace CborKit
