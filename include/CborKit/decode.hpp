#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <ratio>
#include <span>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>

#include "codec.hpp"
#include "decoder.hpp"
#include "errors.hpp"
#include "options.hpp"
#include "result.hpp"
#include "static_schema.hpp"
#include "struct_fields_helper.hpp"
#include "struct_introspection.hpp"

#if CBORKIT_ENABLE_ALLOC
#include <memory>
#endif

namespace CborKit {

namespace decoder_details {

using static_schema::Kind;
using static_schema::ValueKind;
using options::detail::no_options;

template <class Opts, class Field, class Dec, class CTX>
constexpr bool DecodeField(Field& obj, Dec& dec, CTX& ctx);

template <class Dec, class CTX>
constexpr bool CheckStatus(const IterationStatus& st, Dec& dec, CTX& ctx) {
    if (st.status == TryParseStatus::error) {
        return ctx.withDecoderError(dec);
    }
    return true;
}

// Discards one value the model has no place for, within the remaining depth.
template <class Dec, class CTX>
constexpr bool SkipValue(Dec& dec, CTX& ctx) {
    if constexpr (config::skip_enabled()) {
        if (!dec.skip_value(ctx.depthRemaining())) {
            return ctx.withDecoderError(dec);
        }
        return true;
    } else {
        return ctx.withError(DecodeError::TYPE_MISMATCH, dec);
    }
}

template <class Opts, class ObjT, class Dec, class CTX>
    requires Kind<ObjT, ValueKind::custom>
constexpr bool DecodeTyped(ObjT& obj, Dec& dec, CTX& ctx) {
    if (!Codec<ObjT>::decode(obj, dec, ctx)) {
        return ctx.withDecoderError(dec);
    }
    return true;
}

template <class Opts, class ObjT, class Dec, class CTX>
    requires Kind<ObjT, ValueKind::transformer>
constexpr bool DecodeTyped(ObjT& obj, Dec& dec, CTX& ctx) {
    typename ObjT::wire_type wire{};
    if (!DecodeField<Opts>(wire, dec, ctx)) {
        return false;
    }
    if (!obj.transform_from(wire)) {
        return ctx.withError(DecodeError::CUSTOM_CODEC_ERROR, dec);
    }
    return true;
}

template <class Opts, class ObjT, class Dec, class CTX>
    requires Kind<ObjT, ValueKind::boolean>
constexpr bool DecodeTyped(ObjT& obj, Dec& dec, CTX& ctx) {
    if (!dec.read_bool(obj)) {
        return ctx.withDecoderError(dec);
    }
    return true;
}

template <class Opts, class ObjT, class Dec, class CTX>
    requires Kind<ObjT, ValueKind::integer>
constexpr bool DecodeTyped(ObjT& obj, Dec& dec, CTX& ctx) {
    if (!dec.read_int(obj)) {
        return ctx.withDecoderError(dec);
    }
    return true;
}

template <class Opts, class ObjT, class Dec, class CTX>
    requires Kind<ObjT, ValueKind::enumeration>
constexpr bool DecodeTyped(ObjT& obj, Dec& dec, CTX& ctx) {
    const std::size_t at = dec.position();
    std::underlying_type_t<ObjT> raw{};
    if (!dec.read_int(raw)) {
        return ctx.withDecoderError(dec);
    }
    const ObjT value = static_cast<ObjT>(raw);
    if (!static_schema::enum_value_is_known(value)) {
        dec.set_position(at);
        return ctx.withError(DecodeError::UNKNOWN_VARIANT, dec, static_cast<std::uint64_t>(raw));
    }
    obj = value;
    return true;
}

template <class Opts, class ObjT, class Dec, class CTX>
    requires Kind<ObjT, ValueKind::floating>
constexpr bool DecodeTyped(ObjT& obj, Dec& dec, CTX& ctx) {
    bool ok = false;
    if constexpr (std::is_same_v<ObjT, float>) {
        ok = dec.read_f32(obj);
    } else {
        ok = dec.read_f64(obj);
    }
    if (!ok) {
        return ctx.withDecoderError(dec);
    }
    return true;
}

#if CBORKIT_ENABLE_ALLOC
// Owned text: definite or indefinite, each chunk UTF-8 checked.
template <class Opts, class ObjT, class Dec, class CTX>
    requires Kind<ObjT, ValueKind::text>
constexpr bool DecodeTyped(ObjT& obj, Dec& dec, CTX& ctx) {
    obj.clear();
    const bool ok = dec.read_text_chunks([&](std::span<const std::uint8_t> chunk) {
        for (std::uint8_t b : chunk) {
            obj.push_back(static_cast<char>(b));
        }
        return true;
    });
    if (!ok) {
        return ctx.withDecoderError(dec);
    }
    return true;
}

template <class Opts, class ObjT, class Dec, class CTX>
    requires Kind<ObjT, ValueKind::bytes>
constexpr bool DecodeTyped(ObjT& obj, Dec& dec, CTX& ctx) {
    obj.bytes.clear();
    const bool ok = dec.read_bytes_chunks([&](std::span<const std::uint8_t> chunk) {
        obj.bytes.insert(obj.bytes.end(), chunk.begin(), chunk.end());
        return true;
    });
    if (!ok) {
        return ctx.withDecoderError(dec);
    }
    return true;
}
#endif

// Borrowed from the input: definite-length only.
template <class Opts, class ObjT, class Dec, class CTX>
    requires Kind<ObjT, ValueKind::text_view>
constexpr bool DecodeTyped(ObjT& obj, Dec& dec, CTX& ctx) {
    if (!dec.read_text(obj)) {
        return ctx.withDecoderError(dec);
    }
    return true;
}

template <class Opts, class ObjT, class Dec, class CTX>
    requires Kind<ObjT, ValueKind::bytes_view>
constexpr bool DecodeTyped(ObjT& obj, Dec& dec, CTX& ctx) {
    if (!dec.read_bytes(obj.bytes)) {
        return ctx.withDecoderError(dec);
    }
    return true;
}

template <class Opts, class ObjT, class Dec, class CTX>
    requires Kind<ObjT, ValueKind::byte_array>
constexpr bool DecodeTyped(ObjT& obj, Dec& dec, CTX& ctx) {
    const std::size_t at = dec.position();
    std::size_t total = 0;
    const bool ok = dec.read_bytes_chunks([&](std::span<const std::uint8_t> chunk) {
        for (std::uint8_t b : chunk) {
            if (total < obj.bytes.size()) obj.bytes[total] = b;
            ++total;
        }
        return true;
    });
    if (!ok) {
        return ctx.withDecoderError(dec);
    }
    if (total != obj.bytes.size()) {
        dec.set_position(at);
        return ctx.withError(DecodeError::FIXED_SIZE_CONTAINER_LENGTH_MISMATCH, dec, total);
    }
    return true;
}

template <class Opts, class ObjT, class Dec, class CTX>
    requires Kind<ObjT, ValueKind::tagged>
constexpr bool DecodeTyped(ObjT& obj, Dec& dec, CTX& ctx) {
    auto guard = ctx.enter(PathElement{PathElement::Kind::tag, ObjT::tag});
    if (!guard) {
        return ctx.withError(DecodeError::DEPTH_LIMIT_EXCEEDED, dec);
    }
    const std::size_t at = dec.position();
    std::uint64_t tag = 0;
    if (!dec.read_tag(tag)) {
        return ctx.withDecoderError(dec);
    }
    if (tag != ObjT::tag) {
        dec.set_position(at);
        return ctx.withError(DecodeError::TYPE_MISMATCH, dec, tag);
    }
    return DecodeField<no_options>(obj.value, dec, ctx);
}

template <class Opts, class ObjT, class Dec, class CTX>
    requires Kind<ObjT, ValueKind::null_value>
constexpr bool DecodeTyped(ObjT&, Dec& dec, CTX& ctx) {
    if (!dec.read_null()) {
        return ctx.withDecoderError(dec);
    }
    return true;
}

template <class Opts, class ObjT, class Dec, class CTX>
    requires Kind<ObjT, ValueKind::undefined_value>
constexpr bool DecodeTyped(ObjT&, Dec& dec, CTX& ctx) {
    if (!dec.read_undefined()) {
        return ctx.withDecoderError(dec);
    }
    return true;
}

template <class Opts, class ObjT, class Dec, class CTX>
    requires Kind<ObjT, ValueKind::simple_value>
constexpr bool DecodeTyped(ObjT& obj, Dec& dec, CTX& ctx) {
    if (!dec.read_simple(obj.value)) {
        return ctx.withDecoderError(dec);
    }
    return true;
}

template <class Opts, class ObjT, class Dec, class CTX>
    requires Kind<ObjT, ValueKind::optional>
constexpr bool DecodeTyped(ObjT& obj, Dec& dec, CTX& ctx) {
    switch (dec.try_read_null()) {
    case TryParseStatus::error:
        return ctx.withDecoderError(dec);
    case TryParseStatus::ok:
        obj.reset();
        return true;
    case TryParseStatus::no_match:
        break;
    }
    obj.emplace();
    return DecodeField<Opts>(*obj, dec, ctx);
}

#if CBORKIT_ENABLE_ALLOC
template <class Opts, class ObjT, class Dec, class CTX>
    requires Kind<ObjT, ValueKind::unique_ptr>
constexpr bool DecodeTyped(ObjT& obj, Dec& dec, CTX& ctx) {
    switch (dec.try_read_null()) {
    case TryParseStatus::error:
        return ctx.withDecoderError(dec);
    case TryParseStatus::ok:
        obj.reset();
        return true;
    case TryParseStatus::no_match:
        break;
    }
    obj = std::make_unique<typename ObjT::element_type>();
    return DecodeField<Opts>(*obj, dec, ctx);
}
#endif

template <class ObjT, std::size_t... I>
constexpr void EmplaceAlternative(ObjT& obj, std::size_t alt, std::index_sequence<I...>) {
    ((alt == I ? (void)obj.template emplace<I>() : void()), ...);
}

template <class ObjT, class Dec, class CTX, std::size_t... I>
constexpr bool DecodeAlternative(ObjT& obj, std::size_t alt, Dec& dec, CTX& ctx, std::index_sequence<I...>) {
    bool ok = false;
    auto one = [&]<std::size_t J>(std::integral_constant<std::size_t, J>) {
        if (alt != J) return;
        ok = DecodeField<no_options>(obj.template emplace<J>(), dec, ctx);
    };
    (one(std::integral_constant<std::size_t, I>{}), ...);
    return ok;
}

template <class Opts, class ObjT, class Dec, class CTX>
    requires Kind<ObjT, ValueKind::variant>
constexpr bool DecodeTyped(ObjT& obj, Dec& dec, CTX& ctx) {
    using VT = static_schema::variant_traits<ObjT>;
    static_assert(VT::indexesAreUnique, "[[[ CborKit ]]] Two variant alternatives share a wire index");
    constexpr auto alternatives = std::make_index_sequence<VT::alternatives>{};

    if constexpr (VT::indexOnly) {
        static_assert(VT::allAlternativesEmpty,
                      "[[[ CborKit ]]] index_only variants may only hold empty alternatives");
        const std::size_t at = dec.position();
        std::uint64_t wire = 0;
        if (!dec.read_unsigned(wire)) {
            return ctx.withDecoderError(dec);
        }
        const std::size_t alt = VT::alternativeFor(wire);
        if (alt == VT::alternatives) {
            dec.set_position(at);
            return ctx.withError(DecodeError::UNKNOWN_VARIANT, dec, wire);
        }
        EmplaceAlternative(obj, alt, alternatives);
        return true;
    } else {
        auto guard = ctx.enter(PathElement{PathElement::Kind::variant, 0});
        if (!guard) {
            return ctx.withError(DecodeError::DEPTH_LIMIT_EXCEEDED, dec);
        }
        typename Dec::ArrayFrame fr;
        IterationStatus st = dec.read_array_begin(fr);
        if (!CheckStatus(st, dec, ctx)) {
            return false;
        }
        if ((!fr.indefinite && fr.remaining != 2) || !st.has_value) {
            return ctx.withError(DecodeError::TYPE_MISMATCH, dec);
        }

        const std::size_t at = dec.position();
        std::uint64_t wire = 0;
        if (!dec.read_unsigned(wire)) {
            return ctx.withDecoderError(dec);
        }
        guard.at(wire);
        const std::size_t alt = VT::alternativeFor(wire);
        if (alt == VT::alternatives) {
            dec.set_position(at);
            return ctx.withError(DecodeError::UNKNOWN_VARIANT, dec, wire);
        }

        st = dec.advance_after_value(fr);
        if (!CheckStatus(st, dec, ctx)) {
            return false;
        }
        if (!st.has_value) {
            return ctx.withError(DecodeError::TYPE_MISMATCH, dec);
        }
        if (!DecodeAlternative(obj, alt, dec, ctx, alternatives)) {
            return false;
        }
        st = dec.advance_after_value(fr);
        if (!CheckStatus(st, dec, ctx)) {
            return false;
        }
        if (st.has_value) {
            return ctx.withError(DecodeError::TYPE_MISMATCH, dec);
        }
        return true;
    }
}

template <class Opts, class ObjT, class Dec, class CTX>
    requires Kind<ObjT, ValueKind::tuple_like>
constexpr bool DecodeTyped(ObjT& obj, Dec& dec, CTX& ctx) {
    auto guard = ctx.enter(PathElement{PathElement::Kind::array_item, 0});
    if (!guard) {
        return ctx.withError(DecodeError::DEPTH_LIMIT_EXCEEDED, dec);
    }
    typename Dec::ArrayFrame fr;
    IterationStatus st = dec.read_array_begin(fr);
    if (!CheckStatus(st, dec, ctx)) {
        return false;
    }
    std::uint64_t i = 0;
    auto element = [&](auto& elem) {
        if (!st.has_value) {
            return ctx.withError(DecodeError::FIXED_SIZE_CONTAINER_LENGTH_MISMATCH, dec, i);
        }
        guard.at(i++);
        if (!DecodeField<no_options>(elem, dec, ctx)) {
            return false;
        }
        st = dec.advance_after_value(fr);
        return CheckStatus(st, dec, ctx);
    };
    if (!std::apply([&](auto&... elems) { return (element(elems) && ...); }, obj)) {
        return false;
    }
    if (st.has_value) {
        return ctx.withError(DecodeError::FIXED_SIZE_CONTAINER_LENGTH_MISMATCH, dec, i);
    }
    return true;
}

// {0: whole seconds, 1: remaining nanoseconds}; other keys are skipped.
template <class Opts, class ObjT, class Dec, class CTX>
    requires Kind<ObjT, ValueKind::duration>
constexpr bool DecodeTyped(ObjT& obj, Dec& dec, CTX& ctx) {
    auto guard = ctx.enter(PathElement{PathElement::Kind::field, 0});
    if (!guard) {
        return ctx.withError(DecodeError::DEPTH_LIMIT_EXCEEDED, dec);
    }
    typename Dec::MapFrame fr;
    IterationStatus st = dec.read_map_begin(fr);
    if (!CheckStatus(st, dec, ctx)) {
        return false;
    }
    std::int64_t secs = 0;
    std::int64_t nanos = 0;
    bool haveSecs = false;
    bool haveNanos = false;
    while (st.has_value) {
        std::uint64_t key = 0;
        if (!dec.read_unsigned(key)) {
            return ctx.withDecoderError(dec);
        }
        guard.at(key);
        bool ok = false;
        if (key == 0) {
            ok = dec.read_int(secs) || ctx.withDecoderError(dec);
            haveSecs = true;
        } else if (key == 1) {
            ok = dec.read_int(nanos) || ctx.withDecoderError(dec);
            haveNanos = true;
        } else {
            ok = SkipValue(dec, ctx);
        }
        if (!ok) {
            return false;
        }
        st = dec.advance_after_value(fr);
        if (!CheckStatus(st, dec, ctx)) {
            return false;
        }
    }
    if (!haveSecs) {
        return ctx.withError(DecodeError::MISSING_FIELD, dec, 0);
    }
    if (!haveNanos) {
        return ctx.withError(DecodeError::MISSING_FIELD, dec, 1);
    }
    if (nanos <= -1'000'000'000 || nanos >= 1'000'000'000) {
        return ctx.withError(DecodeError::NUMERIC_VALUE_OUT_OF_RANGE, dec);
    }
    using Rep = typename ObjT::rep;
    if constexpr (std::is_integral_v<Rep> && std::ratio_less_v<typename ObjT::period, std::ratio<1>>) {
        constexpr std::int64_t ticks_per_second = ObjT::period::den / ObjT::period::num;
        constexpr std::int64_t limit =
            static_cast<std::int64_t>(std::numeric_limits<Rep>::max()) / ticks_per_second - 1;
        if (secs > limit || secs < -limit) {
            return ctx.withError(DecodeError::NUMERIC_VALUE_OUT_OF_RANGE, dec);
        }
    }
    obj = std::chrono::duration_cast<ObjT>(std::chrono::seconds(secs))
        + std::chrono::duration_cast<ObjT>(std::chrono::nanoseconds(nanos));
    return true;
}

template <class Opts, class ObjT, class Dec, class CTX>
    requires Kind<ObjT, ValueKind::map_like>
constexpr bool DecodeTyped(ObjT& obj, Dec& dec, CTX& ctx) {
    auto guard = ctx.enter(PathElement{PathElement::Kind::map_entry, 0});
    if (!guard) {
        return ctx.withError(DecodeError::DEPTH_LIMIT_EXCEEDED, dec);
    }
    static_schema::map_write_cursor<ObjT> cursor{obj};
    cursor.reset();
    typename Dec::MapFrame fr;
    IterationStatus st = dec.read_map_begin(fr);
    if (!CheckStatus(st, dec, ctx)) {
        return false;
    }
    std::uint64_t i = 0;
    while (st.has_value) {
        guard.at(i++);
        const std::size_t at = dec.position();
        const bool ok = DecodeField<no_options>(cursor.key_ref(), dec, ctx)
                     && DecodeField<no_options>(cursor.value_ref(), dec, ctx);
        switch (cursor.finalize_pair(ok)) {
        case stream_write_result::value_processed:
            break;
        case stream_write_result::overflow:
            dec.set_position(at);
            return ctx.withError(DecodeError::DUPLICATE_KEY_IN_MAP, dec);
        default:
            return false;
        }
        st = dec.advance_after_value(fr);
        if (!CheckStatus(st, dec, ctx)) {
            return false;
        }
    }
    return true;
}

template <class Opts, class ObjT, class Dec, class CTX>
    requires Kind<ObjT, ValueKind::array_like>
constexpr bool DecodeTyped(ObjT& obj, Dec& dec, CTX& ctx) {
    static_assert(static_schema::ArrayWritable<ObjT>, "[[[ CborKit ]]] Sequence type cannot be filled while decoding");
    auto guard = ctx.enter(PathElement{PathElement::Kind::array_item, 0});
    if (!guard) {
        return ctx.withError(DecodeError::DEPTH_LIMIT_EXCEEDED, dec);
    }
    static_schema::array_write_cursor<ObjT> cursor{obj};
    cursor.reset();
    typename Dec::ArrayFrame fr;
    IterationStatus st = dec.read_array_begin(fr);
    if (!CheckStatus(st, dec, ctx)) {
        return false;
    }
    std::uint64_t i = 0;
    while (st.has_value) {
        guard.at(i);
        if (cursor.allocate_slot() != stream_write_result::slot_allocated) {
            return ctx.withError(DecodeError::FIXED_SIZE_CONTAINER_LENGTH_MISMATCH, dec, i);
        }
        const bool ok = DecodeField<no_options>(cursor.get_slot(), dec, ctx);
        if (cursor.finalize_item(ok) != stream_write_result::value_processed) {
            return false;
        }
        ++i;
        st = dec.advance_after_value(fr);
        if (!CheckStatus(st, dec, ctx)) {
            return false;
        }
    }
    if (cursor.finalize(true) != stream_write_result::value_processed) {
        return ctx.withError(DecodeError::FIXED_SIZE_CONTAINER_LENGTH_MISMATCH, dec, i);
    }
    return true;
}

// ======== Structs ========

template <class Opts, class ObjT, class Tag>
inline constexpr bool struct_has_option =
    Opts::template has_option<Tag>
    || options::detail::field_options<introspection::structureOptions<ObjT>>::template has_option<Tag>;

// Fields that must appear on the wire for the struct to decode.
template <class ObjT, std::size_t I>
consteval bool fieldIsRequired() {
    using Value = struct_fields_helper::FieldValue<ObjT, I>;
    using FieldOpts = struct_fields_helper::FieldOpts<ObjT, I>;
    if constexpr (struct_fields_helper::fieldIsExcluded<ObjT, I>()) {
        return false;
    } else if constexpr (Kind<Value, ValueKind::optional> || Kind<Value, ValueKind::unique_ptr>) {
        return false;
    } else {
        return !FieldOpts::template has_option<options::detail::skip_default_tag>
            && !FieldOpts::template has_option<options::detail::defaulted_tag>;
    }
}

template <class ObjT, std::size_t I, class Dec, class CTX>
constexpr bool DecodeStructMember(ObjT& obj, Dec& dec, CTX& ctx) {
    if constexpr (struct_fields_helper::fieldIsExcluded<ObjT, I>()) {
        return true;
    } else {
        using FieldOpts = struct_fields_helper::FieldOpts<ObjT, I>;
        using Value = struct_fields_helper::FieldValue<ObjT, I>;
        auto& field = introspection::getStructElementByIndex<I>(obj);

        if constexpr (Kind<Value, ValueKind::optional>) {
            // An alternative this version does not know leaves the field empty.
            const auto snapshot = ctx.snapshot();
            const std::size_t at = dec.position();
            if (DecodeField<FieldOpts>(field, dec, ctx)) {
                return true;
            }
            if (ctx.error() != DecodeError::UNKNOWN_VARIANT) {
                return false;
            }
            ctx.restore(snapshot);
            if (!dec.set_position(at)) {
                return ctx.withDecoderError(dec);
            }
            struct_fields_helper::FieldMeta<ObjT, I>::getRef(field).reset();
            return SkipValue(dec, ctx);
        } else {
            return DecodeField<FieldOpts>(field, dec, ctx);
        }
    }
}

template <class ObjT, class Dec, class CTX, std::size_t... I>
constexpr bool DecodeMemberAt(std::size_t member, ObjT& obj, Dec& dec, CTX& ctx, std::index_sequence<I...>) {
    bool ok = true;
    auto one = [&]<std::size_t J>(std::integral_constant<std::size_t, J>) {
        if (member != J) return;
        ok = DecodeStructMember<ObjT, J>(obj, dec, ctx);
    };
    (one(std::integral_constant<std::size_t, I>{}), ...);
    return ok;
}

// Absent skip_default fields take the value the encoder left them out for.
template <class ObjT, std::size_t I>
consteval bool fieldRestoresDefault() {
    using Value = struct_fields_helper::FieldValue<ObjT, I>;
    using FieldOpts = struct_fields_helper::FieldOpts<ObjT, I>;
    if constexpr (struct_fields_helper::fieldIsExcluded<ObjT, I>()) {
        return false;
    } else if constexpr (Kind<Value, ValueKind::optional> || Kind<Value, ValueKind::unique_ptr>) {
        return false;
    } else {
        return FieldOpts::template has_option<options::detail::skip_default_tag>;
    }
}

template <class ObjT, class Dec, class CTX, std::size_t N, std::size_t... I>
constexpr bool CheckRequiredFields(ObjT& obj, const std::array<bool, N>& seen, Dec& dec, CTX& ctx,
                                   std::index_sequence<I...>) {
    using FH = struct_fields_helper::FieldsHelper<ObjT>;
    std::uint64_t missing = struct_fields_helper::not_on_wire;
    auto one = [&]<std::size_t J>(std::integral_constant<std::size_t, J>) {
        if constexpr (fieldIsRequired<ObjT, J>()) {
            if (!seen[J] && missing == struct_fields_helper::not_on_wire) {
                missing = FH::wireIndexes[J];
            }
        } else if constexpr (fieldRestoresDefault<ObjT, J>()) {
            if (!seen[J]) {
                using Meta = struct_fields_helper::FieldMeta<ObjT, J>;
                Meta::getRef(introspection::getStructElementByIndex<J>(obj))
                    = struct_fields_helper::defaultFieldValue<ObjT, J>();
            }
        }
    };
    (one(std::integral_constant<std::size_t, I>{}), ...);
    if (missing != struct_fields_helper::not_on_wire) {
        return ctx.withError(DecodeError::MISSING_FIELD, dec, missing);
    }
    return true;
}

// Index-keyed map, definite or indefinite. Unknown indices are skipped; a
// repeated index overwrites the earlier value.
template <class Opts, class ObjT, class Dec, class CTX>
    requires Kind<ObjT, ValueKind::structure>
        && (!struct_has_option<Opts, ObjT, options::detail::as_array_tag>)
        && (!struct_has_option<Opts, ObjT, options::detail::transparent_tag>)
constexpr bool DecodeTyped(ObjT& obj, Dec& dec, CTX& ctx) {
    using FH = struct_fields_helper::FieldsHelper<ObjT>;
    static_assert(FH::fieldsAreUnique, "[[[ CborKit ]]] Two fields share a wire index");
    constexpr auto members = std::make_index_sequence<FH::rawFieldsCount>{};

    // Missing fields are reported at the struct, not at the last key read.
    std::array<bool, FH::rawFieldsCount> seen{};
    {
        auto guard = ctx.enter(PathElement{PathElement::Kind::field, 0});
        if (!guard) {
            return ctx.withError(DecodeError::DEPTH_LIMIT_EXCEEDED, dec);
        }
        typename Dec::MapFrame fr;
        IterationStatus st = dec.read_map_begin(fr);
        if (!CheckStatus(st, dec, ctx)) {
            return false;
        }
        while (st.has_value) {
            std::uint64_t key = 0;
            if (!dec.read_unsigned(key)) {
                return ctx.withDecoderError(dec);
            }
            guard.at(key);
            const std::size_t member = FH::memberForWireIndex(key);
            if (member == struct_fields_helper::npos) {
                if (!SkipValue(dec, ctx)) {
                    return false;
                }
            } else {
                if (!DecodeMemberAt(member, obj, dec, ctx, members)) {
                    return false;
                }
                seen[member] = true;
            }
            st = dec.advance_after_value(fr);
            if (!CheckStatus(st, dec, ctx)) {
                return false;
            }
        }
    }
    return CheckRequiredFields<ObjT>(obj, seen, dec, ctx, members);
}

// Positional array: element k goes to the field with wire index k; elements
// with no field are skipped, missing trailing elements leave fields absent.
template <class Opts, class ObjT, class Dec, class CTX>
    requires Kind<ObjT, ValueKind::structure>
        && struct_has_option<Opts, ObjT, options::detail::as_array_tag>
        && (!struct_has_option<Opts, ObjT, options::detail::transparent_tag>)
constexpr bool DecodeTyped(ObjT& obj, Dec& dec, CTX& ctx) {
    using FH = struct_fields_helper::FieldsHelper<ObjT>;
    static_assert(FH::fieldsAreUnique, "[[[ CborKit ]]] Two fields share a wire index");
    constexpr auto members = std::make_index_sequence<FH::rawFieldsCount>{};

    std::array<bool, FH::rawFieldsCount> seen{};
    {
        auto guard = ctx.enter(PathElement{PathElement::Kind::field, 0});
        if (!guard) {
            return ctx.withError(DecodeError::DEPTH_LIMIT_EXCEEDED, dec);
        }
        typename Dec::ArrayFrame fr;
        IterationStatus st = dec.read_array_begin(fr);
        if (!CheckStatus(st, dec, ctx)) {
            return false;
        }
        std::uint64_t pos = 0;
        while (st.has_value) {
            guard.at(pos);
            const std::size_t member = FH::memberForWireIndex(pos);
            if (member == struct_fields_helper::npos) {
                if (!SkipValue(dec, ctx)) {
                    return false;
                }
            } else {
                if (!DecodeMemberAt(member, obj, dec, ctx, members)) {
                    return false;
                }
                seen[member] = true;
            }
            ++pos;
            st = dec.advance_after_value(fr);
            if (!CheckStatus(st, dec, ctx)) {
                return false;
            }
        }
    }
    return CheckRequiredFields<ObjT>(obj, seen, dec, ctx, members);
}

template <class Opts, class ObjT, class Dec, class CTX>
    requires Kind<ObjT, ValueKind::structure>
        && struct_has_option<Opts, ObjT, options::detail::transparent_tag>
constexpr bool DecodeTyped(ObjT& obj, Dec& dec, CTX& ctx) {
    using FH = struct_fields_helper::FieldsHelper<ObjT>;
    static_assert(FH::fieldsCount == 1, "[[[ CborKit ]]] transparent structs must have exactly one wire field");
    return DecodeStructMember<ObjT, FH::firstWireMember>(obj, dec, ctx);
}

template <class Opts, class ObjT, class Dec, class CTX>
    requires Kind<ObjT, ValueKind::unsupported>
constexpr bool DecodeTyped(ObjT&, Dec&, CTX&) {
    static_assert(!sizeof(ObjT),
                  "[[[ CborKit ]]] T has no CBOR mapping.\n"
                  "Use a supported type, an aggregate, a StructMeta<T> or a Codec<T> specialization");
    return false;
}

// Unwraps Annotated<> and merges its options into the ones given by the caller.
template <class Opts, class Field, class Dec, class CTX>
constexpr bool DecodeField(Field& obj, Dec& dec, CTX& ctx) {
    using Meta   = options::detail::annotation_meta_getter<Field>;
    using Merged = options::detail::field_options<
        typename options::detail::merge_options<typename Opts::pack, typename Meta::OptionsP>::type>;
    return DecodeTyped<Merged>(Meta::getRef(obj), dec, ctx);
}

} // namespace decoder_details

// Entry point for Codec<T>::decode implementations that nest other values.
template <class T, class Dec, class CTX>
constexpr bool DecodeValue(T& obj, Dec& dec, CTX& ctx) {
    return decoder_details::DecodeField<options::detail::no_options>(obj, dec, ctx);
}

// One item of a CBOR sequence. On success obj is replaced and the decoder is
// left after the item; on failure obj is untouched.
template <class OutputObjectT, class UserCtx = void, class Dec>
constexpr DecodeResult DecodeWithDecoder(OutputObjectT& obj, Dec& dec, UserCtx* userCtx = nullptr) {
    DecodeContext<UserCtx> ctx(dec.config().max_depth, userCtx);
    OutputObjectT tmp{};
    if (decoder_details::DecodeField<options::detail::no_options>(tmp, dec, ctx)) {
        obj = std::move(tmp);
    }
    return ctx.result(dec.position());
}

// The whole input must be exactly one item.
template <class OutputObjectT, class UserCtx = void>
constexpr DecodeResult Decode(OutputObjectT& obj, std::span<const std::uint8_t> input,
                              const DecoderConfig& cfg = {}, UserCtx* userCtx = nullptr) {
    Decoder dec(input, cfg);
    DecodeContext<UserCtx> ctx(cfg.max_depth, userCtx);
    OutputObjectT tmp{};
    if (!decoder_details::DecodeField<options::detail::no_options>(tmp, dec, ctx)) {
        return ctx.result(dec.position());
    }
    if (!dec.finish()) {
        ctx.withDecoderError(dec);
        return ctx.result(dec.position());
    }
    obj = std::move(tmp);
    return ctx.result(dec.position());
}

} // namespace CborKit
