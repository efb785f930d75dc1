#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>

#include "codec.hpp"
#include "encoder.hpp"
#include "errors.hpp"
#include "io.hpp"
#include "options.hpp"
#include "result.hpp"
#include "static_schema.hpp"
#include "struct_fields_helper.hpp"
#include "struct_introspection.hpp"

#if CBORKIT_ENABLE_STD
#include <vector>
#endif

namespace CborKit {

namespace encoder_details {

using static_schema::Kind;
using static_schema::ValueKind;
using options::detail::no_options;

template <class Opts, class Field, class Enc, class CTX>
constexpr bool EncodeField(const Field& obj, Enc& enc, CTX& ctx);

template <class Opts, class ObjT, class Enc, class CTX>
    requires Kind<ObjT, ValueKind::custom>
constexpr bool EncodeTyped(const ObjT& obj, Enc& enc, CTX& ctx) {
    if (!Codec<ObjT>::encode(obj, enc, ctx)) {
        return ctx.withEncoderError(enc);
    }
    return true;
}

template <class Opts, class ObjT, class Enc, class CTX>
    requires Kind<ObjT, ValueKind::transformer>
constexpr bool EncodeTyped(const ObjT& obj, Enc& enc, CTX& ctx) {
    typename ObjT::wire_type wire{};
    if (!obj.transform_to(wire)) {
        return ctx.withError(EncodeError::CUSTOM_CODEC_ERROR, enc);
    }
    return EncodeField<Opts>(wire, enc, ctx);
}

template <class Opts, class ObjT, class Enc, class CTX>
    requires Kind<ObjT, ValueKind::boolean>
constexpr bool EncodeTyped(const ObjT& obj, Enc& enc, CTX& ctx) {
    if (!enc.write_bool(obj)) {
        return ctx.withEncoderError(enc);
    }
    return true;
}

template <class Opts, class ObjT, class Enc, class CTX>
    requires Kind<ObjT, ValueKind::integer>
constexpr bool EncodeTyped(const ObjT& obj, Enc& enc, CTX& ctx) {
    if (!enc.write_int(obj)) {
        return ctx.withEncoderError(enc);
    }
    return true;
}

template <class Opts, class ObjT, class Enc, class CTX>
    requires Kind<ObjT, ValueKind::enumeration>
constexpr bool EncodeTyped(const ObjT& obj, Enc& enc, CTX& ctx) {
    if (!enc.write_int(std::to_underlying(obj))) {
        return ctx.withEncoderError(enc);
    }
    return true;
}

template <class Opts, class ObjT, class Enc, class CTX>
    requires Kind<ObjT, ValueKind::floating>
constexpr bool EncodeTyped(const ObjT& obj, Enc& enc, CTX& ctx) {
    bool ok = false;
    if (enc.config().preferred_floats) {
        ok = enc.write_float(obj);
    } else if constexpr (std::is_same_v<ObjT, float>) {
        ok = enc.write_f32(obj);
    } else {
        ok = enc.write_f64(obj);
    }
    if (!ok) {
        return ctx.withEncoderError(enc);
    }
    return true;
}

template <class Opts, class ObjT, class Enc, class CTX>
    requires Kind<ObjT, ValueKind::text> || Kind<ObjT, ValueKind::text_view>
constexpr bool EncodeTyped(const ObjT& obj, Enc& enc, CTX& ctx) {
    if (!enc.write_text(obj)) {
        return ctx.withEncoderError(enc);
    }
    return true;
}

template <class Opts, class ObjT, class Enc, class CTX>
    requires Kind<ObjT, ValueKind::bytes> || Kind<ObjT, ValueKind::bytes_view> || Kind<ObjT, ValueKind::byte_array>
constexpr bool EncodeTyped(const ObjT& obj, Enc& enc, CTX& ctx) {
    if (!enc.write_bytes(std::span<const std::uint8_t>(obj.bytes.data(), obj.bytes.size()))) {
        return ctx.withEncoderError(enc);
    }
    return true;
}

template <class Opts, class ObjT, class Enc, class CTX>
    requires Kind<ObjT, ValueKind::tagged>
constexpr bool EncodeTyped(const ObjT& obj, Enc& enc, CTX& ctx) {
    auto guard = ctx.enter(PathElement{PathElement::Kind::tag, ObjT::tag});
    if (!enc.write_tag(ObjT::tag)) {
        return ctx.withEncoderError(enc);
    }
    return EncodeField<no_options>(obj.value, enc, ctx);
}

template <class Opts, class ObjT, class Enc, class CTX>
    requires Kind<ObjT, ValueKind::null_value>
constexpr bool EncodeTyped(const ObjT&, Enc& enc, CTX& ctx) {
    if (!enc.write_null()) {
        return ctx.withEncoderError(enc);
    }
    return true;
}

template <class Opts, class ObjT, class Enc, class CTX>
    requires Kind<ObjT, ValueKind::undefined_value>
constexpr bool EncodeTyped(const ObjT&, Enc& enc, CTX& ctx) {
    if (!enc.write_undefined()) {
        return ctx.withEncoderError(enc);
    }
    return true;
}

template <class Opts, class ObjT, class Enc, class CTX>
    requires Kind<ObjT, ValueKind::simple_value>
constexpr bool EncodeTyped(const ObjT& obj, Enc& enc, CTX& ctx) {
    if (!enc.write_simple(obj.value)) {
        return ctx.withEncoderError(enc);
    }
    return true;
}

// Absent optional / empty pointer is null.
template <class Opts, class ObjT, class Enc, class CTX>
    requires Kind<ObjT, ValueKind::optional> || Kind<ObjT, ValueKind::unique_ptr>
constexpr bool EncodeTyped(const ObjT& obj, Enc& enc, CTX& ctx) {
    if (!obj) {
        if (!enc.write_null()) {
            return ctx.withEncoderError(enc);
        }
        return true;
    }
    return EncodeField<Opts>(*obj, enc, ctx);
}

// [index, payload], or the bare index for VariantMeta<>::index_only.
template <class Opts, class ObjT, class Enc, class CTX>
    requires Kind<ObjT, ValueKind::variant>
constexpr bool EncodeTyped(const ObjT& obj, Enc& enc, CTX& ctx) {
    using VT = static_schema::variant_traits<ObjT>;
    static_assert(VT::indexesAreUnique, "[[[ CborKit ]]] Two variant alternatives share a wire index");

    if (obj.valueless_by_exception()) {
        return ctx.withError(EncodeError::INVALID_ARGUMENT, enc);
    }
    const std::uint64_t wire = VT::wireIndexes[obj.index()];

    if constexpr (VT::indexOnly) {
        static_assert(VT::allAlternativesEmpty,
                      "[[[ CborKit ]]] index_only variants may only hold empty alternatives");
        if (!enc.write_unsigned(wire)) {
            return ctx.withEncoderError(enc);
        }
        return true;
    } else {
        if (!enc.write_array_header(2) || !enc.write_unsigned(wire)) {
            return ctx.withEncoderError(enc);
        }
        auto guard = ctx.enter(PathElement{PathElement::Kind::variant, wire});
        return std::visit([&](const auto& alt) {
            return EncodeField<no_options>(alt, enc, ctx);
        }, obj);
    }
}

template <class Opts, class ObjT, class Enc, class CTX>
    requires Kind<ObjT, ValueKind::tuple_like>
constexpr bool EncodeTyped(const ObjT& obj, Enc& enc, CTX& ctx) {
    if (!enc.write_array_header(std::tuple_size_v<ObjT>)) {
        return ctx.withEncoderError(enc);
    }
    auto guard = ctx.enter(PathElement{PathElement::Kind::array_item, 0});
    return std::apply([&](const auto&... elems) {
        std::uint64_t i = 0;
        return ((guard.at(i++), EncodeField<no_options>(elems, enc, ctx)) && ...);
    }, obj);
}

// {0: whole seconds, 1: remaining nanoseconds}
template <class Opts, class ObjT, class Enc, class CTX>
    requires Kind<ObjT, ValueKind::duration>
constexpr bool EncodeTyped(const ObjT& obj, Enc& enc, CTX& ctx) {
    const auto secs  = std::chrono::duration_cast<std::chrono::seconds>(obj);
    const auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(obj - secs);
    if (!enc.write_map_header(2)
        || !enc.write_unsigned(0) || !enc.write_int(secs.count())
        || !enc.write_unsigned(1) || !enc.write_int(nanos.count())) {
        return ctx.withEncoderError(enc);
    }
    return true;
}

template <class Opts, class ObjT, class Enc, class CTX>
    requires Kind<ObjT, ValueKind::map_like>
constexpr bool EncodeTyped(const ObjT& obj, Enc& enc, CTX& ctx) {
    static_schema::map_read_cursor<ObjT> cursor{obj};
    typename Enc::MapFrame fr;
    if (!enc.write_map_begin(cursor.size(), fr)) {
        return ctx.withEncoderError(enc);
    }
    auto guard = ctx.enter(PathElement{PathElement::Kind::map_entry, 0});
    std::uint64_t i = 0;
    while (cursor.read_more() == stream_read_result::value) {
        guard.at(i++);
        if (!EncodeField<no_options>(cursor.get_key(), enc, ctx)) {
            return false;
        }
        if (!enc.move_to_value(fr)) {
            return ctx.withEncoderError(enc);
        }
        if (!EncodeField<no_options>(cursor.get_value(), enc, ctx)) {
            return false;
        }
        if (!enc.advance_after_value(fr)) {
            return ctx.withEncoderError(enc);
        }
    }
    if (!enc.write_map_end(fr)) {
        return ctx.withEncoderError(enc);
    }
    return true;
}

template <class Opts, class ObjT, class Enc, class CTX>
    requires Kind<ObjT, ValueKind::array_like>
constexpr bool EncodeTyped(const ObjT& obj, Enc& enc, CTX& ctx) {
    static_assert(static_schema::ArrayReadable<ObjT>, "[[[ CborKit ]]] Sequence type is not iterable");
    static_schema::array_read_cursor<ObjT> cursor{obj};
    typename Enc::ArrayFrame fr;
    if (!enc.write_array_begin(cursor.size(), fr)) {
        return ctx.withEncoderError(enc);
    }
    auto guard = ctx.enter(PathElement{PathElement::Kind::array_item, 0});
    std::uint64_t i = 0;
    while (cursor.read_more() == stream_read_result::value) {
        guard.at(i++);
        if (!EncodeField<no_options>(cursor.get(), enc, ctx)) {
            return false;
        }
        if (!enc.advance_after_value(fr)) {
            return ctx.withEncoderError(enc);
        }
    }
    if (!enc.write_array_end(fr)) {
        return ctx.withEncoderError(enc);
    }
    return true;
}

// ======== Structs ========

template <class Opts, class ObjT, class Tag>
inline constexpr bool struct_has_option =
    Opts::template has_option<Tag>
    || options::detail::field_options<introspection::structureOptions<ObjT>>::template has_option<Tag>;

template <class ObjT, std::size_t I>
constexpr decltype(auto) fieldRef(const ObjT& obj) {
    using Meta = struct_fields_helper::FieldMeta<ObjT, I>;
    return Meta::getRef(introspection::getStructElementByIndex<I>(obj));
}

// Whether a field is written at all: absent optionals and pointers, and
// skip_default fields equal to their value in a default-constructed parent,
// are left out.
template <class ObjT, std::size_t I>
constexpr bool fieldIsPresent(const ObjT& obj) {
    using Value = struct_fields_helper::FieldValue<ObjT, I>;
    using FieldOpts = struct_fields_helper::FieldOpts<ObjT, I>;
    if constexpr (struct_fields_helper::fieldIsExcluded<ObjT, I>()) {
        return false;
    } else {
        const auto& v = fieldRef<ObjT, I>(obj);
        if constexpr (Kind<Value, ValueKind::optional> || Kind<Value, ValueKind::unique_ptr>) {
            if (!v) return false;
        }
        if constexpr (FieldOpts::template has_option<options::detail::skip_default_tag>) {
            if (v == struct_fields_helper::defaultFieldValue<ObjT, I>()) return false;
        }
        return true;
    }
}

template <class ObjT, std::size_t I, class Enc, class CTX>
constexpr bool EncodeStructMember(const ObjT& obj, Enc& enc, CTX& ctx) {
    if constexpr (struct_fields_helper::fieldIsExcluded<ObjT, I>()) {
        return true;
    } else {
        using FieldOpts = struct_fields_helper::FieldOpts<ObjT, I>;
        return EncodeField<FieldOpts>(introspection::getStructElementByIndex<I>(obj), enc, ctx);
    }
}

template <std::size_t I, class Frame, class Guard, class ObjT, class Enc, class CTX>
constexpr bool EncodeOneMapField(Frame& fr, Guard& guard, const ObjT& obj, Enc& enc, CTX& ctx) {
    if (!fieldIsPresent<ObjT, I>(obj)) {
        return true;
    }
    constexpr std::uint64_t wire = struct_fields_helper::FieldsHelper<ObjT>::wireIndexes[I];
    guard.at(wire);
    if (!enc.write_unsigned(wire) || !enc.move_to_value(fr)) {
        return ctx.withEncoderError(enc);
    }
    if (!EncodeStructMember<ObjT, I>(obj, enc, ctx)) {
        return false;
    }
    if (!enc.advance_after_value(fr)) {
        return ctx.withEncoderError(enc);
    }
    return true;
}

// Index-keyed map: {wire index: value, ...}
template <class Opts, class ObjT, class Enc, class CTX>
    requires Kind<ObjT, ValueKind::structure>
        && (!struct_has_option<Opts, ObjT, options::detail::as_array_tag>)
        && (!struct_has_option<Opts, ObjT, options::detail::transparent_tag>)
constexpr bool EncodeTyped(const ObjT& obj, Enc& enc, CTX& ctx) {
    using FH = struct_fields_helper::FieldsHelper<ObjT>;
    static_assert(FH::fieldsAreUnique, "[[[ CborKit ]]] Two fields share a wire index");

    return [&]<std::size_t... I>(std::index_sequence<I...>) {
        const std::size_t present = (std::size_t{0} + ... + (fieldIsPresent<ObjT, I>(obj) ? 1 : 0));
        typename Enc::MapFrame fr;
        if (!enc.write_map_begin(present, fr)) {
            return ctx.withEncoderError(enc);
        }
        {
            auto guard = ctx.enter(PathElement{PathElement::Kind::field, 0});
            if (!(EncodeOneMapField<I>(fr, guard, obj, enc, ctx) && ...)) {
                return false;
            }
        }
        if (!enc.write_map_end(fr)) {
            return ctx.withEncoderError(enc);
        }
        return true;
    }(std::make_index_sequence<FH::rawFieldsCount>{});
}

// Positional array: element k holds the field with wire index k. Positions
// without a field are null; trailing fields that are left out shorten the array.
template <class Opts, class ObjT, class Enc, class CTX>
    requires Kind<ObjT, ValueKind::structure>
        && struct_has_option<Opts, ObjT, options::detail::as_array_tag>
        && (!struct_has_option<Opts, ObjT, options::detail::transparent_tag>)
constexpr bool EncodeTyped(const ObjT& obj, Enc& enc, CTX& ctx) {
    using FH = struct_fields_helper::FieldsHelper<ObjT>;
    static_assert(FH::fieldsAreUnique, "[[[ CborKit ]]] Two fields share a wire index");

    return [&]<std::size_t... I>(std::index_sequence<I...>) {
        std::uint64_t length = 0;
        auto measure = [&]<std::size_t J>(std::integral_constant<std::size_t, J>) {
            if (fieldIsPresent<ObjT, J>(obj) && FH::wireIndexes[J] + 1 > length) {
                length = FH::wireIndexes[J] + 1;
            }
        };
        (measure(std::integral_constant<std::size_t, I>{}), ...);

        if (!enc.write_array_header(length)) {
            return ctx.withEncoderError(enc);
        }
        auto guard = ctx.enter(PathElement{PathElement::Kind::field, 0});
        for (std::uint64_t pos = 0; pos < length; ++pos) {
            guard.at(pos);
            bool found = false;
            bool ok = true;
            auto encodeAt = [&]<std::size_t J>(std::integral_constant<std::size_t, J>) {
                if (FH::wireIndexes[J] != pos) return;
                found = true;
                ok = EncodeStructMember<ObjT, J>(obj, enc, ctx);
            };
            (encodeAt(std::integral_constant<std::size_t, I>{}), ...);
            if (!ok) {
                return false;
            }
            if (!found && !enc.write_null()) {
                return ctx.withEncoderError(enc);
            }
        }
        return true;
    }(std::make_index_sequence<FH::rawFieldsCount>{});
}

// Single-field wrapper encoded as its field.
template <class Opts, class ObjT, class Enc, class CTX>
    requires Kind<ObjT, ValueKind::structure>
        && struct_has_option<Opts, ObjT, options::detail::transparent_tag>
constexpr bool EncodeTyped(const ObjT& obj, Enc& enc, CTX& ctx) {
    using FH = struct_fields_helper::FieldsHelper<ObjT>;
    static_assert(FH::fieldsCount == 1, "[[[ CborKit ]]] transparent structs must have exactly one wire field");
    return EncodeStructMember<ObjT, FH::firstWireMember>(obj, enc, ctx);
}

template <class Opts, class ObjT, class Enc, class CTX>
    requires Kind<ObjT, ValueKind::unsupported>
constexpr bool EncodeTyped(const ObjT&, Enc&, CTX&) {
    static_assert(!sizeof(ObjT),
                  "[[[ CborKit ]]] T has no CBOR mapping.\n"
                  "Use a supported type, an aggregate, a StructMeta<T> or a Codec<T> specialization");
    return false;
}

// Unwraps Annotated<> and merges its options into the ones given by the caller.
template <class Opts, class Field, class Enc, class CTX>
constexpr bool EncodeField(const Field& obj, Enc& enc, CTX& ctx) {
    using Meta   = options::detail::annotation_meta_getter<Field>;
    using Merged = options::detail::field_options<
        typename options::detail::merge_options<typename Opts::pack, typename Meta::OptionsP>::type>;
    return EncodeTyped<Merged>(Meta::getRef(obj), enc, ctx);
}

} // namespace encoder_details

// Entry point for Codec<T>::encode implementations that nest other values.
template <class T, class Enc, class CTX>
constexpr bool EncodeValue(const T& obj, Enc& enc, CTX& ctx) {
    return encoder_details::EncodeField<options::detail::no_options>(obj, enc, ctx);
}

template <class InputObjectT, class UserCtx = void, class Enc>
constexpr EncodeResult EncodeWithEncoder(const InputObjectT& obj, Enc& enc, UserCtx* userCtx = nullptr) {
    EncodeContext<UserCtx> ctx(userCtx);
    encoder_details::EncodeField<options::detail::no_options>(obj, enc, ctx);
    return ctx.result(enc);
}

template <class InputObjectT, ByteOutputIterator It, ByteSentinelForOut<It> Sent, class UserCtx = void>
constexpr EncodeResult Encode(const InputObjectT& obj, It first, Sent last, UserCtx* userCtx = nullptr,
                              EncoderConfig cfg = {}) {
    Encoder<It, Sent> enc(first, last, cfg);
    return EncodeWithEncoder(obj, enc, userCtx);
}

#if CBORKIT_ENABLE_STD
template <class InputObjectT, class UserCtx = void>
constexpr EncodeResult Encode(const InputObjectT& obj, std::vector<std::uint8_t>& out, UserCtx* userCtx = nullptr,
                              EncoderConfig cfg = {}) {
    out.clear();
    return Encode(obj, std::back_inserter(out), io_details::limitless_sentinel{}, userCtx, cfg);
}
#endif

} // namespace CborKit
