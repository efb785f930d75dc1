#pragma once

#include <array>
#include <chrono>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <optional>
#include <ranges>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>

#include "config.hpp"
#include "codec.hpp"
#include "options.hpp"
#include "struct_introspection.hpp"
#include "types.hpp"

#if CBORKIT_ENABLE_ALLOC
#include <memory>
#include <string>
#endif

namespace CborKit {

enum class stream_read_result : std::uint8_t {
    value,  // one value produced; keep going
    end,    // normal end-of-stream
    error   // unrecoverable error; abort
};

enum class stream_write_result : std::uint8_t {
    slot_allocated,
    overflow,
    error,
    value_processed
};

// Optional indices for std::variant alternatives on the wire:
//
//   template<> struct CborKit::VariantMeta<Shape> {
//       static constexpr std::array<std::uint32_t, 2> indices{10, 20};
//       static constexpr bool index_only = false;   // optional
//   };
template <class V>
struct VariantMeta {

};

// Optional list of valid enumerators, checked on decode:
//
//   template<> struct CborKit::EnumMeta<Color> {
//       static constexpr std::array values{Color::red, Color::green};
//   };
template <class E>
struct EnumMeta {

};

namespace static_schema {

template<class T, template<class...> class Template>
struct is_specialization_of : std::false_type {};

template<template<class...> class Template, class... Args>
struct is_specialization_of<Template<Args...>, Template> : std::true_type {};

template<class T, template<class...> class Template>
constexpr bool is_specialization_of_v = is_specialization_of<std::remove_cvref_t<T>, Template>::value;

template<class T> struct is_std_array : std::false_type {};
template<class T, std::size_t N> struct is_std_array<std::array<T, N>> : std::true_type {};

template<class T> struct is_byte_array : std::false_type {};
template<std::size_t N> struct is_byte_array<ByteArray<N>> : std::true_type {};

template<class T> struct is_tagged : std::false_type {};
template<std::uint64_t N, class T> struct is_tagged<Tagged<N, T>> : std::true_type {};

template<class T>
concept TransformerLike = requires(T& t, const T& ct, typename T::wire_type& w, const typename T::wire_type& cw) {
    typename T::wire_type;
    { ct.transform_to(w) } -> std::same_as<bool>;
    { t.transform_from(cw) } -> std::same_as<bool>;
};

template<class T>
concept MapLikeContainer = requires(const T& m) {
    typename T::key_type;
    typename T::mapped_type;
    m.begin();
    m.end();
    m.size();
};

template<class T>
concept SequenceContainer = std::ranges::range<T> && requires(const T& c) {
    typename T::value_type;
    c.size();
};

enum class ValueKind : std::uint8_t {
    unsupported,
    custom,
    transformer,
    boolean,
    integer,
    enumeration,
    floating,
    text,
    text_view,
    bytes,
    bytes_view,
    byte_array,
    tagged,
    null_value,
    undefined_value,
    simple_value,
    optional,
    unique_ptr,
    variant,
    tuple_like,
    duration,
    map_like,
    array_like,
    structure
};

// Exactly one kind per type; earlier checks win.
template<class T>
consteval ValueKind kind_of() {
    using D = std::remove_cv_t<T>;
    if constexpr (HasCustomCodec<D>) {
        return ValueKind::custom;
    } else if constexpr (TransformerLike<D>) {
        return ValueKind::transformer;
    } else if constexpr (std::is_same_v<D, bool>) {
        return ValueKind::boolean;
    } else if constexpr (std::is_integral_v<D>) {
        return ValueKind::integer;
    } else if constexpr (std::is_enum_v<D> && config::derive_enabled()) {
        return ValueKind::enumeration;
    } else if constexpr (std::is_same_v<D, float> || std::is_same_v<D, double>) {
        return ValueKind::floating;
#if CBORKIT_ENABLE_ALLOC
    } else if constexpr (std::is_same_v<D, std::string>) {
        return ValueKind::text;
    } else if constexpr (std::is_same_v<D, ByteVec>) {
        return ValueKind::bytes;
    } else if constexpr (is_specialization_of_v<D, std::unique_ptr>) {
        return ValueKind::unique_ptr;
#endif
    } else if constexpr (std::is_same_v<D, std::string_view>) {
        return ValueKind::text_view;
    } else if constexpr (std::is_same_v<D, ByteSlice>) {
        return ValueKind::bytes_view;
    } else if constexpr (is_byte_array<D>::value) {
        return ValueKind::byte_array;
    } else if constexpr (is_tagged<D>::value) {
        return ValueKind::tagged;
    } else if constexpr (std::is_same_v<D, Null> || std::is_same_v<D, std::monostate>) {
        return ValueKind::null_value;
    } else if constexpr (std::is_same_v<D, Undefined>) {
        return ValueKind::undefined_value;
    } else if constexpr (std::is_same_v<D, Simple>) {
        return ValueKind::simple_value;
    } else if constexpr (is_specialization_of_v<D, std::optional>) {
        return ValueKind::optional;
    } else if constexpr (is_specialization_of_v<D, std::variant> && config::derive_enabled()) {
        return ValueKind::variant;
    } else if constexpr (is_specialization_of_v<D, std::pair> || is_specialization_of_v<D, std::tuple>) {
        return ValueKind::tuple_like;
    } else if constexpr (is_specialization_of_v<D, std::chrono::duration>) {
        return ValueKind::duration;
    } else if constexpr (MapLikeContainer<D>) {
        return ValueKind::map_like;
    } else if constexpr (std::is_bounded_array_v<D> || is_std_array<D>::value || SequenceContainer<D>) {
        return ValueKind::array_like;
    } else if constexpr (config::derive_enabled()
                         && (introspection::detail::has_struct_meta_specialization<D>
                             || (std::is_class_v<D> && std::is_aggregate_v<D>))) {
        return ValueKind::structure;
    } else {
        return ValueKind::unsupported;
    }
}

template<class T, ValueKind K>
concept Kind = (kind_of<T>() == K);

template<class T>
concept Supported = (kind_of<T>() != ValueKind::unsupported);

// ======== Array cursors ========

template<class C>
struct array_read_cursor {};

template<class C>
    requires std::ranges::range<const C>
struct array_read_cursor<C> {
    using element_type = std::remove_cvref_t<std::ranges::range_value_t<const C>>;
    const C& c;
    decltype(std::ranges::begin(c)) it = std::ranges::begin(c);
    bool first = true;

    constexpr std::size_t size() const {
        return static_cast<std::size_t>(std::ranges::distance(c));
    }
    constexpr decltype(auto) get() const {
        return *it;
    }
    constexpr stream_read_result read_more() {
        if (first) {
            first = false;
        } else {
            ++it;
        }
        return it != std::ranges::end(c) ? stream_read_result::value : stream_read_result::end;
    }
};

template<class C>
concept ArrayReadable = requires(C& c) {
    typename array_read_cursor<C>::element_type;
    { array_read_cursor<C>{c}.read_more() } -> std::same_as<stream_read_result>;
    { array_read_cursor<C>{c}.size() } -> std::same_as<std::size_t>;
};

template<class C>
struct array_write_cursor;

// Growable sequences: vector, deque, list.
template<class C>
    requires requires(C& c) {
        { c.emplace_back() } -> std::same_as<typename C::value_type&>;
        c.clear();
    }
struct array_write_cursor<C> {
    using element_type = typename C::value_type;
    static constexpr bool fixed_size = false;
    C& c;

    constexpr stream_write_result allocate_slot() {
        return stream_write_result::slot_allocated;
    }
    constexpr element_type& get_slot() {
        return c.emplace_back();
    }
    constexpr stream_write_result finalize_item(bool ok) {
        return ok ? stream_write_result::value_processed : stream_write_result::error;
    }
    constexpr stream_write_result finalize(bool ok) {
        return ok ? stream_write_result::value_processed : stream_write_result::error;
    }
    constexpr void reset() {
        c.clear();
    }
};

// Sets: each element is decoded aside and inserted; repeats collapse.
template<class C>
    requires (!requires(C& c) { c.emplace_back(); })
          && requires(C& c, typename C::value_type&& v) {
        c.insert(std::move(v));
        c.clear();
    }
struct array_write_cursor<C> {
    using element_type = typename C::value_type;
    static constexpr bool fixed_size = false;
    C& c;
    element_type slot{};

    constexpr stream_write_result allocate_slot() {
        slot = element_type{};
        return stream_write_result::slot_allocated;
    }
    constexpr element_type& get_slot() {
        return slot;
    }
    constexpr stream_write_result finalize_item(bool ok) {
        if (!ok) return stream_write_result::error;
        c.insert(std::move(slot));
        return stream_write_result::value_processed;
    }
    constexpr stream_write_result finalize(bool ok) {
        return ok ? stream_write_result::value_processed : stream_write_result::error;
    }
    constexpr void reset() {
        c.clear();
    }
};

// Fixed size: exactly N items on the wire.
template<class T, std::size_t N>
struct fixed_array_write_cursor {
    using element_type = T;
    static constexpr bool fixed_size = true;
    T* data;
    std::size_t filled = 0;

    constexpr stream_write_result allocate_slot() {
        return filled < N ? stream_write_result::slot_allocated : stream_write_result::overflow;
    }
    constexpr element_type& get_slot() {
        return data[filled];
    }
    constexpr stream_write_result finalize_item(bool ok) {
        if (!ok) return stream_write_result::error;
        ++filled;
        return stream_write_result::value_processed;
    }
    constexpr stream_write_result finalize(bool ok) {
        if (!ok) return stream_write_result::error;
        return filled == N ? stream_write_result::value_processed : stream_write_result::overflow;
    }
    constexpr void reset() {
        filled = 0;
    }
};

template<class T, std::size_t N>
struct array_write_cursor<std::array<T, N>> : fixed_array_write_cursor<T, N> {
    constexpr array_write_cursor(std::array<T, N>& a) : fixed_array_write_cursor<T, N>{a.data()} {}
};

template<class T, std::size_t N>
struct array_write_cursor<T[N]> : fixed_array_write_cursor<T, N> {
    constexpr array_write_cursor(T (&a)[N]) : fixed_array_write_cursor<T, N>{a} {}
};

template<class C>
concept ArrayWritable = requires(C& c) {
    typename array_write_cursor<C>::element_type;
    { array_write_cursor<C>{c}.allocate_slot() } -> std::same_as<stream_write_result>;
    { array_write_cursor<C>{c}.get_slot() } -> std::same_as<typename array_write_cursor<C>::element_type&>;
    { array_write_cursor<C>{c}.finalize_item(std::declval<bool>()) } -> std::same_as<stream_write_result>;
    { array_write_cursor<C>{c}.finalize(std::declval<bool>()) } -> std::same_as<stream_write_result>;
};

// ======== Map cursors ========

template<class M>
struct map_read_cursor {
    using key_type    = typename M::key_type;
    using mapped_type = typename M::mapped_type;

    const M& m;
    typename M::const_iterator it = m.begin();
    bool first = true;

    constexpr std::size_t size() const {
        return m.size();
    }
    constexpr stream_read_result read_more() {
        if (first) {
            first = false;
        } else {
            ++it;
        }
        return it != m.end() ? stream_read_result::value : stream_read_result::end;
    }
    constexpr const key_type& get_key() const {
        return it->first;
    }
    constexpr const mapped_type& get_value() const {
        return it->second;
    }
};

template<class M>
struct map_write_cursor {
    using key_type    = typename M::key_type;
    using mapped_type = typename M::mapped_type;

    M& m;
    key_type current_key{};
    mapped_type current_value{};

    constexpr key_type& key_ref() {
        current_key = key_type{};
        return current_key;
    }
    constexpr mapped_type& value_ref() {
        current_value = mapped_type{};
        return current_value;
    }
    // overflow: the key was already present
    constexpr stream_write_result finalize_pair(bool ok) {
        if (!ok) return stream_write_result::error;
        auto [it, inserted] = m.try_emplace(std::move(current_key), std::move(current_value));
        return inserted ? stream_write_result::value_processed : stream_write_result::overflow;
    }
    constexpr void reset() {
        m.clear();
    }
};

// ======== Sum types ========

template<class V>
struct variant_traits {
    static constexpr std::size_t alternatives = std::variant_size_v<V>;

    static constexpr std::array<std::uint64_t, alternatives> wireIndexes = []() consteval {
        std::array<std::uint64_t, alternatives> out{};
        if constexpr (requires { VariantMeta<V>::indices; }) {
            static_assert(VariantMeta<V>::indices.size() == alternatives,
                          "[[[ CborKit ]]] VariantMeta::indices must list one index per alternative");
            for (std::size_t i = 0; i < alternatives; ++i) out[i] = VariantMeta<V>::indices[i];
        } else {
            for (std::size_t i = 0; i < alternatives; ++i) out[i] = i;
        }
        return out;
    }();

    static constexpr bool indexesAreUnique = [](std::array<std::uint64_t, alternatives> arr) consteval {
        std::ranges::sort(arr);
        return std::ranges::adjacent_find(arr) == arr.end();
    }(wireIndexes);

    static constexpr bool indexOnly = []() consteval {
        if constexpr (requires { VariantMeta<V>::index_only; }) {
            return static_cast<bool>(VariantMeta<V>::index_only);
        } else {
            return false;
        }
    }();

    static constexpr bool allAlternativesEmpty = []<std::size_t... I>(std::index_sequence<I...>) consteval {
        return (std::is_empty_v<std::variant_alternative_t<I, V>> && ...);
    }(std::make_index_sequence<alternatives>{});

    // Alternative position for a wire index, or alternatives when unknown.
    static constexpr std::size_t alternativeFor(std::uint64_t wire) {
        for (std::size_t i = 0; i < alternatives; ++i) {
            if (wireIndexes[i] == wire) return i;
        }
        return alternatives;
    }
};

template<class E>
constexpr bool enum_value_is_known(E value) {
    if constexpr (requires { EnumMeta<E>::values; }) {
        for (const auto& v : EnumMeta<E>::values) {
            if (v == value) return true;
        }
        return false;
    } else {
        return true;
    }
}

} // namespace static_schema

} // namespace CborKit
