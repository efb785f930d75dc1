#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <type_traits>
#include <utility>

#include "options.hpp"
#include "struct_introspection.hpp"

namespace CborKit {

namespace struct_fields_helper {

template<class T, std::size_t I>
using FieldMeta = options::detail::annotation_meta_getter<introspection::structureElementTypeByIndex<I, T>>;

template<class T, std::size_t I>
using FieldOpts = typename FieldMeta<T, I>::options;

template<class T, std::size_t I>
using FieldValue = typename FieldMeta<T, I>::value_t;

template<class T, std::size_t I>
static consteval bool fieldIsExcluded() {
    return FieldOpts<T, I>::template has_option<options::detail::exclude_tag>;
}

// Value the field holds in a default-constructed T. skip_default fields equal
// to it are left out on encode and restored to it on decode.
template<class T, std::size_t I>
constexpr FieldValue<T, I> defaultFieldValue() {
    static_assert(std::is_default_constructible_v<T>,
                  "[[[ CborKit ]]] skip_default needs a default-constructible parent struct");
    const T parent{};
    return FieldMeta<T, I>::getRef(introspection::getStructElementByIndex<I>(parent));
}

inline constexpr std::uint64_t not_on_wire = std::numeric_limits<std::uint64_t>::max();
inline constexpr std::size_t   npos        = std::numeric_limits<std::size_t>::max();

template<class T>
struct FieldsHelper {
    static constexpr std::size_t rawFieldsCount = introspection::structureElementsCount<T>;

    static constexpr std::size_t fieldsCount = []<std::size_t... I>(std::index_sequence<I...>) consteval {
        return (std::size_t{0} + ... + (!fieldIsExcluded<T, I>() ? 1 : 0));
    }(std::make_index_sequence<rawFieldsCount>{});

    // Wire index per struct member, not_on_wire for excluded members.
    static constexpr std::array<std::uint64_t, rawFieldsCount> wireIndexes =
        []<std::size_t... I>(std::index_sequence<I...>) consteval {
            std::array<std::uint64_t, rawFieldsCount> arr{};
            std::uint64_t next = 0;
            auto assign_one = [&](auto ic) consteval {
                constexpr std::size_t J = decltype(ic)::value;
                using Opts = FieldOpts<T, J>;
                if constexpr (fieldIsExcluded<T, J>()) {
                    arr[J] = not_on_wire;
                } else {
                    if constexpr (Opts::template has_option<options::detail::index_tag>) {
                        next = Opts::template get_option<options::detail::index_tag>::value;
                    }
                    arr[J] = next++;
                }
            };
            (assign_one(std::integral_constant<std::size_t, I>{}), ...);
            return arr;
        }(std::make_index_sequence<rawFieldsCount>{});

    static constexpr bool fieldsAreUnique = [](std::array<std::uint64_t, rawFieldsCount> arr) consteval {
        std::ranges::sort(arr);
        for (std::size_t i = 1; i < arr.size(); ++i) {
            if (arr[i] == arr[i - 1] && arr[i] != not_on_wire) return false;
        }
        return true;
    }(wireIndexes);

    static constexpr std::uint64_t maxWireIndex = []() consteval {
        std::uint64_t m = 0;
        for (auto w : wireIndexes) {
            if (w != not_on_wire && w > m) m = w;
        }
        return m;
    }();

    // Struct member carrying the given wire index, or npos.
    static constexpr std::size_t memberForWireIndex(std::uint64_t wire) {
        for (std::size_t i = 0; i < rawFieldsCount; ++i) {
            if (wireIndexes[i] == wire && wire != not_on_wire) return i;
        }
        return npos;
    }

    static constexpr std::size_t firstWireMember = []() consteval {
        for (std::size_t i = 0; i < rawFieldsCount; ++i) {
            if (wireIndexes[i] != not_on_wire) return i;
        }
        return npos;
    }();
};

} // namespace struct_fields_helper

} // namespace CborKit
