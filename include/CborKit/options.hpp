#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>
#include <type_traits>

#include "annotated.hpp"

namespace CborKit {

template <class... Opts>
struct OptionsPack {
    static constexpr std::size_t Count = sizeof...(Opts);
};

namespace options {

namespace detail {

struct index_tag{};
struct skip_default_tag{};
struct defaulted_tag{};
struct exclude_tag{};
struct as_array_tag{};
struct transparent_tag{};

}

// Explicit wire index of a field. Fields without one continue counting from
// the previous field's index.
template<std::uint64_t N>
struct index {
    using tag = detail::index_tag;
    static constexpr std::uint64_t value = N;
    static constexpr std::string_view to_string() {
        return "index";
    }
};

// Not emitted while equal to the value-initialized default; absent input
// leaves the default in place.
struct skip_default {
    using tag = detail::skip_default_tag;
    static constexpr std::string_view to_string() {
        return "skip_default";
    }
};

// Always emitted; absent input leaves the default in place.
struct defaulted {
    using tag = detail::defaulted_tag;
    static constexpr std::string_view to_string() {
        return "defaulted";
    }
};

// Never on the wire.
struct exclude {
    using tag = detail::exclude_tag;
    static constexpr std::string_view to_string() {
        return "exclude";
    }
};

// Struct encoded as a positional array instead of an index-keyed map.
struct as_array {
    using tag = detail::as_array_tag;
    static constexpr std::string_view to_string() {
        return "as_array";
    }
};

// Struct with a single field encoded as that field alone.
struct transparent {
    using tag = detail::transparent_tag;
    static constexpr std::string_view to_string() {
        return "transparent";
    }
};

namespace detail {

template<class Opt, class Tag, class = void>
struct option_matches_tag : std::false_type {};

template<class Opt, class Tag>
struct option_matches_tag<Opt, Tag, std::void_t<typename Opt::tag>>
    : std::bool_constant<std::is_same_v<typename Opt::tag, Tag>> {};

template<class Tag, class... Opts>
struct find_option_by_tag;

template<class Tag>
struct find_option_by_tag<Tag> {
    using type = void;
};

template<class Tag, class First, class... Rest>
struct find_option_by_tag<Tag, First, Rest...> {
private:
    using next = typename find_option_by_tag<Tag, Rest...>::type;

public:
    using type = std::conditional_t<
        option_matches_tag<First, Tag>::value,
        First,
        next
        >;
};

template<class OptPack> struct field_options;

template<class... Opts>
struct field_options<OptionsPack<Opts...>> {
    using pack = OptionsPack<Opts...>;

    template<class Tag>
    using option_type = typename detail::find_option_by_tag<Tag, Opts...>::type;

    template<class Tag>
    static constexpr bool has_option = !std::is_void_v<option_type<Tag>>;

    template<class Tag>
    using get_option = option_type<Tag>;
};

using no_options = field_options<OptionsPack<>>;

template <class P1, class P2> struct merge_options;
template <class... Opts1, class... Opts2>
struct merge_options<OptionsPack<Opts1...>, OptionsPack<Opts2...>> {
    using type = OptionsPack<Opts1..., Opts2...>;
};

template<class T>
struct annotation_meta {
    using value_t  = T;
    using OptionsP = OptionsPack<>;
    using options  = no_options;

    static constexpr decltype(auto) getRef(T& f) {
        return (f);
    }
    static constexpr decltype(auto) getRef(const T& f) {
        return (f);
    }
};

template<class T, class... Opts>
struct annotation_meta<Annotated<T, Opts...>> {
    using value_t  = T;
    using OptionsP = OptionsPack<Opts...>;
    using options  = field_options<OptionsP>;

    static constexpr decltype(auto) getRef(Annotated<T, Opts...>& f) {
        return (f.value);
    }
    static constexpr decltype(auto) getRef(const Annotated<T, Opts...>& f) {
        return (f.value);
    }

    // StructMeta fields: the member is a plain T, the options are injected.
    static constexpr decltype(auto) getRef(T& f) {
        return (f);
    }
    static constexpr decltype(auto) getRef(const T& f) {
        return (f);
    }
};

template<class T, class... Opts>
struct annotation_meta<std::optional<Annotated<T, Opts...>>> {
    static_assert(!sizeof(T), "[[[ CborKit ]]] Use Annotated<std::optional<T>, ...> instead of std::optional<Annotated<T, ...>>");
};

template<class T, class... Opts>
struct annotation_meta<std::unique_ptr<Annotated<T, Opts...>>> {
    static_assert(!sizeof(T), "[[[ CborKit ]]] Use Annotated<std::unique_ptr<T>, ...> instead of std::unique_ptr<Annotated<T, ...>>");
};

template<class Field>
struct annotation_meta_getter : annotation_meta<std::remove_cvref_t<Field>> {};

} // namespace detail

} // namespace options

} // namespace CborKit
