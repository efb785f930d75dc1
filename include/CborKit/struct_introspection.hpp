#pragma once

#include <cstddef>
#include <cstdint>
#include <tuple>
#include <type_traits>
#include <pfr/tuple_size.hpp>
#include <pfr/core.hpp>

#include "annotated.hpp"
#include "options.hpp"

namespace CborKit {

// Explicit field listing for types pfr cannot (or should not) reflect:
//
//   template<> struct CborKit::StructMeta<Point> {
//       using Fields  = StructFields<Field<&Point::x, 0>, Field<&Point::y, 1>>;
//       using Options = OptionsPack<options::as_array>;   // optional
//   };
template <class T>
struct StructMeta {

};

template <auto MPtr, std::uint64_t Index, class... Opts>
struct Field;

template <typename C, typename T, T C::*MPtr, std::uint64_t Index, class... Opts>
struct Field<MPtr, Index, Opts...> {
    using ClassT   = C;
    using ValueT   = T;
    using OptionsP = OptionsPack<options::index<Index>, Opts...>;
    static constexpr std::uint64_t WireIndex = Index;
    static constexpr T C::* MemberP = MPtr;
};

template <class... F>
struct StructFields {
    using FieldsTuple = std::tuple<F...>;
};

namespace introspection {

namespace detail {

template<class T>
struct IntrospectionImpl {
    using StructT = std::remove_cv_t<T>;

    template<std::size_t Index>
    static constexpr decltype(auto) getStructElementByIndex(StructT& s) {
        return (pfr::get<Index>(s));
    }

    template<std::size_t Index>
    static constexpr decltype(auto) getStructElementByIndex(const StructT& s) {
        return (pfr::get<Index>(s));
    }

    static constexpr std::size_t structureElementsCount = pfr::tuple_size_v<StructT>;

    template<std::size_t Index>
    using structureElementTypeByIndex = pfr::tuple_element_t<Index, StructT>;

    using StructOptions = OptionsPack<>;
};

template<class T>
struct is_fields_pack : std::false_type {};

template<class... F>
struct is_fields_pack<StructFields<F...>> : std::true_type {};

template<class T>
inline constexpr bool is_fields_pack_v = is_fields_pack<T>::value;

template<class T, class = void>
struct has_struct_meta_specialization_impl : std::false_type {};

template<class T>
struct has_struct_meta_specialization_impl<T, std::void_t<typename StructMeta<T>::Fields>>
    : std::bool_constant<is_fields_pack_v<typename StructMeta<T>::Fields>> {};

template<class T>
inline constexpr bool has_struct_meta_specialization = has_struct_meta_specialization_impl<T>::value;

template<class T, class = void>
struct struct_meta_options {
    using type = OptionsPack<>;
};

template<class T>
struct struct_meta_options<T, std::void_t<typename StructMeta<T>::Options>> {
    using type = typename StructMeta<T>::Options;
};

template <class T, class OptPack> struct AnnotationFiller;
template <class T, class... Opts> struct AnnotationFiller<T, OptionsPack<Opts...>> {
    using type = Annotated<T, Opts...>;
};

template <class T>
    requires (has_struct_meta_specialization<T>)
struct IntrospectionImpl<T> {
    using Fields = typename StructMeta<T>::Fields::FieldsTuple;
    static constexpr std::size_t structureElementsCount = std::tuple_size_v<Fields>;

    template<std::size_t Index, class StructT>
    static constexpr decltype(auto) getStructElementByIndex(StructT& s) {
        using F = std::tuple_element_t<Index, Fields>;
        return (s.*(F::MemberP));
    }

    // Listed fields carry their options (and wire index) as if annotated.
    template<std::size_t Index>
    using structureElementTypeByIndex = typename AnnotationFiller<
                                        typename std::tuple_element_t<Index, Fields>::ValueT,
                                        typename std::tuple_element_t<Index, Fields>::OptionsP
                                        >::type;

    using StructOptions = typename struct_meta_options<T>::type;
};

} // namespace detail

template<std::size_t Index, class StructT>
constexpr decltype(auto) getStructElementByIndex(StructT& s) {
    using Impl = detail::IntrospectionImpl<std::remove_cv_t<StructT>>;
    return (Impl::template getStructElementByIndex<Index>(s));
}

template<std::size_t Index, class StructT>
constexpr decltype(auto) getStructElementByIndex(const StructT& s) {
    using Impl = detail::IntrospectionImpl<std::remove_cv_t<StructT>>;
    return (Impl::template getStructElementByIndex<Index>(s));
}

template<class StructT>
inline constexpr std::size_t structureElementsCount = detail::IntrospectionImpl<std::remove_cv_t<StructT>>::structureElementsCount;

template<std::size_t Index, class StructT>
using structureElementTypeByIndex = typename detail::IntrospectionImpl<std::remove_cv_t<StructT>>::template structureElementTypeByIndex<Index>;

template<class StructT>
using structureOptions = typename detail::IntrospectionImpl<std::remove_cv_t<StructT>>::StructOptions;

} // namespace introspection

} // namespace CborKit
