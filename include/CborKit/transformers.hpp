#pragma once

#include <concepts>
#include <memory>
#include <utility>

namespace CborKit {

namespace transformers {

// Stores StoredT in the model, travels as WireT on the wire.
//   FromFn: bool(StoredT&, const WireT&)   used when decoding
//   ToFn:   bool(const StoredT&, WireT&)   used when encoding
// A conversion returning false fails the call with CUSTOM_CODEC_ERROR.
template<
    class StoredT,
    class WireT,
    auto FromFn,
    auto ToFn
>
struct Transformed {
    using stored_type = StoredT;
    using wire_type   = WireT;

    StoredT value{};

    constexpr bool transform_from(const WireT& wire) {
        return FromFn(value, wire);
    }

    constexpr bool transform_to(WireT& wire) const {
        return ToFn(value, wire);
    }

    constexpr Transformed() = default;
    constexpr Transformed(const Transformed&) = default;
    constexpr Transformed(Transformed&&) = default;
    constexpr Transformed& operator=(const Transformed&) = default;
    constexpr Transformed& operator=(Transformed&&) = default;

    template<class U>
        requires std::convertible_to<U, StoredT>
    constexpr Transformed(U&& u) : value(std::forward<U>(u)) {}

    constexpr operator StoredT&()             { return value; }
    constexpr operator const StoredT&() const { return value; }

    constexpr StoredT&       get()       { return value; }
    constexpr const StoredT& get() const { return value; }

    constexpr bool operator==(const Transformed& other) const {
        return value == other.value;
    }
};

} // namespace transformers

} // namespace CborKit
