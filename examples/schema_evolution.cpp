#include <CborKit/decode.hpp>
#include <CborKit/encode.hpp>
#include <cassert>
#include <cstdint>
#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <variant>
#include <vector>

using namespace CborKit;
using namespace CborKit::options;

// ============================================================================
// Generic Schema Migration Helper
// ============================================================================

/// Migration field: accepts OldWireT or NewWireT, stores StorageT, always
/// writes NewWireT.
///
/// Template parameters:
///   OldWireT       - Old wire type (e.g., bool)
///   NewWireT       - New wire type (e.g., int)
///   StorageT       - Internal storage type (e.g., enum)
///   OldConvertFn   - Lambda (OldWireT → StorageT)
///   NewConvertFn   - Lambda (NewWireT → StorageT), often identity
///   ToWireFn       - Lambda (StorageT → NewWireT) for encoding
template<class OldWireT, class NewWireT, class StorageT,
         auto OldConvertFn, auto NewConvertFn, auto ToWireFn>
struct MigrationField {
    using old_wire_type = OldWireT;
    using new_wire_type = NewWireT;
    StorageT value{};

    constexpr operator const StorageT&() const { return value; }
    constexpr operator StorageT&() { return value; }
    constexpr bool operator==(const StorageT& other) const { return value == other; }
};

template<class OldWireT, class NewWireT, class StorageT, auto OldFn, auto NewFn, auto ToFn>
struct CborKit::Codec<MigrationField<OldWireT, NewWireT, StorageT, OldFn, NewFn, ToFn>> {
    using Field = MigrationField<OldWireT, NewWireT, StorageT, OldFn, NewFn, ToFn>;

    template<class Enc, class Ctx>
    static constexpr bool encode(const Field& f, Enc& enc, Ctx& ctx) {
        return EncodeValue(std::invoke(ToFn, f.value), enc, ctx);
    }

    template<class Dec, class Ctx>
    static constexpr bool decode(Field& f, Dec& dec, Ctx& ctx) {
        // Try the old wire type first, then rewind and try the new one
        const auto snapshot = ctx.snapshot();
        const std::size_t at = dec.position();
        OldWireT old_val{};
        if (DecodeValue(old_val, dec, ctx)) {
            f.value = std::invoke(OldFn, old_val);
            return true;
        }
        ctx.restore(snapshot);
        if (!dec.set_position(at)) return false;

        NewWireT new_val{};
        if (!DecodeValue(new_val, dec, ctx)) return false;
        f.value = std::invoke(NewFn, new_val);
        return true;
    }
};

// ============================================================================
// Example: bool → enum (encoded as int)
// ============================================================================

enum class State { Disabled = 0, Enabled = 1, Debug = 2 };

using BoolOrIntToEnum = MigrationField<
    bool,   // Old wire: CBOR bool
    int,    // New wire: CBOR int
    State,  // Storage: C++ enum
    [](bool b) { return b ? State::Enabled : State::Disabled; },
    [](int i) { return static_cast<State>(i); },
    [](State s) { return static_cast<int>(s); }
>;

// Schema versions. Field indices never move; new fields get new indices.
struct ConfigV1 {
    std::string name;
    bool enabled;
    std::uint32_t legacy_timeout;
};

struct ConfigV2 {
    std::string name;
    BoolOrIntToEnum enabled;
    // Index 2 retired: old encoders still send it, decoding skips it
    Annotated<std::optional<std::vector<std::string>>, index<3>> tags;
};

struct ConfigV3 {
    std::string name;
    int enabled;
    Annotated<std::optional<std::vector<std::string>>, index<3>> tags;
    Annotated<std::optional<std::variant<std::monostate, std::string>>, index<4>> owner;
};

// ============================================================================
// Tests (constexpr for compile-time validation)
// ============================================================================

template<class T>
constexpr std::vector<std::uint8_t> encode(const T& value) {
    std::vector<std::uint8_t> out;
    if (!Encode(value, out)) return {};
    return out;
}

constexpr bool test_decode_both_types() {
    ConfigV2 config;

    // Old encoding with bool
    if (!Decode(config, encode(ConfigV1{"service", true, 30}))) return false;
    if (config.enabled != State::Enabled) return false;

    if (!Decode(config, encode(ConfigV1{"service", false, 30}))) return false;
    if (config.enabled != State::Disabled) return false;

    // New encoding with int
    if (!Decode(config, encode(ConfigV3{"service", 2, {}, {}}))) return false;
    if (config.enabled != State::Debug) return false;

    return true;
}

constexpr bool test_encoding() {
    ConfigV2 config;
    if (!Decode(config, encode(ConfigV1{"test", true, 5}))) return false;

    // {0: "test", 1: 1}
    const std::vector<std::uint8_t> expected{0xa2, 0x00, 0x64, 0x74, 0x65, 0x73, 0x74, 0x01, 0x01};
    return encode(config) == expected;
}

constexpr bool test_migration_path() {
    ConfigV2 v2;
    if (!Decode(v2, encode(ConfigV1{"app", true, 10}))) return false;
    v2.tags = std::vector<std::string>{"blue"};

    ConfigV3 v3;
    if (!Decode(v3, encode(v2))) return false;
    if (v3.enabled != 1 || !v3.tags.value || v3.tags.value->size() != 1) return false;

    // Newer data still decodes in V2: the unknown field 4 is skipped
    v3.owner = std::variant<std::monostate, std::string>{std::string("ops")};
    return static_cast<bool>(Decode(v2, encode(v3)));
}

// ============================================================================
// Main - both compile-time and runtime validation
// ============================================================================

int main() {
    std::cout << "=== CborKit Schema Evolution: bool → enum ===\n\n";

    static_assert(test_decode_both_types(), "Compile-time: decode both types failed");
    static_assert(test_encoding(), "Compile-time: encoding failed");
    static_assert(test_migration_path(), "Compile-time: migration path failed");

    std::cout << "Compile-time checks passed\n\n";

    std::cout << "Test 1: Decode both bool and int values\n";
    assert(test_decode_both_types());
    std::cout << "  bool true -> State::Enabled, bool false -> State::Disabled, int 2 -> State::Debug\n";

    std::cout << "\nTest 2: Encoding (enum written as int)\n";
    assert(test_encoding());

    std::cout << "\nTest 3: Migration path V1 -> V2 -> V3 and back\n";
    assert(test_migration_path());

    std::cout << "\nAll runtime tests passed\n";
    return 0;
}
