// Embedded Systems Example: heap-free CBOR telemetry
//
// Demonstrates:
// - Building with allocation switched off (no std::string, std::vector or unique_ptr codecs)
// - Fixed-size models (std::array / ByteArray / std::optional) encoded into a fixed buffer
// - Compile-time verification of the wire layout with static_assert
// - A CBOR sequence of readings appended item by item and read back with a Decoder
//

#define CBORKIT_ENABLE_ALLOC 0
#define CBORKIT_ENABLE_STD 0

#include <CborKit/decode.hpp>
#include <CborKit/diagnostic.hpp>
#include <CborKit/encode.hpp>
#include <CborKit/error_formatting.hpp>

#include <array>
#include <cstdint>
#include <cstdio>
#include <optional>

using namespace CborKit;
using namespace CborKit::options;

// The std-only headers above contribute nothing to this build.
static_assert(!config::alloc_enabled() && !config::std_enabled());
static_assert(config::half_enabled() && config::skip_enabled() && config::derive_enabled());

// ============================================================================
// Models
// ============================================================================

enum class SensorKind : std::uint8_t { temperature = 1, humidity = 2, pressure = 3 };

template<>
struct CborKit::EnumMeta<SensorKind> {
    static constexpr std::array values{SensorKind::temperature, SensorKind::humidity, SensorKind::pressure};
};

struct DeviceInfo {
    ByteArray<6> mac{};
    std::uint16_t firmware{};
    std::array<SensorKind, 3> sensors{};
    Annotated<std::uint32_t, skip_default> boot_count{};
    constexpr bool operator==(const DeviceInfo&) const = default;
};

// Compact positional form: [sensor, value, timestamp(, status)]
struct Reading {
    SensorKind sensor{};
    float value{};
    Tagged<1, std::uint32_t> taken_at{};
    std::optional<std::uint8_t> status{};
    constexpr bool operator==(const Reading&) const = default;
};

template<>
struct CborKit::StructMeta<Reading> {
    using Fields = StructFields<
        Field<&Reading::sensor, 0>,
        Field<&Reading::value, 1>,
        Field<&Reading::taken_at, 2>,
        Field<&Reading::status, 3>
    >;
    using Options = OptionsPack<as_array>;
};

// ============================================================================
// Compile-time checks
// ============================================================================

constexpr DeviceInfo sample_device() {
    return DeviceInfo{{{0x02, 0x00, 0x5e, 0x10, 0x00, 0x01}}, 0x0102,
                      {SensorKind::temperature, SensorKind::humidity, SensorKind::pressure}, 0};
}

constexpr bool device_wire_layout() {
    std::array<std::uint8_t, 64> buf{};
    auto res = Encode(sample_device(), buf.begin(), buf.end());
    if (!res) return false;

    constexpr std::array<std::uint8_t, 18> expected{
        0xa3,
        0x00, 0x46, 0x02, 0x00, 0x5e, 0x10, 0x00, 0x01,
        0x01, 0x19, 0x01, 0x02,
        0x02, 0x83, 0x01, 0x02, 0x03
    };
    if (res.bytesWritten() != expected.size()) return false;
    for (std::size_t i = 0; i < expected.size(); ++i) {
        if (buf[i] != expected[i]) return false;
    }

    DeviceInfo back{};
    if (!Decode(back, std::span<const std::uint8_t>(buf.data(), res.bytesWritten()))) return false;
    return back == sample_device();
}
static_assert(device_wire_layout());

constexpr bool reading_rejects_unknown_sensor() {
    // [9, 1.5, 1(0)]
    constexpr std::array<std::uint8_t, 6> input{0x83, 0x09, 0xf9, 0x3e, 0x00, 0xc1};
    Reading r{};
    auto res = Decode(r, input);
    return res.error() == DecodeError::UNKNOWN_VARIANT && res.detail() == 9;
}
static_assert(reading_rejects_unknown_sensor());

// ============================================================================
// Runtime demo: a log of readings in one fixed buffer
// ============================================================================

int main() {
    std::array<std::uint8_t, 256> log{};
    Encoder enc(log.begin(), log.end(), EncoderConfig{.preferred_floats = true});

    const std::array<Reading, 4> readings{{
        {SensorKind::temperature, 21.5f, {1700000000}, std::nullopt},
        {SensorKind::humidity, 40.25f, {1700000005}, std::nullopt},
        {SensorKind::pressure, 1013.25f, {1700000010}, std::uint8_t{2}},
        {SensorKind::temperature, 21.75f, {1700000015}, std::nullopt},
    }};
    for (const Reading& r : readings) {
        if (auto res = EncodeWithEncoder(r, enc); !res) {
            std::printf("encode failed: %d\n", static_cast<int>(res.error()));
            return 1;
        }
    }
    std::printf("%zu readings in %zu bytes\n", readings.size(), enc.bytesWritten());

    Decoder dec(std::span<const std::uint8_t>(log.data(), enc.bytesWritten()));
    while (!dec.at_end()) {
        Reading r{};
        auto res = DecodeWithDecoder(r, dec);
        if (!res) {
            std::printf("decode failed at offset %zu: %d\n", res.offset(), static_cast<int>(res.error()));
            return 1;
        }
        std::printf("sensor %u: %.2f at %u%s\n", static_cast<unsigned>(r.sensor), r.value,
                    static_cast<unsigned>(r.taken_at.value), r.status ? " (flagged)" : "");
    }
    return 0;
}
