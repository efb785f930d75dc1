#include "../test_helpers.hpp"
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

using namespace TestHelpers;
using namespace CborKit;

namespace {

struct Point {
    int x;
    int y;
    constexpr bool operator==(const Point&) const = default;
};

using Shape = std::variant<Point, int, std::monostate>;

struct Circle {
    int r;
    constexpr bool operator==(const Circle&) const = default;
};
struct Square {
    int side;
    constexpr bool operator==(const Square&) const = default;
};
using Figure = std::variant<Circle, Square>;

struct Red {
    constexpr bool operator==(const Red&) const = default;
};
struct Green {
    constexpr bool operator==(const Green&) const = default;
};
struct Blue {
    constexpr bool operator==(const Blue&) const = default;
};
using Color = std::variant<Red, Green, Blue>;

enum class Mode : std::uint8_t { off = 0, on = 1, automatic = 2 };
enum class Level : int { low = -1, mid = 0, high = 1 };

struct Settings {
    int version;
    std::optional<Mode> mode;
    std::optional<Shape> shape;
    constexpr bool operator==(const Settings&) const = default;
};

struct StrictSettings {
    int version;
    Mode mode;
    constexpr bool operator==(const StrictSettings&) const = default;
};

} // namespace

template<>
struct CborKit::VariantMeta<Figure> {
    static constexpr std::array<std::uint32_t, 2> indices{10, 20};
};

template<>
struct CborKit::VariantMeta<Color> {
    static constexpr bool index_only = true;
};

template<>
struct CborKit::EnumMeta<Mode> {
    static constexpr std::array values{Mode::off, Mode::on, Mode::automatic};
};

// ============================================================================
// [index, payload]
// ============================================================================

static_assert(EncodesTo(Shape{Point{1, 2}}, {0x82, 0x00, 0xa2, 0x00, 0x01, 0x01, 0x02}));
static_assert(EncodesTo(Shape{5}, {0x82, 0x01, 0x05}));
static_assert(EncodesTo(Shape{std::monostate{}}, {0x82, 0x02, 0xf6}));

static_assert(DecodesTo<Shape>({0x82, 0x00, 0xa2, 0x00, 0x01, 0x01, 0x02}, Shape{Point{1, 2}}));
static_assert(DecodesTo<Shape>({0x82, 0x01, 0x05}, Shape{5}));
static_assert(DecodesTo<Shape>({0x82, 0x02, 0xf6}, Shape{std::monostate{}}));
static_assert(DecodesTo<Shape>({0x9f, 0x01, 0x05, 0xff}, Shape{5}));

static_assert(DecodeFailsWithDetail<Shape>({0x82, 0x09, 0x05}, DecodeError::UNKNOWN_VARIANT, 9));
static_assert(DecodeFailsWith<Shape>({0x05}, DecodeError::TYPE_MISMATCH));
static_assert(DecodeFailsWith<Shape>({0x81, 0x01}, DecodeError::TYPE_MISMATCH));
static_assert(DecodeFailsWith<Shape>({0x83, 0x01, 0x05, 0x06}, DecodeError::TYPE_MISMATCH));
static_assert(DecodeFailsWith<Shape>({0x9f, 0x01, 0x05, 0x06, 0xff}, DecodeError::TYPE_MISMATCH));
static_assert(DecodeFailsWith<Shape>({0x9f, 0x01, 0xff}, DecodeError::TYPE_MISMATCH));
// Payload must match the chosen alternative
static_assert(DecodeFailsWith<Shape>({0x82, 0x01, 0x61, 0x61}, DecodeError::TYPE_MISMATCH));
static_assert(DecodeFailsWith<Shape>({0x82, 0x61, 0x61, 0x05}, DecodeError::TYPE_MISMATCH));

// Explicit indices
static_assert(EncodesTo(Figure{Circle{3}}, {0x82, 0x0a, 0xa1, 0x00, 0x03}));
static_assert(EncodesTo(Figure{Square{4}}, {0x82, 0x14, 0xa1, 0x00, 0x04}));
static_assert(DecodesTo<Figure>({0x82, 0x14, 0xa1, 0x00, 0x04}, Figure{Square{4}}));
static_assert(DecodeFailsWithDetail<Figure>({0x82, 0x00, 0xa1, 0x00, 0x04}, DecodeError::UNKNOWN_VARIANT, 0));

// ============================================================================
// Bare index
// ============================================================================

static_assert(EncodesTo(Color{Red{}}, {0x00}));
static_assert(EncodesTo(Color{Blue{}}, {0x02}));
static_assert(DecodesTo<Color>({0x01}, Color{Green{}}));
static_assert(DecodeFailsWithDetail<Color>({0x05}, DecodeError::UNKNOWN_VARIANT, 5));
static_assert(DecodeFailsWith<Color>({0x82, 0x01, 0xf6}, DecodeError::TYPE_MISMATCH));

// ============================================================================
// Enumerations
// ============================================================================

static_assert(EncodesTo(Mode::automatic, {0x02}));
static_assert(EncodesTo(Level::low, {0x20}));
static_assert(DecodesTo<Mode>({0x01}, Mode::on));
static_assert(DecodeFailsWithDetail<Mode>({0x07}, DecodeError::UNKNOWN_VARIANT, 7));
static_assert(DecodeFailsWith<Mode>({0x19, 0x01, 0x00}, DecodeError::NUMERIC_VALUE_OUT_OF_RANGE));
static_assert(DecodeFailsWith<Mode>({0x20}, DecodeError::NUMERIC_VALUE_OUT_OF_RANGE));
static_assert(DecodeFailsWith<Mode>({0x61, 0x61}, DecodeError::TYPE_MISMATCH));
// Without EnumMeta any value of the underlying type is accepted
static_assert(DecodesTo<Level>({0x18, 0x63}, static_cast<Level>(99)));

// ============================================================================
// Unknown alternatives in optional fields
// ============================================================================

static_assert(DecodesTo<Settings>({0xa3, 0x00, 0x01, 0x01, 0x02, 0x02, 0x82, 0x01, 0x05},
                                  Settings{1, Mode::automatic, Shape{5}}));
static_assert(DecodesTo<Settings>({0xa2, 0x00, 0x01, 0x01, 0x07}, Settings{1, std::nullopt, std::nullopt}));
static_assert(DecodesTo<Settings>({0xa2, 0x00, 0x01, 0x02, 0x82, 0x09, 0x82, 0x01, 0x02},
                                  Settings{1, std::nullopt, std::nullopt}));
// Other failures inside an optional field still fail the struct
static_assert(DecodeFailsWith<Settings>({0xa2, 0x00, 0x01, 0x01, 0x61, 0x61}, DecodeError::TYPE_MISMATCH));

static_assert(DecodesTo<StrictSettings>({0xa2, 0x00, 0x01, 0x01, 0x00}, StrictSettings{1, Mode::off}));
static_assert(DecodeFailsWithDetail<StrictSettings>({0xa2, 0x00, 0x01, 0x01, 0x07}, DecodeError::UNKNOWN_VARIANT, 7));

static_assert(RoundTrips(Settings{2, Mode::on, Shape{Point{-3, 4}}}));
static_assert(RoundTrips(Settings{3, std::nullopt, Shape{std::monostate{}}}));
