#include "../test_helpers.hpp"
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

using namespace TestHelpers;
using namespace CborKit;

namespace {

struct Point {
    int x;
    int y;
    constexpr bool operator==(const Point&) const = default;
};

struct Line {
    Point from;
    Point to;
    std::vector<Point> via;
    constexpr bool operator==(const Line&) const = default;
};

struct Sparse {
    Annotated<int, options::index<3>> a;
    int b;
    Annotated<int, options::index<10>, options::skip_default> c;
    std::optional<int> d;
    Annotated<int, options::exclude> scratch;
    constexpr bool operator==(const Sparse&) const = default;
};

struct WithDefaults {
    int id;
    Annotated<int, options::defaulted> retries = 3;
    Annotated<std::string, options::skip_default> label;
    constexpr bool operator==(const WithDefaults&) const = default;
};

struct Retry {
    int id;
    Annotated<int, options::skip_default> retries = 5;
    constexpr bool operator==(const Retry&) const = default;
};

struct Timeout {
    int id;
    int retries = 5;
    constexpr bool operator==(const Timeout&) const = default;
};

struct Window {
    int start;
    int step = 2;
    int width = 4;
    constexpr bool operator==(const Window&) const = default;
};

// Listed explicitly instead of reflected
struct Packet {
    std::uint16_t id;
    std::uint8_t ttl;
    ByteVec payload;
    constexpr bool operator==(const Packet&) const = default;
};

struct Reading {
    int sensor;
    std::optional<int> value;
    int flags;
    constexpr bool operator==(const Reading&) const = default;
};

struct UserId {
    std::uint32_t raw;
    constexpr bool operator==(const UserId&) const = default;
};

struct Grid {
    int cells[3];
    constexpr bool operator==(const Grid&) const = default;
};

struct Account {
    UserId owner;
    std::vector<UserId> members;
    constexpr bool operator==(const Account&) const = default;
};

struct Empty {
    constexpr bool operator==(const Empty&) const = default;
};

} // namespace

template<>
struct CborKit::StructMeta<Packet> {
    using Fields = StructFields<
        Field<&Packet::id, 0>,
        Field<&Packet::ttl, 1, options::skip_default>,
        Field<&Packet::payload, 4>
    >;
};

template<>
struct CborKit::StructMeta<Timeout> {
    using Fields = StructFields<
        Field<&Timeout::id, 0>,
        Field<&Timeout::retries, 1, options::skip_default>
    >;
};

template<>
struct CborKit::StructMeta<Window> {
    using Fields = StructFields<
        Field<&Window::start, 0>,
        Field<&Window::step, 1, options::skip_default>,
        Field<&Window::width, 2, options::skip_default>
    >;
    using Options = OptionsPack<options::as_array>;
};

template<>
struct CborKit::StructMeta<Reading> {
    using Fields = StructFields<
        Field<&Reading::sensor, 0>,
        Field<&Reading::value, 1>,
        Field<&Reading::flags, 3>
    >;
    using Options = OptionsPack<options::as_array>;
};

template<>
struct CborKit::StructMeta<UserId> {
    using Fields  = StructFields<Field<&UserId::raw, 0>>;
    using Options = OptionsPack<options::transparent>;
};

template<>
struct CborKit::StructMeta<Grid> {
    using Fields = StructFields<Field<&Grid::cells, 0>>;
};

// ============================================================================
// Index-keyed maps
// ============================================================================

static_assert(EncodesTo(Point{1, 2}, {0xa2, 0x00, 0x01, 0x01, 0x02}));
static_assert(EncodesTo(Point{-1, 300}, {0xa2, 0x00, 0x20, 0x01, 0x19, 0x01, 0x2c}));
static_assert(EncodesTo(Empty{}, {0xa0}));
static_assert(DecodesTo<Empty>({0xa0}, Empty{}));

static_assert(DecodesTo<Point>({0xa2, 0x00, 0x01, 0x01, 0x02}, Point{1, 2}));
// Any key order
static_assert(DecodesTo<Point>({0xa2, 0x01, 0x02, 0x00, 0x01}, Point{1, 2}));
static_assert(DecodesTo<Point>({0xbf, 0x00, 0x01, 0x01, 0x02, 0xff}, Point{1, 2}));
// A repeated key overwrites the earlier value
static_assert(DecodesTo<Point>({0xa3, 0x00, 0x01, 0x00, 0x05, 0x01, 0x02}, Point{5, 2}));
static_assert(DecodeFailsWithDetail<Point>({0xa1, 0x00, 0x01}, DecodeError::MISSING_FIELD, 1));
static_assert(DecodeFailsWithDetail<Point>({0xa0}, DecodeError::MISSING_FIELD, 0));
static_assert(DecodeFailsWith<Point>({0xa1, 0x61, 0x78, 0x01}, DecodeError::TYPE_MISMATCH));
static_assert(DecodeFailsWith<Point>({0x82, 0x01, 0x02}, DecodeError::TYPE_MISMATCH));
static_assert(DecodeFailsWith<Point>({0xa2, 0x00, 0x01, 0x01}, DecodeError::UNEXPECTED_END_OF_DATA));
static_assert(DecodeFailsWith<Point>({0xa2, 0x00, 0x01, 0x01, 0xf5}, DecodeError::TYPE_MISMATCH));

static_assert(EncodesTo(Line{{0, 0}, {3, 4}, {}},
    {0xa3, 0x00, 0xa2, 0x00, 0x00, 0x01, 0x00, 0x01, 0xa2, 0x00, 0x03, 0x01, 0x04, 0x02, 0x80}));
static_assert(RoundTrips(Line{{1, 2}, {3, 4}, {{5, 6}, {-7, -8}}}));

// ============================================================================
// Field options
// ============================================================================

// a at 3, b continues at 4, c at 10 left out at its default, d left out when
// empty, scratch never on the wire
static_assert(EncodesTo(Sparse{1, 2, 0, std::nullopt, 99}, {0xa2, 0x03, 0x01, 0x04, 0x02}));
static_assert(EncodesTo(Sparse{1, 2, 7, 5, 99}, {0xa4, 0x03, 0x01, 0x04, 0x02, 0x0a, 0x07, 0x0b, 0x05}));
static_assert(DecodesTo<Sparse>({0xa2, 0x03, 0x01, 0x04, 0x02}, Sparse{1, 2, 0, std::nullopt, 0}));
static_assert(DecodesTo<Sparse>({0xa3, 0x03, 0x01, 0x04, 0x02, 0x0b, 0xf6}, Sparse{1, 2, 0, std::nullopt, 0}));
static_assert(DecodesTo<Sparse>({0xa4, 0x0b, 0x05, 0x0a, 0x07, 0x04, 0x02, 0x03, 0x01}, Sparse{1, 2, 7, 5, 0}));
// The excluded member's position is not a key
static_assert(DecodesTo<Sparse>({0xa3, 0x03, 0x01, 0x04, 0x02, 0x0c, 0x18, 0x63}, Sparse{1, 2, 0, std::nullopt, 0}));
static_assert(DecodeFailsWithDetail<Sparse>({0xa1, 0x03, 0x01}, DecodeError::MISSING_FIELD, 4));

// defaulted is always written; absent input keeps the member initializer
static_assert(EncodesTo(WithDefaults{1, 0, {}}, {0xa2, 0x00, 0x01, 0x01, 0x00}));
static_assert(EncodesTo(WithDefaults{1, 3, {"x"}}, {0xa3, 0x00, 0x01, 0x01, 0x03, 0x02, 0x61, 0x78}));
static_assert(DecodesTo<WithDefaults>({0xa1, 0x00, 0x01}, WithDefaults{1, 3, {}}));
static_assert(DecodesTo<WithDefaults>({0xa2, 0x00, 0x01, 0x02, 0x61, 0x78}, WithDefaults{1, 3, {"x"}}));
static_assert(DecodeFailsWithDetail<WithDefaults>({0xa1, 0x01, 0x05}, DecodeError::MISSING_FIELD, 0));

// skip_default compares against the member initializer, not against zero
static_assert(EncodesTo(Retry{7, 5}, {0xa1, 0x00, 0x07}));
static_assert(EncodesTo(Retry{7, 0}, {0xa2, 0x00, 0x07, 0x01, 0x00}));
static_assert(DecodesTo<Retry>({0xa1, 0x00, 0x07}, Retry{7, 5}));
static_assert(DecodesTo<Retry>({0xa2, 0x00, 0x07, 0x01, 0x00}, Retry{7, 0}));
static_assert(RoundTrips(Retry{7, 0}));
static_assert(RoundTrips(Retry{7, 5}));
static_assert(RoundTrips(Retry{7, -1}));

static_assert(EncodesTo(Timeout{7, 5}, {0xa1, 0x00, 0x07}));
static_assert(EncodesTo(Timeout{7, 0}, {0xa2, 0x00, 0x07, 0x01, 0x00}));
static_assert(DecodesTo<Timeout>({0xa1, 0x00, 0x07}, Timeout{7, 5}));
static_assert(RoundTrips(Timeout{7, 0}));
static_assert(RoundTrips(Timeout{7, 5}));

// ============================================================================
// StructMeta listings
// ============================================================================

static_assert(EncodesTo(Packet{7, 0, {}}, {0xa2, 0x00, 0x07, 0x04, 0x40}));
static_assert(EncodesTo(Packet{7, 64, {{1}}}, {0xa3, 0x00, 0x07, 0x01, 0x18, 0x40, 0x04, 0x41, 0x01}));
static_assert(DecodesTo<Packet>({0xa2, 0x00, 0x07, 0x04, 0x40}, Packet{7, 0, {}}));
static_assert(DecodeFailsWithDetail<Packet>({0xa1, 0x00, 0x07}, DecodeError::MISSING_FIELD, 4));
static_assert(DecodeFailsWith<Packet>({0xa2, 0x00, 0x1a, 0x00, 0x01, 0x00, 0x00, 0x04, 0x40},
                                      DecodeError::NUMERIC_VALUE_OUT_OF_RANGE));

static_assert(EncodesTo(Grid{{1, 2, 3}}, {0xa1, 0x00, 0x83, 0x01, 0x02, 0x03}));
static_assert(DecodesTo<Grid>({0xa1, 0x00, 0x83, 0x01, 0x02, 0x03}, Grid{{1, 2, 3}}));
static_assert(DecodeFailsWith<Grid>({0xa1, 0x00, 0x82, 0x01, 0x02}, DecodeError::FIXED_SIZE_CONTAINER_LENGTH_MISMATCH));

// ============================================================================
// Positional arrays
// ============================================================================

// Position 2 has no field and is written as null
static_assert(EncodesTo(Reading{7, 20, 1}, {0x84, 0x07, 0x14, 0xf6, 0x01}));
static_assert(EncodesTo(Reading{7, std::nullopt, 0}, {0x84, 0x07, 0xf6, 0xf6, 0x00}));
static_assert(DecodesTo<Reading>({0x84, 0x07, 0x14, 0xf6, 0x01}, Reading{7, 20, 1}));
static_assert(DecodesTo<Reading>({0x9f, 0x07, 0xf6, 0x61, 0x61, 0x01, 0xff}, Reading{7, std::nullopt, 1}));
// Trailing positions this version does not know are skipped
static_assert(DecodesTo<Reading>({0x85, 0x07, 0x14, 0xf6, 0x01, 0x82, 0x01, 0x02}, Reading{7, 20, 1}));
static_assert(DecodeFailsWithDetail<Reading>({0x82, 0x07, 0x14}, DecodeError::MISSING_FIELD, 3));
static_assert(DecodeFailsWith<Reading>({0xa1, 0x00, 0x07}, DecodeError::TYPE_MISMATCH));

// Trailing skip_default fields at their initializer shorten the array; an
// inner one at its initializer is still written to keep the positions
static_assert(EncodesTo(Window{1, 2, 4}, {0x81, 0x01}));
static_assert(EncodesTo(Window{1, 2, 0}, {0x83, 0x01, 0x02, 0x00}));
static_assert(EncodesTo(Window{1, 0, 4}, {0x82, 0x01, 0x00}));
static_assert(DecodesTo<Window>({0x81, 0x01}, Window{1, 2, 4}));
static_assert(DecodesTo<Window>({0x82, 0x01, 0x00}, Window{1, 0, 4}));
static_assert(RoundTrips(Window{1, 0, 0}));
static_assert(RoundTrips(Window{1, 2, 4}));
static_assert(RoundTrips(Window{1, 2, 0}));

// ============================================================================
// Transparent wrappers
// ============================================================================

static_assert(EncodesTo(UserId{42}, {0x18, 0x2a}));
static_assert(DecodesTo<UserId>({0x18, 0x2a}, UserId{42}));
static_assert(EncodesTo(Account{{1}, {{2}, {3}}}, {0xa2, 0x00, 0x01, 0x01, 0x82, 0x02, 0x03}));
static_assert(RoundTrips(Account{{100000}, {{1}, {0xFFFFFFFFu}}}));

// A use-site option on an aggregate
static_assert(EncodesTo(Annotated<Point, options::as_array>{Point{1, 2}}, {0x82, 0x01, 0x02}));
static_assert(DecodesTo<Annotated<Point, options::as_array>>({0x82, 0x01, 0x02},
                                                             Annotated<Point, options::as_array>{Point{1, 2}}));
