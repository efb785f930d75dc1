#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <deque>
#include <iostream>
#include <limits>
#include <list>
#include <map>
#include <memory>
#include <optional>
#include <random>
#include <set>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <variant>
#include <vector>

#include <CborKit/decode.hpp>
#include <CborKit/diagnostic.hpp>
#include <CborKit/encode.hpp>
#include <CborKit/error_formatting.hpp>

using namespace CborKit;

namespace {

void check(bool cond, const char* what) {
    if (!cond) {
        std::cerr << "FAILED: " << what << "\n";
        std::abort();
    }
}

template<class T>
std::vector<std::uint8_t> encoded(const T& value, EncoderConfig cfg = {}) {
    std::vector<std::uint8_t> out;
    auto res = Encode(value, out, static_cast<void*>(nullptr), cfg);
    if (!res) {
        std::cerr << EncodeResultToString(res) << "\n";
        std::abort();
    }
    return out;
}

std::string diag(std::vector<std::uint8_t> input, DiagnosticOptions opts = {}) {
    std::string out;
    auto res = Diagnostic(input, out, {}, opts);
    if (!res) {
        std::cerr << DecodeResultToString(res, input) << "\n";
        std::abort();
    }
    return out;
}

// ============================================================================
// Randomized round trips
// ============================================================================

struct Record {
    std::int64_t id;
    std::uint32_t flags;
    double reading;
    std::string name;
    std::vector<std::int16_t> samples;
    std::optional<std::string> note;
    std::variant<int, std::string, std::monostate> choice;
    std::map<std::string, std::int32_t> counters;
    ByteVec blob;

    bool operator==(const Record&) const = default;
};

std::string random_text(std::mt19937_64& rng) {
    static constexpr std::string_view pool[] = {"a", "z", "0", " ", "\xc3\xa9", "\xe6\xb0\xb4", "\xf0\x9f\x8c\x8a"};
    std::uniform_int_distribution<std::size_t> len(0, 24);
    std::uniform_int_distribution<std::size_t> pick(0, std::size(pool) - 1);
    std::string s;
    for (std::size_t i = len(rng); i > 0; --i) {
        s += pool[pick(rng)];
    }
    return s;
}

Record random_record(std::mt19937_64& rng) {
    std::uniform_int_distribution<std::uint64_t> bits;
    std::uniform_int_distribution<int> small(0, 8);
    Record r{};
    r.id = static_cast<std::int64_t>(bits(rng)) >> small(rng) * 7;
    r.flags = static_cast<std::uint32_t>(bits(rng) >> 32);
    do {
        const std::uint64_t raw = bits(rng);
        std::memcpy(&r.reading, &raw, sizeof(r.reading));
    } while (std::isnan(r.reading));
    r.name = random_text(rng);
    for (int i = small(rng); i > 0; --i) {
        r.samples.push_back(static_cast<std::int16_t>(bits(rng)));
    }
    if (small(rng) % 2) {
        r.note = random_text(rng);
    }
    switch (small(rng) % 3) {
    case 0: r.choice = static_cast<int>(bits(rng)); break;
    case 1: r.choice = random_text(rng); break;
    default: r.choice = std::monostate{}; break;
    }
    for (int i = small(rng); i > 0; --i) {
        r.counters[random_text(rng)] = static_cast<std::int32_t>(bits(rng));
    }
    for (int i = small(rng) * 5; i > 0; --i) {
        r.blob.bytes.push_back(static_cast<std::uint8_t>(bits(rng)));
    }
    return r;
}

void fuzz_roundtrip(std::size_t iterations) {
    std::mt19937_64 rng(20260101);
    for (std::size_t i = 0; i < iterations; ++i) {
        const Record original = random_record(rng);
        for (bool preferred : {false, true}) {
            const auto bytes = encoded(original, EncoderConfig{.preferred_floats = preferred});

            Record back{};
            auto res = Decode(back, bytes);
            if (!res || !(back == original)) {
                std::cerr << "Round trip mismatch at iteration " << i << ": "
                          << DecodeResultToString(res, bytes) << "\n";
                std::abort();
            }
            check(res.offset() == bytes.size(), "decode consumes the whole item");

            Decoder dec(bytes);
            check(dec.skip() && dec.position() == bytes.size(), "skip lands where decode ends");

            std::string text;
            check(static_cast<bool>(Diagnostic(bytes, text)), "diagnostic renders encoder output");
        }
    }
}

// Arbitrary input must fail cleanly or decode to something that re-encodes.
void fuzz_garbage(std::size_t iterations) {
    std::mt19937_64 rng(4242);
    std::uniform_int_distribution<int> byte(0, 255);
    std::uniform_int_distribution<std::size_t> len(0, 64);
    for (std::size_t i = 0; i < iterations; ++i) {
        std::vector<std::uint8_t> input(len(rng));
        for (auto& b : input) b = static_cast<std::uint8_t>(byte(rng));

        Record r{};
        if (Decode(r, input)) {
            std::vector<std::uint8_t> again;
            check(static_cast<bool>(Encode(r, again)), "decoded garbage re-encodes");
        }

        Decoder dec(input);
        const bool skipped = dec.skip();
        check(!skipped || dec.position() <= input.size(), "skip stays inside the input");
        check(skipped || dec.getError() != DecodeError::NO_ERROR, "failed skip reports an error");

        std::string text;
        (void)Diagnostic(input, text);
    }
}

// ============================================================================
// Nesting limits on hostile input
// ============================================================================

struct Tree {
    std::vector<Tree> children;
};

void deep_nesting() {
    std::vector<std::uint8_t> arrays(10000, 0x81);
    arrays.push_back(0x00);

    Decoder dec(arrays);
    check(!dec.skip() && dec.getError() == DecodeError::DEPTH_LIMIT_EXCEEDED, "skip stops at the depth limit");

    std::string text;
    check(Diagnostic(arrays, text).error() == DecodeError::DEPTH_LIMIT_EXCEEDED, "diagnostic stops at the depth limit");

    std::vector<std::uint8_t> trees;
    for (int i = 0; i < 5000; ++i) {
        trees.insert(trees.end(), {0xa1, 0x00, 0x81});
    }
    trees.insert(trees.end(), {0xa1, 0x00, 0x80});
    Tree t;
    auto res = Decode(t, trees);
    check(res.error() == DecodeError::DEPTH_LIMIT_EXCEEDED, "recursive struct stops at the depth limit");
    check(res.errorPath().truncated(), "deep error path is truncated");

    // 32 levels use the whole default budget: one struct and one array each
    std::vector<std::uint8_t> shallow;
    for (int i = 0; i < 31; ++i) {
        shallow.insert(shallow.end(), {0xa1, 0x00, 0x81});
    }
    shallow.insert(shallow.end(), {0xa1, 0x00, 0x80});
    check(static_cast<bool>(Decode(t, shallow)), "shallow tree decodes");
    check(encoded(t) == shallow, "tree re-encodes identically");
}

// ============================================================================
// Standard containers
// ============================================================================

void std_containers() {
    {
        const std::map<std::string, int> m{{"b", 2}, {"a", 1}};
        const auto bytes = encoded(m);
        check(bytes == std::vector<std::uint8_t>{0xa2, 0x61, 0x61, 0x01, 0x61, 0x62, 0x02}, "map encodes in key order");
        std::map<std::string, int> back;
        check(Decode(back, bytes) && back == m, "map round trip");

        const std::vector<std::uint8_t> dup{0xa2, 0x61, 0x61, 0x01, 0x61, 0x61, 0x02};
        auto res = Decode(back, dup);
        check(res.error() == DecodeError::DUPLICATE_KEY_IN_MAP && res.offset() == 4, "duplicate map key");
    }
    {
        std::unordered_map<std::uint32_t, std::vector<std::string>> m{{7, {"x"}}, {9, {}}};
        std::unordered_map<std::uint32_t, std::vector<std::string>> back;
        check(Decode(back, encoded(m)) && back == m, "unordered_map round trip");
    }
    {
        std::set<int> s;
        check(Decode(s, std::vector<std::uint8_t>{0x83, 0x03, 0x01, 0x03}) && s == std::set<int>{1, 3}, "set collapses duplicates");
        check(encoded(s) == std::vector<std::uint8_t>{0x82, 0x01, 0x03}, "set encodes sorted");
    }
    {
        const std::unordered_set<std::string> u{"x", "y", "z"};
        std::unordered_set<std::string> back;
        check(Decode(back, encoded(u)) && back == u, "unordered_set round trip");
    }
    {
        const std::deque<double> d{1.5, -0.0, 1e300};
        std::deque<double> back;
        check(Decode(back, encoded(d)) && back == d, "deque round trip");
        check(encoded(d, EncoderConfig{.preferred_floats = true})
                  == std::vector<std::uint8_t>{0x83, 0xf9, 0x3e, 0x00, 0xf9, 0x80, 0x00,
                                               0xfb, 0x7e, 0x37, 0xe4, 0x3c, 0x88, 0x00, 0x75, 0x9c},
              "preferred floats");
    }
    {
        const std::list<std::optional<int>> l{1, std::nullopt, 3};
        check(encoded(l) == std::vector<std::uint8_t>{0x83, 0x01, 0xf6, 0x03}, "list of optionals");
        std::list<std::optional<int>> back;
        check(Decode(back, encoded(l)) && back == l, "list round trip");
    }
    {
        auto p = std::make_unique<std::string>("hi");
        std::unique_ptr<std::string> back;
        check(Decode(back, encoded(p)) && back && *back == "hi", "unique_ptr round trip");
        std::unique_ptr<std::string> empty;
        check(encoded(empty) == std::vector<std::uint8_t>{0xf6}, "empty unique_ptr is null");
        check(Decode(back, std::vector<std::uint8_t>{0xf6}) && !back, "null resets unique_ptr");
    }
    {
        const std::vector<std::uint8_t> input{0x82, 0x63, 0x61, 0x62, 0x63, 0x60};
        std::vector<std::string_view> views;
        check(Decode(views, input) && views.size() == 2 && views[0] == "abc" && views[1].empty(), "borrowed text");
        check(views[0].data() == reinterpret_cast<const char*>(input.data() + 2), "text points into the input");
        check(Decode(views, std::vector<std::uint8_t>{0x81, 0x7f, 0x61, 0x61, 0xff}).error() == DecodeError::TYPE_MISMATCH,
              "chunked text cannot be borrowed");
    }
    {
        const double nan = std::numeric_limits<double>::quiet_NaN();
        check(encoded(nan, EncoderConfig{.preferred_floats = true}) == std::vector<std::uint8_t>{0xf9, 0x7e, 0x00}, "NaN shortest");
        double back = 0;
        check(Decode(back, std::vector<std::uint8_t>{0xf9, 0x7e, 0x00}) && std::isnan(back), "NaN decodes");
        check(encoded(std::numeric_limits<float>::infinity(), EncoderConfig{.preferred_floats = true})
                  == std::vector<std::uint8_t>{0xf9, 0x7c, 0x00}, "infinity shortest");
    }
}

// ============================================================================
// Non-minimal encodings and UTF-8
// ============================================================================

void wire_strictness() {
    const DecoderConfig strict{.strict = true};
    const std::vector<std::uint8_t> wide_int{0x18, 0x01};
    const std::vector<std::uint8_t> wide_len{0x59, 0x00, 0x01, 0x61};
    const std::vector<std::uint8_t> wide_float{0xfb, 0x3f, 0xf8, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00};

    int i = 0;
    check(Decode(i, wide_int) && i == 1, "lenient accepts a wide integer");
    check(Decode(i, wide_int, strict).error() == DecodeError::NON_CANONICAL_ENCODING, "strict rejects a wide integer");

    std::string s;
    check(Decode(s, std::vector<std::uint8_t>{0x78, 0x01, 0x61}) && s == "a", "lenient accepts a wide length");
    check(Decode(s, wide_len, strict).error() == DecodeError::NON_CANONICAL_ENCODING, "strict rejects a wide length");

    double d = 0;
    check(Decode(d, wide_float) && d == 1.5, "lenient accepts a wide float");
    check(Decode(d, wide_float, strict).error() == DecodeError::NON_CANONICAL_ENCODING, "strict rejects a wide float");

    const auto preferred = encoded(std::vector<double>{1.5, 0.1, 65504.0}, EncoderConfig{.preferred_floats = true});
    std::vector<double> floats;
    check(Decode(floats, preferred, strict) && floats.size() == 3, "preferred floats satisfy a strict decoder");

    // Overlong, surrogate, truncated and out-of-range sequences
    for (const auto& bad : {std::vector<std::uint8_t>{0x62, 0xc0, 0x80},
                            std::vector<std::uint8_t>{0x63, 0xed, 0xa0, 0x80},
                            std::vector<std::uint8_t>{0x62, 0xe6, 0xb0},
                            std::vector<std::uint8_t>{0x64, 0xf4, 0x90, 0x80, 0x80},
                            std::vector<std::uint8_t>{0x7f, 0x61, 0xff, 0xff}}) {
        check(Decode(s, bad).error() == DecodeError::INVALID_UTF8, "invalid UTF-8 is rejected");
    }
    check(Decode(s, std::vector<std::uint8_t>{0x64, 0xf0, 0x9f, 0x8c, 0x8a}) && s == "\xf0\x9f\x8c\x8a", "four-byte sequence");
}

// ============================================================================
// Diagnostic notation and error text
// ============================================================================

void diagnostics() {
    check(diag({0x00}) == "0", "uint");
    check(diag({0x38, 0x63}) == "-100", "negative");
    check(diag({0x3b, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff}) == "-18446744073709551616", "smallest negative");
    check(diag({0x83, 0x01, 0x82, 0x02, 0x03, 0x82, 0x04, 0x05}) == "[1, [2, 3], [4, 5]]", "nested arrays");
    check(diag({0x9f, 0x01, 0x02, 0xff}) == "[_ 1, 2]", "indefinite array");
    check(diag({0x80}) == "[]", "empty array");
    check(diag({0xa2, 0x61, 0x61, 0x01, 0x61, 0x62, 0x82, 0x02, 0x03}) == "{\"a\": 1, \"b\": [2, 3]}", "map");
    check(diag({0x44, 0x01, 0x02, 0x03, 0x04}) == "h'01020304'", "bytes");
    check(diag({0x5f, 0x42, 0x01, 0x02, 0x43, 0x03, 0x04, 0x05, 0xff}) == "(_ h'0102', h'030405')", "chunked bytes");
    check(diag({0x7f, 0x65, 0x73, 0x74, 0x72, 0x65, 0x61, 0x64, 0x6d, 0x69, 0x6e, 0x67, 0xff}) == "(_ \"strea\", \"ming\")", "chunked text");
    check(diag({0xc1, 0x1a, 0x51, 0x4b, 0x67, 0xb0}) == "1(1363896240)", "tag");
    check(diag({0xf4}) == "false" && diag({0xf5}) == "true", "bools");
    check(diag({0xf6}) == "null" && diag({0xf7}) == "undefined", "null and undefined");
    check(diag({0xf0}) == "simple(16)" && diag({0xf8, 0xff}) == "simple(255)", "simple");
    check(diag({0xf9, 0x3c, 0x00}) == "1.0", "half");
    check(diag({0xfb, 0x3f, 0xf1, 0x99, 0x99, 0x99, 0x99, 0x99, 0x9a}) == "1.1", "double");
    check(diag({0xf9, 0x7c, 0x00}) == "Infinity" && diag({0xf9, 0xfc, 0x00}) == "-Infinity", "infinities");
    check(diag({0xf9, 0x7e, 0x00}) == "NaN", "nan");
    check(diag({0x82, 0x01, 0x80}, DiagnosticOptions{.pretty = true}) == "[\n  1,\n  []\n]", "pretty");

    std::string out;
    check(Diagnostic(std::vector<std::uint8_t>{0x01, 0x02}, out).error() == DecodeError::EXCESS_DATA, "diagnostic wants one item");
    check(Diagnostic(std::vector<std::uint8_t>{0x82, 0x01}, out).error() == DecodeError::UNEXPECTED_END_OF_DATA, "truncated");

    {
        const std::vector<std::uint8_t> input{0x83, 0x01, 0x61, 0x61, 0x03};
        std::vector<int> v;
        auto res = Decode(v, input);
        check(ErrorPathToString(res.errorPath()) == "$[1]", "array path");
        check(DecodeResultToString(res, input)
                  == "When decoding $[1], decoding error 'TYPE_MISMATCH' at offset 2: '83 01 [61] 61 03'",
              "decode error text");
    }
    {
        struct Point {
            int x;
            int y;
        };
        const std::vector<std::uint8_t> input{0xa1, 0x00, 0x01};
        Point p{};
        auto res = Decode(p, input);
        check(DecodeResultToString(res, input)
                  == "When decoding $, decoding error 'MISSING_FIELD' (field index 1) at offset 3: 'a1 00 01 [<end>]'",
              "missing field text");
    }
    {
        std::vector<std::uint8_t> small;
        auto res = Encode(std::vector<Simple>{Simple{1}, Simple{24}}, small);
        check(EncodeResultToString(res) == "When encoding $[1], encoding error 'INVALID_ARGUMENT' after 2 bytes",
              "encode error text");
        check(EncodeResultToString(Encode(1, small)) == "encoded 1 bytes", "encode success text");
    }
    int one = 0;
    check(DecodeResultToString(Decode(one, std::vector<std::uint8_t>{0x01}), {}) == "decoded 1 bytes",
          "decode success text");
}

} // namespace

int main() {
    fuzz_roundtrip(2000);
    fuzz_garbage(20000);
    deep_nesting();
    std_containers();
    wire_strictness();
    diagnostics();
    std::cout << "runtime tests passed\n";
}
