#include <CborKit/decode.hpp>
#include <CborKit/diagnostic.hpp>
#include <CborKit/encode.hpp>
#include <array>
#include <cstdint>
#include <format>
#include <iostream>
#include <vector>
using CborKit::Annotated;
using CborKit::Field, CborKit::StructFields, CborKit::OptionsPack;
using std::cout;
using std::endl;
using std::format;

// A type from somewhere else: not an aggregate, so it cannot be reflected.
class Vec {
public:
    Vec() = default;
    Vec(float x, float y, float z) : x(x), y(y), z(z) {}
    float x = 1, y = 2, z = 3;
};

template<> struct CborKit::StructMeta<Vec> {
    using Fields = StructFields<
        Field<&Vec::x, 0>,
        Field<&Vec::y, 1>,
        Field<&Vec::z, 2>
    >;
    using Options = OptionsPack<options::as_array>;
};

// Seconds since the epoch behind tag 1, the way RFC 8949 dates them.
struct Timestamp {
    std::int64_t seconds = 0;
};

template<> struct CborKit::Codec<Timestamp> {
    template<class Enc, class Ctx>
    static constexpr bool encode(const Timestamp& t, Enc& enc, Ctx&) {
        return enc.write_tag(1) && enc.write_int(t.seconds);
    }
    template<class Dec, class Ctx>
    static constexpr bool decode(Timestamp& t, Dec& dec, Ctx& ctx) {
        const std::size_t at = dec.position();
        std::uint64_t tag = 0;
        if (!dec.read_tag(tag)) return false;
        if (tag != 1) {
            dec.set_position(at);
            return ctx.withError(CborKit::DecodeError::TYPE_MISMATCH, dec, tag);
        }
        return dec.read_int(t.seconds);
    }
};

int main() {
    struct TopLevel {
        Vec origin;
        Annotated<std::array<Vec, 2>, CborKit::options::index<4>> box{std::array<Vec, 2>{Vec{0, 0, 0}, Vec{4, 5, 6}}};
        Timestamp created{1363896240};
    };
    std::vector<std::uint8_t> out;
    if (!CborKit::Encode(TopLevel{}, out)) return 1;
    std::string text;
    if (!CborKit::Diagnostic(out, text)) return 1;
    cout << text << endl;
    /* {0: [1.0, 2.0, 3.0], 4: [[0.0, 0.0, 0.0], [4.0, 5.0, 6.0]], 5: 1(1363896240)} */
    TopLevel t;
    if (!CborKit::Decode(t, out)) return 1;
    cout << format("origin: ({}, {}, {}), far corner: ({}, {}, {}), created: {}",
                   t.origin.x, t.origin.y, t.origin.z,
                   t.box->at(1).x, t.box->at(1).y, t.box->at(1).z, t.created.seconds) << endl;
    /* origin: (1, 2, 3), far corner: (4, 5, 6), created: 1363896240 */
}
