#include <cctype>
#include <charconv>
#include <cstdint>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <string_view>
#include <vector>

#include <CborKit/diagnostic.hpp>
#include <CborKit/error_formatting.hpp>

namespace {

void usage(const char* prog) {
    std::cerr << "Usage: " << prog << " [--hex] [--pretty] [--strict] [--max-depth N] [file]\n"
              << "Prints every item of a CBOR sequence in diagnostic notation.\n"
              << "Reads stdin when no file is given or file is '-'.\n";
}

bool read_all(const std::string& path, std::string& out) {
    if (path.empty() || path == "-") {
        out.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
        return true;
    }
    std::ifstream f(path, std::ios::binary);
    if (!f) {
        return false;
    }
    out.assign(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
    return true;
}

int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// Whitespace between digits is ignored.
bool parse_hex(std::string_view text, std::vector<std::uint8_t>& out) {
    int high = -1;
    for (char c : text) {
        if (std::isspace(static_cast<unsigned char>(c))) continue;
        const int v = hex_digit(c);
        if (v < 0) return false;
        if (high < 0) {
            high = v;
        } else {
            out.push_back(static_cast<std::uint8_t>(high * 16 + v));
            high = -1;
        }
    }
    return high < 0;
}

} // namespace

int main(int argc, char* argv[]) {
    bool hex = false;
    CborKit::DiagnosticOptions opts;
    CborKit::DecoderConfig cfg;
    std::string path;

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];
        if (arg == "--hex") {
            hex = true;
        } else if (arg == "--pretty") {
            opts.pretty = true;
        } else if (arg == "--strict") {
            cfg.strict = true;
        } else if (arg == "--max-depth") {
            if (i + 1 >= argc) {
                usage(argv[0]);
                return 2;
            }
            const std::string_view value = argv[++i];
            auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), cfg.max_depth);
            if (ec != std::errc{} || ptr != value.data() + value.size()) {
                std::cerr << "Invalid --max-depth value '" << value << "'\n";
                return 2;
            }
        } else if (arg == "-h" || arg == "--help") {
            usage(argv[0]);
            return 0;
        } else if (!arg.empty() && arg[0] == '-' && arg != "-") {
            std::cerr << "Unknown option '" << arg << "'\n";
            usage(argv[0]);
            return 2;
        } else {
            path = arg;
        }
    }

    std::string raw;
    if (!read_all(path, raw)) {
        std::cerr << "Cannot open '" << path << "'\n";
        return 1;
    }

    std::vector<std::uint8_t> input;
    if (hex) {
        if (!parse_hex(raw, input)) {
            std::cerr << "Input is not valid hex\n";
            return 1;
        }
    } else {
        input.assign(raw.begin(), raw.end());
    }

    CborKit::Decoder dec(input, cfg);
    while (!dec.at_end()) {
        std::string line;
        if (!CborKit::DiagnosticItem(dec, line, opts)) {
            if (!line.empty()) {
                std::cout << line << '\n';
            }
            const CborKit::DecodeResult res(dec.getError(), dec.position(), 0, CborKit::error_path{});
            std::cerr << CborKit::DecodeResultToString(res, input) << '\n';
            return 1;
        }
        std::cout << line << '\n';
    }
    return 0;
}
