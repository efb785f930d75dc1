// Basic CborKit usage example
// Compile: g++ -std=c++23 -I../include basic_usage.cpp -o basic_usage

#include <CborKit/decode.hpp>
#include <CborKit/diagnostic.hpp>
#include <CborKit/encode.hpp>
#include <CborKit/error_formatting.hpp>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace CborKit;

struct Config {
    std::string app_name;
    int version;
    bool debug_mode;

    struct Server {
        std::string host;
        std::uint16_t port;
    };
    Server server;
    std::optional<std::string> motd;
    std::vector<std::string> tags;
};

int main() {
    const Config config{"MyApp", 1, true, {"localhost", 8080}, std::nullopt, {"edge", "eu"}};

    std::vector<std::uint8_t> bytes;
    if (auto res = Encode(config, bytes); !res) {
        std::cout << EncodeResultToString(res) << std::endl;
        return 1;
    }
    std::cout << "Encoded " << bytes.size() << " bytes" << std::endl;

    std::string text;
    if (!Diagnostic(bytes, text)) {
        return 1;
    }
    std::cout << text << std::endl;
    /* {0: "MyApp", 1: 1, 2: true, 3: {0: "localhost", 1: 8080}, 5: ["edge", "eu"]} */

    Config back;
    auto result = Decode(back, bytes);
    if (!result) {
        std::cout << DecodeResultToString(result, bytes) << std::endl;
        return 1;
    }

    std::cout << "App: " << back.app_name << std::endl;
    std::cout << "Version: " << back.version << std::endl;
    std::cout << "Debug: " << (back.debug_mode ? "ON" : "OFF") << std::endl;
    std::cout << "Server: " << back.server.host << ":" << back.server.port << std::endl;

    // Cut the last tag short and see where decoding stops
    bytes.pop_back();
    result = Decode(back, bytes);
    /* When decoding $.5[1], decoding error 'UNEXPECTED_END_OF_DATA' at offset ... */
    std::cout << DecodeResultToString(result, bytes) << std::endl;

    return 0;
}
