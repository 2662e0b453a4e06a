#include "Base64.hpp"
#include "Errors.hpp"

#include <array>
#include <cctype>

namespace {

constexpr char kAlphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

std::array<int, 256> makeDecodeTable() {
    std::array<int, 256> t{};
    t.fill(-1);
    for (int i = 0; i < 64; ++i) t[static_cast<unsigned char>(kAlphabet[i])] = i;
    return t;
}

}

std::vector<std::uint8_t> base64Decode(const std::string& text) {
    static const auto table = makeDecodeTable();

    std::vector<std::uint8_t> out;
    out.reserve(text.size() / 4 * 3);
    std::uint32_t acc = 0;
    int bits = 0;
    std::size_t symbols = 0;
    std::size_t padding = 0;

    for (char c : text) {
        if (std::isspace(static_cast<unsigned char>(c))) continue;
        if (c == '=') {
            ++padding;
            continue;
        }
        throwIf(padding > 0, ErrorCode::InvalidImage, "base64: data after padding");
        int v = table[static_cast<unsigned char>(c)];
        throwIf(v < 0, ErrorCode::InvalidImage, std::string("base64: bad character '") + c + "'");
        acc = (acc << 6) | static_cast<std::uint32_t>(v);
        bits += 6;
        ++symbols;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<std::uint8_t>((acc >> bits) & 0xFFu));
        }
    }
    throwIf(padding > 2, ErrorCode::InvalidImage, "base64: too much padding");
    throwIf((symbols + padding) % 4 != 0 && padding > 0, ErrorCode::InvalidImage, "base64: bad padding");
    throwIf(symbols % 4 == 1, ErrorCode::InvalidImage, "base64: truncated input");
    return out;
}
