#include "base32.h"
#include "errors.h"

#include <cctype>
#include <cstdint>

namespace {

constexpr char kAlphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZ234567";

int b32_val(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a';
    if (c >= '2' && c <= '7') return 26 + (c - '2');
    return -1;
}

std::string encode_impl(const unsigned char* data, std::size_t len) {
    std::string out;
    out.reserve((len + 4) / 5 * 8);

    uint32_t buffer = 0;
    int bits_left = 0;
    for (std::size_t i = 0; i < len; ++i) {
        buffer = (buffer << 8) | data[i];
        bits_left += 8;
        while (bits_left >= 5) {
            bits_left -= 5;
            out.push_back(kAlphabet[(buffer >> bits_left) & 0x1F]);
        }
    }
    if (bits_left > 0) {
        out.push_back(kAlphabet[(buffer << (5 - bits_left)) & 0x1F]);
    }

    // pad to a full 8-char block
    while (out.size() % 8 != 0) out.push_back('=');
    return out;
}

} // namespace

std::string Base32::encode(const std::vector<unsigned char>& bytes) {
    return encode_impl(bytes.data(), bytes.size());
}

std::string Base32::encode(const std::string& bytes) {
    return encode_impl(reinterpret_cast<const unsigned char*>(bytes.data()), bytes.size());
}

std::vector<unsigned char> Base32::decode(const std::string& text) {
    std::vector<unsigned char> out;
    out.reserve(text.size() * 5 / 8 + 1);

    uint32_t buffer = 0;
    int bits_left = 0;

    for (char c : text) {
        if (c == '=') continue;
        if (std::isspace(static_cast<unsigned char>(c))) continue;
        int v = b32_val(c);
        if (v < 0) throw InvalidCharacter("Base32: invalid character in input");
        buffer = (buffer << 5) | static_cast<uint32_t>(v);
        bits_left += 5;
        if (bits_left >= 8) {
            bits_left -= 8;
            out.push_back(static_cast<unsigned char>((buffer >> bits_left) & 0xFF));
        }
    }
    // trailing bits short of a byte are encoder padding
    return out;
}
