#include "base32.h"
#include "errors.h"
#include <cassert>
#include <iostream>
#include <random>
#include <string>
#include <vector>

static std::string as_string(const std::vector<unsigned char>& v) {
    return std::string(v.begin(), v.end());
}

static bool decode_throws(const std::string& text) {
    try {
        Base32::decode(text);
    } catch (const InvalidCharacter&) {
        return true;
    }
    return false;
}

int main() {
    // RFC 4648 section 10
    assert(Base32::encode(std::string()) == "");
    assert(Base32::encode(std::string("f")) == "MY======");
    assert(Base32::encode(std::string("fo")) == "MZXQ====");
    assert(Base32::encode(std::string("foo")) == "MZXW6===");
    assert(Base32::encode(std::string("foob")) == "MZXW6YQ=");
    assert(Base32::encode(std::string("fooba")) == "MZXW6YTB");
    assert(Base32::encode(std::string("foobar")) == "MZXW6YTBOI======");

    assert(as_string(Base32::decode("")) == "");
    assert(as_string(Base32::decode("MY======")) == "f");
    assert(as_string(Base32::decode("MZXQ====")) == "fo");
    assert(as_string(Base32::decode("MZXW6===")) == "foo");
    assert(as_string(Base32::decode("MZXW6YQ=")) == "foob");
    assert(as_string(Base32::decode("MZXW6YTB")) == "fooba");
    assert(as_string(Base32::decode("MZXW6YTBOI======")) == "foobar");

    // lowercase, missing padding and grouped input
    assert(as_string(Base32::decode("mzxw6ytboi")) == "foobar");
    assert(as_string(Base32::decode("MZXW 6YTB OI")) == "foobar");

    // the RFC 6238 key
    assert(Base32::encode(std::string("12345678901234567890")) == "GEZDGNBVGY3TQOJQGEZDGNBVGY3TQOJQ");
    assert(as_string(Base32::decode("GEZDGNBVGY3TQOJQGEZDGNBVGY3TQOJQ")) == "12345678901234567890");

    // characters outside the alphabet
    assert(decode_throws("MZXW1YTB"));   // '1' is not base32
    assert(decode_throws("MZXW8YTB"));
    assert(decode_throws("MZ-W6YTB"));
    assert(decode_throws("MZXW6YT\xC3"));

    // round-trip every length up to 64 with random content, plus all byte values
    std::mt19937 rng(42);
    for (std::size_t len = 0; len <= 64; ++len) {
        std::vector<unsigned char> bytes(len);
        for (auto& b : bytes) b = static_cast<unsigned char>(rng() & 0xFF);
        const std::string enc = Base32::encode(bytes);
        assert(enc.size() % 8 == 0);
        assert(Base32::decode(enc) == bytes);
    }
    std::vector<unsigned char> all(256);
    for (int i = 0; i < 256; ++i) all[i] = static_cast<unsigned char>(i);
    assert(Base32::decode(Base32::encode(all)) == all);

    std::cout << "Base32 test passed.\n";
    return 0;
}
