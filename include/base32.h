// include/base32.h
#pragma once
#include <string>
#include <vector>

// RFC 4648 base32 (alphabet A-Z2-7), used for secrets in provisioning URIs.
class Base32 {
public:
    // Output is '='-padded to a multiple of 8 chars; empty input -> "".
    static std::string encode(const std::vector<unsigned char>& bytes);
    static std::string encode(const std::string& bytes);

    // Case-insensitive; '=' padding and whitespace are skipped.
    // Throws InvalidCharacter on anything else outside the alphabet.
    static std::vector<unsigned char> decode(const std::string& text);
};
