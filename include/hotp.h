// include/hotp.h
#pragma once
#include "secret.h"
#include <chrono>
#include <cstdint>
#include <string>

enum class OtpAlgo { SHA1, SHA256, SHA512 };

// "SHA1" / "SHA256" / "SHA512", as written in otpauth URIs.
const char* algo_name(OtpAlgo algo);
// Case-insensitive inverse of algo_name. Throws InvalidParameter.
OtpAlgo parse_algo(const std::string& name);

struct OtpParams {
    int digits = 6;
    std::chrono::seconds period{30};
    OtpAlgo algo = OtpAlgo::SHA1;

    // Throws InvalidParameter for digits outside [4,10], period <= 0 or unknown algo.
    void validate() const;
};

class HOTP {
public:
    static constexpr int kMinDigits = 4;
    static constexpr int kMaxDigits = 10;

    // RFC 4226: HMAC over the big-endian counter + dynamic truncation.
    // digits is expected to have passed OtpParams::validate().
    static std::string generate(const Secret& key, uint64_t counter,
                                int digits, OtpAlgo algo);
};
