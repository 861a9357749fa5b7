#pragma once
#include "hotp.h"
#include "secret.h"
#include <string>
#include <cstdint>
#include <chrono>

// Whole seconds since the epoch. Counts far past the range of a
// nanosecond system_clock::time_point (year 2262).
using UnixTime = std::chrono::time_point<std::chrono::system_clock, std::chrono::seconds>;

class TOTP {
public:
    // params are validated here; throws InvalidParameter
    TOTP(Secret secret, OtpParams params = OtpParams{});

    std::string code_at(std::chrono::system_clock::time_point tp) const;

    std::string now() const;

    uint64_t counter_at(std::chrono::system_clock::time_point tp) const;

    const OtpParams& params() const noexcept { return params_; }

    // floor(unix_seconds / period); times before the epoch map to 0.
    // Throws InvalidParameter when period <= 0.
    static uint64_t time_counter(int64_t unix_seconds, std::chrono::seconds period);
    static uint64_t time_counter(UnixTime t, std::chrono::seconds period);
    static uint64_t time_counter(std::chrono::system_clock::time_point tp,
                                 std::chrono::seconds period);

    static std::string generate(const Secret& secret, UnixTime t, const OtpParams& params);
    static std::string generate(const Secret& secret,
                                std::chrono::system_clock::time_point tp,
                                const OtpParams& params);

    // Draws length bytes from the OpenSSL CSPRNG. Aborts the process if the
    // source fails: a predictable secret must never leave this function.
    static Secret generate_secret(std::size_t length = 20);

private:
    Secret secret_; // raw key bytes
    OtpParams params_;
};
