#include "totp.h"
#include "errors.h"
#include "logger.h"

#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/rand.h>

#include <cstdlib>
#include <iostream>
#include <utility>
#include <vector>

// ----------- TOTP public API -----------

TOTP::TOTP(Secret secret, OtpParams params)
    : secret_(std::move(secret)),
      params_(params)
{
    params_.validate();
}

uint64_t TOTP::time_counter(int64_t unix_seconds, std::chrono::seconds period) {
    if (period.count() <= 0) {
        throw InvalidParameter("TOTP: period must be positive");
    }
    return static_cast<uint64_t>(unix_seconds >= 0 ? unix_seconds : 0) /
           static_cast<uint64_t>(period.count());
}

uint64_t TOTP::time_counter(UnixTime t, std::chrono::seconds period) {
    return time_counter(static_cast<int64_t>(t.time_since_epoch().count()), period);
}

uint64_t TOTP::time_counter(std::chrono::system_clock::time_point tp,
                            std::chrono::seconds period) {
    return time_counter(std::chrono::time_point_cast<std::chrono::seconds>(tp), period);
}

std::string TOTP::generate(const Secret& secret, UnixTime t, const OtpParams& params) {
    return HOTP::generate(secret, time_counter(t, params.period), params.digits, params.algo);
}

std::string TOTP::generate(const Secret& secret,
                           std::chrono::system_clock::time_point tp,
                           const OtpParams& params) {
    return generate(secret, std::chrono::time_point_cast<std::chrono::seconds>(tp), params);
}

Secret TOTP::generate_secret(std::size_t length) {
    if (length == 0) {
        throw InvalidParameter("TOTP: secret length must be positive");
    }
    std::vector<unsigned char> bytes(length);
    if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        Logger log("totp", std::cerr);
        log.error(std::string("random source unavailable: ") +
                  ERR_error_string(ERR_get_error(), nullptr));
        OPENSSL_cleanse(bytes.data(), bytes.size());
        std::abort();
    }
    return Secret(std::move(bytes));
}

uint64_t TOTP::counter_at(std::chrono::system_clock::time_point tp) const {
    return time_counter(tp, params_.period);
}

std::string TOTP::code_at(std::chrono::system_clock::time_point tp) const {
    return HOTP::generate(secret_, counter_at(tp), params_.digits, params_.algo);
}

std::string TOTP::now() const {
    return code_at(std::chrono::system_clock::now());
}
