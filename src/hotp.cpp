#include "hotp.h"
#include "errors.h"

#include <openssl/hmac.h>
#include <openssl/evp.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace {

const EVP_MD* md_for_algo(OtpAlgo algo) {
    switch (algo) {
        case OtpAlgo::SHA1:   return EVP_sha1();
        case OtpAlgo::SHA256: return EVP_sha256();
        case OtpAlgo::SHA512: return EVP_sha512();
    }
    throw InvalidParameter("HOTP: unsupported algorithm");
}

std::string left_pad_code(uint32_t val, int digits) {
    uint64_t mod = 1;
    for (int i = 0; i < digits; ++i) mod *= 10;
    uint64_t code = static_cast<uint64_t>(val) % mod;

    std::ostringstream oss;
    oss << std::setw(digits) << std::setfill('0') << code;
    return oss.str();
}

} // namespace

const char* algo_name(OtpAlgo algo) {
    switch (algo) {
        case OtpAlgo::SHA1:   return "SHA1";
        case OtpAlgo::SHA256: return "SHA256";
        case OtpAlgo::SHA512: return "SHA512";
    }
    throw InvalidParameter("HOTP: unsupported algorithm");
}

OtpAlgo parse_algo(const std::string& name) {
    std::string up;
    up.reserve(name.size());
    for (char c : name) up.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));

    if (up == "SHA1")   return OtpAlgo::SHA1;
    if (up == "SHA256") return OtpAlgo::SHA256;
    if (up == "SHA512") return OtpAlgo::SHA512;
    throw InvalidParameter("HOTP: unknown algorithm '" + name + "'");
}

void OtpParams::validate() const {
    if (digits < HOTP::kMinDigits || digits > HOTP::kMaxDigits) {
        throw InvalidParameter("OTP: digits must be between 4 and 10");
    }
    if (period.count() <= 0) {
        throw InvalidParameter("OTP: period must be positive");
    }
    if (algo != OtpAlgo::SHA1 && algo != OtpAlgo::SHA256 && algo != OtpAlgo::SHA512) {
        throw InvalidParameter("OTP: unsupported algorithm");
    }
}

std::string HOTP::generate(const Secret& key,
                           uint64_t counter,
                           int digits,
                           OtpAlgo algo)
{
    // counter in big-endian 8 bytes
    std::array<unsigned char, 8> msg{};
    for (int i = 7; i >= 0; --i) {
        msg[i] = static_cast<unsigned char>(counter & 0xFF);
        counter >>= 8;
    }

    const EVP_MD* md = md_for_algo(algo);
    unsigned int len = 0;
    std::array<unsigned char, EVP_MAX_MD_SIZE> mac{};

    if (!HMAC(md,
              key.data(), static_cast<int>(key.size()),
              msg.data(), msg.size(),
              mac.data(), &len)) {
        throw std::runtime_error("HOTP: HMAC failed");
    }

    // dynamic truncation (RFC 4226 5.3)
    const int offset = mac[len - 1] & 0x0F;
    const uint32_t bin_code =
        (static_cast<uint32_t>(mac[offset]   & 0x7F) << 24) |
        (static_cast<uint32_t>(mac[offset+1] & 0xFF) << 16) |
        (static_cast<uint32_t>(mac[offset+2] & 0xFF) <<  8) |
        (static_cast<uint32_t>(mac[offset+3] & 0xFF) <<  0);

    std::fill(mac.begin(), mac.end(), 0);
    return left_pad_code(bin_code, digits);
}
