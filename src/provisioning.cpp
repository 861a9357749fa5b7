#include "provisioning.h"
#include "base32.h"

#include <openssl/crypto.h>

#include <sstream>

std::string uri_escape(const std::string& text) {
    static const char hex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(text.size());
    for (unsigned char c : text) {
        const bool unreserved = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                                (c >= '0' && c <= '9') ||
                                c == '-' || c == '.' || c == '_' || c == '~';
        if (unreserved) {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0x0F]);
        }
    }
    return out;
}

std::string provisioning_uri(const std::string& issuer,
                             const std::string& principal,
                             const Secret& secret,
                             const OtpParams& params)
{
    params.validate();

    std::string b32 = Base32::encode(secret.bytes());
    // authenticator apps expect the secret unpadded
    const auto pad = b32.find('=');
    if (pad != std::string::npos) b32.erase(pad);
    const std::string esc_issuer = uri_escape(issuer);

    std::ostringstream uri;
    uri << "otpauth://totp/" << esc_issuer << ':' << uri_escape(principal)
        << "?secret=" << b32
        << "&issuer=" << esc_issuer
        << "&algorithm=" << algo_name(params.algo)
        << "&digits=" << params.digits
        << "&period=" << params.period.count();

    OPENSSL_cleanse(&b32[0], b32.size());
    return uri.str();
}

std::string group_secret(const std::string& base32, std::size_t group) {
    std::string out;
    std::size_t n = 0;
    for (char c : base32) {
        if (c == '=') break;
        if (group > 0 && n > 0 && n % group == 0) out.push_back(' ');
        out.push_back(c);
        ++n;
    }
    return out;
}
