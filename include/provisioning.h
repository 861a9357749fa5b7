// include/provisioning.h
#pragma once
#include "hotp.h"
#include "secret.h"
#include <string>

// otpauth://totp/<issuer>:<principal>?secret=..&issuer=..&algorithm=..&digits=..&period=..
// issuer and principal are percent-encoded (RFC 3986 unreserved set kept);
// the base32 secret is written without "=" padding.
std::string provisioning_uri(const std::string& issuer,
                             const std::string& principal,
                             const Secret& secret,
                             const OtpParams& params);

// "GEZDGNBVGY3T" -> "GEZD GNBV GY3T" for manual entry; padding dropped.
std::string group_secret(const std::string& base32, std::size_t group = 4);

std::string uri_escape(const std::string& text);
