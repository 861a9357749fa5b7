#include "provisioning.h"
#include "base32.h"
#include "errors.h"
#include <cassert>
#include <chrono>
#include <iostream>

int main() {
    const Secret key = Secret::from_string("12345678901234567890");

    // default parameters
    {
        const std::string uri = provisioning_uri("otpguard", "alice", key, OtpParams{});
        assert(uri ==
            "otpauth://totp/otpguard:alice?secret=GEZDGNBVGY3TQOJQGEZDGNBVGY3TQOJQ"
            "&issuer=otpguard&algorithm=SHA1&digits=6&period=30");
    }

    // non-default parameters, escaped labels, unpadded secret
    {
        OtpParams p{8, std::chrono::seconds(60), OtpAlgo::SHA256};
        const Secret short_key = Secret::from_string("foobar");
        const std::string uri = provisioning_uri("Acme Corp", "bob@host", short_key, p);
        assert(uri ==
            "otpauth://totp/Acme%20Corp:bob%40host?secret=MZXW6YTBOI"
            "&issuer=Acme%20Corp&algorithm=SHA256&digits=8&period=60");

        // the secret in the URI decodes back to the key
        const auto pos = uri.find("secret=") + 7;
        const std::string b32 = uri.substr(pos, uri.find('&', pos) - pos);
        assert(Base32::decode(b32) == short_key.bytes());
    }

    // invalid parameters are rejected before a URI is produced
    {
        bool threw = false;
        try { provisioning_uri("x", "y", key, OtpParams{12, std::chrono::seconds(30), OtpAlgo::SHA1}); }
        catch (const InvalidParameter&) { threw = true; }
        assert(threw);
    }

    assert(uri_escape("a-b_c.d~e") == "a-b_c.d~e");
    assert(uri_escape("a b:c/d") == "a%20b%3Ac%2Fd");

    assert(group_secret("GEZDGNBVGY3TQOJQ") == "GEZD GNBV GY3T QOJQ");
    assert(group_secret("MZXW6YTBOI======") == "MZXW 6YTB OI");
    assert(group_secret("") == "");
    assert(Base32::decode(group_secret("GEZDGNBVGY3TQOJQGEZDGNBVGY3TQOJQ")) == key.bytes());

    std::cout << "Provisioning test passed.\n";
    return 0;
}
