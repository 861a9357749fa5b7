#include "auth.h"
#include "conversation.h"
#include "errors.h"
#include "logger.h"
#include "secret_store.h"
#include "verifier.h"

#include <openssl/crypto.h>

#include <utility>

const char* status_name(Authenticator::Status status) noexcept {
    switch (status) {
        case Authenticator::Status::Success:       return "success";
        case Authenticator::Status::Denied:        return "denied";
        case Authenticator::Status::NotConfigured: return "not-configured";
        case Authenticator::Status::Unavailable:   return "unavailable";
    }
    return "?";
}

Authenticator::Authenticator(SecretStore& store, Verifier& verifier, Conversation& conv,
                             Logger& log, int max_attempts)
    : store_(store), verifier_(verifier), conv_(conv), log_(log),
      max_attempts_(max_attempts),
      clock_([] { return std::chrono::system_clock::now(); })
{
    if (max_attempts_ <= 0) {
        throw InvalidParameter("Authenticator: max_attempts must be positive");
    }
}

std::string Authenticator::prompt_for(int attempt) const {
    return "TOTP code (" + std::to_string(attempt) + "/" + std::to_string(max_attempts_) + "): ";
}

Authenticator::Status Authenticator::authenticate(const std::string& principal) {
    bool configured = false;
    try {
        configured = store_.exists(principal);
    } catch (const SecretUnavailable& e) {
        conv_.error(std::string("Failed to verify TOTP: ") + e.what());
        log_.error_fmt("secret unavailable for '", principal, "': ", e.what());
        return Status::Unavailable;
    }
    if (!configured) {
        conv_.error("TOTP not configured. Contact your administrator.");
        log_.warn_fmt("no secret configured for '", principal, "'");
        return Status::NotConfigured;
    }

    const int digits = verifier_.params().digits;
    int attempts = 0;
    while (attempts < max_attempts_) {
        auto code = conv_.prompt_masked(prompt_for(attempts + 1));
        if (!code) {
            conv_.error("Failed to read TOTP code.");
            log_.warn_fmt("no response from '", principal, "'");
            return Status::Unavailable;
        }

        // cheap feedback for typos; the verifier re-checks in constant time
        if (!Verifier::well_formed(*code, digits)) {
            conv_.error("Invalid format. TOTP code must be " + std::to_string(digits) + " digits.");
            if (!code->empty()) OPENSSL_cleanse(&(*code)[0], code->size());
            ++attempts;
            continue;
        }

        bool ok = false;
        try {
            const Secret secret = store_.load(principal);
            ok = verifier_.verify(*code, secret, clock_(), principal);
        } catch (const SecretUnavailable& e) {
            conv_.error(std::string("Failed to verify TOTP: ") + e.what());
            log_.error_fmt("secret unavailable for '", principal, "': ", e.what());
            OPENSSL_cleanse(&(*code)[0], code->size());
            return Status::Unavailable;
        }
        OPENSSL_cleanse(&(*code)[0], code->size());

        if (ok) {
            conv_.info("TOTP authentication successful!");
            log_.info_fmt("authenticated '", principal, "' after ", attempts + 1, " attempt(s)");
            return Status::Success;
        }

        ++attempts;
        if (attempts < max_attempts_) {
            conv_.error("Invalid TOTP code. " + std::to_string(max_attempts_ - attempts) +
                        " attempts remaining.");
        } else {
            conv_.error("Invalid TOTP code. Maximum attempts exceeded.");
        }
    }

    log_.warn_fmt("denied '", principal, "' after ", max_attempts_, " attempts");
    return Status::Denied;
}
