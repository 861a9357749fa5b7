#include "verifier.h"
#include "errors.h"
#include "logger.h"
#include "replay_guard.h"
#include "totp.h"

const char* outcome_name(VerifyOutcome outcome) noexcept {
    switch (outcome) {
        case VerifyOutcome::Accepted:       return "accepted";
        case VerifyOutcome::NoMatch:        return "no-match";
        case VerifyOutcome::InvalidFormat:  return "invalid-format";
        case VerifyOutcome::RejectedReplay: return "rejected-replay";
        case VerifyOutcome::StoreFailure:   return "store-failure";
    }
    return "?";
}

Verifier::Verifier(OtpParams params, int window, ReplayGuard* guard, Logger& log)
    : params_(params), window_(window), guard_(guard), log_(log)
{
    params_.validate();
    if (window_ < 0 || window_ > kMaxWindow) {
        throw InvalidParameter("Verifier: window must be between 0 and 10");
    }
    if (guard_ && guard_->retention_periods() < static_cast<uint64_t>(2 * window_ + 1)) {
        throw InvalidParameter("Verifier: replay retention must be at least 2*window+1 periods");
    }
}

bool Verifier::well_formed(const std::string& candidate, int digits) noexcept {
    unsigned bad = (candidate.size() != static_cast<std::size_t>(digits)) ? 1u : 0u;
    for (char c : candidate) {
        bad |= (c < '0' || c > '9') ? 1u : 0u;
    }
    return bad == 0;
}

bool Verifier::constant_time_equal(const std::string& a, const std::string& b,
                                   std::size_t width, std::size_t* byte_ops) {
    unsigned char acc = 0;
    for (std::size_t i = 0; i < width; ++i) {
        const unsigned char x = i < a.size() ? static_cast<unsigned char>(a[i]) : 0;
        const unsigned char y = i < b.size() ? static_cast<unsigned char>(b[i]) : 0;
        acc |= static_cast<unsigned char>(x ^ y);
        if (byte_ops) ++*byte_ops;
    }
    return acc == 0;
}

bool Verifier::verify(const std::string& candidate,
                      const Secret& secret,
                      UnixTime t,
                      const std::optional<std::string>& principal)
{
    return check(candidate, secret, t, principal).accepted();
}

bool Verifier::verify(const std::string& candidate,
                      const Secret& secret,
                      std::chrono::system_clock::time_point tp,
                      const std::optional<std::string>& principal)
{
    return check(candidate, secret, tp, principal).accepted();
}

VerifyResult Verifier::check(const std::string& candidate,
                             const Secret& secret,
                             std::chrono::system_clock::time_point tp,
                             const std::optional<std::string>& principal)
{
    return check(candidate, secret, std::chrono::time_point_cast<std::chrono::seconds>(tp), principal);
}

VerifyResult Verifier::check(const std::string& candidate,
                             const Secret& secret,
                             UnixTime t,
                             const std::optional<std::string>& principal)
{
    VerifyResult res;
    const std::size_t width = static_cast<std::size_t>(params_.digits);

    // A malformed candidate still goes through the full scan, against a
    // placeholder that can never equal a decimal code.
    const bool format_ok = well_formed(candidate, params_.digits);
    const std::string probe = format_ok ? candidate : std::string(width, '\0');

    const uint64_t center = TOTP::time_counter(t, params_.period);
    bool found = false;
    uint64_t matched = 0;

    for (int offset = -window_; offset <= window_; ++offset) {
        uint64_t ctr = center;
        if (offset < 0) {
            const uint64_t back = static_cast<uint64_t>(-offset);
            ctr = center >= back ? center - back : 0;
        } else {
            ctr = center + static_cast<uint64_t>(offset);
        }

        const std::string expected = HOTP::generate(secret, ctr, params_.digits, params_.algo);
        ++res.hotp_calls;
        if (constant_time_equal(probe, expected, width, &res.byte_ops)) {
            found = true;
            matched = ctr;
        }
    }

    if (!format_ok) {
        res.outcome = VerifyOutcome::InvalidFormat;
        log_.debug("rejected: malformed code");
        return res;
    }
    if (!found) {
        res.outcome = VerifyOutcome::NoMatch;
        log_.debug_fmt("rejected: no match in window around counter ", center);
        return res;
    }
    res.matched_counter = matched;

    if (!principal) {
        res.outcome = VerifyOutcome::Accepted;
        log_.debug_fmt("accepted counter ", matched, " without replay scope");
        return res;
    }

    if (!guard_) {
        res.outcome = VerifyOutcome::StoreFailure;
        log_.error_fmt("no replay store configured; refusing '", *principal, "'");
        return res;
    }

    switch (guard_->check_and_mark(*principal, matched)) {
        case ReplayGuard::MarkResult::Fresh:
            res.outcome = VerifyOutcome::Accepted;
            log_.info_fmt("accepted code for '", *principal, "' at counter ", matched);
            break;
        case ReplayGuard::MarkResult::Replayed:
            res.outcome = VerifyOutcome::RejectedReplay;
            log_.warn_fmt("rejected replayed code for '", *principal, "' at counter ", matched);
            break;
        case ReplayGuard::MarkResult::Failed:
            res.outcome = VerifyOutcome::StoreFailure;
            log_.error_fmt("cannot confirm freshness for '", *principal, "'; rejecting");
            break;
    }
    return res;
}
