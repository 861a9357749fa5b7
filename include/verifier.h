// include/verifier.h
#pragma once
#include "totp.h"
#include "secret.h"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

class Logger;
class ReplayGuard;

// Terminal state of one verification. Only Accepted means "let them in";
// callers of Verifier::verify() see every other state as plain false.
enum class VerifyOutcome { Accepted, NoMatch, InvalidFormat, RejectedReplay, StoreFailure };

const char* outcome_name(VerifyOutcome outcome) noexcept;

struct VerifyResult {
    VerifyOutcome outcome = VerifyOutcome::NoMatch;
    uint64_t matched_counter = 0;   // valid unless outcome is NoMatch / InvalidFormat
    std::size_t hotp_calls = 0;     // 2*window+1 on every path
    std::size_t byte_ops = 0;       // (2*window+1) * digits on every path

    bool accepted() const noexcept { return outcome == VerifyOutcome::Accepted; }
};

class Verifier {
public:
    static constexpr int kMaxWindow = 10;

    // params are validated; window must be in [0, kMaxWindow]. With a guard,
    // its retention must cover the window (>= 2*window+1 periods).
    // guard may be null, in which case any principal-scoped check fails closed.
    // Throws InvalidParameter.
    Verifier(OtpParams params, int window, ReplayGuard* guard, Logger& log);

    bool verify(const std::string& candidate,
                const Secret& secret,
                UnixTime t,
                const std::optional<std::string>& principal = std::nullopt);
    bool verify(const std::string& candidate,
                const Secret& secret,
                std::chrono::system_clock::time_point tp,
                const std::optional<std::string>& principal = std::nullopt);

    // Same as verify() but keeps the internal outcome for logs and tests.
    VerifyResult check(const std::string& candidate,
                       const Secret& secret,
                       UnixTime t,
                       const std::optional<std::string>& principal = std::nullopt);
    VerifyResult check(const std::string& candidate,
                       const Secret& secret,
                       std::chrono::system_clock::time_point tp,
                       const std::optional<std::string>& principal = std::nullopt);

    const OtpParams& params() const noexcept { return params_; }
    int window() const noexcept { return window_; }

    // Compares exactly width bytes (missing bytes read as 0) without branching
    // on the data. byte_ops, if given, is incremented once per byte compared.
    static bool constant_time_equal(const std::string& a, const std::string& b,
                                    std::size_t width, std::size_t* byte_ops = nullptr);

    static bool well_formed(const std::string& candidate, int digits) noexcept;

private:
    OtpParams params_;
    int window_;
    ReplayGuard* guard_;
    Logger& log_;
};
