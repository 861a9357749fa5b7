#pragma once
#include <string>
#include <chrono>
#include <functional>
#include <utility>

class Conversation;
class Logger;
class SecretStore;
class Verifier;

// One host authentication attempt: prompt, verify with replay protection,
// report. Mirrors what a PAM-style module does around the verifier.
class Authenticator {
public:
    enum class Status {
        Success,        // a fresh code was accepted
        Denied,         // attempts exhausted
        NotConfigured,  // no secret for the principal
        Unavailable,    // secret could not be loaded, or no response from the user
    };

    using Clock = std::function<std::chrono::system_clock::time_point()>;

    // Borrow existing instances; no ownership.
    Authenticator(SecretStore& store, Verifier& verifier, Conversation& conv,
                  Logger& log, int max_attempts = 10);

    Status authenticate(const std::string& principal);

    // Test hook: replaces system_clock::now.
    void set_clock(Clock clock) { clock_ = std::move(clock); }

    int max_attempts() const noexcept { return max_attempts_; }

private:
    SecretStore& store_;
    Verifier& verifier_;
    Conversation& conv_;
    Logger& log_;
    int max_attempts_;
    Clock clock_;

    std::string prompt_for(int attempt) const;
};

const char* status_name(Authenticator::Status status) noexcept;
