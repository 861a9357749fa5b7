#pragma once
#include "hotp.h"
#include "logger.h"
#include <cstdint>
#include <string>

class Config {
public:
    // Load settings from json file; missing keys keep their defaults.
    // Throws ConfigError (unreadable / malformed) or InvalidParameter (bad values).
    static Config load_from_file(const std::string& path);

    // Built-in defaults, same validation and env overrides as a file.
    static Config defaults();

    // Accessors (read-only)
    const OtpParams& otp() const {return otp_; }
    int window() const {return window_; }
    uint64_t retention_periods() const {return retention_periods_; }
    const std::string& replay_dir() const {return replay_dir_; }
    const std::string& secret_dir() const {return secret_dir_; }
    const std::string& issuer() const {return issuer_; }
    int max_attempts() const {return max_attempts_; }
    LogLevel log_level() const {return log_level_; }

private:
    // private ctor enforce factory method
    Config() = default;

    void apply_env();
    void validate() const;

    OtpParams otp_;
    int window_ = 1;
    uint64_t retention_periods_ = 10;
    std::string replay_dir_ = "/var/run/otpguard";
    std::string secret_dir_ = "/var/lib/otpguard";
    std::string issuer_ = "otpguard";
    int max_attempts_ = 10;
    LogLevel log_level_ = LogLevel::INFO;

};
