#include "config.h"
#include "errors.h"
#include "verifier.h"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

Config Config::defaults() {
    Config cfg;
    cfg.apply_env();
    cfg.validate();
    return cfg;
}

Config Config::load_from_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("Config file not found: " + path);
    }

    nlohmann::json j;
    try {
        in >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("Config file " + path + " is not valid JSON: " + e.what());
    }
    if (!j.is_object()) {
        throw ConfigError("Config file " + path + " must hold a JSON object");
    }

    Config cfg;
    try {
        cfg.otp_.digits         = j.value("digits", cfg.otp_.digits);
        cfg.otp_.period         = std::chrono::seconds(j.value("period", static_cast<long long>(cfg.otp_.period.count())));
        cfg.otp_.algo           = parse_algo(j.value("algorithm", std::string(algo_name(cfg.otp_.algo))));
        cfg.window_             = j.value("window", cfg.window_);
        const long long retention = j.value("retention_periods", static_cast<long long>(cfg.retention_periods_));
        if (retention <= 0) {
            throw InvalidParameter("Config: retention_periods must be positive");
        }
        cfg.retention_periods_  = static_cast<uint64_t>(retention);
        cfg.replay_dir_         = j.value("replay_dir", cfg.replay_dir_);
        cfg.secret_dir_         = j.value("secret_dir", cfg.secret_dir_);
        cfg.issuer_             = j.value("issuer", cfg.issuer_);
        cfg.max_attempts_       = j.value("max_attempts", cfg.max_attempts_);
        cfg.log_level_          = parse_log_level(j.value("log_level", std::string(log_level_name(cfg.log_level_))));
    } catch (const nlohmann::json::type_error& e) {
        throw ConfigError("Config file " + path + " has a value of the wrong type: " + e.what());
    }

    cfg.apply_env();
    cfg.validate();
    return cfg;
}

void Config::apply_env() {
    if (const char* dir = std::getenv("OTPGUARD_REPLAY_DIR")) {
        if (*dir) replay_dir_ = dir;
    }
}

void Config::validate() const {
    otp_.validate();
    if (window_ < 0 || window_ > Verifier::kMaxWindow) {
        throw InvalidParameter("Config: window must be between 0 and 10");
    }
    if (retention_periods_ < static_cast<uint64_t>(2 * window_ + 1)) {
        throw InvalidParameter("Config: retention_periods must be at least 2*window+1");
    }
    if (max_attempts_ <= 0) {
        throw InvalidParameter("Config: max_attempts must be positive");
    }
    if (replay_dir_.empty() || secret_dir_.empty()) {
        throw InvalidParameter("Config: replay_dir and secret_dir must be set");
    }
    if (issuer_.empty()) {
        throw InvalidParameter("Config: issuer must not be empty");
    }
}
