// otpguard: provisioning and authentication front end over the verifier core.
#include "auth.h"
#include "config.h"
#include "conversation.h"
#include "errors.h"
#include "logger.h"
#include "provisioning.h"
#include "replay_guard.h"
#include "secret_store.h"
#include "totp.h"
#include "verifier.h"
#include "base32.h"

#include <openssl/crypto.h>

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <optional>
#include <string>

#include <pwd.h>
#include <sys/stat.h>
#include <unistd.h>

namespace {

constexpr const char* kDefaultConfig = "/etc/otpguard/config.json";

void usage(const char* argv0) {
    std::cerr << "usage: " << argv0 << " [-c config.json] <command> [user]\n"
              << "commands:\n"
              << "  setup  [user]  generate and enroll a new secret (root only)\n"
              << "  verify [user]  prompt for a code and verify it\n"
              << "  remove [user]  delete the user's secret (root only)\n";
}

std::optional<std::string> current_user() {
    if (const char* sudo_user = std::getenv("SUDO_USER")) {
        if (*sudo_user) return std::string(sudo_user);
    }
    if (const passwd* pw = ::getpwuid(::getuid())) {
        return std::string(pw->pw_name);
    }
    return std::nullopt;
}

Config load_config(const std::string& path, bool explicit_path) {
    struct stat st{};
    if (!explicit_path && ::stat(path.c_str(), &st) != 0) {
        return Config::defaults();
    }
    return Config::load_from_file(path);
}

int run_setup(const Config& cfg, SecretStore& store, Conversation& conv,
              Logger& log, const std::string& user) {
    if (::getuid() != 0) {
        conv.error("Error: setup must be run with sudo privileges.\n"
                   "Usage: sudo otpguard setup [user]");
        return 1;
    }

    conv.info("Configuring TOTP for user: " + user);

    bool configured = false;
    try {
        configured = store.exists(user);
    } catch (const SecretUnavailable& e) {
        conv.error(std::string("Cannot read existing secret: ") + e.what());
        return 1;
    }

    if (configured) {
        conv.info("TOTP is already configured for user '" + user + "'.");
        conv.info("Reconfiguring will invalidate existing TOTP tokens.");
        auto answer = conv.prompt_echo("Are you sure you want to reconfigure TOTP for '" + user + "'? (yes/N): ");
        if (!answer || !is_affirmative(*answer)) {
            conv.info("Cancelled for security.");
            return 0;
        }
        log.info_fmt("administrator confirmed reconfiguration of '", user, "'");
    }

    const Secret secret = TOTP::generate_secret();
    const std::string uri = provisioning_uri(cfg.issuer(), user, secret, cfg.otp());
    std::string b32 = Base32::encode(secret.bytes());

    conv.info("\nAdd this account to your authenticator app:\n\n  " + uri);
    conv.info("\nOr enter this secret key manually:\n\n  " + group_secret(b32) + "\n");
    OPENSSL_cleanse(&b32[0], b32.size());

    auto code = conv.prompt_echo("Enter the " + std::to_string(cfg.otp().digits) +
                                 "-digit code from your authenticator to verify: ");
    if (!code) {
        conv.error("No code entered. Setup cancelled.");
        return 1;
    }

    // confirmation only; the code is not consumed in the replay store
    Verifier confirm(cfg.otp(), 1, nullptr, log);
    if (!confirm.verify(*code, secret, std::chrono::system_clock::now())) {
        conv.error("Invalid code. Please try setup again.");
        return 1;
    }

    try {
        store.save(user, secret);
    } catch (const PersistenceFailure& e) {
        conv.error(std::string("Failed to save secret: ") + e.what());
        return 1;
    }
    conv.info("TOTP configured successfully for user '" + user + "'.");
    return 0;
}

int run_verify(const Config& cfg, SecretStore& store, Conversation& conv,
               Logger& log, const std::string& user) {
    ReplayGuard guard(cfg.replay_dir(), log, cfg.retention_periods());
    Verifier verifier(cfg.otp(), cfg.window(), &guard, log);
    Authenticator auth(store, verifier, conv, log, cfg.max_attempts());

    switch (auth.authenticate(user)) {
        case Authenticator::Status::Success:       return 0;
        case Authenticator::Status::NotConfigured: return 2;
        case Authenticator::Status::Denied:
        case Authenticator::Status::Unavailable:   return 1;
    }
    return 1;
}

int run_remove(SecretStore& store, Conversation& conv, const std::string& user) {
    if (::getuid() != 0) {
        conv.error("Error: remove must be run with sudo privileges.");
        return 1;
    }
    try {
        store.remove(user);
    } catch (const PersistenceFailure& e) {
        conv.error(std::string("Failed to remove secret: ") + e.what());
        return 1;
    }
    conv.info("TOTP removed for user '" + user + "'.");
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    std::string config_path = kDefaultConfig;
    bool explicit_config = false;

    int i = 1;
    if (i + 1 < argc && std::strcmp(argv[i], "-c") == 0) {
        config_path = argv[i + 1];
        explicit_config = true;
        i += 2;
    }
    if (i >= argc) {
        usage(argv[0]);
        return 64;
    }
    const std::string command = argv[i++];

    std::optional<std::string> user;
    if (i < argc) user = argv[i++];
    else user = current_user();
    if (!user || user->empty()) {
        std::cerr << "Could not determine target user; pass it explicitly.\n";
        return 64;
    }

    Logger log("otpguard", std::clog);
    try {
        const Config cfg = load_config(config_path, explicit_config);
        log.set_level(cfg.log_level());

        FileSecretStore store(cfg.secret_dir(), log);
        TerminalConversation conv;

        if (command == "setup")  return run_setup(cfg, store, conv, log, *user);
        if (command == "verify") return run_verify(cfg, store, conv, log, *user);
        if (command == "remove") return run_remove(store, conv, *user);
    } catch (const ConfigError& e) {
        log.error(e.what());
        return 78;
    } catch (const InvalidParameter& e) {
        log.error(std::string("invalid configuration: ") + e.what());
        return 78;
    }

    usage(argv[0]);
    return 64;
}
