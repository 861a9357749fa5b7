#include "auth.h"
#include "conversation.h"
#include "errors.h"
#include "logger.h"
#include "replay_guard.h"
#include "secret_store.h"
#include "totp.h"
#include "verifier.h"

#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static std::string make_tmp_dir() {
    std::string tmpl = (fs::temp_directory_path() / "otpguard_auth_XXXXXX").string();
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');
    const char* dir = ::mkdtemp(buf.data());
    assert(dir != nullptr);
    return dir;
}

static std::chrono::system_clock::time_point at(long long secs) {
    return std::chrono::system_clock::time_point(std::chrono::seconds(secs));
}

int main() {
    try {
        std::ostringstream sink;
        Logger log("auth_test", sink);
        const std::string root = make_tmp_dir();

        FileSecretStore store(root + "/secrets", log);
        ReplayGuard guard(root + "/replay", log, 10);
        const OtpParams p;
        Verifier verifier(p, 1, &guard, log);

        const Secret secret = Secret::from_string("12345678901234567890");
        store.save("alice", secret);

        const auto now = at(1700000010);
        const std::string good = TOTP::generate(secret, now, p);
        const std::string wrong = good == "000000" ? "111111" : "000000";

        // not configured
        {
            ScriptedConversation conv({good});
            Authenticator auth(store, verifier, conv, log, 3);
            assert(auth.authenticate("bob") == Authenticator::Status::NotConfigured);
            assert(conv.prompts().empty());
            assert(conv.errors().size() == 1);
        }

        // malformed and wrong codes cost attempts, then a good one succeeds
        {
            ScriptedConversation conv({"12ab", wrong, " " + good + "\n"});
            Authenticator auth(store, verifier, conv, log, 3);
            auth.set_clock([now] { return now; });
            assert(auth.authenticate("alice") == Authenticator::Status::Success);
            assert(conv.prompts().size() == 3);
            assert(conv.prompts()[0] == "TOTP code (1/3): ");
            assert(conv.prompts()[2] == "TOTP code (3/3): ");
            assert(conv.errors().size() == 2);
            assert(conv.errors()[0] == "Invalid format. TOTP code must be 6 digits.");
            assert(conv.errors()[1] == "Invalid TOTP code. 1 attempts remaining.");
            assert(conv.infos().back() == "TOTP authentication successful!");
        }

        // the same code in a new invocation is a replay and is denied
        {
            ScriptedConversation conv({good, good});
            Authenticator auth(store, verifier, conv, log, 2);
            auth.set_clock([now] { return now; });
            assert(auth.authenticate("alice") == Authenticator::Status::Denied);
            assert(conv.errors().back() == "Invalid TOTP code. Maximum attempts exceeded.");
        }

        // end of input
        {
            ScriptedConversation conv({});
            Authenticator auth(store, verifier, conv, log, 3);
            assert(auth.authenticate("alice") == Authenticator::Status::Unavailable);
            assert(conv.errors().back() == "Failed to read TOTP code.");
        }

        // secret disappears between exists() and load(): a store that lies
        {
            struct FlakyStore : SecretStore {
                Secret load(const std::string&) override { throw SecretUnavailable("gone"); }
                void save(const std::string&, const Secret&) override {}
                bool exists(const std::string&) override { return true; }
                void remove(const std::string&) override {}
            } flaky;
            ScriptedConversation conv({good});
            Authenticator auth(flaky, verifier, conv, log, 3);
            assert(auth.authenticate("alice") == Authenticator::Status::Unavailable);
            assert(conv.errors().back() == "Failed to verify TOTP: gone");
        }

        // a record that cannot be read is "unavailable", never "not configured"
        {
            fs::create_directories(root + "/secrets/mallory.key");
            ScriptedConversation conv({good});
            Authenticator auth(store, verifier, conv, log, 3);
            assert(auth.authenticate("mallory") == Authenticator::Status::Unavailable);
            assert(conv.prompts().empty());
            assert(conv.errors().size() == 1);
            assert(conv.errors()[0] == "Failed to verify TOTP: secret for 'mallory' unreadable");
        }

        assert(std::string(status_name(Authenticator::Status::Denied)) == "denied");

        // reconfiguration confirmation
        assert(is_affirmative("yes"));
        assert(is_affirmative("YES"));
        assert(is_affirmative(" Yes\n"));
        assert(!is_affirmative("y"));
        assert(!is_affirmative("no"));
        assert(!is_affirmative(""));

        fs::remove_all(root);
        std::cout << "Authenticator test passed.\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "auth_test exception: " << e.what() << "\n";
        return 2;
    }
}
