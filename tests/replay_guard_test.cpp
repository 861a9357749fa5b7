#include "replay_guard.h"
#include "errors.h"
#include "logger.h"
#include <atomic>
#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

namespace fs = std::filesystem;

static std::string make_tmp_dir() {
    std::string tmpl = (fs::temp_directory_path() / "otpguard_replay_XXXXXX").string();
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');
    const char* dir = ::mkdtemp(buf.data());
    assert(dir != nullptr);
    return dir;
}

static std::string slurp(const std::string& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

static unsigned mode_of(const std::string& path) {
    struct stat st{};
    assert(::stat(path.c_str(), &st) == 0);
    return st.st_mode & 0777;
}

int main() {
    std::ostringstream sink;
    Logger log("replay_guard_test", sink);
    log.set_level(LogLevel::DEBUG);

    const std::string root = make_tmp_dir();
    const std::string dir = root + "/state/replay";

    // --- basic mark / probe, lazy directory creation ---
    {
        ReplayGuard g(dir, log, 10);
        assert(!fs::exists(dir));
        assert(!g.is_used("alice", 100));
        assert(g.mark_used("alice", 100));
        assert(g.is_used("alice", 100));
        assert(!g.is_used("alice", 101));
        assert(!g.is_used("bob", 100));

        assert(mode_of(dir) == 0700);
        assert(mode_of(dir + "/alice") == 0600);
        assert(slurp(dir + "/alice") == "100\n");
    }

    // --- durability: a fresh instance sees earlier marks ---
    {
        ReplayGuard g(dir, log, 10);
        assert(g.is_used("alice", 100));
        assert(g.check_and_mark("alice", 100) == ReplayGuard::MarkResult::Replayed);
        assert(g.check_and_mark("alice", 101) == ReplayGuard::MarkResult::Fresh);
        assert(g.check_and_mark("bob", 100) == ReplayGuard::MarkResult::Fresh);
        assert(slurp(dir + "/alice") == "100\n101\n");
    }

    // --- pruning: entries older than counter - retention are dropped on write ---
    {
        ReplayGuard g(dir, log, 10);
        assert(g.mark_used("carol", 1000));
        assert(g.mark_used("carol", 1005));
        assert(g.mark_used("carol", 1010));   // cutoff 1000: keeps 1000
        assert(g.load("carol") == (std::set<uint64_t>{1000, 1005, 1010}));
        assert(g.mark_used("carol", 1011));   // cutoff 1001: drops 1000
        assert(g.load("carol") == (std::set<uint64_t>{1005, 1010, 1011}));
        assert(!g.is_used("carol", 1000));
        assert(g.mark_used("carol", 2000));
        assert(g.load("carol") == (std::set<uint64_t>{2000}));

        // near zero the cutoff clamps
        assert(g.mark_used("dave", 0));
        assert(g.mark_used("dave", 3));
        assert(g.load("dave") == (std::set<uint64_t>{0, 3}));
    }

    // --- principal names are encoded into safe file names ---
    {
        ReplayGuard g(dir, log, 10);
        assert(g.mark_used("../evil", 7));
        assert(fs::exists(dir + "/%2E%2E%2Fevil"));
        assert(!fs::exists(root + "/state/evil"));
        assert(g.mark_used("user@example.com", 7));
        assert(fs::exists(dir + "/user%40example%2Ecom"));
        assert(!g.is_used("user_example.com", 7));
    }

    // --- foreign lines in a record are ignored ---
    {
        {
            std::ofstream out(dir + "/erin");
            out << "12\nnot-a-number\n\n99999999999999999999999\n15\n";
        }
        ReplayGuard g(dir, log, 10);
        assert(g.load("erin") == (std::set<uint64_t>{12, 15}));
        assert(g.check_and_mark("erin", 15) == ReplayGuard::MarkResult::Replayed);
        assert(g.check_and_mark("erin", 16) == ReplayGuard::MarkResult::Fresh);
        assert(slurp(dir + "/erin") == "12\n15\n16\n");
    }

    // --- failures are reported, never treated as fresh ---
    {
        ReplayGuard g(dir, log, 10);
        assert(g.check_and_mark("", 5) == ReplayGuard::MarkResult::Failed);
        assert(!g.mark_used("", 5));
        assert(g.is_used("", 5));

        const std::string blocker = root + "/blocker";
        std::ofstream(blocker) << "x";
        ReplayGuard broken(blocker + "/replay", log, 10);
        assert(broken.check_and_mark("frank", 5) == ReplayGuard::MarkResult::Failed);
        assert(!broken.mark_used("frank", 5));

        // a record path that is a directory cannot be read
        fs::create_directories(dir + "/gina");
        assert(g.is_used("gina", 1));
        assert(g.check_and_mark("gina", 1) == ReplayGuard::MarkResult::Failed);

        bool threw = false;
        try { ReplayGuard bad(dir, log, 0); } catch (const InvalidParameter&) { threw = true; }
        assert(threw);
    }

    // --- threads racing on the same code: exactly one wins ---
    {
        const int threads = 8;
        const int rounds = 20;
        for (int r = 0; r < rounds; ++r) {
            std::atomic<int> fresh{0};
            std::atomic<int> replayed{0};
            std::vector<std::thread> th;
            for (int t = 0; t < threads; ++t) {
                th.emplace_back([&, r] {
                    ReplayGuard g(dir, log, 10);   // separate instance per attempt
                    auto res = g.check_and_mark("harry", 5000 + static_cast<uint64_t>(r));
                    if (res == ReplayGuard::MarkResult::Fresh) ++fresh;
                    if (res == ReplayGuard::MarkResult::Replayed) ++replayed;
                });
            }
            for (auto& x : th) x.join();
            assert(fresh == 1);
            assert(replayed == threads - 1);
        }
        ReplayGuard g(dir, log, 10);
        // retention 10: only the last 11 rounds survive pruning
        assert(g.load("harry").size() == 11);
    }

    // --- separate processes racing on the same code: exactly one wins ---
    {
        const int procs = 6;
        std::vector<pid_t> kids;
        for (int i = 0; i < procs; ++i) {
            pid_t pid = ::fork();
            assert(pid >= 0);
            if (pid == 0) {
                std::ostringstream child_sink;
                Logger child_log("replay_guard_child", child_sink);
                ReplayGuard g(dir, child_log, 10);
                auto res = g.check_and_mark("ivy", 777);
                ::_exit(res == ReplayGuard::MarkResult::Fresh ? 0
                        : res == ReplayGuard::MarkResult::Replayed ? 1 : 2);
            }
            kids.push_back(pid);
        }
        int fresh = 0, replayed = 0, failed = 0;
        for (pid_t pid : kids) {
            int status = 0;
            assert(::waitpid(pid, &status, 0) == pid);
            assert(WIFEXITED(status));
            switch (WEXITSTATUS(status)) {
                case 0: ++fresh; break;
                case 1: ++replayed; break;
                default: ++failed; break;
            }
        }
        assert(fresh == 1);
        assert(replayed == procs - 1);
        assert(failed == 0);
    }

    // no temp files left behind by the atomic writes
    for (const auto& e : fs::directory_iterator(dir)) {
        assert(e.path().filename().string().find(".tmp.") == std::string::npos);
    }

    fs::remove_all(root);
    std::cout << "ReplayGuard test passed.\n";
    return 0;
}
