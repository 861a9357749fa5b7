#include "replay_guard.h"
#include "errors.h"
#include "file_descriptor.h"
#include "logger.h"

#include <cerrno>
#include <cstring>
#include <sstream>
#include <utility>

#include <fcntl.h>
#include <sys/file.h>

namespace {

constexpr unsigned kDirMode  = 0700;
constexpr unsigned kFileMode = 0600;

// Holds an exclusive flock() on the lock file for its lifetime.
FileDescriptor lock_exclusive(const std::string& path) {
    FileDescriptor fd(::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, kFileMode));
    if (!fd) {
        throw PersistenceFailure("open failed '" + path + "': " + std::strerror(errno));
    }
    while (::flock(fd.get(), LOCK_EX) != 0) {
        if (errno == EINTR) continue;
        throw PersistenceFailure("flock failed '" + path + "': " + std::strerror(errno));
    }
    return fd;
}

} // namespace

ReplayGuard::ReplayGuard(std::string dir, Logger& log, uint64_t retention_periods)
    : dir_(std::move(dir)), log_(log), retention_(retention_periods)
{
    if (retention_ == 0) {
        throw InvalidParameter("ReplayGuard: retention must be at least one period");
    }
    if (dir_.empty()) {
        throw InvalidParameter("ReplayGuard: directory must not be empty");
    }
}

std::string ReplayGuard::record_path(const std::string& principal) const {
    return dir_ + "/" + fsutil::encode_name(principal);
}

std::string ReplayGuard::lock_path(const std::string& principal) const {
    return record_path(principal) + ".lock";
}

std::set<uint64_t> ReplayGuard::parse(const std::string& text) {
    std::set<uint64_t> out;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        if (line.empty() || line.find_first_not_of("0123456789") != std::string::npos) continue;
        try {
            out.insert(std::stoull(line));
        } catch (const std::out_of_range&) {
            // more than 64 bits; not a counter we could have written
        }
    }
    return out;
}

std::string ReplayGuard::serialize(const std::set<uint64_t>& counters) {
    std::string out;
    for (uint64_t c : counters) {
        out += std::to_string(c);
        out.push_back('\n');
    }
    return out;
}

std::set<uint64_t> ReplayGuard::load(const std::string& principal) {
    if (principal.empty()) throw PersistenceFailure("ReplayGuard: empty principal");
    std::string text;
    if (!fsutil::read_file(record_path(principal), text)) return {};
    return parse(text);
}

bool ReplayGuard::is_used(const std::string& principal, uint64_t counter) {
    // records are replaced by rename, so a lock-free read sees a whole version
    try {
        return load(principal).count(counter) != 0;
    } catch (const PersistenceFailure& e) {
        log_.error_fmt("replay record unreadable for '", principal, "': ", e.what());
        return true;
    }
}

bool ReplayGuard::mark_used(const std::string& principal, uint64_t counter) {
    return update(principal, counter, Mode::MarkOnly) == MarkResult::Fresh;
}

ReplayGuard::MarkResult ReplayGuard::check_and_mark(const std::string& principal, uint64_t counter) {
    return update(principal, counter, Mode::CheckAndMark);
}

ReplayGuard::MarkResult ReplayGuard::update(const std::string& principal, uint64_t counter, Mode mode) {
    if (principal.empty()) {
        log_.error("replay check refused: empty principal");
        return MarkResult::Failed;
    }

    try {
        fsutil::ensure_dir(dir_, kDirMode);
        FileDescriptor lock = lock_exclusive(lock_path(principal));

        std::set<uint64_t> used = load(principal);
        if (mode == Mode::CheckAndMark && used.count(counter) != 0) {
            log_.debug_fmt("counter ", counter, " already consumed for '", principal, "'");
            return MarkResult::Replayed;
        }

        // drop entries that fell out of the retention window, then add
        const uint64_t cutoff = counter > retention_ ? counter - retention_ : 0;
        used.erase(used.begin(), used.lower_bound(cutoff));
        used.insert(counter);

        fsutil::write_file_atomic(record_path(principal), serialize(used), kFileMode);
        log_.debug_fmt("marked counter ", counter, " for '", principal, "' (", used.size(), " retained)");
        return MarkResult::Fresh;
    } catch (const PersistenceFailure& e) {
        log_.error_fmt("replay store failure for '", principal, "': ", e.what());
        return MarkResult::Failed;
    }
}
