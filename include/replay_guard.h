// include/replay_guard.h
#pragma once
#include <cstdint>
#include <set>
#include <string>

class Logger;

// Persistent record of consumed counters, one file per principal.
//
// Layout under dir:
//   <encoded principal>        newline-separated ascending counters (0600)
//   <encoded principal>.lock   flock() target for the read-modify-write
//
// Every mark prunes counters older than retention_periods relative to the
// counter being added, then replaces the record atomically (temp + rename).
// The exclusive lock serializes concurrent attempts, whether they run as
// threads of one process or as separate processes.
class ReplayGuard {
public:
    enum class MarkResult { Fresh, Replayed, Failed };

    static constexpr uint64_t kDefaultRetentionPeriods = 10;

    // Directory is created lazily (mode 0700) on first write.
    // Throws InvalidParameter when retention_periods == 0.
    ReplayGuard(std::string dir, Logger& log,
                uint64_t retention_periods = kDefaultRetentionPeriods);

    ReplayGuard(const ReplayGuard&) = delete;
    ReplayGuard& operator=(const ReplayGuard&) = delete;

    // Read-only probe. A record that cannot be read counts as used (fail closed).
    bool is_used(const std::string& principal, uint64_t counter);

    // Prune + insert + persist. False on any persistence failure.
    bool mark_used(const std::string& principal, uint64_t counter);

    // Check and mark under a single exclusive lock.
    MarkResult check_and_mark(const std::string& principal, uint64_t counter);

    // Counters currently on disk for principal (empty if none). Throws PersistenceFailure.
    std::set<uint64_t> load(const std::string& principal);

    const std::string& dir() const noexcept { return dir_; }
    uint64_t retention_periods() const noexcept { return retention_; }

private:
    enum class Mode { CheckAndMark, MarkOnly };

    std::string dir_;
    Logger& log_;
    uint64_t retention_;

    std::string record_path(const std::string& principal) const;
    std::string lock_path(const std::string& principal) const;

    MarkResult update(const std::string& principal, uint64_t counter, Mode mode);

    static std::set<uint64_t> parse(const std::string& text);
    static std::string serialize(const std::set<uint64_t>& counters);
};
