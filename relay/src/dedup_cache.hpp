#pragma once

#include <string>
#include <unordered_map>
#include <mutex>
#include <cstdint>

enum class DedupVerdict {
    Accepted,
    DuplicateContent,   // same normalized text inside the retention window
    SymbolCooldown      // same symbol inside the short burst window
};

std::string verdict_string(DedupVerdict verdict);

// In-memory gate with two age-purged maps. Expired entries are swept at the
// start of every check, there is no timer thread.
class DedupCache {
public:
    DedupCache(int64_t retention_ms, int64_t cooldown_ms);

    // Sweep, look up and record as one atomic step. Nothing is recorded
    // for suppressed candidates. An empty key skips the cooldown check.
    DedupVerdict check_and_record(const std::string& raw_text,
                                  const std::string& cooldown_key,
                                  int64_t now_ms);

    void sweep(int64_t now_ms);
    void clear();

    size_t seen_count() const;
    size_t cooldown_count() const;

    int64_t retention_ms() const { return retention_ms_; }
    int64_t cooldown_ms() const { return cooldown_ms_; }

private:
    int64_t retention_ms_;
    int64_t cooldown_ms_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, int64_t> seen_;          // fingerprint -> accepted at
    std::unordered_map<std::string, int64_t> last_by_key_; // cooldown key -> accepted at

    void sweep_locked(int64_t now_ms);
};
