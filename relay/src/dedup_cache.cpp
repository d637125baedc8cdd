#include "dedup_cache.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

std::string verdict_string(DedupVerdict verdict) {
    switch (verdict) {
        case DedupVerdict::Accepted: return "accepted";
        case DedupVerdict::DuplicateContent: return "duplicate_content";
        case DedupVerdict::SymbolCooldown: return "symbol_cooldown";
    }
    return "unknown";
}

DedupCache::DedupCache(int64_t retention_ms, int64_t cooldown_ms)
    : retention_ms_(retention_ms), cooldown_ms_(cooldown_ms) {}

DedupVerdict DedupCache::check_and_record(const std::string& raw_text,
                                          const std::string& cooldown_key,
                                          int64_t now_ms) {
    std::string fingerprint = util::content_fingerprint(raw_text);

    std::lock_guard<std::mutex> lock(mutex_);

    sweep_locked(now_ms);

    if (seen_.count(fingerprint) > 0) {
        return DedupVerdict::DuplicateContent;
    }

    if (!cooldown_key.empty()) {
        auto it = last_by_key_.find(cooldown_key);
        if (it != last_by_key_.end() && now_ms - it->second < cooldown_ms_) {
            return DedupVerdict::SymbolCooldown;
        }
    }

    seen_[fingerprint] = now_ms;
    if (!cooldown_key.empty()) {
        last_by_key_[cooldown_key] = now_ms;
    }

    return DedupVerdict::Accepted;
}

void DedupCache::sweep(int64_t now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    sweep_locked(now_ms);
}

void DedupCache::sweep_locked(int64_t now_ms) {
    size_t purged = 0;

    for (auto it = seen_.begin(); it != seen_.end();) {
        if (now_ms - it->second >= retention_ms_) {
            it = seen_.erase(it);
            purged++;
        } else {
            ++it;
        }
    }

    for (auto it = last_by_key_.begin(); it != last_by_key_.end();) {
        if (now_ms - it->second >= cooldown_ms_) {
            it = last_by_key_.erase(it);
        } else {
            ++it;
        }
    }

    if (purged > 0) {
        spdlog::debug("Dedup sweep purged {} fingerprints, {} remain", purged, seen_.size());
    }
}

void DedupCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    seen_.clear();
    last_by_key_.clear();
}

size_t DedupCache::seen_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return seen_.size();
}

size_t DedupCache::cooldown_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_by_key_.size();
}
