#pragma once

#include "src/server/execution_result.h"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>

namespace execgate {

struct CacheStats {
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t writes = 0;
    uint64_t cleanups = 0;
    double hit_rate_percent = 0.0;
    uint64_t total_entries = 0;
    uint64_t total_size_bytes = 0;
    uint64_t max_size_bytes = 0;
    std::string directory;
};

// Longest lifetime a caller may request for an entry.
constexpr int64_t kMaxTtlSeconds = 365LL * 24 * 3600;

// Converts a caller-supplied TTL in hours to seconds. NaN and non-positive
// values yield nullopt (the cache default applies). Larger values, infinity
// included, are clamped to kMaxTtlSeconds.
std::optional<int64_t> TtlSecondsFromHours(double hours);

// File-backed result store, one JSON file per fingerprint.
//
// Entries are written to a staging file and renamed into place, so a reader
// sees either the previous complete entry or the new one. There is no lock
// around the directory; independent keys never contend.
//
// When the directory grows past max_size_bytes the entries with the oldest
// modification time are removed until it is back under 80% of the ceiling.
// That is eviction by write time, not by access: a hot entry written long ago
// goes before a cold one written recently.
class ResultCache {
public:
    using Params = std::map<std::string, std::string>;
    using Clock = std::function<double()>;

    ResultCache(std::string directory, uint64_t max_size_bytes, int64_t default_ttl_seconds);

    // SHA-256 over trimmed source, lower-cased language and params in key
    // order. 64 lowercase hex characters.
    static std::string Fingerprint(const std::string& source, const std::string& language,
                                   const Params& params);
    static bool IsValidFingerprint(const std::string& fingerprint);

    std::optional<ExecutionResult> Get(const std::string& fingerprint);
    bool Set(const std::string& fingerprint, const ExecutionResult& result,
             std::optional<int64_t> ttl_seconds = std::nullopt);
    bool Invalidate(const std::string& fingerprint);
    size_t CleanupExpired();
    size_t ClearAll();
    CacheStats Stats() const;

    const std::string& directory() const { return directory_; }
    uint64_t max_size_bytes() const { return max_size_bytes_; }
    int64_t default_ttl_seconds() const { return default_ttl_seconds_; }

    // Replaces the epoch-seconds source used for expiry. Tests only.
    void SetClock(Clock clock) { clock_ = std::move(clock); }

private:
    std::filesystem::path EntryPath(const std::string& fingerprint) const;
    void EnforceSizeLimit();
    double Now() const;

    std::string directory_;
    uint64_t max_size_bytes_;
    int64_t default_ttl_seconds_;
    Clock clock_;

    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> writes_{0};
    std::atomic<uint64_t> cleanups_{0};
};

} // namespace execgate
