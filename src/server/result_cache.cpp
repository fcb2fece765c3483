#include "src/server/result_cache.h"
#include "src/server/logger.h"
#include "proto/execgate.pb.h"

#include <google/protobuf/util/json_util.h>
#include <openssl/sha.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <fstream>
#include <random>
#include <sstream>
#include <vector>

namespace execgate {

namespace fs = std::filesystem;

namespace {

const char kEntryExtension[] = ".json";
const char kStagingPrefix[] = ".tmp_";

std::string Trim(const std::string& text) {
    const char* whitespace = " \t\n\r\f\v";
    size_t begin = text.find_first_not_of(whitespace);
    if (begin == std::string::npos) return "";
    size_t end = text.find_last_not_of(whitespace);
    return text.substr(begin, end - begin + 1);
}

std::string ToLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

// Length-prefixed so that no two distinct inputs share an encoding.
void AppendField(std::string& out, const std::string& field) {
    out += std::to_string(field.size());
    out += ':';
    out += field;
}

std::string Sha256Hex(const std::string& data) {
    unsigned char digest[SHA256_DIGEST_LENGTH];
    SHA256((const unsigned char*)data.data(), data.size(), digest);
    static const char* hex = "0123456789abcdef";
    std::string out(2 * SHA256_DIGEST_LENGTH, '0');
    for (int i = 0; i < SHA256_DIGEST_LENGTH; i++) {
        out[2 * i] = hex[(digest[i] >> 4) & 0xF];
        out[2 * i + 1] = hex[digest[i] & 0xF];
    }
    return out;
}

std::string RandomSuffix() {
    thread_local std::mt19937_64 engine{std::random_device{}()};
    std::ostringstream out;
    out << std::hex << engine();
    return out.str();
}

bool IsEntryFile(const fs::directory_entry& entry) {
    std::error_code ec;
    if (!entry.is_regular_file(ec)) return false;
    const fs::path& path = entry.path();
    if (path.extension() != kEntryExtension) return false;
    return path.filename().string().rfind(kStagingPrefix, 0) != 0;
}

struct EntryFile {
    fs::path path;
    uint64_t size;
    fs::file_time_type modified;
};

std::vector<EntryFile> ListEntries(const std::string& directory) {
    std::vector<EntryFile> files;
    std::error_code ec;
    fs::directory_iterator it(directory, ec);
    if (ec) {
        Logger::Error("Cannot list cache directory ", directory, ": ", ec.message());
        return files;
    }
    for (const auto& entry : it) {
        if (!IsEntryFile(entry)) continue;
        std::error_code size_ec;
        std::error_code time_ec;
        uint64_t size = entry.file_size(size_ec);
        fs::file_time_type modified = entry.last_write_time(time_ec);
        // Entries can vanish under a concurrent delete; skip them.
        if (size_ec || time_ec) continue;
        files.push_back({entry.path(), size, modified});
    }
    return files;
}

bool ReadFile(const fs::path& path, std::string* content) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return false;
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) return false;
    *content = buffer.str();
    return true;
}

bool RemoveEntry(const fs::path& path) {
    std::error_code ec;
    bool removed = fs::remove(path, ec);
    if (ec) {
        Logger::Error("Failed to remove cache entry ", path.string(), ": ", ec.message());
        return false;
    }
    return removed;
}

// Parses a stored entry. Returns false when the file is not a well-formed
// entry for `expected_fingerprint`.
bool ParseEntry(const std::string& json, const std::string& expected_fingerprint, v1::CacheEntry* entry) {
    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = true;
    auto status = google::protobuf::util::JsonStringToMessage(json, entry, options);
    if (!status.ok()) return false;
    if (!entry->has_result()) return false;
    return entry->fingerprint() == expected_fingerprint;
}

} // namespace

std::optional<int64_t> TtlSecondsFromHours(double hours) {
    if (std::isnan(hours) || hours <= 0) return std::nullopt;
    double seconds = hours * 3600.0;
    if (seconds >= static_cast<double>(kMaxTtlSeconds)) return kMaxTtlSeconds;
    return std::max<int64_t>(1, static_cast<int64_t>(seconds));
}

ResultCache::ResultCache(std::string directory, uint64_t max_size_bytes, int64_t default_ttl_seconds)
    : directory_(std::move(directory)),
      max_size_bytes_(max_size_bytes),
      default_ttl_seconds_(default_ttl_seconds) {
    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec) {
        Logger::Error("Failed to create cache directory ", directory_, ": ", ec.message());
    } else {
        Logger::Info("Result cache ready at ", directory_);
    }
}

std::string ResultCache::Fingerprint(const std::string& source, const std::string& language,
                                     const Params& params) {
    std::string canonical;
    AppendField(canonical, Trim(source));
    AppendField(canonical, ToLower(language));
    canonical += std::to_string(params.size());
    canonical += '#';
    for (const auto& [key, value] : params) {
        AppendField(canonical, key);
        AppendField(canonical, value);
    }
    return Sha256Hex(canonical);
}

bool ResultCache::IsValidFingerprint(const std::string& fingerprint) {
    if (fingerprint.size() != 2 * SHA256_DIGEST_LENGTH) return false;
    return std::all_of(fingerprint.begin(), fingerprint.end(), [](char c) {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
    });
}

std::optional<ExecutionResult> ResultCache::Get(const std::string& fingerprint) {
    if (!IsValidFingerprint(fingerprint)) {
        misses_++;
        return std::nullopt;
    }

    fs::path path = EntryPath(fingerprint);
    std::string json;
    if (!ReadFile(path, &json)) {
        misses_++;
        Logger::Debug("Cache miss: ", fingerprint.substr(0, 8));
        return std::nullopt;
    }

    v1::CacheEntry entry;
    if (!ParseEntry(json, fingerprint, &entry)) {
        RemoveEntry(path);
        misses_++;
        Logger::Warn("Removed corrupt cache entry: ", fingerprint.substr(0, 8));
        return std::nullopt;
    }

    if (Now() > entry.expires_at()) {
        RemoveEntry(path);
        misses_++;
        Logger::Debug("Cache entry expired: ", fingerprint.substr(0, 8));
        return std::nullopt;
    }

    hits_++;
    Logger::Debug("Cache hit: ", fingerprint.substr(0, 8));

    const v1::CachedResult& stored = entry.result();
    ExecutionResult result;
    result.success = stored.success();
    result.stdout_text = stored.stdout_text();
    result.stderr_text = stored.stderr_text();
    result.elapsed_seconds = stored.elapsed_seconds();
    result.stdout_truncated = stored.stdout_truncated();
    result.stderr_truncated = stored.stderr_truncated();
    result.fingerprint = fingerprint;
    result.from_cache = true;
    return result;
}

bool ResultCache::Set(const std::string& fingerprint, const ExecutionResult& result,
                      std::optional<int64_t> ttl_seconds) {
    if (!IsValidFingerprint(fingerprint)) {
        Logger::Warn("Refusing to cache under malformed key");
        return false;
    }

    int64_t ttl = ttl_seconds.value_or(default_ttl_seconds_);
    if (ttl <= 0) ttl = default_ttl_seconds_;
    double now = Now();

    v1::CacheEntry entry;
    entry.set_fingerprint(fingerprint);
    entry.set_cached_at(now);
    entry.set_expires_at(now + static_cast<double>(ttl));
    entry.set_ttl_seconds(ttl);
    v1::CachedResult* stored = entry.mutable_result();
    stored->set_success(result.success);
    stored->set_stdout_text(result.stdout_text);
    stored->set_stderr_text(result.stderr_text);
    stored->set_elapsed_seconds(result.elapsed_seconds);
    stored->set_stdout_truncated(result.stdout_truncated);
    stored->set_stderr_truncated(result.stderr_truncated);

    std::string json;
    google::protobuf::util::JsonPrintOptions options;
    options.add_whitespace = true;
    options.always_print_primitive_fields = true;
    options.preserve_proto_field_names = true;
    auto status = google::protobuf::util::MessageToJsonString(entry, &json, options);
    if (!status.ok()) {
        Logger::Error("Failed to serialize cache entry: ", status.ToString());
        return false;
    }

    fs::path staging = fs::path(directory_) / (kStagingPrefix + RandomSuffix());
    {
        std::ofstream out(staging, std::ios::binary | std::ios::trunc);
        if (!out) {
            Logger::Error("Failed to open staging file in ", directory_);
            return false;
        }
        out << json;
        out.close();
        if (!out) {
            Logger::Error("Failed to write staging file ", staging.string());
            RemoveEntry(staging);
            return false;
        }
    }

    std::error_code ec;
    fs::rename(staging, EntryPath(fingerprint), ec);
    if (ec) {
        Logger::Error("Failed to publish cache entry ", fingerprint.substr(0, 8), ": ", ec.message());
        RemoveEntry(staging);
        return false;
    }

    writes_++;
    Logger::Debug("Cache stored: ", fingerprint.substr(0, 8), " ttl=", ttl, "s");
    EnforceSizeLimit();
    return true;
}

bool ResultCache::Invalidate(const std::string& fingerprint) {
    if (!IsValidFingerprint(fingerprint)) return false;
    bool removed = RemoveEntry(EntryPath(fingerprint));
    if (removed) Logger::Debug("Cache invalidated: ", fingerprint.substr(0, 8));
    return removed;
}

size_t ResultCache::CleanupExpired() {
    size_t removed = 0;
    double now = Now();

    for (const auto& file : ListEntries(directory_)) {
        std::string fingerprint = file.path.stem().string();
        std::string json;
        if (!ReadFile(file.path, &json)) continue;

        v1::CacheEntry entry;
        bool corrupt = !ParseEntry(json, fingerprint, &entry);
        if (corrupt || now > entry.expires_at()) {
            if (RemoveEntry(file.path)) removed++;
        }
    }

    if (removed > 0) {
        cleanups_++;
        Logger::Info("Cleaned up ", removed, " expired cache entries");
    }
    return removed;
}

size_t ResultCache::ClearAll() {
    size_t removed = 0;
    for (const auto& file : ListEntries(directory_)) {
        if (RemoveEntry(file.path)) removed++;
    }

    hits_ = 0;
    misses_ = 0;
    writes_ = 0;
    cleanups_ = 0;

    Logger::Info("Cache cleared: ", removed, " entries removed");
    return removed;
}

CacheStats ResultCache::Stats() const {
    CacheStats stats;
    stats.hits = hits_.load();
    stats.misses = misses_.load();
    stats.writes = writes_.load();
    stats.cleanups = cleanups_.load();

    uint64_t lookups = stats.hits + stats.misses;
    if (lookups > 0) {
        double rate = 100.0 * static_cast<double>(stats.hits) / static_cast<double>(lookups);
        stats.hit_rate_percent = std::round(rate * 100.0) / 100.0;
    }

    for (const auto& file : ListEntries(directory_)) {
        stats.total_entries++;
        stats.total_size_bytes += file.size;
    }
    stats.max_size_bytes = max_size_bytes_;
    stats.directory = directory_;
    return stats;
}

fs::path ResultCache::EntryPath(const std::string& fingerprint) const {
    return fs::path(directory_) / (fingerprint + kEntryExtension);
}

void ResultCache::EnforceSizeLimit() {
    std::vector<EntryFile> files = ListEntries(directory_);
    uint64_t total = 0;
    for (const auto& file : files) total += file.size;
    if (total <= max_size_bytes_) return;

    std::sort(files.begin(), files.end(), [](const EntryFile& a, const EntryFile& b) {
        return a.modified < b.modified;
    });

    const double target = static_cast<double>(max_size_bytes_) * 0.8;
    size_t removed = 0;
    for (const auto& file : files) {
        if (static_cast<double>(total) <= target) break;
        if (RemoveEntry(file.path)) {
            total -= file.size;
            removed++;
        }
    }
    if (removed > 0) {
        Logger::Info("Cache size limit reached, evicted ", removed, " oldest entries");
    }
}

double ResultCache::Now() const {
    if (clock_) return clock_();
    auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration<double>(since_epoch).count();
}

} // namespace execgate
