#include "src/server/config.h"
#include "src/server/logger.h"
#include "src/server/result_cache.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace execgate {

namespace {

std::string Lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string Trim(const std::string& text) {
    size_t begin = text.find_first_not_of(" \t");
    if (begin == std::string::npos) return "";
    size_t end = text.find_last_not_of(" \t");
    return text.substr(begin, end - begin + 1);
}

std::vector<std::string> SplitList(const std::string& value) {
    std::vector<std::string> items;
    std::stringstream stream(value);
    std::string item;
    while (std::getline(stream, item, ',')) {
        item = Trim(item);
        if (!item.empty()) items.push_back(item);
    }
    return items;
}

bool ParseBool(const std::string& value, bool* out) {
    std::string v = Lower(Trim(value));
    if (v == "true" || v == "1" || v == "yes" || v == "on") {
        *out = true;
        return true;
    }
    if (v == "false" || v == "0" || v == "no" || v == "off") {
        *out = false;
        return true;
    }
    return false;
}

bool ParseInt(const std::string& value, long long* out) {
    std::string v = Trim(value);
    if (v.empty()) return false;
    try {
        size_t consumed = 0;
        long long parsed = std::stoll(v, &consumed);
        if (consumed != v.size()) return false;
        *out = parsed;
        return true;
    } catch (const std::logic_error&) {
        return false;
    }
}

// ParseInt plus a range check, so that narrowing the result cannot wrap.
bool ParseIntIn(const std::string& value, long long minimum, long long maximum, long long* out) {
    return ParseInt(value, out) && *out >= minimum && *out <= maximum;
}

const long long kIntMin = std::numeric_limits<int>::min();
const long long kIntMax = std::numeric_limits<int>::max();
// Largest megabyte count whose byte size fits in 64 bits.
const long long kMaxMegabytes = static_cast<long long>(std::numeric_limits<uint64_t>::max() >> 20);
// (uid_t)-1 and (gid_t)-1 mean "unchanged" to setuid/setgid.
const long long kMaxId = static_cast<long long>(std::numeric_limits<uid_t>::max()) - 1;

bool ParseDouble(const std::string& value, double* out) {
    std::string v = Trim(value);
    if (v.empty()) return false;
    try {
        size_t consumed = 0;
        double parsed = std::stod(v, &consumed);
        if (consumed != v.size()) return false;
        *out = parsed;
        return true;
    } catch (const std::logic_error&) {
        return false;
    }
}

} // namespace

const std::vector<std::string>& KnownConfigNames() {
    static const std::vector<std::string> names = {
        "LISTEN_ADDRESS",
        "CODE_EXECUTION_ENABLED",
        "CODE_EXECUTION_TIMEOUT",
        "MAX_OUTPUT_LENGTH",
        "MAX_CODE_LENGTH",
        "MAX_CONCURRENT_EXECUTIONS",
        "PYTHON_EXECUTABLE",
        "SANDBOX_TEMP_ROOT",
        "SANDBOX_MEMORY_LIMIT_MB",
        "SANDBOX_MAX_PROCESSES",
        "SANDBOX_RUN_AS_UID",
        "SANDBOX_RUN_AS_GID",
        "CACHING_ENABLED",
        "CACHE_DIR",
        "MAX_CACHE_SIZE_MB",
        "CACHE_DEFAULT_TTL_HOURS",
        "DENYLIST_EXTRA_IMPORTS",
        "DENYLIST_EXTRA_FUNCTIONS",
        "DENYLIST_EXTRA_ATTRIBUTES",
        "LOG_LEVEL",
    };
    return names;
}

Config Config::FromEnv() {
    Config config;
    for (const auto& name : KnownConfigNames()) {
        if (const char* value = std::getenv(name.c_str())) {
            config.Set(name, value);
        }
    }
    return config;
}

bool Config::Set(const std::string& name, const std::string& value) {
    bool ok = true;
    long long number = 0;

    if (name == "LISTEN_ADDRESS") {
        listen_address = Trim(value);
    } else if (name == "CODE_EXECUTION_ENABLED") {
        ok = ParseBool(value, &code_execution_enabled);
    } else if (name == "CODE_EXECUTION_TIMEOUT") {
        ok = ParseIntIn(value, kIntMin, kIntMax, &number);
        if (ok) execution_timeout_seconds = static_cast<int>(number);
    } else if (name == "MAX_OUTPUT_LENGTH") {
        ok = ParseInt(value, &number) && number >= 0;
        if (ok) max_output_length = static_cast<size_t>(number);
    } else if (name == "MAX_CODE_LENGTH") {
        ok = ParseInt(value, &number) && number >= 0;
        if (ok) max_code_length = static_cast<size_t>(number);
    } else if (name == "MAX_CONCURRENT_EXECUTIONS") {
        ok = ParseIntIn(value, kIntMin, kIntMax, &number);
        if (ok) max_concurrent_executions = static_cast<int>(number);
    } else if (name == "PYTHON_EXECUTABLE") {
        python_executable = Trim(value);
    } else if (name == "SANDBOX_TEMP_ROOT") {
        sandbox_temp_root = Trim(value);
    } else if (name == "SANDBOX_MEMORY_LIMIT_MB") {
        ok = ParseIntIn(value, 0, kMaxMegabytes, &number);
        if (ok) sandbox_memory_limit_mb = static_cast<uint64_t>(number);
    } else if (name == "SANDBOX_MAX_PROCESSES") {
        ok = ParseInt(value, &number) && number >= 0;
        if (ok) sandbox_max_processes = static_cast<uint64_t>(number);
    } else if (name == "SANDBOX_RUN_AS_UID") {
        if (Trim(value).empty()) {
            sandbox_run_as_uid.reset();
        } else {
            ok = ParseIntIn(value, 0, kMaxId, &number);
            if (ok) sandbox_run_as_uid = static_cast<uid_t>(number);
        }
    } else if (name == "SANDBOX_RUN_AS_GID") {
        if (Trim(value).empty()) {
            sandbox_run_as_gid.reset();
        } else {
            ok = ParseIntIn(value, 0, kMaxId, &number);
            if (ok) sandbox_run_as_gid = static_cast<gid_t>(number);
        }
    } else if (name == "CACHING_ENABLED") {
        ok = ParseBool(value, &caching_enabled);
    } else if (name == "CACHE_DIR") {
        cache_dir = Trim(value);
    } else if (name == "MAX_CACHE_SIZE_MB") {
        ok = ParseIntIn(value, 0, kMaxMegabytes, &number);
        if (ok) max_cache_size_mb = static_cast<uint64_t>(number);
    } else if (name == "CACHE_DEFAULT_TTL_HOURS") {
        double hours = 0;
        ok = ParseDouble(value, &hours) && std::isfinite(hours);
        if (ok) cache_default_ttl_hours = hours;
    } else if (name == "DENYLIST_EXTRA_IMPORTS") {
        denylist_extra_imports = SplitList(value);
    } else if (name == "DENYLIST_EXTRA_FUNCTIONS") {
        denylist_extra_functions = SplitList(value);
    } else if (name == "DENYLIST_EXTRA_ATTRIBUTES") {
        denylist_extra_attributes = SplitList(value);
    } else if (name == "LOG_LEVEL") {
        log_level = Lower(Trim(value));
    } else {
        return false;
    }

    if (!ok) load_errors.push_back(name + " has an invalid value: '" + value + "'");
    return true;
}

bool Config::ApplyFlag(const std::string& flag) {
    if (flag.rfind("--", 0) != 0) return false;
    size_t eq = flag.find('=');
    if (eq == std::string::npos) return false;

    std::string name = flag.substr(2, eq - 2);
    std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) {
        return c == '-' ? '_' : static_cast<char>(std::toupper(c));
    });
    return Set(name, flag.substr(eq + 1));
}

std::vector<std::string> Config::Validate() const {
    std::vector<std::string> issues = load_errors;

    if (listen_address.empty()) issues.push_back("LISTEN_ADDRESS must not be empty");
    if (execution_timeout_seconds < 1 || execution_timeout_seconds > 60) {
        issues.push_back("CODE_EXECUTION_TIMEOUT should be between 1 and 60 seconds");
    }
    if (max_output_length < 1) issues.push_back("MAX_OUTPUT_LENGTH must be at least 1");
    if (max_code_length < 1) issues.push_back("MAX_CODE_LENGTH must be at least 1");
    if (max_concurrent_executions < 1) issues.push_back("MAX_CONCURRENT_EXECUTIONS must be at least 1");
    if (python_executable.empty()) issues.push_back("PYTHON_EXECUTABLE must not be empty");
    if (sandbox_temp_root.empty()) issues.push_back("SANDBOX_TEMP_ROOT must not be empty");
    if (caching_enabled) {
        if (cache_dir.empty()) issues.push_back("CACHE_DIR must not be empty when caching is enabled");
        if (max_cache_size_mb < 1) issues.push_back("MAX_CACHE_SIZE_MB must be at least 1");
        if (cache_default_ttl_hours <= 0) issues.push_back("CACHE_DEFAULT_TTL_HOURS must be positive");
    }
    LogLevel level;
    if (!Logger::ParseLevel(log_level, &level)) {
        issues.push_back("LOG_LEVEL must be one of debug, info, warn, error");
    }
    return issues;
}

SandboxOptions Config::ToSandboxOptions() const {
    SandboxOptions options;
    options.interpreter = python_executable;
    options.temp_root = sandbox_temp_root;
    options.max_output_length = max_output_length;
    options.limits.memory_bytes = static_cast<unsigned long>(sandbox_memory_limit_mb * 1024 * 1024);
    options.limits.max_processes = static_cast<unsigned long>(sandbox_max_processes);
    options.run_as_uid = sandbox_run_as_uid;
    options.run_as_gid = sandbox_run_as_gid;
    return options;
}

Denylist Config::ToDenylist() const {
    Denylist denylist;
    for (const auto& name : denylist_extra_imports) denylist.Add(Denylist::Category::kImport, name);
    for (const auto& name : denylist_extra_functions) denylist.Add(Denylist::Category::kFunction, name);
    for (const auto& name : denylist_extra_attributes) denylist.Add(Denylist::Category::kAttribute, name);
    return denylist;
}

int64_t Config::DefaultTtlSeconds() const {
    return TtlSecondsFromHours(cache_default_ttl_hours).value_or(0);
}

uint64_t Config::MaxCacheSizeBytes() const {
    return max_cache_size_mb * 1024 * 1024;
}

} // namespace execgate
