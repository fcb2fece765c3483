#pragma once

#include "src/server/sandbox.h"
#include "src/server/security_analyzer.h"

#include <sys/types.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace execgate {

struct Config {
    std::string listen_address = "0.0.0.0:50051";
    bool code_execution_enabled = true;
    int execution_timeout_seconds = 10;
    size_t max_output_length = 10000;
    size_t max_code_length = 50000;
    int max_concurrent_executions = 10;

    std::string python_executable = "python3";
    std::string sandbox_temp_root = "/tmp";
    uint64_t sandbox_memory_limit_mb = 256;
    uint64_t sandbox_max_processes = 250;
    std::optional<uid_t> sandbox_run_as_uid;
    std::optional<gid_t> sandbox_run_as_gid;

    bool caching_enabled = true;
    std::string cache_dir = "cache";
    uint64_t max_cache_size_mb = 100;
    double cache_default_ttl_hours = 24.0;

    std::vector<std::string> denylist_extra_imports;
    std::vector<std::string> denylist_extra_functions;
    std::vector<std::string> denylist_extra_attributes;

    std::string log_level = "info";

    // Values that could not be parsed; reported again by Validate().
    std::vector<std::string> load_errors;

    // Reads every known variable (LISTEN_ADDRESS, CODE_EXECUTION_TIMEOUT, ...)
    // from the process environment. Unset variables keep their defaults.
    static Config FromEnv();

    // Sets one option by its variable name. Returns false for unknown names;
    // malformed values are recorded in load_errors.
    bool Set(const std::string& name, const std::string& value);

    // "--cache-dir=/var/cache" is the same as CACHE_DIR=/var/cache.
    bool ApplyFlag(const std::string& flag);

    std::vector<std::string> Validate() const;

    SandboxOptions ToSandboxOptions() const;
    Denylist ToDenylist() const;
    int64_t DefaultTtlSeconds() const;
    uint64_t MaxCacheSizeBytes() const;
};

const std::vector<std::string>& KnownConfigNames();

} // namespace execgate
