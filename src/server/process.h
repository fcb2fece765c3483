#pragma once

#include <sys/types.h>

#include <optional>
#include <string>
#include <vector>

namespace execgate {

struct ResourceLimits {
    unsigned long cpu_time_seconds = 11;               // Wall timeout plus a grace second
    unsigned long memory_bytes = 256UL * 1024 * 1024;  // 0 = unlimited
    unsigned long max_processes = 250;                 // 0 = unlimited
    unsigned long max_file_bytes = 16UL * 1024 * 1024; // Largest file the child may write
};

struct ProcessSpec {
    std::vector<std::string> argv;  // argv[0] is resolved against PATH by Run()
    std::vector<std::string> env;   // Complete child environment, "KEY=VALUE"
    std::string working_directory;
    double timeout_seconds = 10.0;
    size_t capture_bytes = 10001;   // Per stream; the rest is read and discarded
    ResourceLimits limits;
    std::optional<uid_t> run_as_uid;
    std::optional<gid_t> run_as_gid;
};

struct ProcessResult {
    bool started = false;
    bool timed_out = false;
    int exit_code = -1;
    int term_signal = 0;
    double elapsed_seconds = 0.0;
    std::string stdout_text;
    std::string stderr_text;
    bool stdout_overflow = false;
    bool stderr_overflow = false;
    std::string error_message;  // For the log, not for callers
};

class Process {
public:
    static std::string CreateTempDirectory(const std::string& root);
    static bool RemoveDirectory(const std::string& path);
    static bool WriteFile(const std::string& path, const std::string& content);

    // Returns the absolute path of an executable, or "" when none is found.
    static std::string ResolveExecutable(const std::string& name);

    // Runs the command in its own process group and waits for it, killing
    // the whole group at the deadline. The group is also killed after a
    // normal exit so nothing the child spawned outlives the call.
    static ProcessResult Run(const ProcessSpec& spec);
};

} // namespace execgate
