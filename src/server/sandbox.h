#pragma once

#include "src/server/execution_result.h"
#include "src/server/process.h"

#include <memory>
#include <optional>
#include <string>

namespace execgate {

struct SandboxOptions {
    std::string interpreter = "python3";
    std::string temp_root = "/tmp";
    size_t max_output_length = 10000;
    ResourceLimits limits;
    std::optional<uid_t> run_as_uid;
    std::optional<gid_t> run_as_gid;
};

extern const char kStdoutTruncationMarker[];
extern const char kStderrTruncationMarker[];

// How one language turns a source file into a running process.
class LanguageStrategy {
public:
    virtual ~LanguageStrategy() = default;
    virtual std::string GetLanguage() const = 0;
    virtual std::string GetSourceFileName() const = 0;
    // Runs source_file, which already exists inside working_directory.
    virtual ProcessResult Run(const std::string& working_directory, const std::string& source_file,
                              double timeout_seconds, size_t capture_bytes) = 0;
};

class PythonStrategy : public LanguageStrategy {
public:
    explicit PythonStrategy(SandboxOptions options);

    std::string GetLanguage() const override { return "python"; }
    std::string GetSourceFileName() const override { return "main.py"; }
    ProcessResult Run(const std::string& working_directory, const std::string& source_file,
                      double timeout_seconds, size_t capture_bytes) override;

private:
    std::vector<std::string> BuildEnvironment(const std::string& working_directory) const;

    SandboxOptions options_;
};

// Runs code that has already passed the analyzer. Each call gets its own
// working directory, removed on every exit path. Never throws.
class Sandbox {
public:
    // A null strategy selects PythonStrategy.
    explicit Sandbox(SandboxOptions options, std::unique_ptr<LanguageStrategy> strategy = nullptr);

    Sandbox(Sandbox&&) = default;
    Sandbox& operator=(Sandbox&&) = default;

    ExecutionResult Run(const std::string& source, double timeout_seconds) const;

    const SandboxOptions& options() const { return options_; }
    std::string language() const { return strategy_->GetLanguage(); }

private:
    ExecutionResult Execute(const std::string& source, double timeout_seconds) const;

    SandboxOptions options_;
    std::unique_ptr<LanguageStrategy> strategy_;
};

// Cuts `text` to at most `max_length` bytes without splitting a UTF-8
// sequence and appends `marker`. Returns true when cut.
bool TruncateOutput(std::string& text, size_t max_length, const char* marker);

std::string FormatSeconds(double seconds);

} // namespace execgate
