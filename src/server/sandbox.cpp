#include "src/server/sandbox.h"
#include "src/server/logger.h"

#include <cmath>
#include <cstdlib>
#include <exception>
#include <sstream>

namespace execgate {

const char kStdoutTruncationMarker[] = "\n... (output truncated)";
const char kStderrTruncationMarker[] = "\n... (error output truncated)";

namespace {

const char kStartFailureMessage[] = "Execution error: could not start the interpreter";

// Variables copied from the server environment into the child.
const char* const kPassThroughEnvironment[] = {"PATH", "LANG"};

class TempDirectoryGuard {
public:
    explicit TempDirectoryGuard(std::string path) : path_(std::move(path)) {}
    ~TempDirectoryGuard() {
        if (!path_.empty()) Process::RemoveDirectory(path_);
    }
    TempDirectoryGuard(const TempDirectoryGuard&) = delete;
    TempDirectoryGuard& operator=(const TempDirectoryGuard&) = delete;

private:
    std::string path_;
};

ExecutionResult InfrastructureFailure() {
    ExecutionResult result;
    result.success = false;
    result.stderr_text = kStartFailureMessage;
    result.error_kind = ErrorKind::kInfrastructure;
    return result;
}

double RoundMillis(double seconds) {
    return std::round(seconds * 1000.0) / 1000.0;
}

} // namespace

bool TruncateOutput(std::string& text, size_t max_length, const char* marker) {
    if (text.size() <= max_length) return false;
    // Back off to a code point boundary; a UTF-8 sequence is at most 4 bytes.
    size_t cut = max_length;
    size_t floor = max_length >= 3 ? max_length - 3 : 0;
    while (cut > floor && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) --cut;
    text.resize(cut);
    text += marker;
    return true;
}

std::string FormatSeconds(double seconds) {
    std::ostringstream out;
    if (seconds == std::floor(seconds)) {
        out << static_cast<long long>(seconds);
    } else {
        out << seconds;
    }
    return out.str();
}

PythonStrategy::PythonStrategy(SandboxOptions options) : options_(std::move(options)) {}

ProcessResult PythonStrategy::Run(const std::string& working_directory, const std::string& source_file,
                                  double timeout_seconds, size_t capture_bytes) {
    ProcessSpec spec;
    // -I: isolated mode, no user site-packages or PYTHON* variables. -B: no .pyc files.
    spec.argv = {options_.interpreter, "-I", "-B", source_file};
    spec.env = BuildEnvironment(working_directory);
    spec.working_directory = working_directory;
    spec.timeout_seconds = timeout_seconds;
    spec.capture_bytes = capture_bytes;
    spec.limits = options_.limits;
    spec.limits.cpu_time_seconds = static_cast<unsigned long>(std::ceil(timeout_seconds)) + 1;
    spec.run_as_uid = options_.run_as_uid;
    spec.run_as_gid = options_.run_as_gid;
    return Process::Run(spec);
}

std::vector<std::string> PythonStrategy::BuildEnvironment(const std::string& working_directory) const {
    std::vector<std::string> env;
    for (const char* name : kPassThroughEnvironment) {
        const char* value = std::getenv(name);
        if (value) env.push_back(std::string(name) + "=" + value);
    }
    env.push_back("HOME=" + working_directory);
    env.push_back("PYTHONIOENCODING=utf-8");
    env.push_back("PYTHONDONTWRITEBYTECODE=1");
    return env;
}

Sandbox::Sandbox(SandboxOptions options, std::unique_ptr<LanguageStrategy> strategy)
    : options_(std::move(options)), strategy_(std::move(strategy)) {
    if (!strategy_) strategy_ = std::make_unique<PythonStrategy>(options_);
}

ExecutionResult Sandbox::Run(const std::string& source, double timeout_seconds) const {
    try {
        return Execute(source, timeout_seconds);
    } catch (const std::exception& e) {
        Logger::Error("Sandbox run failed: ", e.what());
        return InfrastructureFailure();
    }
}

ExecutionResult Sandbox::Execute(const std::string& source, double timeout_seconds) const {
    std::string workdir = Process::CreateTempDirectory(options_.temp_root);
    if (workdir.empty()) return InfrastructureFailure();
    TempDirectoryGuard guard(workdir);

    const std::string file_name = strategy_->GetSourceFileName();
    if (!Process::WriteFile(workdir + "/" + file_name, source)) return InfrastructureFailure();

    ProcessResult process = strategy_->Run(workdir, file_name, timeout_seconds, options_.max_output_length + 1);
    if (!process.started) {
        Logger::Error("Failed to start ", strategy_->GetLanguage(), " process: ", process.error_message);
        return InfrastructureFailure();
    }

    ExecutionResult result;
    if (process.timed_out) {
        Logger::Warn("Execution timed out after ", FormatSeconds(timeout_seconds), "s");
        result.success = false;
        result.elapsed_seconds = timeout_seconds;
        result.stderr_text = "Execution timed out after " + FormatSeconds(timeout_seconds) + " seconds";
        result.error_kind = ErrorKind::kTimeout;
        return result;
    }
    if (!process.error_message.empty()) {
        Logger::Error("Lost track of ", strategy_->GetLanguage(), " process: ", process.error_message);
        return InfrastructureFailure();
    }

    if (process.stdout_overflow || process.stderr_overflow) {
        Logger::Debug("Child output exceeded ", options_.max_output_length, " bytes; excess discarded");
    }
    result.stdout_text = std::move(process.stdout_text);
    result.stderr_text = std::move(process.stderr_text);
    result.stdout_truncated = TruncateOutput(result.stdout_text, options_.max_output_length, kStdoutTruncationMarker);
    result.stderr_truncated = TruncateOutput(result.stderr_text, options_.max_output_length, kStderrTruncationMarker);
    result.elapsed_seconds = RoundMillis(process.elapsed_seconds);
    result.success = process.exit_code == 0 && process.term_signal == 0;

    if (!result.success) {
        result.error_kind = ErrorKind::kRuntimeFailure;
        if (result.stderr_text.empty()) {
            result.stderr_text = process.term_signal != 0
                ? "Process terminated by signal " + std::to_string(process.term_signal)
                : "Process exited with non-zero status " + std::to_string(process.exit_code);
        }
    }
    Logger::Debug("Execution finished: exit=", process.exit_code, " elapsed=", result.elapsed_seconds, "s");
    return result;
}

} // namespace execgate
