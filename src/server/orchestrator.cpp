#include "src/server/orchestrator.h"
#include "src/server/logger.h"

#include <exception>
#include <stdexcept>

namespace execgate {

namespace {

const char kEmptySubmissionMessage[] = "No code provided for execution";
const char kUnavailableMessage[] = "Code execution is currently unavailable";
const char kInternalErrorMessage[] = "Execution error: internal failure";

bool IsBlank(const std::string& text) {
    return text.find_first_not_of(" \t\n\r\f\v") == std::string::npos;
}

std::string JoinIssues(const std::vector<std::string>& issues) {
    std::string joined;
    for (size_t i = 0; i < issues.size(); ++i) {
        if (i > 0) joined += "; ";
        joined += issues[i];
    }
    return joined;
}

bool ParseSeconds(const std::string& text, double* seconds) {
    try {
        size_t consumed = 0;
        double value = std::stod(text, &consumed);
        if (consumed != text.size()) return false;
        *seconds = value;
        return true;
    } catch (const std::logic_error&) {
        return false;
    }
}

ExecutionResult Failure(ErrorKind kind, const std::string& message) {
    ExecutionResult result;
    result.success = false;
    result.stderr_text = message;
    result.error_kind = kind;
    return result;
}

} // namespace

Orchestrator::Orchestrator(std::optional<Sandbox> sandbox,
                           std::shared_ptr<ResultCache> cache,
                           SecurityAnalyzer analyzer,
                           AsyncOutcomeDispatcher* outcomes,
                           OrchestratorSettings settings)
    : sandbox_(std::move(sandbox)),
      cache_(std::move(cache)),
      analyzer_(std::move(analyzer)),
      outcomes_(outcomes),
      settings_(settings) {}

ExecutionResult Orchestrator::Submit(const CodeSubmission& submission, bool use_cache,
                                     std::optional<int64_t> ttl_seconds) const {
    try {
        return RunPipeline(submission, use_cache, ttl_seconds);
    } catch (const std::exception& e) {
        Logger::Error("Submission failed unexpectedly: ", e.what());
        return Failure(ErrorKind::kInfrastructure, kInternalErrorMessage);
    }
}

ExecutionResult Orchestrator::RunPipeline(const CodeSubmission& submission, bool use_cache,
                                      std::optional<int64_t> ttl_seconds) const {
    if (IsBlank(submission.source)) {
        return Failure(ErrorKind::kEmptySubmission, kEmptySubmissionMessage);
    }
    if (!sandbox_) {
        return Failure(ErrorKind::kUnavailable, kUnavailableMessage);
    }

    const double timeout = EffectiveTimeout(submission);
    ResultCache::Params params = submission.params;
    params["timeout"] = FormatSeconds(timeout);
    params["max_output_length"] = std::to_string(settings_.max_output_length);
    const std::string fingerprint = ResultCache::Fingerprint(submission.source, submission.language, params);

    const bool caching = use_cache && cache_ != nullptr;
    if (caching) {
        if (auto cached = cache_->Get(fingerprint)) {
            Logger::Debug("Serving cached result for ", fingerprint.substr(0, 8));
            return *cached;
        }
    }

    AnalysisReport report = analyzer_.Analyze(submission.source);
    if (!report.safe) {
        Logger::Info("Rejected submission ", fingerprint.substr(0, 8), ": ", report.issues.size(), " issue(s)");
        ExecutionResult result = Failure(ErrorKind::kRejectedUnsafe, "Security warning: " + JoinIssues(report.issues));
        result.issues = std::move(report.issues);
        result.fingerprint = fingerprint;
        Report(submission, result);
        return result;
    }
    Logger::Debug("Submission ", fingerprint.substr(0, 8), " passed analysis, complexity ", report.complexity_score);

    ExecutionResult result = sandbox_->Run(submission.source, timeout);
    result.fingerprint = fingerprint;
    result.from_cache = false;

    // The sandbox normally truncates already; the flags prevent a second marker.
    if (!result.stdout_truncated) {
        result.stdout_truncated = TruncateOutput(result.stdout_text, settings_.max_output_length, kStdoutTruncationMarker);
    }
    if (!result.stderr_truncated) {
        result.stderr_truncated = TruncateOutput(result.stderr_text, settings_.max_output_length, kStderrTruncationMarker);
    }

    if (result.success && caching) {
        cache_->Set(fingerprint, result, ttl_seconds);
    }

    Report(submission, result);
    return result;
}

double Orchestrator::EffectiveTimeout(const CodeSubmission& submission) const {
    auto it = submission.params.find("timeout");
    if (it == submission.params.end()) return settings_.timeout_seconds;

    double value = 0.0;
    if (ParseSeconds(it->second, &value) && value > 0 && value <= 60) return value;
    Logger::Warn("Ignoring invalid timeout override '", it->second, "'");
    return settings_.timeout_seconds;
}

void Orchestrator::Report(const CodeSubmission& submission, const ExecutionResult& result) const {
    if (!outcomes_) return;
    ExecutionOutcome outcome;
    outcome.source = submission.source;
    outcome.language = submission.language;
    outcome.success = result.success;
    outcome.elapsed_seconds = result.elapsed_seconds;
    if (!result.success) outcome.error_summary = result.stderr_text;
    outcomes_->Post(std::move(outcome));
}

} // namespace execgate
