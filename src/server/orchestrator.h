#pragma once

#include "src/server/execution_result.h"
#include "src/server/outcome_sink.h"
#include "src/server/result_cache.h"
#include "src/server/sandbox.h"
#include "src/server/security_analyzer.h"

#include <map>
#include <memory>
#include <optional>
#include <string>

namespace execgate {

struct CodeSubmission {
    std::string source;
    std::string language = "python";
    // Execution overrides. "timeout" (seconds) replaces the default timeout;
    // every entry takes part in the cache fingerprint.
    std::map<std::string, std::string> params;
};

struct OrchestratorSettings {
    double timeout_seconds = 10.0;
    size_t max_output_length = 10000;
};

// Single entry point for a submission: cache lookup, analysis, execution,
// write-through and outcome reporting.
class Orchestrator {
public:
    // An empty sandbox makes every non-empty submission answer "unavailable".
    // A null cache disables caching. `outcomes` may be null.
    Orchestrator(std::optional<Sandbox> sandbox,
                 std::shared_ptr<ResultCache> cache,
                 SecurityAnalyzer analyzer,
                 AsyncOutcomeDispatcher* outcomes,
                 OrchestratorSettings settings);

    ExecutionResult Submit(const CodeSubmission& submission, bool use_cache,
                           std::optional<int64_t> ttl_seconds = std::nullopt) const;

    bool available() const { return sandbox_.has_value(); }
    const std::shared_ptr<ResultCache>& cache() const { return cache_; }
    const OrchestratorSettings& settings() const { return settings_; }

private:
    ExecutionResult RunPipeline(const CodeSubmission& submission, bool use_cache,
                            std::optional<int64_t> ttl_seconds) const;
    double EffectiveTimeout(const CodeSubmission& submission) const;
    void Report(const CodeSubmission& submission, const ExecutionResult& result) const;

    std::optional<Sandbox> sandbox_;
    std::shared_ptr<ResultCache> cache_;
    SecurityAnalyzer analyzer_;
    AsyncOutcomeDispatcher* outcomes_;
    OrchestratorSettings settings_;
};

} // namespace execgate
