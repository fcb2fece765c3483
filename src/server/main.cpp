#include <atomic>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include <grpcpp/grpcpp.h>
#include <pybind11/embed.h>
#include "proto/execgate.grpc.pb.h"
#include "src/server/config.h"
#include "src/server/logger.h"
#include "src/server/orchestrator.h"
#include "src/server/outcome_sink.h"
#include "src/server/result_cache.h"
#include "src/server/sandbox.h"
#include "src/server/security_analyzer.h"

using grpc::CallbackServerContext;
using grpc::Server;
using grpc::ServerBuilder;
using grpc::ServerUnaryReactor;
using grpc::Status;
using grpc::StatusCode;
using execgate::AsyncOutcomeDispatcher;
using execgate::CodeSubmission;
using execgate::Config;
using execgate::ExecutionResult;
using execgate::LearningStats;
using execgate::Logger;
using execgate::LogLevel;
using execgate::Orchestrator;
using execgate::ResultCache;
using execgate::Sandbox;

namespace v1 = execgate::v1;

namespace {

constexpr double kBytesPerMb = 1024.0 * 1024.0;

v1::ErrorKind ToProto(execgate::ErrorKind kind) {
    switch (kind) {
        case execgate::ErrorKind::kNone: return v1::ERROR_KIND_NONE;
        case execgate::ErrorKind::kEmptySubmission: return v1::ERROR_KIND_EMPTY_SUBMISSION;
        case execgate::ErrorKind::kRejectedUnsafe: return v1::ERROR_KIND_REJECTED_UNSAFE;
        case execgate::ErrorKind::kTimeout: return v1::ERROR_KIND_TIMEOUT;
        case execgate::ErrorKind::kRuntimeFailure: return v1::ERROR_KIND_RUNTIME_FAILURE;
        case execgate::ErrorKind::kInfrastructure: return v1::ERROR_KIND_INFRASTRUCTURE;
        case execgate::ErrorKind::kUnavailable: return v1::ERROR_KIND_UNAVAILABLE;
    }
    return v1::ERROR_KIND_INFRASTRUCTURE;
}

void FillResponse(const ExecutionResult& result, v1::ExecuteResponse* response) {
    response->set_success(result.success);
    response->set_output(result.stdout_text);
    response->set_error(result.stderr_text);
    response->set_execution_time_seconds(result.elapsed_seconds);
    response->set_from_cache(result.from_cache);
    if (!result.fingerprint.empty()) response->set_cache_key_prefix(result.fingerprint.substr(0, 8));
    for (const auto& issue : result.issues) response->add_security_issues(issue);
    response->set_error_kind(ToProto(result.error_kind));
}

ServerUnaryReactor* FinishNow(CallbackServerContext* context, const Status& status) {
    ServerUnaryReactor* reactor = context->DefaultReactor();
    reactor->Finish(status);
    return reactor;
}

} // namespace

class CodeExecutorServiceImpl final : public v1::CodeExecutor::CallbackService {
public:
    CodeExecutorServiceImpl(const Config& config, const Orchestrator& orchestrator,
                            std::shared_ptr<LearningStats> learning, const AsyncOutcomeDispatcher& dispatcher)
        : config_(config), orchestrator_(orchestrator), learning_(std::move(learning)),
          dispatcher_(dispatcher), active_executions_(0) {}

    ServerUnaryReactor* Execute(CallbackServerContext* context, const v1::ExecuteRequest* request,
                                v1::ExecuteResponse* response) override {
        if (request->code().size() > config_.max_code_length) {
            Logger::Warn("Rejecting submission of ", request->code().size(), " bytes");
            return FinishNow(context, Status(StatusCode::INVALID_ARGUMENT,
                "Code exceeds the maximum length of " + std::to_string(config_.max_code_length) + " characters"));
        }

        int active = active_executions_.fetch_add(1);
        Logger::Info("Received Execute request. Active executions: ", active + 1);
        if (active >= config_.max_concurrent_executions) {
            active_executions_.fetch_sub(1);
            Logger::Warn("Too many active executions. Rejecting request.");
            return FinishNow(context, Status(StatusCode::RESOURCE_EXHAUSTED, "Too many active executions"));
        }

        class ExecuteReactor : public ServerUnaryReactor {
        public:
            ExecuteReactor(const Orchestrator& orchestrator, const v1::ExecuteRequest* request,
                           v1::ExecuteResponse* response, std::atomic<int>& counter)
                : counter_(counter) {
                std::lock_guard<std::mutex> lock(mutex_);
                // The submission runs on its own thread so a slow child never
                // holds a gRPC callback thread.
                worker_thread_ = std::thread([this, &orchestrator, request, response]() {
                    CodeSubmission submission;
                    submission.source = request->code();
                    std::optional<int64_t> ttl_seconds;
                    if (request->has_cache_ttl_hours()) {
                        ttl_seconds = execgate::TtlSecondsFromHours(request->cache_ttl_hours());
                    }

                    ExecutionResult result = orchestrator.Submit(submission, request->use_cache(), ttl_seconds);
                    FillResponse(result, response);
                    Logger::Info("Execution finished: success=", result.success,
                                 " kind=", execgate::ErrorKindName(result.error_kind),
                                 " from_cache=", result.from_cache);
                    Finish(Status::OK);
                });
            }

            void OnDone() override {
                std::unique_lock<std::mutex> lock(mutex_);
                if (worker_thread_.joinable()) {
                    if (worker_thread_.get_id() == std::this_thread::get_id()) {
                        worker_thread_.detach();
                    } else {
                        worker_thread_.join();
                    }
                }
                lock.unlock();
                counter_.fetch_sub(1);
                delete this;
            }

            void OnCancel() override {
                Logger::Warn("Execute RPC cancelled by client; the run continues until its timeout.");
            }

        private:
            std::mutex mutex_;  // Guards worker_thread_ against an early OnDone
            std::thread worker_thread_;
            std::atomic<int>& counter_;
        };

        return new ExecuteReactor(orchestrator_, request, response, active_executions_);
    }

    ServerUnaryReactor* GetCacheStats(CallbackServerContext* context, const v1::CacheStatsRequest*,
                                      v1::CacheStatsResponse* response) override {
        const auto& cache = orchestrator_.cache();
        if (!cache) return CachingDisabled(context);

        execgate::CacheStats stats = cache->Stats();
        response->set_hits(stats.hits);
        response->set_misses(stats.misses);
        response->set_writes(stats.writes);
        response->set_cleanups(stats.cleanups);
        response->set_hit_rate_percent(stats.hit_rate_percent);
        response->set_total_entries(stats.total_entries);
        response->set_total_size_mb(static_cast<double>(stats.total_size_bytes) / kBytesPerMb);
        response->set_max_size_mb(static_cast<double>(stats.max_size_bytes) / kBytesPerMb);
        response->set_cache_directory(stats.directory);
        return FinishNow(context, Status::OK);
    }

    ServerUnaryReactor* ClearCache(CallbackServerContext* context, const v1::ClearCacheRequest*,
                                   v1::ClearCacheResponse* response) override {
        const auto& cache = orchestrator_.cache();
        if (!cache) return CachingDisabled(context);
        response->set_cleared_count(cache->ClearAll());
        return FinishNow(context, Status::OK);
    }

    ServerUnaryReactor* CleanupCache(CallbackServerContext* context, const v1::CleanupCacheRequest*,
                                     v1::CleanupCacheResponse* response) override {
        const auto& cache = orchestrator_.cache();
        if (!cache) return CachingDisabled(context);
        response->set_removed_count(cache->CleanupExpired());
        return FinishNow(context, Status::OK);
    }

    ServerUnaryReactor* InvalidateCache(CallbackServerContext* context, const v1::InvalidateCacheRequest* request,
                                        v1::InvalidateCacheResponse* response) override {
        const auto& cache = orchestrator_.cache();
        if (!cache) return CachingDisabled(context);
        response->set_found(cache->Invalidate(request->cache_key()));
        return FinishNow(context, Status::OK);
    }

    ServerUnaryReactor* GetCacheConfig(CallbackServerContext* context, const v1::CacheConfigRequest*,
                                       v1::CacheConfigResponse* response) override {
        const auto& cache = orchestrator_.cache();
        response->set_caching_enabled(cache != nullptr);
        if (cache) {
            response->set_cache_directory(cache->directory());
            response->set_max_cache_size_mb(static_cast<double>(cache->max_size_bytes()) / kBytesPerMb);
            response->set_default_ttl_hours(static_cast<double>(cache->default_ttl_seconds()) / 3600.0);
        }
        return FinishNow(context, Status::OK);
    }

    ServerUnaryReactor* GetLearningStats(CallbackServerContext* context, const v1::LearningStatsRequest*,
                                         v1::LearningStatsResponse* response) override {
        execgate::LearningSnapshot snapshot = learning_->Snapshot();
        response->set_total_executions(snapshot.total_executions);
        response->set_languages_used(snapshot.languages_used);
        response->set_overall_success_rate(snapshot.overall_success_rate);
        response->set_most_used_language(snapshot.most_used_language);
        for (const auto& language : snapshot.languages) {
            v1::LanguageStats* stats = response->add_languages();
            stats->set_language(language.language);
            stats->set_usage_count(language.usage_count);
            stats->set_success_rate(language.success_rate);
            stats->set_avg_execution_time_seconds(language.avg_execution_time_seconds);
            for (const auto& [category, count] : language.error_categories) {
                (*stats->mutable_error_categories())[category] = count;
            }
        }
        response->set_dropped_outcomes(dispatcher_.dropped());
        return FinishNow(context, Status::OK);
    }

private:
    static ServerUnaryReactor* CachingDisabled(CallbackServerContext* context) {
        return FinishNow(context, Status(StatusCode::FAILED_PRECONDITION, "Caching is disabled"));
    }

    const Config& config_;
    const Orchestrator& orchestrator_;
    std::shared_ptr<LearningStats> learning_;
    const AsyncOutcomeDispatcher& dispatcher_;
    std::atomic<int> active_executions_;
};

void PrintUsage(const char* program) {
    std::cout << "Usage: " << program << " [--name=value ...]\n"
              << "Every option is also read from the environment variable of the same name\n"
              << "(--cache-dir=x is CACHE_DIR=x). Known options:\n";
    for (const auto& name : execgate::KnownConfigNames()) std::cout << "  " << name << "\n";
}

int RunServer(const Config& config) {
    std::shared_ptr<ResultCache> cache;
    if (config.caching_enabled) {
        cache = std::make_shared<ResultCache>(config.cache_dir, config.MaxCacheSizeBytes(),
                                              config.DefaultTtlSeconds());
    } else {
        Logger::Info("Result caching disabled");
    }

    std::optional<Sandbox> sandbox;
    if (config.code_execution_enabled) {
        sandbox.emplace(config.ToSandboxOptions());
        Logger::Info("Sandbox ready: ", sandbox->language(), " via ", sandbox->options().interpreter);
    } else {
        Logger::Warn("Code execution disabled; Execute will report the service as unavailable");
    }

    auto learning = std::make_shared<LearningStats>();
    AsyncOutcomeDispatcher dispatcher(learning);

    execgate::OrchestratorSettings settings;
    settings.timeout_seconds = config.execution_timeout_seconds;
    settings.max_output_length = config.max_output_length;
    Orchestrator orchestrator(std::move(sandbox), cache, execgate::SecurityAnalyzer(config.ToDenylist()),
                              &dispatcher, settings);

    Logger::Info("Execution timeout ", orchestrator.settings().timeout_seconds, "s, output limit ",
                 orchestrator.settings().max_output_length, " bytes");

    CodeExecutorServiceImpl service(config, orchestrator, learning, dispatcher);

    ServerBuilder builder;
    builder.AddListeningPort(config.listen_address, grpc::InsecureServerCredentials());
    builder.RegisterService(&service);
    std::unique_ptr<Server> server(builder.BuildAndStart());
    if (!server) {
        Logger::Error("Failed to start server on ", config.listen_address);
        return 1;
    }
    Logger::Info("Server listening on ", config.listen_address);
    server->Wait();
    return 0;
}

int main(int argc, char** argv) {
    Config config = Config::FromEnv();
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            PrintUsage(argv[0]);
            return 0;
        }
        if (!config.ApplyFlag(arg)) {
            std::cerr << "Unknown option: " << arg << "\n";
            PrintUsage(argv[0]);
            return 2;
        }
    }

    LogLevel level = LogLevel::INFO;
    if (Logger::ParseLevel(config.log_level, &level)) Logger::SetLevel(level);

    std::vector<std::string> issues = config.Validate();
    if (!issues.empty()) {
        for (const auto& issue : issues) Logger::Error("Configuration: ", issue);
        return 1;
    }

    // The analyzer parses with the embedded interpreter. Python's own signal
    // handlers stay off so SIGINT still stops the server.
    pybind11::scoped_interpreter python(false);
    pybind11::gil_scoped_release released;
    return RunServer(config);
}
