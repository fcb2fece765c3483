#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace execgate {

struct ExecutionOutcome {
    std::string source;
    std::string language;
    bool success = false;
    double elapsed_seconds = 0.0;
    std::string error_summary;
};

// Receives execution outcomes. Implementations may be slow or throw; they are
// only ever called from an AsyncOutcomeDispatcher worker.
class OutcomeSink {
public:
    virtual ~OutcomeSink() = default;
    virtual void Record(const ExecutionOutcome& outcome) = 0;
};

// Hands outcomes to a sink on a background thread. Post() never blocks on the
// sink; when the queue is full the outcome is dropped and counted.
class AsyncOutcomeDispatcher {
public:
    explicit AsyncOutcomeDispatcher(std::shared_ptr<OutcomeSink> sink, size_t capacity = 1024);
    ~AsyncOutcomeDispatcher();

    AsyncOutcomeDispatcher(const AsyncOutcomeDispatcher&) = delete;
    AsyncOutcomeDispatcher& operator=(const AsyncOutcomeDispatcher&) = delete;

    // Returns false if the outcome was dropped.
    bool Post(ExecutionOutcome outcome);

    // Blocks until every posted outcome has been handed to the sink.
    void WaitIdle();

    // Delivers what is queued, then joins the worker. Later posts are dropped.
    void Stop();

    uint64_t dropped() const { return dropped_.load(); }
    uint64_t delivered() const { return delivered_.load(); }
    uint64_t failed() const { return failed_.load(); }

private:
    void WorkerLoop();

    std::shared_ptr<OutcomeSink> sink_;
    const size_t capacity_;

    std::mutex mutex_;
    std::condition_variable work_cv_;
    std::condition_variable idle_cv_;
    std::queue<ExecutionOutcome> queue_;
    bool stopping_ = false;
    bool busy_ = false;

    std::atomic<uint64_t> dropped_{0};
    std::atomic<uint64_t> delivered_{0};
    std::atomic<uint64_t> failed_{0};
    std::thread worker_;
};

struct LanguageSnapshot {
    std::string language;
    uint64_t usage_count = 0;
    double success_rate = 0.0;
    double avg_execution_time_seconds = 0.0;
    std::map<std::string, uint64_t> error_categories;
};

struct LearningSnapshot {
    uint64_t total_executions = 0;
    uint64_t languages_used = 0;
    double overall_success_rate = 0.0;
    std::string most_used_language;
    std::vector<LanguageSnapshot> languages;
};

// In-memory aggregate of outcomes per language: usage, running success rate,
// running mean execution time and a coarse error classification.
class LearningStats : public OutcomeSink {
public:
    void Record(const ExecutionOutcome& outcome) override;
    LearningSnapshot Snapshot() const;

    // Maps an error text to syntax_error, name_error, import_error,
    // type_error, index_error, key_error, runtime_error or unknown.
    static std::string CategorizeError(const std::string& error_summary);

private:
    mutable std::mutex mutex_;
    std::map<std::string, LanguageSnapshot> languages_;
};

} // namespace execgate
