#include "src/server/outcome_sink.h"
#include "src/server/logger.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <exception>

namespace execgate {

AsyncOutcomeDispatcher::AsyncOutcomeDispatcher(std::shared_ptr<OutcomeSink> sink, size_t capacity)
    : sink_(std::move(sink)), capacity_(capacity == 0 ? 1 : capacity) {
    worker_ = std::thread([this]() { WorkerLoop(); });
}

AsyncOutcomeDispatcher::~AsyncOutcomeDispatcher() {
    Stop();
}

bool AsyncOutcomeDispatcher::Post(ExecutionOutcome outcome) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_ || queue_.size() >= capacity_) {
            dropped_++;
            Logger::Debug("Outcome dropped, queue full or stopped");
            return false;
        }
        queue_.push(std::move(outcome));
    }
    work_cv_.notify_one();
    return true;
}

void AsyncOutcomeDispatcher::WaitIdle() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this] { return queue_.empty() && !busy_; });
}

void AsyncOutcomeDispatcher::Stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    work_cv_.notify_all();
    if (worker_.joinable()) worker_.join();
}

void AsyncOutcomeDispatcher::WorkerLoop() {
    while (true) {
        ExecutionOutcome outcome;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            work_cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) break;  // stopping and drained
            outcome = std::move(queue_.front());
            queue_.pop();
            busy_ = true;
        }

        try {
            if (sink_) sink_->Record(outcome);
            delivered_++;
        } catch (const std::exception& e) {
            failed_++;
            Logger::Warn("Outcome sink failed: ", e.what());
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            busy_ = false;
        }
        idle_cv_.notify_all();
    }
    idle_cv_.notify_all();
}

void LearningStats::Record(const ExecutionOutcome& outcome) {
    std::lock_guard<std::mutex> lock(mutex_);
    LanguageSnapshot& stats = languages_[outcome.language];
    stats.language = outcome.language;
    stats.usage_count++;

    const double n = static_cast<double>(stats.usage_count);
    stats.success_rate = (stats.success_rate * (n - 1) + (outcome.success ? 1.0 : 0.0)) / n;
    stats.avg_execution_time_seconds = (stats.avg_execution_time_seconds * (n - 1) + outcome.elapsed_seconds) / n;

    if (!outcome.success && !outcome.error_summary.empty()) {
        stats.error_categories[CategorizeError(outcome.error_summary)]++;
    }
}

LearningSnapshot LearningStats::Snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    LearningSnapshot snapshot;
    double weighted_success = 0.0;
    uint64_t most_used_count = 0;

    for (const auto& [language, stats] : languages_) {
        snapshot.total_executions += stats.usage_count;
        weighted_success += stats.success_rate * static_cast<double>(stats.usage_count);
        if (stats.usage_count > most_used_count) {
            most_used_count = stats.usage_count;
            snapshot.most_used_language = language;
        }
        snapshot.languages.push_back(stats);
    }
    snapshot.languages_used = languages_.size();
    if (snapshot.total_executions > 0) {
        double rate = weighted_success / static_cast<double>(snapshot.total_executions);
        snapshot.overall_success_rate = std::round(rate * 1000.0) / 1000.0;
    }
    return snapshot;
}

std::string LearningStats::CategorizeError(const std::string& error_summary) {
    if (error_summary.empty()) return "unknown";

    std::string text = error_summary;
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    auto contains = [&text](const char* needle) { return text.find(needle) != std::string::npos; };

    if (contains("syntax")) return "syntax_error";
    if (contains("name") && contains("not defined")) return "name_error";
    if (contains("import") || contains("module")) return "import_error";
    if (contains("type")) return "type_error";
    if (contains("index")) return "index_error";
    if (contains("key")) return "key_error";
    return "runtime_error";
}

} // namespace execgate
