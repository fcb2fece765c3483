#include <chrono>
#include <cmath>
#include <condition_variable>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>

#include "src/server/outcome_sink.h"
#include "tests/test_harness.h"

using execgate::AsyncOutcomeDispatcher;
using execgate::ExecutionOutcome;
using execgate::LanguageSnapshot;
using execgate::LearningSnapshot;
using execgate::LearningStats;
using execgate::OutcomeSink;
using execgate_test::expect;
using execgate_test::run_test;

namespace {

ExecutionOutcome Outcome(const std::string& language, bool success, double elapsed,
                         const std::string& error = "") {
    ExecutionOutcome outcome;
    outcome.source = "print(1)";
    outcome.language = language;
    outcome.success = success;
    outcome.elapsed_seconds = elapsed;
    outcome.error_summary = error;
    return outcome;
}

class ThrowingSink : public OutcomeSink {
public:
    void Record(const ExecutionOutcome&) override { throw std::runtime_error("sink unavailable"); }
};

// Holds the worker inside Record() until released.
class GatedSink : public OutcomeSink {
public:
    void Record(const ExecutionOutcome&) override {
        std::unique_lock<std::mutex> lock(mutex_);
        entered_ = true;
        entered_cv_.notify_all();
        release_cv_.wait(lock, [this] { return released_; });
        recorded_++;
    }
    void WaitEntered() {
        std::unique_lock<std::mutex> lock(mutex_);
        entered_cv_.wait(lock, [this] { return entered_; });
    }
    void Release() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            released_ = true;
        }
        release_cv_.notify_all();
    }
    int recorded() {
        std::lock_guard<std::mutex> lock(mutex_);
        return recorded_;
    }

private:
    std::mutex mutex_;
    std::condition_variable entered_cv_;
    std::condition_variable release_cv_;
    bool entered_ = false;
    bool released_ = false;
    int recorded_ = 0;
};

const LanguageSnapshot* Find(const LearningSnapshot& snapshot, const std::string& language) {
    for (const auto& entry : snapshot.languages) {
        if (entry.language == language) return &entry;
    }
    return nullptr;
}

void test_delivers_to_sink() {
    auto stats = std::make_shared<LearningStats>();
    AsyncOutcomeDispatcher dispatcher(stats);
    expect(dispatcher.Post(Outcome("python", true, 0.5)), "post accepted");
    expect(dispatcher.Post(Outcome("python", false, 1.5, "boom")), "second post accepted");
    dispatcher.WaitIdle();
    expect(dispatcher.delivered() == 2, "both delivered");
    expect(stats->Snapshot().total_executions == 2, "sink saw both outcomes");
}

void test_throwing_sink_is_contained() {
    AsyncOutcomeDispatcher dispatcher(std::make_shared<ThrowingSink>());
    expect(dispatcher.Post(Outcome("python", true, 0.1)), "post accepted");
    expect(dispatcher.Post(Outcome("python", true, 0.1)), "post after failure accepted");
    dispatcher.WaitIdle();
    expect(dispatcher.failed() == 2, "failures counted");
    expect(dispatcher.delivered() == 0, "nothing delivered");
}

void test_full_queue_drops() {
    auto gate = std::make_shared<GatedSink>();
    AsyncOutcomeDispatcher dispatcher(gate, 2);

    expect(dispatcher.Post(Outcome("python", true, 0.1)), "first post taken by the worker");
    gate->WaitEntered();
    expect(dispatcher.Post(Outcome("python", true, 0.1)), "queue slot one");
    expect(dispatcher.Post(Outcome("python", true, 0.1)), "queue slot two");

    auto start = std::chrono::steady_clock::now();
    expect(!dispatcher.Post(Outcome("python", true, 0.1)), "overflow dropped");
    double waited = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    expect(waited < 1.0, "post does not wait for the sink");
    expect(dispatcher.dropped() == 1, "drop counted");

    gate->Release();
    dispatcher.WaitIdle();
    expect(gate->recorded() == 3, "queued outcomes delivered after release");
}

void test_stop_drains_then_rejects() {
    auto stats = std::make_shared<LearningStats>();
    AsyncOutcomeDispatcher dispatcher(stats);
    for (int i = 0; i < 50; ++i) dispatcher.Post(Outcome("python", true, 0.01));
    dispatcher.Stop();
    expect(stats->Snapshot().total_executions == 50, "queued outcomes delivered before stop returns");
    expect(!dispatcher.Post(Outcome("python", true, 0.01)), "post after stop dropped");
    dispatcher.Stop();
}

void test_learning_stats_running_averages() {
    LearningStats stats;
    stats.Record(Outcome("python", true, 1.0));
    stats.Record(Outcome("python", false, 3.0, "NameError: name 'x' is not defined"));
    stats.Record(Outcome("python", true, 2.0));
    stats.Record(Outcome("javascript", false, 0.5, "SyntaxError: Unexpected token"));

    LearningSnapshot snapshot = stats.Snapshot();
    expect(snapshot.total_executions == 4, "total executions");
    expect(snapshot.languages_used == 2, "languages used");
    expect(snapshot.most_used_language == "python", "most used language");
    expect(snapshot.overall_success_rate == 0.5, "overall success rate");

    const LanguageSnapshot* python = Find(snapshot, "python");
    expect(python != nullptr, "python tracked");
    expect(python->usage_count == 3, "python usage");
    expect(std::abs(python->success_rate - 2.0 / 3.0) < 1e-9, "python success rate");
    expect(std::abs(python->avg_execution_time_seconds - 2.0) < 1e-9, "python mean time");
    expect(python->error_categories.at("name_error") == 1, "name error categorized");

    const LanguageSnapshot* js = Find(snapshot, "javascript");
    expect(js != nullptr && js->error_categories.at("syntax_error") == 1, "syntax error categorized");
}

void test_success_rate_rounding() {
    LearningStats stats;
    stats.Record(Outcome("python", true, 0.1));
    stats.Record(Outcome("python", true, 0.1));
    stats.Record(Outcome("python", false, 0.1));
    expect(stats.Snapshot().overall_success_rate == 0.667, "overall rate rounded to three decimals");
}

void test_failures_without_summary_not_categorized() {
    LearningStats stats;
    stats.Record(Outcome("python", false, 0.1));
    LearningSnapshot snapshot = stats.Snapshot();
    const LanguageSnapshot* python = Find(snapshot, "python");
    expect(python != nullptr && python->error_categories.empty(), "no category without a summary");
}

void test_empty_snapshot() {
    LearningStats stats;
    LearningSnapshot snapshot = stats.Snapshot();
    expect(snapshot.total_executions == 0 && snapshot.languages.empty(), "nothing recorded");
    expect(snapshot.overall_success_rate == 0.0, "zero rate");
    expect(snapshot.most_used_language.empty(), "no most used language");
}

void test_error_categories() {
    expect(LearningStats::CategorizeError("SyntaxError: invalid syntax") == "syntax_error", "syntax");
    expect(LearningStats::CategorizeError("NameError: name 'foo' is not defined") == "name_error", "name");
    expect(LearningStats::CategorizeError("ModuleNotFoundError: No module named 'numpy'") == "import_error",
           "module");
    expect(LearningStats::CategorizeError("TypeError: unsupported operand") == "type_error", "type");
    expect(LearningStats::CategorizeError("IndexError: list index out of range") == "index_error", "index");
    expect(LearningStats::CategorizeError("KeyError: 'missing'") == "key_error", "key");
    expect(LearningStats::CategorizeError("ZeroDivisionError: division by zero") == "runtime_error", "other");
    expect(LearningStats::CategorizeError("") == "unknown", "empty");
}

} // namespace

int main() {
    std::cout << "=== Outcome Sink Tests ===\n";
    run_test("delivers to sink", test_delivers_to_sink);
    run_test("throwing sink is contained", test_throwing_sink_is_contained);
    run_test("full queue drops", test_full_queue_drops);
    run_test("stop drains then rejects", test_stop_drains_then_rejects);
    run_test("learning stats running averages", test_learning_stats_running_averages);
    run_test("success rate rounding", test_success_rate_rounding);
    run_test("failures without summary not categorized", test_failures_without_summary_not_categorized);
    run_test("empty snapshot", test_empty_snapshot);
    run_test("error categories", test_error_categories);
    return execgate_test::finish();
}
