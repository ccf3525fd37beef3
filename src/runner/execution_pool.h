#pragma once

#include <atomic>
#include <chrono>
#include <map>
#include <string>
#include <thread>
#include <vector>

#include "absl/synchronization/mutex.h"
#include "bench/profiling_hook.h"
#include "corpus/test_vector.h"
#include "corpus/vector_loader.h"
#include "replay/replay_engine.h"
#include "selector/selector_evaluator.h"

namespace Concord {

enum class WorkUnit {
    kGas,       // sum of expected gas across receipts
    kMessages   // number of messages
};

uint64_t WorkUnitsOf(const TestVector& vector, WorkUnit unit);

struct PoolOptions {
    // 0 selects std::thread::hardware_concurrency().
    size_t worker_count = 0;
    // 0 disables the per-replay timeout.
    std::chrono::milliseconds timeout{0};
    int timeout_retries = 0;
    bool verify_determinism = false;
    CheckStrength check = CheckStrength::kFull;
    TolerancePolicy relaxed_policy = TolerancePolicy::Relaxed(std::nullopt, 0.02);
    std::string category_selector = kSelectorCategory;
    WorkUnit work_unit = WorkUnit::kGas;
};

struct WorkItem {
    TestVectorPtr vector;
    Variant variant;
    SelectorDecision decision;
};

struct SkippedItem {
    std::string vector_id;
    std::string variant_id;
    std::string reason;
};

struct OutcomeCounts {
    size_t passed = 0;
    size_t failed = 0;
    size_t errored = 0;

    size_t total() const { return passed + failed + errored; }
    void Add(Outcome outcome);
    bool operator==(const OutcomeCounts& o) const {
        return passed == o.passed && failed == o.failed && errored == o.errored;
    }
};

/**
 * Final, canonically ordered view of one run. Identical for any worker count
 * or scheduling order, timings aside.
 */
struct AggregateReport {
    std::vector<ExecutionResult> results;   // sorted by (vector_id, variant_id)
    std::vector<SkippedItem> skipped;
    std::vector<CorpusError> corpus_errors;
    OutcomeCounts counts;
    std::map<std::string, OutcomeCounts> by_category;
    size_t harness_defects = 0;

    void Tally();
};

/**
 * Expands vectors into (vector, variant) work items and records the skipped
 * ones with their reason.
 */
std::vector<WorkItem> SelectWork(const std::vector<TestVectorPtr>& vectors,
                                 const SelectorEvaluator& evaluator,
                                 std::vector<SkippedItem>* skipped);

/**
 * Single mutation point for results produced by concurrent workers.
 * Results are keyed by the index of their work item, which breaks ties
 * between equal (vector_id, variant_id) pairs.
 */
class ResultAggregator {
public:
    void Add(size_t item_index, ExecutionResult result);
    // Sorted by (vector_id, variant_id, item_index).
    std::vector<ExecutionResult> TakeSorted();
    size_t size() const;

private:
    struct Entry {
        size_t item_index;
        ExecutionResult result;
    };

    mutable absl::Mutex mu_;
    std::vector<Entry> results_ ABSL_GUARDED_BY(mu_);
};

/**
 * Fixed-size worker pool over an immutable work queue. Per-item faults,
 * timeouts and unexpected exceptions become ERROR results; nothing a single
 * replay does aborts its siblings.
 */
class ExecutionPool {
public:
    ExecutionPool(const ReplayEngine& engine, PoolOptions options, IProfilingHook* hook = nullptr);
    ~ExecutionPool();

    ExecutionPool(const ExecutionPool&) = delete;
    ExecutionPool& operator=(const ExecutionPool&) = delete;

    AggregateReport RunAll(const std::vector<WorkItem>& items);

    /**
     * @throws std::system_error when worker threads cannot be created
     */
    AggregateReport RunAll(const std::vector<WorkItem>& items, size_t worker_count);

    const PoolOptions& options() const { return options_; }

private:
    void WorkerThread(const std::vector<WorkItem>* items, std::atomic<size_t>* next, ResultAggregator* sink);
    ExecutionResult RunOne(const WorkItem& item);
    ExecutionResult Attempt(const WorkItem& item, const ReplayOptions& replay_options) const;
    ExecutionResult AttemptWithTimeout(const WorkItem& item, ReplayOptions replay_options);
    std::string CategoryOf(const TestVector& vector) const;
    void JoinAbandoned();

    const ReplayEngine& engine_;
    PoolOptions options_;
    NoopProfilingHook noop_hook_;
    IProfilingHook* hook_;
    std::atomic<bool> abort_{false};

    absl::Mutex abandoned_mu_;
    std::vector<std::thread> abandoned_ ABSL_GUARDED_BY(abandoned_mu_);
};

} // namespace Concord
