#include "execution_pool.h"

#include <algorithm>
#include <future>
#include <system_error>
#include <tuple>

#include <glog/logging.h>

namespace Concord {

namespace {

ExecutionResult PanicResult(const WorkItem& item, const std::string& what) {
    ExecutionResult result;
    result.vector_id = item.vector->id;
    result.variant_id = item.variant.id;
    result.outcome = Outcome::kError;
    result.error_kind = ErrorKind::kPanic;
    result.reasons.push_back("unexpected exception: " + what);
    return result;
}

} // namespace

uint64_t WorkUnitsOf(const TestVector& vector, WorkUnit unit) {
    switch (unit) {
        case WorkUnit::kGas:
            return vector.ExpectedGas();
        case WorkUnit::kMessages:
            return vector.messages.size();
    }
    return 0;
}

void OutcomeCounts::Add(Outcome outcome) {
    switch (outcome) {
        case Outcome::kPass: ++passed; break;
        case Outcome::kFail: ++failed; break;
        case Outcome::kError: ++errored; break;
    }
}

void AggregateReport::Tally() {
    counts = OutcomeCounts();
    by_category.clear();
    harness_defects = 0;
    for (const auto& r : results) {
        counts.Add(r.outcome);
        by_category[r.category].Add(r.outcome);
        if (r.error_kind == ErrorKind::kNondeterminism) {
            ++harness_defects;
        }
    }
}

std::vector<WorkItem> SelectWork(const std::vector<TestVectorPtr>& vectors,
                                 const SelectorEvaluator& evaluator,
                                 std::vector<SkippedItem>* skipped) {
    std::vector<WorkItem> items;
    for (const auto& vector : vectors) {
        for (const auto& variant : vector->variants) {
            SelectorDecision decision = evaluator.Evaluate(*vector, variant);
            if (decision.runs()) {
                items.push_back(WorkItem{vector, variant, std::move(decision)});
            } else {
                VLOG(1) << "[SelectWork] skip " << vector->id << "/" << variant.id << ": " << decision.reason;
                if (skipped) {
                    skipped->push_back(SkippedItem{vector->id, variant.id, decision.reason});
                }
            }
        }
    }
    return items;
}

void ResultAggregator::Add(size_t item_index, ExecutionResult result) {
    absl::MutexLock lock(&mu_);
    results_.push_back(Entry{item_index, std::move(result)});
}

std::vector<ExecutionResult> ResultAggregator::TakeSorted() {
    std::vector<Entry> entries;
    {
        absl::MutexLock lock(&mu_);
        entries.swap(results_);
    }
    std::sort(entries.begin(), entries.end(), [](const Entry& a, const Entry& b) {
        return std::tie(a.result.vector_id, a.result.variant_id, a.item_index) <
               std::tie(b.result.vector_id, b.result.variant_id, b.item_index);
    });
    std::vector<ExecutionResult> out;
    out.reserve(entries.size());
    for (auto& e : entries) {
        out.push_back(std::move(e.result));
    }
    return out;
}

size_t ResultAggregator::size() const {
    absl::MutexLock lock(&mu_);
    return results_.size();
}

ExecutionPool::ExecutionPool(const ReplayEngine& engine, PoolOptions options, IProfilingHook* hook)
    : engine_(engine),
      options_(std::move(options)),
      hook_(hook ? hook : &noop_hook_) {}

ExecutionPool::~ExecutionPool() {
    JoinAbandoned();
}

void ExecutionPool::JoinAbandoned() {
    std::vector<std::thread> threads;
    {
        absl::MutexLock lock(&abandoned_mu_);
        threads.swap(abandoned_);
    }
    if (!threads.empty()) {
        LOG(INFO) << "Waiting for " << threads.size() << " cancelled replays to unwind";
    }
    for (auto& t : threads) {
        if (t.joinable()) {
            t.join();
        }
    }
}

std::string ExecutionPool::CategoryOf(const TestVector& vector) const {
    auto it = vector.selectors.find(options_.category_selector);
    return it != vector.selectors.end() ? it->second : "default";
}

ExecutionResult ExecutionPool::Attempt(const WorkItem& item, const ReplayOptions& replay_options) const {
    if (!options_.verify_determinism) {
        return engine_.Replay(*item.vector, item.variant, replay_options);
    }
    DeterminismCheck check = engine_.CheckDeterminism(*item.vector, item.variant, replay_options);
    ExecutionResult result = std::move(check.first);
    if (!check.deterministic) {
        result.outcome = Outcome::kError;
        result.error_kind = ErrorKind::kNondeterminism;
        result.reasons.push_back("harness defect, nondeterministic replay: " + check.divergence);
    }
    return result;
}

ExecutionResult ExecutionPool::AttemptWithTimeout(const WorkItem& item, ReplayOptions replay_options) {
    auto cancelled = std::make_shared<std::atomic<bool>>(false);
    auto promise = std::make_shared<std::promise<ExecutionResult>>();
    std::future<ExecutionResult> future = promise->get_future();
    replay_options.cancelled = cancelled.get();

    // The helper keeps its own copies so an abandoned replay stays valid.
    std::thread helper([this, owned = item, replay_options, cancelled, promise]() {
        try {
            promise->set_value(Attempt(owned, replay_options));
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    });

    if (future.wait_for(options_.timeout) == std::future_status::ready) {
        helper.join();
        return future.get();
    }

    cancelled->store(true, std::memory_order_relaxed);
    {
        absl::MutexLock lock(&abandoned_mu_);
        abandoned_.push_back(std::move(helper));
    }
    LOG(WARNING) << "Replay of " << item.vector->id << "/" << item.variant.id
                 << " exceeded " << options_.timeout.count() << "ms";

    ExecutionResult result;
    result.vector_id = item.vector->id;
    result.variant_id = item.variant.id;
    result.outcome = Outcome::kError;
    result.error_kind = ErrorKind::kTimeout;
    result.elapsed_raw = std::chrono::duration_cast<std::chrono::nanoseconds>(options_.timeout);
    result.reasons.push_back("timeout after " + std::to_string(options_.timeout.count()) + "ms");
    return result;
}

ExecutionResult ExecutionPool::RunOne(const WorkItem& item) {
    ReplayOptions replay_options;
    replay_options.verdict = item.decision.verdict;
    replay_options.relaxed_policy = options_.relaxed_policy;
    replay_options.check = options_.check;

    const int max_attempts = 1 + std::max(0, options_.timeout_retries);
    ExecutionResult result;
    int attempts = 0;
    while (true) {
        ++attempts;
        try {
            result = options_.timeout.count() > 0 ? AttemptWithTimeout(item, replay_options)
                                                  : Attempt(item, replay_options);
        } catch (const std::exception& e) {
            result = PanicResult(item, e.what());
        } catch (...) {
            result = PanicResult(item, "non-standard exception");
        }
        if (result.error_kind != ErrorKind::kTimeout || attempts >= max_attempts) {
            break;
        }
        LOG(WARNING) << "Retrying " << item.vector->id << "/" << item.variant.id
                     << " (attempt " << attempts + 1 << " of " << max_attempts << ")";
    }

    result.attempts = attempts;
    result.verdict = item.decision.verdict;
    result.category = CategoryOf(*item.vector);
    result.work_units = WorkUnitsOf(*item.vector, options_.work_unit);
    if (result.outcome != Outcome::kPass) {
        VLOG(1) << "[ExecutionPool] " << result.vector_id << "/" << result.variant_id << " "
                << OutcomeName(result.outcome) << ": "
                << (result.reasons.empty() ? "" : result.reasons.front());
    }
    return result;
}

void ExecutionPool::WorkerThread(const std::vector<WorkItem>* items, std::atomic<size_t>* next,
                                 ResultAggregator* sink) {
    while (!abort_.load(std::memory_order_relaxed)) {
        const size_t idx = next->fetch_add(1, std::memory_order_relaxed);
        if (idx >= items->size()) {
            return;
        }
        const WorkItem& item = (*items)[idx];
        hook_->OnReplayStart(item.vector->id, item.variant.id);
        ExecutionResult result = RunOne(item);
        hook_->OnReplayEnd(result);
        sink->Add(idx, std::move(result));
    }
}

AggregateReport ExecutionPool::RunAll(const std::vector<WorkItem>& items) {
    return RunAll(items, options_.worker_count);
}

AggregateReport ExecutionPool::RunAll(const std::vector<WorkItem>& items, size_t worker_count) {
    if (worker_count == 0) {
        worker_count = std::max(1u, std::thread::hardware_concurrency());
    }
    const size_t num_threads = std::min(worker_count, std::max<size_t>(items.size(), 1));
    LOG(INFO) << "Running " << items.size() << " replays on " << num_threads << " workers";

    ResultAggregator sink;
    std::atomic<size_t> next{0};
    abort_.store(false);

    std::vector<std::thread> workers;
    workers.reserve(num_threads);
    try {
        for (size_t i = 0; i < num_threads; ++i) {
            workers.emplace_back(&ExecutionPool::WorkerThread, this, &items, &next, &sink);
        }
    } catch (const std::system_error& e) {
        LOG(ERROR) << "Failed to create worker pool: " << e.what();
        abort_.store(true);
        for (auto& w : workers) {
            if (w.joinable()) w.join();
        }
        JoinAbandoned();
        throw;
    }
    for (auto& w : workers) {
        w.join();
    }
    JoinAbandoned();

    AggregateReport report;
    report.results = sink.TakeSorted();
    report.Tally();
    hook_->Flush();
    LOG(INFO) << "Run complete: " << report.counts.passed << " passed, " << report.counts.failed
              << " failed, " << report.counts.errored << " errored";
    return report;
}

} // namespace Concord
