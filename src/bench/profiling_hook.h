#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "absl/synchronization/mutex.h"
#include "replay/replay_engine.h"

namespace Concord {

/**
 * Instrumentation capability injected into the execution pool.
 * Called from worker threads; implementations must be thread safe.
 */
class IProfilingHook {
public:
    virtual ~IProfilingHook() = default;

    virtual void OnReplayStart(const std::string& vector_id, const std::string& variant_id) = 0;
    virtual void OnReplayEnd(const ExecutionResult& result) = 0;
    virtual void Flush() = 0;
};

class NoopProfilingHook : public IProfilingHook {
public:
    void OnReplayStart(const std::string&, const std::string&) override {}
    void OnReplayEnd(const ExecutionResult&) override {}
    void Flush() override {}
};

/**
 * Collects one measurement point per replay and appends them to a CSV file
 * on Flush().
 */
class CsvProfilingHook : public IProfilingHook {
public:
    struct MeasurementPoint {
        std::string vector_id;
        std::string variant_id;
        uint64_t t_start_ns = 0;     // steady clock, replay handed to the engine
        uint64_t t_end_ns = 0;       // steady clock, result returned
        uint64_t elapsed_raw_ns = 0; // as measured by the engine
        size_t worker = 0;
        std::string outcome;
    };

    explicit CsvProfilingHook(std::string path) : path_(std::move(path)) {}
    ~CsvProfilingHook() override;

    void OnReplayStart(const std::string& vector_id, const std::string& variant_id) override;
    void OnReplayEnd(const ExecutionResult& result) override;
    void Flush() override;

    size_t pending() const;

private:
    static uint64_t NowNs();
    static size_t WorkerIndex();

    std::string path_;
    mutable absl::Mutex mu_;
    std::vector<MeasurementPoint> open_ ABSL_GUARDED_BY(mu_);
    std::vector<MeasurementPoint> done_ ABSL_GUARDED_BY(mu_);
};

/**
 * Profiling is off unless `enabled` or CONCORD_ENABLE_PROFILING is truthy.
 */
std::unique_ptr<IProfilingHook> MakeProfilingHook(bool enabled, const std::string& output_path);

} // namespace Concord
