#include "profiling_hook.h"

#include <atomic>
#include <chrono>
#include <fstream>

#include <glog/logging.h>

#include "common/env_flags.h"

namespace Concord {

namespace {
std::atomic<size_t> g_next_worker_index{0};
thread_local size_t t_worker_index = static_cast<size_t>(-1);
} // namespace

uint64_t CsvProfilingHook::NowNs() {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count());
}

size_t CsvProfilingHook::WorkerIndex() {
    if (t_worker_index == static_cast<size_t>(-1)) {
        t_worker_index = g_next_worker_index.fetch_add(1, std::memory_order_relaxed);
    }
    return t_worker_index;
}

CsvProfilingHook::~CsvProfilingHook() {
    Flush();
}

void CsvProfilingHook::OnReplayStart(const std::string& vector_id, const std::string& variant_id) {
    MeasurementPoint m;
    m.vector_id = vector_id;
    m.variant_id = variant_id;
    m.worker = WorkerIndex();
    m.t_start_ns = NowNs();
    absl::MutexLock lock(&mu_);
    open_.push_back(std::move(m));
}

void CsvProfilingHook::OnReplayEnd(const ExecutionResult& result) {
    const uint64_t now = NowNs();
    const size_t worker = WorkerIndex();
    absl::MutexLock lock(&mu_);
    for (auto it = open_.begin(); it != open_.end(); ++it) {
        if (it->worker == worker && it->vector_id == result.vector_id && it->variant_id == result.variant_id) {
            it->t_end_ns = now;
            it->elapsed_raw_ns = static_cast<uint64_t>(result.elapsed_raw.count());
            it->outcome = OutcomeName(result.outcome);
            done_.push_back(std::move(*it));
            open_.erase(it);
            return;
        }
    }
    LOG(WARNING) << "[CsvProfilingHook] end without start for " << result.vector_id << "/" << result.variant_id;
}

size_t CsvProfilingHook::pending() const {
    absl::MutexLock lock(&mu_);
    return done_.size();
}

void CsvProfilingHook::Flush() {
    std::vector<MeasurementPoint> points;
    {
        absl::MutexLock lock(&mu_);
        points.swap(done_);
    }
    if (points.empty()) return;

    std::ofstream out(path_, std::ios::app);
    if (!out) {
        LOG(ERROR) << "Failed to open profiling output: " << path_;
        return;
    }

    // Write CSV header if file is empty
    out.seekp(0, std::ios::end);
    if (out.tellp() == 0) {
        out << "vector_id,variant_id,worker,t_start_ns,t_end_ns,elapsed_raw_ns,outcome\n";
    }
    for (const auto& m : points) {
        out << m.vector_id << ","
            << m.variant_id << ","
            << m.worker << ","
            << m.t_start_ns << ","
            << m.t_end_ns << ","
            << m.elapsed_raw_ns << ","
            << m.outcome << "\n";
    }
    out.close();
    LOG(INFO) << "Flushed " << points.size() << " measurements to " << path_;
}

std::unique_ptr<IProfilingHook> MakeProfilingHook(bool enabled, const std::string& output_path) {
    if (enabled || ReadEnvBoolStrict("CONCORD_ENABLE_PROFILING", false)) {
        LOG(INFO) << "Profiling enabled, writing " << output_path;
        return std::make_unique<CsvProfilingHook>(output_path);
    }
    return std::make_unique<NoopProfilingHook>();
}

} // namespace Concord
