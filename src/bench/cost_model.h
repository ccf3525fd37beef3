#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "replay/replay_engine.h"

namespace Concord {

/**
 * One (work units, elapsed) observation. Immutable once recorded.
 */
struct CalibrationSample {
    std::string vector_id;
    std::string category;
    uint64_t work_units = 0;
    uint64_t elapsed_ns = 0;
};

/**
 * Fitted elapsed = slope * work_units + intercept, in nanoseconds.
 * A new fit supersedes an old one; models are never updated in place.
 */
struct CostModel {
    double slope = 0;
    double intercept = 0;
    double residual_variance = 0;
    double r_squared = 0;
    size_t sample_count = 0;

    double Predict(double work_units) const { return slope * work_units + intercept; }

    // Work units per second, when the slope is positive.
    std::optional<double> Throughput() const {
        if (slope > 0) return 1e9 / slope;
        return std::nullopt;
    }
};

enum class FitStatus {
    kOk,
    kInsufficientData
};

const char* FitStatusName(FitStatus status);

struct FitResult {
    FitStatus status = FitStatus::kInsufficientData;
    std::optional<CostModel> model;   // set only when status is kOk
    std::string detail;

    bool ok() const { return status == FitStatus::kOk; }
};

/**
 * Ordinary least squares over (work_units, elapsed_ns).
 */
class CostModelFitter {
public:
    static FitResult Fit(const std::vector<CalibrationSample>& samples);

    // One fit per sample category.
    static std::map<std::string, FitResult> FitByCategory(const std::vector<CalibrationSample>& samples);
};

/**
 * Samples from PASS results carrying a calibrated elapsed time.
 */
std::vector<CalibrationSample> SamplesFromResults(const std::vector<ExecutionResult>& results);

} // namespace Concord
