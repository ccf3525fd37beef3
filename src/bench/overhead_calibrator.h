#pragma once

#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

#include "corpus/test_vector.h"
#include "replay/replay_engine.h"

namespace Concord {

class CalibrationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct CalibrationOptions {
    size_t iterations = 200;
    size_t warmup = 20;
};

struct BaselineOffset {
    std::chrono::nanoseconds offset{0};
    std::vector<std::chrono::nanoseconds> samples;   // in measurement order
};

/**
 * Measures the fixed per-replay harness cost with a zero-message vector run
 * through the same ReplayEngine path as real vectors, and subtracts it from
 * raw timings.
 */
class OverheadCalibrator {
public:
    OverheadCalibrator(const ReplayEngine& engine, CalibrationOptions options)
        : engine_(engine), options_(options) {}

    /**
     * Same blockstore and root as `seed`, no messages, postcondition root
     * equal to the initial root.
     */
    static TestVectorPtr MakeBaselineVector(const TestVector& seed);

    /**
     * @throws CalibrationError if the seed has no variant or a baseline
     *         replay does not PASS
     */
    BaselineOffset Measure(const TestVector& seed) const;
    BaselineOffset Measure(const TestVector& seed, const Variant& variant) const;

    // Mean of the two middle samples for even counts; 0 for no samples.
    static std::chrono::nanoseconds Median(std::vector<std::chrono::nanoseconds> samples);

    static std::chrono::nanoseconds Apply(std::chrono::nanoseconds raw, std::chrono::nanoseconds offset) {
        return raw > offset ? raw - offset : std::chrono::nanoseconds(0);
    }

    // Sets elapsed_calibrated on every result.
    static void ApplyTo(std::vector<ExecutionResult>& results, std::chrono::nanoseconds offset);

    const CalibrationOptions& options() const { return options_; }

private:
    const ReplayEngine& engine_;
    CalibrationOptions options_;
};

} // namespace Concord
