#include "overhead_calibrator.h"

#include <algorithm>

#include <glog/logging.h>

namespace Concord {

TestVectorPtr OverheadCalibrator::MakeBaselineVector(const TestVector& seed) {
    auto baseline = std::make_shared<TestVector>();
    baseline->id = seed.id + "::baseline";
    baseline->selectors = seed.selectors;
    baseline->car_root = seed.car_root;
    baseline->blockstore = seed.blockstore;
    baseline->variants = seed.variants;
    baseline->base_fee = seed.base_fee;
    baseline->circ_supply = seed.circ_supply;
    baseline->postconditions.state_root = seed.car_root;
    return baseline;
}

BaselineOffset OverheadCalibrator::Measure(const TestVector& seed) const {
    if (seed.variants.empty()) {
        throw CalibrationError("calibration seed " + seed.id + " has no variants");
    }
    return Measure(seed, seed.variants.front());
}

BaselineOffset OverheadCalibrator::Measure(const TestVector& seed, const Variant& variant) const {
    TestVectorPtr baseline = MakeBaselineVector(seed);
    ReplayOptions replay_options;

    auto run_once = [&](size_t i) {
        ExecutionResult result = engine_.Replay(*baseline, variant, replay_options);
        if (result.outcome != Outcome::kPass) {
            throw CalibrationError("baseline replay " + std::to_string(i) + " of " + baseline->id + "/" +
                                   variant.id + " was " + OutcomeName(result.outcome) + ": " +
                                   (result.reasons.empty() ? "" : result.reasons.front()));
        }
        return result.elapsed_raw;
    };

    for (size_t i = 0; i < options_.warmup; ++i) {
        run_once(i);
    }

    BaselineOffset out;
    out.samples.reserve(options_.iterations);
    for (size_t i = 0; i < options_.iterations; ++i) {
        out.samples.push_back(run_once(options_.warmup + i));
    }
    out.offset = Median(out.samples);

    LOG(INFO) << "Baseline offset " << out.offset.count() << "ns over " << out.samples.size()
              << " iterations (" << options_.warmup << " warmup) seeded from " << seed.id;
    return out;
}

std::chrono::nanoseconds OverheadCalibrator::Median(std::vector<std::chrono::nanoseconds> samples) {
    if (samples.empty()) {
        return std::chrono::nanoseconds(0);
    }
    std::sort(samples.begin(), samples.end());
    const size_t mid = samples.size() / 2;
    if (samples.size() % 2 == 1) {
        return samples[mid];
    }
    return (samples[mid - 1] + samples[mid]) / 2;
}

void OverheadCalibrator::ApplyTo(std::vector<ExecutionResult>& results, std::chrono::nanoseconds offset) {
    for (auto& r : results) {
        r.elapsed_calibrated = Apply(r.elapsed_raw, offset);
    }
}

} // namespace Concord
