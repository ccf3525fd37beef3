#include "cost_model.h"

#include <glog/logging.h>

namespace Concord {

const char* FitStatusName(FitStatus status) {
    switch (status) {
        case FitStatus::kOk: return "OK";
        case FitStatus::kInsufficientData: return "INSUFFICIENT_DATA";
    }
    return "UNKNOWN";
}

FitResult CostModelFitter::Fit(const std::vector<CalibrationSample>& samples) {
    FitResult result;
    if (samples.size() < 2) {
        result.detail = std::to_string(samples.size()) + " samples, need at least 2";
        return result;
    }

    bool distinct = false;
    for (const auto& s : samples) {
        if (s.work_units != samples.front().work_units) {
            distinct = true;
            break;
        }
    }
    if (!distinct) {
        result.detail = "all samples share work_units=" + std::to_string(samples.front().work_units);
        return result;
    }

    // Long double keeps Σx² exact enough for gas-sized work units.
    const long double n = static_cast<long double>(samples.size());
    long double sx = 0, sy = 0, sxy = 0, sxx = 0;
    for (const auto& s : samples) {
        const long double x = s.work_units;
        const long double y = s.elapsed_ns;
        sx += x;
        sy += y;
        sxy += x * y;
        sxx += x * x;
    }
    const long double denom = n * sxx - sx * sx;
    if (denom <= 0) {
        result.detail = "zero variance in work units";
        return result;
    }
    const long double slope = (n * sxy - sx * sy) / denom;
    const long double intercept = (sy - slope * sx) / n;

    const long double mean_y = sy / n;
    long double ssr = 0, sst = 0;
    for (const auto& s : samples) {
        const long double y = s.elapsed_ns;
        const long double residual = y - (slope * s.work_units + intercept);
        ssr += residual * residual;
        sst += (y - mean_y) * (y - mean_y);
    }

    CostModel model;
    model.slope = static_cast<double>(slope);
    model.intercept = static_cast<double>(intercept);
    model.sample_count = samples.size();
    model.residual_variance = samples.size() > 2 ? static_cast<double>(ssr / (n - 2)) : 0.0;
    if (sst > 0) {
        model.r_squared = static_cast<double>(1 - ssr / sst);
    } else {
        model.r_squared = ssr == 0 ? 1.0 : 0.0;
    }

    result.status = FitStatus::kOk;
    result.model = model;
    return result;
}

std::map<std::string, FitResult> CostModelFitter::FitByCategory(const std::vector<CalibrationSample>& samples) {
    std::map<std::string, std::vector<CalibrationSample>> grouped;
    for (const auto& s : samples) {
        grouped[s.category].push_back(s);
    }
    std::map<std::string, FitResult> fits;
    for (const auto& [category, group] : grouped) {
        fits[category] = Fit(group);
        if (!fits[category].ok()) {
            LOG(WARNING) << "Cost model for category " << category << ": "
                         << FitStatusName(fits[category].status) << " (" << fits[category].detail << ")";
        }
    }
    return fits;
}

std::vector<CalibrationSample> SamplesFromResults(const std::vector<ExecutionResult>& results) {
    std::vector<CalibrationSample> samples;
    samples.reserve(results.size());
    for (const auto& r : results) {
        if (r.outcome != Outcome::kPass || !r.elapsed_calibrated) continue;
        CalibrationSample s;
        s.vector_id = r.vector_id + "/" + r.variant_id;
        s.category = r.category;
        s.work_units = r.work_units;
        s.elapsed_ns = static_cast<uint64_t>(r.elapsed_calibrated->count());
        samples.push_back(std::move(s));
    }
    return samples;
}

} // namespace Concord
