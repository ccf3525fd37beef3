#pragma once

#include <optional>
#include <string>

#include "bench/overhead_calibrator.h"
#include "common/configuration.h"
#include "runner/execution_pool.h"
#include "selector/selector_evaluator.h"

namespace Concord {

/**
 * Plain snapshot of the configuration consumed by the core components.
 */
struct RunConfig {
    std::string corpus_dir;
    SelectorConfig selector;
    PoolOptions pool;
    CalibrationOptions calibration;
    std::string calibration_seed;
    bool profiling_enabled = false;
    std::string profiling_output;
    std::string result_dir;
    bool list_skipped = false;
};

std::optional<CheckStrength> ParseCheckStrength(const std::string& name);
std::optional<WorkUnit> ParseWorkUnit(const std::string& name);

/**
 * @return false with `error` set when a field cannot be mapped
 */
bool MakeRunConfig(const ConcordConfig& config, RunConfig* out, std::string* error);

} // namespace Concord
