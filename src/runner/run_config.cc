#include "run_config.h"

namespace Concord {

std::optional<CheckStrength> ParseCheckStrength(const std::string& name) {
    if (name == "full") return CheckStrength::kFull;
    if (name == "only_success") return CheckStrength::kOnlySuccess;
    if (name == "none") return CheckStrength::kNone;
    return std::nullopt;
}

std::optional<WorkUnit> ParseWorkUnit(const std::string& name) {
    if (name == "gas") return WorkUnit::kGas;
    if (name == "messages") return WorkUnit::kMessages;
    return std::nullopt;
}

bool MakeRunConfig(const ConcordConfig& config, RunConfig* out, std::string* error) {
    RunConfig rc;
    rc.corpus_dir = config.runner.corpus_dir.get();

    rc.selector.target_network_version = static_cast<uint32_t>(config.selection.network_version.get());
    rc.selector.variant_classes.clear();
    rc.selector.variant_classes.insert(config.selection.variant_classes.begin(),
                                       config.selection.variant_classes.end());
    rc.selector.include_patterns = config.selection.include;
    rc.selector.exclude_patterns = config.selection.exclude;
    rc.selector.include_only = config.selection.include_only.get();
    rc.selector.relaxed_patterns = config.selection.relaxed;
    rc.selector.relaxed_classes.insert(config.selection.relaxed_classes.begin(),
                                       config.selection.relaxed_classes.end());

    auto check = ParseCheckStrength(config.runner.check.get());
    if (!check) {
        if (error) *error = "unknown check strength '" + config.runner.check.get() + "'";
        return false;
    }
    auto work_unit = ParseWorkUnit(config.runner.work_unit.get());
    if (!work_unit) {
        if (error) *error = "unknown work unit '" + config.runner.work_unit.get() + "'";
        return false;
    }
    rc.pool.worker_count = config.runner.workers.get();
    rc.pool.timeout = std::chrono::milliseconds(config.runner.timeout_ms.get());
    rc.pool.timeout_retries = config.runner.timeout_retries.get();
    rc.pool.verify_determinism = config.runner.verify_determinism.get();
    rc.pool.check = *check;
    rc.pool.work_unit = *work_unit;

    const size_t gas_abs = config.tolerance.gas_abs.get();
    const double gas_rel = config.tolerance.gas_rel.get();
    rc.pool.relaxed_policy = TolerancePolicy::Relaxed(
        gas_abs > 0 ? std::optional<uint64_t>(gas_abs) : std::nullopt,
        gas_rel > 0 ? std::optional<double>(gas_rel) : std::nullopt);

    rc.calibration.iterations = config.calibration.iterations.get();
    rc.calibration.warmup = config.calibration.warmup.get();
    rc.calibration_seed = config.calibration.seed_vector.get();

    rc.profiling_enabled = config.profiling.enabled.get();
    rc.profiling_output = config.profiling.output.get();
    rc.result_dir = config.report.result_dir.get();
    rc.list_skipped = config.report.list_skipped.get();

    *out = std::move(rc);
    return true;
}

} // namespace Concord
