#include <iostream>
#include <system_error>

#include <cxxopts.hpp>
#include <glog/logging.h>

#include "bench/cost_model.h"
#include "bench/overhead_calibrator.h"
#include "bench/profiling_hook.h"
#include "bench/result_writer.h"
#include "machine/ledger_machine.h"
#include "replay/replay_engine.h"
#include "runner/execution_pool.h"
#include "runner/report.h"
#include "tool_common.h"

namespace {

// The configured seed, or the first selected work item.
const Concord::WorkItem* FindSeed(const Concord::SelectedWork& work, const std::string& seed_id) {
    for (const auto& item : work.items) {
        if (seed_id.empty() || item.vector->id == seed_id) {
            return &item;
        }
    }
    return nullptr;
}

} // namespace

int main(int argc, char* argv[]) {
    Concord::InitLogging(argv[0]);

    cxxopts::Options options("concord_bench", "Calibrated replay timing and cost-model fitting");
    Concord::AddRunOptions(options);
    options.add_options()
        ("iterations", "Baseline calibration iterations", cxxopts::value<size_t>())
        ("warmup", "Unrecorded warmup iterations", cxxopts::value<size_t>())
        ("seed_vector", "Vector id the zero-message baseline is built from", cxxopts::value<std::string>())
        ("record_results", "Append samples and models to CSV files under result_dir");
    auto args = options.parse(argc, argv);
    if (args.count("help")) {
        std::cout << options.help() << std::endl;
        return 0;
    }
    FLAGS_v = args["log_level"].as<int>();

    Concord::RunConfig config;
    if (!Concord::ResolveRunConfig(args, &config)) {
        return 2;
    }

    Concord::LedgerMachineFactory factory;
    Concord::SelectedWork work;
    if (!Concord::LoadSelectedWork(config, factory, &work)) {
        return 2;
    }
    const Concord::WorkItem* seed = FindSeed(work, config.calibration_seed);
    if (!seed) {
        LOG(ERROR) << "No selected vector to calibrate against"
                   << (config.calibration_seed.empty() ? "" : " with id " + config.calibration_seed);
        return 2;
    }

    Concord::ReplayEngine engine(factory);
    Concord::OverheadCalibrator calibrator(engine, config.calibration);
    Concord::BaselineOffset baseline;
    try {
        baseline = calibrator.Measure(*seed->vector, seed->variant);
    } catch (const Concord::CalibrationError& e) {
        LOG(ERROR) << "Calibration failed: " << e.what();
        return 2;
    }

    auto hook = Concord::MakeProfilingHook(config.profiling_enabled, config.profiling_output);
    Concord::ExecutionPool pool(engine, config.pool, hook.get());
    Concord::AggregateReport report;
    try {
        report = pool.RunAll(work.items);
    } catch (const std::system_error& e) {
        LOG(ERROR) << "Execution pool failed: " << e.what();
        return 2;
    }
    report.skipped = std::move(work.skipped);
    report.corpus_errors = std::move(work.corpus.errors);
    Concord::OverheadCalibrator::ApplyTo(report.results, baseline.offset);

    const auto samples = Concord::SamplesFromResults(report.results);
    const Concord::FitResult overall = Concord::CostModelFitter::Fit(samples);
    const auto by_category = Concord::CostModelFitter::FitByCategory(samples);

    Concord::WriteReport(report, std::cout, config.list_skipped);
    std::cout << "== Cost model (baseline offset " << baseline.offset.count() << "ns) ==\n";
    Concord::WriteFitSummary("all", overall, std::cout);
    for (const auto& [category, fit] : by_category) {
        Concord::WriteFitSummary(category, fit, std::cout);
    }

    if (args.count("record_results")) {
        Concord::ResultWriter writer(config.result_dir);
        bool written = writer.WriteSamples(samples, baseline.offset);
        written = writer.WriteModel("all", overall) && written;
        for (const auto& [category, fit] : by_category) {
            written = writer.WriteModel(category, fit) && written;
        }
        if (!written) {
            LOG(ERROR) << "Some results could not be written under " << config.result_dir;
        }
    }
    return Concord::ExitStatusFor(report);
}
