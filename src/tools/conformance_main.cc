#include <iostream>
#include <system_error>

#include <cxxopts.hpp>
#include <glog/logging.h>

#include "bench/profiling_hook.h"
#include "machine/ledger_machine.h"
#include "replay/replay_engine.h"
#include "runner/execution_pool.h"
#include "runner/report.h"
#include "tool_common.h"

int main(int argc, char* argv[]) {
    Concord::InitLogging(argv[0]);

    cxxopts::Options options("concord_conformance", "Replay test vectors and verify their postconditions");
    Concord::AddRunOptions(options);
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

    Concord::ReplayEngine engine(factory);
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

    Concord::WriteReport(report, std::cout, config.list_skipped);
    return Concord::ExitStatusFor(report);
}
