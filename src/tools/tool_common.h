#pragma once

#include <string>
#include <vector>

#include <cxxopts.hpp>

#include "corpus/vector_loader.h"
#include "machine/machine.h"
#include "runner/execution_pool.h"
#include "runner/run_config.h"

namespace Concord {

void InitLogging(const char* argv0);

// Options shared by the corpus-driven binaries; each maps to a config field.
void AddRunOptions(cxxopts::Options& options);

/**
 * Config file, then environment, then command line. Logs every validation
 * error before returning false.
 */
bool ResolveRunConfig(const cxxopts::ParseResult& args, RunConfig* out);

struct SelectedWork {
    Corpus corpus;
    std::vector<WorkItem> items;
    std::vector<SkippedItem> skipped;
};

/**
 * @return false when the corpus directory is unreadable or a pattern is invalid
 */
bool LoadSelectedWork(const RunConfig& config, const IMachineFactory& factory, SelectedWork* out);

} // namespace Concord
