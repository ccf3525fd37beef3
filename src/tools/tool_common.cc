#include "tool_common.h"

#include <regex>

#include <glog/logging.h>

#include "common/configuration.h"

namespace Concord {

void InitLogging(const char* argv0) {
    google::InitGoogleLogging(argv0);
    google::InstallFailureSignalHandler();
    FLAGS_logtostderr = 1; // log only to console, no files
}

void AddRunOptions(cxxopts::Options& options) {
    options.add_options()
        ("f,config", "YAML configuration file", cxxopts::value<std::string>())
        ("corpus", "Corpus directory", cxxopts::value<std::string>())
        ("w,workers", "Worker threads, 0 for all cores", cxxopts::value<size_t>())
        ("timeout_ms", "Per-replay timeout in milliseconds", cxxopts::value<int>())
        ("timeout_retries", "Retries for timed-out replays", cxxopts::value<int>())
        ("verify_determinism", "Replay every vector twice and compare")
        ("check", "Postcondition check: full, only_success, none", cxxopts::value<std::string>())
        ("work_unit", "Cost-model work unit: gas, messages", cxxopts::value<std::string>())
        ("network_version", "Only run variants at this network version", cxxopts::value<int>())
        ("include", "Vector id pattern to force-run", cxxopts::value<std::vector<std::string>>())
        ("exclude", "Vector id pattern to skip", cxxopts::value<std::vector<std::string>>())
        ("include_only", "Skip vectors matching no include pattern")
        ("relaxed", "Vector id pattern run with relaxed gas tolerance", cxxopts::value<std::vector<std::string>>())
        ("profile", "Record per-replay timing to the profiling CSV")
        ("list_skipped", "List skipped vectors in the report")
        ("result_dir", "Directory for CSV results", cxxopts::value<std::string>())
        ("l,log_level", "Log level", cxxopts::value<int>()->default_value("0"))
        ("h,help", "Print usage");
}

bool ResolveRunConfig(const cxxopts::ParseResult& args, RunConfig* out) {
    Configuration& configuration = Configuration::getInstance();
    if (args.count("config")) {
        const std::string path = args["config"].as<std::string>();
        if (!configuration.loadFromFile(path)) {
            LOG(ERROR) << "Invalid configuration in " << path;
            for (const auto& e : configuration.getValidationErrors()) {
                LOG(ERROR) << "  " << e;
            }
            return false;
        }
        LOG(INFO) << "Loaded configuration from " << path;
    }
    configuration.overrideFromCommandLine(args);
    if (!configuration.validate()) {
        for (const auto& e : configuration.getValidationErrors()) {
            LOG(ERROR) << "Configuration: " << e;
        }
        return false;
    }
    std::string error;
    if (!MakeRunConfig(configuration.config(), out, &error)) {
        LOG(ERROR) << "Configuration: " << error;
        return false;
    }
    return true;
}

bool LoadSelectedWork(const RunConfig& config, const IMachineFactory& factory, SelectedWork* out) {
    std::string fatal;
    if (!LoadCorpus(config.corpus_dir, out->corpus, &fatal)) {
        LOG(ERROR) << "Cannot read corpus: " << fatal;
        return false;
    }
    for (const auto& e : out->corpus.errors) {
        LOG(WARNING) << "Skipping " << e.path << ": " << e.reason;
    }
    LOG(INFO) << "Loaded " << out->corpus.vectors.size() << " vectors from " << config.corpus_dir
              << " (" << out->corpus.errors.size() << " unreadable)";

    try {
        SelectorEvaluator evaluator(config.selector, &factory);
        out->items = SelectWork(out->corpus.vectors, evaluator, &out->skipped);
    } catch (const std::regex_error& e) {
        LOG(ERROR) << "Invalid selection pattern: " << e.what();
        return false;
    }
    LOG(INFO) << "Selected " << out->items.size() << " replays, skipped " << out->skipped.size();
    return true;
}

} // namespace Concord
