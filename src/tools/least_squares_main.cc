#include <iostream>
#include <map>
#include <string>
#include <vector>

#include <cxxopts.hpp>
#include <glog/logging.h>

#include "bench/cost_model.h"
#include "bench/result_writer.h"
#include "runner/report.h"
#include "tool_common.h"

int main(int argc, char* argv[]) {
    Concord::InitLogging(argv[0]);

    cxxopts::Options options("concord_least_squares", "Fit a linear cost model to recorded samples");
    options.add_options()
        ("i,input", "Sample CSV with work_units and elapsed_ns columns", cxxopts::value<std::vector<std::string>>())
        ("by_category", "Also fit each sample category separately")
        ("result_dir", "Append the fitted models to models.csv here", cxxopts::value<std::string>())
        ("l,log_level", "Log level", cxxopts::value<int>()->default_value("0"))
        ("h,help", "Print usage");
    options.parse_positional({"input"});
    auto args = options.parse(argc, argv);
    if (args.count("help") || !args.count("input")) {
        std::cout << options.help() << std::endl;
        return args.count("help") ? 0 : 2;
    }
    FLAGS_v = args["log_level"].as<int>();

    std::vector<Concord::CalibrationSample> samples;
    for (const auto& path : args["input"].as<std::vector<std::string>>()) {
        std::string error;
        if (!Concord::ReadSamplesCsv(path, &samples, &error)) {
            LOG(ERROR) << error;
            return 2;
        }
    }
    LOG(INFO) << "Read " << samples.size() << " samples";

    const Concord::FitResult overall = Concord::CostModelFitter::Fit(samples);
    std::cout << "== Cost model ==\n";
    Concord::WriteFitSummary("all", overall, std::cout);

    std::map<std::string, Concord::FitResult> by_category;
    if (args.count("by_category")) {
        by_category = Concord::CostModelFitter::FitByCategory(samples);
        for (const auto& [category, fit] : by_category) {
            Concord::WriteFitSummary(category, fit, std::cout);
        }
    }

    if (args.count("result_dir")) {
        Concord::ResultWriter writer(args["result_dir"].as<std::string>());
        bool written = writer.WriteModel("all", overall);
        for (const auto& [category, fit] : by_category) {
            written = writer.WriteModel(category, fit) && written;
        }
        if (!written) {
            return 2;
        }
    }
    return 0;
}
