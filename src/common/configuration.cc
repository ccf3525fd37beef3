#include "configuration.h"

#include <cstdlib>
#include <cstring>
#include <initializer_list>

#include <cxxopts.hpp>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

#include "common/env_flags.h"

namespace Concord {

namespace {

void ReadStringList(const YAML::Node& node, std::vector<std::string>& out) {
    out.clear();
    if (node.IsScalar()) {
        out.push_back(node.as<std::string>());
        return;
    }
    for (const auto& item : node) {
        out.push_back(item.as<std::string>());
    }
}

bool OneOf(const std::string& value, std::initializer_list<const char*> allowed) {
    for (const char* a : allowed) {
        if (value == a) return true;
    }
    return false;
}

} // namespace

// Template specializations for environment variable parsing
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return std::stoi(env_val);
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<size_t> ConfigValue<size_t>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        if (std::strchr(env_val, '-')) {
            LOG(WARNING) << "Negative value for env var " << env_var_ << ": " << env_val;
            return std::nullopt;
        }
        try {
            return std::stoull(env_val);
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<double> ConfigValue<double>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return std::stod(env_val);
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        return std::string(env_val);
    }
    return std::nullopt;
}

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        if (IsEnvTrueValue(env_val)) return true;
        if (IsEnvFalseValue(env_val)) return false;
        LOG(WARNING) << "Invalid boolean value for env var " << env_var_ << ": " << env_val;
    }
    return std::nullopt;
}

Configuration& Configuration::getInstance() {
    static Configuration instance;
    return instance;
}

void Configuration::reset() {
    config_ = ConcordConfig();
    validation_errors_.clear();
}

bool Configuration::parseDocument(const YAML::Node& yaml, const std::string& origin) {
    if (!yaml["concord"]) {
        LOG(WARNING) << "No 'concord' section in " << origin << ", keeping defaults";
        return validate();
    }
    auto root = yaml["concord"];

    if (root["runner"]) {
        auto runner = root["runner"];
        if (runner["corpus_dir"]) config_.runner.corpus_dir.set(runner["corpus_dir"].as<std::string>());
        if (runner["workers"]) config_.runner.workers.set(runner["workers"].as<size_t>());
        if (runner["timeout_ms"]) config_.runner.timeout_ms.set(runner["timeout_ms"].as<int>());
        if (runner["timeout_retries"]) config_.runner.timeout_retries.set(runner["timeout_retries"].as<int>());
        if (runner["verify_determinism"]) config_.runner.verify_determinism.set(runner["verify_determinism"].as<bool>());
        if (runner["check"]) config_.runner.check.set(runner["check"].as<std::string>());
        if (runner["work_unit"]) config_.runner.work_unit.set(runner["work_unit"].as<std::string>());
    }

    if (root["selection"]) {
        auto selection = root["selection"];
        if (selection["network_version"]) config_.selection.network_version.set(selection["network_version"].as<int>());
        if (selection["variant_classes"]) ReadStringList(selection["variant_classes"], config_.selection.variant_classes);
        if (selection["include"]) ReadStringList(selection["include"], config_.selection.include);
        if (selection["exclude"]) ReadStringList(selection["exclude"], config_.selection.exclude);
        if (selection["include_only"]) config_.selection.include_only.set(selection["include_only"].as<bool>());
        if (selection["relaxed"]) ReadStringList(selection["relaxed"], config_.selection.relaxed);
        if (selection["relaxed_classes"]) ReadStringList(selection["relaxed_classes"], config_.selection.relaxed_classes);
    }

    if (root["tolerance"]) {
        auto tolerance = root["tolerance"];
        if (tolerance["gas_abs"]) config_.tolerance.gas_abs.set(tolerance["gas_abs"].as<size_t>());
        if (tolerance["gas_rel"]) config_.tolerance.gas_rel.set(tolerance["gas_rel"].as<double>());
    }

    if (root["calibration"]) {
        auto calibration = root["calibration"];
        if (calibration["iterations"]) config_.calibration.iterations.set(calibration["iterations"].as<size_t>());
        if (calibration["warmup"]) config_.calibration.warmup.set(calibration["warmup"].as<size_t>());
        if (calibration["seed_vector"]) config_.calibration.seed_vector.set(calibration["seed_vector"].as<std::string>());
    }

    if (root["profiling"]) {
        auto profiling = root["profiling"];
        if (profiling["enabled"]) config_.profiling.enabled.set(profiling["enabled"].as<bool>());
        if (profiling["output"]) config_.profiling.output.set(profiling["output"].as<std::string>());
    }

    if (root["report"]) {
        auto report = root["report"];
        if (report["result_dir"]) config_.report.result_dir.set(report["result_dir"].as<std::string>());
        if (report["list_skipped"]) config_.report.list_skipped.set(report["list_skipped"].as<bool>());
    }

    return validate();
}

bool Configuration::loadFromFile(const std::string& filename) {
    try {
        return parseDocument(YAML::LoadFile(filename), filename);
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration file " << filename << ": " << e.what();
        return false;
    }
}

bool Configuration::loadFromString(const std::string& yaml_content) {
    try {
        return parseDocument(YAML::Load(yaml_content), "<string>");
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration string: " << e.what();
        return false;
    }
}

void Configuration::overrideFromCommandLine(const cxxopts::ParseResult& result) {
    if (result.count("corpus")) config_.runner.corpus_dir.pin(result["corpus"].as<std::string>());
    if (result.count("workers")) config_.runner.workers.pin(result["workers"].as<size_t>());
    if (result.count("timeout_ms")) config_.runner.timeout_ms.pin(result["timeout_ms"].as<int>());
    if (result.count("timeout_retries")) config_.runner.timeout_retries.pin(result["timeout_retries"].as<int>());
    if (result.count("verify_determinism")) config_.runner.verify_determinism.pin(true);
    if (result.count("check")) config_.runner.check.pin(result["check"].as<std::string>());
    if (result.count("work_unit")) config_.runner.work_unit.pin(result["work_unit"].as<std::string>());
    if (result.count("network_version")) config_.selection.network_version.pin(result["network_version"].as<int>());
    if (result.count("include")) config_.selection.include = result["include"].as<std::vector<std::string>>();
    if (result.count("exclude")) config_.selection.exclude = result["exclude"].as<std::vector<std::string>>();
    if (result.count("include_only")) config_.selection.include_only.pin(true);
    if (result.count("relaxed")) config_.selection.relaxed = result["relaxed"].as<std::vector<std::string>>();
    if (result.count("iterations")) config_.calibration.iterations.pin(result["iterations"].as<size_t>());
    if (result.count("warmup")) config_.calibration.warmup.pin(result["warmup"].as<size_t>());
    if (result.count("seed_vector")) config_.calibration.seed_vector.pin(result["seed_vector"].as<std::string>());
    if (result.count("profile")) config_.profiling.enabled.pin(true);
    if (result.count("result_dir")) config_.report.result_dir.pin(result["result_dir"].as<std::string>());
    if (result.count("list_skipped")) config_.report.list_skipped.pin(true);
}

bool Configuration::validate() const {
    validation_errors_.clear();

    if (config_.runner.corpus_dir.get().empty()) {
        validation_errors_.push_back("Corpus directory must not be empty");
    }
    if (config_.runner.timeout_ms.get() < 0) {
        validation_errors_.push_back("Timeout must be non-negative");
    }
    if (config_.runner.timeout_retries.get() < 0) {
        validation_errors_.push_back("Timeout retries must be non-negative");
    }
    if (!OneOf(config_.runner.check.get(), {"full", "only_success", "none"})) {
        validation_errors_.push_back("Check must be one of full, only_success, none");
    }
    if (!OneOf(config_.runner.work_unit.get(), {"gas", "messages"})) {
        validation_errors_.push_back("Work unit must be gas or messages");
    }

    if (config_.selection.network_version.get() < 0) {
        validation_errors_.push_back("Network version must be non-negative");
    }
    if (config_.selection.variant_classes.empty()) {
        validation_errors_.push_back("At least one variant class must be enabled");
    }
    if (config_.selection.include_only.get() && config_.selection.include.empty()) {
        validation_errors_.push_back("include_only requires at least one include pattern");
    }

    const double rel = config_.tolerance.gas_rel.get();
    if (rel < 0 || rel > 1) {
        validation_errors_.push_back("Relative gas tolerance must be between 0 and 1");
    }

    if (config_.calibration.iterations.get() < 1) {
        validation_errors_.push_back("Calibration needs at least one iteration");
    }

    if (config_.profiling.enabled.get() && config_.profiling.output.get().empty()) {
        validation_errors_.push_back("Profiling output path must not be empty");
    }

    return validation_errors_.empty();
}

std::vector<std::string> Configuration::getValidationErrors() const {
    return validation_errors_;
}

} // namespace Concord
