#ifndef CONCORD_CONFIGURATION_H_
#define CONCORD_CONFIGURATION_H_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace YAML {
class Node;
}

namespace cxxopts {
class ParseResult;
}

namespace Concord {

/**
 * Configuration value that can be overridden by environment variables
 */
template<typename T>
class ConfigValue {
public:
    ConfigValue() = default;
    ConfigValue(T default_value, const std::string& env_var = "")
        : value_(default_value), env_var_(env_var) {}

    T get() const {
        if (!pinned_ && !env_var_.empty()) {
            auto env_value = getEnvValue();
            if (env_value.has_value()) {
                return env_value.value();
            }
        }
        return value_;
    }

    void set(T value) { value_ = value; }
    // Takes precedence over the environment variable.
    void pin(T value) { value_ = value; pinned_ = true; }
    const std::string& env_var() const { return env_var_; }

private:
    T value_;
    std::string env_var_;
    bool pinned_ = false;

    std::optional<T> getEnvValue() const;
};

/**
 * Main configuration structure
 */
struct ConcordConfig {
    struct Runner {
        ConfigValue<std::string> corpus_dir{"corpus", "CONCORD_CORPUS_DIR"};
        // 0 uses every hardware thread.
        ConfigValue<size_t> workers{0, "CONCORD_WORKERS"};
        // Per-replay timeout; 0 disables it.
        ConfigValue<int> timeout_ms{0, "CONCORD_TIMEOUT_MS"};
        ConfigValue<int> timeout_retries{0, "CONCORD_TIMEOUT_RETRIES"};
        ConfigValue<bool> verify_determinism{false, "CONCORD_VERIFY_DETERMINISM"};
        // full, only_success or none
        ConfigValue<std::string> check{"full", "CONCORD_CHECK"};
        // gas or messages
        ConfigValue<std::string> work_unit{"gas", "CONCORD_WORK_UNIT"};
    } runner;

    struct Selection {
        // 0 runs every network version the machine supports.
        ConfigValue<int> network_version{0, "CONCORD_NETWORK_VERSION"};
        std::vector<std::string> variant_classes{"default"};
        std::vector<std::string> include;
        std::vector<std::string> exclude;
        ConfigValue<bool> include_only{false, "CONCORD_INCLUDE_ONLY"};
        std::vector<std::string> relaxed;
        std::vector<std::string> relaxed_classes;
    } selection;

    // Gas bounds applied to relaxed vectors. 0 leaves a bound unset.
    struct Tolerance {
        ConfigValue<size_t> gas_abs{0, "CONCORD_TOLERANCE_GAS_ABS"};
        ConfigValue<double> gas_rel{0.02, "CONCORD_TOLERANCE_GAS_REL"};
    } tolerance;

    struct Calibration {
        ConfigValue<size_t> iterations{200, "CONCORD_CALIBRATION_ITERATIONS"};
        ConfigValue<size_t> warmup{20, "CONCORD_CALIBRATION_WARMUP"};
        // Empty picks the first selected vector.
        ConfigValue<std::string> seed_vector{"", "CONCORD_CALIBRATION_SEED"};
    } calibration;

    struct Profiling {
        ConfigValue<bool> enabled{false, "CONCORD_ENABLE_PROFILING"};
        ConfigValue<std::string> output{"concord_profile.csv", "CONCORD_PROFILE_OUTPUT"};
    } profiling;

    struct Report {
        ConfigValue<std::string> result_dir{"results", "CONCORD_RESULT_DIR"};
        ConfigValue<bool> list_skipped{false, "CONCORD_LIST_SKIPPED"};
    } report;
};

/**
 * Configuration manager singleton
 */
class Configuration {
public:
    static Configuration& getInstance();

    // Load configuration from file
    bool loadFromFile(const std::string& filename);

    // Load configuration from YAML string
    bool loadFromString(const std::string& yaml_content);

    // Command line values take precedence over YAML and environment
    void overrideFromCommandLine(const cxxopts::ParseResult& result);

    // Back to compiled-in defaults
    void reset();

    const ConcordConfig& config() const { return config_; }
    ConcordConfig& config() { return config_; }

    // Validation
    bool validate() const;
    std::vector<std::string> getValidationErrors() const;

private:
    Configuration() = default;
    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    ConcordConfig config_;
    mutable std::vector<std::string> validation_errors_;

    bool parseDocument(const YAML::Node& yaml, const std::string& origin);
};

// Template specializations for getEnvValue
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const;

template<>
std::optional<size_t> ConfigValue<size_t>::getEnvValue() const;

template<>
std::optional<double> ConfigValue<double>::getEnvValue() const;

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const;

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const;

} // namespace Concord

#endif // CONCORD_CONFIGURATION_H_
