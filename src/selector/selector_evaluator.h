#pragma once

#include <cstdint>
#include <regex>
#include <set>
#include <string>
#include <vector>

#include "corpus/test_vector.h"
#include "machine/machine.h"

namespace Concord {

// Selector keys understood by the evaluator. Anything else fails closed.
constexpr char kSelectorMinNetworkVersion[] = "min_network_version";
constexpr char kSelectorMaxNetworkVersion[] = "max_network_version";
constexpr char kSelectorVariantClass[] = "variant_class";
constexpr char kSelectorChaosActor[] = "chaos_actor";
constexpr char kSelectorCategory[] = "category";

constexpr char kDefaultVariantClass[] = "default";
constexpr char kChaosVariantClass[] = "chaos";

struct SelectorConfig {
    // 0 runs every network version the machine factory supports.
    uint32_t target_network_version = 0;
    std::set<std::string> variant_classes{kDefaultVariantClass};
    std::vector<std::string> include_patterns;
    std::vector<std::string> exclude_patterns;
    // When set, vectors matching no include pattern are skipped.
    bool include_only = false;
    std::vector<std::string> relaxed_patterns;
    std::set<std::string> relaxed_classes;
};

enum class Verdict {
    kRun,
    kSkip,
    kRunRelaxed
};

const char* VerdictName(Verdict verdict);

struct SelectorDecision {
    Verdict verdict = Verdict::kSkip;
    std::string reason;

    bool runs() const { return verdict != Verdict::kSkip; }
};

/**
 * Decides whether a vector variant runs under the active configuration.
 *
 * Precedence: explicit exclude > explicit include > default evaluation.
 * Unknown selector keys always skip, even for included ids.
 */
class SelectorEvaluator {
public:
    /**
     * @param factory used to drop variants the machine cannot instantiate; may be null
     * @throws std::regex_error on an invalid pattern
     */
    SelectorEvaluator(SelectorConfig config, const IMachineFactory* factory);

    SelectorDecision Evaluate(const TestVector& vector, const Variant& variant) const;

private:
    SelectorDecision DefaultEvaluation(const TestVector& vector, const Variant& variant) const;
    bool IsRelaxed(const TestVector& vector) const;

    static bool MatchesAny(const std::vector<std::regex>& patterns, const std::string& id);

    SelectorConfig config_;
    const IMachineFactory* factory_;
    std::vector<std::regex> include_;
    std::vector<std::regex> exclude_;
    std::vector<std::regex> relaxed_;
};

} // namespace Concord
