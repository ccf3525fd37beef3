#include "selector_evaluator.h"

#include <charconv>

namespace Concord {

namespace {

const std::set<std::string>& KnownKeys() {
    static const std::set<std::string> keys = {
        kSelectorMinNetworkVersion,
        kSelectorMaxNetworkVersion,
        kSelectorVariantClass,
        kSelectorChaosActor,
        kSelectorCategory,
    };
    return keys;
}

bool ParseVersion(const std::string& text, uint32_t& out) {
    if (text.empty()) return false;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    return ec == std::errc() && ptr == text.data() + text.size();
}

std::vector<std::regex> Compile(const std::vector<std::string>& patterns) {
    std::vector<std::regex> compiled;
    compiled.reserve(patterns.size());
    for (const auto& p : patterns) {
        compiled.emplace_back(p, std::regex::ECMAScript);
    }
    return compiled;
}

SelectorDecision Skip(std::string reason) {
    return SelectorDecision{Verdict::kSkip, std::move(reason)};
}

} // namespace

const char* VerdictName(Verdict verdict) {
    switch (verdict) {
        case Verdict::kRun: return "RUN";
        case Verdict::kSkip: return "SKIP";
        case Verdict::kRunRelaxed: return "RUN_RELAXED";
    }
    return "UNKNOWN";
}

SelectorEvaluator::SelectorEvaluator(SelectorConfig config, const IMachineFactory* factory)
    : config_(std::move(config)),
      factory_(factory),
      include_(Compile(config_.include_patterns)),
      exclude_(Compile(config_.exclude_patterns)),
      relaxed_(Compile(config_.relaxed_patterns)) {}

bool SelectorEvaluator::MatchesAny(const std::vector<std::regex>& patterns, const std::string& id) {
    for (const auto& re : patterns) {
        if (std::regex_search(id, re)) {
            return true;
        }
    }
    return false;
}

SelectorDecision SelectorEvaluator::Evaluate(const TestVector& vector, const Variant& variant) const {
    if (MatchesAny(exclude_, vector.id)) {
        return Skip("excluded by pattern");
    }
    for (const auto& [key, value] : vector.selectors) {
        if (KnownKeys().count(key) == 0) {
            return Skip("unknown selector '" + key + "'");
        }
    }

    if (!MatchesAny(include_, vector.id)) {
        if (config_.include_only && !include_.empty()) {
            return Skip("not included");
        }
        SelectorDecision decision = DefaultEvaluation(vector, variant);
        if (!decision.runs()) {
            return decision;
        }
    }

    if (IsRelaxed(vector)) {
        return SelectorDecision{Verdict::kRunRelaxed, "relaxed tolerance"};
    }
    return SelectorDecision{Verdict::kRun, ""};
}

SelectorDecision SelectorEvaluator::DefaultEvaluation(const TestVector& vector, const Variant& variant) const {
    const uint32_t nv = variant.network_version;

    auto it = vector.selectors.find(kSelectorMinNetworkVersion);
    if (it != vector.selectors.end()) {
        uint32_t min_nv = 0;
        if (!ParseVersion(it->second, min_nv)) {
            return Skip("malformed min_network_version '" + it->second + "'");
        }
        if (nv < min_nv) {
            return Skip("network version " + std::to_string(nv) + " below minimum " + it->second);
        }
    }
    it = vector.selectors.find(kSelectorMaxNetworkVersion);
    if (it != vector.selectors.end()) {
        uint32_t max_nv = 0;
        if (!ParseVersion(it->second, max_nv)) {
            return Skip("malformed max_network_version '" + it->second + "'");
        }
        if (nv > max_nv) {
            return Skip("network version " + std::to_string(nv) + " above maximum " + it->second);
        }
    }

    if (config_.target_network_version != 0 && nv != config_.target_network_version) {
        return Skip("network version " + std::to_string(nv) + " is not the target " +
                    std::to_string(config_.target_network_version));
    }
    if (factory_ != nullptr && !factory_->Supports(nv)) {
        return Skip("machine '" + factory_->Name() + "' does not support network version " + std::to_string(nv));
    }

    it = vector.selectors.find(kSelectorVariantClass);
    const std::string variant_class = it != vector.selectors.end() ? it->second : kDefaultVariantClass;
    if (config_.variant_classes.count(variant_class) == 0) {
        return Skip("variant class '" + variant_class + "' not enabled");
    }

    it = vector.selectors.find(kSelectorChaosActor);
    if (it != vector.selectors.end()) {
        if (it->second != "true" && it->second != "false") {
            return Skip("malformed chaos_actor '" + it->second + "'");
        }
        if (it->second == "true" && config_.variant_classes.count(kChaosVariantClass) == 0) {
            return Skip("requires chaos actor");
        }
    }
    return SelectorDecision{Verdict::kRun, ""};
}

bool SelectorEvaluator::IsRelaxed(const TestVector& vector) const {
    if (MatchesAny(relaxed_, vector.id)) {
        return true;
    }
    auto it = vector.selectors.find(kSelectorVariantClass);
    return it != vector.selectors.end() && config_.relaxed_classes.count(it->second) > 0;
}

} // namespace Concord
