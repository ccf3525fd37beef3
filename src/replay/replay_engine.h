#pragma once

#include <atomic>
#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "common/cid.h"
#include "corpus/test_vector.h"
#include "machine/machine.h"
#include "selector/selector_evaluator.h"

namespace Concord {

enum class Outcome {
    kPass,
    kFail,    // execution completed, postconditions did not match
    kError    // no verdict could be obtained
};

enum class ErrorKind {
    kNone,
    kMissingBlock,
    kInstantiation,
    kFault,
    kTimeout,
    kNondeterminism,
    kPanic
};

/**
 * How much of the postconditions a replay verifies. Benchmarks use the weaker
 * levels to keep comparison cost out of the measurement.
 */
enum class CheckStrength {
    kFull,
    kOnlySuccess,
    kNone
};

const char* OutcomeName(Outcome outcome);
const char* ErrorKindName(ErrorKind kind);

struct ExecutionResult {
    std::string vector_id;
    std::string variant_id;
    Outcome outcome = Outcome::kError;
    ErrorKind error_kind = ErrorKind::kNone;
    Cid actual_state_root;
    std::vector<Receipt> actual_receipts;
    std::chrono::nanoseconds elapsed_raw{0};
    std::optional<std::chrono::nanoseconds> elapsed_calibrated;
    std::vector<std::string> reasons;

    // Filled in by the execution pool.
    std::string category;
    uint64_t work_units = 0;
    Verdict verdict = Verdict::kRun;
    int attempts = 1;
};

struct ReplayOptions {
    Verdict verdict = Verdict::kRun;
    // Applied when verdict is kRunRelaxed.
    TolerancePolicy relaxed_policy = TolerancePolicy::Relaxed(std::nullopt, 0.02);
    CheckStrength check = CheckStrength::kFull;
    const std::atomic<bool>* cancelled = nullptr;
};

struct DeterminismCheck {
    bool deterministic = true;
    ExecutionResult first;
    std::string divergence;
};

/**
 * Replays one vector variant against a fresh machine and classifies the run.
 * Stateless between calls: every replay gets its own blockstore overlay and
 * machine, so calls may run concurrently.
 */
class ReplayEngine {
public:
    explicit ReplayEngine(const IMachineFactory& factory) : factory_(factory) {}

    ExecutionResult Replay(const TestVector& vector, const Variant& variant,
                           const ReplayOptions& options = ReplayOptions()) const;

    /**
     * Replay twice with independent machines and compare root and receipts.
     */
    DeterminismCheck CheckDeterminism(const TestVector& vector, const Variant& variant,
                                      const ReplayOptions& options = ReplayOptions()) const;

    /**
     * Postcondition comparison. Empty result means the run matches.
     */
    static std::vector<std::string> Compare(const Postconditions& expected,
                                            const Cid& actual_root,
                                            const std::vector<Receipt>& actual_receipts,
                                            const TolerancePolicy& policy);

    const IMachineFactory& factory() const { return factory_; }

private:
    static TolerancePolicy EffectivePolicy(const TestVector& vector, const ReplayOptions& options);

    const IMachineFactory& factory_;
};

} // namespace Concord
