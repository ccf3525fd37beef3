#include "replay_engine.h"

#include <algorithm>

#include <glog/logging.h>

#include "blockstore/blockstore.h"

namespace Concord {

namespace {

bool Cancelled(const ReplayOptions& options) {
    return options.cancelled && options.cancelled->load(std::memory_order_relaxed);
}

std::string Hex(const std::string& bytes, size_t limit = 32) {
    static const char kDigits[] = "0123456789abcdef";
    std::string out;
    const size_t n = std::min(bytes.size(), limit);
    out.reserve(n * 2 + 3);
    for (size_t i = 0; i < n; ++i) {
        const auto b = static_cast<uint8_t>(bytes[i]);
        out.push_back(kDigits[b >> 4]);
        out.push_back(kDigits[b & 0xf]);
    }
    if (bytes.size() > limit) out += "...";
    return out.empty() ? "<empty>" : out;
}

void MarkError(ExecutionResult& result, ErrorKind kind, std::string reason) {
    result.outcome = Outcome::kError;
    result.error_kind = kind;
    result.actual_receipts.clear();
    result.actual_state_root = Cid();
    result.reasons.push_back(std::move(reason));
}

} // namespace

const char* OutcomeName(Outcome outcome) {
    switch (outcome) {
        case Outcome::kPass: return "PASS";
        case Outcome::kFail: return "FAIL";
        case Outcome::kError: return "ERROR";
    }
    return "UNKNOWN";
}

const char* ErrorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::kNone: return "none";
        case ErrorKind::kMissingBlock: return "missing_block";
        case ErrorKind::kInstantiation: return "instantiation";
        case ErrorKind::kFault: return "fault";
        case ErrorKind::kTimeout: return "timeout";
        case ErrorKind::kNondeterminism: return "nondeterminism";
        case ErrorKind::kPanic: return "panic";
    }
    return "unknown";
}

TolerancePolicy ReplayEngine::EffectivePolicy(const TestVector& vector, const ReplayOptions& options) {
    if (options.verdict == Verdict::kRunRelaxed) {
        return options.relaxed_policy;
    }
    if (vector.postconditions.tolerance) {
        return *vector.postconditions.tolerance;
    }
    return TolerancePolicy::Exact();
}

std::vector<std::string> ReplayEngine::Compare(const Postconditions& expected,
                                               const Cid& actual_root,
                                               const std::vector<Receipt>& actual_receipts,
                                               const TolerancePolicy& policy) {
    std::vector<std::string> mismatches;
    if (expected.receipts.size() != actual_receipts.size()) {
        mismatches.push_back("receipt count: expected " + std::to_string(expected.receipts.size()) +
                             ", got " + std::to_string(actual_receipts.size()));
    }
    const size_t n = std::min(expected.receipts.size(), actual_receipts.size());
    for (size_t i = 0; i < n; ++i) {
        const Receipt& want = expected.receipts[i];
        const Receipt& got = actual_receipts[i];
        const std::string prefix = "receipt " + std::to_string(i) + ": ";
        if (want.exit_code != got.exit_code) {
            mismatches.push_back(prefix + "exit code expected " + std::to_string(want.exit_code) +
                                 ", got " + std::to_string(got.exit_code));
        }
        if (want.return_data != got.return_data) {
            mismatches.push_back(prefix + "return data expected " + Hex(want.return_data) +
                                 ", got " + Hex(got.return_data));
        }
        if (!policy.GasWithin(want.gas_used, got.gas_used)) {
            mismatches.push_back(prefix + "gas used expected " + std::to_string(want.gas_used) +
                                 ", got " + std::to_string(got.gas_used));
        }
    }
    if (expected.state_root != actual_root) {
        mismatches.push_back("state root expected " + expected.state_root.ToString() +
                             ", got " + actual_root.ToString());
    }
    return mismatches;
}

ExecutionResult ReplayEngine::Replay(const TestVector& vector, const Variant& variant,
                                     const ReplayOptions& options) const {
    ExecutionResult result;
    result.vector_id = vector.id;
    result.variant_id = variant.id;
    result.verdict = options.verdict;

    const auto start = std::chrono::steady_clock::now();
    auto stop_clock = [&]() {
        result.elapsed_raw = std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::steady_clock::now() - start);
    };

    OverlayBlockstore blockstore(vector.blockstore);
    if (!blockstore.Has(vector.car_root)) {
        stop_clock();
        MarkError(result, ErrorKind::kMissingBlock, "missing state root block " + vector.car_root.ToString());
        return result;
    }

    MachineContext context;
    context.blockstore = &blockstore;
    context.initial_root = vector.car_root;
    context.network_version = variant.network_version;
    context.epoch = variant.epoch;
    context.base_fee = vector.base_fee;
    context.circ_supply = vector.circ_supply;
    context.cancelled = options.cancelled;

    std::unique_ptr<IMachine> machine;
    try {
        machine = factory_.Create(context);
    } catch (const InstantiationError& e) {
        stop_clock();
        MarkError(result, ErrorKind::kInstantiation, std::string("instantiation failed: ") + e.what());
        return result;
    }
    if (!machine) {
        stop_clock();
        MarkError(result, ErrorKind::kInstantiation, "factory returned no machine");
        return result;
    }

    try {
        result.actual_receipts.reserve(vector.messages.size());
        for (size_t i = 0; i < vector.messages.size(); ++i) {
            if (Cancelled(options)) {
                stop_clock();
                MarkError(result, ErrorKind::kTimeout, "cancelled before message " + std::to_string(i));
                return result;
            }
            const ApplyMessage& msg = vector.messages[i];
            result.actual_receipts.push_back(machine->Apply(msg.payload, variant.epoch + msg.epoch_offset));
        }
        result.actual_state_root = machine->StateRoot();
    } catch (const MachineFault& e) {
        stop_clock();
        const ErrorKind kind = Cancelled(options) ? ErrorKind::kTimeout
                             : dynamic_cast<const MissingBlockFault*>(&e) ? ErrorKind::kMissingBlock
                             : ErrorKind::kFault;
        MarkError(result, kind, std::string("machine fault: ") + e.what());
        return result;
    }
    stop_clock();

    std::vector<std::string> mismatches;
    switch (options.check) {
        case CheckStrength::kFull:
            mismatches = Compare(vector.postconditions, result.actual_state_root,
                                 result.actual_receipts, EffectivePolicy(vector, options));
            break;
        case CheckStrength::kOnlySuccess:
            for (size_t i = 0; i < result.actual_receipts.size(); ++i) {
                if (result.actual_receipts[i].exit_code != 0) {
                    mismatches.push_back("receipt " + std::to_string(i) + ": non-zero exit code " +
                                         std::to_string(result.actual_receipts[i].exit_code));
                }
            }
            break;
        case CheckStrength::kNone:
            break;
    }

    if (mismatches.empty()) {
        result.outcome = Outcome::kPass;
    } else {
        result.outcome = Outcome::kFail;
        result.reasons = std::move(mismatches);
    }
    VLOG(2) << "[ReplayEngine] " << vector.id << "/" << variant.id << " " << OutcomeName(result.outcome)
            << " in " << result.elapsed_raw.count() << "ns";
    return result;
}

DeterminismCheck ReplayEngine::CheckDeterminism(const TestVector& vector, const Variant& variant,
                                                const ReplayOptions& options) const {
    DeterminismCheck check;
    check.first = Replay(vector, variant, options);
    ExecutionResult second = Replay(vector, variant, options);

    if (check.first.outcome != second.outcome) {
        check.divergence = std::string("outcome ") + OutcomeName(check.first.outcome) +
                           " vs " + OutcomeName(second.outcome);
    } else if (check.first.actual_state_root != second.actual_state_root) {
        check.divergence = "state root " + check.first.actual_state_root.ToString() +
                           " vs " + second.actual_state_root.ToString();
    } else if (check.first.actual_receipts != second.actual_receipts) {
        check.divergence = "receipts differ between replays";
    }
    check.deterministic = check.divergence.empty();
    if (!check.deterministic) {
        LOG(ERROR) << "Nondeterministic replay of " << vector.id << "/" << variant.id << ": " << check.divergence;
    }
    return check;
}

} // namespace Concord
