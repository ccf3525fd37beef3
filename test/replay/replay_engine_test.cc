#include <gtest/gtest.h>

#include "../../src/replay/replay_engine.h"
#include "../common/ledger_fixture.h"
#include "../common/scripted_machines.h"

using namespace Concord;
using namespace ConcordTest;

class ReplayEngineTest : public ::testing::Test {
protected:
    ReplayEngineTest() : engine_(factory_) {}

    ExecutionResult Replay(const TestVector& v, ReplayOptions options = ReplayOptions()) {
        return engine_.Replay(v, v.variants.front(), options);
    }

    ScriptedFactory factory_;
    ReplayEngine engine_;
};

TEST_F(ReplayEngineTest, MatchingVectorPasses) {
    auto v = MakeTransferVector("transfer");
    ExecutionResult r = Replay(*v);
    EXPECT_EQ(r.outcome, Outcome::kPass);
    EXPECT_EQ(r.error_kind, ErrorKind::kNone);
    EXPECT_EQ(r.vector_id, "transfer");
    EXPECT_EQ(r.variant_id, "nv18");
    EXPECT_EQ(r.actual_state_root, v->postconditions.state_root);
    EXPECT_EQ(r.actual_receipts, v->postconditions.receipts);
    EXPECT_GT(r.elapsed_raw.count(), 0);
    EXPECT_FALSE(r.elapsed_calibrated.has_value());
}

TEST_F(ReplayEngineTest, ReplayIsDeterministic) {
    auto v = MakeTransferVector("transfer");
    ExecutionResult a = Replay(*v);
    ExecutionResult b = Replay(*v);
    EXPECT_EQ(a.actual_state_root, b.actual_state_root);
    EXPECT_EQ(a.actual_receipts, b.actual_receipts);

    DeterminismCheck check = engine_.CheckDeterminism(*v, v->variants.front());
    EXPECT_TRUE(check.deterministic);
    EXPECT_TRUE(check.divergence.empty());
}

TEST_F(ReplayEngineTest, ReplayDoesNotMutateSharedStore) {
    auto v = MakeTransferVector("transfer");
    Replay(*v);
    EXPECT_FALSE(v->blockstore->Has(v->postconditions.state_root));
}

TEST_F(ReplayEngineTest, UnstableMachineIsReportedAsDivergent) {
    auto v = MakeTransferVector("unstable");
    v->variants = {Variant{"unstable", kUnstableVersion, 0}};
    DeterminismCheck check = engine_.CheckDeterminism(*v, v->variants.front());
    EXPECT_FALSE(check.deterministic);
    EXPECT_NE(check.divergence.find("state root"), std::string::npos);
}

TEST_F(ReplayEngineTest, ZeroMessagesIdentityPasses) {
    auto v = MakeLedgerVector("empty", LedgerState{{1, 5}}, {});
    ASSERT_EQ(v->postconditions.state_root, v->car_root);
    ExecutionResult r = Replay(*v);
    EXPECT_EQ(r.outcome, Outcome::kPass);
    EXPECT_TRUE(r.actual_receipts.empty());
    EXPECT_EQ(r.actual_state_root, v->car_root);
}

TEST_F(ReplayEngineTest, MissingRootBlockIsError) {
    auto v = MakeTransferVector("orphan");
    v->blockstore = std::make_shared<MemoryBlockstore>();
    ExecutionResult r = Replay(*v);
    EXPECT_EQ(r.outcome, Outcome::kError);
    EXPECT_EQ(r.error_kind, ErrorKind::kMissingBlock);
    EXPECT_TRUE(r.actual_receipts.empty());
    EXPECT_FALSE(r.reasons.empty());
}

TEST_F(ReplayEngineTest, WrongStateRootFails) {
    auto v = MakeTransferVector("wrong_root");
    v->postconditions.state_root = Cid::Sum(kCodecRaw, "something else");
    ExecutionResult r = Replay(*v);
    EXPECT_EQ(r.outcome, Outcome::kFail);
    ASSERT_EQ(r.reasons.size(), 1u);
    EXPECT_NE(r.reasons[0].find("state root"), std::string::npos);
}

TEST_F(ReplayEngineTest, WrongExitCodeFails) {
    auto v = MakeTransferVector("wrong_exit");
    v->postconditions.receipts[0].exit_code = kLedgerExitInsufficientFunds;
    ExecutionResult r = Replay(*v);
    EXPECT_EQ(r.outcome, Outcome::kFail);
    EXPECT_NE(r.reasons[0].find("exit code"), std::string::npos);
}

TEST_F(ReplayEngineTest, DecodeFaultDiscardsReceipts) {
    auto v = MakeTransferVector("garbage");
    v->messages.push_back(ApplyMessage{"\x07garbage", 0});
    ExecutionResult r = Replay(*v);
    EXPECT_EQ(r.outcome, Outcome::kError);
    EXPECT_EQ(r.error_kind, ErrorKind::kFault);
    EXPECT_TRUE(r.actual_receipts.empty());
    EXPECT_FALSE(r.actual_state_root.Defined());
}

TEST_F(ReplayEngineTest, UnsupportedVersionIsInstantiationError) {
    auto v = MakeTransferVector("future");
    v->variants = {Variant{"nv40", 40, 0}};
    ExecutionResult r = Replay(*v);
    EXPECT_EQ(r.outcome, Outcome::kError);
    EXPECT_EQ(r.error_kind, ErrorKind::kInstantiation);
}

TEST_F(ReplayEngineTest, CancelledReplayIsTimeout) {
    auto v = MakeTransferVector("cancelled");
    std::atomic<bool> cancelled{true};
    ReplayOptions options;
    options.cancelled = &cancelled;
    ExecutionResult r = Replay(*v, options);
    EXPECT_EQ(r.outcome, Outcome::kError);
    EXPECT_EQ(r.error_kind, ErrorKind::kTimeout);
}

TEST_F(ReplayEngineTest, RelaxedToleranceOnGas) {
    // Flat gas: every message costs 1000.
    auto v = MakeLedgerVector("gas", LedgerState{{1, 100}}, {LedgerMachine::MintMessage(1, 1)}, 16);
    ASSERT_EQ(v->postconditions.receipts[0].gas_used, 1000u);

    v->postconditions.receipts[0].gas_used = 990;
    ReplayOptions relaxed;
    relaxed.verdict = Verdict::kRunRelaxed;
    relaxed.relaxed_policy = TolerancePolicy::Relaxed(std::nullopt, 0.02);
    EXPECT_EQ(Replay(*v).outcome, Outcome::kFail);
    EXPECT_EQ(Replay(*v, relaxed).outcome, Outcome::kPass);

    v->postconditions.receipts[0].gas_used = 1300;
    EXPECT_EQ(Replay(*v, relaxed).outcome, Outcome::kFail);
}

TEST_F(ReplayEngineTest, CompareAppliesGasBounds) {
    Postconditions expected;
    expected.state_root = Cid::Sum(kCodecRaw, "root");
    expected.receipts = {Receipt{0, "", 1000}};
    const auto policy = TolerancePolicy::Relaxed(std::nullopt, 0.02);

    EXPECT_TRUE(ReplayEngine::Compare(expected, expected.state_root, {Receipt{0, "", 1010}}, policy).empty());
    EXPECT_FALSE(ReplayEngine::Compare(expected, expected.state_root, {Receipt{0, "", 1300}}, policy).empty());
    EXPECT_FALSE(ReplayEngine::Compare(expected, expected.state_root, {Receipt{0, "", 1010}},
                                       TolerancePolicy::Exact()).empty());
    // Return data stays exact under relaxed gas.
    EXPECT_FALSE(ReplayEngine::Compare(expected, expected.state_root, {Receipt{0, "x", 1000}}, policy).empty());
    // Receipt count mismatch.
    EXPECT_FALSE(ReplayEngine::Compare(expected, expected.state_root, {}, policy).empty());
}

TEST_F(ReplayEngineTest, AbsoluteGasBound) {
    const auto policy = TolerancePolicy::Relaxed(50, std::nullopt);
    EXPECT_TRUE(policy.GasWithin(1000, 1050));
    EXPECT_FALSE(policy.GasWithin(1000, 1051));
    EXPECT_TRUE(TolerancePolicy::Exact().GasWithin(7, 7));
}

TEST_F(ReplayEngineTest, VectorToleranceAppliesWithoutRelaxedVerdict) {
    auto v = MakeLedgerVector("own_tolerance", LedgerState{{1, 100}}, {LedgerMachine::MintMessage(1, 1)}, 16);
    v->postconditions.receipts[0].gas_used = 1040;
    v->postconditions.tolerance = TolerancePolicy::Relaxed(50, std::nullopt);
    EXPECT_EQ(Replay(*v).outcome, Outcome::kPass);
}

TEST_F(ReplayEngineTest, CheckStrength) {
    auto v = MakeTransferVector("weak");
    v->postconditions.state_root = Cid::Sum(kCodecRaw, "ignored");

    ReplayOptions none;
    none.check = CheckStrength::kNone;
    EXPECT_EQ(Replay(*v, none).outcome, Outcome::kPass);

    ReplayOptions only_success;
    only_success.check = CheckStrength::kOnlySuccess;
    EXPECT_EQ(Replay(*v, only_success).outcome, Outcome::kPass);

    v->messages.push_back(ApplyMessage{LedgerMachine::TransferMessage(9, 1, 1), 0});
    EXPECT_EQ(Replay(*v, only_success).outcome, Outcome::kFail);
}
