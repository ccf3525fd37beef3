#include <gtest/gtest.h>
#include <limits>

#include "../../src/machine/ledger_machine.h"
#include "../common/ledger_fixture.h"

using namespace Concord;
using namespace ConcordTest;

class LedgerMachineTest : public ::testing::Test {
protected:
    std::unique_ptr<IMachine> Create(uint32_t nv, const LedgerState& state) {
        root_ = PutLedgerState(store_, state);
        MachineContext context;
        context.blockstore = &store_;
        context.initial_root = root_;
        context.network_version = nv;
        return factory_.Create(context);
    }

    LedgerMachineFactory factory_;
    MemoryBlockstore store_;
    Cid root_;
};

TEST_F(LedgerMachineTest, StateEncodingIsCanonical) {
    LedgerState state{{9, 1}, {2, 300}};
    const std::string block = LedgerMachine::EncodeState(state);
    auto decoded = LedgerMachine::DecodeState(block);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, state);
    EXPECT_FALSE(LedgerMachine::DecodeState("LDG1").has_value());
    EXPECT_FALSE(LedgerMachine::DecodeState(block.substr(0, block.size() - 1)).has_value());
}

TEST_F(LedgerMachineTest, RuleSetFollowsNetworkVersion) {
    EXPECT_TRUE(std::holds_alternative<FlatGasRules>(LedgerRulesFor(17)));
    EXPECT_TRUE(std::holds_alternative<MeteredGasRules>(LedgerRulesFor(18)));
    EXPECT_EQ(LedgerGasFor(LedgerRulesFor(16), 17), 1000u);
    EXPECT_EQ(LedgerGasFor(LedgerRulesFor(21), 17), 500u + 12u * 17u);
}

TEST_F(LedgerMachineTest, TransferMovesFunds) {
    auto machine = Create(18, {{1, 1000}, {2, 5}});
    Receipt r = machine->Apply(LedgerMachine::TransferMessage(1, 2, 250), 0);
    EXPECT_EQ(r.exit_code, kLedgerExitOk);
    EXPECT_EQ(r.gas_used, 704u);
    ASSERT_EQ(r.return_data.size(), 8u);
    EXPECT_EQ(static_cast<uint8_t>(r.return_data[0]), 255u);  // 255 little-endian

    const Cid root = machine->StateRoot();
    EXPECT_NE(root, root_);
    auto block = store_.Get(root);
    ASSERT_TRUE(block.has_value());
    auto state = LedgerMachine::DecodeState(*block);
    ASSERT_TRUE(state.has_value());
    EXPECT_EQ(state->at(1), 750u);
    EXPECT_EQ(state->at(2), 255u);
}

TEST_F(LedgerMachineTest, FailedTransferLeavesStateUnchanged) {
    auto machine = Create(16, {{1, 10}});
    Receipt insufficient = machine->Apply(LedgerMachine::TransferMessage(1, 2, 11), 0);
    EXPECT_EQ(insufficient.exit_code, kLedgerExitInsufficientFunds);
    EXPECT_TRUE(insufficient.return_data.empty());
    EXPECT_EQ(insufficient.gas_used, 1000u);

    Receipt unknown = machine->Apply(LedgerMachine::TransferMessage(7, 1, 1), 0);
    EXPECT_EQ(unknown.exit_code, kLedgerExitUnknownAccount);
    EXPECT_EQ(machine->StateRoot(), root_);
}

TEST_F(LedgerMachineTest, MintOverflowIsAnExitCode) {
    auto machine = Create(18, {{1, std::numeric_limits<uint64_t>::max()}});
    Receipt r = machine->Apply(LedgerMachine::MintMessage(1, 1), 0);
    EXPECT_EQ(r.exit_code, kLedgerExitOverflow);
}

TEST_F(LedgerMachineTest, MalformedMessagesFault) {
    auto machine = Create(18, {{1, 1}});
    EXPECT_THROW(machine->Apply("", 0), MessageDecodeFault);
    EXPECT_THROW(machine->Apply(std::string(1, '\x09'), 0), MessageDecodeFault);
    EXPECT_THROW(machine->Apply(LedgerMachine::MintMessage(1, 1).substr(0, 5), 0), MessageDecodeFault);
}

TEST_F(LedgerMachineTest, FactoryRejectsBadContexts) {
    EXPECT_FALSE(factory_.Supports(15));
    EXPECT_TRUE(factory_.Supports(16));
    EXPECT_TRUE(factory_.Supports(21));
    EXPECT_FALSE(factory_.Supports(22));
    EXPECT_THROW(Create(22, {{1, 1}}), InstantiationError);

    MachineContext missing;
    missing.blockstore = &store_;
    missing.initial_root = Cid::Sum(kCodecRaw, "absent");
    missing.network_version = 18;
    EXPECT_THROW(factory_.Create(missing), InstantiationError);

    Cid corrupt = Cid::Sum(kCodecRaw, "not a ledger");
    store_.Put(corrupt, "not a ledger");
    MachineContext bad = missing;
    bad.initial_root = corrupt;
    EXPECT_THROW(factory_.Create(bad), InstantiationError);
}

TEST_F(LedgerMachineTest, CancelledMachineFaults) {
    std::atomic<bool> cancelled{true};
    root_ = PutLedgerState(store_, {{1, 1}});
    LedgerMachine machine(&store_, root_, {{1, 1}}, LedgerRulesFor(18), &cancelled);
    EXPECT_THROW(machine.Apply(LedgerMachine::MintMessage(1, 1), 0), MachineFault);
}
