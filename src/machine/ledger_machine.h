#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>

#include "machine/machine.h"

namespace Concord {

// Exit codes produced by the ledger machine.
constexpr int64_t kLedgerExitOk = 0;
constexpr int64_t kLedgerExitInsufficientFunds = 16;
constexpr int64_t kLedgerExitUnknownAccount = 17;
constexpr int64_t kLedgerExitOverflow = 18;

constexpr uint8_t kLedgerOpTransfer = 0x01;
constexpr uint8_t kLedgerOpMint = 0x02;

constexpr uint32_t kLedgerMinNetworkVersion = 16;
constexpr uint32_t kLedgerMaxNetworkVersion = 21;
// First network version charging gas per payload byte.
constexpr uint32_t kLedgerMeteredGasVersion = 18;

struct FlatGasRules {
    uint64_t per_message = 1000;
};

struct MeteredGasRules {
    uint64_t base = 500;
    uint64_t per_byte = 12;
};

// Closed set of rule sets, chosen once per machine from the network version.
using LedgerRules = std::variant<FlatGasRules, MeteredGasRules>;

LedgerRules LedgerRulesFor(uint32_t network_version);
uint64_t LedgerGasFor(const LedgerRules& rules, size_t payload_size);

using LedgerState = std::map<uint32_t, uint64_t>;

/**
 * Small deterministic account ledger. State is one raw block:
 *   "LDG1" | u32 count | { u32 account | u64 balance }*   (little-endian, sorted)
 * Messages:
 *   0x01 | u32 from | u32 to | u64 amount   transfer
 *   0x02 | u32 to | u64 amount              mint
 */
class LedgerMachine : public IMachine {
public:
    LedgerMachine(IBlockstore* blockstore, const Cid& initial_root, LedgerState state,
                  LedgerRules rules, const std::atomic<bool>* cancelled);

    Receipt Apply(const std::string& message, int64_t epoch) override;
    Cid StateRoot() override;

    const LedgerState& state() const { return state_; }

    static std::string EncodeState(const LedgerState& state);
    static std::optional<LedgerState> DecodeState(const std::string& block);

    static std::string TransferMessage(uint32_t from, uint32_t to, uint64_t amount);
    static std::string MintMessage(uint32_t to, uint64_t amount);

private:
    int64_t ApplyTransfer(uint32_t from, uint32_t to, uint64_t amount, std::string& ret);
    int64_t ApplyMint(uint32_t to, uint64_t amount, std::string& ret);

    IBlockstore* blockstore_;
    LedgerState state_;
    LedgerRules rules_;
    const std::atomic<bool>* cancelled_;
    std::optional<Cid> cached_root_;
};

class LedgerMachineFactory : public IMachineFactory {
public:
    std::string Name() const override { return "ledger"; }
    bool Supports(uint32_t network_version) const override;
    std::unique_ptr<IMachine> Create(const MachineContext& context) const override;
};

} // namespace Concord
