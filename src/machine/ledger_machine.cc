#include "ledger_machine.h"

#include <cstring>
#include <limits>

#include <glog/logging.h>

namespace Concord {

namespace {

constexpr char kStateMagic[] = "LDG1";
constexpr size_t kMagicSize = 4;
constexpr size_t kTransferSize = 1 + 4 + 4 + 8;
constexpr size_t kMintSize = 1 + 4 + 8;

template<typename T>
void PutLE(std::string& out, T value) {
    for (size_t i = 0; i < sizeof(T); ++i) {
        out.push_back(static_cast<char>((static_cast<uint64_t>(value) >> (8 * i)) & 0xff));
    }
}

template<typename T>
T GetLE(const std::string& in, size_t offset) {
    uint64_t value = 0;
    for (size_t i = 0; i < sizeof(T); ++i) {
        value |= static_cast<uint64_t>(static_cast<uint8_t>(in[offset + i])) << (8 * i);
    }
    return static_cast<T>(value);
}

std::string BalanceReturn(uint64_t balance) {
    std::string ret;
    PutLE<uint64_t>(ret, balance);
    return ret;
}

} // namespace

LedgerRules LedgerRulesFor(uint32_t network_version) {
    if (network_version >= kLedgerMeteredGasVersion) {
        return MeteredGasRules{};
    }
    return FlatGasRules{};
}

uint64_t LedgerGasFor(const LedgerRules& rules, size_t payload_size) {
    struct Visitor {
        size_t size;
        uint64_t operator()(const FlatGasRules& r) const { return r.per_message; }
        uint64_t operator()(const MeteredGasRules& r) const { return r.base + r.per_byte * size; }
    };
    return std::visit(Visitor{payload_size}, rules);
}

LedgerMachine::LedgerMachine(IBlockstore* blockstore, const Cid& initial_root, LedgerState state,
                             LedgerRules rules, const std::atomic<bool>* cancelled)
    : blockstore_(blockstore),
      state_(std::move(state)),
      rules_(rules),
      cancelled_(cancelled),
      cached_root_(initial_root) {}

std::string LedgerMachine::EncodeState(const LedgerState& state) {
    std::string block(kStateMagic, kMagicSize);
    PutLE<uint32_t>(block, static_cast<uint32_t>(state.size()));
    for (const auto& [account, balance] : state) {
        PutLE<uint32_t>(block, account);
        PutLE<uint64_t>(block, balance);
    }
    return block;
}

std::optional<LedgerState> LedgerMachine::DecodeState(const std::string& block) {
    if (block.size() < kMagicSize + 4 || block.compare(0, kMagicSize, kStateMagic) != 0) {
        return std::nullopt;
    }
    const uint32_t count = GetLE<uint32_t>(block, kMagicSize);
    if (block.size() != kMagicSize + 4 + static_cast<size_t>(count) * 12) {
        return std::nullopt;
    }
    LedgerState state;
    size_t offset = kMagicSize + 4;
    for (uint32_t i = 0; i < count; ++i) {
        const uint32_t account = GetLE<uint32_t>(block, offset);
        const uint64_t balance = GetLE<uint64_t>(block, offset + 4);
        if (!state.emplace(account, balance).second) {
            return std::nullopt;  // duplicate account
        }
        offset += 12;
    }
    return state;
}

std::string LedgerMachine::TransferMessage(uint32_t from, uint32_t to, uint64_t amount) {
    std::string msg(1, static_cast<char>(kLedgerOpTransfer));
    PutLE<uint32_t>(msg, from);
    PutLE<uint32_t>(msg, to);
    PutLE<uint64_t>(msg, amount);
    return msg;
}

std::string LedgerMachine::MintMessage(uint32_t to, uint64_t amount) {
    std::string msg(1, static_cast<char>(kLedgerOpMint));
    PutLE<uint32_t>(msg, to);
    PutLE<uint64_t>(msg, amount);
    return msg;
}

Receipt LedgerMachine::Apply(const std::string& message, int64_t epoch) {
    if (cancelled_ && cancelled_->load(std::memory_order_relaxed)) {
        throw MachineFault("replay cancelled");
    }
    if (message.empty()) {
        throw MessageDecodeFault("empty message payload");
    }

    Receipt receipt;
    receipt.gas_used = LedgerGasFor(rules_, message.size());
    const uint8_t op = static_cast<uint8_t>(message[0]);
    switch (op) {
        case kLedgerOpTransfer:
            if (message.size() != kTransferSize) {
                throw MessageDecodeFault("transfer payload has " + std::to_string(message.size()) + " bytes");
            }
            receipt.exit_code = ApplyTransfer(GetLE<uint32_t>(message, 1),
                                              GetLE<uint32_t>(message, 5),
                                              GetLE<uint64_t>(message, 9),
                                              receipt.return_data);
            break;
        case kLedgerOpMint:
            if (message.size() != kMintSize) {
                throw MessageDecodeFault("mint payload has " + std::to_string(message.size()) + " bytes");
            }
            receipt.exit_code = ApplyMint(GetLE<uint32_t>(message, 1),
                                          GetLE<uint64_t>(message, 5),
                                          receipt.return_data);
            break;
        default:
            throw MessageDecodeFault("unknown opcode " + std::to_string(op));
    }
    VLOG(4) << "[LedgerMachine] epoch=" << epoch << " op=" << static_cast<int>(op)
            << " exit=" << receipt.exit_code << " gas=" << receipt.gas_used;
    return receipt;
}

int64_t LedgerMachine::ApplyTransfer(uint32_t from, uint32_t to, uint64_t amount, std::string& ret) {
    auto src = state_.find(from);
    if (src == state_.end()) {
        return kLedgerExitUnknownAccount;
    }
    if (src->second < amount) {
        return kLedgerExitInsufficientFunds;
    }
    if (from != to) {
        const uint64_t dst_balance = state_.count(to) ? state_[to] : 0;
        if (dst_balance > std::numeric_limits<uint64_t>::max() - amount) {
            return kLedgerExitOverflow;
        }
        src->second -= amount;
        state_[to] = dst_balance + amount;
        cached_root_.reset();
    }
    ret = BalanceReturn(state_[to]);
    return kLedgerExitOk;
}

int64_t LedgerMachine::ApplyMint(uint32_t to, uint64_t amount, std::string& ret) {
    const uint64_t balance = state_.count(to) ? state_[to] : 0;
    if (balance > std::numeric_limits<uint64_t>::max() - amount) {
        return kLedgerExitOverflow;
    }
    state_[to] = balance + amount;
    cached_root_.reset();
    ret = BalanceReturn(state_[to]);
    return kLedgerExitOk;
}

Cid LedgerMachine::StateRoot() {
    if (cached_root_) {
        return *cached_root_;
    }
    std::string block = EncodeState(state_);
    Cid root = Cid::Sum(kCodecRaw, block);
    blockstore_->Put(root, std::move(block));
    cached_root_ = root;
    return root;
}

bool LedgerMachineFactory::Supports(uint32_t network_version) const {
    return network_version >= kLedgerMinNetworkVersion && network_version <= kLedgerMaxNetworkVersion;
}

std::unique_ptr<IMachine> LedgerMachineFactory::Create(const MachineContext& context) const {
    if (!Supports(context.network_version)) {
        throw InstantiationError("ledger machine does not support network version " +
                                 std::to_string(context.network_version));
    }
    if (context.blockstore == nullptr) {
        throw InstantiationError("no blockstore");
    }
    auto block = context.blockstore->Get(context.initial_root);
    if (!block) {
        throw InstantiationError("missing state root block " + context.initial_root.ToString());
    }
    auto state = LedgerMachine::DecodeState(*block);
    if (!state) {
        throw InstantiationError("corrupt ledger state at " + context.initial_root.ToString());
    }
    // Until the first mutation the root is the loaded one, whatever its codec.
    return std::make_unique<LedgerMachine>(context.blockstore, context.initial_root, std::move(*state),
                                           LedgerRulesFor(context.network_version),
                                           context.cancelled);
}

} // namespace Concord
