#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>

#include "blockstore/blockstore.h"
#include "common/cid.h"
#include "corpus/test_vector.h"

namespace Concord {

/**
 * The machine could not be created (unsupported version, unreadable root,
 * corrupt initial state).
 */
class InstantiationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * A message could not be applied under the machine's own semantics.
 * Distinct from a non-zero exit code, which is a normal receipt.
 */
class MachineFault : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class MissingBlockFault : public MachineFault {
public:
    explicit MissingBlockFault(const Cid& cid)
        : MachineFault("missing block " + cid.ToString()) {}
};

class MessageDecodeFault : public MachineFault {
public:
    using MachineFault::MachineFault;
};

/**
 * Everything a factory needs to build one machine for one replay.
 * The blockstore is owned by the replay and outlives the machine.
 */
struct MachineContext {
    IBlockstore* blockstore = nullptr;
    Cid initial_root;
    uint32_t network_version = 0;
    int64_t epoch = 0;
    uint64_t base_fee = 0;
    uint64_t circ_supply = 0;
    // Set when the replay has been abandoned; machines may poll it.
    const std::atomic<bool>* cancelled = nullptr;
};

class IMachine {
public:
    virtual ~IMachine() = default;

    /**
     * Apply one message at the given epoch.
     * @throws MachineFault when the message cannot be applied
     */
    virtual Receipt Apply(const std::string& message, int64_t epoch) = 0;

    /**
     * Flush pending state and return its root.
     * @throws MachineFault on a storage failure
     */
    virtual Cid StateRoot() = 0;
};

/**
 * Builds fresh machines. Passed explicitly to the replay engine and the
 * execution pool; there is no process-wide registry.
 */
class IMachineFactory {
public:
    virtual ~IMachineFactory() = default;

    virtual std::string Name() const = 0;
    virtual bool Supports(uint32_t network_version) const = 0;

    /**
     * @throws InstantiationError
     */
    virtual std::unique_ptr<IMachine> Create(const MachineContext& context) const = 0;
};

} // namespace Concord
