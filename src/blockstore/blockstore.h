#pragma once

#include <memory>
#include <optional>
#include <string>

#include "absl/container/flat_hash_map.h"
#include "common/cid.h"

namespace Concord {

/**
 * Content-addressed block store consumed by machines.
 * No deletion, no partial reads.
 */
class IBlockstore {
public:
    virtual ~IBlockstore() = default;

    virtual std::optional<std::string> Get(const Cid& cid) const = 0;
    virtual bool Has(const Cid& cid) const = 0;
    virtual void Put(const Cid& cid, std::string block) = 0;
};

/**
 * Plain in-memory store. Used for a vector's decoded archive, which is
 * frozen after loading and then only read. Not synchronized: concurrent
 * replays share it through const pointers only.
 */
class MemoryBlockstore : public IBlockstore {
public:
    MemoryBlockstore() = default;

    std::optional<std::string> Get(const Cid& cid) const override;
    bool Has(const Cid& cid) const override;
    void Put(const Cid& cid, std::string block) override;

    size_t size() const { return blocks_.size(); }

private:
    absl::flat_hash_map<Cid, std::string> blocks_;
};

/**
 * Per-replay view over a shared, read-only base store. Writes land in a
 * private layer so concurrent replays of the same vector never observe each
 * other's intermediate state.
 */
class OverlayBlockstore : public IBlockstore {
public:
    explicit OverlayBlockstore(std::shared_ptr<const IBlockstore> base)
        : base_(std::move(base)) {}

    std::optional<std::string> Get(const Cid& cid) const override;
    bool Has(const Cid& cid) const override;
    void Put(const Cid& cid, std::string block) override;

    size_t written() const { return writes_.size(); }

private:
    std::shared_ptr<const IBlockstore> base_;
    absl::flat_hash_map<Cid, std::string> writes_;
};

} // namespace Concord
