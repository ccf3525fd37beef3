#include "blockstore.h"

namespace Concord {

std::optional<std::string> MemoryBlockstore::Get(const Cid& cid) const {
    auto it = blocks_.find(cid);
    if (it == blocks_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool MemoryBlockstore::Has(const Cid& cid) const {
    return blocks_.contains(cid);
}

void MemoryBlockstore::Put(const Cid& cid, std::string block) {
    blocks_.insert_or_assign(cid, std::move(block));
}

std::optional<std::string> OverlayBlockstore::Get(const Cid& cid) const {
    auto it = writes_.find(cid);
    if (it != writes_.end()) {
        return it->second;
    }
    if (!base_) {
        return std::nullopt;
    }
    return base_->Get(cid);
}

bool OverlayBlockstore::Has(const Cid& cid) const {
    return writes_.contains(cid) || (base_ && base_->Has(cid));
}

void OverlayBlockstore::Put(const Cid& cid, std::string block) {
    writes_.insert_or_assign(cid, std::move(block));
}

} // namespace Concord
