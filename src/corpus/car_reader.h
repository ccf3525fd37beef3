#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "blockstore/blockstore.h"
#include "common/cid.h"

namespace Concord {

/**
 * Reader for CAR v1 archives, optionally gzip-compressed.
 *
 * Layout: varint(header_len) | header | { varint(section_len) | CID | block }*
 * The DAG-CBOR header is skipped; vectors name their root explicitly.
 */
class CarReader {
public:
    /**
     * Decompress `data` when it carries the gzip magic, else return it as is.
     * @return false on a corrupt gzip stream
     */
    static bool MaybeGunzip(std::string_view data, std::string& out, std::string* error);

    /**
     * Load every block section into `store`. sha2-256 blocks are verified
     * against their CID.
     * @return false with `error` set on any malformed section
     */
    static bool Load(std::string_view car, MemoryBlockstore& store, std::string* error);
};

} // namespace Concord
