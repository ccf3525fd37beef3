#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "absl/hash/hash.h"

namespace Concord {

// Multicodec / multihash codes used by the corpus.
constexpr uint64_t kCodecRaw = 0x55;
constexpr uint64_t kCodecDagCbor = 0x71;
constexpr uint64_t kHashSha256 = 0x12;

/**
 * Content identifier: version, codec and a multihash (code + digest).
 * Cids compare by their binary encoding.
 */
class Cid {
public:
    Cid() = default;
    Cid(uint64_t version, uint64_t codec, uint64_t hash_code, std::string digest);

    /**
     * SHA-256 CIDv1 of a block.
     */
    static Cid Sum(uint64_t codec, std::string_view data);

    /**
     * Parse a binary CID from the front of `data`. On success `consumed` holds
     * the number of bytes read.
     */
    static std::optional<Cid> FromBytes(std::string_view data, size_t* consumed = nullptr);

    /**
     * Parse the multibase text form. Only base32 ('b' prefix) is accepted.
     */
    static std::optional<Cid> FromString(std::string_view text);

    // Binary form, as written to CAR archives.
    const std::string& Bytes() const { return bytes_; }
    std::string ToString() const;

    bool Defined() const { return !bytes_.empty(); }
    uint64_t version() const { return version_; }
    uint64_t codec() const { return codec_; }
    uint64_t hash_code() const { return hash_code_; }
    const std::string& digest() const { return digest_; }

    bool operator==(const Cid& other) const { return bytes_ == other.bytes_; }
    bool operator!=(const Cid& other) const { return bytes_ != other.bytes_; }
    bool operator<(const Cid& other) const { return bytes_ < other.bytes_; }

    // Hashes the binary form, consistent with operator==.
    template <typename H>
    friend H AbslHashValue(H h, const Cid& cid) {
        return H::combine(std::move(h), cid.bytes_);
    }

private:
    uint64_t version_ = 0;
    uint64_t codec_ = 0;
    uint64_t hash_code_ = 0;
    std::string digest_;
    std::string bytes_;
};

// Unsigned LEB128 varint helpers shared with the CAR reader.
void AppendVarint(std::string& out, uint64_t value);
std::optional<uint64_t> ReadVarint(std::string_view data, size_t& offset);

std::string Base32Encode(std::string_view data);
std::optional<std::string> Base32Decode(std::string_view text);

} // namespace Concord
