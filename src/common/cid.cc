#include "cid.h"

#include <openssl/evp.h>
#include <glog/logging.h>

namespace Concord {

namespace {

constexpr char kBase32Alphabet[] = "abcdefghijklmnopqrstuvwxyz234567";
constexpr uint64_t kCodecDagPb = 0x70;
constexpr size_t kSha256Size = 32;

} // namespace

void AppendVarint(std::string& out, uint64_t value) {
    while (value >= 0x80) {
        out.push_back(static_cast<char>((value & 0x7f) | 0x80));
        value >>= 7;
    }
    out.push_back(static_cast<char>(value));
}

std::optional<uint64_t> ReadVarint(std::string_view data, size_t& offset) {
    uint64_t value = 0;
    int shift = 0;
    while (offset < data.size()) {
        uint8_t byte = static_cast<uint8_t>(data[offset++]);
        if (shift == 63 && byte > 1) {
            return std::nullopt;  // overflow
        }
        value |= static_cast<uint64_t>(byte & 0x7f) << shift;
        if ((byte & 0x80) == 0) {
            return value;
        }
        shift += 7;
        if (shift > 63) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

std::string Base32Encode(std::string_view data) {
    std::string out;
    out.reserve((data.size() * 8 + 4) / 5);
    uint32_t buffer = 0;
    int bits = 0;
    for (unsigned char c : data) {
        buffer = (buffer << 8) | c;
        bits += 8;
        while (bits >= 5) {
            out.push_back(kBase32Alphabet[(buffer >> (bits - 5)) & 0x1f]);
            bits -= 5;
        }
    }
    if (bits > 0) {
        out.push_back(kBase32Alphabet[(buffer << (5 - bits)) & 0x1f]);
    }
    return out;
}

std::optional<std::string> Base32Decode(std::string_view text) {
    std::string out;
    out.reserve(text.size() * 5 / 8);
    uint32_t buffer = 0;
    int bits = 0;
    for (char c : text) {
        int v;
        if (c >= 'a' && c <= 'z') {
            v = c - 'a';
        } else if (c >= 'A' && c <= 'Z') {
            v = c - 'A';
        } else if (c >= '2' && c <= '7') {
            v = c - '2' + 26;
        } else if (c == '=') {
            break;
        } else {
            return std::nullopt;
        }
        buffer = (buffer << 5) | static_cast<uint32_t>(v);
        bits += 5;
        if (bits >= 8) {
            out.push_back(static_cast<char>((buffer >> (bits - 8)) & 0xff));
            bits -= 8;
        }
    }
    return out;
}

Cid::Cid(uint64_t version, uint64_t codec, uint64_t hash_code, std::string digest)
    : version_(version), codec_(codec), hash_code_(hash_code), digest_(std::move(digest)) {
    if (version_ != 0) {
        AppendVarint(bytes_, version_);
        AppendVarint(bytes_, codec_);
    }
    AppendVarint(bytes_, hash_code_);
    AppendVarint(bytes_, digest_.size());
    bytes_ += digest_;
}

Cid Cid::Sum(uint64_t codec, std::string_view data) {
    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int md_len = 0;
    if (EVP_Digest(data.data(), data.size(), md, &md_len, EVP_sha256(), nullptr) != 1) {
        LOG(FATAL) << "EVP_Digest(sha256) failed";
    }
    return Cid(1, codec, kHashSha256, std::string(reinterpret_cast<char*>(md), md_len));
}

std::optional<Cid> Cid::FromBytes(std::string_view data, size_t* consumed) {
    size_t offset = 0;
    // CIDv0 is a bare sha2-256 multihash.
    if (data.size() >= 2 + kSha256Size &&
            static_cast<uint8_t>(data[0]) == kHashSha256 &&
            static_cast<uint8_t>(data[1]) == kSha256Size) {
        if (consumed) *consumed = 2 + kSha256Size;
        return Cid(0, kCodecDagPb, kHashSha256, std::string(data.substr(2, kSha256Size)));
    }

    auto version = ReadVarint(data, offset);
    if (!version || *version != 1) {
        return std::nullopt;
    }
    auto codec = ReadVarint(data, offset);
    auto hash_code = codec ? ReadVarint(data, offset) : std::nullopt;
    auto digest_len = hash_code ? ReadVarint(data, offset) : std::nullopt;
    if (!digest_len || *digest_len > data.size() - offset) {
        return std::nullopt;
    }
    std::string digest(data.substr(offset, *digest_len));
    offset += *digest_len;
    if (consumed) *consumed = offset;
    return Cid(1, *codec, *hash_code, std::move(digest));
}

std::optional<Cid> Cid::FromString(std::string_view text) {
    if (text.empty() || text[0] != 'b') {
        return std::nullopt;
    }
    auto raw = Base32Decode(text.substr(1));
    if (!raw) {
        return std::nullopt;
    }
    size_t consumed = 0;
    auto cid = FromBytes(*raw, &consumed);
    if (!cid || consumed != raw->size()) {
        return std::nullopt;
    }
    return cid;
}

std::string Cid::ToString() const {
    if (bytes_.empty()) {
        return "<undef>";
    }
    // v0 has no base32 form; it is printed from its multihash bytes.
    return "b" + Base32Encode(bytes_);
}

} // namespace Concord
