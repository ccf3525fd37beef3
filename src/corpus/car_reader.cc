#include "car_reader.h"

#include <zlib.h>
#include <glog/logging.h>

namespace Concord {

namespace {

constexpr size_t kInflateChunk = 64 * 1024;

bool IsGzip(std::string_view data) {
    return data.size() >= 2 &&
           static_cast<uint8_t>(data[0]) == 0x1f &&
           static_cast<uint8_t>(data[1]) == 0x8b;
}

} // namespace

bool CarReader::MaybeGunzip(std::string_view data, std::string& out, std::string* error) {
    if (!IsGzip(data)) {
        out.assign(data.data(), data.size());
        return true;
    }

    z_stream stream{};
    // 16 + MAX_WBITS selects the gzip wrapper.
    if (inflateInit2(&stream, 16 + MAX_WBITS) != Z_OK) {
        if (error) *error = "inflateInit2 failed";
        return false;
    }
    stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
    stream.avail_in = static_cast<uInt>(data.size());

    out.clear();
    char chunk[kInflateChunk];
    int ret = Z_OK;
    do {
        stream.next_out = reinterpret_cast<Bytef*>(chunk);
        stream.avail_out = sizeof(chunk);
        ret = inflate(&stream, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            if (error) {
                *error = std::string("gzip inflate failed: ") + (stream.msg ? stream.msg : "unknown");
            }
            inflateEnd(&stream);
            return false;
        }
        out.append(chunk, sizeof(chunk) - stream.avail_out);
    } while (ret != Z_STREAM_END && (stream.avail_in > 0 || stream.avail_out == 0));
    inflateEnd(&stream);

    if (ret != Z_STREAM_END) {
        if (error) *error = "truncated gzip stream";
        return false;
    }
    return true;
}

bool CarReader::Load(std::string_view car, MemoryBlockstore& store, std::string* error) {
    size_t offset = 0;
    auto header_len = ReadVarint(car, offset);
    if (!header_len || *header_len == 0 || *header_len > car.size() - offset) {
        if (error) *error = "invalid CAR header length";
        return false;
    }
    offset += *header_len;

    size_t sections = 0;
    while (offset < car.size()) {
        auto section_len = ReadVarint(car, offset);
        if (!section_len || *section_len > car.size() - offset) {
            if (error) *error = "truncated CAR section " + std::to_string(sections);
            return false;
        }
        std::string_view section = car.substr(offset, *section_len);
        offset += *section_len;

        size_t cid_len = 0;
        auto cid = Cid::FromBytes(section, &cid_len);
        if (!cid) {
            if (error) *error = "malformed CID in CAR section " + std::to_string(sections);
            return false;
        }
        std::string_view block = section.substr(cid_len);
        if (cid->hash_code() == kHashSha256 &&
                Cid::Sum(cid->codec(), block).digest() != cid->digest()) {
            if (error) *error = "block hash mismatch for " + cid->ToString();
            return false;
        }
        store.Put(*cid, std::string(block));
        ++sections;
    }
    VLOG(3) << "[CarReader] loaded " << sections << " blocks";
    return true;
}

} // namespace Concord
