#include <gtest/gtest.h>
#include <zlib.h>

#include "../../src/corpus/car_reader.h"
#include "../common/ledger_fixture.h"

using namespace Concord;
using namespace ConcordTest;

namespace {

std::string Gzip(const std::string& data) {
    z_stream stream{};
    EXPECT_EQ(deflateInit2(&stream, Z_DEFAULT_COMPRESSION, Z_DEFLATED, 16 + MAX_WBITS, 8,
                           Z_DEFAULT_STRATEGY), Z_OK);
    std::string out(deflateBound(&stream, data.size()) + 32, '\0');
    stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
    stream.avail_in = static_cast<uInt>(data.size());
    stream.next_out = reinterpret_cast<Bytef*>(out.data());
    stream.avail_out = static_cast<uInt>(out.size());
    EXPECT_EQ(deflate(&stream, Z_FINISH), Z_STREAM_END);
    out.resize(stream.total_out);
    deflateEnd(&stream);
    return out;
}

} // namespace

TEST(CarReaderTest, LoadsBlocks) {
    Cid a = Cid::Sum(kCodecRaw, "alpha");
    Cid b = Cid::Sum(kCodecDagCbor, "beta");
    MemoryBlockstore store;
    std::string error;
    ASSERT_TRUE(CarReader::Load(MakeCar({{a, "alpha"}, {b, "beta"}}), store, &error)) << error;
    EXPECT_EQ(store.size(), 2u);
    EXPECT_EQ(store.Get(b).value_or(""), "beta");
}

TEST(CarReaderTest, RejectsHashMismatch) {
    Cid a = Cid::Sum(kCodecRaw, "alpha");
    MemoryBlockstore store;
    std::string error;
    EXPECT_FALSE(CarReader::Load(MakeCar({{a, "tampered"}}), store, &error));
    EXPECT_NE(error.find("hash mismatch"), std::string::npos);
}

TEST(CarReaderTest, RejectsTruncatedSection) {
    Cid a = Cid::Sum(kCodecRaw, "alpha");
    std::string car = MakeCar({{a, "alpha"}});
    car.resize(car.size() - 3);
    MemoryBlockstore store;
    std::string error;
    EXPECT_FALSE(CarReader::Load(car, store, &error));
}

TEST(CarReaderTest, GunzipsCompressedArchives) {
    Cid a = Cid::Sum(kCodecRaw, "alpha");
    const std::string car = MakeCar({{a, "alpha"}});
    std::string out;
    std::string error;
    ASSERT_TRUE(CarReader::MaybeGunzip(Gzip(car), out, &error)) << error;
    EXPECT_EQ(out, car);

    // Plain input passes through untouched.
    ASSERT_TRUE(CarReader::MaybeGunzip(car, out, &error));
    EXPECT_EQ(out, car);
}

TEST(CarReaderTest, CorruptGzipFails) {
    std::string broken = Gzip("some archive bytes");
    broken.resize(broken.size() / 2);
    std::string out;
    std::string error;
    EXPECT_FALSE(CarReader::MaybeGunzip(broken, out, &error));
    EXPECT_FALSE(error.empty());
}
