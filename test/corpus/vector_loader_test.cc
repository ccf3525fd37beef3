#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

#include "../../src/corpus/vector_loader.h"
#include "../common/ledger_fixture.h"

using namespace Concord;
using namespace ConcordTest;

namespace fs = std::filesystem;

class VectorLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        initial_ = LedgerState{{1, 1000}, {2, 0}};
        expected_ = MakeLedgerVector("transfer_basic", initial_,
                                     {LedgerMachine::TransferMessage(1, 2, 250)}, 18,
                                     {{"category", "transfer"}});
    }

    // Minimal envelope around the given preconditions.variants entries.
    std::string EnvelopeWithVariants(const std::string& variants) const {
        const std::string block = LedgerMachine::EncodeState(initial_);
        const Cid root = Cid::Sum(kCodecRaw, block);
        return std::string(R"({"class": "message", "car": ")") + Base64(MakeCar({{root, block}})) + R"(",
            "preconditions": {"state_tree": {"root_cid": {"/": ")" + root.ToString() + R"("}},
                              "variants": [)" + variants + R"(]},
            "postconditions": {"state_tree": {"root_cid": {"/": ")" + root.ToString() + R"("}}}})";
    }

    LedgerState initial_;
    std::shared_ptr<TestVector> expected_;
};

TEST_F(VectorLoaderTest, DecodesEnvelope) {
    LoadResult result = VectorLoader::LoadString(MakeLedgerEnvelope(*expected_, initial_), "mem", "fallback");
    ASSERT_TRUE(result.ok()) << result.error->reason;
    const TestVector& v = *result.vector;
    EXPECT_EQ(v.id, "transfer_basic");
    EXPECT_EQ(v.selectors.at("category"), "transfer");
    EXPECT_EQ(v.car_root, expected_->car_root);
    EXPECT_TRUE(v.blockstore->Has(v.car_root));
    EXPECT_EQ(v.base_fee, 100u);
    EXPECT_EQ(v.circ_supply, 5000u);
    ASSERT_EQ(v.variants.size(), 1u);
    EXPECT_EQ(v.variants[0].network_version, 18u);
    EXPECT_EQ(v.variants[0].epoch, kFixtureEpoch);
    ASSERT_EQ(v.messages.size(), 1u);
    EXPECT_EQ(v.messages[0].payload, expected_->messages[0].payload);
    EXPECT_EQ(v.postconditions.state_root, expected_->postconditions.state_root);
    ASSERT_EQ(v.postconditions.receipts.size(), 1u);
    EXPECT_EQ(v.postconditions.receipts[0], expected_->postconditions.receipts[0]);
    EXPECT_FALSE(v.postconditions.tolerance.has_value());
}

TEST_F(VectorLoaderTest, SingleVariantFromPreconditions) {
    const std::string block = LedgerMachine::EncodeState(initial_);
    const Cid root = Cid::Sum(kCodecRaw, block);
    const std::string json = std::string(R"({"class": "message", "car": ")") +
        Base64(MakeCar({{root, block}})) + R"(",
        "preconditions": {"state_tree": {"root_cid": {"/": ")" + root.ToString() + R"("}},
                          "epoch": 7, "network_version": 17},
        "postconditions": {"state_tree": {"root_cid": {"/": ")" + root.ToString() + R"("}},
                           "tolerance": {"gas_rel": 0.1}}})";
    LoadResult result = VectorLoader::LoadString(json, "mem", "from_filename");
    ASSERT_TRUE(result.ok()) << result.error->reason;
    EXPECT_EQ(result.vector->id, "from_filename");
    ASSERT_EQ(result.vector->variants.size(), 1u);
    EXPECT_EQ(result.vector->variants[0].id, "nv17");
    EXPECT_EQ(result.vector->variants[0].epoch, 7);
    EXPECT_TRUE(result.vector->messages.empty());
    ASSERT_TRUE(result.vector->postconditions.tolerance.has_value());
    EXPECT_EQ(result.vector->postconditions.tolerance->kind, TolerancePolicy::Kind::kRelaxed);
}

TEST_F(VectorLoaderTest, VariantsWithoutIdsGetDistinctIds) {
    LoadResult result = VectorLoader::LoadString(
        EnvelopeWithVariants(R"({"epoch": 0, "nv": 18}, {"epoch": 500, "nv": 18})"), "mem", "upgrade");
    ASSERT_TRUE(result.ok()) << result.error->reason;
    ASSERT_EQ(result.vector->variants.size(), 2u);
    EXPECT_EQ(result.vector->variants[0].id, "nv18@0");
    EXPECT_EQ(result.vector->variants[1].id, "nv18@500");
}

TEST_F(VectorLoaderTest, DuplicateVariantIdIsCorpusError) {
    auto named = VectorLoader::LoadString(
        EnvelopeWithVariants(R"({"id": "a", "epoch": 0, "nv": 18}, {"id": "a", "epoch": 9, "nv": 19})"),
        "dup.json", "dup");
    ASSERT_FALSE(named.ok());
    EXPECT_EQ(named.error->path, "dup.json");
    EXPECT_NE(named.error->reason.find("duplicate variant id 'a'"), std::string::npos);

    auto derived = VectorLoader::LoadString(
        EnvelopeWithVariants(R"({"epoch": 3, "nv": 18}, {"epoch": 3, "nv": 18})"), "dup.json", "dup");
    ASSERT_FALSE(derived.ok());
    EXPECT_NE(derived.error->reason.find("nv18@3"), std::string::npos);
}

TEST_F(VectorLoaderTest, NegativeAmountIsCorpusError) {
    std::string json = MakeLedgerEnvelope(*expected_, initial_);
    const std::string basefee = "\"basefee\": \"100\"";
    json.replace(json.find(basefee), basefee.size(), "\"basefee\": \"-1\"");
    auto result = VectorLoader::LoadString(json, "neg.json", "neg");
    ASSERT_FALSE(result.ok());
    EXPECT_NE(result.error->reason.find("basefee"), std::string::npos);
}

TEST_F(VectorLoaderTest, ReportsCorpusErrors) {
    auto bad_class = VectorLoader::LoadString(R"({"class": "tipset"})", "a.json", "a");
    ASSERT_FALSE(bad_class.ok());
    EXPECT_EQ(bad_class.error->path, "a.json");
    EXPECT_NE(bad_class.error->reason.find("tipset"), std::string::npos);

    auto not_json = VectorLoader::LoadString("{{{", "b.json", "b");
    EXPECT_FALSE(not_json.ok());

    auto no_car = VectorLoader::LoadString(R"({"class": "message", "preconditions": {}})", "c.json", "c");
    ASSERT_FALSE(no_car.ok());
    EXPECT_NE(no_car.error->reason.find("car"), std::string::npos);
}

TEST_F(VectorLoaderTest, LoadCorpusSkipsBrokenFiles) {
    const fs::path dir = fs::temp_directory_path() / "concord_loader_test";
    fs::remove_all(dir);
    fs::create_directories(dir / "nested");
    {
        std::ofstream(dir / "b_good.json") << MakeLedgerEnvelope(*expected_, initial_);
        auto other = MakeLedgerVector("mint_basic", initial_, {LedgerMachine::MintMessage(5, 1)});
        std::ofstream(dir / "nested" / "a_mint.json") << MakeLedgerEnvelope(*other, initial_);
        std::ofstream(dir / "c_broken.json") << "not json at all: [";
        std::ofstream(dir / "d_duplicate.json") << MakeLedgerEnvelope(*expected_, initial_);
        std::ofstream(dir / "README.md") << "ignored";
    }

    Corpus corpus;
    std::string fatal;
    ASSERT_TRUE(LoadCorpus(dir, corpus, &fatal)) << fatal;
    ASSERT_EQ(corpus.vectors.size(), 2u);
    EXPECT_EQ(corpus.vectors[0]->id, "transfer_basic");
    EXPECT_EQ(corpus.vectors[1]->id, "mint_basic");
    ASSERT_EQ(corpus.errors.size(), 2u);
    EXPECT_NE(corpus.errors[1].reason.find("duplicate"), std::string::npos);
    fs::remove_all(dir);
}

TEST_F(VectorLoaderTest, UnreadableCorpusIsFatal) {
    Corpus corpus;
    std::string fatal;
    EXPECT_FALSE(LoadCorpus("/nonexistent/concord/corpus", corpus, &fatal));
    EXPECT_FALSE(fatal.empty());
}
