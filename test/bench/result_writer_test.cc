#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>

#include "../../src/bench/result_writer.h"

namespace fs = std::filesystem;
using namespace Concord;

class ResultWriterTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::path(::testing::TempDir()) /
               ("concord_results_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(dir_);
    }

    void TearDown() override {
        fs::remove_all(dir_);
    }

    static size_t CountLines(const std::string& path, const std::string& prefix) {
        std::ifstream in(path);
        std::string line;
        size_t n = 0;
        while (std::getline(in, line)) {
            if (line.rfind(prefix, 0) == 0) ++n;
        }
        return n;
    }

    fs::path dir_;
};

TEST_F(ResultWriterTest, SamplesRoundTripThroughCsv) {
    ResultWriter writer(dir_.string(), "run1");
    std::vector<CalibrationSample> samples = {
        {"transfer_a/nv18", "transfer", 704, 5100},
        {"mint_b/nv18", "mint", 656, 4800},
    };
    ASSERT_TRUE(writer.WriteSamples(samples, std::chrono::nanoseconds(1200)));

    std::vector<CalibrationSample> read;
    std::string error;
    ASSERT_TRUE(ReadSamplesCsv(writer.samples_path(), &read, &error)) << error;
    ASSERT_EQ(read.size(), 2u);
    EXPECT_EQ(read[0].vector_id, "transfer_a/nv18");
    EXPECT_EQ(read[0].category, "transfer");
    EXPECT_EQ(read[0].work_units, 704u);
    EXPECT_EQ(read[1].elapsed_ns, 4800u);
}

TEST_F(ResultWriterTest, HeaderWrittenOnce) {
    ResultWriter first(dir_.string(), "run1");
    ResultWriter second(dir_.string(), "run2");
    ASSERT_TRUE(first.WriteSamples({{"a", "default", 1, 10}}, std::chrono::nanoseconds(0)));
    ASSERT_TRUE(second.WriteSamples({{"b", "default", 2, 20}}, std::chrono::nanoseconds(0)));
    EXPECT_EQ(CountLines(first.samples_path(), "run,"), 1u);
    EXPECT_EQ(CountLines(first.samples_path(), "run1,"), 1u);
    EXPECT_EQ(CountLines(first.samples_path(), "run2,"), 1u);
}

TEST_F(ResultWriterTest, ModelRowsCarryStatus) {
    ResultWriter writer(dir_.string(), "run1");
    FitResult ok;
    ok.status = FitStatus::kOk;
    ok.model = CostModel{3.0, 7.0, 0.0, 1.0, 20};
    FitResult missing;
    missing.detail = "fewer than two distinct work unit values";
    ASSERT_TRUE(writer.WriteModel("transfer", ok));
    ASSERT_TRUE(writer.WriteModel("mint", missing));

    std::ifstream in(writer.models_path());
    std::stringstream contents;
    contents << in.rdbuf();
    EXPECT_NE(contents.str().find("run1,transfer,OK,20,3,7,0,1,"), std::string::npos);
    EXPECT_NE(contents.str().find("run1,mint,INSUFFICIENT_DATA,"), std::string::npos);
}

TEST_F(ResultWriterTest, ReadsMinimalCsv) {
    fs::create_directories(dir_);
    const std::string path = (dir_ / "minimal.csv").string();
    {
        std::ofstream out(path);
        out << "work_units,elapsed_ns\n"
            << "# warm cache\n"
            << "10,130\n"
            << "20,250\n";
    }
    std::vector<CalibrationSample> read;
    std::string error;
    ASSERT_TRUE(ReadSamplesCsv(path, &read, &error)) << error;
    ASSERT_EQ(read.size(), 2u);
    EXPECT_EQ(read[0].category, "default");
    EXPECT_EQ(read[1].work_units, 20u);
}

TEST_F(ResultWriterTest, RejectsMalformedCsv) {
    fs::create_directories(dir_);
    const std::string no_columns = (dir_ / "no_columns.csv").string();
    const std::string bad_number = (dir_ / "bad_number.csv").string();
    const std::string negative = (dir_ / "negative.csv").string();
    {
        std::ofstream(no_columns) << "vector_id,elapsed_ns\na,1\n";
        std::ofstream(bad_number) << "work_units,elapsed_ns\nten,1\n";
        std::ofstream(negative) << "work_units,elapsed_ns\n10,-5\n";
    }
    std::vector<CalibrationSample> read;
    std::string error;
    EXPECT_FALSE(ReadSamplesCsv(no_columns, &read, &error));
    EXPECT_NE(error.find("work_units"), std::string::npos);
    EXPECT_FALSE(ReadSamplesCsv(bad_number, &read, &error));
    EXPECT_FALSE(ReadSamplesCsv(negative, &read, &error));
    EXPECT_NE(error.find("negative"), std::string::npos);
    EXPECT_TRUE(read.empty());
    EXPECT_FALSE(ReadSamplesCsv((dir_ / "absent.csv").string(), &read, &error));
}
