#pragma once

#include <chrono>
#include <fstream>
#include <string>
#include <vector>

#include "bench/cost_model.h"

namespace Concord {

/**
 * Appends benchmark samples and fitted models to CSV files under a result
 * directory. Headers are written only when a file is created.
 */
class ResultWriter {
public:
    /**
     * Constructor
     * @param result_dir Directory for samples.csv and models.csv, created on demand
     * @param run_label Tag written on every row; defaults to a local timestamp
     */
    explicit ResultWriter(std::string result_dir, std::string run_label = "");

    bool WriteSamples(const std::vector<CalibrationSample>& samples, std::chrono::nanoseconds baseline_offset);
    bool WriteModel(const std::string& category, const FitResult& fit);

    const std::string& samples_path() const { return samples_path_; }
    const std::string& models_path() const { return models_path_; }
    const std::string& run_label() const { return run_label_; }

    static std::string TimestampLabel();

private:
    bool OpenForAppend(const std::string& path, const char* header, std::ofstream& out) const;

    std::string result_dir_;
    std::string run_label_;
    std::string samples_path_;
    std::string models_path_;
};

/**
 * Reads samples back from a CSV with at least `work_units` and `elapsed_ns`
 * columns; `vector_id` and `category` are picked up when present.
 */
bool ReadSamplesCsv(const std::string& path, std::vector<CalibrationSample>* samples, std::string* error);

} // namespace Concord
