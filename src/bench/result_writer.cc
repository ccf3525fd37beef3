#include "result_writer.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include <glog/logging.h>

namespace fs = std::filesystem;

namespace Concord {

namespace {

constexpr const char* kSamplesHeader = "run,vector_id,category,work_units,elapsed_ns,baseline_offset_ns\n";
constexpr const char* kModelsHeader =
    "run,category,status,samples,slope_ns,intercept_ns,residual_variance,r_squared,throughput_per_sec\n";

std::string FormatFloat(double value) {
    if (value == 0.0) return "0";
    std::stringstream ss;
    ss << std::setprecision(10) << value;
    return ss.str();
}

std::vector<std::string> SplitCsvLine(const std::string& line) {
    std::vector<std::string> fields;
    std::stringstream ss(line);
    std::string field;
    while (std::getline(ss, field, ',')) {
        while (!field.empty() && (field.back() == '\r' || field.back() == ' ')) field.pop_back();
        fields.push_back(field);
    }
    return fields;
}

// Unsigned column value; stoull alone would wrap a leading '-'.
uint64_t ParseUnsignedField(const std::string& field) {
    if (field.find('-') != std::string::npos) {
        throw std::invalid_argument("negative value '" + field + "'");
    }
    size_t pos = 0;
    const uint64_t value = std::stoull(field, &pos);
    if (pos != field.size()) {
        throw std::invalid_argument("trailing characters in '" + field + "'");
    }
    return value;
}

} // namespace

std::string ResultWriter::TimestampLabel() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    std::tm local{};
    localtime_r(&time_t_now, &local);
    std::stringstream timestamp;
    timestamp << std::put_time(&local, "%Y%m%d_%H%M%S");
    return timestamp.str();
}

ResultWriter::ResultWriter(std::string result_dir, std::string run_label)
    : result_dir_(std::move(result_dir)),
      run_label_(run_label.empty() ? TimestampLabel() : std::move(run_label)) {
    samples_path_ = (fs::path(result_dir_) / "samples.csv").string();
    models_path_ = (fs::path(result_dir_) / "models.csv").string();
}

bool ResultWriter::OpenForAppend(const std::string& path, const char* header, std::ofstream& out) const {
    std::error_code ec;
    fs::create_directories(result_dir_, ec);
    if (ec) {
        LOG(ERROR) << "Failed to create result directory " << result_dir_ << ": " << ec.message();
        return false;
    }
    const bool headers_needed = !fs::exists(path, ec) || fs::file_size(path, ec) == 0;
    out.open(path, std::ios::app);
    if (!out.is_open()) {
        LOG(ERROR) << "Could not open " << path << ": " << strerror(errno);
        return false;
    }
    if (headers_needed) {
        out << header;
        LOG(INFO) << "Created new result file with headers: " << path;
    }
    return true;
}

bool ResultWriter::WriteSamples(const std::vector<CalibrationSample>& samples,
                                std::chrono::nanoseconds baseline_offset) {
    std::ofstream file;
    if (!OpenForAppend(samples_path_, kSamplesHeader, file)) {
        return false;
    }
    for (const auto& s : samples) {
        file << run_label_ << ","
             << s.vector_id << ","
             << s.category << ","
             << s.work_units << ","
             << s.elapsed_ns << ","
             << baseline_offset.count() << "\n";
    }
    file.close();
    LOG(INFO) << "Wrote " << samples.size() << " samples to " << samples_path_;
    return static_cast<bool>(file);
}

bool ResultWriter::WriteModel(const std::string& category, const FitResult& fit) {
    std::ofstream file;
    if (!OpenForAppend(models_path_, kModelsHeader, file)) {
        return false;
    }
    file << run_label_ << "," << category << "," << FitStatusName(fit.status) << ",";
    if (fit.model) {
        const CostModel& m = *fit.model;
        file << m.sample_count << ","
             << FormatFloat(m.slope) << ","
             << FormatFloat(m.intercept) << ","
             << FormatFloat(m.residual_variance) << ","
             << FormatFloat(m.r_squared) << ","
             << (m.Throughput() ? FormatFloat(*m.Throughput()) : "") << "\n";
    } else {
        file << ",,,,,\n";
    }
    file.close();
    return static_cast<bool>(file);
}

bool ReadSamplesCsv(const std::string& path, std::vector<CalibrationSample>* samples, std::string* error) {
    std::ifstream in(path);
    if (!in) {
        if (error) *error = "cannot open " + path + ": " + strerror(errno);
        return false;
    }
    std::string line;
    if (!std::getline(in, line)) {
        if (error) *error = path + " is empty";
        return false;
    }
    const std::vector<std::string> header = SplitCsvLine(line);
    int col_id = -1, col_category = -1, col_work = -1, col_elapsed = -1;
    for (size_t i = 0; i < header.size(); ++i) {
        if (header[i] == "vector_id") col_id = static_cast<int>(i);
        else if (header[i] == "category") col_category = static_cast<int>(i);
        else if (header[i] == "work_units") col_work = static_cast<int>(i);
        else if (header[i] == "elapsed_ns") col_elapsed = static_cast<int>(i);
    }
    if (col_work < 0 || col_elapsed < 0) {
        if (error) *error = path + ": header must name work_units and elapsed_ns";
        return false;
    }

    size_t line_no = 1;
    while (std::getline(in, line)) {
        ++line_no;
        if (line.empty() || line[0] == '#') continue;
        const std::vector<std::string> fields = SplitCsvLine(line);
        const auto need = static_cast<size_t>(std::max(col_work, col_elapsed));
        if (fields.size() <= need) {
            if (error) *error = path + ":" + std::to_string(line_no) + ": too few columns";
            return false;
        }
        CalibrationSample s;
        try {
            s.work_units = ParseUnsignedField(fields[col_work]);
            s.elapsed_ns = ParseUnsignedField(fields[col_elapsed]);
        } catch (const std::exception& e) {
            if (error) *error = path + ":" + std::to_string(line_no) + ": " + e.what();
            return false;
        }
        if (col_id >= 0 && static_cast<size_t>(col_id) < fields.size()) s.vector_id = fields[col_id];
        s.category = (col_category >= 0 && static_cast<size_t>(col_category) < fields.size())
                         ? fields[col_category] : "default";
        samples->push_back(std::move(s));
    }
    return true;
}

} // namespace Concord
