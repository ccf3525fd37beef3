#include "report.h"

#include <sstream>

namespace Concord {

namespace {

void WriteCounts(std::ostream& out, const OutcomeCounts& counts) {
    out << "pass=" << counts.passed
        << " fail=" << counts.failed
        << " error=" << counts.errored
        << " total=" << counts.total();
}

// Left-aligned to a fixed column without touching the caller's stream flags.
std::string Padded(const std::string& label, size_t width = 24) {
    return label.size() >= width ? label : label + std::string(width - label.size(), ' ');
}

} // namespace

void WriteReport(const AggregateReport& report, std::ostream& out, bool list_skipped) {
    out << "== Summary ==\n";
    out << "  ";
    WriteCounts(out, report.counts);
    out << " skipped=" << report.skipped.size()
        << " corpus_errors=" << report.corpus_errors.size() << "\n";

    if (!report.by_category.empty()) {
        out << "== By category ==\n";
        for (const auto& [category, counts] : report.by_category) {
            out << "  " << Padded(category) << " ";
            WriteCounts(out, counts);
            out << "\n";
        }
    }

    bool header = false;
    for (const auto& r : report.results) {
        if (r.outcome == Outcome::kPass) continue;
        if (!header) {
            out << "== Failures and errors ==\n";
            header = true;
        }
        out << "  " << OutcomeName(r.outcome) << " " << r.vector_id << "/" << r.variant_id;
        if (r.error_kind != ErrorKind::kNone) {
            out << " [" << ErrorKindName(r.error_kind) << "]";
        }
        if (r.attempts > 1) {
            out << " attempts=" << r.attempts;
        }
        out << "\n";
        for (const auto& reason : r.reasons) {
            out << "      " << reason << "\n";
        }
    }

    if (report.harness_defects > 0) {
        out << "== Harness defects ==\n";
        out << "  " << report.harness_defects << " replays were not deterministic\n";
    }

    if (!report.corpus_errors.empty()) {
        out << "== Corpus errors ==\n";
        for (const auto& e : report.corpus_errors) {
            out << "  " << e.path << ": " << e.reason << "\n";
        }
    }

    if (list_skipped && !report.skipped.empty()) {
        out << "== Skipped ==\n";
        for (const auto& s : report.skipped) {
            out << "  " << s.vector_id << "/" << s.variant_id << ": " << s.reason << "\n";
        }
    }
}

std::string FormatReport(const AggregateReport& report, bool list_skipped) {
    std::ostringstream ss;
    WriteReport(report, ss, list_skipped);
    return ss.str();
}

void WriteFitSummary(const std::string& label, const FitResult& fit, std::ostream& out) {
    out << "  " << Padded(label) << " ";
    if (!fit.model) {
        out << FitStatusName(fit.status) << " (" << fit.detail << ")\n";
        return;
    }
    const CostModel& m = *fit.model;
    out << "n=" << m.sample_count
        << " slope=" << m.slope << "ns/unit"
        << " intercept=" << m.intercept << "ns"
        << " r2=" << m.r_squared
        << " resid_var=" << m.residual_variance;
    if (auto throughput = m.Throughput()) {
        out << " throughput=" << *throughput << "/s";
    }
    out << "\n";
}

int ExitStatusFor(const AggregateReport& report) {
    return (report.counts.failed == 0 && report.counts.errored == 0) ? 0 : 1;
}

} // namespace Concord
