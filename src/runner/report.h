#pragma once

#include <ostream>
#include <string>

#include "bench/cost_model.h"
#include "runner/execution_pool.h"

namespace Concord {

/**
 * Human-readable run summary: counts per outcome and per category, then every
 * FAIL and ERROR id with its reasons, skipped items and corpus errors.
 */
void WriteReport(const AggregateReport& report, std::ostream& out, bool list_skipped = false);

std::string FormatReport(const AggregateReport& report, bool list_skipped = false);

// One line per fit: coefficients and goodness of fit, or the reason there is none.
void WriteFitSummary(const std::string& label, const FitResult& fit, std::ostream& out);

// Process exit status for a conformance run: 0 when nothing failed or errored.
int ExitStatusFor(const AggregateReport& report);

} // namespace Concord
