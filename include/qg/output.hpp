#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace qg
{
// Forward declarations to avoid heavy includes in header
struct Metrics;
struct Verdict;
struct Thresholds;
struct Report;
struct GateResult;

// Whole numbers without a fraction, reals in shortest form with a decimal point ("2.0", "3.33")
std::string format_number(double value, bool integral);

std::string format_number(std::int64_t value);

// A gate's measured / threshold value, exact when integer-typed
std::string format_measured(const GateResult &g);

std::string format_threshold(const GateResult &g);

// Text formatting (returns complete text block with trailing newlines)
std::string format_header_text(const std::string &jtl_file);

std::string format_loaded_text(std::size_t count, const std::string &jtl_file);

std::string format_metrics_text(const Metrics &m);

std::string format_gates_text(const Verdict &v);

std::string format_verdict_text(const Verdict &v);

// Final JSON (single object string without trailing newline)
std::string build_report_json(const std::string &jtl_file,
                              const Thresholds &thresholds,
                              const Report &report);
} // namespace qg
