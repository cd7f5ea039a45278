#include "qg/output.hpp"

#include <cstdint>
#include <format>
#include <sstream>
#include <string_view>

#include "qg/gates.hpp"
#include "qg/model.hpp"

namespace qg {

namespace {

constexpr std::string_view kRule =
    "============================================================";

std::string with_unit(const std::string &value, const std::string &unit)
{
    if (unit == "%") return value + unit;
    return value + " " + unit;
}

} // namespace

std::string format_number(double value, bool integral)
{
    if (integral)
    {
        // outside int64 the cast back is undefined; print the double without a fraction
        if (!(value >= -9223372036854775808.0 && value < 9223372036854775808.0))
            return std::format("{:.0f}", value);
        return format_number(static_cast<std::int64_t>(value));
    }
    std::string s = std::format("{}", value);
    if (s.find_first_of(".eEn") == std::string::npos) s += ".0"; // "n": inf/nan
    return s;
}

std::string format_number(std::int64_t value)
{
    return std::format("{}", value);
}

std::string format_measured(const GateResult &g)
{
    return g.measured_integral ? format_number(g.measured_whole) : format_number(g.measured, false);
}

std::string format_threshold(const GateResult &g)
{
    return g.threshold_integral ? format_number(g.threshold_whole) : format_number(g.threshold, false);
}

std::string format_header_text(const std::string &jtl_file)
{
    std::ostringstream os;
    os << "\nStarting Quality Gates Validation...\n";
    os << "JTL File: " << jtl_file << '\n';
    return os.str();
}

std::string format_loaded_text(std::size_t count, const std::string &jtl_file)
{
    return std::format("✓ Successfully read {} samples from {}\n", count, jtl_file);
}

std::string format_metrics_text(const Metrics &m)
{
    std::ostringstream os;
    os << '\n' << kRule << '\n';
    os << "QUALITY GATES VALIDATION\n";
    os << kRule << '\n';
    os << "\nPerformance Metrics:\n";
    auto row = [&](std::string_view label, const std::string &value)
    {
        os << "  " << std::format("{:<21}", std::string(label) + ":") << value << '\n';
    };
    row("Total Samples", std::to_string(m.total_samples));
    row("Error Count", std::to_string(m.error_count));
    row("Error Rate", format_number(m.error_rate, false) + "%");
    row("Avg Response Time", format_number(m.avg_response_time, false) + " ms");
    row("P95 Response Time", std::to_string(m.p95_response_time) + " ms");
    row("P99 Response Time", std::to_string(m.p99_response_time) + " ms");
    row("Throughput", format_number(m.throughput, false) + " TPS");
    return os.str();
}

std::string format_gates_text(const Verdict &v)
{
    std::ostringstream os;
    os << "\nQuality Gate Results:\n";
    for (const auto &g: v.gates)
    {
        os << "  " << (g.passed ? "✓ " : "✗ ")
           << std::format("{:<19}", g.label + ":")
           << with_unit(format_measured(g), g.unit)
           << ' ' << comparison_symbol(g.cmp, g.passed) << ' '
           << with_unit(format_threshold(g), g.unit)
           << (g.passed ? " [PASS]" : " [FAIL]") << '\n';
    }
    os << '\n' << kRule << '\n';
    return os.str();
}

std::string format_verdict_text(const Verdict &v)
{
    std::ostringstream os;
    if (v.passed) os << "\nAll quality gates PASSED!\n";
    else os << "\nSome quality gates FAILED!\n";
    os << kRule << "\n\n";
    return os.str();
}

} // namespace qg
