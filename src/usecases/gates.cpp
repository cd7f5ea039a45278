#include "qg/gates.hpp"

#include <algorithm>
#include <utility>

namespace qg {

namespace {

// Either a real measurement or an exact integer (latencies in ms).
struct Operand {
    double       real{};
    std::int64_t whole{};
    bool         integral{};
};

Operand real_value(double v) { return Operand{v, 0, false}; }
Operand whole_value(std::int64_t v) { return Operand{static_cast<double>(v), v, true}; }

// -1 / 0 / 1; integers compare exactly, mixed pairs in long double (exact for int64)
int compare(const Operand& a, const Operand& b)
{
    if (a.integral && b.integral) return (a.whole > b.whole) - (a.whole < b.whole);
    const long double x = a.integral ? static_cast<long double>(a.whole) : a.real;
    const long double y = b.integral ? static_cast<long double>(b.whole) : b.real;
    return (x > y) - (x < y);
}

GateResult make_gate(std::string key,
                     std::string label,
                     Operand measured,
                     Operand threshold,
                     Comparison cmp,
                     std::string unit)
{
    GateResult g{};
    g.key                = std::move(key);
    g.label              = std::move(label);
    g.measured           = measured.real;
    g.threshold          = threshold.real;
    g.cmp                = cmp;
    g.unit               = std::move(unit);
    g.measured_integral  = measured.integral;
    g.threshold_integral = threshold.integral;
    g.measured_whole     = measured.whole;
    g.threshold_whole    = threshold.whole;
    const int c = compare(measured, threshold);
    g.passed = cmp == Comparison::AtMost ? c <= 0 : c >= 0;
    return g;
}

} // namespace

Verdict evaluate_gates(const Metrics& m, Thresholds t)
{
    Verdict v{};
    v.gates.reserve(5);
    v.gates.push_back(make_gate("error_rate", "Error Rate",
                                real_value(m.error_rate),
                                real_value(t.error_rate_pct),
                                Comparison::AtMost, "%"));
    v.gates.push_back(make_gate("avg_response_time", "Avg Response Time",
                                real_value(m.avg_response_time),
                                whole_value(t.avg_response_ms),
                                Comparison::AtMost, "ms"));
    v.gates.push_back(make_gate("p95_response_time", "P95 Response Time",
                                whole_value(m.p95_response_time),
                                whole_value(t.p95_ms),
                                Comparison::AtMost, "ms"));
    v.gates.push_back(make_gate("p99_response_time", "P99 Response Time",
                                whole_value(m.p99_response_time),
                                whole_value(t.p99_ms),
                                Comparison::AtMost, "ms"));
    v.gates.push_back(make_gate("throughput", "Throughput",
                                real_value(m.throughput),
                                real_value(t.throughput_tps),
                                Comparison::AtLeast, "TPS"));

    v.passed = std::ranges::all_of(v.gates, [](const GateResult& g) { return g.passed; });
    return v;
}

const char* comparison_symbol(Comparison cmp, bool passed)
{
    switch (cmp)
    {
        case Comparison::AtMost: return passed ? "<=" : ">";
        case Comparison::AtLeast: return passed ? ">=" : "<";
    }
    return "?";
}

} // namespace qg
