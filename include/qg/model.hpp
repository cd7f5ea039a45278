#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace qg {

// One JTL row. Missing fields arrive as timestamp=0, elapsed=0, success=true;
// a missing timestamp also clears has_timestamp so it stays out of the throughput window.
struct Sample {
    std::int64_t timestamp{};   // start time, ms since epoch
    std::int64_t elapsed{};     // latency, ms (>= 0)
    bool         success{true};
    bool         has_timestamp{true};
};

struct Metrics {
    std::int64_t total_samples{};
    std::int64_t error_count{};
    double       error_rate{};          // percent, 2 decimals
    double       avg_response_time{};   // ms, 2 decimals
    std::int64_t p95_response_time{};   // ms
    std::int64_t p99_response_time{};   // ms
    double       throughput{};          // samples/s, 2 decimals
};

struct Thresholds {
    double       error_rate_pct  = 2.0;
    std::int64_t avg_response_ms = 500;
    std::int64_t p95_ms          = 800;
    std::int64_t p99_ms          = 1200;
    double       throughput_tps  = 10.0;
};

enum class Comparison { AtMost, AtLeast };

struct GateResult {
    std::string key;        // machine name, e.g. "p95_response_time"
    std::string label;      // display name, e.g. "P95 Response Time"
    double      measured{};
    double      threshold{};
    Comparison  cmp{Comparison::AtMost};
    std::string unit;       // "%", "ms", "TPS"
    bool        measured_integral{};   // print without a fraction
    bool        threshold_integral{};
    std::int64_t measured_whole{};     // exact value when measured_integral
    std::int64_t threshold_whole{};    // exact value when threshold_integral
    bool        passed{};
};

struct Verdict {
    std::vector<GateResult> gates;
    bool passed{};
};

} // namespace qg
