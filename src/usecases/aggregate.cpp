#include "qg/aggregate.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <format>
#include <numeric>
#include <optional>
#include <string>

namespace qg {

std::int64_t percentile_nearest_rank(const std::vector<std::int64_t>& sorted, double p)
{
    if (sorted.empty()) return 0;
    if (p <= 0.0) return sorted.front();
    // floor(n * p) in double, as earlier reports computed it
    auto idx = static_cast<std::size_t>(static_cast<double>(sorted.size()) * p);
    if (idx >= sorted.size()) return sorted.back();
    return sorted[idx];
}

double round_to(double value, int digits)
{
    if (!std::isfinite(value)) return value;
    const std::string s = std::format("{:.{}f}", value, digits);
    double out{};
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    if (ec != std::errc{}) return value;
    return out;
}

Metrics aggregate_samples(const std::vector<Sample>& samples)
{
    Metrics m{};
    if (samples.empty()) return m;

    std::vector<std::int64_t> latencies;
    latencies.reserve(samples.size());
    std::optional<std::int64_t> first_ts;
    std::optional<std::int64_t> last_ts;

    for (const auto& s : samples) {
        ++m.total_samples;
        if (!s.success) ++m.error_count;
        latencies.push_back(s.elapsed);
        // rows without a timeStamp do not widen the window
        if (!s.has_timestamp) continue;
        first_ts = first_ts ? std::min(*first_ts, s.timestamp) : s.timestamp;
        last_ts  = last_ts ? std::max(*last_ts, s.timestamp) : s.timestamp;
    }

    std::ranges::sort(latencies);

    const auto n = static_cast<double>(m.total_samples);
    m.error_rate = round_to(static_cast<double>(m.error_count) / n * 100.0, 2);

    // long double: the sum of int64 latencies may exceed int64
    const long double sum =
        std::accumulate(latencies.begin(), latencies.end(), 0.0L,
                        [](long double acc, std::int64_t v) { return acc + static_cast<long double>(v); });
    m.avg_response_time = round_to(static_cast<double>(sum / static_cast<long double>(m.total_samples)), 2);

    m.p95_response_time = percentile_nearest_rank(latencies, 0.95);
    m.p99_response_time = percentile_nearest_rank(latencies, 0.99);

    // span in double; the int64 difference can overflow
    double duration_s = 0.0;
    if (first_ts && last_ts)
        duration_s = (static_cast<double>(*last_ts) - static_cast<double>(*first_ts)) / 1000.0;
    if (duration_s <= 0.0) duration_s = 1.0;
    m.throughput = round_to(n / duration_s, 2);

    return m;
}

} // namespace qg
