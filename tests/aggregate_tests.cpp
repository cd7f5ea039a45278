#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <string_view>
#include <vector>

#include "qg/aggregate.hpp"

using namespace qg;

static void assert_true(bool cond, std::string_view msg)
{
    if (!cond)
    {
        std::cerr << "ASSERT FAILED: " << msg << std::endl;
        std::exit(1);
    }
}

static bool approx(double a, double b, double eps = 1e-9)
{
    return std::fabs(a - b) <= eps;
}

static std::vector<Sample> samples_from(const std::vector<std::int64_t>& elapsed,
                                        std::int64_t ts_step = 100)
{
    std::vector<Sample> out;
    out.reserve(elapsed.size());
    for (size_t i = 0; i < elapsed.size(); ++i)
    {
        out.push_back(Sample{static_cast<std::int64_t>(i) * ts_step, elapsed[i], true});
    }
    return out;
}

static void test_empty()
{
    Metrics m = aggregate_samples({});
    assert_true(m.total_samples == 0 && m.error_count == 0, "empty counts");
    assert_true(approx(m.error_rate, 0.0) && approx(m.avg_response_time, 0.0), "empty rate/avg");
    assert_true(m.p95_response_time == 0 && m.p99_response_time == 0, "empty percentiles");
    assert_true(approx(m.throughput, 0.0), "empty throughput");
}

static void test_percentile_ten_values()
{
    std::vector<std::int64_t> sorted{100, 200, 300, 400, 500, 600, 700, 800, 900, 1000};
    assert_true(percentile_nearest_rank(sorted, 0.95) == 1000, "n=10 p95 -> index 9");
    assert_true(percentile_nearest_rank(sorted, 0.99) == 1000, "n=10 p99 -> index 9");
    assert_true(percentile_nearest_rank(sorted, 0.5) == 600, "n=10 p50 -> index 5");
}

static void test_percentile_edges()
{
    assert_true(percentile_nearest_rank({}, 0.95) == 0, "empty list -> 0");
    assert_true(percentile_nearest_rank({42}, 0.95) == 42, "singleton");
    assert_true(percentile_nearest_rank({1, 2, 3}, 0.0) == 1, "p0 -> first");
    assert_true(percentile_nearest_rank({1, 2, 3}, 1.0) == 3, "p100 clamps to last");

    std::vector<std::int64_t> hundred;
    for (int i = 1; i <= 100; ++i) hundred.push_back(i);
    // floor(100*0.95) = 95 -> 96th value, not interpolated
    assert_true(percentile_nearest_rank(hundred, 0.95) == 96, "n=100 p95=96");
    assert_true(percentile_nearest_rank(hundred, 0.99) == 100, "n=100 p99=100");
}

static void test_three_sample_scenario()
{
    std::vector<Sample> s{{0, 100, true}, {500, 200, true}, {1000, 300, true}};
    Metrics m = aggregate_samples(s);
    assert_true(m.total_samples == 3 && m.error_count == 0, "scenario counts");
    assert_true(approx(m.avg_response_time, 200.0), "scenario avg=200.0");
    assert_true(m.p95_response_time == 300 && m.p99_response_time == 300, "scenario p95/p99=300");
    assert_true(approx(m.error_rate, 0.0), "scenario error_rate=0.0");
    assert_true(approx(m.throughput, 3.0), "scenario throughput=3.0");
}

static void test_unsorted_input()
{
    std::vector<Sample> s{{2000, 300, true}, {0, 100, true}, {1000, 200, false}, {500, 50, true}};
    Metrics m = aggregate_samples(s);
    assert_true(m.error_count == 1, "unsorted error count");
    assert_true(approx(m.error_rate, 25.0), "unsorted error rate");
    assert_true(approx(m.avg_response_time, 162.5), "unsorted avg");
    assert_true(m.p95_response_time == 300, "unsorted p95 uses max");
    assert_true(approx(m.throughput, 2.0), "4 samples over 2s");
}

static void test_zero_window_defaults_to_one_second()
{
    std::vector<Sample> s{{1700000000000, 10, true}, {1700000000000, 20, true}, {1700000000000, 30, true}};
    Metrics m = aggregate_samples(s);
    assert_true(approx(m.throughput, 3.0), "identical timestamps -> 1s window");

    std::vector<Sample> missing{{0, 10, true, false}, {0, 20, true, false}};
    assert_true(approx(aggregate_samples(missing).throughput, 2.0), "missing timestamps -> 1s window");
}

static void test_absent_timestamp_outside_window()
{
    // one row without a timeStamp must not stretch the window back to epoch 0
    std::vector<Sample> s{{1700000000000, 100, true, true},
                          {0, 200, true, false},
                          {1700000001000, 300, true, true}};
    Metrics m = aggregate_samples(s);
    assert_true(m.total_samples == 3, "absent-timestamp row still counted");
    assert_true(approx(m.avg_response_time, 200.0), "absent-timestamp row still in latency stats");
    assert_true(approx(m.throughput, 3.0), "window spans only present timestamps");

    // a real timestamp of 0 is still part of the window
    std::vector<Sample> zero{{0, 10, true, true}, {2000, 10, true, true}};
    assert_true(approx(aggregate_samples(zero).throughput, 1.0), "present zero timestamp counts");
}

static void test_int64_extremes()
{
    constexpr std::int64_t kMax = std::numeric_limits<std::int64_t>::max();
    std::vector<Sample> s{{kMax, kMax, true}, {-kMax, kMax, true}};
    Metrics m = aggregate_samples(s);
    assert_true(m.avg_response_time > 0.0, "huge latencies keep a non-negative average");
    assert_true(std::fabs(m.avg_response_time - 9.223372036854775807e18) <= 1e4, "average of two int64 max");
    assert_true(m.p95_response_time == kMax && m.p99_response_time == kMax, "percentiles are int64 max");
    assert_true(m.throughput >= 0.0 && m.throughput < 0.01, "full int64 span gives ~0 TPS, not a wrapped value");
}

static void test_ten_samples_one_failed()
{
    std::vector<Sample> s = samples_from({10, 20, 30, 40, 50, 60, 70, 80, 90, 100});
    s[3].success = false;
    Metrics m = aggregate_samples(s);
    assert_true(m.error_count == 1, "one failure counted");
    assert_true(approx(m.error_rate, 10.0), "error rate 10.0");
}

static void test_rounding()
{
    assert_true(approx(round_to(2.675, 2), 2.67), "2.675 is below the tie in binary");
    assert_true(approx(round_to(0.125, 2), 0.12), "exact tie rounds to even (down)");
    assert_true(approx(round_to(0.375, 2), 0.38), "exact tie rounds to even (up)");
    assert_true(approx(round_to(100.0 / 7.0, 2), 14.29), "100/7");

    Metrics m = aggregate_samples(samples_from({1, 2, 2}));
    assert_true(approx(m.avg_response_time, 1.67), "avg 5/3 -> 1.67");

    std::vector<Sample> s = samples_from({5, 5, 5}, 1000);
    s[0].success = false;
    Metrics m2 = aggregate_samples(s);
    assert_true(approx(m2.error_rate, 33.33), "1/3 errors -> 33.33");
    assert_true(approx(m2.throughput, 1.5), "3 samples over 2s");
}

static void test_percentile_properties()
{
    const std::vector<std::vector<std::int64_t>> lists{
        {7},
        {5, 1},
        {9, 3, 3, 3, 1},
        {1000, 1, 500, 250, 750, 125, 875, 0, 999, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12, 13},
    };
    for (const auto& l : lists)
    {
        Metrics m = aggregate_samples(samples_from(l));
        std::int64_t lo = l.front();
        std::int64_t hi = l.front();
        for (auto v : l)
        {
            lo = std::min(lo, v);
            hi = std::max(hi, v);
        }
        assert_true(m.p99_response_time >= m.p95_response_time, "p99 >= p95");
        assert_true(m.p95_response_time >= lo && m.p99_response_time <= hi, "percentiles within [min, max]");
    }
}

static void test_idempotent()
{
    std::vector<Sample> s{{10, 120, true}, {5, 80, false}, {900, 310, true}, {450, 95, true}};
    Metrics a = aggregate_samples(s);
    Metrics b = aggregate_samples(s);
    assert_true(a.total_samples == b.total_samples && a.error_count == b.error_count, "same counts");
    assert_true(a.error_rate == b.error_rate && a.avg_response_time == b.avg_response_time, "same rate/avg");
    assert_true(a.p95_response_time == b.p95_response_time && a.p99_response_time == b.p99_response_time,
                "same percentiles");
    assert_true(a.throughput == b.throughput, "same throughput");
}

static void test_error_rate_monotonic()
{
    std::vector<Sample> s = samples_from({1, 1, 1, 1, 1, 1, 1});
    double prev = aggregate_samples(s).error_rate;
    for (auto& x : s)
    {
        x.success = false;
        double cur = aggregate_samples(s).error_rate;
        assert_true(cur >= prev, "error rate never decreases as failures grow");
        prev = cur;
    }
    assert_true(approx(prev, 100.0), "all failed -> 100.0");
}

int main()
{
    test_empty();
    test_percentile_ten_values();
    test_percentile_edges();
    test_three_sample_scenario();
    test_unsorted_input();
    test_zero_window_defaults_to_one_second();
    test_absent_timestamp_outside_window();
    test_int64_extremes();
    test_ten_samples_one_failed();
    test_rounding();
    test_percentile_properties();
    test_idempotent();
    test_error_rate_monotonic();
    std::cout << "aggregate tests: OK" << std::endl;
    return 0;
}
