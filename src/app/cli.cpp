#include "qg/cli.hpp"

#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <optional>
#include <print>
#include <string>
#include <string_view>

using namespace std::string_view_literals;

namespace qg {

void print_usage(const char *prog)
{
    std::println("Validate JMeter test results against quality gates");
    std::println("Usage: {} --jtl-file PATH [options]", prog);
    std::println("Options:");
    std::println("  --jtl-file PATH              JMeter JTL (CSV) result file (required)");
    std::println(
        "  --error-rate-threshold F     Max error rate in percent (default: 2.0)");
    std::println(
        "  --avg-response-threshold N   Max average response time in ms (default: 500)");
    std::println(
        "  --p95-threshold N            Max p95 response time in ms (default: 800)");
    std::println(
        "  --p99-threshold N            Max p99 response time in ms (default: 1200)");
    std::println(
        "  --throughput-threshold F     Min throughput in TPS (default: 10.0)");
    std::println("  --json                       Output the report as JSON");
    std::println("  -h, --help                   Show this help");
    std::println("");
    std::println("Exit status: 0 all gates passed, 1 a gate failed, 2 usage or input error");
    std::println("");
    std::println("Examples:");
    std::println("  {} --jtl-file results.jtl", prog);
    std::println(
        "  {} --jtl-file results.jtl --error-rate-threshold 2.0 --p95-threshold 800",
        prog);
}

namespace {

std::optional<std::int64_t> parse_ms(std::string_view s)
{
    std::int64_t v{};
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (s.empty() || ec != std::errc{} || ptr != s.data() + s.size() || v < 0)
        return std::nullopt;
    return v;
}

std::optional<double> parse_real(std::string_view s)
{
    double v{};
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (s.empty() || ec != std::errc{} || ptr != s.data() + s.size() ||
        !std::isfinite(v) || v < 0.0)
        return std::nullopt;
    return v;
}

} // namespace

CliStatus parse_args(int argc, char **argv, Options &opt)
{
    for (int i = 1; i < argc; ++i)
    {
        std::string_view a = argv[i];

        // "--name value" or "--name=value"
        auto take_value = [&](std::string_view name, std::string &val) -> bool
        {
            if (a == name && i + 1 < argc)
            {
                val = argv[++i];
                return true;
            }
            if (a.size() > name.size() + 1 && a.starts_with(name) &&
                a[name.size()] == '=')
            {
                val = std::string(a.substr(name.size() + 1));
                return true;
            }
            std::println(stderr, "invalid {} usage", name);
            return false;
        };
        auto is_opt = [&](std::string_view name)
        {
            return a == name ||
                   (a.starts_with(name) && a.size() > name.size() && a[name.size()] == '=');
        };

        if (a == "-h"sv || a == "--help"sv)
        {
            print_usage(argv[0]);
            return CliStatus::Help;
        }
        if (a == "--json"sv)
        {
            opt.json = true;
        }
        else if (is_opt("--jtl-file"))
        {
            if (!take_value("--jtl-file", opt.jtl_file)) return CliStatus::Error;
        }
        else if (is_opt("--error-rate-threshold") || is_opt("--throughput-threshold"))
        {
            const bool rate = is_opt("--error-rate-threshold");
            const std::string_view name = rate ? "--error-rate-threshold"sv : "--throughput-threshold"sv;
            std::string val;
            if (!take_value(name, val)) return CliStatus::Error;
            auto v = parse_real(val);
            if (!v)
            {
                std::println(stderr, "invalid {} value: {}", name, val);
                return CliStatus::Error;
            }
            (rate ? opt.thresholds.error_rate_pct : opt.thresholds.throughput_tps) = *v;
        }
        else if (is_opt("--avg-response-threshold") || is_opt("--p95-threshold") ||
                 is_opt("--p99-threshold"))
        {
            std::string_view name;
            std::int64_t *slot = nullptr;
            if (is_opt("--avg-response-threshold"))
            {
                name = "--avg-response-threshold";
                slot = &opt.thresholds.avg_response_ms;
            }
            else if (is_opt("--p95-threshold"))
            {
                name = "--p95-threshold";
                slot = &opt.thresholds.p95_ms;
            }
            else
            {
                name = "--p99-threshold";
                slot = &opt.thresholds.p99_ms;
            }
            std::string val;
            if (!take_value(name, val)) return CliStatus::Error;
            auto v = parse_ms(val);
            if (!v)
            {
                std::println(stderr, "invalid {} value: {}", name, val);
                return CliStatus::Error;
            }
            *slot = *v;
        }
        else
        {
            std::println(stderr, "unknown argument: {}", a);
            return CliStatus::Error;
        }
    }
    if (opt.jtl_file.empty())
    {
        std::println(stderr, "missing --jtl-file PATH");
        return CliStatus::Error;
    }
    return CliStatus::Ok;
}

} // namespace qg
