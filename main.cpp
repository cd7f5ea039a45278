// Quality gate validation for JMeter results (C++23)

#include <cstdio>
#include <print>

#include "qg/cli.hpp"
#include "qg/jtl.hpp"
#include "qg/output.hpp"
#include "qg/usecases.hpp"

namespace {
constexpr int kExitUsageOrInput = 2;
}

int main(int argc, char **argv)
{
    qg::Options opt;
    if (argc <= 1)
    {
        qg::print_usage(argv[0]);
        return kExitUsageOrInput;
    }
    switch (qg::parse_args(argc, argv, opt))
    {
        case qg::CliStatus::Ok: break;
        case qg::CliStatus::Help: return 0;
        case qg::CliStatus::Error: return kExitUsageOrInput;
    }

    if (!opt.json) std::print("{}", qg::format_header_text(opt.jtl_file));

    qg::LoadResult loaded = qg::load_jtl_file(opt.jtl_file);
    if (!loaded.ok())
    {
        if (loaded.kind == qg::LoadErrorKind::NotFound)
            std::println(stderr, "✗ Error: {}", loaded.error);
        else
            std::println(stderr, "✗ Error reading JTL file {}: {}", opt.jtl_file, loaded.error);
        return kExitUsageOrInput;
    }

    const qg::Report report = qg::evaluate_samples(loaded.samples, opt.thresholds);

    if (opt.json)
    {
        std::println("{}", qg::build_report_json(opt.jtl_file, opt.thresholds, report));
    }
    else
    {
        std::print("{}", qg::format_loaded_text(loaded.samples.size(), opt.jtl_file));
        std::print("{}", qg::format_metrics_text(report.metrics));
        std::print("{}", qg::format_gates_text(report.verdict));
        std::print("{}", qg::format_verdict_text(report.verdict));
    }

    return qg::exit_code_for(report);
}
