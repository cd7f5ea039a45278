#include "qg/output.hpp"

#include <sstream>

#include "qg/gates.hpp"
#include "qg/json.hpp"
#include "qg/model.hpp"
#include "qg/usecases.hpp"

namespace qg
{
std::string build_report_json(const std::string &jtl_file,
                              const Thresholds &thresholds,
                              const Report &report)
{
    const Metrics &m = report.metrics;
    const Verdict &v = report.verdict;

    std::ostringstream os;
    os << "{";
    os << R"("jtl_file":")" << json_escape(jtl_file) << R"(",)";
    os << R"("passed":)" << (v.passed ? "true" : "false") << ",";
    os << R"("thresholds":{)"
            << R"("error_rate":)" << format_number(thresholds.error_rate_pct, false) << ","
            << R"("avg_response_time":)" << thresholds.avg_response_ms << ","
            << R"("p95_response_time":)" << thresholds.p95_ms << ","
            << R"("p99_response_time":)" << thresholds.p99_ms << ","
            << R"("throughput":)" << format_number(thresholds.throughput_tps, false)
            << "},";
    os << R"("metrics":{)"
            << R"("total_samples":)" << m.total_samples << ","
            << R"("error_count":)" << m.error_count << ","
            << R"("error_rate":)" << format_number(m.error_rate, false) << ","
            << R"("avg_response_time":)" << format_number(m.avg_response_time, false) << ","
            << R"("p95_response_time":)" << m.p95_response_time << ","
            << R"("p99_response_time":)" << m.p99_response_time << ","
            << R"("throughput":)" << format_number(m.throughput, false)
            << "},";
    os << R"("gates":[)";
    for (size_t i = 0; i < v.gates.size(); ++i)
    {
        const auto &g = v.gates[i];
        if (i) os << ",";
        os << R"({"name":")" << json_escape(g.key)
                << R"(","label":")" << json_escape(g.label)
                << R"(","measured":)" << format_measured(g)
                << R"(,"threshold":)" << format_threshold(g)
                << R"(,"comparison":")" << comparison_symbol(g.cmp, true)
                << R"(","unit":")" << json_escape(g.unit)
                << R"(","passed":)" << (g.passed ? "true" : "false") << "}";
    }
    os << "]";
    os << "}";
    return os.str();
}
} // namespace qg
