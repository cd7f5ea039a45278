#include "qg/usecases.hpp"

#include "qg/aggregate.hpp"
#include "qg/gates.hpp"

namespace qg {

Report evaluate_samples(const std::vector<Sample>& samples, Thresholds thresholds)
{
    Report r{};
    r.metrics = aggregate_samples(samples);
    r.verdict = evaluate_gates(r.metrics, thresholds);
    return r;
}

int exit_code_for(const Report& report)
{
    return report.verdict.passed ? 0 : 1;
}

} // namespace qg
