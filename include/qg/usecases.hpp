#pragma once

#include <vector>

#include "qg/model.hpp"

namespace qg {

struct Report {
    Metrics metrics;
    Verdict verdict;
};

// samples -> Metrics -> Verdict. Pure; safe to call concurrently on independent inputs.
Report evaluate_samples(const std::vector<Sample>& samples, Thresholds thresholds);

// 0 when every gate passed, 1 otherwise
int exit_code_for(const Report& report);

} // namespace qg
