#pragma once

#include "qg/model.hpp"

namespace qg {

// Evaluate all five gates (no short-circuit). Bounds are inclusive.
Verdict evaluate_gates(const Metrics& m, Thresholds t);

// "<=" / ">" for AtMost, ">=" / "<" for AtLeast depending on outcome
const char* comparison_symbol(Comparison cmp, bool passed);

} // namespace qg
