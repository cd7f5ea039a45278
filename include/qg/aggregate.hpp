#pragma once

#include <cstdint>
#include <vector>

#include "qg/model.hpp"

namespace qg {

// 昇順ソート済み sorted から nearest-rank で値を取り出す (index = floor(n*p), 範囲外は末尾)
std::int64_t percentile_nearest_rank(const std::vector<std::int64_t>& sorted, double p);

// Round half-even on the exact binary value, as a correctly rounded "{:.Nf}" would.
double round_to(double value, int digits);

// samples から Metrics を算出（入力は未ソートで可、空なら全てゼロ）
Metrics aggregate_samples(const std::vector<Sample>& samples);

} // namespace qg
