#pragma once

#include <string>

#include "qg/model.hpp"

namespace qg
{
struct Options
{
    std::string jtl_file;    // JMeter result file (required)
    Thresholds thresholds;   // gate limits, defaults per Thresholds
    bool json = false;       // JSON report instead of text
};
} // namespace qg
