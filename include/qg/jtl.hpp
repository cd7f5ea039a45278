#pragma once

#include <cstddef>
#include <istream>
#include <string>
#include <vector>

#include "qg/model.hpp"

namespace qg {

enum class LoadErrorKind {
    None = 0,
    NotFound,
    Format,
};

struct LoadResult {
    std::vector<Sample> samples;
    LoadErrorKind kind{LoadErrorKind::None};
    std::string error;     // message when kind != None
    std::size_t line{};    // 1-based line of a Format error, 0 otherwise

    bool ok() const { return kind == LoadErrorKind::None; }
};

// Parse a JMeter CSV result log. Columns timeStamp/elapsed/success are located
// by header name; everything else is ignored.
LoadResult parse_jtl(std::istream& in);

// Open path and parse it. kind = NotFound when the file cannot be opened.
LoadResult load_jtl_file(const std::string& path);

} // namespace qg
