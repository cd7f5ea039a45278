#pragma once

#include <string>
#include <string_view>

namespace qg {

std::string json_escape(std::string_view s);

} // namespace qg
