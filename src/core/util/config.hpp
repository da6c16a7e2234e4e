#pragma once

#include <string>
#include <string_view>

#include "core/model/types.hpp"

namespace hogpen::util {

// key=value lines, '#' comments. Unknown keys are ignored; a missing file keeps the defaults.
Result load_casino_config(std::string_view path, CasinoConfig& out);
Result parse_casino_config(std::string_view text, CasinoConfig& out);
std::string render_casino_config(const CasinoConfig& config);

}  // namespace hogpen::util
