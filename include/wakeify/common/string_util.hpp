#pragma once

#include <string>
#include <string_view>

namespace wakeify::common {

std::string trim_copy(std::string_view value);
std::string to_lower(std::string value);

// Trimmed and lower-cased; the key used for every name comparison.
std::string fold_name(std::string_view value);

bool iequals(std::string_view a, std::string_view b);

}  // namespace wakeify::common
