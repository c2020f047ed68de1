#include "wakeify/common/string_util.hpp"

#include <algorithm>
#include <cctype>

namespace wakeify::common {

std::string trim_copy(std::string_view value) {
    auto first = value.begin();
    while (first != value.end() && std::isspace(static_cast<unsigned char>(*first))) {
        ++first;
    }
    if (first == value.end()) {
        return {};
    }
    auto last = value.end();
    do {
        --last;
    } while (last != first && std::isspace(static_cast<unsigned char>(*last)));
    return std::string(first, last + 1);
}

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}

std::string fold_name(std::string_view value) {
    return to_lower(trim_copy(value));
}

bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

}  // namespace wakeify::common
