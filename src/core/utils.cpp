#include "utils.hpp"
#include <algorithm>
#include <cctype>

std::string to_lower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string last_dotted_component(const std::string& dotted) {
    auto dot = dotted.rfind('.');
    if (dot == std::string::npos) return dotted;
    return dotted.substr(dot + 1);
}
