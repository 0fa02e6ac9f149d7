#include "ark/scene/name_pattern.hpp"

#include <fnmatch.h>

namespace ark::scene {

bool matchName(std::string_view pattern, std::string_view name) {
    // fnmatch needs NUL-terminated strings.
    const std::string p(pattern);
    const std::string n(name);
    return ::fnmatch(p.c_str(), n.c_str(), 0) == 0;
}

bool isPath(std::string_view text) noexcept {
    return text.find(kPathSeparator) != std::string_view::npos;
}

std::vector<std::string> splitPath(std::string_view path) {
    std::vector<std::string> parts;
    std::size_t start = 0;
    while (start <= path.size()) {
        auto end = path.find(kPathSeparator, start);
        if (end == std::string_view::npos) {
            end = path.size();
        }
        if (end > start) {
            parts.emplace_back(path.substr(start, end - start));
        }
        start = end + 1;
    }
    return parts;
}

} // namespace ark::scene
