#include "worldfetch/world_filter.hpp"

#include "util/path_utils.hpp"

#include <algorithm>

namespace worldfetch {

WorldFilter::WorldFilter(const std::vector<std::string>& names) {
    for (const auto& raw : names) {
        std::string name = NormalizeTarPath(raw);
        while (!name.empty() && name.back() == '/') name.pop_back();
        if (name.empty()) continue;
        if (std::find(names_.begin(), names_.end(), name) != names_.end()) continue;
        names_.push_back(std::move(name));
    }
}

std::optional<std::string_view> WorldFilter::Match(std::string_view path) const {
    for (const auto& name : names_) {
        if (path.size() < name.size() || path.compare(0, name.size(), name) != 0) continue;
        if (path.size() == name.size() || path[name.size()] == '/') {
            return std::string_view(name);
        }
    }
    return std::nullopt;
}

} // namespace worldfetch
