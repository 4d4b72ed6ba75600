#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace worldfetch {

// Whitelist of top-level archive directories ("world", "world_nether", ...).
class WorldFilter {
  public:
    WorldFilter() = default;
    // Names are normalized like entry paths; empty names and duplicates are dropped.
    explicit WorldFilter(const std::vector<std::string>& names);

    // The world a normalized entry path belongs to: the path equals the name
    // or lies anywhere below it. First matching name wins.
    std::optional<std::string_view> Match(std::string_view normalized_path) const;

    const std::vector<std::string>& Names() const { return names_; }
    bool Empty() const { return names_.empty(); }

  private:
    std::vector<std::string> names_;
};

} // namespace worldfetch
