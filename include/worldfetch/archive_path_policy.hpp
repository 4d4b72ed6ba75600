#pragma once

#include "util/result.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace worldfetch {

// Maps archive entry paths onto the destination root and refuses anything
// that would land outside it. Checks run on resolved absolute paths, so ".."
// segments and symlinks already present under the root cannot be used to
// escape.
class ArchivePathPolicy {
  public:
    // `dst_dir` must exist; it is resolved to its canonical absolute form.
    static Result ForRoot(const std::string& dst_dir, ArchivePathPolicy& out);

    // Destination for normalized entry path `rel`, or nullopt when the
    // resolved path is outside `<root>/<world>` (the world directory itself
    // is allowed).
    std::optional<std::filesystem::path> Resolve(std::string_view rel, std::string_view world) const;

    const std::filesystem::path& Root() const { return root_; }

    // True when `p` equals `base` or lies below it. Both must be normalized.
    static bool IsWithin(const std::filesystem::path& p, const std::filesystem::path& base);

  private:
    std::filesystem::path root_;
};

} // namespace worldfetch
