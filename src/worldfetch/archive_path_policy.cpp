#include "worldfetch/archive_path_policy.hpp"

#include <iterator>
#include <system_error>

namespace worldfetch {

namespace fs = std::filesystem;

bool ArchivePathPolicy::IsWithin(const fs::path& p, const fs::path& base) {
    auto pi = p.begin();
    for (auto bi = base.begin(); bi != base.end(); ++bi, ++pi) {
        // A trailing empty element stands for a trailing separator on `base`.
        if (bi->empty() && std::next(bi) == base.end()) break;
        if (pi == p.end() || *pi != *bi) return false;
    }
    return true;
}

Result ArchivePathPolicy::ForRoot(const std::string& dst_dir, ArchivePathPolicy& out) {
    std::error_code ec;
    const fs::path canonical = fs::canonical(fs::path(dst_dir), ec);
    if (ec) {
        return Result::Fail(ec.value(), "cannot resolve destination " + dst_dir + ": " + ec.message());
    }
    if (!fs::is_directory(canonical, ec) || ec) {
        return Result::Fail(-1, "Destination path is not a directory: " + dst_dir);
    }
    out.root_ = canonical;
    return Result::Ok();
}

std::optional<fs::path> ArchivePathPolicy::Resolve(std::string_view rel, std::string_view world) const {
    if (rel.empty() || world.empty()) return std::nullopt;
    if (rel.find('\0') != std::string_view::npos) return std::nullopt;

    const fs::path rel_path{std::string(rel)};
    if (rel_path.is_absolute()) return std::nullopt;

    const fs::path base = (root_ / fs::path(std::string(world))).lexically_normal();
    fs::path target = (root_ / rel_path).lexically_normal();
    if (!target.empty() && !target.has_filename()) {
        // "world/dir/" normalizes with a trailing separator; drop it.
        target = target.parent_path();
    }

    if (!IsWithin(base, root_) || base == root_) return std::nullopt;
    if (!IsWithin(target, base)) return std::nullopt;

    // Follow whatever part of the target already exists on disk. A symlink
    // planted under the root must not carry the entry somewhere else.
    std::error_code ec;
    const fs::path resolved = fs::weakly_canonical(target, ec);
    if (ec) return std::nullopt;
    if (!IsWithin(resolved, root_)) return std::nullopt;

    return target;
}

} // namespace worldfetch
