#include "worldfetch/world_extractor.hpp"

#include "io/file_writer.hpp"
#include "io/gzip_reader.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"
#include "worldfetch/archive_path_policy.hpp"
#include "worldfetch/tar_stream_reader_adapter.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <algorithm>
#include <cerrno>
#include <filesystem>
#include <memory>
#include <vector>

namespace worldfetch {

namespace fs = std::filesystem;

namespace {

struct ArchiveReadDeleter {
    void operator()(archive* a) const {
        if (a) archive_read_free(a);
    }
};

constexpr mode_t kDefaultFileMode = 0644;

// Structural failures name the layer that broke: the gzip reader keeps its own
// error, everything else is libarchive's.
Result StreamFail(const GzipReader& gz, archive* ar, const char* op) {
    const std::string gz_err = gz.LastError();
    if (!gz_err.empty()) return Result::Fail(-1, "gzip: " + gz_err);
    return Result::Fail(-1, std::string("tar: ") + op + ": " + ArchiveErr(ar));
}

Result SizeLimitFail(std::uint64_t limit) {
    return Result::Fail(EFBIG, "file exceeds maximum allowed size of " + std::to_string(limit) + " bytes");
}

mode_t EntryMode(archive_entry* entry) {
    const mode_t perm = archive_entry_perm(entry) & 0777;
    return perm != 0 ? perm : kDefaultFileMode;
}

} // namespace

std::uint64_t ExtractionTally::FilesFor(std::string_view world) const {
    auto it = files.find(world);
    return it == files.end() ? 0 : it->second;
}

std::vector<std::string> ExtractionTally::Missing(const WorldFilter& filter) const {
    std::vector<std::string> out;
    for (const auto& name : filter.Names()) {
        if (FilesFor(name) == 0) out.push_back(name);
    }
    return out;
}

Result WorldExtractor::Extract(IReader& compressed,
                               const std::string& dst_dir,
                               const WorldFilter& filter,
                               ExtractionTally& tally) const {
    ArchivePathPolicy policy;
    auto root_res = ArchivePathPolicy::ForRoot(dst_dir, policy);
    if (!root_res.is_ok()) return root_res;

    GzipReader gz(compressed);

    std::unique_ptr<archive, ArchiveReadDeleter> ar(archive_read_new());
    if (!ar) return Result::Fail(-1, "archive_read_new failed");

    // Decompression is done by GzipReader; libarchive only walks tar headers.
    archive_read_support_filter_none(ar.get());
    archive_read_support_format_tar(ar.get());

    if (OpenArchiveFromReader(ar.get(), gz) != ARCHIVE_OK) {
        return StreamFail(gz, ar.get(), "open");
    }

    std::vector<std::uint8_t> buf(std::max<std::size_t>(opt_.copy_buffer_bytes, 1));

    // Copies the current entry's data into `target`, enforcing the size cap.
    // A partially written file is removed on any failure.
    auto copy_entry = [&](archive_entry* entry, const fs::path& target, std::uint64_t& written) -> Result {
        written = 0;
        if (archive_entry_size_is_set(entry) &&
            static_cast<std::uint64_t>(archive_entry_size(entry)) > opt_.max_file_bytes) {
            return SizeLimitFail(opt_.max_file_bytes);
        }

        FileWriter out;
        auto open_res = FileWriter::Create(target.string(), EntryMode(entry), out);
        if (!open_res.is_ok()) return open_res;

        auto fail = [&](Result r) {
            (void)out.Close();
            std::error_code ec;
            fs::remove(target, ec);
            return r;
        };

        while (true) {
            const la_ssize_t n = archive_read_data(ar.get(), buf.data(), buf.size());
            if (n == 0) break;
            if (n < 0) return fail(StreamFail(gz, ar.get(), "read data"));

            written += static_cast<std::uint64_t>(n);
            if (written > opt_.max_file_bytes) {
                return fail(SizeLimitFail(opt_.max_file_bytes));
            }

            auto w = out.WriteAll(std::span<const std::uint8_t>(buf.data(), static_cast<size_t>(n)));
            if (!w.is_ok()) return fail(w);
        }

        auto c = out.Close();
        if (!c.is_ok()) return fail(c);
        return Result::Ok();
    };

    archive_entry* entry = nullptr;
    while (true) {
        const int r = archive_read_next_header(ar.get(), &entry);
        if (r == ARCHIVE_EOF) break;
        if (r == ARCHIVE_WARN) {
            LogWarn("tar: %s", ArchiveErr(ar.get()).c_str());
        } else if (r != ARCHIVE_OK) {
            return StreamFail(gz, ar.get(), "read header");
        }

        const char* raw = archive_entry_pathname(entry);
        const std::string rel = NormalizeTarPath(raw ? std::string(raw) : std::string());

        const auto world = filter.Match(rel);
        if (!world) {
            if (archive_read_data_skip(ar.get()) != ARCHIVE_OK) {
                return StreamFail(gz, ar.get(), "skip data");
            }
            continue;
        }

        const auto target = policy.Resolve(rel, *world);
        if (!target) {
            LogDebug("skipping entry outside destination: %s", rel.c_str());
            ++tally.unsafe_skipped;
            if (archive_read_data_skip(ar.get()) != ARCHIVE_OK) {
                return StreamFail(gz, ar.get(), "skip data");
            }
            continue;
        }

        const mode_t type = archive_entry_filetype(entry);
        std::error_code ec;

        if (type == AE_IFDIR) {
            fs::create_directories(*target, ec);
            if (ec) {
                return Result::Fail(ec.value(), "creating directory " + target->string() + ": " + ec.message());
            }
            ++tally.directories;
        } else if (type == AE_IFREG && archive_entry_hardlink(entry) == nullptr) {
            fs::create_directories(target->parent_path(), ec);
            if (ec) {
                return Result::Fail(ec.value(), "creating parent directory for " + target->string() +
                                                    ": " + ec.message());
            }

            std::uint64_t written = 0;
            auto cr = copy_entry(entry, *target, written);
            if (!cr.is_ok()) return cr.Wrap("writing file " + target->string());

            LogDebug("extracted %s (%llu bytes)", rel.c_str(), (unsigned long long)written);
            ++tally.files[std::string(*world)];
            tally.bytes += written;
        } else {
            LogDebug("skipping unsupported entry type: %s", rel.c_str());
            if (archive_read_data_skip(ar.get()) != ARCHIVE_OK) {
                return StreamFail(gz, ar.get(), "skip data");
            }
        }
    }

    for (const auto& name : filter.Names()) {
        const std::uint64_t n = tally.FilesFor(name);
        if (n == 0) {
            LogWarn("world \"%s\" was not found in the backup", name.c_str());
        } else {
            LogInfo("extracted %llu files for world \"%s\"", (unsigned long long)n, name.c_str());
        }
    }
    return Result::Ok();
}

} // namespace worldfetch
