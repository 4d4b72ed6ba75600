#pragma once

#include "io/io.hpp"
#include "net/http.hpp"

#include <archive.h>
#include <archive_entry.h>
#include <zlib.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <sys/stat.h>
#include <unistd.h>
#include <utility>
#include <vector>

namespace testutil {

class TemporaryDirectory {
  public:
    TemporaryDirectory() {
        char tpl[] = "/tmp/worldfetch_tests_XXXXXX";
        char* p = ::mkdtemp(tpl);
        if (!p) {
            throw std::runtime_error("mkdtemp failed");
        }
        path_ = p;
    }

    ~TemporaryDirectory() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TemporaryDirectory(const TemporaryDirectory&) = delete;
    TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;

    const std::string& Path() const { return path_; }
    std::filesystem::path Sub(const std::string& name) const { return std::filesystem::path(path_) / name; }

  private:
    std::string path_;
};

class MemoryReader final : public worldfetch::IReader {
  public:
    explicit MemoryReader(std::string data) : data_(data.begin(), data.end()) {}

    explicit MemoryReader(std::vector<std::uint8_t> data) : data_(std::move(data)) {}

    ssize_t Read(std::span<std::uint8_t> out) override {
        if (pos_ >= data_.size())
            return 0;
        const size_t n = std::min(out.size(), data_.size() - pos_);
        std::copy(data_.begin() + static_cast<std::ptrdiff_t>(pos_),
                  data_.begin() + static_cast<std::ptrdiff_t>(pos_ + n),
                  out.begin());
        pos_ += n;
        return static_cast<ssize_t>(n);
    }

    std::optional<std::uint64_t> TotalSize() const override {
        return static_cast<std::uint64_t>(data_.size());
    }

  private:
    std::vector<std::uint8_t> data_;
    size_t pos_ = 0;
};

struct TarEntry {
    std::string path;
    std::string contents;
    mode_t file_type = AE_IFREG;
    std::string link_target = {};
};

inline std::vector<std::uint8_t> BuildTar(const std::vector<TarEntry>& entries) {
    size_t capacity = 64 * 1024;
    for (const auto& e : entries) capacity += e.contents.size() + 4096;
    std::vector<std::uint8_t> out(capacity);
    size_t used = 0;

    archive* a = archive_write_new();
    if (!a)
        throw std::runtime_error("archive_write_new failed");
    if (archive_write_set_format_pax_restricted(a) != ARCHIVE_OK) {
        (void)archive_write_free(a);
        throw std::runtime_error("archive_write_set_format_pax_restricted failed");
    }
    if (archive_write_open_memory(a, out.data(), out.size(), &used) != ARCHIVE_OK) {
        (void)archive_write_free(a);
        throw std::runtime_error("archive_write_open_memory failed");
    }

    for (const auto& entry : entries) {
        archive_entry* hdr = archive_entry_new();
        if (!hdr) {
            (void)archive_write_free(a);
            throw std::runtime_error("archive_entry_new failed");
        }
        archive_entry_set_pathname(hdr, entry.path.c_str());
        archive_entry_set_filetype(hdr, entry.file_type);
        archive_entry_set_perm(hdr, entry.file_type == AE_IFDIR ? 0755 : 0644);
        if (entry.file_type == AE_IFLNK) {
            archive_entry_set_symlink(hdr, entry.link_target.c_str());
        }
        const bool has_data = entry.file_type == AE_IFREG;
        archive_entry_set_size(hdr, has_data ? static_cast<la_int64_t>(entry.contents.size()) : 0);
        if (archive_write_header(a, hdr) != ARCHIVE_OK) {
            archive_entry_free(hdr);
            (void)archive_write_free(a);
            throw std::runtime_error("archive_write_header failed");
        }
        if (has_data && !entry.contents.empty()) {
            if (archive_write_data(a, entry.contents.data(), entry.contents.size()) < 0) {
                archive_entry_free(hdr);
                (void)archive_write_free(a);
                throw std::runtime_error("archive_write_data failed");
            }
        }
        archive_entry_free(hdr);
    }

    if (archive_write_close(a) != ARCHIVE_OK) {
        (void)archive_write_free(a);
        throw std::runtime_error("archive_write_close failed");
    }
    if (archive_write_free(a) != ARCHIVE_OK) {
        throw std::runtime_error("archive_write_free failed");
    }
    out.resize(used);
    return out;
}

// One gzip member holding `data`.
inline std::vector<std::uint8_t> Gzip(std::span<const std::uint8_t> data) {
    z_stream s{};
    if (deflateInit2(&s, Z_DEFAULT_COMPRESSION, Z_DEFLATED, 16 + MAX_WBITS, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        throw std::runtime_error("deflateInit2 failed");
    }
    std::vector<std::uint8_t> out(deflateBound(&s, static_cast<uLong>(data.size())) + 64);
    s.next_in = const_cast<Bytef*>(data.data());
    s.avail_in = static_cast<uInt>(data.size());
    s.next_out = out.data();
    s.avail_out = static_cast<uInt>(out.size());
    const int rc = deflate(&s, Z_FINISH);
    deflateEnd(&s);
    if (rc != Z_STREAM_END) {
        throw std::runtime_error("deflate failed");
    }
    out.resize(s.total_out);
    return out;
}

inline std::vector<std::uint8_t> Gzip(const std::string& s) {
    return Gzip(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(s.data()), s.size()));
}

inline std::vector<std::uint8_t> BuildTarGz(const std::vector<TarEntry>& entries) {
    const auto tar = BuildTar(entries);
    return Gzip(std::span<const std::uint8_t>(tar.data(), tar.size()));
}

inline std::string ReadAll(worldfetch::IReader& reader) {
    std::string out;
    std::array<std::uint8_t, 1024> buf{};
    while (true) {
        const ssize_t n = reader.Read(std::span<std::uint8_t>(buf.data(), buf.size()));
        if (n == 0)
            break;
        if (n < 0)
            return {};
        out.append(reinterpret_cast<const char*>(buf.data()), static_cast<size_t>(n));
    }
    return out;
}

inline std::string ReadFile(const std::filesystem::path& p) {
    std::ifstream ifs(p, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
}

// Relative path -> contents for every regular file below `root`.
inline std::map<std::string, std::string> Snapshot(const std::filesystem::path& root) {
    std::map<std::string, std::string> files;
    for (const auto& e : std::filesystem::recursive_directory_iterator(root)) {
        if (e.is_regular_file()) {
            files[std::filesystem::relative(e.path(), root).string()] = ReadFile(e.path());
        }
    }
    return files;
}

inline std::vector<std::uint8_t> PatternBytes(size_t n) {
    std::vector<std::uint8_t> v(n);
    for (size_t i = 0; i < n; ++i) v[i] = static_cast<std::uint8_t>((i * 131 + (i >> 8)) & 0xFF);
    return v;
}

// In-memory HTTP origin. Serves one resource and mimics the handful of server
// behaviours the downloader has to cope with.
class FakeHttpServer final : public worldfetch::IHttpTransport {
  public:
    struct Behaviour {
        bool support_ranges = true;
        bool report_length = true;       // Content-Length on full responses
        bool report_total = true;        // "bytes a-b/T" rather than "bytes a-b/*"
        std::optional<long> status;      // forced status for every request
        bool fail_transport = false;
        // Ranged requests (other than the 0-0 probe) that start here get a 500
        // or a body cut in half.
        std::optional<std::uint64_t> error_at_first;
        std::optional<std::uint64_t> truncate_at_first;
        size_t max_read = 16 * 1024;     // largest slice handed out per Read()
    };

    explicit FakeHttpServer(std::vector<std::uint8_t> body) : body_(std::move(body)) {}
    FakeHttpServer(std::vector<std::uint8_t> body, const Behaviour& b) : body_(std::move(body)), b_(b) {}

    worldfetch::Result Open(const worldfetch::HttpRequest& req,
                            std::unique_ptr<worldfetch::IHttpResponse>& out) override {
        requests_.fetch_add(1);
        {
            std::lock_guard<std::mutex> lk(mu_);
            seen_.push_back(req.range);
        }
        if (b_.fail_transport) {
            return worldfetch::Result::Fail(-1, "connection refused");
        }

        auto resp = std::make_unique<Response>(this);
        const std::uint64_t size = body_.size();
        const bool probe = req.range && req.range->first == 0 && req.range->last == 0;

        if (req.range && b_.support_ranges) {
            if (req.range->first >= size) {
                resp->status = 416;
            } else {
                const std::uint64_t first = req.range->first;
                const std::uint64_t last = std::min<std::uint64_t>(req.range->last, size - 1);
                resp->status = worldfetch::kHttpPartialContent;
                resp->headers["content-range"] = "bytes " + std::to_string(first) + "-" +
                                                 std::to_string(last) + "/" +
                                                 (b_.report_total ? std::to_string(size) : "*");
                std::uint64_t end = last + 1;
                if (!probe && b_.error_at_first && *b_.error_at_first == first) {
                    resp->status = 500;
                    end = first;
                } else if (!probe && b_.truncate_at_first && *b_.truncate_at_first == first) {
                    end = first + (end - first) / 2;
                }
                resp->begin = first;
                resp->end = end;
                resp->headers["content-length"] = std::to_string(end - first);
            }
        } else {
            resp->status = worldfetch::kHttpOk;
            resp->begin = 0;
            resp->end = size;
            if (b_.report_length) resp->headers["content-length"] = std::to_string(size);
        }
        if (b_.status) resp->status = *b_.status;
        resp->pos = resp->begin;

        out = std::move(resp);
        return worldfetch::Result::Ok();
    }

    int Requests() const { return requests_.load(); }
    std::uint64_t BytesServed() const { return served_.load(); }

    std::vector<std::optional<worldfetch::ByteRange>> SeenRanges() const {
        std::lock_guard<std::mutex> lk(mu_);
        return seen_;
    }

  private:
    struct Response final : public worldfetch::IHttpResponse {
        explicit Response(FakeHttpServer* s) : server(s) {}

        long Status() const override { return status; }

        std::optional<std::string> Header(std::string_view name) const override {
            std::string key(name);
            std::transform(key.begin(), key.end(), key.begin(), [](unsigned char c) {
                return static_cast<char>(std::tolower(c));
            });
            auto it = headers.find(key);
            if (it == headers.end()) return std::nullopt;
            return it->second;
        }

        ssize_t Read(std::span<std::uint8_t> out) override {
            if (pos >= end) return 0;
            const size_t n = std::min<std::uint64_t>({out.size(), end - pos, server->b_.max_read});
            std::copy_n(server->body_.begin() + static_cast<std::ptrdiff_t>(pos), n, out.begin());
            pos += n;
            server->served_.fetch_add(n);
            return static_cast<ssize_t>(n);
        }

        FakeHttpServer* server;
        long status = 0;
        std::map<std::string, std::string> headers;
        std::uint64_t begin = 0;
        std::uint64_t end = 0;
        std::uint64_t pos = 0;
    };

    const std::vector<std::uint8_t> body_;
    Behaviour b_{};
    std::atomic<int> requests_{0};
    std::atomic<std::uint64_t> served_{0};
    mutable std::mutex mu_;
    std::vector<std::optional<worldfetch::ByteRange>> seen_;
};

} // namespace testutil
