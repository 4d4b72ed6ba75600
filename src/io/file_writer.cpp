// file_writer.cpp - Writer for temp archives and extracted entries.

#include "io/file_writer.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace worldfetch {

namespace {

Result ErrnoFail(const std::string& what, const std::string& path) {
    const int e = errno;
    return Result::Fail(e, what + " " + path + " (" + std::strerror(e) + ")");
}

} // namespace

Result FileWriter::Create(std::string path, mode_t mode, FileWriter& out) {
    out.path_ = std::move(path);

    int fd = ::open(out.path_.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, mode);
    if (fd < 0) {
        return ErrnoFail("Failed to open output:", out.path_);
    }
    out.fd_.Reset(fd);
    return Result::Ok();
}

Result FileWriter::Adopt(int fd, std::string path, FileWriter& out) {
    if (fd < 0) return Result::Fail(EBADF, "invalid descriptor for " + path);
    out.path_ = std::move(path);
    out.fd_.Reset(fd);
    return Result::Ok();
}

Result FileWriter::WriteAll(std::span<const std::uint8_t> in) {
    size_t rem = in.size();
    const std::uint8_t* p = in.data();

    while (rem > 0) {
        ssize_t n = ::write(fd_.Get(), p, rem);
        if (n > 0) {
            p += static_cast<size_t>(n);
            rem -= static_cast<size_t>(n);
            continue;
        }
        if (n == -1 && errno == EINTR) {
            continue;
        }
        return ErrnoFail("Write failed:", path_);
    }

    return Result::Ok();
}

Result FileWriter::WriteAt(std::uint64_t offset, std::span<const std::uint8_t> in) const {
    size_t rem = in.size();
    const std::uint8_t* p = in.data();
    auto pos = static_cast<off_t>(offset);

    while (rem > 0) {
        ssize_t n = ::pwrite(fd_.Get(), p, rem, pos);
        if (n > 0) {
            p += static_cast<size_t>(n);
            rem -= static_cast<size_t>(n);
            pos += static_cast<off_t>(n);
            continue;
        }
        if (n == -1 && errno == EINTR) {
            continue;
        }
        return ErrnoFail("Positional write failed:", path_);
    }

    return Result::Ok();
}

Result FileWriter::Truncate(std::uint64_t size) const {
    while (::ftruncate(fd_.Get(), static_cast<off_t>(size)) == -1) {
        if (errno == EINTR) continue;
        return ErrnoFail("Failed to pre-size", path_);
    }
    return Result::Ok();
}

Result FileWriter::Close() {
    if (!fd_.Valid()) return Result::Ok();
    if (fd_.Close() == -1) {
        return ErrnoFail("Failed to close", path_);
    }
    return Result::Ok();
}

} // namespace worldfetch
