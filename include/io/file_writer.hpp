#pragma once

#include "io/fd.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <sys/types.h>

namespace worldfetch {

// Regular-file writer. WriteAll() appends at the current position; WriteAt()
// uses pwrite(2) and may be called from several threads at once as long as
// the ranges are disjoint.
class FileWriter final : public IWriter {
  public:
    static Result Create(std::string path, mode_t mode, FileWriter& out);
    static Result Adopt(int fd, std::string path, FileWriter& out);

    Result WriteAll(std::span<const std::uint8_t> in) override;
    Result WriteAt(std::uint64_t offset, std::span<const std::uint8_t> in) const;
    Result Truncate(std::uint64_t size) const;
    Result Close();

    const std::string& Path() const { return path_; }

  private:
    std::string path_;
    Fd fd_;
};

} // namespace worldfetch
