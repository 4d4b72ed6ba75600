#pragma once

#include "io/file_writer.hpp"
#include "util/result.hpp"

#include <string>

namespace worldfetch {

// mkstemps(3) file that is unlinked when the object goes away, whatever path
// the caller leaves by.
class ScopedTempFile {
  public:
    ScopedTempFile() = default;
    ~ScopedTempFile();

    ScopedTempFile(const ScopedTempFile&) = delete;
    ScopedTempFile& operator=(const ScopedTempFile&) = delete;

    // Creates "<dir>/<prefix>XXXXXX<suffix>" and hands its descriptor to `writer`.
    Result Create(const std::string& dir,
                  const std::string& prefix,
                  const std::string& suffix,
                  FileWriter& writer);

    const std::string& Path() const { return path_; }

  private:
    std::string path_;
};

} // namespace worldfetch
