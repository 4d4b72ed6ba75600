#include "io/temp_file.hpp"

#include "util/logger.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <unistd.h>
#include <vector>

namespace worldfetch {

ScopedTempFile::~ScopedTempFile() {
    if (path_.empty()) return;
    if (::unlink(path_.c_str()) != 0 && errno != ENOENT) {
        LogWarn("could not remove temp file %s: %s", path_.c_str(), std::strerror(errno));
    }
}

Result ScopedTempFile::Create(const std::string& dir,
                              const std::string& prefix,
                              const std::string& suffix,
                              FileWriter& writer) {
    std::string tpl = dir;
    if (!tpl.empty() && tpl.back() != '/') tpl.push_back('/');
    tpl += prefix + "XXXXXX" + suffix;

    std::vector<char> buf(tpl.begin(), tpl.end());
    buf.push_back('\0');

    const int fd = ::mkstemps(buf.data(), static_cast<int>(suffix.size()));
    if (fd < 0) {
        return Result::Fail(errno, "creating temp file in " + dir + ": " + std::strerror(errno));
    }
    path_.assign(buf.data());
    return FileWriter::Adopt(fd, path_, writer);
}

} // namespace worldfetch
