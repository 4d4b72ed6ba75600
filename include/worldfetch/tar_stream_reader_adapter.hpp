#pragma once

#include "io/io.hpp"

#include <archive.h>

#include <string>

namespace worldfetch {

// archive_read_open2() over an IReader. The reader must outlive `ar`. Read
// errors are forwarded into the archive's error string.
int OpenArchiveFromReader(struct archive* ar, IReader& reader);
std::string ArchiveErr(struct archive* ar);

} // namespace worldfetch
