#pragma once

#include <atomic>

namespace worldfetch {

// Raised by SIGINT/SIGTERM; long-running loops poll it and bail out.
extern std::atomic_bool g_cancel;

void InstallSignalHandlers();

} // namespace worldfetch
