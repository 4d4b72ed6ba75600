#pragma once

#include "worldfetch/progress.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>

namespace worldfetch {

// Background thread that samples a ProgressCounter every `interval` and
// forwards it to a sink, or to the log when no sink is given. Stops on
// destruction.
class ProgressReporter {
  public:
    ProgressReporter(const ProgressCounter& counter,
                     std::uint64_t total,
                     std::string phase,
                     std::chrono::milliseconds interval,
                     IProgress* sink);
    ~ProgressReporter();

    ProgressReporter(const ProgressReporter&) = delete;
    ProgressReporter& operator=(const ProgressReporter&) = delete;

    void Stop();

    // Emits one sample from the calling thread.
    void EmitNow() const;

  private:
    void Run();

    const ProgressCounter& counter_;
    const std::uint64_t total_;
    const std::string phase_;
    const std::chrono::milliseconds interval_;
    IProgress* sink_;

    std::mutex mu_;
    std::condition_variable cv_;
    bool stop_ = false;
    std::thread thread_;
};

} // namespace worldfetch
