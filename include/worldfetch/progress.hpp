#pragma once

#include <atomic>
#include <cstdint>
#include <string_view>

namespace worldfetch {

// Bytes transferred so far, shared by the workers of one transfer. Only ever
// grows; readers use it for reporting and never for control decisions.
class ProgressCounter {
  public:
    void Add(std::uint64_t n) { bytes_.fetch_add(n, std::memory_order_relaxed); }
    std::uint64_t Load() const { return bytes_.load(std::memory_order_relaxed); }

  private:
    std::atomic<std::uint64_t> bytes_{0};
};

struct ProgressEvent {
    std::string_view phase;
    std::uint64_t done = 0;
    std::uint64_t total = 0; // 0 when unknown
};

class IProgress {
  public:
    virtual ~IProgress() = default;
    virtual void OnProgress(const ProgressEvent& e) = 0;
};

} // namespace worldfetch
