#include "worldfetch/progress_reporter.hpp"

#include "util/format.hpp"
#include "util/logger.hpp"

namespace worldfetch {

ProgressReporter::ProgressReporter(const ProgressCounter& counter,
                                   std::uint64_t total,
                                   std::string phase,
                                   std::chrono::milliseconds interval,
                                   IProgress* sink)
    : counter_(counter), total_(total), phase_(std::move(phase)), interval_(interval), sink_(sink) {
    thread_ = std::thread([this] { Run(); });
}

ProgressReporter::~ProgressReporter() { Stop(); }

void ProgressReporter::Stop() {
    {
        std::lock_guard<std::mutex> lk(mu_);
        stop_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) thread_.join();
}

void ProgressReporter::Run() {
    std::unique_lock<std::mutex> lk(mu_);
    while (!cv_.wait_for(lk, interval_, [this] { return stop_; })) {
        // The sink may be slow; Stop() must not wait on it for the lock.
        lk.unlock();
        EmitNow();
        lk.lock();
    }
}

void ProgressReporter::EmitNow() const {
    const std::uint64_t done = counter_.Load();
    if (sink_) {
        ProgressEvent event{};
        event.phase = phase_;
        event.done = done;
        event.total = total_;
        sink_->OnProgress(event);
        return;
    }

    if (total_ > 0) {
        LogInfo("[%s] %s / %s (%d%%)", phase_.c_str(), FormatBytes(done).c_str(),
                FormatBytes(total_).c_str(), Percent(done, total_));
    } else {
        LogInfo("[%s] %s received", phase_.c_str(), FormatBytes(done).c_str());
    }
}

} // namespace worldfetch
