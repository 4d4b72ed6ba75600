#pragma once
#include "io/io.hpp"
#include "worldfetch/progress.hpp"

#include <cstdint>

namespace worldfetch {

class CountingReader final : public IReader {
public:
    CountingReader(IReader& inner, ProgressCounter& counter)
        : inner_(inner), counter_(counter) {}

    ssize_t Read(std::span<std::uint8_t> out) override {
        const ssize_t n = inner_.Read(out);
        if (n > 0) {
            counter_.Add(static_cast<std::uint64_t>(n));
        }
        return n;
    }

    std::optional<std::uint64_t> TotalSize() const override { return inner_.TotalSize(); }
    std::string LastError() const override { return inner_.LastError(); }

private:
    IReader& inner_;
    ProgressCounter& counter_;
};

} // namespace worldfetch
