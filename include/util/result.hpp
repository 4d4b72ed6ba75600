#pragma once
#include <string>
#include <string_view>
#include <utility>

namespace worldfetch {

struct Result {
    bool ok{true};
    int err{0};
    std::string msg;

    bool is_ok() const { return ok; }
    const std::string& message() const { return msg; }

    // Failure carrying the same code with "<stage>: " in front of the message.
    Result Wrap(std::string_view stage) const {
        if (ok) return *this;
        return Fail(err, std::string(stage) + ": " + msg);
    }

    static Result Ok() { return {}; }
    static Result Fail(int e, std::string m) {
        return {.ok = false, .err = e, .msg = std::move(m)};
    }
};

} // namespace worldfetch
