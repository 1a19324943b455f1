#pragma once

// 3rd party
#include <fmt/printf.h>

// std includes
#include <string>

namespace LView {

    // printf style formatting, type safe (arguments checked by fmt)
    template <typename... Args>
    std::string fmtString(const char* format, const Args& ... args) {
        return fmt::sprintf(format, args...);
    }

    // throws InvalidArgument if s is not entirely an integer
    int toInt(const std::string& s);

    bool startsWith(const std::string& s, const std::string& prefix);
}
