#pragma once

#include <cstdio>
#include <fmt/color.h>
#include <fmt/format.h>
#include <utility>

namespace bfi {

    template <typename... Args>
    void report_error(fmt::format_string<Args...> format, Args&&... args) {
        fmt::print(stderr, fmt::fg(fmt::color::red) | fmt::emphasis::bold, "error");
        fmt::print(stderr, ": {}\n", fmt::format(format, std::forward<Args>(args)...));
    }

    template <typename... Args>
    void report_note(fmt::format_string<Args...> format, Args&&... args) {
        fmt::print(stderr, fmt::fg(fmt::color::cyan) | fmt::emphasis::bold, "note");
        fmt::print(stderr, ": {}\n", fmt::format(format, std::forward<Args>(args)...));
    }

}
