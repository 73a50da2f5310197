#pragma once

#include <cstdio>
#include <utility>
#include <fmt/core.h>
#include <fmt/color.h>

// Coloured diagnostics on stderr; query output owns stdout.
namespace eqjoin::console {

template<typename... Args>
void print_info(fmt::format_string<Args...> fmt_str, Args&&... args) {
    fmt::print(stderr, "{}\n", fmt::format(fmt_str, std::forward<Args>(args)...));
}

template<typename... Args>
void print_success(fmt::format_string<Args...> fmt_str, Args&&... args) {
    fmt::print(stderr, fg(fmt::color::green), "{}\n", fmt::format(fmt_str, std::forward<Args>(args)...));
}

template<typename... Args>
void print_warning(fmt::format_string<Args...> fmt_str, Args&&... args) {
    fmt::print(stderr, fg(fmt::color::yellow), "{}\n", fmt::format(fmt_str, std::forward<Args>(args)...));
}

template<typename... Args>
void print_error(fmt::format_string<Args...> fmt_str, Args&&... args) {
    fmt::print(stderr, fg(fmt::color::red), "{}\n", fmt::format(fmt_str, std::forward<Args>(args)...));
}

} // namespace eqjoin::console
