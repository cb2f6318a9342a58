#include "print.hpp"

#include <cstdio>
#include <string>

#include <fmt/color.h>
#include <fmt/core.h>

namespace ferry::driver {

namespace {

constexpr auto kToolStyle =
    fmt::fg(fmt::terminal_color::white) | fmt::emphasis::bold;

}  // namespace

void PrintError(const std::string& message) {
  fmt::print(
      stderr, "{}: {} {}\n", fmt::styled("ferry", kToolStyle),
      fmt::styled(
          "error:",
          fmt::fg(fmt::terminal_color::bright_red) | fmt::emphasis::bold),
      fmt::styled(message, fmt::emphasis::bold));
}

}  // namespace ferry::driver
