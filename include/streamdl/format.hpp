#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace streamdl {

[[nodiscard]] std::string formatSize(double bytes);
[[nodiscard]] std::string formatPercent(double ratio);
[[nodiscard]] std::string formatSeconds(double seconds);

// Number of code points in UTF-8 `text`.
[[nodiscard]] std::size_t displayWidth(std::string_view text);

namespace color {

inline constexpr std::string_view kGreen = "\x1b[1;32;40m";
inline constexpr std::string_view kYellow = "\x1b[1;33;40m";
inline constexpr std::string_view kBlue = "\x1b[1;34;40m";
inline constexpr std::string_view kMagenta = "\x1b[1;35;40m";
inline constexpr std::string_view kCyan = "\x1b[1;36;40m";
inline constexpr std::string_view kRed = "\x1b[1;31;40m";
inline constexpr std::string_view kReset = "\x1b[0;0;0m";

[[nodiscard]] std::string paint(std::string_view code, std::string_view text);

[[nodiscard]] inline std::string green(std::string_view text) { return paint(kGreen, text); }
[[nodiscard]] inline std::string yellow(std::string_view text) { return paint(kYellow, text); }
[[nodiscard]] inline std::string blue(std::string_view text) { return paint(kBlue, text); }
[[nodiscard]] inline std::string magenta(std::string_view text) { return paint(kMagenta, text); }
[[nodiscard]] inline std::string cyan(std::string_view text) { return paint(kCyan, text); }
[[nodiscard]] inline std::string red(std::string_view text) { return paint(kRed, text); }

} // namespace color

} // namespace streamdl
