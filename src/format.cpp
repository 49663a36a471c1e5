#include "streamdl/format.hpp"

#include <fmt/format.h>

namespace streamdl {

std::string formatSize(double bytes) {
    constexpr double KiB = 1024.0;
    constexpr double MiB = KiB * 1024.0;

    if (bytes > MiB) {
        return fmt::format("{:.2f} MiB", bytes / MiB);
    } else if (bytes > KiB) {
        return fmt::format("{:.0f} KiB", bytes / KiB);
    } else {
        return fmt::format("{} B", bytes);
    }
}

std::string formatPercent(double ratio) {
    return fmt::format("{:.2f}%", ratio * 100.0);
}

std::string formatSeconds(double seconds) {
    return fmt::format("{:.1f}s", seconds);
}

std::size_t displayWidth(std::string_view text) {
    std::size_t width = 0;
    for (const char c : text) {
        // Continuation bytes are 10xxxxxx.
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) {
            ++width;
        }
    }
    return width;
}

namespace color {

std::string paint(std::string_view code, std::string_view text) {
    std::string painted;
    painted.reserve(code.size() + text.size() + kReset.size());
    painted.append(code);
    painted.append(text);
    painted.append(kReset);
    return painted;
}

} // namespace color

} // namespace streamdl
