#include "streamdl/console.hpp"

#include "streamdl/format.hpp"

#include <fmt/format.h>

#include <string>

namespace streamdl {

Console::Console(std::ostream& out, std::ostream& err, bool verbose)
    : out_(out), err_(err), verbose_(verbose) {}

void Console::info(std::string_view line) const {
    out_ << color::blue(fmt::format("💡 {}", line)) << std::endl;
}

void Console::debug(std::string_view line) const {
    if (!verbose_) {
        return;
    }
    out_ << line << std::endl;
}

void Console::warn(std::string_view line) const {
    err_ << color::yellow(line) << std::endl;
}

void Console::error(std::string_view line) const {
    err_ << color::red(line) << std::endl;
}

void Console::header(std::string_view line) const {
    std::string bar;
    const std::size_t width = displayWidth(line) + 2;
    for (std::size_t i = 0; i < width; ++i) {
        bar += u8"―";
    }

    out_ << '\n';
    out_ << color::blue(bar) << '\n';
    out_ << color::blue(fmt::format(" {} ", line)) << '\n';
    out_ << color::blue(bar) << '\n';
    out_ << std::endl;
}

} // namespace streamdl
