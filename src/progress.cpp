#include "streamdl/progress.hpp"

#include "streamdl/format.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <charconv>
#include <cmath>
#include <utility>

namespace streamdl {

namespace {

// Sub-cell shades, empty through full block.
constexpr const char* kGlyphs[] = {" ", u8"▏", u8"▎", u8"▍", u8"▌", u8"▋", u8"▊", u8"▉", u8"█"};
constexpr unsigned kUnitsPerCell = 8;
constexpr const char* kBarStart = u8"▐";
constexpr const char* kBarEnd = u8"▌";
constexpr char kFiller = ' ';

} // namespace

Transfer::Transfer(std::string url, std::uint64_t total_bytes, unsigned unit_budget)
    : url_(std::move(url)), total_bytes_(total_bytes), unit_budget_(unit_budget) {}

bool Transfer::advance(std::size_t bytes) {
    downloaded_bytes_ += bytes;

    const unsigned target = targetUnits();
    if (target <= current_units_) {
        return false;
    }
    current_units_ = target;
    return true;
}

unsigned Transfer::targetUnits() const {
    if (total_bytes_ == 0) {
        return 0;
    }
    if (downloaded_bytes_ >= total_bytes_) {
        return unit_budget_;
    }

    const long double ratio = static_cast<long double>(downloaded_bytes_) / static_cast<long double>(total_bytes_);
    const auto units = static_cast<unsigned>(std::floor(ratio * unit_budget_));
    return std::min(units, unit_budget_);
}

std::uint64_t parseContentLength(std::string_view value) {
    std::size_t pos = 0;
    while (pos < value.size() && (value[pos] == ' ' || value[pos] == '\t')) {
        ++pos;
    }
    if (pos < value.size() && value[pos] == '+') {
        ++pos;
    }

    std::uint64_t length = 0;
    const char* first = value.data() + pos;
    const char* last = value.data() + value.size();
    const auto [ptr, ec] = std::from_chars(first, last, length);
    if (ec != std::errc{} || ptr == first) {
        return 0;
    }
    return length;
}

ProgressBar::ProgressBar(std::ostream& out) : out_(out) {}

std::size_t ProgressBar::cellCount(unsigned unit_budget) {
    return (unit_budget + kUnitsPerCell - 1) / kUnitsPerCell;
}

std::string ProgressBar::renderLine(const Transfer& transfer) {
    std::string line;
    line.reserve(cellCount(transfer.unitBudget()) * 3 + 64);
    line += kBarStart;

    unsigned units = std::min(transfer.currentUnits(), transfer.unitBudget());
    std::size_t remaining = cellCount(transfer.unitBudget());
    while (units > 0) {
        const unsigned chunk = units >= kUnitsPerCell ? kUnitsPerCell : units % kUnitsPerCell;
        line += kGlyphs[chunk];
        units -= chunk;
        --remaining;
    }
    line.append(remaining, kFiller);
    line += kBarEnd;
    line += ' ';
    line += suffixOf(transfer);
    return line;
}

std::string ProgressBar::suffixOf(const Transfer& transfer) {
    const auto done = static_cast<double>(transfer.downloadedBytes());
    if (!transfer.hasKnownTotal()) {
        return formatSize(done);
    }
    return fmt::format("{} / {}", formatSize(done), formatSize(static_cast<double>(transfer.totalBytes())));
}

void ProgressBar::render(const Transfer& transfer) {
    const std::string line = renderLine(transfer);
    out_ << '\r' << line << std::flush;

    // Glyphs are multi-byte, so measure in terminal columns.
    const std::size_t width = cellCount(transfer.unitBudget()) + 3 + suffixOf(transfer).size();
    drawn_width_ = std::max(drawn_width_, width);
}

void ProgressBar::clear() {
    if (drawn_width_ == 0) {
        return;
    }
    out_ << '\r' << std::string(drawn_width_, ' ') << '\r' << std::flush;
    drawn_width_ = 0;
}

} // namespace streamdl
