#pragma once

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>

namespace streamdl {

// Byte counters of one in-flight download, quantized into a fixed budget of
// progress units. total_bytes == 0 means the length is unknown.
class Transfer {
public:
    Transfer(std::string url, std::uint64_t total_bytes, unsigned unit_budget = 100);

    // Counts `bytes` more and returns true when the unit target moved past the
    // last rendered value.
    bool advance(std::size_t bytes);

    [[nodiscard]] unsigned targetUnits() const;

    [[nodiscard]] const std::string& url() const { return url_; }
    [[nodiscard]] std::uint64_t downloadedBytes() const { return downloaded_bytes_; }
    [[nodiscard]] std::uint64_t totalBytes() const { return total_bytes_; }
    [[nodiscard]] bool hasKnownTotal() const { return total_bytes_ > 0; }
    [[nodiscard]] unsigned currentUnits() const { return current_units_; }
    [[nodiscard]] unsigned unitBudget() const { return unit_budget_; }

private:
    std::string url_;
    std::uint64_t downloaded_bytes_{0};
    std::uint64_t total_bytes_{0};
    unsigned current_units_{0};
    unsigned unit_budget_;
};

// Parses a Content-Length value the lenient way: leading blanks are skipped and
// the leading run of digits is taken. Anything unusable yields 0.
[[nodiscard]] std::uint64_t parseContentLength(std::string_view value);

class ProgressBar {
public:
    explicit ProgressBar(std::ostream& out);

    void render(const Transfer& transfer);
    // Blanks out the last rendered line. No-op if nothing was drawn.
    void clear();

    [[nodiscard]] static std::string renderLine(const Transfer& transfer);
    [[nodiscard]] static std::size_t cellCount(unsigned unit_budget);

private:
    static std::string suffixOf(const Transfer& transfer);

    std::ostream& out_;
    std::size_t drawn_width_{0};
};

} // namespace streamdl
