#pragma once

#include <ostream>
#include <string_view>

namespace streamdl {

// Line-oriented status output. Verbosity is fixed at construction so that
// independent consoles can coexist.
class Console {
public:
    Console(std::ostream& out, std::ostream& err, bool verbose = false);

    void info(std::string_view line) const;
    void debug(std::string_view line) const;
    void warn(std::string_view line) const;
    void error(std::string_view line) const;
    void header(std::string_view line) const;

    [[nodiscard]] bool isVerbose() const { return verbose_; }
    [[nodiscard]] std::ostream& out() const { return out_; }

private:
    std::ostream& out_;
    std::ostream& err_;
    bool verbose_;
};

} // namespace streamdl
