#include "streamdl/options.hpp"

#include <fmt/format.h>

#include <cctype>
#include <stdexcept>

namespace streamdl {

unsigned long long parseOptionValue(const std::string& option, const std::string& value,
                                    unsigned long long max_value) {
    // stoull would accept a sign and wrap negatives around.
    if (value.empty() || !std::isdigit(static_cast<unsigned char>(value.front()))) {
        throw std::invalid_argument(fmt::format("Invalid value for {}: {}", option, value));
    }

    unsigned long long number = 0;
    try {
        std::size_t used = 0;
        number = std::stoull(value, &used);
        if (used != value.size()) {
            throw std::invalid_argument(value);
        }
    } catch (const std::exception&) {
        throw std::invalid_argument(fmt::format("Invalid value for {}: {}", option, value));
    }

    if (number > max_value) {
        throw std::invalid_argument(fmt::format("Value for {} must not exceed {}", option, max_value));
    }
    return number;
}

} // namespace streamdl
