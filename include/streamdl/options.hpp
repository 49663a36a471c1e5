#pragma once

#include <string>

namespace streamdl {

// Parses a non-negative decimal flag value no larger than `max_value`.
// Throws std::invalid_argument naming `option` otherwise.
[[nodiscard]] unsigned long long parseOptionValue(const std::string& option, const std::string& value,
                                                  unsigned long long max_value);

} // namespace streamdl
