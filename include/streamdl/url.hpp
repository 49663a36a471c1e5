#pragma once

#include <string>

namespace streamdl {

// Resolves `reference` (absolute or relative) against `base`.
// Throws std::invalid_argument if either cannot be parsed.
[[nodiscard]] std::string resolveUrl(const std::string& base, const std::string& reference);

// Host part of `url`, or the url itself when it has none.
[[nodiscard]] std::string hostOf(const std::string& url);

} // namespace streamdl
