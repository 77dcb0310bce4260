#pragma once

#include <string>

namespace gridlab {
namespace utils {

// Command-line value parsing. The whole text must be consumed; anything else
// throws InvalidParameterError naming the flag.
double parseNumberArg(const std::string& flag, const std::string& text);

// Rejects values outside the int range
int parseIntegerArg(const std::string& flag, const std::string& text);

} // namespace utils
} // namespace gridlab
