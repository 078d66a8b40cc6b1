#pragma once

#include <string>
#include <vector>

namespace utils {

// "%41b+c" -> "Ab c" when plusAsSpace is set. Malformed escapes are kept
// verbatim.
std::string percentDecode(const std::string& in, bool plusAsSpace = false);

// Splits on any of the delimiter characters, dropping empty pieces.
std::vector<std::string> splitAny(const std::string& in,
                                  const std::string& delimiters);

std::string trim(const std::string& in);

bool startsWithNoCase(const std::string& text, const std::string& prefix);

}  // namespace utils
