#pragma once

#include <cstddef>
#include <string>

namespace soda {
namespace utf8 {

bool isValid(const std::string& text);

// Decodes a NUL-terminated byte string, replacing every malformed sequence
// with U+FFFD. A null pointer yields an empty string.
std::string toLossy(const char* text);
std::string toLossy(const char* data, std::size_t size);

} // namespace utf8
} // namespace soda
