#ifndef PARSE_UTILS_HPP
#define PARSE_UTILS_HPP

#include <cstddef>
#include <string>

// Parse a byte size with an optional unit suffix.
// Format: decimal digits followed by an optional K, M or G (with or without a
// trailing B, case-insensitive); units are powers of 1024.
// Invalid input: empty, non-numeric, unknown suffix or overflow sets ok=false
// and returns 0.
size_t parse_bytes(const std::string& value, bool& ok);

// Parse a decimal integer within [min, max]. Sets ok=false and returns 0 on
// anything else, including trailing characters.
int parse_int(const std::string& value, int min, int max, bool& ok);

#endif // PARSE_UTILS_HPP
