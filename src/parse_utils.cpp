#include "parse_utils.hpp"
#include <algorithm>
#include <cctype>
#include <limits>
#include <stdexcept>

int parse_int(const std::string& value, int min, int max, bool& ok) {
    ok = false;
    if (value.empty() || !std::all_of(value.begin(), value.end(), [](unsigned char c) {
            return std::isdigit(c) != 0 || c == '-' || c == '+';
        }))
        return 0;
    try {
        size_t used = 0;
        int v = std::stoi(value, &used);
        if (used != value.size() || v < min || v > max)
            return 0;
        ok = true;
        return v;
    } catch (const std::invalid_argument&) {
        return 0;
    } catch (const std::out_of_range&) {
        return 0;
    }
}

size_t parse_bytes(const std::string& value, bool& ok) {
    ok = false;
    std::string val = value;
    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (!val.empty() && val.back() == 'b')
        val.pop_back();
    unsigned long long mult = 1;
    if (!val.empty()) {
        switch (val.back()) {
        case 'k':
            mult = 1024ull;
            break;
        case 'm':
            mult = 1024ull * 1024;
            break;
        case 'g':
            mult = 1024ull * 1024 * 1024;
            break;
        default:
            break;
        }
        if (mult != 1)
            val.pop_back();
    }
    if (val.empty() || !std::all_of(val.begin(), val.end(),
                                    [](unsigned char c) { return std::isdigit(c) != 0; }))
        return 0;
    try {
        unsigned long long n = std::stoull(val);
        if (n > std::numeric_limits<size_t>::max() / mult)
            return 0;
        ok = true;
        return static_cast<size_t>(n * mult);
    } catch (const std::out_of_range&) {
        return 0;
    }
}
