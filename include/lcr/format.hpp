#pragma once

#include <string>
#include <cstdint>
#include <algorithm>


namespace lcr {

// Format an integer with thousands separators
// Example: 6436311 -> "6,436,311"
inline std::string format_number_exact(uint64_t value) {
    std::string raw = std::to_string(value);
    std::string formatted;
    formatted.reserve(raw.size() + raw.size() / 3);

    int count = 0;
    for (auto it = raw.rbegin(); it != raw.rend(); ++it) {
        if (count == 3) {
            formatted.push_back(',');
            count = 0;
        }
        formatted.push_back(*it);
        ++count;
    }
    std::reverse(formatted.begin(), formatted.end());
    return formatted;
}

// Format a ratio of two counters as a percentage with one decimal
// Example: (1, 8) -> "12.5%"; a zero denominator yields "n/a"
inline std::string format_ratio(uint64_t part, uint64_t total) {
    if (total == 0) {
        return "n/a";
    }
    const uint64_t permille = (part * 1000 + total / 2) / total;
    return std::to_string(permille / 10) + "." + std::to_string(permille % 10) + "%";
}

} // namespace lcr
