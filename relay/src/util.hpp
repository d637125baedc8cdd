#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <cstdint>

namespace util {
    std::string current_iso8601();
    std::string format_iso8601(int64_t timestamp_ms);
    int64_t current_timestamp_ms();
    std::string trim(const std::string& str);
    std::string to_lower(const std::string& str);
    std::string to_upper(const std::string& str);
    std::string collapse_whitespace(const std::string& str);
    bool contains_icase(const std::string& haystack, const std::string& needle);
    std::string preview(const std::string& str, size_t max_len = 50);

    // Hex hash of the whitespace-collapsed, lower-cased text
    std::string content_fingerprint(const std::string& text);
}
