#include "util.hpp"
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <functional>
#include <cctype>
#include <ctime>

namespace util {

std::string current_iso8601() {
    return format_iso8601(current_timestamp_ms());
}

std::string format_iso8601(int64_t timestamp_ms) {
    std::time_t itt = static_cast<std::time_t>(timestamp_ms / 1000);
    std::tm tm_utc{};
    gmtime_r(&itt, &tm_utc);
    std::ostringstream ss;
    ss << std::put_time(&tm_utc, "%FT%TZ");
    return ss.str();
}

int64_t current_timestamp_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

std::string trim(const std::string& str) {
    auto start = str.begin();
    while (start != str.end() && std::isspace(static_cast<unsigned char>(*start))) start++;

    auto end = str.end();
    while (end != start && std::isspace(static_cast<unsigned char>(*(end - 1)))) end--;

    return std::string(start, end);
}

std::string to_lower(const std::string& str) {
    std::string out = str;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string to_upper(const std::string& str) {
    std::string out = str;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

std::string collapse_whitespace(const std::string& str) {
    std::string out;
    out.reserve(str.size());

    bool pending_space = false;
    for (char c : str) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) {
            out.push_back(' ');
            pending_space = false;
        }
        out.push_back(c);
    }
    return out;
}

bool contains_icase(const std::string& haystack, const std::string& needle) {
    return to_lower(haystack).find(to_lower(needle)) != std::string::npos;
}

std::string preview(const std::string& str, size_t max_len) {
    std::string flat = collapse_whitespace(str);
    if (flat.size() <= max_len) {
        return flat;
    }

    // Do not cut a UTF-8 sequence in half
    size_t cut = max_len;
    while (cut > 0 && (static_cast<unsigned char>(flat[cut]) & 0xC0) == 0x80) {
        cut--;
    }
    return flat.substr(0, cut) + "...";
}

std::string content_fingerprint(const std::string& text) {
    std::string normalized = to_lower(collapse_whitespace(text));

    std::hash<std::string> hasher;
    size_t hash_val = hasher(normalized);

    std::ostringstream ss;
    ss << std::hex << std::setw(16) << std::setfill('0') << hash_val;
    return ss.str();
}

} // namespace util
