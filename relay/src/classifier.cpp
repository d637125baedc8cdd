#include "classifier.hpp"
#include "signal_extractor.hpp"
#include "util.hpp"
#include <regex>
#include <algorithm>
#include <cctype>

Classification SignalClassifier::classify(const std::string& text) {
    std::string normalized = util::collapse_whitespace(text);
    if (normalized.empty()) {
        return Classification::irrelevant();
    }

    if (auto symbol = match_cancellation(normalized)) {
        return Classification::cancellation(*symbol);
    }

    if (mentions_leverage(normalized)) {
        // The keyword alone is not enough, malformed signals are dropped
        if (auto parsed = SignalExtractor::extract(normalized)) {
            return Classification::open_signal(*parsed);
        }
    }

    return Classification::irrelevant();
}

std::optional<std::string> SignalClassifier::match_cancellation(const std::string& text) {
    static const std::regex symbol_first_re(
        R"((?:^|[^A-Za-z0-9#/_\-])(#?)([A-Za-z0-9]{2,20}(?:[/_\-][A-Za-z0-9]{2,10})?)\s*[:,\-]?\s*manually\s+cancell?ed)",
        std::regex::ECMAScript | std::regex::icase);
    static const std::regex phrase_first_re(
        R"(manually\s+cancell?ed\s*[:,\-]?\s*(#?)([A-Za-z0-9]{2,20}(?:[/_\-][A-Za-z0-9]{2,10})?)(?![A-Za-z0-9]))",
        std::regex::ECMAScript | std::regex::icase);

    for (const auto* re : {&symbol_first_re, &phrase_first_re}) {
        std::smatch m;
        auto begin = text.cbegin();
        auto flags = std::regex_constants::match_default;
        while (std::regex_search(begin, text.cend(), m, *re, flags)) {
            if (is_ticker_token(m[2].str(), m[1].length() > 0)) {
                return normalize_ticker(m[2].str());
            }
            begin = m[0].second;
            flags = std::regex_constants::match_prev_avail;
        }
    }

    return std::nullopt;
}

bool SignalClassifier::mentions_leverage(const std::string& text) {
    return util::contains_icase(text, "leverage");
}

bool SignalClassifier::is_ticker_token(const std::string& token, bool has_marker) {
    bool has_letter = std::any_of(token.begin(), token.end(),
                                  [](char c) { return std::isalpha(static_cast<unsigned char>(c)); });
    if (!has_letter) return false;
    if (has_marker) return true;

    // Without '#' only an uppercase token counts, "Trade manually cancelled" is prose
    return std::none_of(token.begin(), token.end(),
                        [](char c) { return c >= 'a' && c <= 'z'; });
}

std::string SignalClassifier::normalize_ticker(const std::string& token) {
    size_t sep = token.find_first_of("/_-");
    if (sep == std::string::npos) {
        return SignalExtractor::normalize_pair(token, "");
    }
    return SignalExtractor::normalize_pair(token.substr(0, sep), token.substr(sep + 1));
}
