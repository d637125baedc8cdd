#include "signal_extractor.hpp"
#include "util.hpp"
#include <vector>
#include <algorithm>
#include <cctype>

namespace {

const std::regex::flag_type kIcase = std::regex::ECMAScript | std::regex::icase;

bool is_upper_ticker(const std::string& word) {
    if (word.size() < 2 || word.size() > 10) return false;
    return std::all_of(word.begin(), word.end(),
                       [](char c) { return c >= 'A' && c <= 'Z'; });
}

bool is_direction_word(const std::string& upper_word) {
    return upper_word == "BUY" || upper_word == "LONG" ||
           upper_word == "SELL" || upper_word == "SHORT";
}

std::vector<std::string> alnum_words(const std::string& text) {
    std::vector<std::string> words;
    std::string current;
    for (char c : text) {
        if (std::isalnum(static_cast<unsigned char>(c))) {
            current.push_back(c);
        } else if (!current.empty()) {
            words.push_back(current);
            current.clear();
        }
    }
    if (!current.empty()) words.push_back(current);
    return words;
}

} // namespace

std::optional<ParsedSignal> SignalExtractor::extract(const std::string& text) {
    std::string normalized = util::collapse_whitespace(text);
    if (normalized.empty()) return std::nullopt;

    auto symbol = extract_symbol(normalized);
    auto direction = extract_direction(normalized);
    auto entry = extract_entry(normalized);
    auto target = extract_target(normalized);
    auto stop_loss = extract_stop_loss(normalized);

    // Leverage is the only optional field
    if (!symbol || !direction || !entry || !target || !stop_loss) {
        return std::nullopt;
    }

    ParsedSignal signal;
    signal.symbol = *symbol;
    signal.direction = *direction;
    signal.leverage = extract_leverage(normalized);
    signal.entry_price = *entry;
    signal.take_profit = *target;
    signal.stop_loss = *stop_loss;
    return signal;
}

std::optional<std::string> SignalExtractor::extract_symbol(const std::string& text) {
    static const std::regex hashtag_re(
        R"(#([A-Za-z]{2,10})(?:[/_\-]([A-Za-z]{2,10}))?(?![A-Za-z0-9]))");
    static const std::regex slash_re(
        R"((?:^|[^A-Za-z0-9])([A-Za-z]{2,10})/([A-Za-z]{2,10})(?![A-Za-z0-9]))");

    // An explicit pair outranks tags, channels decorate posts with "#VIP" and the like
    for (auto it = std::sregex_iterator(text.begin(), text.end(), slash_re);
         it != std::sregex_iterator(); ++it) {
        std::string base = util::to_upper((*it)[1].str());
        std::string quote = util::to_upper((*it)[2].str());
        if (is_quote_asset(quote) && !is_reserved_word(base)) {
            return normalize_pair(base, quote);
        }
    }

    for (auto it = std::sregex_iterator(text.begin(), text.end(), hashtag_re);
         it != std::sregex_iterator(); ++it) {
        std::string base = util::to_upper((*it)[1].str());
        if (!is_reserved_word(base)) {
            return normalize_pair(base, (*it)[2].str());
        }
    }

    // Bare tickers must be written in uppercase, otherwise prose matches
    auto words = alnum_words(text);
    std::vector<bool> candidate(words.size(), false);
    std::optional<size_t> direction_idx;

    for (size_t i = 0; i < words.size(); i++) {
        std::string upper = util::to_upper(words[i]);
        if (!direction_idx && is_direction_word(upper)) {
            direction_idx = i;
        }
        candidate[i] = is_upper_ticker(words[i]) && !is_reserved_word(words[i]);
    }

    if (direction_idx) {
        size_t d = *direction_idx;
        if (d > 0 && candidate[d - 1]) return normalize_pair(words[d - 1], "");
        if (d + 1 < words.size() && candidate[d + 1]) return normalize_pair(words[d + 1], "");
    }

    for (size_t i = 0; i < words.size(); i++) {
        if (candidate[i]) return normalize_pair(words[i], "");
    }

    return std::nullopt;
}

std::optional<Direction> SignalExtractor::extract_direction(const std::string& text) {
    static const std::regex direction_re(R"(\b(buy|long|sell|short)\b)", kIcase);

    std::smatch m;
    if (!std::regex_search(text, m, direction_re)) {
        return std::nullopt;
    }

    std::string word = util::to_upper(m[1].str());
    if (word == "BUY" || word == "LONG") {
        return Direction::Long;
    }
    return Direction::Short;
}

std::string SignalExtractor::extract_leverage(const std::string& text) {
    static const std::regex leverage_re(
        R"((?:^|[\s:(\-])(\d{1,4})\s?[xX](?![A-Za-z0-9]))");

    std::smatch m;

    // Prefer a value stated after the keyword, fall back to anywhere in the text
    std::string lower = util::to_lower(text);
    size_t keyword = lower.find("leverage");
    if (keyword != std::string::npos) {
        std::string tail = text.substr(keyword);
        if (std::regex_search(tail, m, leverage_re)) {
            return m[1].str() + "X";
        }
    }

    if (std::regex_search(text, m, leverage_re)) {
        return m[1].str() + "X";
    }

    return NO_LEVERAGE;
}

std::optional<std::string> SignalExtractor::extract_entry(const std::string& text) {
    static const std::regex entry_re(
        R"(\bentr(?:y|ies)(?:\s*(?:zone|price|point))?[\s:=@$~#\-]*(\d+(?:\.\d+)?))",
        kIcase);
    return match_decimal(text, entry_re);
}

std::optional<std::string> SignalExtractor::extract_target(const std::string& text) {
    // "Target 1 4150": the literal 1 is a label, not the value
    static const std::regex target_re(
        R"(\btargets?(?:\s*1(?![\d.]))?[\s:=@$~#)\-]*(\d+(?:\.\d+)?))",
        kIcase);
    return match_decimal(text, target_re);
}

std::optional<std::string> SignalExtractor::extract_stop_loss(const std::string& text) {
    static const std::regex stop_loss_re(
        R"(\b(?:sl|stop[\s\-]*loss)[\s:=@$~#\-]*(\d+(?:\.\d+)?))",
        kIcase);
    return match_decimal(text, stop_loss_re);
}

std::string SignalExtractor::normalize_pair(const std::string& base, const std::string& quote) {
    auto clean = [](const std::string& s) {
        std::string out;
        for (char c : s) {
            if (std::isalnum(static_cast<unsigned char>(c))) {
                out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
            }
        }
        return out;
    };

    std::string b = clean(base);
    std::string q = clean(quote);

    if (!q.empty()) {
        return b + q;
    }
    if (has_quote_suffix(b)) {
        return b;
    }
    return b + DEFAULT_QUOTE;
}

bool SignalExtractor::has_quote_suffix(const std::string& symbol) {
    static const std::vector<std::string> quotes = {
        "USDT", "USDC", "BUSD", "FDUSD", "TUSD"
    };

    for (const auto& q : quotes) {
        if (symbol.size() >= q.size() + 2 &&
            symbol.compare(symbol.size() - q.size(), q.size(), q) == 0) {
            return true;
        }
    }
    return false;
}

bool SignalExtractor::is_quote_asset(const std::string& upper_word) {
    static const std::vector<std::string> quotes = {
        "USDT", "USDC", "BUSD", "FDUSD", "TUSD", "USD", "BTC", "ETH", "BNB"
    };

    return std::find(quotes.begin(), quotes.end(), upper_word) != quotes.end();
}

bool SignalExtractor::is_reserved_word(const std::string& upper_word) {
    static const std::vector<std::string> reserved = {
        "BUY", "SELL", "LONG", "SHORT", "SL", "TP", "ENTRY", "ENTRIES",
        "TARGET", "TARGETS", "LEVERAGE", "CROSS", "ISOLATED", "STOP", "LOSS",
        "TAKE", "PROFIT", "PRICE", "ZONE", "SIGNAL", "TRADE", "FUTURES", "SPOT",
        "CLOSE", "MANUALLY", "CANCELLED", "CANCELED", "EXCHANGE", "ACTION",
        "SYMBOL", "NEW", "VIP", "USDT", "USDC", "BUSD", "FDUSD", "TUSD"
    };

    return std::find(reserved.begin(), reserved.end(), upper_word) != reserved.end();
}

std::optional<std::string> SignalExtractor::match_decimal(const std::string& text,
                                                          const std::regex& pattern) {
    std::smatch m;
    if (std::regex_search(text, m, pattern)) {
        return m[1].str();
    }
    return std::nullopt;
}
