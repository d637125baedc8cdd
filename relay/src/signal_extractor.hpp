#pragma once

#include "signal.hpp"
#include <string>
#include <optional>
#include <regex>

// Field extractors for the fixed signal grammar. Every function is pure and
// expects whitespace-normalized text (see util::collapse_whitespace);
// extract() normalizes on its own.
class SignalExtractor {
public:
    static std::optional<ParsedSignal> extract(const std::string& text);

    static std::optional<std::string> extract_symbol(const std::string& text);
    static std::optional<Direction> extract_direction(const std::string& text);
    static std::string extract_leverage(const std::string& text);
    static std::optional<std::string> extract_entry(const std::string& text);
    static std::optional<std::string> extract_target(const std::string& text);
    static std::optional<std::string> extract_stop_loss(const std::string& text);

    // BTC + "" -> BTCUSDT, BTCUSDT + "" -> BTCUSDT, ETH + BTC -> ETHBTC
    static std::string normalize_pair(const std::string& base, const std::string& quote);

    static constexpr const char* DEFAULT_QUOTE = "USDT";
    static constexpr const char* NO_LEVERAGE = "N/A";

private:
    static bool has_quote_suffix(const std::string& symbol);
    static bool is_reserved_word(const std::string& upper_word);
    static bool is_quote_asset(const std::string& upper_word);
    static std::optional<std::string> match_decimal(const std::string& text,
                                                    const std::regex& pattern);
};
