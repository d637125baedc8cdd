#pragma once

#include "signal.hpp"
#include <string>
#include <optional>

class SignalClassifier {
public:
    // First match wins: cancellation, then leverage-bearing signal, then irrelevant
    static Classification classify(const std::string& text);

    static std::optional<std::string> match_cancellation(const std::string& text);
    static bool mentions_leverage(const std::string& text);

private:
    static bool is_ticker_token(const std::string& token, bool has_marker);
    static std::string normalize_ticker(const std::string& token);
};
