#pragma once

#include <string>
#include <cstdint>
#include <optional>

struct RawMessage {
    int64_t id = 0;
    std::string text;
};

enum class Direction {
    Long,
    Short
};

inline std::string direction_string(Direction d) {
    return d == Direction::Long ? "LONG" : "SHORT";
}

struct ParsedSignal {
    std::string symbol;      // e.g. BTCUSDT
    Direction direction = Direction::Long;
    std::string leverage;    // "30X" or "N/A"
    std::string entry_price;
    std::string take_profit;
    std::string stop_loss;
};

enum class MessageIntent {
    Cancellation,
    OpenSignal,
    Irrelevant
};

struct Classification {
    MessageIntent intent = MessageIntent::Irrelevant;
    std::string symbol;                   // set for Cancellation and OpenSignal
    std::optional<ParsedSignal> signal;   // set for OpenSignal only

    static Classification cancellation(const std::string& symbol) {
        Classification c;
        c.intent = MessageIntent::Cancellation;
        c.symbol = symbol;
        return c;
    }

    static Classification open_signal(const ParsedSignal& parsed) {
        Classification c;
        c.intent = MessageIntent::OpenSignal;
        c.symbol = parsed.symbol;
        c.signal = parsed;
        return c;
    }

    static Classification irrelevant() { return Classification{}; }

    std::string intent_string() const {
        switch (intent) {
            case MessageIntent::Cancellation: return "cancellation";
            case MessageIntent::OpenSignal: return "open_signal";
            default: return "irrelevant";
        }
    }
};
