#include "formatter.hpp"
#include "util.hpp"
#include <fmt/format.h>
#include <cctype>

SignalFormatter::SignalFormatter(const std::string& exchange_label)
    : exchange_label_(exchange_label) {}

std::string SignalFormatter::build_action_line(Direction direction) {
    std::string marker = direction == Direction::Long ? "🟢" : "🔴";
    return fmt::format("{} Action: {}", marker, direction_string(direction));
}

std::optional<std::string> SignalFormatter::format(const Classification& classification) const {
    switch (classification.intent) {
        case MessageIntent::Cancellation:
            return format_close_command(classification.symbol);
        case MessageIntent::OpenSignal:
            if (classification.signal) {
                return format_open_signal(*classification.signal);
            }
            return std::nullopt;
        default:
            return std::nullopt;
    }
}

std::string SignalFormatter::format_open_signal(const ParsedSignal& signal) const {
    // Prices are copied as matched, never reparsed, so precision survives
    std::string msg = build_action_line(signal.direction) + "\n";
    msg += fmt::format("💎 Symbol: #{}\n", util::to_upper(signal.symbol));
    msg += fmt::format("🏦 Exchange: {}\n", exchange_label_);
    msg += fmt::format("⚙️ Leverage: Cross ({})\n", signal.leverage);
    msg += fmt::format("🎯 Entry: {}\n", signal.entry_price);
    msg += fmt::format("💰 Target: {}\n", signal.take_profit);
    msg += fmt::format("🛑 Stop Loss: {}", signal.stop_loss);
    return msg;
}

std::string SignalFormatter::format_close_command(const std::string& symbol) {
    std::string cleaned;
    for (char c : util::to_upper(symbol)) {
        if (std::isalnum(static_cast<unsigned char>(c))) {
            cleaned.push_back(c);
        }
    }
    return "/close #" + cleaned;
}
