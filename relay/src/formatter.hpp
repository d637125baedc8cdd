#pragma once

#include "signal.hpp"
#include <string>
#include <optional>

class SignalFormatter {
public:
    explicit SignalFormatter(const std::string& exchange_label = DEFAULT_EXCHANGE);

    // Irrelevant -> nullopt; same input always renders the same text
    std::optional<std::string> format(const Classification& classification) const;

    std::string format_open_signal(const ParsedSignal& signal) const;
    static std::string format_close_command(const std::string& symbol);

    const std::string& exchange_label() const { return exchange_label_; }

    static constexpr const char* DEFAULT_EXCHANGE = "Binance Futures";

private:
    std::string exchange_label_;

    static std::string build_action_line(Direction direction);
};
