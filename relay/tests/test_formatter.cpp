#include <catch2/catch_test_macros.hpp>
#include "../src/formatter.hpp"

namespace {

ParsedSignal make_signal(Direction direction) {
    ParsedSignal s;
    s.symbol = "ETHUSDT";
    s.direction = direction;
    s.leverage = "30X";
    s.entry_price = "4089";
    s.take_profit = "4150";
    s.stop_loss = "4020";
    return s;
}

} // namespace

TEST_CASE("Close command", "[formatter]") {
    REQUIRE(SignalFormatter::format_close_command("BTCUSDT") == "/close #BTCUSDT");
    REQUIRE(SignalFormatter::format_close_command("btcusdt") == "/close #BTCUSDT");
    REQUIRE(SignalFormatter::format_close_command("BTC/USDT") == "/close #BTCUSDT");
}

TEST_CASE("Open signal template", "[formatter]") {
    SignalFormatter formatter;

    SECTION("Long") {
        std::string expected =
            "🟢 Action: LONG\n"
            "💎 Symbol: #ETHUSDT\n"
            "🏦 Exchange: Binance Futures\n"
            "⚙️ Leverage: Cross (30X)\n"
            "🎯 Entry: 4089\n"
            "💰 Target: 4150\n"
            "🛑 Stop Loss: 4020";
        REQUIRE(formatter.format_open_signal(make_signal(Direction::Long)) == expected);
    }

    SECTION("Short uses its own marker") {
        auto text = formatter.format_open_signal(make_signal(Direction::Short));
        REQUIRE(text.rfind("🔴 Action: SHORT\n", 0) == 0);
    }

    SECTION("Values pass through unchanged") {
        auto s = make_signal(Direction::Long);
        s.entry_price = "110200.50";
        s.take_profit = "0.000120";
        auto text = formatter.format_open_signal(s);
        REQUIRE(text.find("Entry: 110200.50\n") != std::string::npos);
        REQUIRE(text.find("Target: 0.000120\n") != std::string::npos);
    }

    SECTION("Custom exchange label") {
        SignalFormatter bybit("Bybit");
        REQUIRE(bybit.format_open_signal(make_signal(Direction::Long))
                    .find("Exchange: Bybit\n") != std::string::npos);
    }
}

TEST_CASE("Format by classification", "[formatter]") {
    SignalFormatter formatter;

    REQUIRE_FALSE(formatter.format(Classification::irrelevant()).has_value());
    REQUIRE(formatter.format(Classification::cancellation("SOLUSDT")) == "/close #SOLUSDT");

    auto c = Classification::open_signal(make_signal(Direction::Long));
    auto first = formatter.format(c);
    REQUIRE(first.has_value());
    REQUIRE(formatter.format(c) == first);
}
