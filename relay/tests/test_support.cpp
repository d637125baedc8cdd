#include <catch2/catch_test_macros.hpp>
#include "../src/util.hpp"
#include "../src/config.hpp"
#include "../src/audit.hpp"
#include "../src/poller.hpp"
#include <cstdlib>

namespace {

void clear_relay_env() {
    for (const char* name : {"TG_BOT_TOKEN", "SOURCE_CHAT", "TARGET_CHAT", "REDIS_URL",
                             "PORT", "DEDUP_RETENTION_SECONDS", "SYMBOL_COOLDOWN_SECONDS",
                             "KEEPALIVE_INTERVAL_SECONDS", "EXCHANGE_LABEL", "AUDIT_MAXLEN"}) {
        unsetenv(name);
    }
}

} // namespace

TEST_CASE("String helpers", "[util]") {
    SECTION("Trim and collapse") {
        REQUIRE(util::trim("  abc \n") == "abc");
        REQUIRE(util::trim("   ").empty());
        REQUIRE(util::collapse_whitespace("  a \n\t b  c ") == "a b c");
    }

    SECTION("Case-insensitive search") {
        REQUIRE(util::contains_icase("Use LEVERAGE wisely", "leverage"));
        REQUIRE_FALSE(util::contains_icase("no match", "leverage"));
    }

    SECTION("Preview truncates long text") {
        REQUIRE(util::preview("short") == "short");
        std::string long_text(80, 'a');
        REQUIRE(util::preview(long_text) == std::string(50, 'a') + "...");
    }

    SECTION("Fingerprint ignores case and spacing only") {
        REQUIRE(util::content_fingerprint("BTC  LONG\n") == util::content_fingerprint("btc long"));
        REQUIRE(util::content_fingerprint("btc long") != util::content_fingerprint("btc short"));
        REQUIRE(util::content_fingerprint("x").size() == 16);
    }

    SECTION("Timestamp formatting") {
        REQUIRE(util::format_iso8601(0) == "1970-01-01T00:00:00Z");
        REQUIRE(util::format_iso8601(86400000) == "1970-01-02T00:00:00Z");
    }
}

TEST_CASE("Config from environment", "[config]") {
    clear_relay_env();

    SECTION("Defaults") {
        auto cfg = Config::from_env();
        REQUIRE(cfg.listen_port == 10000);
        REQUIRE(cfg.dedup_retention_seconds == 86400);
        REQUIRE(cfg.symbol_cooldown_seconds == 10);
        REQUIRE(cfg.retention_ms() == 86400000);
        REQUIRE(cfg.exchange_label == "Binance Futures");
        REQUIRE_FALSE(cfg.audit_enabled());
    }

    SECTION("Missing token fails validation") {
        auto cfg = Config::from_env();
        REQUIRE_THROWS_AS(cfg.validate(), std::runtime_error);
    }

    SECTION("Valid configuration") {
        setenv("TG_BOT_TOKEN", "123:abc", 1);
        setenv("SOURCE_CHAT", "@signals_in", 1);
        setenv("TARGET_CHAT", "@signals_out", 1);
        setenv("SYMBOL_COOLDOWN_SECONDS", "5", 1);
        setenv("PORT", "not-a-number", 1);

        auto cfg = Config::from_env();
        REQUIRE(cfg.symbol_cooldown_seconds == 5);
        REQUIRE(cfg.listen_port == 10000);
        REQUIRE_NOTHROW(cfg.validate());
    }

    SECTION("Cooldown must be shorter than retention") {
        setenv("TG_BOT_TOKEN", "123:abc", 1);
        setenv("SOURCE_CHAT", "@signals_in", 1);
        setenv("TARGET_CHAT", "@signals_out", 1);
        setenv("DEDUP_RETENTION_SECONDS", "60", 1);
        setenv("SYMBOL_COOLDOWN_SECONDS", "60", 1);

        REQUIRE_THROWS_AS(Config::from_env().validate(), std::runtime_error);
    }

    SECTION("Source and target must differ") {
        setenv("TG_BOT_TOKEN", "123:abc", 1);
        setenv("SOURCE_CHAT", "@same", 1);
        setenv("TARGET_CHAT", "@same", 1);

        REQUIRE_THROWS_AS(Config::from_env().validate(), std::runtime_error);
    }

    clear_relay_env();
}

TEST_CASE("Audit event", "[audit]") {
    SignalPipeline pipeline(86400000, 10000);
    auto decision = pipeline.evaluate(
        "ETH/USDT LONG\nLeverage 30x\nEntries 4089\nTarget 1 4150\nSL 4020", 2000);

    auto event = Auditor::build_audit_event(77, decision, 2000);

    REQUIRE(event["event"] == "forwarded");
    REQUIRE(event["message_id"] == 77);
    REQUIRE(event["intent"] == "open_signal");
    REQUIRE(event["symbol"] == "ETHUSDT");
    REQUIRE(event["verdict"] == "accepted");
    REQUIRE(event["forwarded"] == true);
    REQUIRE(event["ts"] == "1970-01-01T00:00:02Z");
    REQUIRE(event["signal"]["entry"] == "4089");
    REQUIRE(event["signal"]["leverage"] == "30X");
}

TEST_CASE("Update to raw message", "[poller]") {
    const int64_t source = -1001234567890;

    SECTION("Channel post from the source") {
        nlohmann::json update = {
            {"update_id", 10},
            {"channel_post", {
                {"message_id", 55},
                {"chat", {{"id", source}, {"type", "channel"}}},
                {"text", "ETH/USDT LONG"}
            }}
        };

        auto msg = ChannelPoller::to_raw_message(update, source);
        REQUIRE(msg.has_value());
        REQUIRE(msg->id == 55);
        REQUIRE(msg->text == "ETH/USDT LONG");
    }

    SECTION("Caption is used for media posts") {
        nlohmann::json update = {
            {"update_id", 11},
            {"channel_post", {
                {"message_id", 56},
                {"chat", {{"id", source}}},
                {"caption", "Leverage 10x"}
            }}
        };

        auto msg = ChannelPoller::to_raw_message(update, source);
        REQUIRE(msg.has_value());
        REQUIRE(msg->text == "Leverage 10x");
    }

    SECTION("Other chats are ignored") {
        nlohmann::json update = {
            {"update_id", 12},
            {"message", {
                {"message_id", 1},
                {"chat", {{"id", 42}}},
                {"text", "hi"}
            }}
        };

        REQUIRE_FALSE(ChannelPoller::to_raw_message(update, source).has_value());
    }

    SECTION("Updates without a post are ignored") {
        nlohmann::json update = {{"update_id", 13}};
        REQUIRE_FALSE(ChannelPoller::to_raw_message(update, source).has_value());
    }
}
