#include <catch2/catch_test_macros.hpp>
#include "../src/pipeline.hpp"
#include "../src/relay.hpp"
#include <string>
#include <vector>

namespace {

constexpr int64_t kDay = 24LL * 3600 * 1000;
constexpr int64_t kCooldown = 10 * 1000;

const std::string kEthSignal =
    "ETH/USDT LONG\nLeverage 30x\nEntries 4089\nTarget 1 4150\nSL 4020";

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

} // namespace

TEST_CASE("Pipeline output", "[pipeline]") {
    SignalPipeline pipeline(kDay, kCooldown);

    SECTION("Open signal is reformatted") {
        auto out = pipeline.process(kEthSignal, 0);
        REQUIRE(out.has_value());
        REQUIRE(contains(*out, "Action: LONG"));
        REQUIRE(contains(*out, "Symbol: #ETHUSDT"));
        REQUIRE(contains(*out, "Leverage: Cross (30X)"));
        REQUIRE(contains(*out, "Entry: 4089"));
        REQUIRE(contains(*out, "Target: 4150"));
        REQUIRE(contains(*out, "Stop Loss: 4020"));
    }

    SECTION("Prices keep their source precision") {
        auto out = pipeline.process(
            "BTC/USDT SHORT Leverage 50x Entry 110200.50 Target 108000.00 SL 111000.10", 0);
        REQUIRE(out.has_value());
        REQUIRE(contains(*out, "Entry: 110200.50"));
        REQUIRE(contains(*out, "Target: 108000.00"));
        REQUIRE(contains(*out, "Stop Loss: 111000.10"));
        REQUIRE(contains(*out, "Action: SHORT"));
    }

    SECTION("Cancellation takes precedence over leverage") {
        auto out = pipeline.process("#BTCUSDT Manually Cancelled, was using Leverage 20x", 0);
        REQUIRE(out == std::string("/close #BTCUSDT"));
    }

    SECTION("Text without either keyword is dropped") {
        REQUIRE_FALSE(pipeline.process("Good morning traders", 0).has_value());
        REQUIRE_FALSE(pipeline.process("ETH/USDT LONG Entries 4089 Target 1 4150 SL 4020", 0).has_value());
        REQUIRE_FALSE(pipeline.process("", 0).has_value());
    }

    SECTION("Leverage without prices is dropped") {
        REQUIRE_FALSE(pipeline.process("BTC/USDT LONG Leverage 20x", 0).has_value());
    }

    SECTION("Raw message overload") {
        RawMessage msg{42, kEthSignal};
        REQUIRE(pipeline.process(msg, 0).has_value());
    }
}

TEST_CASE("Pipeline deduplication", "[pipeline]") {
    SignalPipeline pipeline(kDay, kCooldown);

    SECTION("Identical text is relayed once") {
        REQUIRE(pipeline.process(kEthSignal, 1000).has_value());
        REQUIRE_FALSE(pipeline.process(kEthSignal, 1001).has_value());
        REQUIRE_FALSE(pipeline.process(kEthSignal, kDay / 2).has_value());
    }

    SECTION("Reworded repost of the same symbol inside the cooldown") {
        REQUIRE(pipeline.process(kEthSignal, 0).has_value());
        REQUIRE_FALSE(pipeline.process(
            "#ETHUSDT BUY Leverage 25x Entry 4090 Target 4160 SL 4010", 3000).has_value());
    }

    SECTION("Close right after an open is still delivered") {
        REQUIRE(pipeline.process("#SOLUSDT LONG Leverage 20x Entry 150 Target 160 SL 140", 0)
                    .has_value());
        REQUIRE(pipeline.process("#SOLUSDT Manually Cancelled", 3000)
                == std::string("/close #SOLUSDT"));
        REQUIRE_FALSE(pipeline.process("SOLUSDT manually cancelled", 4000).has_value());
    }

    SECTION("Reworded repost after the cooldown") {
        REQUIRE(pipeline.process(kEthSignal, 0).has_value());
        REQUIRE(pipeline.process(
            "#ETHUSDT BUY Leverage 25x Entry 4090 Target 4160 SL 4010", 20000).has_value());
    }

    SECTION("Accepted again after the retention window") {
        REQUIRE(pipeline.process(kEthSignal, 0).has_value());
        REQUIRE(pipeline.process(kEthSignal, kDay).has_value());
    }

    SECTION("Dropped messages never touch the cache") {
        pipeline.process("Good morning traders", 0);
        pipeline.process("BTC/USDT LONG Leverage 20x", 0);
        REQUIRE(pipeline.cache().seen_count() == 0);
    }

    SECTION("Dropped messages still expire old entries") {
        REQUIRE(pipeline.process(kEthSignal, 0).has_value());
        REQUIRE(pipeline.cache().cooldown_count() == 1);

        pipeline.process("Good morning traders", kDay);
        REQUIRE(pipeline.cache().seen_count() == 0);
        REQUIRE(pipeline.cache().cooldown_count() == 0);
    }
}

TEST_CASE("Pipeline decisions", "[pipeline]") {
    SignalPipeline pipeline(kDay, kCooldown);

    auto irrelevant = pipeline.evaluate("hello", 0);
    REQUIRE_FALSE(irrelevant.verdict.has_value());
    REQUIRE(irrelevant.reason() == "irrelevant");
    REQUIRE(irrelevant.fingerprint.empty());

    auto first = pipeline.evaluate(kEthSignal, 0);
    REQUIRE(first.forward());
    REQUIRE(first.reason() == "accepted");
    REQUIRE_FALSE(first.fingerprint.empty());

    REQUIRE(SignalPipeline::cooldown_key(first.classification) == "open_signal:ETHUSDT");
    REQUIRE(SignalPipeline::cooldown_key(irrelevant.classification).empty());

    auto second = pipeline.evaluate(kEthSignal, 1);
    REQUIRE_FALSE(second.forward());
    REQUIRE(second.reason() == "duplicate_content");
    REQUIRE(second.fingerprint == first.fingerprint);
}

TEST_CASE("Relay delivery and stats", "[relay]") {
    SignalPipeline pipeline(kDay, kCooldown);
    std::vector<std::string> sent;
    std::vector<nlohmann::json> audited;
    int64_t now = 0;
    bool send_ok = true;

    SignalRelay relay(pipeline,
        [&](const std::string& text) { sent.push_back(text); return send_ok; },
        [&](const nlohmann::json& event) { audited.push_back(event); },
        [&]() { return now; });

    SECTION("Forward, suppress, skip") {
        now = 1000;
        REQUIRE(relay.handle(RawMessage{1, kEthSignal}));
        now = 1500;
        REQUIRE_FALSE(relay.handle(RawMessage{2, kEthSignal}));
        REQUIRE_FALSE(relay.handle(RawMessage{3, "just chatting"}));

        REQUIRE(sent.size() == 1);
        REQUIRE(relay.stats().received.load() == 3);
        REQUIRE(relay.stats().forwarded.load() == 1);
        REQUIRE(relay.stats().suppressed.load() == 1);
        REQUIRE(relay.stats().skipped.load() == 1);
        REQUIRE(relay.stats().last_forward_ms.load() == 1000);

        REQUIRE(audited.size() == 3);
        REQUIRE(audited[0]["verdict"] == "accepted");
        REQUIRE(audited[0]["delivered"] == true);
        REQUIRE(audited[1]["verdict"] == "duplicate_content");
        REQUIRE(audited[2]["intent"] == "irrelevant");
    }

    SECTION("Failed delivery is counted") {
        send_ok = false;
        REQUIRE_FALSE(relay.handle(RawMessage{1, "#SOLUSDT manually cancelled"}));
        REQUIRE(sent.size() == 1);
        REQUIRE(sent[0] == "/close #SOLUSDT");
        REQUIRE(relay.stats().send_failures.load() == 1);
        REQUIRE(relay.stats().forwarded.load() == 0);
        REQUIRE(audited[0]["delivered"] == false);
    }

    SECTION("Stats json") {
        now = 5000;
        relay.handle(RawMessage{1, kEthSignal});
        auto j = relay.stats().to_json();
        REQUIRE(j["received"] == 1);
        REQUIRE(j["forwarded"] == 1);
        REQUIRE(j["last_forward"] == "1970-01-01T00:00:05Z");
    }
}
