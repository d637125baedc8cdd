#include "status_server.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>

StatusServer::StatusServer(const Config& config,
                           const HealthCheck& health,
                           const RelayStats& stats)
    : config_(config)
    , health_(health)
    , stats_(stats)
    , server_(std::make_unique<httplib::Server>())
{}

StatusServer::~StatusServer() {
    stop();
}

void StatusServer::start() {
    if (running_) return;

    setup_routes();
    running_ = true;

    server_thread_ = std::thread([this]() {
        spdlog::info("Starting HTTP server on {}:{}",
                     config_.listen_addr, config_.listen_port);
        if (!server_->listen(config_.listen_addr.c_str(), config_.listen_port)) {
            spdlog::error("HTTP server failed to listen on {}:{}",
                          config_.listen_addr, config_.listen_port);
        }
    });

    spdlog::info("Status server started");
}

void StatusServer::stop() {
    if (!running_) return;

    running_ = false;
    server_->stop();

    if (server_thread_.joinable()) {
        server_thread_.join();
    }

    spdlog::info("Status server stopped");
}

void StatusServer::setup_routes() {
    server_->Get("/health",
        [this](const httplib::Request& req, httplib::Response& res) {
            handle_health(req, res);
        });

    server_->Get("/",
        [this](const httplib::Request& req, httplib::Response& res) {
            handle_status_page(req, res);
        });
}

void StatusServer::handle_health(const httplib::Request&, httplib::Response& res) {
    try {
        auto status = health_.get_status();
        bool ok = status.value("ok", false);
        res.set_content(status.dump(), "application/json");
        res.status = ok ? 200 : 503;
    } catch (const std::exception& e) {
        spdlog::error("Health handler error: {}", e.what());
        res.status = 500;
    }
}

void StatusServer::handle_status_page(const httplib::Request&, httplib::Response& res) {
    std::string html = fmt::format(R"(<!DOCTYPE html>
<html>
<head>
    <title>Signal Relay</title>
    <style>
        body {{ font-family: Arial; max-width: 800px; margin: 50px auto; padding: 20px; }}
        .status {{ background: #4CAF50; color: white; padding: 20px; border-radius: 5px; }}
        .info {{ background: #f5f5f5; padding: 15px; margin: 20px 0; border-radius: 5px; }}
    </style>
</head>
<body>
    <div class="status">
        <h1>Signal Relay</h1>
        <p>Status: <strong>RUNNING</strong></p>
    </div>
    <div class="info">
        <h2>Configuration</h2>
        <p><strong>Source Channel:</strong> {}</p>
        <p><strong>Target Channel:</strong> {}</p>
        <p><strong>Keep-Alive:</strong> every {} seconds</p>
        <p><strong>Duplicate window:</strong> {} seconds, symbol cooldown {} seconds</p>
        <p><strong>Time:</strong> {}</p>
    </div>
    <div class="info">
        <h2>Counters</h2>
        <p>Received {} / Forwarded {} / Skipped {} / Suppressed {} / Send failures {}</p>
    </div>
    <div class="info">
        <h2>Features</h2>
        <ul>
            <li>Reformats complete signals containing "Leverage"</li>
            <li>Turns "Manually Cancelled #TICKER" into "/close #TICKER"</li>
            <li>Drops reposts of the same message and bursts for the same symbol</li>
            <li>Keep-alive heartbeat</li>
        </ul>
    </div>
</body>
</html>
)",
        config_.source_chat, config_.target_chat,
        config_.keepalive_interval_seconds,
        config_.dedup_retention_seconds, config_.symbol_cooldown_seconds,
        util::current_iso8601(),
        stats_.received.load(), stats_.forwarded.load(), stats_.skipped.load(),
        stats_.suppressed.load(), stats_.send_failures.load());

    res.set_content(html, "text/html");
}
