#pragma once

#include "config.hpp"
#include "health.hpp"
#include "relay.hpp"
#include <httplib.h>
#include <atomic>
#include <thread>
#include <memory>

class StatusServer {
public:
    StatusServer(const Config& config,
                 const HealthCheck& health,
                 const RelayStats& stats);
    ~StatusServer();

    void start();
    void stop();
    bool is_running() const { return running_; }

private:
    const Config& config_;
    const HealthCheck& health_;
    const RelayStats& stats_;

    std::unique_ptr<httplib::Server> server_;
    std::atomic<bool> running_{false};
    std::thread server_thread_;

    void setup_routes();
    void handle_health(const httplib::Request& req, httplib::Response& res);
    void handle_status_page(const httplib::Request& req, httplib::Response& res);
};
