#pragma once

#include "alert_sink.hpp"
#include "config.hpp"
#include "types.hpp"
#include <memory>

// Publishes alerts to a Redis stream for the notification dispatcher
class RedisBus : public AlertSink {
public:
    explicit RedisBus(const Config& config);
    ~RedisBus() override;

    // Connection management
    bool connect();
    void disconnect();
    bool is_connected() const;
    bool ensure_connection();

    bool publish(const AlertEvent& event) override;
    const char* name() const override { return "redis"; }

    // Non-copyable
    RedisBus(const RedisBus&) = delete;
    RedisBus& operator=(const RedisBus&) = delete;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};
