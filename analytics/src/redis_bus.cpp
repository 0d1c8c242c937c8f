#include "redis_bus.hpp"
#include <spdlog/spdlog.h>
#include <sw/redis++/redis++.h>
#include <algorithm>
#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace {
    constexpr std::chrono::milliseconds kInitialBackoff(1000);
    constexpr std::chrono::milliseconds kMaxBackoff(30000);

    long long epoch_millis(std::chrono::system_clock::time_point tp) {
        return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
    }
}

class RedisBus::Impl {
public:
    explicit Impl(const Config& config) : config_(config) {
        open();
    }

    ~Impl() {
        close();
    }

    bool open() {
        last_attempt_ = std::chrono::steady_clock::now();
        try {
            auto client = std::make_unique<sw::redis::Redis>(config_.redis_url);
            client->ping();
            client_ = std::move(client);
            failed_attempts_ = 0;
            backoff_ = kInitialBackoff;
            spdlog::info("Alert stream {} ready on {}", config_.stream_alerts, config_.redis_url);
            return true;
        } catch (const sw::redis::Error& e) {
            client_.reset();
            ++failed_attempts_;
            backoff_ = std::min(backoff_ * 2, kMaxBackoff);
            spdlog::error("Redis connection to {} failed (attempt {}): {}",
                          config_.redis_url, failed_attempts_, e.what());
            return false;
        }
    }

    void close() {
        if (client_) {
            client_.reset();
            spdlog::info("Closed Redis connection to {}", config_.redis_url);
        }
    }

    bool healthy() const {
        if (!client_) {
            return false;
        }
        try {
            client_->ping();
            return true;
        } catch (const sw::redis::Error& e) {
            spdlog::debug("Redis ping failed: {}", e.what());
            return false;
        }
    }

    // Reconnects at most once per backoff window
    bool ready() {
        if (healthy()) {
            return true;
        }
        if (std::chrono::steady_clock::now() - last_attempt_ < backoff_) {
            return false;
        }
        return open();
    }

    bool append(const AlertEvent& event) {
        if (!ready()) {
            spdlog::warn("{} alert for {} not streamed: Redis unavailable", to_string(event.type), event.symbol);
            return false;
        }

        std::vector<std::pair<std::string, std::string>> fields = {
            {"data", event.to_json().dump()},
            {"type", to_string(event.type)},
            {"symbol", event.symbol},
            {"timestamp", std::to_string(epoch_millis(event.timestamp))}
        };

        try {
            std::string id;
            if (config_.stream_maxlen > 0) {
                id = client_->xadd(config_.stream_alerts, "*", fields.begin(), fields.end(),
                                   config_.stream_maxlen, true);
            } else {
                id = client_->xadd(config_.stream_alerts, "*", fields.begin(), fields.end());
            }
            spdlog::debug("Streamed {} alert for {} to {} as {}",
                          to_string(event.type), event.symbol, config_.stream_alerts, id);
            return true;
        } catch (const sw::redis::Error& e) {
            spdlog::error("XADD to {} failed: {}", config_.stream_alerts, e.what());
            return false;
        }
    }

private:
    const Config& config_;
    std::unique_ptr<sw::redis::Redis> client_;

    std::chrono::steady_clock::time_point last_attempt_;
    std::chrono::milliseconds backoff_ = kInitialBackoff;
    int failed_attempts_ = 0;
};

RedisBus::RedisBus(const Config& config) : impl_(std::make_unique<Impl>(config)) {}

RedisBus::~RedisBus() = default;

bool RedisBus::connect() {
    return impl_->open();
}

void RedisBus::disconnect() {
    impl_->close();
}

bool RedisBus::is_connected() const {
    return impl_->healthy();
}

bool RedisBus::ensure_connection() {
    return impl_->ready();
}

bool RedisBus::publish(const AlertEvent& event) {
    return impl_->append(event);
}
