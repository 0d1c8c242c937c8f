#pragma once

#include "types.hpp"
#include <array>
#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>

// Durable last-alert state per (symbol, timeframe, alert_type).
//
// put() is the only mutation and is atomic per key: a failed put leaves the
// previous record in place. Callers that read-modify-write a key must hold
// lock(key) for the whole sequence.
class AlertStateStore {
public:
    virtual ~AlertStateStore() = default;

    virtual std::optional<AlertState> get(const AlertKey& key) const = 0;
    virtual bool put(const AlertKey& key, const AlertState& state) = 0;

    // Drops the record so the key is back in its "no prior alert" phase
    virtual bool erase(const AlertKey& key) = 0;

    // Durable persistence point
    virtual bool flush() = 0;

    virtual std::size_t size() const = 0;

    std::unique_lock<std::mutex> lock(const AlertKey& key);

private:
    static constexpr std::size_t kLockStripes = 64;
    std::array<std::mutex, kLockStripes> key_locks_;
};

// Pretty-printed JSON file, rewritten atomically (temp file + rename).
// A missing or corrupt file degrades to an empty store.
class JsonFileAlertStateStore : public AlertStateStore {
public:
    explicit JsonFileAlertStateStore(std::string path, bool write_through = false);

    std::optional<AlertState> get(const AlertKey& key) const override;
    bool put(const AlertKey& key, const AlertState& state) override;
    bool erase(const AlertKey& key) override;
    bool flush() override;
    std::size_t size() const override;

    const std::string& path() const { return path_; }

    // Non-copyable
    JsonFileAlertStateStore(const JsonFileAlertStateStore&) = delete;
    JsonFileAlertStateStore& operator=(const JsonFileAlertStateStore&) = delete;

private:
    struct Entry {
        AlertKey key;
        AlertState state;
    };

    void load();
    bool write_locked();

    std::string path_;
    bool write_through_;
    mutable std::mutex mutex_;
    std::map<std::string, Entry> entries_;
    bool dirty_ = false;
};
