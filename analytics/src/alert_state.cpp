#include "alert_state.hpp"
#include <filesystem>
#include <fstream>
#include <functional>
#include <utility>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

std::unique_lock<std::mutex> AlertStateStore::lock(const AlertKey& key) {
    std::size_t stripe = std::hash<std::string>{}(key.serialize()) % kLockStripes;
    return std::unique_lock<std::mutex>(key_locks_[stripe]);
}

JsonFileAlertStateStore::JsonFileAlertStateStore(std::string path, bool write_through)
    : path_(std::move(path)), write_through_(write_through) {
    load();
}

void JsonFileAlertStateStore::load() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();

    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        spdlog::info("No alert state at {}; starting empty", path_);
        return;
    }

    std::ifstream in(path_);
    if (!in.is_open()) {
        spdlog::warn("Cannot read alert state {}; starting empty", path_);
        return;
    }

    json doc;
    try {
        in >> doc;
    } catch (const json::parse_error& e) {
        spdlog::warn("Corrupt alert state {} ({}); starting empty", path_, e.what());
        return;
    }

    auto alerts = doc.find("alerts");
    if (!doc.is_object() || alerts == doc.end() || !alerts->is_object()) {
        spdlog::warn("Alert state {} has no 'alerts' object; starting empty", path_);
        return;
    }

    std::size_t skipped = 0;
    for (auto it = alerts->begin(); it != alerts->end(); ++it) {
        auto key = AlertKey::parse(it.key());
        auto state = AlertState::from_json(it.value());
        if (!key || !state) {
            ++skipped;
            continue;
        }
        entries_[key->serialize()] = Entry{*key, *state};
    }

    if (skipped > 0) {
        spdlog::warn("Skipped {} malformed record(s) in alert state {}", skipped, path_);
    }
    spdlog::info("Loaded {} alert state record(s) from {}", entries_.size(), path_);
}

std::optional<AlertState> JsonFileAlertStateStore::get(const AlertKey& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key.serialize());
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second.state;
}

bool JsonFileAlertStateStore::put(const AlertKey& key, const AlertState& state) {
    std::lock_guard<std::mutex> lock(mutex_);

    const std::string id = key.serialize();
    auto previous = entries_.find(id);
    std::optional<Entry> rollback;
    if (previous != entries_.end()) {
        rollback = previous->second;
    }

    entries_[id] = Entry{key, state};
    dirty_ = true;

    if (!write_through_) {
        return true;
    }

    if (write_locked()) {
        return true;
    }

    // Keep the store exactly as it was after the last successful put
    if (rollback) {
        entries_[id] = *rollback;
    } else {
        entries_.erase(id);
    }
    return false;
}

bool JsonFileAlertStateStore::erase(const AlertKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = entries_.find(key.serialize());
    if (it == entries_.end()) {
        return true;
    }

    Entry removed = it->second;
    entries_.erase(it);
    dirty_ = true;

    if (!write_through_ || write_locked()) {
        return true;
    }

    entries_[key.serialize()] = removed;
    return false;
}

bool JsonFileAlertStateStore::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!dirty_) {
        return true;
    }
    return write_locked();
}

std::size_t JsonFileAlertStateStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

bool JsonFileAlertStateStore::write_locked() {
    json alerts = json::object();
    for (const auto& [id, entry] : entries_) {
        json record = entry.state.to_json();
        record["symbol"] = entry.key.symbol;
        record["timeframe"] = entry.key.timeframe;
        record["alert_type"] = to_string(entry.key.type);
        alerts[id] = record;
    }

    json doc = {
        {"version", 1},
        {"alerts", alerts}
    };

    const std::string tmp_path = path_ + ".tmp";
    {
        std::ofstream out(tmp_path, std::ios::trunc);
        if (!out.is_open()) {
            spdlog::error("Cannot open {} for writing alert state", tmp_path);
            return false;
        }
        out << doc.dump(2) << '\n';
        out.flush();
        if (!out.good()) {
            spdlog::error("Failed writing alert state to {}", tmp_path);
            return false;
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp_path, path_, ec);
    if (ec) {
        spdlog::error("Failed to replace alert state {}: {}", path_, ec.message());
        std::filesystem::remove(tmp_path, ec);
        return false;
    }

    dirty_ = false;
    return true;
}
