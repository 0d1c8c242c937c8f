#include "analytics_service.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <thread>

AnalyticsService::AnalyticsService(const Config& config)
    : AnalyticsService(config, std::make_unique<JsonFileAlertStateStore>(
                                   config.alerts.state_file, config.alerts.state_write_through)) {}

AnalyticsService::AnalyticsService(const Config& config, std::unique_ptr<AlertStateStore> store)
    : config_(config),
      weights_(config_.regime_weights),
      regime_classifier_(config_.regimes),
      scoring_engine_(weights_),
      store_(std::move(store)),
      evaluator_(config_.alerts, *store_) {}

void AnalyticsService::add_sink(std::shared_ptr<AlertSink> sink) {
    if (sink) {
        sinks_.push_back(std::move(sink));
    }
}

CycleReport AnalyticsService::run_cycle(const CycleInput& input) {
    return run_cycle(input, input.timestamp);
}

CycleReport AnalyticsService::run_cycle(const CycleInput& input, std::chrono::system_clock::time_point now) {
    CycleReport report = run_cycle_steps(input, now);

    // A request is consumed by the cycle it arrived in
    cancel_requested_ = false;
    return report;
}

CycleReport AnalyticsService::run_cycle_steps(const CycleInput& input, std::chrono::system_clock::time_point now) {
    CycleReport report;
    report.regime = regime_classifier_.classify(input.market_health);

    spdlog::info("Scan cycle started: {} symbol(s), regime {} (confidence {:.2f})",
                 input.symbols.size(), to_string(report.regime.label), report.regime.confidence);

    auto scored = score_symbols(input.symbols, report.regime, now, report.failed_symbols);
    report.failed_symbols += input.rejected_symbols;

    if (cancel_requested_) {
        spdlog::warn("Scan cycle cancelled during scoring; discarding {} bundle(s)", scored.size());
        report.cancelled = true;
        return report;
    }

    for (auto& bundle : scored) {
        if (bundle) {
            report.bundles.push_back(std::move(*bundle));
        }
    }

    // Alert decisions are applied single-threaded, in input order. Until the
    // cycle is committed every touched key can be restored.
    evaluator_.begin_cycle();
    for (const auto& bundle : report.bundles) {
        if (cancel_requested_) {
            break;
        }
        auto events = evaluator_.evaluate(bundle, now);
        for (auto& event : events) {
            report.events.push_back(std::move(event));
        }
    }

    if (!cancel_requested_ && config_.alerts.regime_change_scope == RegimeChangeScope::Global) {
        auto regime_event = evaluator_.evaluate_regime(report.regime, now);
        if (regime_event) {
            report.events.push_back(std::move(*regime_event));
        }
    }

    if (cancel_requested_) {
        spdlog::warn("Scan cycle cancelled during alert evaluation; discarding {} alert(s)", report.events.size());
        report.cancelled = true;
        report.bundles.clear();
        report.events.clear();
        if (!evaluator_.rollback_cycle()) {
            report.warnings.push_back("Alert state of the cancelled cycle could not be fully rolled back");
        }
        return report;
    }
    evaluator_.commit_cycle();

    report.state_flushed = flush_state(report);
    dispatch(report);

    if (report.failed_symbols > 0) {
        report.warnings.push_back(fmt::format("{} symbol(s) failed to score or were rejected", report.failed_symbols));
    }

    spdlog::info("Scan cycle finished: {} bundle(s), {} alert(s), {} dispatched",
                 report.bundles.size(), report.events.size(), report.dispatched);
    return report;
}

std::vector<std::optional<ScoreBundle>> AnalyticsService::score_symbols(
    const std::vector<SymbolInput>& symbols,
    const Regime& regime,
    std::chrono::system_clock::time_point now,
    std::size_t& failed) {

    std::vector<std::optional<ScoreBundle>> results(symbols.size());
    std::atomic<std::size_t> next{0};
    std::atomic<std::size_t> failures{0};

    auto worker = [&]() {
        while (!cancel_requested_) {
            std::size_t i = next.fetch_add(1);
            if (i >= symbols.size()) {
                break;
            }
            try {
                results[i] = scoring_engine_.build_bundle(symbols[i], regime, now);
            } catch (const std::exception& e) {
                // One bad symbol never blocks the rest of the cycle
                failures.fetch_add(1);
                spdlog::error("Error scoring {} {}: {}", symbols[i].symbol, symbols[i].timeframe, e.what());
            }
        }
    };

    std::size_t thread_count = std::min<std::size_t>(
        static_cast<std::size_t>(std::max(1, config_.thread_pool_size)), symbols.size());

    if (thread_count <= 1) {
        worker();
    } else {
        std::vector<std::thread> threads;
        threads.reserve(thread_count);
        for (std::size_t t = 0; t < thread_count; ++t) {
            threads.emplace_back(worker);
        }
        for (auto& thread : threads) {
            thread.join();
        }
    }

    failed = failures.load();
    return results;
}

bool AnalyticsService::flush_state(CycleReport& report) {
    if (store_->flush()) {
        return true;
    }

    spdlog::warn("Alert state flush failed, retrying once");
    if (store_->flush()) {
        return true;
    }

    // Deliver anyway; duplicate suppression resumes once the store is healthy
    report.warnings.push_back("Alert state could not be persisted this cycle");
    for (auto& event : report.events) {
        event.persisted = false;
    }
    spdlog::warn("Alert state could not be persisted; {} alert(s) flagged unpersisted", report.events.size());
    return false;
}

void AnalyticsService::dispatch(CycleReport& report) {
    for (const auto& event : report.events) {
        bool delivered = false;
        for (const auto& sink : sinks_) {
            try {
                if (sink->publish(event)) {
                    delivered = true;
                } else {
                    spdlog::error("Sink {} rejected {} alert for {}", sink->name(),
                                  to_string(event.type), event.symbol);
                }
            } catch (const std::exception& e) {
                spdlog::error("Sink {} failed for {} alert on {}: {}", sink->name(),
                              to_string(event.type), event.symbol, e.what());
            }
        }
        if (delivered) {
            ++report.dispatched;
        }
    }
}
