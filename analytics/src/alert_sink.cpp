#include "alert_sink.hpp"
#include <spdlog/spdlog.h>

bool LogAlertSink::publish(const AlertEvent& event) {
    spdlog::info("[ALERT] {} | {} {} | CS: {:.1f} | {}{}",
                 to_string(event.type), event.symbol, event.timeframe,
                 event.confluence_score, event.message,
                 event.persisted ? "" : " (unpersisted)");
    return true;
}
