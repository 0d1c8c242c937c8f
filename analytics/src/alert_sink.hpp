#pragma once

#include "types.hpp"

// Channel-agnostic consumer of the ordered AlertEvent sequence
class AlertSink {
public:
    virtual ~AlertSink() = default;

    virtual bool publish(const AlertEvent& event) = 0;
    virtual const char* name() const = 0;
};

// Writes each alert through the default spdlog logger
class LogAlertSink : public AlertSink {
public:
    bool publish(const AlertEvent& event) override;
    const char* name() const override { return "log"; }
};
