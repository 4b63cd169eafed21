#include "diagnostics.hpp"
#include "event.hpp"
#include "event_bus.hpp"
#include "util.hpp"
#include <iostream>

namespace toolgate {

const char* diagnostic_level_name(DiagnosticLevel level) {
    switch (level) {
        case DiagnosticLevel::Info:  return "INFO";
        case DiagnosticLevel::Warn:  return "WARN";
        case DiagnosticLevel::Error: return "ERROR";
    }
    return "INFO";
}

void to_json(nlohmann::json& j, const DiagnosticStep& step) {
    j = nlohmann::json{
        {"level", diagnostic_level_name(step.level)},
        {"message", step.message}
    };
    if (!step.meta.is_null()) j["meta"] = step.meta;
}

// ── DiagnosticTrace ─────────────────────────────────────────────

DiagnosticTrace::DiagnosticTrace(std::string tool_name, EventBus* bus)
    : tool_name_(std::move(tool_name)), bus_(bus) {}

void DiagnosticTrace::info(const std::string& message, nlohmann::json meta) {
    emit(DiagnosticLevel::Info, message, std::move(meta));
}

void DiagnosticTrace::warn(const std::string& message, nlohmann::json meta) {
    emit(DiagnosticLevel::Warn, message, std::move(meta));
}

void DiagnosticTrace::error(const std::string& message, nlohmann::json meta) {
    emit(DiagnosticLevel::Error, message, std::move(meta));
}

void DiagnosticTrace::emit(DiagnosticLevel level, const std::string& message,
                           nlohmann::json meta) {
    steps_.push_back(DiagnosticStep{level, message, std::move(meta)});
    if (!bus_) return;

    DiagnosticEvent ev;
    ev.tool_name = tool_name_;
    ev.step = steps_.back();
    ev.timestamp_ms = epoch_millis();
    bus_->publish(ev);
}

// ── DiagnosticLogger ────────────────────────────────────────────

DiagnosticLogger::DiagnosticLogger(EventBus& bus)
    : DiagnosticLogger(bus, std::cerr) {}

DiagnosticLogger::DiagnosticLogger(EventBus& bus, std::ostream& out)
    : bus_(bus), out_(out) {
    subscription_ = subscribe<DiagnosticEvent>(bus_,
        [this](const DiagnosticEvent& ev) {
            if (quiet_) return;
            out_ << "[diag] " << ev.tool_name << " ["
                 << diagnostic_level_name(ev.step.level) << "] " << ev.step.message;
            if (!ev.step.meta.is_null()) out_ << ' ' << ev.step.meta.dump();
            out_ << '\n';
        });
}

DiagnosticLogger::~DiagnosticLogger() {
    bus_.unsubscribe(subscription_);
}

} // namespace toolgate
