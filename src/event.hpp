#pragma once
#include "diagnostics.hpp"
#include "tool.hpp"
#include <string>
#include <cstdint>

namespace toolgate {

// Tag-based event dispatch. No RTTI, no dynamic_cast.
// Events are stack-allocated structs; never deleted through base pointer.

struct Event {
    const char* type_tag;
};

// ── Event tags ──────────────────────────────────────────────────

namespace event_tags {
    constexpr const char* ToolCallRequest = "ToolCallRequest";
    constexpr const char* ToolCallResult  = "ToolCallResult";
    constexpr const char* Diagnostic      = "Diagnostic";
} // namespace event_tags

// ── Event structs ───────────────────────────────────────────────

struct ToolCallRequestEvent : Event {
    static constexpr const char* TAG = event_tags::ToolCallRequest;
    std::string tool_name;
    std::string arguments;

    ToolCallRequestEvent() { type_tag = TAG; }
};

struct ToolCallResultEvent : Event {
    static constexpr const char* TAG = event_tags::ToolCallResult;
    std::string tool_name;
    bool ok = false;
    std::string error;
    uint64_t duration_ms = 0;

    ToolCallResultEvent() { type_tag = TAG; }
};

struct DiagnosticEvent : Event {
    static constexpr const char* TAG = event_tags::Diagnostic;
    std::string tool_name;
    DiagnosticStep step;
    uint64_t timestamp_ms = 0;

    DiagnosticEvent() { type_tag = TAG; }
};

} // namespace toolgate
