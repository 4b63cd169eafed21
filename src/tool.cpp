#include "tool.hpp"

namespace toolgate {

void to_json(nlohmann::json& j, const ToolResult& result) {
    j = nlohmann::json{
        {"ok", result.ok},
        {"content", result.content}
    };
    if (result.error) j["error"] = *result.error;
    if (result.diagnostic_steps) j["diagnostic_steps"] = *result.diagnostic_steps;
}

const char* tool_error_kind_name(ToolErrorKind kind) {
    switch (kind) {
        case ToolErrorKind::PathNotAllowed:     return "PathNotAllowed";
        case ToolErrorKind::RootNotConfigured:  return "RootNotConfigured";
        case ToolErrorKind::InvalidArg:         return "InvalidArg";
        case ToolErrorKind::UnknownTool:        return "UnknownTool";
        case ToolErrorKind::Network:            return "Network";
        case ToolErrorKind::CommandFailed:      return "CommandFailed";
        case ToolErrorKind::Io:                 return "Io";
        case ToolErrorKind::CapabilityDisabled: return "CapabilityDisabled";
        case ToolErrorKind::Unsupported:        return "Unsupported";
    }
    return "Unknown";
}

static std::string render(ToolErrorKind kind, const std::string& detail) {
    switch (kind) {
        case ToolErrorKind::PathNotAllowed:     return "Path not allowed: " + detail;
        case ToolErrorKind::RootNotConfigured:  return "Root not configured";
        case ToolErrorKind::InvalidArg:         return "Invalid argument: " + detail;
        case ToolErrorKind::UnknownTool:        return "Tool not found: " + detail;
        case ToolErrorKind::Network:            return "Network: " + detail;
        case ToolErrorKind::CommandFailed:      return "Command execution failed: " + detail;
        case ToolErrorKind::Io:                 return "IO: " + detail;
        case ToolErrorKind::CapabilityDisabled: return "Capability disabled: " + detail;
        case ToolErrorKind::Unsupported:        return "Unsupported: " + detail;
    }
    return detail;
}

ToolError::ToolError(ToolErrorKind kind, const std::string& detail)
    : std::runtime_error(render(kind, detail)), kind_(kind), detail_(detail) {}

const char* tool_risk_name(ToolRisk risk) {
    switch (risk) {
        case ToolRisk::ReadOnly: return "read_only";
        case ToolRisk::Write:    return "write";
        case ToolRisk::Network:  return "network";
        case ToolRisk::Low:      return "low";
        case ToolRisk::High:     return "high";
    }
    return "high";
}

void to_json(nlohmann::json& j, const ToolDefinition& def) {
    j = nlohmann::json{
        {"id", def.id},
        {"name", def.name},
        {"description", def.description},
        {"scope", def.scope},
        {"risk", tool_risk_name(def.risk)}
    };
    if (!def.json_schema.is_null()) j["json_schema"] = def.json_schema;
}

} // namespace toolgate
