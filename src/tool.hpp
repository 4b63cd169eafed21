#pragma once
#include "diagnostics.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace toolgate {

// Uniform result envelope. ok == false iff error is set.
struct ToolResult {
    bool ok = false;
    std::string content;
    std::optional<std::string> error;
    std::optional<std::vector<DiagnosticStep>> diagnostic_steps;

    static ToolResult success(std::string content) {
        ToolResult r;
        r.ok = true;
        r.content = std::move(content);
        return r;
    }

    static ToolResult failure(std::string error) {
        ToolResult r;
        r.error = std::move(error);
        return r;
    }
};

void to_json(nlohmann::json& j, const ToolResult& result);

enum class ToolErrorKind {
    PathNotAllowed,
    RootNotConfigured,
    InvalidArg,
    UnknownTool,
    Network,
    CommandFailed,
    Io,
    CapabilityDisabled,
    Unsupported,
};

const char* tool_error_kind_name(ToolErrorKind kind);

// Raised by tool handlers; the dispatcher turns it into a ToolResult.
class ToolError : public std::runtime_error {
public:
    ToolError(ToolErrorKind kind, const std::string& detail = {});

    ToolErrorKind kind() const { return kind_; }
    const std::string& detail() const { return detail_; }

private:
    ToolErrorKind kind_;
    std::string detail_;
};

enum class ToolRisk { ReadOnly, Write, Network, Low, High };

const char* tool_risk_name(ToolRisk risk);

struct ToolDefinition {
    std::string id;          // capability group
    std::string name;        // unique tool identifier
    std::string description;
    std::string scope;       // human-readable boundary statement
    ToolRisk risk = ToolRisk::ReadOnly;
    nlohmann::json json_schema;
};

void to_json(nlohmann::json& j, const ToolDefinition& def);

} // namespace toolgate
