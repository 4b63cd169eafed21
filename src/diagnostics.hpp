#pragma once
#include <nlohmann/json.hpp>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>

namespace toolgate {

class EventBus;

enum class DiagnosticLevel { Info, Warn, Error };

const char* diagnostic_level_name(DiagnosticLevel level);

// One operator-facing trace entry. meta is null when absent.
struct DiagnosticStep {
    DiagnosticLevel level = DiagnosticLevel::Info;
    std::string message;
    nlohmann::json meta;
};

void to_json(nlohmann::json& j, const DiagnosticStep& step);

// Ordered, append-only trace for a single tool call. Each step is kept for
// the result envelope and, when a bus is attached, published as a
// DiagnosticEvent.
class DiagnosticTrace {
public:
    explicit DiagnosticTrace(std::string tool_name, EventBus* bus = nullptr);

    void info(const std::string& message, nlohmann::json meta = nullptr);
    void warn(const std::string& message, nlohmann::json meta = nullptr);
    void error(const std::string& message, nlohmann::json meta = nullptr);

    const std::vector<DiagnosticStep>& steps() const { return steps_; }
    std::vector<DiagnosticStep> take() { return std::move(steps_); }
    bool empty() const { return steps_.empty(); }
    const std::string& tool_name() const { return tool_name_; }

private:
    void emit(DiagnosticLevel level, const std::string& message, nlohmann::json meta);

    std::string tool_name_;
    EventBus* bus_;
    std::vector<DiagnosticStep> steps_;
};

// Writes every published DiagnosticEvent to a stream:
//   [diag] <tool> [LEVEL] message {meta}
class DiagnosticLogger {
public:
    explicit DiagnosticLogger(EventBus& bus);
    DiagnosticLogger(EventBus& bus, std::ostream& out);
    ~DiagnosticLogger();

    DiagnosticLogger(const DiagnosticLogger&) = delete;
    DiagnosticLogger& operator=(const DiagnosticLogger&) = delete;

    void set_quiet(bool quiet) { quiet_ = quiet; }

private:
    EventBus& bus_;
    std::ostream& out_;
    uint64_t subscription_ = 0;
    bool quiet_ = false;
};

} // namespace toolgate
