#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace quill::core {

enum class Severity {
    Info,
    Warning,
    Error,
};

struct DiagnosticEvent {
    std::chrono::steady_clock::time_point timestamp;
    Severity severity = Severity::Info;
    std::string module;
    std::string stage;
    std::string message;
    std::string source;       // document the event refers to, if any
    std::size_t line = 0;     // 0 when the event has no source position
    std::size_t position = 0;
};

const char* severity_name(Severity severity);

std::string format_diagnostic(const DiagnosticEvent& event);

using DiagnosticObserver = std::function<void(const DiagnosticEvent&)>;

class DiagnosticEmitter {
public:
    void emit(Severity severity, const std::string& module,
              const std::string& stage, const std::string& message);
    void emit_at(Severity severity, const std::string& module,
                 const std::string& stage, const std::string& message,
                 std::size_t line, std::size_t position);

    void set_source(std::string source);
    const std::string& source() const;

    void set_min_severity(Severity min);
    Severity min_severity() const;

    void add_observer(DiagnosticObserver observer);

    const std::vector<DiagnosticEvent>& events() const;
    std::vector<DiagnosticEvent> events_by_severity(Severity severity) const;
    std::vector<DiagnosticEvent> events_by_module(const std::string& module) const;

    void clear();
    std::size_t size() const;

private:
    void record(DiagnosticEvent event);

    std::vector<DiagnosticEvent> events_;
    std::vector<DiagnosticObserver> observers_;
    std::string source_;
    Severity min_severity_ = Severity::Info;
};

}  // namespace quill::core
