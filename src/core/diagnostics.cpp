#include "quill/core/diagnostics.h"

#include <sstream>

namespace quill::core {

const char* severity_name(Severity severity) {
    switch (severity) {
        case Severity::Info:    return "info";
        case Severity::Warning: return "warning";
        case Severity::Error:   return "error";
    }
    return "unknown";
}

std::string format_diagnostic(const DiagnosticEvent& event) {
    std::ostringstream oss;
    if (!event.source.empty()) {
        oss << event.source;
        if (event.line != 0) {
            oss << ":" << event.line;
        }
        oss << ": ";
    } else if (event.line != 0) {
        oss << "line " << event.line << ": ";
    }
    oss << "[" << severity_name(event.severity) << "]";
    if (!event.module.empty()) {
        oss << " " << event.module;
    }
    if (!event.stage.empty()) {
        oss << "/" << event.stage;
    }
    oss << ": " << event.message;
    return oss.str();
}

void DiagnosticEmitter::emit(Severity severity, const std::string& module,
                             const std::string& stage, const std::string& message) {
    emit_at(severity, module, stage, message, 0, 0);
}

void DiagnosticEmitter::emit_at(Severity severity, const std::string& module,
                                const std::string& stage, const std::string& message,
                                std::size_t line, std::size_t position) {
    if (severity < min_severity_) {
        return;
    }

    DiagnosticEvent event;
    event.timestamp = std::chrono::steady_clock::now();
    event.severity = severity;
    event.module = module;
    event.stage = stage;
    event.message = message;
    event.source = source_;
    event.line = line;
    event.position = position;
    record(std::move(event));
}

void DiagnosticEmitter::record(DiagnosticEvent event) {
    events_.push_back(std::move(event));
    for (const auto& observer : observers_) {
        observer(events_.back());
    }
}

void DiagnosticEmitter::set_source(std::string source) {
    source_ = std::move(source);
}

const std::string& DiagnosticEmitter::source() const {
    return source_;
}

void DiagnosticEmitter::set_min_severity(Severity min) {
    min_severity_ = min;
}

Severity DiagnosticEmitter::min_severity() const {
    return min_severity_;
}

void DiagnosticEmitter::add_observer(DiagnosticObserver observer) {
    observers_.push_back(std::move(observer));
}

const std::vector<DiagnosticEvent>& DiagnosticEmitter::events() const {
    return events_;
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events_by_severity(Severity severity) const {
    std::vector<DiagnosticEvent> result;
    for (const auto& e : events_) {
        if (e.severity == severity) {
            result.push_back(e);
        }
    }
    return result;
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events_by_module(const std::string& module) const {
    std::vector<DiagnosticEvent> result;
    for (const auto& e : events_) {
        if (e.module == module) {
            result.push_back(e);
        }
    }
    return result;
}

void DiagnosticEmitter::clear() {
    events_.clear();
}

std::size_t DiagnosticEmitter::size() const {
    return events_.size();
}

}  // namespace quill::core
