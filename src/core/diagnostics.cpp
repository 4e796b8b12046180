#include <weft/core/diagnostics.h>
#include <weft/core/config.h>

#include <sstream>

namespace weft::core {

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
    oss << "[" << severity_name(event.severity) << "]";
    if (!event.module.empty()) {
        oss << " " << event.module;
    }
    if (!event.stage.empty()) {
        oss << "/" << event.stage;
    }
    if (event.correlation_id != 0) {
        oss << " (cid:" << event.correlation_id << ")";
    }
    oss << ": " << event.message;
    return oss.str();
}

DiagnosticEmitter::DiagnosticEmitter(std::size_t capacity)
    : capacity_(capacity == 0 ? config::kMaxDiagnosticEvents : capacity) {}

void DiagnosticEmitter::emit(Severity severity, const std::string& module,
                             const std::string& stage, const std::string& message) {
    DiagnosticEvent event;
    std::vector<DiagnosticObserver> observers;
    {
        std::lock_guard lock(mutex_);
        if (severity < min_severity_) {
            return;
        }

        event.timestamp = std::chrono::steady_clock::now();
        event.severity = severity;
        event.module = module;
        event.stage = stage;
        event.message = message;
        event.correlation_id = correlation_id_;

        events_.push_back(event);
        while (events_.size() > capacity_) {
            events_.pop_front();
        }
        observers = observers_;
    }

    for (const auto& observer : observers) {
        observer(event);
    }
}

void DiagnosticEmitter::set_correlation_id(std::uint64_t id) {
    std::lock_guard lock(mutex_);
    correlation_id_ = id;
}

std::uint64_t DiagnosticEmitter::correlation_id() const {
    std::lock_guard lock(mutex_);
    return correlation_id_;
}

void DiagnosticEmitter::set_min_severity(Severity min) {
    std::lock_guard lock(mutex_);
    min_severity_ = min;
}

void DiagnosticEmitter::add_observer(DiagnosticObserver observer) {
    std::lock_guard lock(mutex_);
    observers_.push_back(std::move(observer));
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events() const {
    std::lock_guard lock(mutex_);
    return {events_.begin(), events_.end()};
}

std::size_t DiagnosticEmitter::size() const {
    std::lock_guard lock(mutex_);
    return events_.size();
}

std::string FailureTrace::format() const {
    std::ostringstream oss;
    oss << "FailureTrace";
    if (correlation_id != 0) {
        oss << " (cid:" << correlation_id << ")";
    }
    oss << "\n";
    oss << "  module: " << module << "\n";
    oss << "  stage: " << stage << "\n";
    oss << "  error: " << error_message << "\n";
    if (!context_events.empty()) {
        oss << "  context_events: " << context_events.size() << "\n";
    }
    return oss.str();
}

FailureTraceCollector::FailureTraceCollector(std::size_t capacity)
    : capacity_(capacity == 0 ? config::kMaxDiagnosticEvents : capacity) {}

FailureTrace FailureTraceCollector::capture(const DiagnosticEmitter& emitter,
                                            const std::string& module,
                                            const std::string& stage,
                                            const std::string& error_message) {
    FailureTrace trace;
    trace.correlation_id = emitter.correlation_id();
    trace.module = module;
    trace.stage = stage;
    trace.error_message = error_message;
    trace.context_events = emitter.events();

    std::lock_guard lock(mutex_);
    traces_.push_back(trace);
    while (traces_.size() > capacity_) {
        traces_.pop_front();
    }
    return trace;
}

std::vector<FailureTrace> FailureTraceCollector::traces() const {
    std::lock_guard lock(mutex_);
    return {traces_.begin(), traces_.end()};
}

std::size_t FailureTraceCollector::size() const {
    std::lock_guard lock(mutex_);
    return traces_.size();
}

}  // namespace weft::core
