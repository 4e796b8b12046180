#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace weft::core {

enum class Severity {
    Info,
    Warning,
    Error,
};

const char* severity_name(Severity severity);

struct DiagnosticEvent {
    std::chrono::steady_clock::time_point timestamp;
    Severity severity = Severity::Info;
    std::string module;
    std::string stage;
    std::string message;
    std::uint64_t correlation_id = 0;
};

std::string format_diagnostic(const DiagnosticEvent& event);

using DiagnosticObserver = std::function<void(const DiagnosticEvent&)>;

// Thread-safe structured log. Observers are called outside the lock,
// on the emitting thread.
class DiagnosticEmitter {
public:
    explicit DiagnosticEmitter(std::size_t capacity = 0);

    void emit(Severity severity, const std::string& module,
              const std::string& stage, const std::string& message);

    void set_correlation_id(std::uint64_t id);
    std::uint64_t correlation_id() const;

    void set_min_severity(Severity min);

    void add_observer(DiagnosticObserver observer);

    std::vector<DiagnosticEvent> events() const;
    std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::deque<DiagnosticEvent> events_;
    std::vector<DiagnosticObserver> observers_;
    std::size_t capacity_;
    std::uint64_t correlation_id_ = 0;
    Severity min_severity_ = Severity::Info;
};

// Diagnostic context captured at the moment a defect was reported.
struct FailureTrace {
    std::uint64_t correlation_id = 0;
    std::string module;
    std::string stage;
    std::string error_message;
    std::vector<DiagnosticEvent> context_events;

    std::string format() const;
};

// Keeps the newest `capacity` traces (config default when 0).
class FailureTraceCollector {
public:
    explicit FailureTraceCollector(std::size_t capacity = 0);

    FailureTrace capture(const DiagnosticEmitter& emitter,
                         const std::string& module,
                         const std::string& stage,
                         const std::string& error_message);

    std::vector<FailureTrace> traces() const;
    std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::deque<FailureTrace> traces_;
    std::size_t capacity_;
};

}  // namespace weft::core
