#pragma once
#include <weft/core/diagnostics.h>
#include <weft/dom/dom_adapter.h>
#include <weft/effect/fiber.h>
#include <weft/effect/scope.h>
#include <weft/platform/executor.h>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <exception>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace weft::effect {

struct RuntimeOptions {
    // Log fiber start/exit at Info
    bool verbose = false;
    core::Severity min_severity = core::Severity::Info;
    std::uint64_t correlation_id = 0;
    // Diagnostic events, failure traces and defect records kept; the
    // config default when 0
    std::size_t record_capacity = 0;
};

struct DefectRecord {
    std::string module;
    std::string stage;
    std::string message;
    std::exception_ptr error;
};

// Execution context threaded through every Modifier: the DOM boundary,
// where forked work runs, and where defects and diagnostics go.
// Must outlive every scope whose fibers it started.
class Runtime {
public:
    Runtime(dom::DomAdapter& dom, platform::Executor& executor, RuntimeOptions options = {});

    Runtime(const Runtime&) = delete;
    Runtime& operator=(const Runtime&) = delete;

    dom::DomAdapter& dom() { return dom_; }
    platform::Executor& executor() { return executor_; }
    core::DiagnosticEmitter& diagnostics() { return diagnostics_; }
    const core::DiagnosticEmitter& diagnostics() const { return diagnostics_; }
    const RuntimeOptions& options() const { return options_; }

    // Starts `body` as a fiber owned by `owner`. Throws weft::Interrupted
    // if `owner` is already closing.
    std::shared_ptr<Fiber> fork(Scope& owner, const std::string& name, Fiber::Body body);

    // Escalation point for failures that have no synchronous caller.
    void report_defect(const std::string& module, const std::string& stage,
                       std::exception_ptr error);

    // Reports every defect of a close result (no-op when ok).
    void report_close(const std::string& module, const std::string& stage,
                      const CloseResult& result);

    // Newest defects, at most record_capacity of them
    std::vector<DefectRecord> defects() const;
    // Every defect reported so far, including dropped records
    size_t defect_count() const;
    std::vector<core::FailureTrace> failure_traces() const { return failures_.traces(); }

    size_t active_fibers() const;

    // Blocks until no fiber started by this runtime is still running.
    bool wait_idle(std::chrono::milliseconds timeout);

    void log(core::Severity severity, const std::string& module,
             const std::string& stage, const std::string& message);

private:
    void on_fiber_exit(const Fiber& fiber, const Exit& exit);

    dom::DomAdapter& dom_;
    platform::Executor& executor_;
    RuntimeOptions options_;
    core::DiagnosticEmitter diagnostics_;
    core::FailureTraceCollector failures_;

    mutable std::mutex mutex_;
    std::condition_variable idle_cv_;
    size_t active_fibers_ = 0;
    std::deque<DefectRecord> defects_;
    size_t defects_reported_ = 0;
    size_t record_capacity_;
};

} // namespace weft::effect
