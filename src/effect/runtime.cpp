#include <weft/effect/runtime.h>
#include <weft/core/config.h>

namespace weft::effect {

Runtime::Runtime(dom::DomAdapter& dom, platform::Executor& executor, RuntimeOptions options)
    : dom_(dom)
    , executor_(executor)
    , options_(options)
    , diagnostics_(options.record_capacity)
    , failures_(options.record_capacity)
    , record_capacity_(options.record_capacity == 0 ? core::config::kMaxDiagnosticEvents
                                                    : options.record_capacity) {
    diagnostics_.set_min_severity(options_.min_severity);
    diagnostics_.set_correlation_id(options_.correlation_id);
}

std::shared_ptr<Fiber> Runtime::fork(Scope& owner, const std::string& name, Fiber::Body body) {
    auto fiber = std::make_shared<Fiber>(name, owner.token(), std::move(body));
    fiber->set_exit_handler([this](const Fiber& f, const Exit& exit) { on_fiber_exit(f, exit); });

    {
        std::lock_guard lock(mutex_);
        ++active_fibers_;
    }
    if (!owner.add_fiber(fiber)) {
        // Never started: settle it so the active count stays balanced
        fiber->join();
        throw Interrupted();
    }

    if (options_.verbose) {
        log(core::Severity::Info, "fiber", "start", name);
    }
    fiber->start(executor_);
    return fiber;
}

void Runtime::report_defect(const std::string& module, const std::string& stage,
                            std::exception_ptr error) {
    std::string message = describe_exception(error);
    diagnostics_.emit(core::Severity::Error, module, stage, message);
    failures_.capture(diagnostics_, module, stage, message);

    std::lock_guard lock(mutex_);
    defects_.push_back({module, stage, message, std::move(error)});
    ++defects_reported_;
    while (defects_.size() > record_capacity_) {
        defects_.pop_front();
    }
}

void Runtime::report_close(const std::string& module, const std::string& stage,
                           const CloseResult& result) {
    if (result.ok()) return;
    log(core::Severity::Warning, module, stage,
        std::to_string(result.defects.size()) + " defect(s) while closing");
    for (const auto& defect : result.defects) {
        report_defect(module, stage, defect);
    }
}

std::vector<DefectRecord> Runtime::defects() const {
    std::lock_guard lock(mutex_);
    return {defects_.begin(), defects_.end()};
}

size_t Runtime::defect_count() const {
    std::lock_guard lock(mutex_);
    return defects_reported_;
}

size_t Runtime::active_fibers() const {
    std::lock_guard lock(mutex_);
    return active_fibers_;
}

bool Runtime::wait_idle(std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    return idle_cv_.wait_for(lock, timeout, [this]() { return active_fibers_ == 0; });
}

void Runtime::log(core::Severity severity, const std::string& module,
                  const std::string& stage, const std::string& message) {
    diagnostics_.emit(severity, module, stage, message);
}

void Runtime::on_fiber_exit(const Fiber& fiber, const Exit& exit) {
    if (exit.kind == ExitKind::Defect) {
        report_defect("fiber", fiber.name(), exit.defect);
    } else if (options_.verbose) {
        log(core::Severity::Info, "fiber", "exit",
            fiber.name() + ": " + exit_kind_name(exit.kind));
    }

    {
        std::lock_guard lock(mutex_);
        --active_fibers_;
    }
    idle_cv_.notify_all();
}

} // namespace weft::effect
