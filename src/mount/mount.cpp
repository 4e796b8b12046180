#include <weft/mount/mount.h>

namespace weft::mount {

MountHandle::MountHandle(effect::Runtime& runtime, std::shared_ptr<effect::Scope> scope)
    : runtime_(&runtime)
    , scope_(std::move(scope)) {}

MountHandle::~MountHandle() {
    if (scope_) {
        runtime_->report_close("mount", "destroy", scope_->close());
    }
}

MountHandle::MountHandle(MountHandle&& other) noexcept
    : runtime_(other.runtime_)
    , scope_(std::move(other.scope_)) {}

MountHandle& MountHandle::operator=(MountHandle&& other) noexcept {
    if (this != &other) {
        if (scope_) {
            runtime_->report_close("mount", "destroy", scope_->close());
        }
        runtime_ = other.runtime_;
        scope_ = std::move(other.scope_);
    }
    return *this;
}

effect::CloseResult MountHandle::close() {
    if (!scope_) return {};
    return scope_->close();
}

bool MountHandle::is_open() const {
    return scope_ && scope_->is_open();
}

} // namespace weft::mount
