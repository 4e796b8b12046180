#pragma once
#include <weft/mount/modifier.h>

#include <memory>
#include <utility>

namespace weft::mount {

// Owner of a top-level mount. Closing it (or destroying it) removes
// everything the modifier created.
class MountHandle {
public:
    MountHandle(effect::Runtime& runtime, std::shared_ptr<effect::Scope> scope);
    ~MountHandle();

    MountHandle(MountHandle&& other) noexcept;
    MountHandle& operator=(MountHandle&& other) noexcept;
    MountHandle(const MountHandle&) = delete;
    MountHandle& operator=(const MountHandle&) = delete;

    // Idempotent; later calls return an empty result.
    effect::CloseResult close();

    bool is_open() const;
    const std::shared_ptr<effect::Scope>& scope() const { return scope_; }

private:
    effect::Runtime* runtime_;
    std::shared_ptr<effect::Scope> scope_;
};

// Runs `modifier` under a fresh root scope, inserting under `parent` before
// `before` (or last). On failure everything already mounted is removed and
// the exception propagates.
template<typename T>
MountHandle mount(effect::Runtime& runtime, NodeId parent, const Modifier<T>& modifier,
                  NodeId before = kNoNode) {
    auto scope = effect::Scope::open("mount");
    MountHandle handle(runtime, scope);
    try {
        modifier.run(MountContext{&runtime, MountPoint{parent, before}, scope});
    } catch (...) {
        runtime.report_close("mount", "rollback", handle.close());
        throw;
    }
    return handle;
}

} // namespace weft::mount
