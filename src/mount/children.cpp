#include <weft/mount/children.h>
#include <weft/core/config.h>

#include <algorithm>
#include <stdexcept>
#include <string>

namespace weft::mount {

std::shared_ptr<Children> Children::make() {
    return std::shared_ptr<Children>(new Children());
}

// ---------------------------------------------------------------------------
// render
// ---------------------------------------------------------------------------

Modifier<Unit> Children::render() {
    auto self = shared_from_this();
    return Modifier<Unit>([self](const MountContext& ctx) {
        bool again;
        {
            std::lock_guard lock(self->mutex_);
            again = self->rendered_;
            self->rendered_ = true;
        }
        if (again) {
            ctx.runtime->log(core::Severity::Warning, "children", "render", "mounted twice");
            throw UsageError("Children::render mounted twice");
        }

        auto scope = ctx.scope->fork("children");
        std::weak_ptr<Children> weak = self;
        if (!scope->add_finalizer([weak]() {
                if (auto children = weak.lock()) {
                    std::lock_guard lock(children->mutex_);
                    children->entries_.clear();
                    children->scope_.reset();
                    children->runtime_ = nullptr;
                }
            })) {
            throw Interrupted();
        }

        NodeId start = ctx.within(scope).mount_node(
            dom::op::CreateMarker{core::config::kChildrenMarker});

        std::lock_guard lock(self->mutex_);
        self->runtime_ = ctx.runtime;
        self->scope_ = scope;
        self->parent_ = ctx.point.parent;
        self->start_ = start;
        return Unit{};
    });
}

// ---------------------------------------------------------------------------
// child
// ---------------------------------------------------------------------------

Children::Destroy Children::child(Creator creator, std::optional<size_t> position) {
    std::shared_ptr<effect::Scope> scope;
    effect::Runtime* runtime = nullptr;
    NodeId parent = kNoNode;
    NodeId marker = kNoNode;
    bool anchored = false;
    std::string failure;
    {
        std::lock_guard lock(mutex_);
        if (!rendered_) {
            throw UsageError("Children::child called before render");
        }
        if (!scope_) {
            throw ScopeClosedError("children scope is closed");
        }
        runtime = runtime_;
        parent = parent_;
        scope = scope_->fork("child");

        std::uint64_t key = next_key_++;
        std::weak_ptr<Children> weak = weak_from_this();
        // Registered first so it runs after the child's own finalizers.
        if (!scope->add_finalizer([weak, key]() {
                if (auto children = weak.lock()) children->forget(key);
            })) {
            throw ScopeClosedError("children scope is closed");
        }

        size_t index = std::min(position.value_or(entries_.size()), entries_.size());
        NodeId anchor = index == 0 ? start_ : entries_[index - 1].marker;

        dom::DomAdapter* adapter = &runtime->dom();
        marker = effect::acquire_release(*scope,
            [adapter]() { return adapter->create_marker(core::config::kChildMarker); },
            [adapter](NodeId id) { if (id != kNoNode) adapter->remove(id); });
        anchored = marker != kNoNode && adapter->insert_after(parent, marker, anchor);
        if (anchored) {
            entries_.insert(entries_.begin() + static_cast<std::ptrdiff_t>(index),
                            Entry{key, scope, marker});
        } else {
            failure = "children anchor #" + std::to_string(anchor) + " is gone";
        }
    }

    if (!anchored) {
        runtime->report_close("children", "child", scope->close());
        throw std::runtime_error(failure);
    }

    // The creator may call destroy or child() itself, so no lock from here.
    Destroy destroy = make_destroy(scope);
    MountContext ctx{runtime, MountPoint{parent, marker}, scope};
    try {
        creator(destroy).run(ctx);
    } catch (const Interrupted&) {
        // destroyed while mounting
        runtime->report_close("children", "child", scope->close());
    } catch (...) {
        runtime->report_close("children", "child", scope->close());
        throw;
    }
    return destroy;
}

Children::Destroy Children::make_destroy(std::weak_ptr<effect::Scope> scope) const {
    return [scope]() {
        if (auto live = scope.lock()) {
            live->close().rethrow_if_failed("child destroy");
        }
    };
}

void Children::forget(std::uint64_t key) {
    std::lock_guard lock(mutex_);
    std::erase_if(entries_, [key](const Entry& entry) { return entry.key == key; });
}

size_t Children::size() const {
    std::lock_guard lock(mutex_);
    return entries_.size();
}

bool Children::is_rendered() const {
    std::lock_guard lock(mutex_);
    return rendered_;
}

} // namespace weft::mount
