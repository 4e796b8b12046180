#include <weft/mount/modifier.h>

#include <stdexcept>

namespace weft::mount {

NodeId MountContext::mount_node(dom::DomOp create) const {
    checkpoint();
    dom::DomAdapter* adapter = &dom();
    NodeId node = effect::acquire_release(*scope,
        [adapter, &create]() { return adapter->apply(std::move(create)).node; },
        [adapter](NodeId id) { adapter->remove(id); });
    if (node == kNoNode) {
        fail_mutation("node creation failed");
    }

    checkpoint();
    if (!adapter->insert(point.parent, node, point.before)) {
        fail_mutation("mount point #" + std::to_string(point.parent) + " is gone");
    }
    return node;
}

void MountContext::fail_mutation(const std::string& what) const {
    checkpoint();
    throw std::runtime_error(what);
}

Modifier<Unit> sequence(std::vector<Modifier<Unit>> modifiers) {
    return Modifier<Unit>([modifiers = std::move(modifiers)](const MountContext& ctx) {
        for (const auto& modifier : modifiers) {
            modifier.run(ctx);
        }
        return Unit{};
    });
}

void report_stream_failure(effect::Runtime& runtime, const std::string& module,
                           const std::string& stage, std::exception_ptr error) {
    try {
        std::rethrow_exception(error);
    } catch (const Interrupted&) {
        // subscriber is being torn down
    } catch (...) {
        runtime.report_defect(module, stage, std::current_exception());
    }
}

Modifier<Unit> perform(std::function<void(const MountContext&)> effect) {
    return Modifier<Unit>([effect = std::move(effect)](const MountContext& ctx) {
        ctx.checkpoint();
        effect(ctx);
        return Unit{};
    });
}

} // namespace weft::mount
