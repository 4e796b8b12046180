#pragma once
#include <weft/mount/modifier.h>

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace weft::mount {

// Dynamic, ordered set of independently scoped children.
//
// render() is mounted once and marks where the children live. Each call to
// child() adds one entry after the existing ones (or at an ordinal
// position); the entry stays until its Destroy hook runs or the render
// scope closes.
//
// DOM layout: [start marker] [child 0 content] [child 0 marker] [child 1 ...
class Children : public std::enable_shared_from_this<Children> {
public:
    using Destroy = std::function<void()>;
    using Creator = std::function<Modifier<Unit>(Destroy)>;

    static std::shared_ptr<Children> make();

    Children(const Children&) = delete;
    Children& operator=(const Children&) = delete;

    // Throws UsageError when mounted a second time.
    Modifier<Unit> render();

    // Mounts creator(destroy) as a new entry and returns its Destroy hook.
    // Throws UsageError before render(), ScopeClosedError after the render
    // scope closed. If the creator or its modifier throws, the entry is
    // removed again and the exception propagates.
    Destroy child(Creator creator, std::optional<size_t> position = std::nullopt);

    size_t size() const;
    bool is_rendered() const;

private:
    Children() = default;

    struct Entry {
        std::uint64_t key = 0;
        std::shared_ptr<effect::Scope> scope;
        NodeId marker = kNoNode;
    };

    Destroy make_destroy(std::weak_ptr<effect::Scope> scope) const;
    void forget(std::uint64_t key);

    mutable std::mutex mutex_;
    bool rendered_ = false;
    effect::Runtime* runtime_ = nullptr;
    std::shared_ptr<effect::Scope> scope_;
    NodeId parent_ = kNoNode;
    NodeId start_ = kNoNode;
    std::vector<Entry> entries_;
    std::uint64_t next_key_ = 1;
};

} // namespace weft::mount
