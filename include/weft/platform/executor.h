#pragma once
#include <functional>

namespace weft::platform {

// Somewhere a unit of work can be sent to run later.
class Executor {
public:
    using Task = std::function<void()>;

    virtual ~Executor() = default;

    // Must not run `task` inline on the calling thread.
    virtual void execute(Task task) = 0;
};

} // namespace weft::platform
