#pragma once
#include <weft/effect/cancel_token.h>
#include <weft/platform/executor.h>

#include <condition_variable>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace weft::effect {

class Scope;

enum class ExitKind {
    Pending,
    Success,
    Interrupted,
    Defect,
};

const char* exit_kind_name(ExitKind kind);

struct Exit {
    ExitKind kind = ExitKind::Pending;
    std::exception_ptr defect;
};

// A unit of concurrent work started on an Executor and stopped
// cooperatively through its CancelToken.
class Fiber : public std::enable_shared_from_this<Fiber> {
public:
    using Body = std::function<void()>;
    using ExitHandler = std::function<void(const Fiber&, const Exit&)>;

    Fiber(std::string name, CancelToken token, Body body);

    Fiber(const Fiber&) = delete;
    Fiber& operator=(const Fiber&) = delete;

    const std::string& name() const { return name_; }
    const CancelToken& token() const { return token_; }

    // Called exactly once, when the fiber reaches its exit.
    void set_exit_handler(ExitHandler handler);

    // Posts the body to `executor`. If the executor rejects it the fiber
    // exits with a defect.
    void start(platform::Executor& executor);

    void interrupt();

    // Waits for the exit. A fiber that has not started yet is marked
    // interrupted and will not run. Returns at once when called from the
    // fiber's own thread.
    void join();

    bool done() const;
    Exit exit() const;

    // Scope the fiber was handed to with Scope::add_fiber.
    void set_owner(std::weak_ptr<Scope> owner);
    std::shared_ptr<Scope> owner() const;

    // Fiber whose body is executing on the calling thread, or nullptr.
    static const Fiber* current();

private:
    enum class State { Pending, Running, Done };

    void run();
    void finish(Exit exit);

    std::string name_;
    CancelToken token_;
    Body body_;
    ExitHandler exit_handler_;
    std::weak_ptr<Scope> owner_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    State state_ = State::Pending;
    std::thread::id runner_;
    Exit exit_;
};

} // namespace weft::effect
