#include <weft/core/errors.h>
#include <weft/effect/cancel_token.h>
#include <weft/effect/fiber.h>
#include <weft/effect/promise.h>
#include <weft/platform/event_loop.h>
#include <weft/platform/thread_pool.h>

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>

using namespace weft::effect;
using namespace std::chrono_literals;

// ---------------------------------------------------------------------------
// 1. CancelToken
// ---------------------------------------------------------------------------
TEST(CancelTokenTest, CopiesShareState) {
    CancelToken token;
    CancelToken copy = token;
    EXPECT_TRUE(copy == token);
    EXPECT_FALSE(CancelToken() == token);

    copy.cancel();
    EXPECT_TRUE(token.is_cancelled());
    EXPECT_THROW(token.throw_if_cancelled(), weft::Interrupted);
}

TEST(CancelTokenTest, CallbacksRunOnce) {
    CancelToken token;
    int calls = 0;
    token.on_cancel([&calls]() { ++calls; });

    token.cancel();
    token.cancel();
    EXPECT_EQ(calls, 1);
}

TEST(CancelTokenTest, LateCallbackRunsImmediately) {
    CancelToken token;
    token.cancel();

    bool ran = false;
    EXPECT_EQ(token.on_cancel([&ran]() { ran = true; }), 0u);
    EXPECT_TRUE(ran);
}

TEST(CancelTokenTest, RemovedCallbackDoesNotRun) {
    CancelToken token;
    bool ran = false;
    auto id = token.on_cancel([&ran]() { ran = true; });
    token.remove_callback(id);

    token.cancel();
    EXPECT_FALSE(ran);
}

// ---------------------------------------------------------------------------
// 2. Promise
// ---------------------------------------------------------------------------
TEST(PromiseTest, CompletedValueIsReturned) {
    Promise<int> promise;
    EXPECT_TRUE(promise.complete(7));
    EXPECT_FALSE(promise.complete(8));
    EXPECT_TRUE(promise.is_done());
    EXPECT_EQ(promise.await(CancelToken()), 7);
}

TEST(PromiseTest, FailureIsRethrown) {
    Promise<int> promise;
    promise.fail(std::make_exception_ptr(std::runtime_error("lost")));
    EXPECT_THROW(promise.await(CancelToken()), std::runtime_error);
}

TEST(PromiseTest, AwaitWakesOnCompletionFromAnotherThread) {
    Promise<std::string> promise;
    std::thread producer([promise]() mutable {
        std::this_thread::sleep_for(10ms);
        promise.complete("ready");
    });

    EXPECT_EQ(promise.await(CancelToken()), "ready");
    producer.join();
}

TEST(PromiseTest, CancellationInterruptsAwait) {
    Promise<int> promise;
    CancelToken token;
    std::thread canceller([token]() mutable {
        std::this_thread::sleep_for(10ms);
        token.cancel();
    });

    EXPECT_THROW(promise.await(token), weft::Interrupted);
    canceller.join();
    EXPECT_FALSE(promise.is_done());
}

// ---------------------------------------------------------------------------
// 3. Fiber exits
// ---------------------------------------------------------------------------
TEST(FiberTest, SuccessfulBody) {
    weft::platform::EventLoop loop;
    bool ran = false;
    auto fiber = std::make_shared<Fiber>("ok", CancelToken(), [&ran]() { ran = true; });

    ExitKind seen = ExitKind::Pending;
    fiber->set_exit_handler([&seen](const Fiber&, const Exit& exit) { seen = exit.kind; });
    fiber->start(loop);
    EXPECT_FALSE(fiber->done());

    loop.run_pending();
    EXPECT_TRUE(ran);
    EXPECT_TRUE(fiber->done());
    EXPECT_EQ(seen, ExitKind::Success);
    EXPECT_EQ(fiber->exit().kind, ExitKind::Success);
}

TEST(FiberTest, ThrowingBodyIsADefect) {
    weft::platform::EventLoop loop;
    auto fiber = std::make_shared<Fiber>("bad", CancelToken(), []() {
        throw std::runtime_error("boom");
    });
    fiber->start(loop);
    loop.run_pending();

    Exit exit = fiber->exit();
    EXPECT_EQ(exit.kind, ExitKind::Defect);
    EXPECT_EQ(weft::describe_exception(exit.defect), "boom");
    EXPECT_STREQ(exit_kind_name(exit.kind), "defect");
}

TEST(FiberTest, JoinBeforeRunSkipsBody) {
    weft::platform::EventLoop loop;
    bool ran = false;
    auto fiber = std::make_shared<Fiber>("skipped", CancelToken(), [&ran]() { ran = true; });
    fiber->start(loop);

    fiber->join();
    loop.run_pending();
    EXPECT_FALSE(ran);
    EXPECT_EQ(fiber->exit().kind, ExitKind::Interrupted);
}

TEST(FiberTest, InterruptStopsAwaitingBody) {
    weft::platform::ThreadPool pool(1);
    Promise<int> never;
    CancelToken token;
    std::atomic<bool> started{false};
    auto fiber = std::make_shared<Fiber>("waiting", token, [&, token]() {
        started = true;
        never.await(token);
    });
    fiber->start(pool);

    while (!started.load()) std::this_thread::sleep_for(1ms);
    fiber->interrupt();
    fiber->join();
    EXPECT_EQ(fiber->exit().kind, ExitKind::Interrupted);
}

TEST(FiberTest, RejectedStartIsADefect) {
    weft::platform::ThreadPool pool(1);
    pool.shutdown();
    auto fiber = std::make_shared<Fiber>("rejected", CancelToken(), []() {});
    fiber->start(pool);

    EXPECT_TRUE(fiber->done());
    EXPECT_EQ(fiber->exit().kind, ExitKind::Defect);
}
