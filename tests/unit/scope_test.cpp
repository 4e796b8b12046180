#include <weft/core/errors.h>
#include <weft/dom/document.h>
#include <weft/dom/dom_adapter.h>
#include <weft/effect/runtime.h>
#include <weft/effect/promise.h>
#include <weft/effect/scope.h>
#include <weft/platform/event_loop.h>
#include <weft/platform/thread_pool.h>

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace weft::effect;
using namespace std::chrono_literals;

// ---------------------------------------------------------------------------
// 1. Finalizers run once, most recent first
// ---------------------------------------------------------------------------
TEST(ScopeTest, FinalizersRunInReverseOrder) {
    auto scope = Scope::open();
    std::vector<int> order;
    for (int i = 0; i < 3; ++i) {
        EXPECT_TRUE(scope->add_finalizer([i, &order]() { order.push_back(i); }));
    }
    EXPECT_EQ(scope->finalizer_count(), 3u);

    EXPECT_TRUE(scope->close().ok());
    EXPECT_EQ(order, (std::vector<int>{2, 1, 0}));
    EXPECT_TRUE(scope->is_closed());
}

TEST(ScopeTest, SecondCloseIsNoOp) {
    auto scope = Scope::open();
    int calls = 0;
    scope->add_finalizer([&calls]() { ++calls; });

    scope->close();
    auto again = scope->close();
    EXPECT_TRUE(again.ok());
    EXPECT_EQ(calls, 1);
}

// ---------------------------------------------------------------------------
// 2. Children close before the parent's finalizers, newest child first
// ---------------------------------------------------------------------------
TEST(ScopeTest, ChildrenCloseBeforeOwnFinalizers) {
    auto parent = Scope::open("parent");
    std::vector<std::string> order;
    parent->add_finalizer([&order]() { order.push_back("parent"); });

    auto a = parent->fork("a");
    auto b = parent->fork("b");
    a->add_finalizer([&order]() { order.push_back("a"); });
    b->add_finalizer([&order]() { order.push_back("b"); });
    EXPECT_EQ(parent->child_count(), 2u);

    parent->close();
    EXPECT_EQ(order, (std::vector<std::string>{"b", "a", "parent"}));
    EXPECT_TRUE(a->is_closed());
    EXPECT_TRUE(b->is_closed());
}

TEST(ScopeTest, ClosedChildIsForgotten) {
    auto parent = Scope::open();
    auto child = parent->fork("child");
    EXPECT_EQ(child->parent(), parent);

    child->close();
    EXPECT_EQ(parent->child_count(), 0u);
    EXPECT_TRUE(parent->is_open());
}

TEST(ScopeTest, CloseCancelsWholeSubtree) {
    auto parent = Scope::open();
    auto child = parent->fork();
    auto grandchild = child->fork();
    CancelToken token = grandchild->token();

    parent->close();
    EXPECT_TRUE(token.is_cancelled());
    EXPECT_EQ(grandchild->label(), "root");
}

// ---------------------------------------------------------------------------
// 3. Failing finalizers are collected, not fatal
// ---------------------------------------------------------------------------
TEST(ScopeTest, FinalizerFailuresAreCollected) {
    auto parent = Scope::open();
    auto child = parent->fork();
    bool last_ran = false;

    parent->add_finalizer([&last_ran]() { last_ran = true; });
    parent->add_finalizer([]() { throw std::runtime_error("parent finalizer"); });
    child->add_finalizer([]() { throw std::logic_error("child finalizer"); });

    CloseResult result = parent->close();
    EXPECT_TRUE(last_ran);
    ASSERT_EQ(result.defects.size(), 2u);
    EXPECT_EQ(result.messages(), (std::vector<std::string>{"child finalizer", "parent finalizer"}));

    try {
        result.rethrow_if_failed("teardown");
        FAIL() << "expected DefectError";
    } catch (const weft::DefectError& e) {
        EXPECT_EQ(e.causes().size(), 2u);
        EXPECT_NE(std::string(e.what()).find("teardown"), std::string::npos);
    }
}

// ---------------------------------------------------------------------------
// 4. Registration on a closed scope
// ---------------------------------------------------------------------------
TEST(ScopeTest, ClosedScopeRejectsRegistration) {
    auto scope = Scope::open();
    scope->close();

    EXPECT_FALSE(scope->add_finalizer([]() {}));
    EXPECT_THROW(scope->fork(), weft::ScopeClosedError);
}

TEST(ScopeTest, AcquireReleaseOnClosedScopeReleasesAtOnce) {
    auto scope = Scope::open();
    std::vector<std::string> log;

    int handle = acquire_release(*scope,
        [&log]() { log.push_back("acquire"); return 1; },
        [&log](int) { log.push_back("release"); });
    EXPECT_EQ(handle, 1);
    scope->close();
    EXPECT_EQ(log, (std::vector<std::string>{"acquire", "release"}));

    log.clear();
    EXPECT_THROW(acquire_release(*scope,
        [&log]() { log.push_back("acquire"); return 2; },
        [&log](int) { log.push_back("release"); }), weft::Interrupted);
    EXPECT_EQ(log, (std::vector<std::string>{"acquire", "release"}));
}

TEST(ScopeTest, ReentrantCloseFromFinalizerReturns) {
    auto scope = Scope::open();
    bool inner_ok = false;
    scope->add_finalizer([&]() { inner_ok = scope->close().ok(); });

    scope->close();
    EXPECT_TRUE(inner_ok);
}

// ---------------------------------------------------------------------------
// 5. Runtime: fibers owned by scopes
// ---------------------------------------------------------------------------
namespace {

class RuntimeTest : public ::testing::Test {
protected:
    weft::dom::Document document;
    weft::dom::DocumentAdapter adapter{document};
    weft::platform::ThreadPool pool{2};
    Runtime runtime{adapter, pool};
};

} // namespace

TEST_F(RuntimeTest, CloseInterruptsAndJoinsFibers) {
    auto scope = Scope::open();
    Promise<int> never;
    std::atomic<bool> started{false};
    std::atomic<bool> finished{false};
    CancelToken token = scope->token();

    runtime.fork(*scope, "waiter", [&, token]() {
        started = true;
        try {
            never.await(token);
        } catch (const weft::Interrupted&) {
            finished = true;
            throw;
        }
    });
    while (!started.load()) std::this_thread::sleep_for(1ms);

    scope->close();
    EXPECT_TRUE(finished.load());
    EXPECT_TRUE(runtime.wait_idle(1000ms));
    EXPECT_EQ(runtime.defect_count(), 0u);
}

TEST_F(RuntimeTest, FiberDefectIsReported) {
    auto scope = Scope::open();
    runtime.fork(*scope, "broken", []() { throw std::runtime_error("render failed"); });

    ASSERT_TRUE(runtime.wait_idle(1000ms));
    auto defects = runtime.defects();
    ASSERT_EQ(defects.size(), 1u);
    EXPECT_EQ(defects[0].module, "fiber");
    EXPECT_EQ(defects[0].stage, "broken");
    EXPECT_EQ(defects[0].message, "render failed");
    EXPECT_EQ(runtime.failure_traces().size(), 1u);
    auto events = runtime.diagnostics().events();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].severity, weft::core::Severity::Error);
    scope->close();
}

TEST_F(RuntimeTest, ForkOnClosedScopeThrows) {
    auto scope = Scope::open();
    scope->close();
    bool ran = false;

    EXPECT_THROW(runtime.fork(*scope, "late", [&ran]() { ran = true; }), weft::Interrupted);
    EXPECT_TRUE(runtime.wait_idle(1000ms));
    EXPECT_FALSE(ran);
    EXPECT_EQ(runtime.active_fibers(), 0u);
}

TEST_F(RuntimeTest, FiberMayCloseItsOwnScope) {
    auto scope = Scope::open();
    std::atomic<bool> finalized{false};
    scope->add_finalizer([&finalized]() { finalized = true; });

    runtime.fork(*scope, "self-close", [scope]() { scope->close(); });
    ASSERT_TRUE(runtime.wait_idle(1000ms));
    EXPECT_TRUE(finalized.load());
    EXPECT_TRUE(scope->is_closed());
}

TEST_F(RuntimeTest, DescendantFiberMayCloseAncestorBeingClosed) {
    auto scope = Scope::open();
    auto leaf = scope->fork("middle")->fork("leaf");
    std::atomic<bool> started{false};
    std::atomic<bool> returned{false};

    runtime.fork(*leaf, "closer", [&started, &returned, scope]() {
        started = true;
        std::this_thread::sleep_for(50ms);
        scope->close();
        returned = true;
    });
    while (!started.load()) std::this_thread::sleep_for(1ms);

    EXPECT_TRUE(scope->close().ok());
    EXPECT_TRUE(returned.load());
    EXPECT_TRUE(scope->is_closed());
    EXPECT_TRUE(runtime.wait_idle(1000ms));
    EXPECT_EQ(runtime.defect_count(), 0u);
}

TEST(RuntimeLogTest, VerboseRuntimeLogsFiberLifecycle) {
    weft::dom::Document document;
    weft::dom::DocumentAdapter adapter(document);
    weft::platform::EventLoop loop;
    RuntimeOptions options;
    options.verbose = true;
    options.correlation_id = 5;
    Runtime runtime(adapter, loop, options);

    auto scope = Scope::open();
    runtime.fork(*scope, "quiet", []() {});
    loop.run_pending();

    auto events = runtime.diagnostics().events();
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].module, "fiber");
    EXPECT_EQ(events[0].stage, "start");
    EXPECT_EQ(events[1].stage, "exit");
    EXPECT_EQ(events[1].correlation_id, 5u);
    scope->close();
}

TEST(RuntimeLogTest, DefectRecordsAreCapped) {
    weft::dom::Document document;
    weft::dom::DocumentAdapter adapter(document);
    weft::platform::EventLoop loop;
    RuntimeOptions options;
    options.record_capacity = 3;
    Runtime runtime(adapter, loop, options);

    for (int i = 0; i < 10; ++i) {
        runtime.report_defect("binding", "text",
            std::make_exception_ptr(std::runtime_error("failure " + std::to_string(i))));
    }

    EXPECT_EQ(runtime.defect_count(), 10u);
    auto defects = runtime.defects();
    ASSERT_EQ(defects.size(), 3u);
    EXPECT_EQ(defects.front().message, "failure 7");
    EXPECT_EQ(defects.back().message, "failure 9");
    EXPECT_EQ(runtime.failure_traces().size(), 3u);
    EXPECT_EQ(runtime.diagnostics().size(), 3u);
}
