#include <weft/core/diagnostics.h>
#include <weft/core/errors.h>

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

using namespace weft::core;

// ---------------------------------------------------------------------------
// 1. Emitting and filtering
// ---------------------------------------------------------------------------
TEST(DiagnosticEmitterTest, EmitRecordsEvents) {
    DiagnosticEmitter emitter;
    emitter.emit(Severity::Info, "mount", "create", "div");
    emitter.emit(Severity::Error, "fiber", "slot", "boom");

    ASSERT_EQ(emitter.size(), 2u);
    auto events = emitter.events();
    EXPECT_EQ(events[0].module, "mount");
    EXPECT_EQ(events[1].severity, Severity::Error);
    EXPECT_EQ(events[1].stage, "slot");
}

TEST(DiagnosticEmitterTest, MinSeverityDropsLowerEvents) {
    DiagnosticEmitter emitter;
    emitter.set_min_severity(Severity::Warning);
    emitter.emit(Severity::Info, "a", "b", "dropped");
    emitter.emit(Severity::Warning, "a", "b", "kept");

    ASSERT_EQ(emitter.size(), 1u);
    EXPECT_EQ(emitter.events()[0].message, "kept");
}

TEST(DiagnosticEmitterTest, CapacityKeepsNewest) {
    DiagnosticEmitter emitter(3);
    for (int i = 0; i < 5; ++i) {
        emitter.emit(Severity::Info, "m", "s", std::to_string(i));
    }

    auto events = emitter.events();
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events.front().message, "2");
    EXPECT_EQ(events.back().message, "4");
}

TEST(DiagnosticEmitterTest, ObserversSeeEveryEmittedEvent) {
    DiagnosticEmitter emitter;
    std::vector<std::string> seen;
    emitter.add_observer([&seen](const DiagnosticEvent& e) { seen.push_back(e.message); });

    emitter.emit(Severity::Warning, "m", "s", "one");
    emitter.emit(Severity::Error, "m", "s", "two");
    EXPECT_EQ(seen, (std::vector<std::string>{"one", "two"}));
}

// ---------------------------------------------------------------------------
// 2. Formatting
// ---------------------------------------------------------------------------
TEST(DiagnosticFormatTest, FormatsModuleStageAndCorrelation) {
    DiagnosticEvent event;
    event.severity = Severity::Error;
    event.module = "alternative";
    event.stage = "render";
    event.message = "failed";
    EXPECT_EQ(format_diagnostic(event), "[error] alternative/render: failed");

    event.correlation_id = 7;
    EXPECT_EQ(format_diagnostic(event), "[error] alternative/render (cid:7): failed");
}

// ---------------------------------------------------------------------------
// 3. Failure traces carry the context at capture time
// ---------------------------------------------------------------------------
TEST(FailureTraceTest, CaptureSnapshotsContext) {
    DiagnosticEmitter emitter;
    emitter.set_correlation_id(42);
    emitter.emit(Severity::Info, "mount", "create", "div");

    FailureTraceCollector collector;
    FailureTrace trace = collector.capture(emitter, "children", "child", "creator threw");

    EXPECT_EQ(collector.size(), 1u);
    EXPECT_EQ(trace.correlation_id, 42u);
    EXPECT_EQ(trace.context_events.size(), 1u);

    std::string text = trace.format();
    EXPECT_NE(text.find("(cid:42)"), std::string::npos);
    EXPECT_NE(text.find("error: creator threw"), std::string::npos);
    EXPECT_NE(text.find("context_events: 1"), std::string::npos);
}

TEST(FailureTraceTest, CollectorKeepsNewest) {
    DiagnosticEmitter emitter;
    FailureTraceCollector collector(2);
    for (int i = 0; i < 4; ++i) {
        collector.capture(emitter, "binding", "text", "failure " + std::to_string(i));
    }

    auto traces = collector.traces();
    ASSERT_EQ(traces.size(), 2u);
    EXPECT_EQ(traces[0].error_message, "failure 2");
    EXPECT_EQ(traces[1].error_message, "failure 3");
}

// ---------------------------------------------------------------------------
// 4. Error helpers
// ---------------------------------------------------------------------------
TEST(ErrorsTest, DescribeException) {
    EXPECT_EQ(weft::describe_exception(nullptr), "no exception");
    EXPECT_EQ(weft::describe_exception(std::make_exception_ptr(std::runtime_error("x"))), "x");
    EXPECT_EQ(weft::describe_exception(std::make_exception_ptr(weft::Interrupted())), "interrupted");
    EXPECT_EQ(weft::describe_exception(std::make_exception_ptr(42)), "non-standard exception");
}

TEST(ErrorsTest, DefectErrorKeepsCauses) {
    std::vector<std::exception_ptr> causes{
        std::make_exception_ptr(std::runtime_error("a")),
        std::make_exception_ptr(std::logic_error("b")),
    };
    weft::DefectError error("close failed", causes);
    EXPECT_STREQ(error.what(), "close failed");
    EXPECT_EQ(error.causes().size(), 2u);
}
