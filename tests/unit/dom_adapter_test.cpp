#include <weft/dom/document.h>
#include <weft/dom/dom_adapter.h>
#include <weft/dom/dom_ops.h>

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace weft::dom;

namespace {

class DomAdapterTest : public ::testing::Test {
protected:
    void SetUp() override {
        body = adapter.create_element("body");
        ASSERT_TRUE(adapter.insert(adapter.root(), body));
    }

    Document document;
    DocumentAdapter adapter{document};
    NodeId body = kNoNode;
};

} // namespace

// ---------------------------------------------------------------------------
// 1. Create, insert, read back
// ---------------------------------------------------------------------------
TEST_F(DomAdapterTest, CreateAndInsert) {
    NodeId p = adapter.create_element("p");
    NodeId t = adapter.create_text("hello");
    EXPECT_FALSE(adapter.is_attached(p));

    ASSERT_TRUE(adapter.insert(p, t));
    ASSERT_TRUE(adapter.insert(body, p));
    EXPECT_TRUE(adapter.is_attached(t));
    EXPECT_EQ(adapter.children(body), (std::vector<NodeId>{p}));
    EXPECT_EQ(adapter.parent_of(t), p);
    EXPECT_EQ(adapter.tag_name(p), "p");
    EXPECT_EQ(adapter.text_content(body), "hello");
    EXPECT_EQ(adapter.serialize(body), "<p>hello</p>");
}

TEST_F(DomAdapterTest, InsertBeforeAndAfter) {
    NodeId a = adapter.create_element("a");
    NodeId b = adapter.create_element("b");
    NodeId c = adapter.create_element("c");

    ASSERT_TRUE(adapter.insert(body, c));
    ASSERT_TRUE(adapter.insert(body, a, c));
    ASSERT_TRUE(adapter.insert_after(body, b, a));
    EXPECT_EQ(adapter.children(body), (std::vector<NodeId>{a, b, c}));
}

// ---------------------------------------------------------------------------
// 2. Stale or invalid ids fail without side effects
// ---------------------------------------------------------------------------
TEST_F(DomAdapterTest, StaleIdsAreRejected) {
    NodeId div = adapter.create_element("div");
    ASSERT_TRUE(adapter.insert(body, div));
    ASSERT_TRUE(adapter.remove(div));

    EXPECT_FALSE(adapter.exists(div));
    EXPECT_FALSE(adapter.set_attribute(div, "x", "y"));
    EXPECT_FALSE(adapter.insert(body, div));
    EXPECT_FALSE(adapter.remove(div));
    EXPECT_EQ(adapter.add_listener(div, "click", [](Event&) {}), 0u);
}

TEST_F(DomAdapterTest, InsertRejectsCyclesAndBadReferences) {
    NodeId outer = adapter.create_element("div");
    NodeId inner = adapter.create_element("span");
    NodeId text = adapter.create_text("t");
    ASSERT_TRUE(adapter.insert(body, outer));
    ASSERT_TRUE(adapter.insert(outer, inner));

    EXPECT_FALSE(adapter.insert(inner, outer));
    EXPECT_FALSE(adapter.insert(outer, outer));
    EXPECT_FALSE(adapter.insert(text, adapter.create_element("b")));
    // `before` must be a child of the parent
    EXPECT_FALSE(adapter.insert(body, adapter.create_element("i"), inner));
}

TEST_F(DomAdapterTest, DocumentCannotBeRemoved) {
    EXPECT_FALSE(adapter.remove(adapter.root()));
    EXPECT_TRUE(adapter.exists(adapter.root()));
}

TEST_F(DomAdapterTest, RemoveForgetsWholeSubtree) {
    size_t before = adapter.node_count();
    NodeId ul = adapter.create_element("ul");
    NodeId li = adapter.create_element("li");
    NodeId text = adapter.create_text("x");
    ASSERT_TRUE(adapter.insert(li, text));
    ASSERT_TRUE(adapter.insert(ul, li));
    ASSERT_TRUE(adapter.insert(body, ul));
    EXPECT_EQ(adapter.node_count(), before + 3);

    ASSERT_TRUE(adapter.remove(ul));
    EXPECT_EQ(adapter.node_count(), before);
    EXPECT_FALSE(adapter.exists(text));
}

// ---------------------------------------------------------------------------
// 3. Attributes and text
// ---------------------------------------------------------------------------
TEST_F(DomAdapterTest, AttributesAndText) {
    NodeId div = adapter.create_element("div");
    NodeId text = adapter.create_text("a");
    ASSERT_TRUE(adapter.insert(div, text));

    EXPECT_TRUE(adapter.set_attribute(div, "title", "x"));
    EXPECT_EQ(adapter.attribute(div, "title"), "x");
    EXPECT_TRUE(adapter.remove_attribute(div, "title"));
    EXPECT_FALSE(adapter.attribute(div, "title").has_value());
    // Already absent is still success
    EXPECT_TRUE(adapter.remove_attribute(div, "title"));

    EXPECT_TRUE(adapter.set_text(text, "b"));
    EXPECT_EQ(adapter.text_content(div), "b");
    EXPECT_FALSE(adapter.set_text(div, "nope"));
    EXPECT_FALSE(adapter.set_attribute(text, "x", "y"));
}

// ---------------------------------------------------------------------------
// 4. Serialization
// ---------------------------------------------------------------------------
TEST_F(DomAdapterTest, SerializeEscapesAndHidesMarkers) {
    NodeId a = adapter.create_element("a");
    ASSERT_TRUE(adapter.set_attribute(a, "title", "x\"y"));
    ASSERT_TRUE(adapter.insert(a, adapter.create_text("1 < 2 & 3")));
    ASSERT_TRUE(adapter.insert(body, a));
    ASSERT_TRUE(adapter.insert(body, adapter.create_marker("weft:slot")));

    EXPECT_EQ(adapter.serialize(body), "<a title=\"x&quot;y\">1 &lt; 2 &amp; 3</a>");
    EXPECT_EQ(adapter.serialize(body, true, true),
              "<a title=\"x&quot;y\">1 &lt; 2 &amp; 3</a><!--weft:slot-->");
    EXPECT_EQ(adapter.serialize(a, false), "<a title=\"x&quot;y\">1 &lt; 2 &amp; 3</a>");
}

// ---------------------------------------------------------------------------
// 5. Observer sees every applied operation
// ---------------------------------------------------------------------------
TEST_F(DomAdapterTest, ObserverRecordsOperations) {
    std::vector<std::string> log;
    adapter.set_observer([&log](const DomOp& op, const OpResult& result) {
        log.push_back(std::string(op_name(op)) + (result.ok ? "" : "!"));
    });

    NodeId span = adapter.create_element("span");
    adapter.set_attribute(span, "id", "s");
    adapter.insert(body, span);
    adapter.remove(span);
    adapter.remove(span);

    EXPECT_EQ(log, (std::vector<std::string>{
        "create-element", "set-attribute", "insert", "remove", "remove!"}));
}

TEST(DomOps, Describe) {
    EXPECT_EQ(describe(op::SetAttribute{4, "title", "b"}), "set-attribute #4 title=\"b\"");
    EXPECT_EQ(describe(op::Insert{1, 2, 3}), "insert #2 into #1 before #3");
    EXPECT_EQ(describe(op::Insert{1, 2, kNoNode}), "insert #2 into #1");
    EXPECT_EQ(describe(op::Remove{9}), "remove #9");
    EXPECT_STREQ(op_name(DomOp(op::CreateMarker{"m"})), "create-marker");
}

// ---------------------------------------------------------------------------
// 6. Dispatch
// ---------------------------------------------------------------------------
TEST_F(DomAdapterTest, ListenersFireInAttachmentOrder) {
    NodeId button = adapter.create_element("button");
    ASSERT_TRUE(adapter.insert(body, button));

    std::vector<int> order;
    for (int i = 0; i < 3; ++i) {
        adapter.add_listener(button, "click", [i, &order](Event&) { order.push_back(i); });
    }

    Event event("click");
    EXPECT_TRUE(adapter.dispatch(button, event));
    EXPECT_EQ(order, (std::vector<int>{0, 1, 2}));
}

TEST_F(DomAdapterTest, ListenersMayMutateDuringDispatch) {
    NodeId button = adapter.create_element("button");
    ASSERT_TRUE(adapter.insert(body, button));

    ListenerId id = 0;
    id = adapter.add_listener(button, "click", [&](Event& e) {
        adapter.set_attribute(e.current_target(), "pressed", "yes");
        adapter.remove_listener(button, id);
    });
    ASSERT_NE(id, 0u);

    Event first("click");
    adapter.dispatch(button, first);
    EXPECT_EQ(adapter.attribute(button, "pressed"), "yes");
    EXPECT_EQ(adapter.listener_count(button, "click"), 0u);
}

TEST_F(DomAdapterTest, DispatchToUnknownNodeFails) {
    Event event("click");
    EXPECT_FALSE(adapter.dispatch(12345, event));
}
