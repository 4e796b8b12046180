#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace weft::dom {

class Node;

using NodeId = std::uint64_t;
inline constexpr NodeId kNoNode = 0;

using ListenerId = std::uint64_t;

enum class EventPhase {
    None = 0,
    Capturing = 1,
    AtTarget = 2,
    Bubbling = 3
};

class Event {
public:
    explicit Event(const std::string& type, bool bubbles = true, bool cancelable = true);

    const std::string& type() const { return type_; }
    NodeId target() const { return target_; }
    NodeId current_target() const { return current_target_; }
    EventPhase phase() const { return phase_; }
    bool bubbles() const { return bubbles_; }
    bool cancelable() const { return cancelable_; }

    void stop_propagation() { propagation_stopped_ = true; }
    void stop_immediate_propagation() { immediate_propagation_stopped_ = true; propagation_stopped_ = true; }
    void prevent_default() { if (cancelable_) default_prevented_ = true; }

    bool propagation_stopped() const { return propagation_stopped_; }
    bool immediate_propagation_stopped() const { return immediate_propagation_stopped_; }
    bool default_prevented() const { return default_prevented_; }

    // Free-form payload, e.g. the value of an input event.
    const std::string& detail() const { return detail_; }
    void set_detail(const std::string& detail) { detail_ = detail; }

    // Set by the dispatch mechanism while the event propagates.
    std::string type_;
    NodeId target_ = kNoNode;
    NodeId current_target_ = kNoNode;
    EventPhase phase_ = EventPhase::None;

private:
    bool bubbles_;
    bool cancelable_;
    bool propagation_stopped_ = false;
    bool immediate_propagation_stopped_ = false;
    bool default_prevented_ = false;
    std::string detail_;
};

class EventTarget {
public:
    using EventListener = std::function<void(Event&)>;

    struct ListenerEntry {
        ListenerId id;
        EventListener listener;
        bool capture;
    };
    using ListenerRef = std::shared_ptr<const ListenerEntry>;

    // Listeners of one type fire in the order they were added.
    ListenerId add_event_listener(const std::string& type, EventListener listener, bool capture = false);
    bool remove_event_listener(ListenerId id);
    size_t listener_count(const std::string& type) const;

    // Listeners that fire for `type` in `phase`. The returned entries stay
    // valid even if they are removed while the event is being delivered.
    std::vector<ListenerRef> listeners_for(const std::string& type, EventPhase phase) const;

private:
    std::unordered_map<std::string, std::vector<ListenerRef>> listeners_;
    ListenerId next_id_ = 1;
};

// One hop of a dispatch: the node, the phase and the listeners to call.
struct DispatchStep {
    NodeId node = kNoNode;
    EventPhase phase = EventPhase::None;
    std::vector<EventTarget::ListenerRef> listeners;
};

// Capture -> target -> bubble plan for `event` aimed at `target`.
std::vector<DispatchStep> plan_dispatch(const Event& event, const Node& target);

// Invokes a plan built by plan_dispatch, honoring stop_propagation.
// Returns false if the default action was prevented.
bool run_dispatch(Event& event, NodeId target, const std::vector<DispatchStep>& plan);

} // namespace weft::dom
