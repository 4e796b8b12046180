#include <weft/dom/event.h>
#include <weft/dom/node.h>

#include <algorithm>

namespace weft::dom {

// ---------------------------------------------------------------------------
// Event
// ---------------------------------------------------------------------------

Event::Event(const std::string& type, bool bubbles, bool cancelable)
    : type_(type)
    , bubbles_(bubbles)
    , cancelable_(cancelable) {}

// ---------------------------------------------------------------------------
// EventTarget
// ---------------------------------------------------------------------------

ListenerId EventTarget::add_event_listener(const std::string& type, EventListener listener, bool capture) {
    ListenerId id = next_id_++;
    listeners_[type].push_back(
        std::make_shared<const ListenerEntry>(ListenerEntry{id, std::move(listener), capture}));
    return id;
}

bool EventTarget::remove_event_listener(ListenerId id) {
    for (auto it = listeners_.begin(); it != listeners_.end(); ++it) {
        auto& entries = it->second;
        auto found = std::find_if(entries.begin(), entries.end(),
            [id](const ListenerRef& e) { return e->id == id; });
        if (found != entries.end()) {
            entries.erase(found);
            if (entries.empty()) {
                listeners_.erase(it);
            }
            return true;
        }
    }
    return false;
}

size_t EventTarget::listener_count(const std::string& type) const {
    auto it = listeners_.find(type);
    return it == listeners_.end() ? 0 : it->second.size();
}

std::vector<EventTarget::ListenerRef> EventTarget::listeners_for(const std::string& type,
                                                                 EventPhase phase) const {
    std::vector<ListenerRef> result;
    auto it = listeners_.find(type);
    if (it == listeners_.end()) {
        return result;
    }

    // At target: all listeners fire regardless of capture flag
    // Capturing phase: only capture listeners fire
    // Bubbling phase: only non-capture listeners fire
    for (const auto& entry : it->second) {
        if (phase == EventPhase::AtTarget ||
            (phase == EventPhase::Capturing && entry->capture) ||
            (phase == EventPhase::Bubbling && !entry->capture)) {
            result.push_back(entry);
        }
    }
    return result;
}

// ---------------------------------------------------------------------------
// Dispatch
// ---------------------------------------------------------------------------

std::vector<DispatchStep> plan_dispatch(const Event& event, const Node& target) {
    // Ancestor path from target's parent up to the root
    std::vector<const Node*> path;
    for (const Node* current = target.parent(); current; current = current->parent()) {
        path.push_back(current);
    }

    std::vector<DispatchStep> plan;
    for (auto it = path.rbegin(); it != path.rend(); ++it) {
        plan.push_back({(*it)->id(), EventPhase::Capturing,
                        (*it)->event_target().listeners_for(event.type(), EventPhase::Capturing)});
    }

    plan.push_back({target.id(), EventPhase::AtTarget,
                    target.event_target().listeners_for(event.type(), EventPhase::AtTarget)});

    if (event.bubbles()) {
        for (const Node* ancestor : path) {
            plan.push_back({ancestor->id(), EventPhase::Bubbling,
                            ancestor->event_target().listeners_for(event.type(), EventPhase::Bubbling)});
        }
    }
    return plan;
}

bool run_dispatch(Event& event, NodeId target, const std::vector<DispatchStep>& plan) {
    event.target_ = target;

    for (const auto& step : plan) {
        if (event.propagation_stopped()) break;
        event.phase_ = step.phase;
        event.current_target_ = step.node;
        for (const auto& entry : step.listeners) {
            if (event.immediate_propagation_stopped()) break;
            entry->listener(event);
        }
    }

    event.phase_ = EventPhase::None;
    event.current_target_ = kNoNode;
    return !event.default_prevented();
}

} // namespace weft::dom
