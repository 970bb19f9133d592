#include <livetree/component/UpdateQueue.hpp>

#include "log/TaggedLogger.hpp"

#include <deque>
#include <utility>

namespace LT {

namespace {

struct QueueState {
    std::deque<UpdateQueue::Closure> closures;
    bool                             in_flight = false;
    bool                             draining  = false;
};

auto queue_state() -> QueueState& {
    thread_local QueueState state;
    return state;
}

} // namespace

UpdateQueue::Ticket::Ticket() {
    auto& state = queue_state();
    if (!state.in_flight) {
        state.in_flight = true;
        owner_          = true;
    }
}

UpdateQueue::Ticket::~Ticket() {
    if (owner_ && !finished_) {
        auto& state = queue_state();
        state.in_flight = false;
        state.draining  = false;
        if (!state.closures.empty()) {
            lt_log("update owner left early, " + std::to_string(state.closures.size()) + " updates stay queued", "Scheduler", "WARN");
        }
    }
}

auto UpdateQueue::Ticket::finish() -> void {
    if (!owner_ || finished_) {
        return;
    }
    auto& state    = queue_state();
    state.draining = true;
    std::size_t ran = 0;
    while (!state.closures.empty()) {
        auto closure = std::move(state.closures.front());
        state.closures.pop_front();
        closure();
        ++ran;
    }
    if (ran > 0) {
        lt_log("drained " + std::to_string(ran) + " deferred updates", "Scheduler");
    }
    state.draining  = false;
    state.in_flight = false;
    finished_       = true;
}

auto UpdateQueue::schedule(Closure closure) -> void {
    auto& state = queue_state();
    state.closures.push_back(std::move(closure));
    lt_log("deferred update queued, " + std::to_string(state.closures.size()) + " pending", "Scheduler");
}

auto UpdateQueue::pending() -> std::size_t {
    return queue_state().closures.size();
}

auto UpdateQueue::in_flight() -> bool {
    return queue_state().in_flight;
}

auto UpdateQueue::draining() -> bool {
    return queue_state().draining;
}

namespace detail {

auto trace_component(std::string const& message) -> void {
    lt_log(message, "Component");
}

} // namespace detail

} // namespace LT
