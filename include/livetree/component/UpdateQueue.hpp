#pragma once

#include <cstddef>
#include <functional>
#include <string>

namespace LT {

/**
 * Serializes component updates on one thread.
 *
 * Every update takes a Ticket. The first ticket taken while nothing is in
 * flight becomes the owner and, when finished, drains the queue in FIFO
 * order, including closures scheduled while draining. Other tickets are
 * passive. Closures are never run from schedule() itself.
 *
 * The queue is thread-local, created on first use and alive until the thread
 * exits.
 */
class UpdateQueue {
public:
    using Closure = std::function<void()>;

    class Ticket {
    public:
        Ticket();
        // An owner unwinding without finish() clears the in-flight flag and
        // leaves pending closures for the next owner.
        ~Ticket();

        Ticket(Ticket const&)            = delete;
        Ticket& operator=(Ticket const&) = delete;

        [[nodiscard]] auto is_owner() const -> bool { return owner_; }

        // Owner: drains the queue, then clears the in-flight flag. No-op for
        // other tickets and on repeated calls.
        auto finish() -> void;

    private:
        bool owner_    = false;
        bool finished_ = false;
    };

    static auto schedule(Closure closure) -> void;

    [[nodiscard]] static auto pending() -> std::size_t;
    // True while an owner ticket is alive.
    [[nodiscard]] static auto in_flight() -> bool;
    [[nodiscard]] static auto draining() -> bool;
};

namespace detail {
// Component-layer trace output, compiled away without LT_LOG_DEBUG.
auto trace_component(std::string const& message) -> void;
} // namespace detail

} // namespace LT
