#pragma once

#include <livetree/component/Checklist.hpp>
#include <livetree/component/UpdateQueue.hpp>
#include <livetree/core/Error.hpp>
#include <livetree/dom/ElementStatus.hpp>
#include <livetree/dom/Nodes.hpp>
#include <livetree/platform/Document.hpp>
#include <livetree/platform/LiveNode.hpp>
#include <livetree/render/Render.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace LT {

enum class MountStatus {
    Never,
    Mounted,
    Unmounted,
    PermanentlyMounted,
};

constexpr auto to_string(MountStatus status) -> std::string_view {
    switch (status) {
    case MountStatus::Never:
        return "Never";
    case MountStatus::Mounted:
        return "Mounted";
    case MountStatus::Unmounted:
        return "Unmounted";
    case MountStatus::PermanentlyMounted:
        return "PermanentlyMounted";
    }
    return "Unknown";
}

template <typename C>
class Comp;

namespace detail {

// Normalizes what a mutator returns (nothing, ShouldRender or a Checklist)
// into a Checklist.
template <typename C, typename Fn, typename... Args>
auto invoke_mutator(Fn& fn, C& state, Args&&... args) -> Checklist<C> {
    using Result = std::invoke_result_t<Fn&, C&, Args&&...>;
    if constexpr (std::is_void_v<Result>) {
        std::invoke(fn, state, std::forward<Args>(args)...);
        return Checklist<C>::run_render();
    } else if constexpr (std::is_same_v<Result, ShouldRender>) {
        return std::invoke(fn, state, std::forward<Args>(args)...) == ShouldRender::Yes ? Checklist<C>::run_render()
                                                                                        : Checklist<C>::skip_render();
    } else {
        static_assert(std::is_same_v<Result, Checklist<C>>, "a mutator returns void, ShouldRender or Checklist<C>");
        return std::invoke(fn, state, std::forward<Args>(args)...);
    }
}

template <typename C>
concept HasPreUpdate = requires(C& state, Comp<C> const& comp) { state.pre_update(comp); };

} // namespace detail

/**
 * Storage of one component: its state, the root element it renders into and
 * the global listeners it owns.
 *
 * C provides `auto render(Render::ElementRender<C>& element) const -> void`
 * and may provide `auto pre_update(Comp<C> const&) -> void`, which runs before
 * every mutator.
 *
 * At most one borrow is active at a time. Updates that find the instance
 * borrowed are deferred to the UpdateQueue instead of waiting.
 */
template <typename C>
class CompInstance {
public:
    class Borrow {
    public:
        explicit Borrow(CompInstance& instance)
            : instance_(instance) {
            instance_.borrowed_ = true;
        }
        ~Borrow() { instance_.borrowed_ = false; }

        Borrow(Borrow const&)            = delete;
        Borrow& operator=(Borrow const&) = delete;

    private:
        CompInstance& instance_;
    };

    CompInstance(Dom::Element root, MountStatus mount_status)
        : root_(std::move(root)), mount_status_(mount_status) {}

    CompInstance(CompInstance const&)            = delete;
    CompInstance& operator=(CompInstance const&) = delete;

    [[nodiscard]] auto has_state() const -> bool { return state_.has_value(); }
    [[nodiscard]] auto state() const -> C const& {
        if (!state_) {
            contract_violation("component state read before its initializer finished");
        }
        return *state_;
    }
    [[nodiscard]] auto state() -> C& {
        if (!state_) {
            contract_violation("component state read before its initializer finished");
        }
        return *state_;
    }
    auto set_state(C state) -> void { state_.emplace(std::move(state)); }

    [[nodiscard]] auto root() -> Dom::Element& { return root_; }
    [[nodiscard]] auto root() const -> Dom::Element const& { return root_; }
    [[nodiscard]] auto root_live() const -> Platform::ElementPtr const& { return root_.live(); }

    [[nodiscard]] auto mount_status() const -> MountStatus { return mount_status_; }
    [[nodiscard]] auto is_mounted() const -> bool { return mount_status_ == MountStatus::Mounted; }
    auto set_mount_status(MountStatus status) -> void { mount_status_ = status; }

    [[nodiscard]] auto borrowed() const -> bool { return borrowed_; }
    [[nodiscard]] auto has_rendered() const -> bool { return has_rendered_; }
    [[nodiscard]] auto render_count() const -> std::size_t { return render_count_; }

    auto add_global_listener(Platform::ListenerHandle registration) -> void {
        global_listeners_.push_back(std::move(registration));
    }
    [[nodiscard]] auto global_listener_count() const -> std::size_t { return global_listeners_.size(); }
    auto release_global_listeners() -> void { global_listeners_.clear(); }

    // The root reports JustCreated on the first pass and after it was moved
    // onto another live element.
    auto render(Comp<C> const& comp) -> void {
        auto status = root_fresh_ ? Dom::ElementStatus::JustCreated : Dom::ElementStatus::Existing;
        root_fresh_ = false;
        {
            Render::ElementRender<C> element{comp, state(), root_, status};
            std::as_const(state()).render(element);
        }
        has_rendered_ = true;
        ++render_count_;
    }

    auto extra_update(Comp<C> const& comp, Checklist<C> checklist) -> void {
        if (checklist.should_render() == ShouldRender::Yes) {
            render(comp);
        }
        for (auto& command : checklist.take_commands()) {
            command->execute(comp, state());
        }
    }

    // Moves the rendered content onto `live` and renders there.
    auto mount_to(Comp<C> const& comp, Platform::ElementPtr live) -> void {
        root_.replace_live(std::move(live));
        root_fresh_ = true;
        if (mount_status_ != MountStatus::PermanentlyMounted) {
            mount_status_ = MountStatus::Mounted;
        }
        render(comp);
    }

private:
    std::optional<C>                      state_;
    Dom::Element                          root_;
    MountStatus                           mount_status_;
    std::vector<Platform::ListenerHandle> global_listeners_;
    bool                                  borrowed_     = false;
    bool                                  has_rendered_ = false;
    bool                                  root_fresh_   = true;
    std::size_t                           render_count_ = 0;
};

/**
 * Non-owning handle to a component. Every update goes through here; a handle
 * whose component is gone turns updates into no-ops.
 */
template <typename C>
class Comp {
public:
    using Mutator = std::function<Checklist<C>(C&)>;

    Comp() = default;
    explicit Comp(std::weak_ptr<CompInstance<C>> instance)
        : instance_(std::move(instance)) {}

    [[nodiscard]] auto expired() const -> bool { return instance_.expired(); }
    [[nodiscard]] auto instance() const -> std::shared_ptr<CompInstance<C>> { return instance_.lock(); }

    template <typename Fn>
    auto update(Fn fn) const -> void {
        run_update(Mutator{[fn = std::move(fn)](C& state) mutable { return detail::invoke_mutator(fn, state); }});
    }

    template <typename Arg, typename Fn>
    auto update_arg(Arg arg, Fn fn) const -> void {
        run_update(Mutator{[fn = std::move(fn), arg = std::move(arg)](C& state) mutable {
            return detail::invoke_mutator(fn, state, arg);
        }});
    }

    /**
     * Take a ticket, resolve the instance, and either run `mutator` under a
     * borrow or queue a retry when the instance is already borrowed. The
     * ticket owner drains the queue last.
     */
    auto run_update(Mutator mutator) const -> void {
        UpdateQueue::Ticket ticket;
        auto                instance = instance_.lock();
        if (!instance) {
            detail::trace_component("update for a destroyed component dropped");
            ticket.finish();
            return;
        }
        if (instance->borrowed()) {
            detail::trace_component("component busy, update deferred");
            UpdateQueue::schedule([comp = *this, mutator = std::move(mutator)]() mutable { comp.run_update(std::move(mutator)); });
            ticket.finish();
            return;
        }
        {
            typename CompInstance<C>::Borrow borrow{*instance};
            auto&                            state = instance->state();
            if constexpr (detail::HasPreUpdate<C>) {
                state.pre_update(*this);
            }
            instance->extra_update(*this, mutator(state));
        }
        ticket.finish();
    }

    // Callback factories. Each result holds this handle weakly.
    template <typename Fn>
    [[nodiscard]] auto callback(Fn fn) const -> std::function<void()> {
        return [comp = *this, fn = std::move(fn)] { comp.update(fn); };
    }

    template <typename T, typename Fn>
    [[nodiscard]] auto callback_arg(Fn fn) const -> std::function<void(T)> {
        return [comp = *this, fn = std::move(fn)](T arg) { comp.update_arg(std::move(arg), fn); };
    }

    // Event handler that ignores the event.
    template <typename Fn>
    [[nodiscard]] auto handler(Fn fn) const -> Platform::EventHandler {
        return [comp = *this, fn = std::move(fn)](Platform::Event const&) { comp.update(fn); };
    }

    // Event handler that passes the event as fn(state, event).
    template <typename Fn>
    [[nodiscard]] auto handler_arg(Fn fn) const -> Platform::EventHandler {
        return [comp = *this, fn = std::move(fn)](Platform::Event const& event) { comp.update_arg(event, fn); };
    }

    // Window-level listener released with the component.
    auto listen_global(std::string type, Platform::EventHandler handler) const -> void {
        auto instance = instance_.lock();
        if (!instance) {
            return;
        }
        auto const& document = instance->root_live()->owner_document();
        if (!document) {
            contract_violation("component root has no owner document");
        }
        instance->add_global_listener(document->add_global_listener(std::move(type), std::move(handler)));
    }

    [[nodiscard]] auto document() const -> Platform::DocumentPtr {
        auto instance = instance_.lock();
        return instance ? instance->root_live()->owner_document() : nullptr;
    }

    // Skipped while the instance is borrowed, which only happens when the
    // component is dropped from inside its own update.
    auto set_unmounted() const -> void {
        auto instance = instance_.lock();
        if (instance && !instance->borrowed() && instance->mount_status() != MountStatus::PermanentlyMounted) {
            instance->set_mount_status(MountStatus::Unmounted);
        }
    }

private:
    std::weak_ptr<CompInstance<C>> instance_;
};

/**
 * Owning handle. A parent keeps its children as ChildComp members of its
 * state; the application keeps the root one.
 */
template <typename C>
class RcComp {
public:
    // Bound to an existing element for the rest of its life.
    template <typename Init>
    [[nodiscard]] static auto create(Init&& init, Platform::ElementPtr root) -> RcComp {
        if (!root) {
            contract_violation("RcComp::create needs a root element");
        }
        return create_with(std::forward<Init>(init), Dom::Element{std::move(root)}, MountStatus::PermanentlyMounted);
    }

    // Renders into a detached placeholder until a parent mounts it.
    template <typename Init>
    [[nodiscard]] static auto create(Init&& init, Platform::DocumentPtr const& document) -> RcComp {
        if (!document) {
            contract_violation("RcComp::create needs a document");
        }
        return create_with(std::forward<Init>(init), Dom::Element{document->create_element("div")}, MountStatus::Never);
    }

    RcComp(RcComp&&) noexcept            = default;
    RcComp& operator=(RcComp&& other) noexcept {
        if (this != &other) {
            teardown();
            instance_ = std::move(other.instance_);
        }
        return *this;
    }
    RcComp(RcComp const&)            = delete;
    RcComp& operator=(RcComp const&) = delete;

    ~RcComp() { teardown(); }

    [[nodiscard]] auto comp() const -> Comp<C> { return Comp<C>{instance_}; }
    [[nodiscard]] auto instance() const -> CompInstance<C>& { return *instance_; }
    [[nodiscard]] auto state() const -> C const& { return std::as_const(*instance_).state(); }
    [[nodiscard]] auto mount_status() const -> MountStatus { return instance_->mount_status(); }
    [[nodiscard]] auto is_mounted() const -> bool { return instance_->is_mounted(); }

    // Renders unless something was rendered already.
    auto first_render() const -> void {
        UpdateQueue::Ticket ticket;
        if (!instance_->has_rendered()) {
            if (instance_->borrowed()) {
                contract_violation("component is borrowed during its first render");
            }
            typename CompInstance<C>::Borrow borrow{*instance_};
            instance_->render(comp());
        }
        ticket.finish();
    }

    // Takes `live` over as the root element and renders into it.
    auto mount_to(Platform::ElementPtr const& live) const -> void {
        UpdateQueue::Ticket ticket;
        if (instance_->borrowed()) {
            contract_violation("component is borrowed while being mounted");
        }
        {
            typename CompInstance<C>::Borrow borrow{*instance_};
            instance_->mount_to(comp(), live);
        }
        detail::trace_component("component mounted into <" + live->tag_name() + ">");
        ticket.finish();
    }

private:
    explicit RcComp(std::shared_ptr<CompInstance<C>> instance)
        : instance_(std::move(instance)) {}

    template <typename Init>
    static auto create_with(Init&& init, Dom::Element root, MountStatus status) -> RcComp {
        UpdateQueue::Ticket ticket;
        auto                instance = std::make_shared<CompInstance<C>>(std::move(root), status);
        {
            typename CompInstance<C>::Borrow borrow{*instance};
            instance->set_state(std::invoke(std::forward<Init>(init), Comp<C>{instance}));
        }
        RcComp rc{std::move(instance)};
        ticket.finish();
        return rc;
    }

    auto teardown() -> void {
        if (!instance_) {
            return;
        }
        if (instance_->mount_status() != MountStatus::PermanentlyMounted) {
            instance_->set_mount_status(MountStatus::Unmounted);
        }
        instance_->root_live()->set_text_content(std::nullopt);
        instance_->release_global_listeners();
        detail::trace_component("component dropped");
        instance_.reset();
    }

    std::shared_ptr<CompInstance<C>> instance_;
};

template <typename C>
using ChildComp = RcComp<C>;

// Held in the node slot of the element a child is mounted into.
template <typename C>
class ComponentHandle final : public Dom::ComponentHandleBase {
public:
    explicit ComponentHandle(Comp<C> comp)
        : comp_(std::move(comp)) {}
    ~ComponentHandle() override { comp_.set_unmounted(); }

private:
    Comp<C> comp_;
};

} // namespace LT
