#pragma once

#include <livetree/component/UpdateQueue.hpp>

#include <functional>
#include <memory>
#include <utility>
#include <vector>

namespace LT {

template <typename C>
class Comp;

enum class ShouldRender {
    No,
    Yes,
};

// Side effect that runs after the update that queued it has rendered.
template <typename C>
class Command {
public:
    virtual ~Command() = default;

    virtual auto execute(Comp<C> const& comp, C& state) -> void = 0;
};

/**
 * Outcome of one mutator: whether to render, and the commands to run
 * afterwards in the order they were added.
 */
template <typename C>
class Checklist {
public:
    Checklist() = default;

    Checklist(Checklist&&) noexcept            = default;
    Checklist& operator=(Checklist&&) noexcept = default;

    [[nodiscard]] static auto skip_render() -> Checklist {
        Checklist checklist;
        checklist.should_render_ = ShouldRender::No;
        return checklist;
    }

    [[nodiscard]] static auto run_render() -> Checklist { return Checklist{}; }

    auto set_skip_render() -> void { should_render_ = ShouldRender::No; }
    auto set_run_render() -> void { should_render_ = ShouldRender::Yes; }

    auto add_command(std::unique_ptr<Command<C>> command) -> void { commands_.push_back(std::move(command)); }

    // Another component's update, queued behind the current one.
    auto update_related_component(std::function<void()> update) -> void { UpdateQueue::schedule(std::move(update)); }

    [[nodiscard]] auto should_render() const -> ShouldRender { return should_render_; }
    [[nodiscard]] auto command_count() const -> std::size_t { return commands_.size(); }
    [[nodiscard]] auto take_commands() -> std::vector<std::unique_ptr<Command<C>>> { return std::move(commands_); }

private:
    ShouldRender                             should_render_ = ShouldRender::Yes;
    std::vector<std::unique_ptr<Command<C>>> commands_;
};

} // namespace LT
