#pragma once

namespace LT::Dom {

// How the element handed to a render function came to be. Static attributes
// and static children are written only for JustCreated; listeners are bound
// for anything but Existing because cloned platform nodes carry none.
enum class ElementStatus {
    JustCreated,
    Existing,
    JustCloned,
};

[[nodiscard]] constexpr auto to_string(ElementStatus status) -> char const* {
    switch (status) {
    case ElementStatus::JustCreated:
        return "just_created";
    case ElementStatus::Existing:
        return "existing";
    case ElementStatus::JustCloned:
        return "just_cloned";
    }
    return "existing";
}

} // namespace LT::Dom
