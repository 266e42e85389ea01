#pragma once

#include "macrorec/keys.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace macrorec {

enum class EventKind {
    MOUSE_MOVE,
    MOUSE_DOWN,
    MOUSE_UP,
    MOUSE_SCROLL,
    KEY_DOWN,
    KEY_UP
};

enum class MouseButton {
    LEFT,
    RIGHT,
    MIDDLE,
    X1,
    X2
};

// One recorded input occurrence. Fields that do not apply to the kind stay
// at their defaults so that two equal events always compare equal.
struct Event {
    EventKind kind = EventKind::MOUSE_MOVE;
    std::chrono::milliseconds offset{0};   // since recording start
    int x = 0, y = 0;                       // mouse kinds only
    MouseButton button = MouseButton::LEFT; // MOUSE_DOWN / MOUSE_UP
    int scrollDx = 0, scrollDy = 0;         // MOUSE_SCROLL, in wheel notches
    Key key = Key::A;                       // KEY_DOWN / KEY_UP

    static Event mouseMove(std::chrono::milliseconds offset, int x, int y);
    static Event mouseButton(std::chrono::milliseconds offset, int x, int y,
                             MouseButton button, bool down);
    static Event mouseScroll(std::chrono::milliseconds offset, int x, int y, int dx, int dy);
    static Event keyEvent(std::chrono::milliseconds offset, Key key, bool down);

    bool isMouse() const;
    bool isKeyboard() const;

    bool operator==(const Event& other) const;
    bool operator!=(const Event& other) const { return !(*this == other); }
};

const char* eventKindName(EventKind kind);
std::optional<EventKind> eventKindFromName(std::string_view name);

const char* mouseButtonName(MouseButton button);
std::optional<MouseButton> mouseButtonFromName(std::string_view name);

// Short human readable form, used in logs and `macrorec info`.
std::string describe(const Event& event);

} // namespace macrorec
