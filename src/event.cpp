#include "macrorec/event.hpp"

#include <sstream>

namespace macrorec {

Event Event::mouseMove(std::chrono::milliseconds offset, int x, int y) {
    Event e;
    e.kind = EventKind::MOUSE_MOVE;
    e.offset = offset;
    e.x = x;
    e.y = y;
    return e;
}

Event Event::mouseButton(std::chrono::milliseconds offset, int x, int y,
                         MouseButton button, bool down) {
    Event e;
    e.kind = down ? EventKind::MOUSE_DOWN : EventKind::MOUSE_UP;
    e.offset = offset;
    e.x = x;
    e.y = y;
    e.button = button;
    return e;
}

Event Event::mouseScroll(std::chrono::milliseconds offset, int x, int y, int dx, int dy) {
    Event e;
    e.kind = EventKind::MOUSE_SCROLL;
    e.offset = offset;
    e.x = x;
    e.y = y;
    e.scrollDx = dx;
    e.scrollDy = dy;
    return e;
}

Event Event::keyEvent(std::chrono::milliseconds offset, Key key, bool down) {
    Event e;
    e.kind = down ? EventKind::KEY_DOWN : EventKind::KEY_UP;
    e.offset = offset;
    e.key = key;
    return e;
}

bool Event::isMouse() const {
    return !isKeyboard();
}

bool Event::isKeyboard() const {
    return kind == EventKind::KEY_DOWN || kind == EventKind::KEY_UP;
}

bool Event::operator==(const Event& other) const {
    return kind == other.kind && offset == other.offset &&
           x == other.x && y == other.y && button == other.button &&
           scrollDx == other.scrollDx && scrollDy == other.scrollDy &&
           key == other.key;
}

const char* eventKindName(EventKind kind) {
    switch (kind) {
        case EventKind::MOUSE_MOVE:   return "mouse_move";
        case EventKind::MOUSE_DOWN:   return "mouse_down";
        case EventKind::MOUSE_UP:     return "mouse_up";
        case EventKind::MOUSE_SCROLL: return "mouse_scroll";
        case EventKind::KEY_DOWN:     return "key_down";
        case EventKind::KEY_UP:       return "key_up";
    }
    return "unknown";
}

std::optional<EventKind> eventKindFromName(std::string_view name) {
    if (name == "mouse_move") return EventKind::MOUSE_MOVE;
    if (name == "mouse_down") return EventKind::MOUSE_DOWN;
    if (name == "mouse_up") return EventKind::MOUSE_UP;
    if (name == "mouse_scroll") return EventKind::MOUSE_SCROLL;
    if (name == "key_down") return EventKind::KEY_DOWN;
    if (name == "key_up") return EventKind::KEY_UP;
    return std::nullopt;
}

const char* mouseButtonName(MouseButton button) {
    switch (button) {
        case MouseButton::LEFT:   return "left";
        case MouseButton::RIGHT:  return "right";
        case MouseButton::MIDDLE: return "middle";
        case MouseButton::X1:     return "x1";
        case MouseButton::X2:     return "x2";
    }
    return "unknown";
}

std::optional<MouseButton> mouseButtonFromName(std::string_view name) {
    if (name == "left") return MouseButton::LEFT;
    if (name == "right") return MouseButton::RIGHT;
    if (name == "middle") return MouseButton::MIDDLE;
    if (name == "x1") return MouseButton::X1;
    if (name == "x2") return MouseButton::X2;
    return std::nullopt;
}

std::string describe(const Event& event) {
    std::ostringstream ss;
    ss << event.offset.count() << "ms " << eventKindName(event.kind);
    switch (event.kind) {
        case EventKind::MOUSE_MOVE:
            ss << " (" << event.x << ", " << event.y << ")";
            break;
        case EventKind::MOUSE_DOWN:
        case EventKind::MOUSE_UP:
            ss << " " << mouseButtonName(event.button) << " (" << event.x << ", " << event.y << ")";
            break;
        case EventKind::MOUSE_SCROLL:
            ss << " dx=" << event.scrollDx << " dy=" << event.scrollDy;
            break;
        case EventKind::KEY_DOWN:
        case EventKind::KEY_UP:
            ss << " " << keyName(event.key);
            break;
    }
    return ss.str();
}

} // namespace macrorec
