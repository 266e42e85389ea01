#pragma once

#include "macrorec/event.hpp"

#include <bitset>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>

namespace macrorec {

// A notification as the platform delivered it, before the Recorder stamps it.
struct RawInput {
    EventKind kind = EventKind::MOUSE_MOVE;
    int x = 0, y = 0;
    MouseButton button = MouseButton::LEFT;
    int scrollDx = 0, scrollDy = 0;
    std::optional<Key> key;   // empty when the platform key is not in the table
    uint32_t platformCode = 0; // raw VK / keysym, for logging unknown keys
    bool injected = false;     // produced by synthesis rather than a device
};

// Global input subscription. Only one subscriber at a time.
class InputCapture {
public:
    using Sink = std::function<void(const RawInput&)>;

    virtual ~InputCapture() = default;

    // Begins delivering notifications to sink from a backend thread.
    // Throws PermissionError when the capability cannot be acquired.
    virtual void start(Sink sink) = 0;
    virtual void stop() = 0;
    virtual bool active() const = 0;
};

// Drops auto-repeat: a key-down for a key that is already down. Codes are
// the platform's key codes, folded to 8 bits. Capture backends reset it on
// every start() since a release seen after stop() is never delivered.
class KeyRepeatFilter {
public:
    // False when the notification is a repeat and must not be delivered.
    bool accept(uint32_t code, bool down);
    void reset() { held.reset(); }

private:
    std::bitset<256> held;
};

// Global input synthesis. Each action returns false when the OS rejected it.
class InputSynthesizer {
public:
    virtual ~InputSynthesizer() = default;

    // Throws PermissionError when the capability cannot be acquired.
    virtual void acquire() = 0;
    virtual void release() = 0;

    virtual bool moveTo(int x, int y) = 0;
    // Moves the pointer to (x, y) first, then presses or releases.
    virtual bool button(MouseButton button, bool down, int x, int y) = 0;
    virtual bool scroll(int dx, int dy, int x, int y) = 0;
    virtual bool key(Key key, bool down) = 0;
};

// Backends for the platform this build targets. They throw PermissionError
// when no backend was compiled in.
std::unique_ptr<InputCapture> createSystemCapture();
std::unique_ptr<InputSynthesizer> createSystemSynthesizer();

} // namespace macrorec
