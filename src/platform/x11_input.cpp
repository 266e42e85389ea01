#include "macrorec/errors.hpp"
#include "macrorec/input.hpp"

#include <atomic>
#include <chrono>
#include <iostream>
#include <thread>
#include <vector>

// Xlib defines macros such as None and Status; keep it after our headers.
#include <X11/Xlib.h>
#include <X11/extensions/XTest.h>
#include <X11/extensions/record.h>

namespace macrorec {

namespace {

// X core protocol event codes as they appear in RECORD data.
constexpr int X_KEY_PRESS = 2;
constexpr int X_KEY_RELEASE = 3;
constexpr int X_BUTTON_PRESS = 4;
constexpr int X_BUTTON_RELEASE = 5;
constexpr int X_MOTION_NOTIFY = 6;

bool buttonFromX11(unsigned detail, MouseButton& button) {
    switch (detail) {
        case 1: button = MouseButton::LEFT;   return true;
        case 2: button = MouseButton::MIDDLE; return true;
        case 3: button = MouseButton::RIGHT;  return true;
        case 8: button = MouseButton::X1;     return true;
        case 9: button = MouseButton::X2;     return true;
        default: return false;
    }
}

unsigned buttonToX11(MouseButton button) {
    switch (button) {
        case MouseButton::LEFT:   return 1;
        case MouseButton::MIDDLE: return 2;
        case MouseButton::RIGHT:  return 3;
        case MouseButton::X1:     return 8;
        case MouseButton::X2:     return 9;
    }
    return 1;
}

// Two connections: RECORD delivers on the data display while the context is
// created and torn down on the control display.
class X11Capture : public InputCapture {
public:
    ~X11Capture() override { stop(); }

    void start(Sink newSink) override {
        if (running) throw PermissionError("input capture already running");

        controlDisplay = XOpenDisplay(nullptr);
        dataDisplay = XOpenDisplay(nullptr);
        if (!controlDisplay || !dataDisplay) {
            closeDisplays();
            throw PermissionError("cannot open X display");
        }

        int major = 0, minor = 0;
        if (!XRecordQueryVersion(controlDisplay, &major, &minor)) {
            closeDisplays();
            throw PermissionError("XRecord extension not supported on this server");
        }
        loadKeymap();
        repeats.reset();

        XRecordRange* range = XRecordAllocRange();
        if (!range) {
            closeDisplays();
            throw PermissionError("could not allocate a record range");
        }
        range->device_events.first = X_KEY_PRESS;
        range->device_events.last = X_MOTION_NOTIFY;
        XRecordClientSpec clients = XRecordAllClients;
        context = XRecordCreateContext(controlDisplay, 0, &clients, 1, &range, 1);
        XFree(range);
        if (!context) {
            closeDisplays();
            throw PermissionError("could not create a record context");
        }
        // the context must reach the server before the data connection enables it
        XSync(controlDisplay, False);

        sink = std::move(newSink);
        if (!XRecordEnableContextAsync(dataDisplay, context, &X11Capture::intercept,
                                       reinterpret_cast<XPointer>(this))) {
            XRecordFreeContext(controlDisplay, context);
            context = 0;
            sink = nullptr;
            closeDisplays();
            throw PermissionError("could not enable the record context");
        }

        running = true;
        replyThread = std::thread([this] {
            while (running) {
                XRecordProcessReplies(dataDisplay);
                std::this_thread::sleep_for(std::chrono::milliseconds(2));
            }
        });
    }

    void stop() override {
        if (!running) return;
        running = false;
        if (replyThread.joinable()) replyThread.join();

        if (!XRecordDisableContext(controlDisplay, context)) {
            std::cerr << "XRecordDisableContext failed!" << std::endl;
        }
        XSync(controlDisplay, False);
        if (!XRecordFreeContext(controlDisplay, context)) {
            std::cerr << "XRecordFreeContext failed!" << std::endl;
        }
        context = 0;
        sink = nullptr;
        closeDisplays();
    }

    bool active() const override { return running; }

private:
    static void intercept(XPointer priv, XRecordInterceptData* data) {
        X11Capture* self = reinterpret_cast<X11Capture*>(priv);
        if (data->category == XRecordFromServer && self->running) self->decode(data->data);
        XRecordFreeData(data);
    }

    // Layout of an xEvent: type, detail, then rootX/rootY as the 10th and 11th shorts.
    void decode(const unsigned char* bytes) {
        int type = bytes[0] & 0x7F;
        unsigned detail = bytes[1];
        const short* words = reinterpret_cast<const short*>(bytes);

        RawInput raw;
        raw.x = words[10];
        raw.y = words[11];

        switch (type) {
            case X_MOTION_NOTIFY:
                raw.kind = EventKind::MOUSE_MOVE;
                break;

            case X_BUTTON_PRESS:
            case X_BUTTON_RELEASE:
                // wheel clicks arrive as buttons 4-7; the release carries nothing new
                if (detail >= 4 && detail <= 7) {
                    if (type == X_BUTTON_RELEASE) return;
                    raw.kind = EventKind::MOUSE_SCROLL;
                    if (detail == 4) raw.scrollDy = 1;
                    else if (detail == 5) raw.scrollDy = -1;
                    else if (detail == 6) raw.scrollDx = -1;
                    else raw.scrollDx = 1;
                    break;
                }
                if (!buttonFromX11(detail, raw.button)) return;
                raw.kind = type == X_BUTTON_PRESS ? EventKind::MOUSE_DOWN : EventKind::MOUSE_UP;
                break;

            case X_KEY_PRESS:
            case X_KEY_RELEASE: {
                bool down = type == X_KEY_PRESS;
                if (!repeats.accept(detail, down)) return;
                raw.kind = down ? EventKind::KEY_DOWN : EventKind::KEY_UP;
                uint32_t keysym = keysymFor(detail);
                raw.platformCode = keysym ? keysym : detail;
                if (keysym) raw.key = keyFromKeysym(keysym);
                break;
            }

            default:
                return;
        }
        if (sink) sink(raw);
    }

    void loadKeymap() {
        XDisplayKeycodes(controlDisplay, &minKeycode, &maxKeycode);
        int count = maxKeycode - minKeycode + 1;
        int perKeycode = 0;
        KeySym* map = XGetKeyboardMapping(controlDisplay, static_cast<KeyCode>(minKeycode), count, &perKeycode);
        keymap.assign(static_cast<size_t>(count), 0);
        if (!map) return;
        for (int i = 0; i < count; ++i) {
            keymap[i] = static_cast<uint32_t>(map[i * perKeycode]);
        }
        XFree(map);
    }

    uint32_t keysymFor(unsigned keycode) const {
        if (static_cast<int>(keycode) < minKeycode || static_cast<int>(keycode) > maxKeycode) return 0;
        return keymap[keycode - minKeycode];
    }

    void closeDisplays() {
        if (dataDisplay) XCloseDisplay(dataDisplay);
        if (controlDisplay) XCloseDisplay(controlDisplay);
        dataDisplay = nullptr;
        controlDisplay = nullptr;
    }

    Sink sink;
    std::atomic<bool> running{false};
    std::thread replyThread;
    Display* controlDisplay = nullptr;
    Display* dataDisplay = nullptr;
    XRecordContext context = 0;
    int minKeycode = 0, maxKeycode = 0;
    std::vector<uint32_t> keymap;
    KeyRepeatFilter repeats;
};

class X11Synthesizer : public InputSynthesizer {
public:
    ~X11Synthesizer() override { release(); }

    void acquire() override {
        if (display) return;
        display = XOpenDisplay(nullptr);
        if (!display) throw PermissionError("cannot open X display");
        int eventBase, errorBase, major, minor;
        if (!XTestQueryExtension(display, &eventBase, &errorBase, &major, &minor)) {
            release();
            throw PermissionError("XTest extension not supported on this server");
        }
    }

    void release() override {
        if (!display) return;
        XCloseDisplay(display);
        display = nullptr;
    }

    bool moveTo(int x, int y) override {
        if (!display) return false;
        if (!XTestFakeMotionEvent(display, -1, x, y, CurrentTime)) return false;
        XFlush(display);
        return true;
    }

    bool button(MouseButton button, bool down, int x, int y) override {
        if (!moveTo(x, y)) return false;
        if (!XTestFakeButtonEvent(display, buttonToX11(button), down ? True : False, CurrentTime)) return false;
        XFlush(display);
        return true;
    }

    bool scroll(int dx, int dy, int x, int y) override {
        if (!moveTo(x, y)) return false;
        // each wheel notch is a click of button 4/5 (vertical) or 6/7 (horizontal)
        if (!clicks(dy > 0 ? 4 : 5, dy > 0 ? dy : -dy)) return false;
        if (!clicks(dx > 0 ? 7 : 6, dx > 0 ? dx : -dx)) return false;
        XFlush(display);
        return true;
    }

    bool key(Key key, bool down) override {
        if (!display) return false;
        KeyCode code = XKeysymToKeycode(display, static_cast<KeySym>(keyToKeysym(key)));
        if (code == 0) return false;
        if (!XTestFakeKeyEvent(display, code, down ? True : False, CurrentTime)) return false;
        XFlush(display);
        return true;
    }

private:
    bool clicks(unsigned xButton, int count) {
        for (int i = 0; i < count; ++i) {
            if (!XTestFakeButtonEvent(display, xButton, True, CurrentTime)) return false;
            if (!XTestFakeButtonEvent(display, xButton, False, CurrentTime)) return false;
        }
        return true;
    }

    Display* display = nullptr;
};

} // namespace

std::unique_ptr<InputCapture> createSystemCapture() {
    return std::make_unique<X11Capture>();
}

std::unique_ptr<InputSynthesizer> createSystemSynthesizer() {
    return std::make_unique<X11Synthesizer>();
}

} // namespace macrorec
