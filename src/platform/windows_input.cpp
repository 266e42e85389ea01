#include "macrorec/errors.hpp"
#include "macrorec/input.hpp"

#include <atomic>
#include <future>
#include <mutex>
#include <thread>

#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>

namespace macrorec {

namespace {

// Low-level hooks deliver on the thread that installed them, so the hooks
// live on their own thread running a message loop.
class WindowsCapture : public InputCapture {
public:
    ~WindowsCapture() override { stop(); }

    void start(Sink newSink) override {
        if (running) throw PermissionError("input capture already running");
        {
            std::lock_guard<std::mutex> lk(instanceMutex);
            if (instance) throw PermissionError("another capture already owns the input hooks");
            instance = this;
        }
        sink = std::move(newSink);
        repeats.reset();

        std::promise<bool> installed;
        auto ready = installed.get_future();
        hookThread = std::thread([this, &installed] {
            hookThreadId = GetCurrentThreadId();
            mouseHook = SetWindowsHookExW(WH_MOUSE_LL, MouseHookProc, GetModuleHandleW(nullptr), 0);
            keyboardHook = SetWindowsHookExW(WH_KEYBOARD_LL, KeyboardHookProc, GetModuleHandleW(nullptr), 0);
            bool ok = mouseHook && keyboardHook;
            installed.set_value(ok);
            if (ok) {
                MSG msg;
                while (GetMessageW(&msg, nullptr, 0, 0) > 0) {
                    TranslateMessage(&msg);
                    DispatchMessageW(&msg);
                }
            }
            if (mouseHook) UnhookWindowsHookEx(mouseHook);
            if (keyboardHook) UnhookWindowsHookEx(keyboardHook);
            mouseHook = nullptr;
            keyboardHook = nullptr;
        });

        if (!ready.get()) {
            hookThread.join();
            releaseInstance();
            throw PermissionError("Failed to set hooks!");
        }
        running = true;
    }

    void stop() override {
        if (!running) return;
        running = false;
        PostThreadMessageW(hookThreadId, WM_QUIT, 0, 0);
        if (hookThread.joinable()) hookThread.join();
        releaseInstance();
    }

    bool active() const override { return running; }

private:
    static LRESULT CALLBACK MouseHookProc(int nCode, WPARAM wParam, LPARAM lParam) {
        WindowsCapture* self = instance;
        if (nCode >= 0 && self && self->running) {
            const MSLLHOOKSTRUCT* info = reinterpret_cast<const MSLLHOOKSTRUCT*>(lParam);
            RawInput raw;
            raw.x = info->pt.x;
            raw.y = info->pt.y;
            raw.injected = (info->flags & (LLMHF_INJECTED | LLMHF_LOWER_IL_INJECTED)) != 0;
            bool deliver = true;

            switch (wParam) {
                case WM_MOUSEMOVE:   raw.kind = EventKind::MOUSE_MOVE; break;
                case WM_LBUTTONDOWN: raw.kind = EventKind::MOUSE_DOWN; raw.button = MouseButton::LEFT; break;
                case WM_LBUTTONUP:   raw.kind = EventKind::MOUSE_UP;   raw.button = MouseButton::LEFT; break;
                case WM_RBUTTONDOWN: raw.kind = EventKind::MOUSE_DOWN; raw.button = MouseButton::RIGHT; break;
                case WM_RBUTTONUP:   raw.kind = EventKind::MOUSE_UP;   raw.button = MouseButton::RIGHT; break;
                case WM_MBUTTONDOWN: raw.kind = EventKind::MOUSE_DOWN; raw.button = MouseButton::MIDDLE; break;
                case WM_MBUTTONUP:   raw.kind = EventKind::MOUSE_UP;   raw.button = MouseButton::MIDDLE; break;
                case WM_XBUTTONDOWN:
                case WM_XBUTTONUP:
                    raw.kind = wParam == WM_XBUTTONDOWN ? EventKind::MOUSE_DOWN : EventKind::MOUSE_UP;
                    raw.button = GET_XBUTTON_WPARAM(info->mouseData) == XBUTTON1 ? MouseButton::X1 : MouseButton::X2;
                    break;
                case WM_MOUSEWHEEL:
                    raw.kind = EventKind::MOUSE_SCROLL;
                    raw.scrollDy = GET_WHEEL_DELTA_WPARAM(info->mouseData) / WHEEL_DELTA;
                    break;
                case WM_MOUSEHWHEEL:
                    raw.kind = EventKind::MOUSE_SCROLL;
                    raw.scrollDx = GET_WHEEL_DELTA_WPARAM(info->mouseData) / WHEEL_DELTA;
                    break;
                default:
                    deliver = false;
                    break;
            }
            if (deliver && self->sink) self->sink(raw);
        }
        return CallNextHookEx(nullptr, nCode, wParam, lParam);
    }

    static LRESULT CALLBACK KeyboardHookProc(int nCode, WPARAM wParam, LPARAM lParam) {
        WindowsCapture* self = instance;
        if (nCode >= 0 && self && self->running) {
            const KBDLLHOOKSTRUCT* info = reinterpret_cast<const KBDLLHOOKSTRUCT*>(lParam);
            bool down = wParam == WM_KEYDOWN || wParam == WM_SYSKEYDOWN;
            bool up = wParam == WM_KEYUP || wParam == WM_SYSKEYUP;
            if (down || up) {
                if (self->repeats.accept(info->vkCode, down)) {
                    RawInput raw;
                    raw.kind = down ? EventKind::KEY_DOWN : EventKind::KEY_UP;
                    raw.platformCode = info->vkCode;
                    raw.key = keyFromVirtualKey(static_cast<uint16_t>(info->vkCode));
                    raw.injected = (info->flags & (LLKHF_INJECTED | LLKHF_LOWER_IL_INJECTED)) != 0;
                    if (self->sink) self->sink(raw);
                }
            }
        }
        return CallNextHookEx(nullptr, nCode, wParam, lParam);
    }

    void releaseInstance() {
        std::lock_guard<std::mutex> lk(instanceMutex);
        if (instance == this) instance = nullptr;
    }

    static std::mutex instanceMutex;
    static std::atomic<WindowsCapture*> instance;

    Sink sink;
    std::atomic<bool> running{false};
    std::thread hookThread;
    DWORD hookThreadId = 0;
    HHOOK mouseHook = nullptr;
    HHOOK keyboardHook = nullptr;
    KeyRepeatFilter repeats;
};

std::mutex WindowsCapture::instanceMutex;
std::atomic<WindowsCapture*> WindowsCapture::instance{nullptr};

bool isExtendedKey(WORD vk) {
    switch (vk) {
        case VK_INSERT: case VK_DELETE: case VK_HOME: case VK_END:
        case VK_PRIOR: case VK_NEXT: case VK_LEFT: case VK_RIGHT: case VK_UP: case VK_DOWN:
        case VK_RCONTROL: case VK_RMENU: case VK_LWIN: case VK_RWIN: case VK_APPS:
        case VK_DIVIDE: case VK_NUMLOCK: case VK_SNAPSHOT:
            return true;
        default:
            return false;
    }
}

class WindowsSynthesizer : public InputSynthesizer {
public:
    void acquire() override {
        screenWidth = GetSystemMetrics(SM_CXSCREEN);
        screenHeight = GetSystemMetrics(SM_CYSCREEN);
        if (screenWidth <= 1 || screenHeight <= 1) {
            throw PermissionError("no interactive desktop to send input to");
        }
    }

    void release() override {}

    bool moveTo(int x, int y) override {
        INPUT input = {0};
        input.type = INPUT_MOUSE;
        input.mi.dwFlags = MOUSEEVENTF_MOVE | MOUSEEVENTF_ABSOLUTE;
        input.mi.dx = static_cast<LONG>((x * 65535LL) / (screenWidth - 1));
        input.mi.dy = static_cast<LONG>((y * 65535LL) / (screenHeight - 1));
        return send(input);
    }

    bool button(MouseButton button, bool down, int x, int y) override {
        if (!moveTo(x, y)) return false;
        INPUT input = {0};
        input.type = INPUT_MOUSE;
        switch (button) {
            case MouseButton::LEFT:   input.mi.dwFlags = down ? MOUSEEVENTF_LEFTDOWN : MOUSEEVENTF_LEFTUP; break;
            case MouseButton::RIGHT:  input.mi.dwFlags = down ? MOUSEEVENTF_RIGHTDOWN : MOUSEEVENTF_RIGHTUP; break;
            case MouseButton::MIDDLE: input.mi.dwFlags = down ? MOUSEEVENTF_MIDDLEDOWN : MOUSEEVENTF_MIDDLEUP; break;
            case MouseButton::X1:
            case MouseButton::X2:
                input.mi.dwFlags = down ? MOUSEEVENTF_XDOWN : MOUSEEVENTF_XUP;
                input.mi.mouseData = button == MouseButton::X1 ? XBUTTON1 : XBUTTON2;
                break;
        }
        return send(input);
    }

    bool scroll(int dx, int dy, int x, int y) override {
        if (!moveTo(x, y)) return false;
        if (dy != 0) {
            INPUT input = {0};
            input.type = INPUT_MOUSE;
            input.mi.dwFlags = MOUSEEVENTF_WHEEL;
            input.mi.mouseData = static_cast<DWORD>(dy * WHEEL_DELTA);
            if (!send(input)) return false;
        }
        if (dx != 0) {
            INPUT input = {0};
            input.type = INPUT_MOUSE;
            input.mi.dwFlags = MOUSEEVENTF_HWHEEL;
            input.mi.mouseData = static_cast<DWORD>(dx * WHEEL_DELTA);
            if (!send(input)) return false;
        }
        return true;
    }

    bool key(Key key, bool down) override {
        WORD vk = keyToVirtualKey(key);
        INPUT input = {0};
        input.type = INPUT_KEYBOARD;
        input.ki.wVk = 0;
        input.ki.wScan = static_cast<WORD>(MapVirtualKeyW(vk, MAPVK_VK_TO_VSC));
        input.ki.dwFlags = KEYEVENTF_SCANCODE;
        if (isExtendedKey(vk)) input.ki.dwFlags |= KEYEVENTF_EXTENDEDKEY;
        if (!down) input.ki.dwFlags |= KEYEVENTF_KEYUP;
        return send(input);
    }

private:
    static bool send(INPUT& input) {
        return SendInput(1, &input, sizeof(INPUT)) == 1;
    }

    int screenWidth = 0;
    int screenHeight = 0;
};

} // namespace

std::unique_ptr<InputCapture> createSystemCapture() {
    return std::make_unique<WindowsCapture>();
}

std::unique_ptr<InputSynthesizer> createSystemSynthesizer() {
    return std::make_unique<WindowsSynthesizer>();
}

} // namespace macrorec
