#include "macrorec/compiler.hpp"
#include "macrorec/errors.hpp"
#include "macrorec/macro_store.hpp"
#include "macrorec/player.hpp"

#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>

namespace fs = std::filesystem;

namespace macrorec {

namespace {

// Step kinds shared by both runtimes
const char* stepKind(EventKind kind) {
    switch (kind) {
        case EventKind::MOUSE_MOVE:   return "MOVE";
        case EventKind::MOUSE_DOWN:   return "BUTTON_DOWN";
        case EventKind::MOUSE_UP:     return "BUTTON_UP";
        case EventKind::MOUSE_SCROLL: return "SCROLL";
        case EventKind::KEY_DOWN:     return "KEY_DOWN";
        case EventKind::KEY_UP:       return "KEY_UP";
    }
    return "MOVE";
}

int x11Button(MouseButton button) {
    switch (button) {
        case MouseButton::LEFT:   return 1;
        case MouseButton::MIDDLE: return 2;
        case MouseButton::RIGHT:  return 3;
        case MouseButton::X1:     return 8;
        case MouseButton::X2:     return 9;
    }
    return 1;
}

std::string escapeLiteral(const std::string& text) {
    std::ostringstream ss;
    for (unsigned char c : text) {
        if (c == '\\' || c == '"') {
            ss << '\\' << c;
        } else if (c < 0x20 || c == 0x7f) {
            ss << "\\x" << std::hex << static_cast<int>(c) << std::dec << "\"\"";
        } else {
            ss << c;
        }
    }
    return ss.str();
}

std::string shellQuote(const std::string& arg) {
#ifdef _WIN32
    return "\"" + arg + "\"";
#else
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') quoted += "'\\''";
        else quoted += c;
    }
    return quoted + "'";
#endif
}

// Fields a and b carry the button, key or scroll payload in the target's own codes.
void emitSteps(std::ostringstream& out, const Macro& macro, CompileTarget target) {
    out << "const Step STEPS[] = {\n";
    for (const Event& event : macro.getEvents()) {
        long a = 0, b = 0;
        switch (event.kind) {
            case EventKind::MOUSE_MOVE:
                break;
            case EventKind::MOUSE_DOWN:
            case EventKind::MOUSE_UP:
                a = target == CompileTarget::X11 ? x11Button(event.button) : static_cast<long>(event.button);
                break;
            case EventKind::MOUSE_SCROLL:
                a = event.scrollDx;
                b = event.scrollDy;
                break;
            case EventKind::KEY_DOWN:
            case EventKind::KEY_UP:
                a = target == CompileTarget::X11 ? static_cast<long>(keyToKeysym(event.key))
                                                 : static_cast<long>(keyToVirtualKey(event.key));
                break;
        }
        out << "    {" << stepKind(event.kind) << ", " << event.offset.count() << ", "
            << event.x << ", " << event.y << ", " << a << ", " << b << "},";
        if (event.isKeyboard()) out << "  // " << keyName(event.key);
        out << "\n";
    }
    out << "};\n"
        << "const size_t STEP_COUNT = sizeof(STEPS) / sizeof(STEPS[0]);\n\n";
}

const char* COMMON_HEAD = R"(#include <chrono>
#include <cstddef>
#include <cstdio>
#include <set>
#include <thread>

namespace {

enum Kind { MOVE, BUTTON_DOWN, BUTTON_UP, SCROLL, KEY_DOWN, KEY_UP };

struct Step {
    Kind kind;
    long long t;   // ms since recording start
    int x, y;
    long a, b;
};

)";

const char* X11_RUNTIME = R"(Display* display = nullptr;
std::set<unsigned> heldKeys;
std::set<unsigned> heldButtons;

bool moveTo(int x, int y) {
    return XTestFakeMotionEvent(display, -1, x, y, CurrentTime) != 0;
}

bool button(unsigned number, bool down) {
    if (!XTestFakeButtonEvent(display, number, down ? True : False, CurrentTime)) return false;
    if (down) heldButtons.insert(number);
    else heldButtons.erase(number);
    return true;
}

bool click(unsigned number, int count) {
    for (int i = 0; i < count; ++i) {
        if (!XTestFakeButtonEvent(display, number, True, CurrentTime)) return false;
        if (!XTestFakeButtonEvent(display, number, False, CurrentTime)) return false;
    }
    return true;
}

// wheel notches map to buttons 4/5 (vertical) and 6/7 (horizontal)
bool scroll(int dx, int dy) {
    if (dy > 0 && !click(4, dy)) return false;
    if (dy < 0 && !click(5, -dy)) return false;
    if (dx < 0 && !click(6, -dx)) return false;
    if (dx > 0 && !click(7, dx)) return false;
    return true;
}

bool key(unsigned long keysym, bool down) {
    KeyCode code = XKeysymToKeycode(display, keysym);
    if (code == 0) return false;
    if (!XTestFakeKeyEvent(display, code, down ? True : False, CurrentTime)) return false;
    if (down) heldKeys.insert(code);
    else heldKeys.erase(code);
    return true;
}

bool dispatch(const Step& step) {
    bool ok = false;
    switch (step.kind) {
        case MOVE:
            ok = moveTo(step.x, step.y);
            break;
        case BUTTON_DOWN:
        case BUTTON_UP:
            ok = moveTo(step.x, step.y) && button(static_cast<unsigned>(step.a), step.kind == BUTTON_DOWN);
            break;
        case SCROLL:
            ok = moveTo(step.x, step.y) && scroll(static_cast<int>(step.a), static_cast<int>(step.b));
            break;
        case KEY_DOWN:
        case KEY_UP:
            ok = key(static_cast<unsigned long>(step.a), step.kind == KEY_DOWN);
            break;
    }
    XFlush(display);
    return ok;
}

void releaseHeld() {
    for (unsigned code : heldKeys) XTestFakeKeyEvent(display, code, False, CurrentTime);
    for (unsigned number : heldButtons) XTestFakeButtonEvent(display, number, False, CurrentTime);
    heldKeys.clear();
    heldButtons.clear();
    XFlush(display);
}

bool openBackend() {
    display = XOpenDisplay(nullptr);
    if (!display) {
        std::fprintf(stderr, "cannot open X display\n");
        return false;
    }
    int eventBase, errorBase, major, minor;
    if (!XTestQueryExtension(display, &eventBase, &errorBase, &major, &minor)) {
        std::fprintf(stderr, "XTest extension not available\n");
        XCloseDisplay(display);
        display = nullptr;
        return false;
    }
    return true;
}

void closeBackend() {
    XCloseDisplay(display);
    display = nullptr;
}

} // namespace
)";

const char* WIN32_RUNTIME = R"(std::set<WORD> heldKeys;
std::set<long> heldButtons;

bool send(INPUT& input) {
    return SendInput(1, &input, sizeof(INPUT)) == 1;
}

bool moveTo(int x, int y) {
    int screenWidth = GetSystemMetrics(SM_CXSCREEN);
    int screenHeight = GetSystemMetrics(SM_CYSCREEN);
    if (screenWidth <= 1 || screenHeight <= 1) return false;
    INPUT input = {0};
    input.type = INPUT_MOUSE;
    input.mi.dwFlags = MOUSEEVENTF_MOVE | MOUSEEVENTF_ABSOLUTE;
    input.mi.dx = static_cast<LONG>((x * 65535LL) / (screenWidth - 1));
    input.mi.dy = static_cast<LONG>((y * 65535LL) / (screenHeight - 1));
    return send(input);
}

// 0 left, 1 right, 2 middle, 3 x1, 4 x2
bool button(long index, bool down) {
    INPUT input = {0};
    input.type = INPUT_MOUSE;
    switch (index) {
        case 0: input.mi.dwFlags = down ? MOUSEEVENTF_LEFTDOWN : MOUSEEVENTF_LEFTUP; break;
        case 1: input.mi.dwFlags = down ? MOUSEEVENTF_RIGHTDOWN : MOUSEEVENTF_RIGHTUP; break;
        case 2: input.mi.dwFlags = down ? MOUSEEVENTF_MIDDLEDOWN : MOUSEEVENTF_MIDDLEUP; break;
        case 3:
        case 4:
            input.mi.dwFlags = down ? MOUSEEVENTF_XDOWN : MOUSEEVENTF_XUP;
            input.mi.mouseData = index == 3 ? XBUTTON1 : XBUTTON2;
            break;
        default: return false;
    }
    if (!send(input)) return false;
    if (down) heldButtons.insert(index);
    else heldButtons.erase(index);
    return true;
}

bool scroll(int dx, int dy) {
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

bool isExtended(WORD vk) {
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

bool sendKey(WORD vk, bool down) {
    INPUT input = {0};
    input.type = INPUT_KEYBOARD;
    input.ki.wVk = 0;
    input.ki.wScan = static_cast<WORD>(MapVirtualKeyW(vk, MAPVK_VK_TO_VSC));
    input.ki.dwFlags = KEYEVENTF_SCANCODE;
    if (isExtended(vk)) input.ki.dwFlags |= KEYEVENTF_EXTENDEDKEY;
    if (!down) input.ki.dwFlags |= KEYEVENTF_KEYUP;
    return send(input);
}

bool key(WORD vk, bool down) {
    if (!sendKey(vk, down)) return false;
    if (down) heldKeys.insert(vk);
    else heldKeys.erase(vk);
    return true;
}

bool dispatch(const Step& step) {
    switch (step.kind) {
        case MOVE:
            return moveTo(step.x, step.y);
        case BUTTON_DOWN:
        case BUTTON_UP:
            return moveTo(step.x, step.y) && button(step.a, step.kind == BUTTON_DOWN);
        case SCROLL:
            return moveTo(step.x, step.y) && scroll(static_cast<int>(step.a), static_cast<int>(step.b));
        case KEY_DOWN:
        case KEY_UP:
            return key(static_cast<WORD>(step.a), step.kind == KEY_DOWN);
    }
    return false;
}

// release any keys still down to avoid stuck keys
void releaseHeld() {
    for (WORD vk : heldKeys) sendKey(vk, false);
    heldKeys.clear();
    std::set<long> buttons = heldButtons;
    for (long index : buttons) button(index, false);
    heldButtons.clear();
}

bool openBackend() {
    return true;
}

void closeBackend() {}

} // namespace
)";

const char* MAIN_LOOP = R"(
int main() {
    if (!openBackend()) return 2;
    std::printf("Replaying \"%s\": %zu events, %d loop(s)\n", MACRO_NAME, STEP_COUNT, LOOPS);

    auto deadline = std::chrono::steady_clock::now();
    bool ok = true;
    for (int loop = 0; ok && loop < LOOPS; ++loop) {
        long long previous = 0;
        for (size_t i = 0; i < STEP_COUNT; ++i) {
            const Step& step = STEPS[i];
            deadline += std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                std::chrono::duration<double, std::milli>(static_cast<double>(step.t - previous) / SPEED));
            previous = step.t;
            std::this_thread::sleep_until(deadline);

            if (step.kind == MOVE && !REPLAY_MOUSE_MOVES) continue;
            if (!dispatch(step)) {
                std::fprintf(stderr, "Error executing action %zu\n", i);
                ok = false;
                break;
            }
        }
    }

    releaseHeld();
    closeBackend();
    std::printf(ok ? "Playback completed!\n" : "Playback stopped.\n");
    return ok ? 0 : 1;
}
)";

} // namespace

const char* compileTargetName(CompileTarget target) {
    return target == CompileTarget::X11 ? "x11" : "win32";
}

CompileTarget compileTargetFromName(const std::string& name) {
    if (name == "x11") return CompileTarget::X11;
    if (name == "win32") return CompileTarget::WIN32_API;
    throw InvalidParameterError("unknown compile target \"" + name + "\" (expected x11 or win32)");
}

CompileTarget hostCompileTarget() {
#ifdef _WIN32
    return CompileTarget::WIN32_API;
#else
    return CompileTarget::X11;
#endif
}

std::string emitSource(const Macro& macro, const CompileOptions& options) {
    validatePlaybackParameters(options.speed, options.loops);
    if (macro.isEmpty()) throw EmptyMacroError();

    const bool x11 = options.target == CompileTarget::X11;
    std::ostringstream out;
    out << "// Replays the macro \"" << escapeLiteral(macro.getName()) << "\" ("
        << macro.getEventCount() << " events, recorded " << formatTimestamp(macro.getCreatedAt()) << ").\n"
        << "// Generated by macrorec. Build with:\n";
    if (x11) {
        out << "//   c++ -std=c++17 -O2 -o replay replay.cpp -lXtst -lX11\n"
            << "#include <X11/Xlib.h>\n"
            << "#include <X11/extensions/XTest.h>\n";
    } else {
        out << "//   cl /std:c++17 /EHsc replay.cpp user32.lib\n"
            << "#ifndef NOMINMAX\n#define NOMINMAX\n#endif\n"
            << "#include <windows.h>\n";
    }
    out << COMMON_HEAD;

    out << "const char* const MACRO_NAME = \"" << escapeLiteral(macro.getName()) << "\";\n"
        << "const double SPEED = " << std::setprecision(std::numeric_limits<double>::max_digits10)
        << std::showpoint << options.speed << std::noshowpoint << std::setprecision(6) << ";\n"
        << "const int LOOPS = " << options.loops << ";\n"
        << "const bool REPLAY_MOUSE_MOVES = " << (options.replayMouseMoves ? "true" : "false") << ";\n\n";

    emitSteps(out, macro, options.target);
    out << (x11 ? X11_RUNTIME : WIN32_RUNTIME) << MAIN_LOOP;
    return out.str();
}

fs::path compile(const Macro& macro, const fs::path& outputPath, const CompileOptions& options) {
    std::string source = emitSource(macro, options);

    fs::path sourcePath = options.build ? fs::path(outputPath.string() + ".cpp") : outputPath;
    std::error_code ec;
    if (sourcePath.has_parent_path()) {
        fs::create_directories(sourcePath.parent_path(), ec);
        if (ec) throw IOError("cannot create " + sourcePath.parent_path().string() + ": " + ec.message());
    }
    std::ofstream file(sourcePath, std::ios::out | std::ios::trunc);
    if (!file) throw IOError("cannot open " + sourcePath.string() + " for writing");
    file << source;
    file.close();
    if (!file) throw IOError("failed writing " + sourcePath.string());
    std::cout << "Replay program source written to: " << sourcePath.string() << std::endl;

    if (!options.build) return sourcePath;

    std::string command = options.cxx + " -std=c++17 -O2 -o " + shellQuote(outputPath.string()) + " " +
                          shellQuote(sourcePath.string());
    command += options.target == CompileTarget::X11 ? " -lXtst -lX11" : " -luser32";
    std::cout << "Building: " << command << std::endl;
    int status = std::system(command.c_str());
    if (status != 0) {
        throw IOError("build of " + outputPath.string() + " failed (status " + std::to_string(status) + ")");
    }
    std::cout << "Replay program built: " << outputPath.string() << std::endl;
    return outputPath;
}

} // namespace macrorec
