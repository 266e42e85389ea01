#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace macrorec {

// Every key a macro may contain. Macro files name keys by their canonical
// lower-case name (see keyName); nothing outside this table is accepted.
enum class Key : uint16_t {
    A, B, C, D, E, F, G, H, I, J, K, L, M,
    N, O, P, Q, R, S, T, U, V, W, X, Y, Z,
    DIGIT_0, DIGIT_1, DIGIT_2, DIGIT_3, DIGIT_4,
    DIGIT_5, DIGIT_6, DIGIT_7, DIGIT_8, DIGIT_9,
    F1, F2, F3, F4, F5, F6, F7, F8, F9, F10, F11, F12,
    F13, F14, F15, F16, F17, F18, F19, F20, F21, F22, F23, F24,
    SHIFT, SHIFT_R, CTRL, CTRL_R, ALT, ALT_R, ALT_GR, CMD, CMD_R,
    SPACE, ENTER, TAB, BACKSPACE, ESC, DEL, INSERT,
    HOME, END, PAGE_UP, PAGE_DOWN, UP, DOWN, LEFT, RIGHT,
    CAPS_LOCK, NUM_LOCK, SCROLL_LOCK, PRINT_SCREEN, PAUSE, MENU,
    MINUS, EQUAL, BRACKET_LEFT, BRACKET_RIGHT, BACKSLASH,
    SEMICOLON, APOSTROPHE, GRAVE, COMMA, PERIOD, SLASH,
    KP_0, KP_1, KP_2, KP_3, KP_4, KP_5, KP_6, KP_7, KP_8, KP_9,
    KP_MULTIPLY, KP_ADD, KP_SUBTRACT, KP_DECIMAL, KP_DIVIDE
};

struct KeyInfo {
    Key key;
    const char* name;
    uint16_t virtualKey;   // Win32 VK_* code
    uint32_t keysym;       // X11 keysym
};

// The full table, in declaration order of Key.
const std::vector<KeyInfo>& keyTable();

const char* keyName(Key key);

// Exact match on the canonical name. Unknown names yield nullopt.
std::optional<Key> keyFromName(std::string_view name);

uint16_t keyToVirtualKey(Key key);
uint32_t keyToKeysym(Key key);

std::optional<Key> keyFromVirtualKey(uint16_t vk);
std::optional<Key> keyFromKeysym(uint32_t keysym);

bool isModifier(Key key);

} // namespace macrorec
