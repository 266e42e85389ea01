#include "macrorec/keys.hpp"

namespace macrorec {

namespace {

const std::vector<KeyInfo> KEY_TABLE = {
    {Key::A, "a", 0x41, 0x61}, {Key::B, "b", 0x42, 0x62}, {Key::C, "c", 0x43, 0x63},
    {Key::D, "d", 0x44, 0x64}, {Key::E, "e", 0x45, 0x65}, {Key::F, "f", 0x46, 0x66},
    {Key::G, "g", 0x47, 0x67}, {Key::H, "h", 0x48, 0x68}, {Key::I, "i", 0x49, 0x69},
    {Key::J, "j", 0x4A, 0x6a}, {Key::K, "k", 0x4B, 0x6b}, {Key::L, "l", 0x4C, 0x6c},
    {Key::M, "m", 0x4D, 0x6d}, {Key::N, "n", 0x4E, 0x6e}, {Key::O, "o", 0x4F, 0x6f},
    {Key::P, "p", 0x50, 0x70}, {Key::Q, "q", 0x51, 0x71}, {Key::R, "r", 0x52, 0x72},
    {Key::S, "s", 0x53, 0x73}, {Key::T, "t", 0x54, 0x74}, {Key::U, "u", 0x55, 0x75},
    {Key::V, "v", 0x56, 0x76}, {Key::W, "w", 0x57, 0x77}, {Key::X, "x", 0x58, 0x78},
    {Key::Y, "y", 0x59, 0x79}, {Key::Z, "z", 0x5A, 0x7a},

    {Key::DIGIT_0, "0", 0x30, 0x30}, {Key::DIGIT_1, "1", 0x31, 0x31},
    {Key::DIGIT_2, "2", 0x32, 0x32}, {Key::DIGIT_3, "3", 0x33, 0x33},
    {Key::DIGIT_4, "4", 0x34, 0x34}, {Key::DIGIT_5, "5", 0x35, 0x35},
    {Key::DIGIT_6, "6", 0x36, 0x36}, {Key::DIGIT_7, "7", 0x37, 0x37},
    {Key::DIGIT_8, "8", 0x38, 0x38}, {Key::DIGIT_9, "9", 0x39, 0x39},

    {Key::F1, "f1", 0x70, 0xffbe},   {Key::F2, "f2", 0x71, 0xffbf},
    {Key::F3, "f3", 0x72, 0xffc0},   {Key::F4, "f4", 0x73, 0xffc1},
    {Key::F5, "f5", 0x74, 0xffc2},   {Key::F6, "f6", 0x75, 0xffc3},
    {Key::F7, "f7", 0x76, 0xffc4},   {Key::F8, "f8", 0x77, 0xffc5},
    {Key::F9, "f9", 0x78, 0xffc6},   {Key::F10, "f10", 0x79, 0xffc7},
    {Key::F11, "f11", 0x7A, 0xffc8}, {Key::F12, "f12", 0x7B, 0xffc9},
    {Key::F13, "f13", 0x7C, 0xffca}, {Key::F14, "f14", 0x7D, 0xffcb},
    {Key::F15, "f15", 0x7E, 0xffcc}, {Key::F16, "f16", 0x7F, 0xffcd},
    {Key::F17, "f17", 0x80, 0xffce}, {Key::F18, "f18", 0x81, 0xffcf},
    {Key::F19, "f19", 0x82, 0xffd0}, {Key::F20, "f20", 0x83, 0xffd1},
    {Key::F21, "f21", 0x84, 0xffd2}, {Key::F22, "f22", 0x85, 0xffd3},
    {Key::F23, "f23", 0x86, 0xffd4}, {Key::F24, "f24", 0x87, 0xffd5},

    {Key::SHIFT, "shift", 0xA0, 0xffe1},
    {Key::SHIFT_R, "shift_r", 0xA1, 0xffe2},
    {Key::CTRL, "ctrl", 0xA2, 0xffe3},
    {Key::CTRL_R, "ctrl_r", 0xA3, 0xffe4},
    {Key::ALT, "alt", 0xA4, 0xffe9},
    {Key::ALT_R, "alt_r", 0xA5, 0xffea},
    {Key::ALT_GR, "alt_gr", 0xA5, 0xfe03},    // Windows reports AltGr as right Alt
    {Key::CMD, "cmd", 0x5B, 0xffeb},
    {Key::CMD_R, "cmd_r", 0x5C, 0xffec},

    {Key::SPACE, "space", 0x20, 0x0020},
    {Key::ENTER, "enter", 0x0D, 0xff0d},
    {Key::TAB, "tab", 0x09, 0xff09},
    {Key::BACKSPACE, "backspace", 0x08, 0xff08},
    {Key::ESC, "esc", 0x1B, 0xff1b},
    {Key::DEL, "delete", 0x2E, 0xffff},
    {Key::INSERT, "insert", 0x2D, 0xff63},
    {Key::HOME, "home", 0x24, 0xff50},
    {Key::END, "end", 0x23, 0xff57},
    {Key::PAGE_UP, "page_up", 0x21, 0xff55},
    {Key::PAGE_DOWN, "page_down", 0x22, 0xff56},
    {Key::UP, "up", 0x26, 0xff52},
    {Key::DOWN, "down", 0x28, 0xff54},
    {Key::LEFT, "left", 0x25, 0xff51},
    {Key::RIGHT, "right", 0x27, 0xff53},
    {Key::CAPS_LOCK, "caps_lock", 0x14, 0xffe5},
    {Key::NUM_LOCK, "num_lock", 0x90, 0xff7f},
    {Key::SCROLL_LOCK, "scroll_lock", 0x91, 0xff14},
    {Key::PRINT_SCREEN, "print_screen", 0x2C, 0xff61},
    {Key::PAUSE, "pause", 0x13, 0xff13},
    {Key::MENU, "menu", 0x5D, 0xff67},

    {Key::MINUS, "minus", 0xBD, 0x002d},
    {Key::EQUAL, "equal", 0xBB, 0x003d},
    {Key::BRACKET_LEFT, "bracketleft", 0xDB, 0x005b},
    {Key::BRACKET_RIGHT, "bracketright", 0xDD, 0x005d},
    {Key::BACKSLASH, "backslash", 0xDC, 0x005c},
    {Key::SEMICOLON, "semicolon", 0xBA, 0x003b},
    {Key::APOSTROPHE, "apostrophe", 0xDE, 0x0027},
    {Key::GRAVE, "grave", 0xC0, 0x0060},
    {Key::COMMA, "comma", 0xBC, 0x002c},
    {Key::PERIOD, "period", 0xBE, 0x002e},
    {Key::SLASH, "slash", 0xBF, 0x002f},

    {Key::KP_0, "kp_0", 0x60, 0xffb0}, {Key::KP_1, "kp_1", 0x61, 0xffb1},
    {Key::KP_2, "kp_2", 0x62, 0xffb2}, {Key::KP_3, "kp_3", 0x63, 0xffb3},
    {Key::KP_4, "kp_4", 0x64, 0xffb4}, {Key::KP_5, "kp_5", 0x65, 0xffb5},
    {Key::KP_6, "kp_6", 0x66, 0xffb6}, {Key::KP_7, "kp_7", 0x67, 0xffb7},
    {Key::KP_8, "kp_8", 0x68, 0xffb8}, {Key::KP_9, "kp_9", 0x69, 0xffb9},
    {Key::KP_MULTIPLY, "kp_multiply", 0x6A, 0xffaa},
    {Key::KP_ADD, "kp_add", 0x6B, 0xffab},
    {Key::KP_SUBTRACT, "kp_subtract", 0x6D, 0xffad},
    {Key::KP_DECIMAL, "kp_decimal", 0x6E, 0xffae},
    {Key::KP_DIVIDE, "kp_divide", 0x6F, 0xffaf},
};

const KeyInfo& infoFor(Key key) {
    // the table is laid out in enum order
    return KEY_TABLE[static_cast<size_t>(key)];
}

} // namespace

const std::vector<KeyInfo>& keyTable() {
    return KEY_TABLE;
}

const char* keyName(Key key) {
    return infoFor(key).name;
}

std::optional<Key> keyFromName(std::string_view name) {
    for (const auto& info : KEY_TABLE) {
        if (name == info.name) return info.key;
    }
    return std::nullopt;
}

uint16_t keyToVirtualKey(Key key) {
    return infoFor(key).virtualKey;
}

uint32_t keyToKeysym(Key key) {
    return infoFor(key).keysym;
}

std::optional<Key> keyFromVirtualKey(uint16_t vk) {
    // generic modifier codes map onto the left-hand key
    if (vk == 0x10) return Key::SHIFT;
    if (vk == 0x11) return Key::CTRL;
    if (vk == 0x12) return Key::ALT;
    for (const auto& info : KEY_TABLE) {
        if (info.virtualKey == vk) return info.key;
    }
    return std::nullopt;
}

std::optional<Key> keyFromKeysym(uint32_t keysym) {
    // upper-case letters report the same key as lower-case
    if (keysym >= 0x41 && keysym <= 0x5a) keysym += 0x20;
    for (const auto& info : KEY_TABLE) {
        if (info.keysym == keysym) return info.key;
    }
    return std::nullopt;
}

bool isModifier(Key key) {
    switch (key) {
        case Key::SHIFT:
        case Key::SHIFT_R:
        case Key::CTRL:
        case Key::CTRL_R:
        case Key::ALT:
        case Key::ALT_R:
        case Key::ALT_GR:
        case Key::CMD:
        case Key::CMD_R:
            return true;
        default:
            return false;
    }
}

} // namespace macrorec
