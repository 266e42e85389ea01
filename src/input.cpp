#include "macrorec/input.hpp"

namespace macrorec {

bool KeyRepeatFilter::accept(uint32_t code, bool down) {
    size_t slot = code & 0xFF;
    bool repeat = down && held[slot];
    held[slot] = down;
    return !repeat;
}

} // namespace macrorec
