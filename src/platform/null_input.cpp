#include "macrorec/errors.hpp"
#include "macrorec/input.hpp"

namespace macrorec {

// Built when neither X11 with XTest nor Win32 is available.
std::unique_ptr<InputCapture> createSystemCapture() {
    throw PermissionError("no input capture backend available in this build");
}

std::unique_ptr<InputSynthesizer> createSystemSynthesizer() {
    throw PermissionError("no input synthesis backend available in this build");
}

} // namespace macrorec
