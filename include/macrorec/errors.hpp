#pragma once

#include <stdexcept>
#include <string>

namespace macrorec {

// Root of every error the core raises. Front-ends may catch this or std::exception.
class MacroError : public std::runtime_error {
public:
    explicit MacroError(const std::string& what) : std::runtime_error(what) {}
};

class AlreadyRecordingError : public MacroError {
public:
    explicit AlreadyRecordingError(const std::string& what = "a recording session is already active")
        : MacroError(what) {}
};

class NotRecordingError : public MacroError {
public:
    explicit NotRecordingError(const std::string& what = "no recording session is active")
        : MacroError(what) {}
};

class AlreadyPlayingError : public MacroError {
public:
    explicit AlreadyPlayingError(const std::string& what = "a playback session is already active")
        : MacroError(what) {}
};

class InvalidParameterError : public MacroError {
public:
    explicit InvalidParameterError(const std::string& what) : MacroError(what) {}
};

class EmptyMacroError : public MacroError {
public:
    explicit EmptyMacroError(const std::string& what = "macro has no events")
        : MacroError(what) {}
};

class MalformedMacroError : public MacroError {
public:
    explicit MalformedMacroError(const std::string& what) : MacroError(what) {}
};

class IOError : public MacroError {
public:
    explicit IOError(const std::string& what) : MacroError(what) {}
};

class PermissionError : public MacroError {
public:
    explicit PermissionError(const std::string& what) : MacroError(what) {}
};

// pause()/resume()/stop() called outside the states they are valid in
class InvalidStateError : public MacroError {
public:
    explicit InvalidStateError(const std::string& what) : MacroError(what) {}
};

} // namespace macrorec
