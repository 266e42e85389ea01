#pragma once

#include "macrorec/macro.hpp"

#include <filesystem>
#include <string>

namespace macrorec {

enum class CompileTarget {
    X11,
    WIN32_API
};

const char* compileTargetName(CompileTarget target);
// "x11" or "win32"; throws InvalidParameterError otherwise.
CompileTarget compileTargetFromName(const std::string& name);
CompileTarget hostCompileTarget();

struct CompileOptions {
    CompileTarget target = hostCompileTarget();
    double speed = 1.0;
    int loops = 1;
    bool replayMouseMoves = true;
    // When set, compile() writes <output>.cpp and runs cxx on it to produce output.
    bool build = false;
    std::string cxx = "c++";
};

// C++17 source of a program that replays the macro on its own. The events
// are embedded as static data; the program needs no macro file at runtime.
std::string emitSource(const Macro& macro, const CompileOptions& options = {});

// Throws InvalidParameterError for bad speed/loops, EmptyMacroError for an
// empty macro and IOError when the source cannot be written or the build fails.
// Returns the path of the produced artifact.
std::filesystem::path compile(const Macro& macro, const std::filesystem::path& outputPath,
                              const CompileOptions& options = {});

} // namespace macrorec
