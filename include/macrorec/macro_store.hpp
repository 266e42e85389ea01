#pragma once

#include "macrorec/macro.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace macrorec {

constexpr int MACRO_FORMAT_VERSION = 1;

// Writes the macro as a JSON document, creating parent directories.
// Throws IOError when the file cannot be written.
void saveMacro(const Macro& macro, const std::filesystem::path& path);

// Throws IOError when the file cannot be read and MalformedMacroError when
// its content is not a valid macro. Nothing in the file is ever evaluated.
Macro loadMacro(const std::filesystem::path& path);

nlohmann::json macroToJson(const Macro& macro);

// Accepts the current object format and the bare-array format of older
// recordings (format version 0). fallbackName names version 0 macros,
// which carry no name of their own.
Macro macroFromJson(const nlohmann::json& doc, const std::string& fallbackName = "imported");

std::string serializeMacro(const Macro& macro);
Macro parseMacro(const std::string& text);

// ISO-8601 UTC with milliseconds, e.g. 2026-10-19T10:15:00.123Z
std::string formatTimestamp(Macro::TimePoint time);
std::optional<Macro::TimePoint> parseTimestamp(const std::string& text);

// *.json files in dir, sorted by name. Empty when dir does not exist.
std::vector<std::filesystem::path> listRecordings(const std::filesystem::path& dir);

std::filesystem::path defaultRecordingPath(const std::filesystem::path& dir, const Macro& macro);

} // namespace macrorec
