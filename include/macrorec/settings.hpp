#pragma once

#include "macrorec/keys.hpp"
#include "macrorec/player.hpp"
#include "macrorec/recorder.hpp"

#include <chrono>
#include <filesystem>

#include <nlohmann/json.hpp>

namespace macrorec {

// -------------------------- TUNABLE PARAMETERS --------------------------
struct Settings {
    std::filesystem::path recordingsDir = "recordings";

    bool recordMouseMoves = true;
    int mouseMoveThreshold = 5;                          // px on either axis
    std::chrono::milliseconds mouseMoveMinInterval{0};

    bool replayMouseMoves = true;
    double speed = 1.0;
    int loops = 1;
    std::chrono::milliseconds startDelay{0};
    std::chrono::milliseconds loopGap{0};
    std::chrono::milliseconds pollTick{10};

    Key stopKey = Key::F9;                               // ends recording and playback
};
// ----------------------------------------------------------------------

// Overlays the fields present in the file on the defaults.
// Throws IOError when the file cannot be read and InvalidParameterError
// when it is not JSON or a value is out of range.
Settings loadSettings(const std::filesystem::path& path);
void saveSettings(const Settings& settings, const std::filesystem::path& path);

Settings settingsFromJson(const nlohmann::json& doc);
nlohmann::json settingsToJson(const Settings& settings);

void validateSettings(const Settings& settings);

// The stop key is added to the excluded keys so it never lands in a macro.
RecorderOptions toRecorderOptions(const Settings& settings);
PlaybackOptions toPlaybackOptions(const Settings& settings);

} // namespace macrorec
