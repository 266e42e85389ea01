#include "macrorec/settings.hpp"
#include "macrorec/errors.hpp"

#include <fstream>
#include <iostream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace macrorec {

namespace {

std::chrono::milliseconds readMillis(const json& doc, const char* field) {
    return std::chrono::milliseconds(doc.at(field).get<int64_t>());
}

} // namespace

void validateSettings(const Settings& settings) {
    validatePlaybackParameters(settings.speed, settings.loops);
    if (settings.recordingsDir.empty()) throw InvalidParameterError("recordings_dir must not be empty");
    if (settings.mouseMoveThreshold < 0) throw InvalidParameterError("mouse_move_threshold must not be negative");
    if (settings.mouseMoveMinInterval.count() < 0) {
        throw InvalidParameterError("mouse_move_min_interval_ms must not be negative");
    }
    if (settings.startDelay.count() < 0) throw InvalidParameterError("start_delay_ms must not be negative");
    if (settings.loopGap.count() < 0) throw InvalidParameterError("loop_gap_ms must not be negative");
    if (settings.pollTick.count() <= 0) throw InvalidParameterError("poll_tick_ms must be positive");
    if (settings.startDelay > MAX_EVENT_OFFSET || settings.loopGap > MAX_EVENT_OFFSET ||
        settings.pollTick > MAX_EVENT_OFFSET || settings.mouseMoveMinInterval > MAX_EVENT_OFFSET) {
        throw InvalidParameterError("durations must be at most " + std::to_string(MAX_EVENT_OFFSET.count()) + " ms");
    }
}

Settings settingsFromJson(const json& doc) {
    if (!doc.is_object()) throw InvalidParameterError("settings must be a JSON object");

    Settings settings;
    try {
        if (doc.contains("recordings_dir")) settings.recordingsDir = doc.at("recordings_dir").get<std::string>();
        if (doc.contains("record_mouse_moves")) settings.recordMouseMoves = doc.at("record_mouse_moves").get<bool>();
        if (doc.contains("mouse_move_threshold")) settings.mouseMoveThreshold = doc.at("mouse_move_threshold").get<int>();
        if (doc.contains("mouse_move_min_interval_ms")) {
            settings.mouseMoveMinInterval = readMillis(doc, "mouse_move_min_interval_ms");
        }
        if (doc.contains("replay_mouse_moves")) settings.replayMouseMoves = doc.at("replay_mouse_moves").get<bool>();
        if (doc.contains("speed")) settings.speed = doc.at("speed").get<double>();
        if (doc.contains("loops")) settings.loops = doc.at("loops").get<int>();
        if (doc.contains("start_delay_ms")) settings.startDelay = readMillis(doc, "start_delay_ms");
        if (doc.contains("loop_gap_ms")) settings.loopGap = readMillis(doc, "loop_gap_ms");
        if (doc.contains("poll_tick_ms")) settings.pollTick = readMillis(doc, "poll_tick_ms");
        if (doc.contains("stop_key")) {
            std::string name = doc.at("stop_key").get<std::string>();
            auto key = keyFromName(name);
            if (!key) throw InvalidParameterError("stop_key \"" + name + "\" is not a known key");
            settings.stopKey = *key;
        }
    } catch (const json::exception& e) {
        throw InvalidParameterError(std::string("bad settings value: ") + e.what());
    }

    validateSettings(settings);
    return settings;
}

json settingsToJson(const Settings& settings) {
    json j;
    j["recordings_dir"] = settings.recordingsDir.string();
    j["record_mouse_moves"] = settings.recordMouseMoves;
    j["mouse_move_threshold"] = settings.mouseMoveThreshold;
    j["mouse_move_min_interval_ms"] = settings.mouseMoveMinInterval.count();
    j["replay_mouse_moves"] = settings.replayMouseMoves;
    j["speed"] = settings.speed;
    j["loops"] = settings.loops;
    j["start_delay_ms"] = settings.startDelay.count();
    j["loop_gap_ms"] = settings.loopGap.count();
    j["poll_tick_ms"] = settings.pollTick.count();
    j["stop_key"] = keyName(settings.stopKey);
    return j;
}

Settings loadSettings(const fs::path& path) {
    std::ifstream file(path);
    if (!file) throw IOError("cannot open settings file " + path.string());

    json doc;
    try {
        doc = json::parse(file);
    } catch (const json::exception& e) {
        throw InvalidParameterError(path.string() + " is not valid JSON: " + e.what());
    }
    Settings settings = settingsFromJson(doc);
    std::cout << "Loaded settings from: " << path.string() << std::endl;
    return settings;
}

void saveSettings(const Settings& settings, const fs::path& path) {
    validateSettings(settings);

    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) throw IOError("cannot create " + path.parent_path().string() + ": " + ec.message());
    }
    std::ofstream file(path, std::ios::out | std::ios::trunc);
    if (!file) throw IOError("cannot open " + path.string() + " for writing");
    file << settingsToJson(settings).dump(2) << '\n';
    file.close();
    if (!file) throw IOError("failed writing " + path.string());
}

RecorderOptions toRecorderOptions(const Settings& settings) {
    RecorderOptions options;
    options.recordMouseMoves = settings.recordMouseMoves;
    options.mouseMoveThreshold = settings.mouseMoveThreshold;
    options.mouseMoveMinInterval = settings.mouseMoveMinInterval;
    options.excludedKeys.push_back(settings.stopKey);
    return options;
}

PlaybackOptions toPlaybackOptions(const Settings& settings) {
    PlaybackOptions options;
    options.speed = settings.speed;
    options.loops = settings.loops;
    options.replayMouseMoves = settings.replayMouseMoves;
    options.startDelay = settings.startDelay;
    options.loopGap = settings.loopGap;
    options.pollTick = settings.pollTick;
    return options;
}

} // namespace macrorec
