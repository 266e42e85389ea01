#pragma once

#include "macrorec/input.hpp"
#include "macrorec/macro.hpp"
#include "macrorec/session.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace macrorec {

struct RecorderOptions {
    bool recordMouseMoves = true;
    // A move is kept only once the pointer travelled this many pixels on
    // either axis since the last kept move ...
    int mouseMoveThreshold = 5;
    // ... and at least this long after it.
    std::chrono::milliseconds mouseMoveMinInterval{0};
    // Keys the front-end uses as hotkeys; they never end up in the macro.
    std::vector<Key> excludedKeys;
    // Empty means recording_YYYYMMDD_HHMMSS.
    std::string name;
};

class Recorder {
public:
    // Sees every notification the capture delivers while recording, before filtering.
    using Observer = std::function<void(const RawInput&)>;

    explicit Recorder(InputCapture& capture, RecorderOptions options = {});
    ~Recorder();

    Recorder(const Recorder&) = delete;
    Recorder& operator=(const Recorder&) = delete;

    void start();
    void onEvent(const RawInput& raw);
    Macro stop();

    bool isRecording() const { return recording; }
    size_t getEventCount() const;

    // Only while idle; throws AlreadyRecordingError otherwise.
    void setOptions(RecorderOptions newOptions);
    const RecorderOptions& getOptions() const { return options; }

    void setObserver(Observer newObserver);

private:
    std::chrono::milliseconds elapsed() const;
    bool acceptMove(int x, int y, std::chrono::milliseconds offset);
    bool isExcluded(Key key) const;

    InputCapture& capture;
    RecorderOptions options;
    Observer observer;

    std::atomic<bool> recording{false};
    SessionGuard session;

    mutable std::mutex eventsMutex;
    std::vector<Event> events;
    std::chrono::steady_clock::time_point startTime;
    Macro::TimePoint createdAt{};

    bool haveLastMove = false;
    int lastMoveX = 0, lastMoveY = 0;
    std::chrono::milliseconds lastMoveOffset{0};
};

} // namespace macrorec
