#include "macrorec/recorder.hpp"
#include "macrorec/errors.hpp"

#include <algorithm>
#include <cstdlib>
#include <iostream>

namespace macrorec {

Recorder::Recorder(InputCapture& capture, RecorderOptions options)
    : capture(capture) {
    setOptions(std::move(options));
}

Recorder::~Recorder() {
    if (recording) {
        recording = false;
        capture.stop();
    }
}

void Recorder::start() {
    if (recording) throw AlreadyRecordingError();

    SessionGuard guard = SessionGuard::acquire(SessionKind::RECORDING);
    {
        std::lock_guard<std::mutex> lk(eventsMutex);
        events.clear();
        haveLastMove = false;
        lastMoveOffset = std::chrono::milliseconds{0};
        startTime = std::chrono::steady_clock::now();
        createdAt = std::chrono::time_point_cast<std::chrono::milliseconds>(Macro::Clock::now());
    }

    recording = true;
    try {
        capture.start([this](const RawInput& raw) { onEvent(raw); });
    } catch (const std::exception& e) {
        recording = false;
        std::cerr << "Could not start input capture: " << e.what() << std::endl;
        throw;
    }
    session = std::move(guard);
    std::cout << "Recording started!" << std::endl;
}

void Recorder::onEvent(const RawInput& raw) {
    if (!recording) return;

    Observer notify;
    {
        std::lock_guard<std::mutex> lk(eventsMutex);
        notify = observer;
    }
    if (notify) notify(raw);

    // our own playback (or another injector) must never feed back into the macro
    if (raw.injected) return;

    auto offset = elapsed();

    std::lock_guard<std::mutex> lk(eventsMutex);
    if (!recording) return;
    if (!events.empty() && offset < events.back().offset) offset = events.back().offset;
    if (offset > MAX_EVENT_OFFSET) return;

    switch (raw.kind) {
        case EventKind::MOUSE_MOVE:
            if (!options.recordMouseMoves) return;
            if (!acceptMove(raw.x, raw.y, offset)) return;
            events.push_back(Event::mouseMove(offset, raw.x, raw.y));
            break;

        case EventKind::MOUSE_DOWN:
        case EventKind::MOUSE_UP:
            events.push_back(Event::mouseButton(offset, raw.x, raw.y, raw.button,
                                                raw.kind == EventKind::MOUSE_DOWN));
            break;

        case EventKind::MOUSE_SCROLL:
            events.push_back(Event::mouseScroll(offset, raw.x, raw.y, raw.scrollDx, raw.scrollDy));
            break;

        case EventKind::KEY_DOWN:
        case EventKind::KEY_UP:
            if (!raw.key) {
                std::cerr << "Ignoring key with no symbol table entry (code 0x"
                          << std::hex << raw.platformCode << std::dec << ")" << std::endl;
                return;
            }
            if (isExcluded(*raw.key)) return;
            events.push_back(Event::keyEvent(offset, *raw.key, raw.kind == EventKind::KEY_DOWN));
            break;
    }
}

Macro Recorder::stop() {
    if (!recording) throw NotRecordingError();

    recording = false;
    capture.stop();

    std::vector<Event> captured;
    {
        std::lock_guard<std::mutex> lk(eventsMutex);
        captured.swap(events);
    }
    session.release();

    std::string name = options.name.empty() ? defaultMacroName(createdAt) : options.name;
    std::cout << "Recording stopped! Captured " << captured.size() << " events." << std::endl;
    return Macro(std::move(name), createdAt, std::move(captured));
}

size_t Recorder::getEventCount() const {
    std::lock_guard<std::mutex> lk(eventsMutex);
    return events.size();
}

void Recorder::setOptions(RecorderOptions newOptions) {
    if (recording) throw AlreadyRecordingError("cannot change recorder options while recording");
    if (newOptions.mouseMoveThreshold < 0) {
        throw InvalidParameterError("mouse move threshold must not be negative");
    }
    if (newOptions.mouseMoveMinInterval.count() < 0) {
        throw InvalidParameterError("mouse move interval must not be negative");
    }
    options = std::move(newOptions);
}

void Recorder::setObserver(Observer newObserver) {
    std::lock_guard<std::mutex> lk(eventsMutex);
    observer = std::move(newObserver);
}

std::chrono::milliseconds Recorder::elapsed() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - startTime);
}

bool Recorder::acceptMove(int x, int y, std::chrono::milliseconds offset) {
    if (haveLastMove) {
        int travelled = std::max(std::abs(x - lastMoveX), std::abs(y - lastMoveY));
        if (travelled < options.mouseMoveThreshold) return false;
        if (offset - lastMoveOffset < options.mouseMoveMinInterval) return false;
    }
    haveLastMove = true;
    lastMoveX = x;
    lastMoveY = y;
    lastMoveOffset = offset;
    return true;
}

bool Recorder::isExcluded(Key key) const {
    return std::find(options.excludedKeys.begin(), options.excludedKeys.end(), key)
           != options.excludedKeys.end();
}

} // namespace macrorec
