#pragma once

#include "macrorec/errors.hpp"
#include "macrorec/input.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

// Capture that only delivers what the test emits.
class FakeCapture : public macrorec::InputCapture {
public:
    void start(Sink newSink) override {
        if (failStart) throw macrorec::PermissionError("capture denied");
        std::lock_guard<std::mutex> lk(mutex);
        sink = std::move(newSink);
        running = true;
        ++starts;
    }

    void stop() override {
        std::lock_guard<std::mutex> lk(mutex);
        sink = nullptr;
        running = false;
        ++stops;
    }

    bool active() const override { return running; }

    void emit(const macrorec::RawInput& raw) {
        Sink target;
        {
            std::lock_guard<std::mutex> lk(mutex);
            if (!running) return;
            target = sink;
        }
        target(raw);
    }

    void move(int x, int y, bool injected = false) {
        macrorec::RawInput raw;
        raw.kind = macrorec::EventKind::MOUSE_MOVE;
        raw.x = x;
        raw.y = y;
        raw.injected = injected;
        emit(raw);
    }

    void key(macrorec::Key key, bool down, bool injected = false) {
        macrorec::RawInput raw;
        raw.kind = down ? macrorec::EventKind::KEY_DOWN : macrorec::EventKind::KEY_UP;
        raw.key = key;
        raw.injected = injected;
        emit(raw);
    }

    void unknownKey(uint32_t code) {
        macrorec::RawInput raw;
        raw.kind = macrorec::EventKind::KEY_DOWN;
        raw.platformCode = code;
        emit(raw);
    }

    void click(int x, int y, macrorec::MouseButton button, bool down) {
        macrorec::RawInput raw;
        raw.kind = down ? macrorec::EventKind::MOUSE_DOWN : macrorec::EventKind::MOUSE_UP;
        raw.x = x;
        raw.y = y;
        raw.button = button;
        emit(raw);
    }

    void wheel(int x, int y, int dx, int dy) {
        macrorec::RawInput raw;
        raw.kind = macrorec::EventKind::MOUSE_SCROLL;
        raw.x = x;
        raw.y = y;
        raw.scrollDx = dx;
        raw.scrollDy = dy;
        emit(raw);
    }

    bool failStart = false;
    int starts = 0;
    int stops = 0;

private:
    mutable std::mutex mutex;
    Sink sink;
    std::atomic<bool> running{false};
};

// Synthesizer that records every action with the time it was requested.
class FakeSynthesizer : public macrorec::InputSynthesizer {
public:
    enum class ActionType {
        MOVE,
        BUTTON,
        SCROLL,
        KEY
    };

    struct Action {
        ActionType type;
        bool down = false;
        macrorec::Key key = macrorec::Key::A;
        macrorec::MouseButton button = macrorec::MouseButton::LEFT;
        int x = 0, y = 0;
        int dx = 0, dy = 0;
        std::chrono::steady_clock::time_point at;
    };

    void acquire() override {
        if (failAcquire) throw macrorec::PermissionError("synthesis denied");
        acquired = true;
        ++acquires;
    }

    void release() override {
        acquired = false;
        ++releases;
    }

    bool moveTo(int x, int y) override {
        Action action{ActionType::MOVE};
        action.x = x;
        action.y = y;
        return record(action);
    }

    bool button(macrorec::MouseButton button, bool down, int x, int y) override {
        Action action{ActionType::BUTTON};
        action.button = button;
        action.down = down;
        action.x = x;
        action.y = y;
        return record(action);
    }

    bool scroll(int dx, int dy, int x, int y) override {
        Action action{ActionType::SCROLL};
        action.dx = dx;
        action.dy = dy;
        action.x = x;
        action.y = y;
        return record(action);
    }

    bool key(macrorec::Key key, bool down) override {
        Action action{ActionType::KEY};
        action.key = key;
        action.down = down;
        return record(action);
    }

    std::vector<Action> getActions() const {
        std::lock_guard<std::mutex> lk(mutex);
        return actions;
    }

    size_t count(ActionType type, bool down) const {
        std::lock_guard<std::mutex> lk(mutex);
        size_t n = 0;
        for (const auto& action : actions) {
            if (action.type == type && action.down == down) ++n;
        }
        return n;
    }

    bool failAcquire = false;
    // Time every action takes, as a slow display server would.
    std::chrono::milliseconds actionDelay{0};
    // Index of the one action to reject; negative never rejects.
    int failAt = -1;
    std::atomic<bool> acquired{false};
    std::atomic<int> acquires{0};
    std::atomic<int> releases{0};

private:
    bool record(Action action) {
        if (actionDelay.count() > 0) std::this_thread::sleep_for(actionDelay);
        std::lock_guard<std::mutex> lk(mutex);
        action.at = std::chrono::steady_clock::now();
        bool reject = static_cast<int>(attempts) == failAt;
        ++attempts;
        if (reject) return false;
        actions.push_back(action);
        return true;
    }

    mutable std::mutex mutex;
    std::vector<Action> actions;
    size_t attempts = 0;
};
