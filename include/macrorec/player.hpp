#pragma once

#include "macrorec/input.hpp"
#include "macrorec/macro.hpp"
#include "macrorec/session.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace macrorec {

constexpr double MIN_SPEED = 0.1;
constexpr double MAX_SPEED = 5.0;
constexpr int MIN_LOOPS = 1;
constexpr int MAX_LOOPS = 999;

// Throws InvalidParameterError unless speed is in [0.1, 5.0] and loops in [1, 999].
void validatePlaybackParameters(double speed, int loops);

enum class PlayerState {
    IDLE,
    PLAYING,
    PAUSED,
    STOPPED,
    COMPLETED
};

const char* playerStateName(PlayerState state);

struct PlaybackOptions {
    double speed = 1.0;
    int loops = 1;
    bool replayMouseMoves = true;   // skipped moves still take their time
    std::chrono::milliseconds startDelay{0};
    std::chrono::milliseconds loopGap{0};
    // Upper bound on how long pause()/stop() wait for the worker to notice.
    std::chrono::milliseconds pollTick{10};
};

struct PlaybackStatus {
    PlayerState state = PlayerState::IDLE;
    size_t cursor = 0;        // events handled in the current loop
    size_t totalEvents = 0;
    int loopIndex = 0;
    int loopCount = 0;
    double speed = 1.0;
};

// Replays one macro at a time on a worker thread. All synthesis happens on
// that thread; the control thread only flips state and waits.
class Player {
public:
    using ProgressCallback = std::function<void(size_t cursor, size_t total, int loopIndex, int loopCount)>;

    explicit Player(InputSynthesizer& synth);
    ~Player();

    Player(const Player&) = delete;
    Player& operator=(const Player&) = delete;

    // The macro's events are copied; the caller may drop it afterwards.
    void play(const Macro& macro, const PlaybackOptions& options = {});
    void pause();
    void resume();
    void stop();
    // Asks a running session to stop without waiting for the worker. Returns
    // false when nothing was playing. Safe from input-hook callbacks, where
    // stop() would block the thread the worker's final releases go through.
    bool requestStop();

    // Blocks until the session is STOPPED or COMPLETED and returns that state.
    PlayerState wait();

    PlayerState getState() const;
    PlaybackStatus getStatus() const;
    std::string getLastError() const;

    // Called on the worker thread after every handled event. Must not call wait().
    void setProgressCallback(ProgressCallback callback);

private:
    using SteadyClock = std::chrono::steady_clock;

    void run();
    bool waitUntil(SteadyClock::time_point& deadline);
    bool dispatch(const Event& event);
    void releaseHeld();

    InputSynthesizer& synth;

    mutable std::mutex stateMutex;
    std::condition_variable stateChanged;
    PlayerState state = PlayerState::IDLE;
    std::atomic<bool> cancelRequested{false};
    SteadyClock::time_point pausedAt;
    SteadyClock::duration pausedTotal{0};

    std::vector<Event> events;
    PlaybackOptions options;
    size_t cursor = 0;
    int loopIndex = 0;
    std::string lastError;
    ProgressCallback progress;

    // worker-thread only
    std::set<Key> heldKeys;
    std::set<MouseButton> heldButtons;
    int pointerX = 0, pointerY = 0;

    SessionGuard session;
    std::thread worker;
};

} // namespace macrorec
