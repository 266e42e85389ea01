#include "macrorec/player.hpp"
#include "macrorec/errors.hpp"

#include <algorithm>
#include <iostream>
#include <sstream>

namespace macrorec {

void validatePlaybackParameters(double speed, int loops) {
    if (!(speed >= MIN_SPEED && speed <= MAX_SPEED)) {
        std::ostringstream ss;
        ss << "speed factor " << speed << " is outside [" << MIN_SPEED << ", " << MAX_SPEED << "]";
        throw InvalidParameterError(ss.str());
    }
    if (loops < MIN_LOOPS || loops > MAX_LOOPS) {
        throw InvalidParameterError("loop count " + std::to_string(loops) + " is outside [" +
                                    std::to_string(MIN_LOOPS) + ", " + std::to_string(MAX_LOOPS) + "]");
    }
}

const char* playerStateName(PlayerState state) {
    switch (state) {
        case PlayerState::IDLE:      return "idle";
        case PlayerState::PLAYING:   return "playing";
        case PlayerState::PAUSED:    return "paused";
        case PlayerState::STOPPED:   return "stopped";
        case PlayerState::COMPLETED: return "completed";
    }
    return "unknown";
}

Player::Player(InputSynthesizer& synth) : synth(synth) {}

Player::~Player() {
    {
        std::lock_guard<std::mutex> lk(stateMutex);
        cancelRequested = true;
    }
    stateChanged.notify_all();
    if (worker.joinable()) worker.join();
}

void Player::play(const Macro& macro, const PlaybackOptions& playOptions) {
    {
        std::lock_guard<std::mutex> lk(stateMutex);
        if (state == PlayerState::PLAYING || state == PlayerState::PAUSED) throw AlreadyPlayingError();
    }
    validatePlaybackParameters(playOptions.speed, playOptions.loops);
    if (playOptions.pollTick.count() <= 0 || playOptions.pollTick > MAX_EVENT_OFFSET) {
        throw InvalidParameterError("poll tick must be positive and at most " +
                                    std::to_string(MAX_EVENT_OFFSET.count()) + " ms");
    }
    if (playOptions.startDelay.count() < 0 || playOptions.loopGap.count() < 0) {
        throw InvalidParameterError("start delay and loop gap must not be negative");
    }
    if (playOptions.startDelay > MAX_EVENT_OFFSET || playOptions.loopGap > MAX_EVENT_OFFSET) {
        throw InvalidParameterError("start delay and loop gap must be at most " +
                                    std::to_string(MAX_EVENT_OFFSET.count()) + " ms");
    }
    if (macro.isEmpty()) throw EmptyMacroError();

    // the previous session already finished; collect its thread
    if (worker.joinable()) worker.join();

    SessionGuard guard = SessionGuard::acquire(SessionKind::PLAYBACK);
    synth.acquire();

    {
        std::lock_guard<std::mutex> lk(stateMutex);
        events = macro.getEvents();
        options = playOptions;
        cursor = 0;
        loopIndex = 0;
        lastError.clear();
        pausedTotal = SteadyClock::duration{0};
        cancelRequested = false;
        state = PlayerState::PLAYING;
    }
    heldKeys.clear();
    heldButtons.clear();
    session = std::move(guard);

    std::cout << "Playing \"" << macro.getName() << "\": " << events.size() << " events, speed "
              << options.speed << "x, " << options.loops << " loop(s)" << std::endl;
    worker = std::thread(&Player::run, this);
}

void Player::pause() {
    {
        std::lock_guard<std::mutex> lk(stateMutex);
        if (state != PlayerState::PLAYING) {
            throw InvalidStateError(std::string("cannot pause while ") + playerStateName(state));
        }
        state = PlayerState::PAUSED;
        pausedAt = SteadyClock::now();
    }
    stateChanged.notify_all();
}

void Player::resume() {
    {
        std::lock_guard<std::mutex> lk(stateMutex);
        if (state != PlayerState::PAUSED) {
            throw InvalidStateError(std::string("cannot resume while ") + playerStateName(state));
        }
        pausedTotal += SteadyClock::now() - pausedAt;
        state = PlayerState::PLAYING;
    }
    stateChanged.notify_all();
}

void Player::stop() {
    {
        std::lock_guard<std::mutex> lk(stateMutex);
        if (state != PlayerState::PLAYING && state != PlayerState::PAUSED) {
            throw InvalidStateError(std::string("cannot stop while ") + playerStateName(state));
        }
        cancelRequested = true;
    }
    stateChanged.notify_all();
    // from a progress callback the worker unwinds on its own
    if (worker.joinable() && worker.get_id() != std::this_thread::get_id()) worker.join();
}

bool Player::requestStop() {
    {
        std::lock_guard<std::mutex> lk(stateMutex);
        if (state != PlayerState::PLAYING && state != PlayerState::PAUSED) return false;
        cancelRequested = true;
    }
    stateChanged.notify_all();
    return true;
}

PlayerState Player::wait() {
    std::unique_lock<std::mutex> lk(stateMutex);
    stateChanged.wait(lk, [this] {
        return state != PlayerState::PLAYING && state != PlayerState::PAUSED;
    });
    return state;
}

PlayerState Player::getState() const {
    std::lock_guard<std::mutex> lk(stateMutex);
    return state;
}

PlaybackStatus Player::getStatus() const {
    std::lock_guard<std::mutex> lk(stateMutex);
    PlaybackStatus status;
    status.state = state;
    status.cursor = cursor;
    status.totalEvents = events.size();
    status.loopIndex = loopIndex;
    status.loopCount = options.loops;
    status.speed = options.speed;
    return status;
}

std::string Player::getLastError() const {
    std::lock_guard<std::mutex> lk(stateMutex);
    return lastError;
}

void Player::setProgressCallback(ProgressCallback callback) {
    std::lock_guard<std::mutex> lk(stateMutex);
    progress = std::move(callback);
}

void Player::run() {
    ProgressCallback notify;
    {
        std::lock_guard<std::mutex> lk(stateMutex);
        notify = progress;
    }

    bool failed = false;
    auto deadline = SteadyClock::now() + options.startDelay;
    bool alive = waitUntil(deadline);

    for (int loop = 0; alive && !failed && loop < options.loops; ++loop) {
        if (loop > 0) {
            {
                std::lock_guard<std::mutex> lk(stateMutex);
                loopIndex = loop;
                cursor = 0;
            }
            deadline += options.loopGap;
        }

        std::chrono::milliseconds previous{0};
        for (size_t idx = 0; idx < events.size(); ++idx) {
            const Event& event = events[idx];

            // scaled gap to the previous event, accumulated so rounding never drifts
            std::chrono::duration<double, std::milli> gap(
                static_cast<double>((event.offset - previous).count()) / options.speed);
            deadline += std::chrono::duration_cast<SteadyClock::duration>(gap);
            previous = event.offset;

            if (!waitUntil(deadline)) {
                alive = false;
                break;
            }

            bool skip = !options.replayMouseMoves && event.kind == EventKind::MOUSE_MOVE;
            if (!skip) {
                if (cancelRequested) {
                    alive = false;
                    break;
                }
                if (!dispatch(event)) {
                    std::ostringstream ss;
                    ss << "synthesis failed at event " << idx << " (" << describe(event) << ")";
                    std::cerr << "Error executing action: " << ss.str() << std::endl;
                    std::lock_guard<std::mutex> lk(stateMutex);
                    lastError = ss.str();
                    failed = true;
                    break;
                }
            }

            {
                std::lock_guard<std::mutex> lk(stateMutex);
                cursor = idx + 1;
            }
            if (notify) notify(idx + 1, events.size(), loop, options.loops);
        }
    }

    // release any keys or buttons still down to avoid stuck input
    releaseHeld();
    synth.release();
    session.release();

    // decided under the lock so a stop() accepted while PLAYING always ends STOPPED
    PlayerState finalState;
    {
        std::lock_guard<std::mutex> lk(stateMutex);
        finalState = (alive && !failed && !cancelRequested) ? PlayerState::COMPLETED : PlayerState::STOPPED;
        state = finalState;
    }
    stateChanged.notify_all();
    std::cout << (finalState == PlayerState::COMPLETED ? "Playback completed!" : "Playback stopped.")
              << std::endl;
}

bool Player::waitUntil(SteadyClock::time_point& deadline) {
    std::unique_lock<std::mutex> lk(stateMutex);
    while (true) {
        if (cancelRequested) return false;
        if (state == PlayerState::PAUSED) {
            stateChanged.wait(lk, [this] {
                return cancelRequested || state != PlayerState::PAUSED;
            });
            continue;
        }
        // time spent paused does not count against the schedule
        deadline += pausedTotal;
        pausedTotal = SteadyClock::duration{0};

        auto now = SteadyClock::now();
        if (now >= deadline) return true;
        auto slice = std::min<SteadyClock::duration>(deadline - now, options.pollTick);
        stateChanged.wait_for(lk, slice);
    }
}

bool Player::dispatch(const Event& event) {
    switch (event.kind) {
        case EventKind::MOUSE_MOVE:
            pointerX = event.x;
            pointerY = event.y;
            return synth.moveTo(event.x, event.y);

        case EventKind::MOUSE_DOWN:
        case EventKind::MOUSE_UP: {
            bool down = event.kind == EventKind::MOUSE_DOWN;
            pointerX = event.x;
            pointerY = event.y;
            if (!synth.button(event.button, down, event.x, event.y)) return false;
            if (down) heldButtons.insert(event.button);
            else heldButtons.erase(event.button);
            return true;
        }

        case EventKind::MOUSE_SCROLL:
            return synth.scroll(event.scrollDx, event.scrollDy, event.x, event.y);

        case EventKind::KEY_DOWN:
        case EventKind::KEY_UP: {
            bool down = event.kind == EventKind::KEY_DOWN;
            if (!synth.key(event.key, down)) return false;
            if (down) heldKeys.insert(event.key);
            else heldKeys.erase(event.key);
            return true;
        }
    }
    return false;
}

void Player::releaseHeld() {
    for (Key key : heldKeys) {
        if (!synth.key(key, false)) {
            std::cerr << "Could not release key " << keyName(key) << std::endl;
        }
    }
    heldKeys.clear();
    for (MouseButton button : heldButtons) {
        if (!synth.button(button, false, pointerX, pointerY)) {
            std::cerr << "Could not release mouse button " << mouseButtonName(button) << std::endl;
        }
    }
    heldButtons.clear();
}

} // namespace macrorec
