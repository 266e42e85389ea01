#include "macrorec/errors.hpp"
#include "macrorec/macro_store.hpp"
#include "macrorec/player.hpp"
#include "macrorec/recorder.hpp"
#include "macrorec/session.hpp"
#include "fake_input.hpp"
#include "test_harness.hpp"

#include <map>
#include <thread>

using namespace macrorec;
using std::chrono::milliseconds;
using Clock = std::chrono::steady_clock;
using ActionType = FakeSynthesizer::ActionType;

namespace {

Macro makeMacro(std::vector<Event> events, const std::string& name = "test") {
    return Macro(name, Macro::TimePoint{}, std::move(events));
}

long long msBetween(Clock::time_point from, Clock::time_point to) {
    return std::chrono::duration_cast<milliseconds>(to - from).count();
}

// Every key and button that went down was released again.
bool nothingHeld(const FakeSynthesizer& synth) {
    std::map<int, int> keys, buttons;
    for (const auto& action : synth.getActions()) {
        if (action.type == ActionType::KEY) keys[static_cast<int>(action.key)] += action.down ? 1 : -1;
        if (action.type == ActionType::BUTTON) buttons[static_cast<int>(action.button)] += action.down ? 1 : -1;
    }
    for (const auto& entry : keys) {
        if (entry.second > 0) return false;
    }
    for (const auto& entry : buttons) {
        if (entry.second > 0) return false;
    }
    return true;
}

Macro holdingMacro() {
    return makeMacro({
        Event::keyEvent(milliseconds(0), Key::SHIFT, true),
        Event::mouseButton(milliseconds(10), 50, 60, MouseButton::LEFT, true),
        Event::mouseMove(milliseconds(20), 70, 80),
        Event::keyEvent(milliseconds(1000), Key::SHIFT, false),
        Event::mouseButton(milliseconds(1010), 70, 80, MouseButton::LEFT, false),
    });
}

} // namespace

void testRejectedPlay() {
    TEST("empty macro fails with EmptyMacroError")
        FakeSynthesizer synth;
        Player player(synth);
        ASSERT_THROWS(player.play(makeMacro({})), EmptyMacroError);
        ASSERT(player.getState() == PlayerState::IDLE);
        ASSERT(synth.acquires == 0);
    PASS()

    TEST("speed and loop bounds fail with InvalidParameterError")
        FakeSynthesizer synth;
        Player player(synth);
        Macro m = makeMacro({Event::keyEvent(milliseconds(0), Key::A, true)});
        PlaybackOptions options;
        options.speed = 0.0;
        ASSERT_THROWS(player.play(m, options), InvalidParameterError);
        options.speed = 5.01;
        ASSERT_THROWS(player.play(m, options), InvalidParameterError);
        options.speed = 0.09;
        ASSERT_THROWS(player.play(m, options), InvalidParameterError);
        options.speed = 1.0;
        options.loops = 0;
        ASSERT_THROWS(player.play(m, options), InvalidParameterError);
        options.loops = 1000;
        ASSERT_THROWS(player.play(m, options), InvalidParameterError);
        options.loops = 1;
        options.pollTick = milliseconds(0);
        ASSERT_THROWS(player.play(m, options), InvalidParameterError);
        ASSERT(player.getState() == PlayerState::IDLE);
        ASSERT(synth.acquires == 0);
        ASSERT(activeSession() == SessionKind::NONE);
    PASS()

    TEST("boundary speeds and loops are accepted")
        ASSERT_THROWS(validatePlaybackParameters(5.0000001, 1), InvalidParameterError);
        validatePlaybackParameters(0.1, 1);
        validatePlaybackParameters(5.0, 999);
    PASS()

    TEST("denied synthesis leaves the player idle")
        FakeSynthesizer synth;
        synth.failAcquire = true;
        Player player(synth);
        ASSERT_THROWS(player.play(makeMacro({Event::keyEvent(milliseconds(0), Key::A, true)})), PermissionError);
        ASSERT(player.getState() == PlayerState::IDLE);
        ASSERT(activeSession() == SessionKind::NONE);
    PASS()

    TEST("pause, resume and stop are refused while idle")
        FakeSynthesizer synth;
        Player player(synth);
        ASSERT_THROWS(player.pause(), InvalidStateError);
        ASSERT_THROWS(player.resume(), InvalidStateError);
        ASSERT_THROWS(player.stop(), InvalidStateError);
    PASS()

    TEST("playback is refused while recording")
        FakeCapture capture;
        Recorder recorder(capture);
        FakeSynthesizer synth;
        Player player(synth);
        recorder.start();
        ASSERT_THROWS(player.play(makeMacro({Event::keyEvent(milliseconds(0), Key::A, true)})), AlreadyRecordingError);
        ASSERT(player.getState() == PlayerState::IDLE);
        recorder.stop();
    PASS()
}

void testDispatchCounts() {
    std::vector<Event> events = {
        Event::mouseMove(milliseconds(0), 10, 10),
        Event::mouseButton(milliseconds(5), 10, 10, MouseButton::LEFT, true),
        Event::mouseButton(milliseconds(10), 10, 10, MouseButton::LEFT, false),
        Event::mouseMove(milliseconds(12), 20, 20),
        Event::mouseScroll(milliseconds(15), 20, 20, 0, 1),
        Event::keyEvent(milliseconds(20), Key::A, true),
        Event::keyEvent(milliseconds(25), Key::A, false),
    };

    TEST("one loop dispatches every event once")
        FakeSynthesizer synth;
        Player player(synth);
        player.play(makeMacro(events));
        ASSERT(player.wait() == PlayerState::COMPLETED);
        auto actions = synth.getActions();
        ASSERT(actions.size() == events.size());
        ASSERT(actions[0].type == ActionType::MOVE && actions[0].x == 10);
        ASSERT(actions[1].type == ActionType::BUTTON && actions[1].down);
        ASSERT(actions[4].type == ActionType::SCROLL && actions[4].dy == 1);
        ASSERT(actions[5].type == ActionType::KEY && actions[5].key == Key::A && actions[5].down);
        ASSERT(!synth.acquired);
        ASSERT(synth.releases == 1);
    PASS()

    TEST("n loops dispatch n times the events")
        FakeSynthesizer synth;
        Player player(synth);
        PlaybackOptions options;
        options.loops = 3;
        options.speed = 5.0;
        player.play(makeMacro(events), options);
        ASSERT(player.wait() == PlayerState::COMPLETED);
        ASSERT(synth.getActions().size() == 3 * events.size());
    PASS()

    TEST("without mouse-move replay only non-move events are dispatched")
        FakeSynthesizer synth;
        Player player(synth);
        PlaybackOptions options;
        options.loops = 4;
        options.speed = 5.0;
        options.replayMouseMoves = false;
        player.play(makeMacro(events), options);
        ASSERT(player.wait() == PlayerState::COMPLETED);
        auto actions = synth.getActions();
        ASSERT(actions.size() == 4 * (events.size() - 2));
        for (const auto& action : actions) ASSERT(action.type != ActionType::MOVE);
    PASS()

    TEST("progress reports every handled event")
        FakeSynthesizer synth;
        Player player(synth);
        std::mutex mutex;
        std::vector<std::pair<size_t, int>> seen;
        size_t reportedTotal = 0;
        int reportedLoops = 0;
        player.setProgressCallback([&](size_t cursor, size_t total, int loopIndex, int loopCount) {
            std::lock_guard<std::mutex> lk(mutex);
            seen.emplace_back(cursor, loopIndex);
            reportedTotal = total;
            reportedLoops = loopCount;
        });
        PlaybackOptions options;
        options.loops = 2;
        options.speed = 5.0;
        player.play(makeMacro(events), options);
        ASSERT(player.wait() == PlayerState::COMPLETED);
        std::lock_guard<std::mutex> lk(mutex);
        ASSERT(seen.size() == 2 * events.size());
        ASSERT(reportedTotal == events.size());
        ASSERT(reportedLoops == 2);
        ASSERT(seen.front().first == 1 && seen.front().second == 0);
        ASSERT(seen.back().first == events.size() && seen.back().second == 1);
    PASS()

    TEST("a finished player can play again")
        FakeSynthesizer synth;
        Player player(synth);
        player.play(makeMacro(events));
        ASSERT(player.wait() == PlayerState::COMPLETED);
        player.play(makeMacro(events));
        ASSERT(player.wait() == PlayerState::COMPLETED);
        ASSERT(synth.getActions().size() == 2 * events.size());
        ASSERT(synth.acquires == 2 && synth.releases == 2);
    PASS()
}

void testTiming() {
    std::vector<Event> events = {
        Event::keyEvent(milliseconds(0), Key::A, true),
        Event::keyEvent(milliseconds(200), Key::A, false),
    };

    TEST("speed 2.0 halves the playback duration")
        FakeSynthesizer synth;
        Player player(synth);
        PlaybackOptions options;
        options.speed = 2.0;
        player.play(makeMacro(events), options);
        ASSERT(player.wait() == PlayerState::COMPLETED);
        auto actions = synth.getActions();
        ASSERT(actions.size() == 2);
        long long gap = msBetween(actions[0].at, actions[1].at);
        ASSERT(gap >= 95 && gap < 180);
    PASS()

    TEST("speed 0.5 doubles the playback duration")
        FakeSynthesizer synth;
        Player player(synth);
        PlaybackOptions options;
        options.speed = 0.5;
        player.play(makeMacro(events), options);
        ASSERT(player.wait() == PlayerState::COMPLETED);
        auto actions = synth.getActions();
        long long gap = msBetween(actions[0].at, actions[1].at);
        ASSERT(gap >= 395 && gap < 500);
    PASS()

    TEST("skipped mouse moves still take their time")
        FakeSynthesizer synth;
        Player player(synth);
        PlaybackOptions options;
        options.replayMouseMoves = false;
        player.play(makeMacro({
            Event::keyEvent(milliseconds(0), Key::A, true),
            Event::mouseMove(milliseconds(100), 1, 1),
            Event::mouseMove(milliseconds(150), 2, 2),
            Event::keyEvent(milliseconds(200), Key::A, false),
        }), options);
        ASSERT(player.wait() == PlayerState::COMPLETED);
        auto actions = synth.getActions();
        ASSERT(actions.size() == 2);
        long long gap = msBetween(actions[0].at, actions[1].at);
        ASSERT(gap >= 195 && gap < 280);
    PASS()

    TEST("start delay and loop gap")
        FakeSynthesizer synth;
        Player player(synth);
        PlaybackOptions options;
        options.startDelay = milliseconds(100);
        options.loopGap = milliseconds(80);
        options.loops = 2;
        auto begin = Clock::now();
        player.play(makeMacro({Event::keyEvent(milliseconds(0), Key::A, true),
                               Event::keyEvent(milliseconds(20), Key::A, false)}), options);
        ASSERT(player.wait() == PlayerState::COMPLETED);
        auto actions = synth.getActions();
        ASSERT(actions.size() == 4);
        ASSERT(msBetween(begin, actions[0].at) >= 100);
        long long betweenLoops = msBetween(actions[1].at, actions[2].at);
        ASSERT(betweenLoops >= 75 && betweenLoops < 160);
    PASS()
}

void testRecordedScenario() {
    ScratchDir dir("player_scenario");

    TEST("saved three-event macro replays at speed 2.0")
        Macro recorded = makeMacro({
            Event::mouseMove(milliseconds(0), 100, 100),
            Event::keyEvent(milliseconds(500), Key::A, true),
            Event::keyEvent(milliseconds(520), Key::A, false),
        }, "scenario");
        std::filesystem::path path = dir.path / "scenario.json";
        saveMacro(recorded, path);
        Macro loaded = loadMacro(path);
        ASSERT(loaded == recorded);

        FakeSynthesizer synth;
        Player player(synth);
        PlaybackOptions options;
        options.speed = 2.0;
        options.loops = 1;
        auto begin = Clock::now();
        player.play(loaded, options);
        ASSERT(player.wait() == PlayerState::COMPLETED);

        auto actions = synth.getActions();
        ASSERT(actions.size() == 3);
        ASSERT(actions[0].type == ActionType::MOVE && actions[0].x == 100 && actions[0].y == 100);
        ASSERT(actions[1].type == ActionType::KEY && actions[1].key == Key::A && actions[1].down);
        ASSERT(actions[2].type == ActionType::KEY && actions[2].key == Key::A && !actions[2].down);
        long long down = msBetween(begin, actions[1].at);
        long long up = msBetween(begin, actions[2].at);
        ASSERT(down >= 245 && down < 330);
        ASSERT(up >= 255 && up < 340);
        ASSERT(up - down >= 8);
    PASS()
}

void testPauseResume() {
    TEST("pause freezes the schedule and resume continues it")
        FakeSynthesizer synth;
        Player player(synth);
        player.play(makeMacro({
            Event::keyEvent(milliseconds(0), Key::A, true),
            Event::keyEvent(milliseconds(200), Key::A, false),
        }));
        std::this_thread::sleep_for(milliseconds(50));
        player.pause();
        ASSERT(player.getState() == PlayerState::PAUSED);
        ASSERT_THROWS(player.pause(), InvalidStateError);
        std::this_thread::sleep_for(milliseconds(250));
        ASSERT(synth.getActions().size() == 1);
        ASSERT(player.getStatus().cursor == 1);
        player.resume();
        ASSERT(player.getState() == PlayerState::PLAYING);
        ASSERT_THROWS(player.resume(), InvalidStateError);
        ASSERT(player.wait() == PlayerState::COMPLETED);
        auto actions = synth.getActions();
        ASSERT(actions.size() == 2);
        ASSERT(msBetween(actions[0].at, actions[1].at) >= 390);
    PASS()

    TEST("status reflects the running session")
        FakeSynthesizer synth;
        Player player(synth);
        PlaybackOptions options;
        options.loops = 3;
        options.speed = 0.5;
        player.play(makeMacro({
            Event::keyEvent(milliseconds(0), Key::A, true),
            Event::keyEvent(milliseconds(400), Key::A, false),
        }), options);
        std::this_thread::sleep_for(milliseconds(100));
        PlaybackStatus status = player.getStatus();
        ASSERT(status.state == PlayerState::PLAYING);
        ASSERT(status.cursor == 1);
        ASSERT(status.totalEvents == 2);
        ASSERT(status.loopIndex == 0);
        ASSERT(status.loopCount == 3);
        ASSERT(status.speed == 0.5);
        player.stop();
    PASS()
}

void testStopAndCleanup() {
    TEST("stop while playing releases every held key and button")
        FakeSynthesizer synth;
        Player player(synth);
        player.play(holdingMacro());
        std::this_thread::sleep_for(milliseconds(100));
        player.stop();
        ASSERT(player.getState() == PlayerState::STOPPED);
        ASSERT(synth.count(ActionType::KEY, true) == 1);
        ASSERT(synth.count(ActionType::KEY, false) == 1);
        ASSERT(synth.count(ActionType::BUTTON, false) == 1);
        ASSERT(nothingHeld(synth));
        ASSERT(!synth.acquired);
        ASSERT(activeSession() == SessionKind::NONE);
        ASSERT(player.wait() == PlayerState::STOPPED);
    PASS()

    TEST("stop while paused releases held input")
        FakeSynthesizer synth;
        Player player(synth);
        player.play(holdingMacro());
        std::this_thread::sleep_for(milliseconds(100));
        player.pause();
        player.stop();
        ASSERT(player.getState() == PlayerState::STOPPED);
        ASSERT(nothingHeld(synth));
        ASSERT_THROWS(player.stop(), InvalidStateError);
    PASS()

    TEST("stop right after play dispatches nothing further")
        FakeSynthesizer synth;
        Player player(synth);
        PlaybackOptions options;
        options.startDelay = milliseconds(500);
        player.play(holdingMacro(), options);
        player.stop();
        ASSERT(player.getState() == PlayerState::STOPPED);
        ASSERT(synth.getActions().empty());
    PASS()

    TEST("keys still down at completion are released")
        FakeSynthesizer synth;
        Player player(synth);
        player.play(makeMacro({Event::keyEvent(milliseconds(0), Key::CTRL, true)}));
        ASSERT(player.wait() == PlayerState::COMPLETED);
        auto actions = synth.getActions();
        ASSERT(actions.size() == 2);
        ASSERT(actions[1].key == Key::CTRL && !actions[1].down);
    PASS()

    TEST("synthesis failure stops playback and releases input")
        FakeSynthesizer synth;
        synth.failAt = 2;
        Player player(synth);
        player.play(holdingMacro());
        ASSERT(player.wait() == PlayerState::STOPPED);
        ASSERT(!player.getLastError().empty());
        ASSERT(nothingHeld(synth));
        ASSERT(synth.count(ActionType::MOVE, false) == 0);
        ASSERT(!synth.acquired);
        ASSERT(activeSession() == SessionKind::NONE);
    PASS()
}

void testRequestStop() {
    TEST("requestStop returns without waiting for a slow action")
        FakeSynthesizer synth;
        synth.actionDelay = milliseconds(150);
        Player player(synth);
        player.play(makeMacro({
            Event::keyEvent(milliseconds(0), Key::A, true),
            Event::keyEvent(milliseconds(500), Key::A, false),
        }));
        std::this_thread::sleep_for(milliseconds(40));
        auto begin = Clock::now();
        ASSERT(player.requestStop());
        ASSERT(msBetween(begin, Clock::now()) < 50);
        ASSERT(player.wait() == PlayerState::STOPPED);
        ASSERT(nothingHeld(synth));
        ASSERT(activeSession() == SessionKind::NONE);
    PASS()

    TEST("requestStop from the progress callback ends playback")
        FakeSynthesizer synth;
        Player player(synth);
        player.setProgressCallback([&player](size_t cursor, size_t, int, int) {
            if (cursor == 1) player.requestStop();
        });
        player.play(holdingMacro());
        ASSERT(player.wait() == PlayerState::STOPPED);
        ASSERT(synth.count(ActionType::BUTTON, true) == 0);
        ASSERT(nothingHeld(synth));
    PASS()

    TEST("requestStop while idle or finished reports nothing to stop")
        FakeSynthesizer synth;
        Player player(synth);
        ASSERT(!player.requestStop());
        player.play(makeMacro({Event::keyEvent(milliseconds(0), Key::A, true)}));
        ASSERT(player.wait() == PlayerState::COMPLETED);
        ASSERT(!player.requestStop());
        ASSERT(player.getState() == PlayerState::COMPLETED);
    PASS()

    TEST("an accepted stop never ends completed")
        for (int i = 0; i < 50; ++i) {
            FakeSynthesizer synth;
            Player player(synth);
            player.play(makeMacro({Event::keyEvent(milliseconds(0), Key::A, true)}));
            bool accepted = true;
            try {
                player.stop();
            } catch (const InvalidStateError&) {
                accepted = false;
            }
            PlayerState end = player.wait();
            ASSERT(end == (accepted ? PlayerState::STOPPED : PlayerState::COMPLETED));
        }
    PASS()
}

void testScheduleBounds() {
    TEST("an event at the maximum offset waits at the slowest speed")
        FakeSynthesizer synth;
        Player player(synth);
        PlaybackOptions options;
        options.speed = MIN_SPEED;
        options.loops = MAX_LOOPS;
        options.loopGap = MAX_EVENT_OFFSET;
        player.play(makeMacro({
            Event::keyEvent(milliseconds(0), Key::A, true),
            Event::keyEvent(MAX_EVENT_OFFSET, Key::A, false),
        }), options);
        std::this_thread::sleep_for(milliseconds(150));
        ASSERT(player.getState() == PlayerState::PLAYING);
        ASSERT(synth.getActions().size() == 1);
        player.stop();
        ASSERT(nothingHeld(synth));
    PASS()

    TEST("delays beyond the maximum offset are refused")
        FakeSynthesizer synth;
        Player player(synth);
        Macro m = makeMacro({Event::keyEvent(milliseconds(0), Key::A, true)});
        PlaybackOptions options;
        options.loopGap = MAX_EVENT_OFFSET + milliseconds(1);
        ASSERT_THROWS(player.play(m, options), InvalidParameterError);
        options.loopGap = milliseconds(0);
        options.startDelay = milliseconds(10000000000000LL);
        ASSERT_THROWS(player.play(m, options), InvalidParameterError);
        options.startDelay = milliseconds(0);
        options.pollTick = MAX_EVENT_OFFSET + milliseconds(1);
        ASSERT_THROWS(player.play(m, options), InvalidParameterError);
        ASSERT(player.getState() == PlayerState::IDLE);
        ASSERT(synth.acquires == 0);
    PASS()
}

void testConcurrentPlay() {
    TEST("second play fails with AlreadyPlayingError and the first is unaffected")
        FakeSynthesizer synth;
        Player player(synth);
        std::vector<Event> events = {
            Event::keyEvent(milliseconds(0), Key::A, true),
            Event::keyEvent(milliseconds(150), Key::A, false),
        };
        player.play(makeMacro(events));
        ASSERT_THROWS(player.play(makeMacro(events)), AlreadyPlayingError);

        FakeSynthesizer otherSynth;
        Player other(otherSynth);
        ASSERT_THROWS(other.play(makeMacro(events)), AlreadyPlayingError);
        ASSERT(other.getState() == PlayerState::IDLE);
        ASSERT(otherSynth.acquires == 0);

        ASSERT(player.getState() == PlayerState::PLAYING);
        ASSERT(player.wait() == PlayerState::COMPLETED);
        ASSERT(synth.getActions().size() == 2);
    PASS()
}

int main() {
    std::cout << "\n=== Player Tests ===\n" << std::endl;

    testRejectedPlay();
    testDispatchCounts();
    testTiming();
    testRecordedScenario();
    testPauseResume();
    testStopAndCleanup();
    testRequestStop();
    testScheduleBounds();
    testConcurrentPlay();

    return summary();
}
