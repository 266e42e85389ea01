#include "macrorec/errors.hpp"
#include "macrorec/macro.hpp"
#include "test_harness.hpp"

using namespace macrorec;
using std::chrono::milliseconds;

namespace {

Macro::TimePoint at(long long ms) {
    return Macro::TimePoint(milliseconds(ms));
}

std::vector<Event> sampleEvents() {
    return {
        Event::mouseMove(milliseconds(0), 100, 100),
        Event::mouseButton(milliseconds(40), 100, 100, MouseButton::LEFT, true),
        Event::mouseButton(milliseconds(90), 100, 100, MouseButton::LEFT, false),
        Event::mouseScroll(milliseconds(120), 100, 100, 0, -2),
        Event::keyEvent(milliseconds(500), Key::A, true),
        Event::keyEvent(milliseconds(520), Key::A, false),
    };
}

} // namespace

void testConstruction() {
    TEST("macro keeps name, timestamp and events")
        Macro m("demo", at(1000), sampleEvents());
        ASSERT(m.getName() == "demo");
        ASSERT(m.getCreatedAt() == at(1000));
        ASSERT(m.getEventCount() == 6);
        ASSERT(!m.isEmpty());
        ASSERT(m.getDuration() == milliseconds(520));
    PASS()
}

void testEmpty() {
    TEST("empty macro")
        Macro m("empty", at(0), {});
        ASSERT(m.isEmpty());
        ASSERT(m.getDuration() == milliseconds(0));
        ASSERT(m.getStats().totalEvents == 0);
    PASS()
}

void testOrdering() {
    TEST("construction rejects out-of-order offsets")
        std::vector<Event> events = {
            Event::keyEvent(milliseconds(100), Key::A, true),
            Event::keyEvent(milliseconds(50), Key::A, false),
        };
        ASSERT_THROWS(Macro("bad", at(0), events), MalformedMacroError);
    PASS()

    TEST("construction rejects negative offsets")
        std::vector<Event> events = {Event::mouseMove(milliseconds(-1), 0, 0)};
        ASSERT_THROWS(Macro("bad", at(0), events), MalformedMacroError);
    PASS()

    TEST("construction rejects offsets beyond the maximum")
        std::vector<Event> events = {Event::keyEvent(MAX_EVENT_OFFSET + milliseconds(1), Key::A, true)};
        ASSERT_THROWS(Macro("bad", at(0), events), MalformedMacroError);
        Macro edge("edge", at(0), {Event::keyEvent(MAX_EVENT_OFFSET, Key::A, true)});
        ASSERT(edge.getDuration() == MAX_EVENT_OFFSET);
    PASS()

    TEST("equal offsets are allowed")
        std::vector<Event> events = {
            Event::keyEvent(milliseconds(10), Key::SHIFT, true),
            Event::keyEvent(milliseconds(10), Key::A, true),
        };
        Macro m("same", at(0), events);
        ASSERT(m.getEventCount() == 2);
    PASS()
}

void testStats() {
    TEST("statistics count clicks, moves, scrolls and key presses")
        MacroStats s = Macro("demo", at(0), sampleEvents()).getStats();
        ASSERT(s.totalEvents == 6);
        ASSERT(s.duration == milliseconds(520));
        ASSERT(s.mouseClicks == 1);
        ASSERT(s.mouseMoves == 1);
        ASSERT(s.mouseScrolls == 1);
        ASSERT(s.keyPresses == 1);
    PASS()
}

void testEquality() {
    TEST("equality covers metadata and every event")
        Macro a("demo", at(5), sampleEvents());
        Macro b("demo", at(5), sampleEvents());
        ASSERT(a == b);
        ASSERT(a != a.renamed("other"));
        ASSERT(a.renamed("other").getEvents() == a.getEvents());
        ASSERT(a != Macro("demo", at(6), sampleEvents()));

        auto shifted = sampleEvents();
        shifted.back().offset = milliseconds(521);
        ASSERT(a != Macro("demo", at(5), shifted));
    PASS()
}

void testDefaultName() {
    TEST("default name follows recording_YYYYmmdd_HHMMSS")
        std::string name = defaultMacroName(at(1700000000000LL));
        ASSERT(name.size() == std::string("recording_20231114_221320").size());
        ASSERT(name.rfind("recording_2023111", 0) == 0);
        ASSERT(name[18] == '_');
    PASS()
}

int main() {
    std::cout << "\n=== Macro Tests ===\n" << std::endl;

    testConstruction();
    testEmpty();
    testOrdering();
    testStats();
    testEquality();
    testDefaultName();

    return summary();
}
