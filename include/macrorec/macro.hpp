#pragma once

#include "macrorec/event.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace macrorec {

struct MacroStats {
    size_t totalEvents = 0;
    std::chrono::milliseconds duration{0};
    size_t mouseClicks = 0;
    size_t mouseMoves = 0;
    size_t mouseScrolls = 0;
    size_t keyPresses = 0;
};

// Latest offset an event may have: seven days. At the slowest speed, across
// every loop, the replay schedule still fits in steady_clock nanoseconds.
constexpr std::chrono::milliseconds MAX_EVENT_OFFSET{7LL * 24 * 60 * 60 * 1000};

// A sealed recording. Once constructed the event sequence never changes.
class Macro {
public:
    using Clock = std::chrono::system_clock;
    using TimePoint = std::chrono::time_point<Clock, std::chrono::milliseconds>;

    Macro() = default;

    // Throws MalformedMacroError when an offset is negative, beyond
    // MAX_EVENT_OFFSET, or the sequence goes backwards in time.
    Macro(std::string name, TimePoint createdAt, std::vector<Event> events);

    const std::string& getName() const { return name; }
    TimePoint getCreatedAt() const { return createdAt; }
    const std::vector<Event>& getEvents() const { return events; }

    size_t getEventCount() const { return events.size(); }
    bool isEmpty() const { return events.empty(); }
    std::chrono::milliseconds getDuration() const;

    MacroStats getStats() const;

    // Same events and timing under another name.
    Macro renamed(std::string newName) const;

    bool operator==(const Macro& other) const;
    bool operator!=(const Macro& other) const { return !(*this == other); }

private:
    std::string name;
    TimePoint createdAt{};
    std::vector<Event> events;
};

// "recording_YYYYMMDD_HHMMSS" in local time, as the recordings folder names files.
std::string defaultMacroName(Macro::TimePoint createdAt);

} // namespace macrorec
