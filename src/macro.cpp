#include "macrorec/macro.hpp"
#include "macrorec/errors.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace macrorec {

Macro::Macro(std::string name, TimePoint createdAt, std::vector<Event> events)
    : name(std::move(name)), createdAt(createdAt), events(std::move(events)) {
    std::chrono::milliseconds previous{0};
    for (size_t i = 0; i < this->events.size(); ++i) {
        const auto offset = this->events[i].offset;
        if (offset.count() < 0) {
            throw MalformedMacroError("event " + std::to_string(i) + " has a negative offset");
        }
        if (offset > MAX_EVENT_OFFSET) {
            throw MalformedMacroError("event " + std::to_string(i) + " is later than the maximum offset of " +
                                      std::to_string(MAX_EVENT_OFFSET.count()) + " ms");
        }
        if (offset < previous) {
            throw MalformedMacroError("event " + std::to_string(i) + " is earlier than the event before it");
        }
        previous = offset;
    }
}

std::chrono::milliseconds Macro::getDuration() const {
    if (events.empty()) return std::chrono::milliseconds{0};
    return events.back().offset;
}

MacroStats Macro::getStats() const {
    MacroStats s;
    s.totalEvents = events.size();
    s.duration = getDuration();
    for (const auto& e : events) {
        switch (e.kind) {
            case EventKind::MOUSE_MOVE:   ++s.mouseMoves; break;
            case EventKind::MOUSE_DOWN:   ++s.mouseClicks; break;
            case EventKind::MOUSE_SCROLL: ++s.mouseScrolls; break;
            case EventKind::KEY_DOWN:     ++s.keyPresses; break;
            default: break;
        }
    }
    return s;
}

Macro Macro::renamed(std::string newName) const {
    return Macro(std::move(newName), createdAt, events);
}

bool Macro::operator==(const Macro& other) const {
    return name == other.name && createdAt == other.createdAt && events == other.events;
}

std::string defaultMacroName(Macro::TimePoint createdAt) {
    auto time = Macro::Clock::to_time_t(createdAt);
    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &time);
#else
    localtime_r(&time, &local);
#endif
    std::stringstream ss;
    ss << "recording_" << std::put_time(&local, "%Y%m%d_%H%M%S");
    return ss.str();
}

} // namespace macrorec
