#include "macrorec/macro_store.hpp"
#include "macrorec/errors.hpp"

#include <algorithm>
#include <cctype>
#include <climits>
#include <cmath>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace macrorec {

namespace {

const json& requireField(const json& obj, const char* field, const std::string& where) {
    auto it = obj.find(field);
    if (it == obj.end()) {
        throw MalformedMacroError(where + ": missing \"" + field + "\"");
    }
    return *it;
}

int64_t requireInteger(const json& obj, const char* field, const std::string& where) {
    const json& value = requireField(obj, field, where);
    if (!value.is_number_integer()) {
        throw MalformedMacroError(where + ": \"" + field + "\" must be an integer");
    }
    return value.get<int64_t>();
}

int requireInt(const json& obj, const char* field, const std::string& where) {
    int64_t value = requireInteger(obj, field, where);
    if (value < INT_MIN || value > INT_MAX) {
        throw MalformedMacroError(where + ": \"" + field + "\" is out of range");
    }
    return static_cast<int>(value);
}

std::string requireString(const json& obj, const char* field, const std::string& where) {
    const json& value = requireField(obj, field, where);
    if (!value.is_string()) {
        throw MalformedMacroError(where + ": \"" + field + "\" must be a string");
    }
    return value.get<std::string>();
}

bool requireBool(const json& obj, const char* field, const std::string& where) {
    const json& value = requireField(obj, field, where);
    if (!value.is_boolean()) {
        throw MalformedMacroError(where + ": \"" + field + "\" must be a boolean");
    }
    return value.get<bool>();
}

double requireNumber(const json& obj, const char* field, const std::string& where) {
    const json& value = requireField(obj, field, where);
    if (!value.is_number()) {
        throw MalformedMacroError(where + ": \"" + field + "\" must be a number");
    }
    double number = value.get<double>();
    if (!std::isfinite(number)) {
        throw MalformedMacroError(where + ": \"" + field + "\" must be finite");
    }
    return number;
}

// older recorders wrote float coordinates now and then
int requireLegacyInt(const json& obj, const char* field, const std::string& where) {
    double number = requireNumber(obj, field, where);
    if (number < INT_MIN || number > INT_MAX) {
        throw MalformedMacroError(where + ": \"" + field + "\" is out of range");
    }
    return static_cast<int>(std::lround(number));
}

json eventToJson(const Event& event) {
    json j;
    j["kind"] = eventKindName(event.kind);
    j["t_offset_ms"] = event.offset.count();
    switch (event.kind) {
        case EventKind::MOUSE_MOVE:
            j["x"] = event.x;
            j["y"] = event.y;
            break;
        case EventKind::MOUSE_DOWN:
        case EventKind::MOUSE_UP:
            j["x"] = event.x;
            j["y"] = event.y;
            j["button"] = mouseButtonName(event.button);
            break;
        case EventKind::MOUSE_SCROLL:
            j["x"] = event.x;
            j["y"] = event.y;
            j["dx"] = event.scrollDx;
            j["dy"] = event.scrollDy;
            break;
        case EventKind::KEY_DOWN:
        case EventKind::KEY_UP:
            j["key"] = keyName(event.key);
            break;
    }
    return j;
}

Event eventFromJson(const json& item, size_t index) {
    const std::string where = "event " + std::to_string(index);
    if (!item.is_object()) throw MalformedMacroError(where + ": must be an object");

    std::string kindName = requireString(item, "kind", where);
    auto kind = eventKindFromName(kindName);
    if (!kind) throw MalformedMacroError(where + ": unknown kind \"" + kindName + "\"");

    int64_t offsetMs = requireInteger(item, "t_offset_ms", where);
    if (offsetMs < 0) throw MalformedMacroError(where + ": negative t_offset_ms");
    if (offsetMs > MAX_EVENT_OFFSET.count()) {
        throw MalformedMacroError(where + ": t_offset_ms exceeds " + std::to_string(MAX_EVENT_OFFSET.count()));
    }
    std::chrono::milliseconds offset(offsetMs);

    switch (*kind) {
        case EventKind::MOUSE_MOVE:
            return Event::mouseMove(offset, requireInt(item, "x", where), requireInt(item, "y", where));

        case EventKind::MOUSE_DOWN:
        case EventKind::MOUSE_UP: {
            std::string buttonName = requireString(item, "button", where);
            auto button = mouseButtonFromName(buttonName);
            if (!button) throw MalformedMacroError(where + ": unknown button \"" + buttonName + "\"");
            return Event::mouseButton(offset, requireInt(item, "x", where), requireInt(item, "y", where),
                                      *button, *kind == EventKind::MOUSE_DOWN);
        }

        case EventKind::MOUSE_SCROLL:
            return Event::mouseScroll(offset, requireInt(item, "x", where), requireInt(item, "y", where),
                                      requireInt(item, "dx", where), requireInt(item, "dy", where));

        case EventKind::KEY_DOWN:
        case EventKind::KEY_UP: {
            std::string name = requireString(item, "key", where);
            auto key = keyFromName(name);
            if (!key) throw MalformedMacroError(where + ": unknown key name \"" + name + "\"");
            return Event::keyEvent(offset, *key, *kind == EventKind::KEY_DOWN);
        }
    }
    throw MalformedMacroError(where + ": unhandled kind");
}

// "Key.shift", "'a'", "A", "Shift" as written by older recorders
std::optional<Key> legacyKey(const std::string& text) {
    std::string name = text;
    if (name.rfind("Key.", 0) == 0) {
        name = name.substr(4);
    } else if (name.size() == 3 && name.front() == '\'' && name.back() == '\'') {
        name = name.substr(1, 1);
    }

    if (name.size() == 1) {
        char c = static_cast<char>(std::tolower(static_cast<unsigned char>(name[0])));
        switch (c) {
            case ' ':  return Key::SPACE;
            case '-':  return Key::MINUS;
            case '=':  return Key::EQUAL;
            case '[':  return Key::BRACKET_LEFT;
            case ']':  return Key::BRACKET_RIGHT;
            case '\\': return Key::BACKSLASH;
            case ';':  return Key::SEMICOLON;
            case '\'': return Key::APOSTROPHE;
            case '`':  return Key::GRAVE;
            case ',':  return Key::COMMA;
            case '.':  return Key::PERIOD;
            case '/':  return Key::SLASH;
            default:   return keyFromName(std::string(1, c));
        }
    }

    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (name == "shift_l") name = "shift";
    else if (name == "ctrl_l" || name == "control") name = "ctrl";
    else if (name == "alt_l") name = "alt";
    else if (name == "cmd_l") name = "cmd";
    else if (name == "return") name = "enter";
    else if (name == "escape") name = "esc";
    return keyFromName(name);
}

std::optional<MouseButton> legacyButton(std::string text) {
    if (text.rfind("Button.", 0) == 0) text = text.substr(7);
    return mouseButtonFromName(text);
}

Macro legacyFromJson(const json& doc, const std::string& fallbackName) {
    std::vector<Event> events;
    events.reserve(doc.size());
    for (size_t i = 0; i < doc.size(); ++i) {
        const json& item = doc[i];
        const std::string where = "action " + std::to_string(i);
        if (!item.is_object()) throw MalformedMacroError(where + ": must be an object");

        std::string type = requireString(item, "type", where);
        double seconds = requireNumber(item, "time", where);
        if (seconds < 0) throw MalformedMacroError(where + ": negative time");
        if (seconds * 1000.0 > static_cast<double>(MAX_EVENT_OFFSET.count())) {
            throw MalformedMacroError(where + ": time exceeds the maximum offset");
        }
        std::chrono::milliseconds offset(std::llround(seconds * 1000.0));

        const json& data = item.contains("data") ? item.at("data") : item;
        if (!data.is_object()) throw MalformedMacroError(where + ": \"data\" must be an object");

        if (type == "mouse_move") {
            events.push_back(Event::mouseMove(offset, requireLegacyInt(data, "x", where),
                                              requireLegacyInt(data, "y", where)));
        } else if (type == "mouse_click" || type == "mouse_press" || type == "mouse_release") {
            std::string buttonName = requireString(data, "button", where);
            auto button = legacyButton(buttonName);
            if (!button) throw MalformedMacroError(where + ": unknown button \"" + buttonName + "\"");
            bool down = type == "mouse_click" ? requireBool(data, "pressed", where) : type == "mouse_press";
            events.push_back(Event::mouseButton(offset, requireLegacyInt(data, "x", where),
                                                requireLegacyInt(data, "y", where), *button, down));
        } else if (type == "mouse_scroll") {
            events.push_back(Event::mouseScroll(offset, requireLegacyInt(data, "x", where),
                                                requireLegacyInt(data, "y", where),
                                                requireLegacyInt(data, "dx", where),
                                                requireLegacyInt(data, "dy", where)));
        } else if (type == "key_press" || type == "key_release") {
            std::string keyText = requireString(data, "key", where);
            std::optional<Key> key;
            // Windows recordings carry the virtual-key code next to the display name
            if (data.contains("vkCode")) {
                int64_t vk = requireInteger(data, "vkCode", where);
                if (vk > 0 && vk <= 0xFF) key = keyFromVirtualKey(static_cast<uint16_t>(vk));
            }
            if (!key) key = legacyKey(keyText);
            if (!key) throw MalformedMacroError(where + ": unknown key \"" + keyText + "\"");
            events.push_back(Event::keyEvent(offset, *key, type == "key_press"));
        } else {
            throw MalformedMacroError(where + ": unsupported action type \"" + type + "\"");
        }
    }
    return Macro(fallbackName, Macro::TimePoint{}, std::move(events));
}

int64_t daysFromCivil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

} // namespace

json macroToJson(const Macro& macro) {
    json j;
    j["format_version"] = MACRO_FORMAT_VERSION;
    j["name"] = macro.getName();
    j["created_at"] = formatTimestamp(macro.getCreatedAt());
    j["event_count"] = macro.getEventCount();
    j["duration_ms"] = macro.getDuration().count();
    json events = json::array();
    for (const auto& event : macro.getEvents()) {
        events.push_back(eventToJson(event));
    }
    j["events"] = std::move(events);
    return j;
}

Macro macroFromJson(const json& doc, const std::string& fallbackName) {
    if (doc.is_array()) return legacyFromJson(doc, fallbackName);
    if (!doc.is_object()) throw MalformedMacroError("macro document must be a JSON object");

    const std::string where = "macro";
    int64_t version = requireInteger(doc, "format_version", where);
    if (version < 1 || version > MACRO_FORMAT_VERSION) {
        throw MalformedMacroError("unsupported format_version " + std::to_string(version));
    }

    std::string name = requireString(doc, "name", where);
    std::string created = requireString(doc, "created_at", where);
    auto createdAt = parseTimestamp(created);
    if (!createdAt) throw MalformedMacroError("created_at is not an ISO-8601 UTC timestamp: " + created);

    const json& list = requireField(doc, "events", where);
    if (!list.is_array()) throw MalformedMacroError("\"events\" must be an array");

    std::vector<Event> events;
    events.reserve(list.size());
    for (size_t i = 0; i < list.size(); ++i) {
        events.push_back(eventFromJson(list[i], i));
    }

    if (doc.contains("event_count")) {
        int64_t declared = requireInteger(doc, "event_count", where);
        if (declared != static_cast<int64_t>(events.size())) {
            throw MalformedMacroError("event_count " + std::to_string(declared) + " does not match " +
                                      std::to_string(events.size()) + " events");
        }
    }
    return Macro(std::move(name), *createdAt, std::move(events));
}

std::string serializeMacro(const Macro& macro) {
    return macroToJson(macro).dump(2);
}

Macro parseMacro(const std::string& text) {
    json doc;
    try {
        doc = json::parse(text);
    } catch (const json::exception& e) {
        throw MalformedMacroError(std::string("not valid JSON: ") + e.what());
    }
    return macroFromJson(doc);
}

void saveMacro(const Macro& macro, const fs::path& path) {
    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) throw IOError("cannot create " + path.parent_path().string() + ": " + ec.message());
    }

    std::ofstream file(path, std::ios::out | std::ios::trunc);
    if (!file) throw IOError("cannot open " + path.string() + " for writing");
    file << serializeMacro(macro) << '\n';
    file.close();
    if (!file) throw IOError("failed writing " + path.string());
    std::cout << "Recording saved to: " << path.string() << std::endl;
}

Macro loadMacro(const fs::path& path) {
    std::ifstream file(path);
    if (!file) throw IOError("cannot open " + path.string());

    json doc;
    try {
        doc = json::parse(file);
    } catch (const json::exception& e) {
        throw MalformedMacroError(path.string() + " is not valid JSON: " + e.what());
    }

    try {
        Macro macro = macroFromJson(doc, path.stem().string());
        std::cout << "Loaded recording from: " << path.string() << std::endl;
        return macro;
    } catch (const json::exception& e) {
        throw MalformedMacroError(path.string() + ": " + e.what());
    }
}

std::string formatTimestamp(Macro::TimePoint time) {
    int64_t ms = time.time_since_epoch().count();
    int64_t secs = ms / 1000;
    int64_t rem = ms % 1000;
    if (rem < 0) {
        rem += 1000;
        --secs;
    }
    std::time_t t = static_cast<std::time_t>(secs);
    std::tm utc{};
#ifdef _WIN32
    gmtime_s(&utc, &t);
#else
    gmtime_r(&t, &utc);
#endif
    std::ostringstream ss;
    ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.'
       << std::setw(3) << std::setfill('0') << rem << 'Z';
    return ss.str();
}

std::optional<Macro::TimePoint> parseTimestamp(const std::string& text) {
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    int consumed = 0;
    if (std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
                    &year, &month, &day, &hour, &minute, &second, &consumed) != 6) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60 ||
        hour < 0 || minute < 0 || second < 0) {
        return std::nullopt;
    }

    size_t pos = static_cast<size_t>(consumed);
    int64_t millis = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (digits < 3) millis = millis * 10 + (text[pos] - '0');
            ++digits;
            ++pos;
        }
        if (digits == 0) return std::nullopt;
        for (int d = digits; d < 3; ++d) millis *= 10;
    }

    std::string zone = text.substr(pos);
    if (zone != "Z" && zone != "+00:00") return std::nullopt;

    int64_t days = daysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    int64_t total = (((days * 24 + hour) * 60 + minute) * 60 + second) * 1000 + millis;
    return Macro::TimePoint(std::chrono::milliseconds(total));
}

std::vector<fs::path> listRecordings(const fs::path& dir) {
    std::vector<fs::path> recordings;
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) return recordings;
    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        if (entry.is_regular_file() && entry.path().extension() == ".json") {
            recordings.push_back(entry.path());
        }
    }
    std::sort(recordings.begin(), recordings.end());
    return recordings;
}

fs::path defaultRecordingPath(const fs::path& dir, const Macro& macro) {
    return dir / (macro.getName() + ".json");
}

} // namespace macrorec
