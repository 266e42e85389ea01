#include "macrorec/compiler.hpp"
#include "macrorec/errors.hpp"
#include "macrorec/macro_store.hpp"
#include "macrorec/player.hpp"
#include "macrorec/recorder.hpp"
#include "macrorec/settings.hpp"

#include <algorithm>
#include <condition_variable>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

using namespace macrorec;
namespace fs = std::filesystem;

namespace {

void printUsage() {
    std::cout << "Usage: macrorec [--config <settings.json>] [command]\n"
              << "\n"
              << "Commands:\n"
              << "  record <file> [--no-moves]                   record until the stop key is pressed\n"
              << "  play <file> [--speed S] [--loops N] [--no-moves]\n"
              << "  compile <file> <output> [--target x11|win32] [--speed S] [--loops N]\n"
              << "                          [--no-moves] [--build] [--cxx <compiler>]\n"
              << "  info <file>                                  show name, timing and statistics\n"
              << "  list                                         list the recordings folder\n"
              << "\n"
              << "Without a command an interactive menu is shown." << std::endl;
}

double parseSpeed(const std::string& text) {
    size_t used = 0;
    double value = 0.0;
    try {
        value = std::stod(text, &used);
    } catch (const std::exception&) {
        throw InvalidParameterError("speed must be a number, got \"" + text + "\"");
    }
    if (used != text.size()) throw InvalidParameterError("speed must be a number, got \"" + text + "\"");
    return value;
}

int parseCount(const std::string& text, const char* what) {
    size_t used = 0;
    int value = 0;
    try {
        value = std::stoi(text, &used);
    } catch (const std::exception&) {
        throw InvalidParameterError(std::string(what) + " must be a whole number, got \"" + text + "\"");
    }
    if (used != text.size()) {
        throw InvalidParameterError(std::string(what) + " must be a whole number, got \"" + text + "\"");
    }
    return value;
}

// Removes "--flag value" from args and returns value, or an empty string when absent.
std::string takeOption(std::vector<std::string>& args, const std::string& flag) {
    auto it = std::find(args.begin(), args.end(), flag);
    if (it == args.end()) return {};
    if (it + 1 == args.end()) throw InvalidParameterError(flag + " needs a value");
    std::string value = *(it + 1);
    args.erase(it, it + 2);
    return value;
}

bool takeFlag(std::vector<std::string>& args, const std::string& flag) {
    auto it = std::find(args.begin(), args.end(), flag);
    if (it == args.end()) return false;
    args.erase(it);
    return true;
}

void expectPositional(const std::vector<std::string>& args, size_t count, const char* command) {
    for (const auto& arg : args) {
        if (arg.rfind("--", 0) == 0) throw InvalidParameterError(std::string("unknown option ") + arg);
    }
    if (args.size() != count) {
        throw InvalidParameterError(std::string(command) + " expects " + std::to_string(count) + " argument(s)");
    }
}

class MacroConsole {
public:
    explicit MacroConsole(Settings settings) : settings(std::move(settings)) {}

    Macro record(bool recordMouseMoves) {
        RecorderOptions options = toRecorderOptions(settings);
        options.recordMouseMoves = options.recordMouseMoves && recordMouseMoves;
        Recorder recorder(capture(), options);

        std::mutex stopMutex;
        std::condition_variable stopPressed;
        bool stopRequested = false;
        recorder.setObserver([&](const RawInput& raw) {
            if (isStopKey(raw)) {
                {
                    std::lock_guard<std::mutex> lk(stopMutex);
                    stopRequested = true;
                }
                stopPressed.notify_all();
            }
        });

        recorder.start();
        std::cout << "Press " << keyName(settings.stopKey) << " to stop recording." << std::endl;
        {
            std::unique_lock<std::mutex> lk(stopMutex);
            stopPressed.wait(lk, [&] { return stopRequested; });
        }
        Macro macro = recorder.stop();
        printStats(macro);
        return macro;
    }

    PlayerState play(const Macro& macro, const PlaybackOptions& options) {
        Player& p = player();
        p.setProgressCallback([](size_t cursor, size_t total, int loopIndex, int loopCount) {
            if (cursor == total && loopCount > 1) {
                std::cout << "Loop " << (loopIndex + 1) << "/" << loopCount << " done" << std::endl;
            }
        });
        p.play(macro, options);

        // the stop key ends playback early; without capture playback just runs to the end
        bool watching = false;
        try {
            // the worker unwinds on its own; wait() below collects the result
            capture().start([this, &p](const RawInput& raw) {
                if (isStopKey(raw)) p.requestStop();
            });
            watching = true;
            std::cout << "Press " << keyName(settings.stopKey) << " to stop playback." << std::endl;
        } catch (const PermissionError& e) {
            std::cerr << "Stop key unavailable: " << e.what() << std::endl;
        }

        PlayerState result = p.wait();
        if (watching) capture().stop();
        return result;
    }

    void info(const Macro& macro) const {
        std::cout << "Name:        " << macro.getName() << std::endl;
        std::cout << "Created:     " << formatTimestamp(macro.getCreatedAt()) << std::endl;
        printStats(macro);
        const auto& events = macro.getEvents();
        size_t shown = std::min<size_t>(events.size(), 10);
        for (size_t i = 0; i < shown; ++i) std::cout << "  " << describe(events[i]) << std::endl;
        if (shown < events.size()) std::cout << "  ... " << (events.size() - shown) << " more" << std::endl;
    }

    std::vector<fs::path> list() const {
        auto recordings = listRecordings(settings.recordingsDir);
        if (!recordings.empty()) {
            std::cout << "Available recordings:" << std::endl;
            for (size_t i = 0; i < recordings.size(); i++) {
                std::cout << "  " << (i + 1) << ". " << recordings[i].string() << std::endl;
            }
        } else {
            std::cout << "No recordings found." << std::endl;
        }
        return recordings;
    }

    void interactiveMode() {
        bool shouldExit = false;
        while (!shouldExit) {
            std::cout << "\n" << std::string(50, '=') << std::endl;
            std::cout << "macrorec - Interactive Mode" << std::endl;
            std::cout << std::string(50, '=') << std::endl;
            std::cout << "Speed: " << settings.speed << "x   Stop key: " << keyName(settings.stopKey) << std::endl;
            std::cout << "1. Record" << std::endl;
            std::cout << "2. Play Last Recording" << std::endl;
            std::cout << "3. Play Last Recording in Loop" << std::endl;
            std::cout << "4. Load and Play Recording File" << std::endl;
            std::cout << "5. List All Recordings" << std::endl;
            std::cout << "6. Set Playback Speed" << std::endl;
            std::cout << "7. Compile Last Recording" << std::endl;
            std::cout << "8. Exit" << std::endl;
            std::cout << std::string(50, '-') << std::endl;
            std::cout << "Choose option (1-8): ";
            std::string choice;
            if (!std::getline(std::cin, choice)) break;

            try {
                if (choice == "1") {
                    Macro macro = record(true);
                    if (!macro.isEmpty()) saveMacro(macro, defaultRecordingPath(settings.recordingsDir, macro));
                    lastMacro = std::make_unique<Macro>(std::move(macro));
                } else if (choice == "2") {
                    if (lastMacro) play(*lastMacro, toPlaybackOptions(settings));
                    else std::cout << "No recording available. Record something first!" << std::endl;
                } else if (choice == "3") {
                    if (lastMacro) {
                        PlaybackOptions options = toPlaybackOptions(settings);
                        options.loops = parseCount(prompt("Number of loops (1-999): "), "loops");
                        play(*lastMacro, options);
                    } else {
                        std::cout << "No recording available. Record something first!" << std::endl;
                    }
                } else if (choice == "4") {
                    auto recordings = list();
                    if (!recordings.empty()) {
                        int idx = parseCount(prompt("Enter recording number: "), "recording number") - 1;
                        if (idx >= 0 && idx < static_cast<int>(recordings.size())) {
                            lastMacro = std::make_unique<Macro>(loadMacro(recordings[idx]));
                            std::cout << "Playing back: " << recordings[idx].string() << std::endl;
                            play(*lastMacro, toPlaybackOptions(settings));
                        } else {
                            std::cout << "Number out of range!" << std::endl;
                        }
                    }
                } else if (choice == "5") {
                    list();
                } else if (choice == "6") {
                    double speed = parseSpeed(prompt("Speed (0.1-5.0): "));
                    validatePlaybackParameters(speed, settings.loops);
                    settings.speed = speed;
                } else if (choice == "7") {
                    if (lastMacro) {
                        CompileOptions options;
                        options.speed = settings.speed;
                        options.replayMouseMoves = settings.replayMouseMoves;
                        compile(*lastMacro, prompt("Output file: "), options);
                    } else {
                        std::cout << "No recording available. Record something first!" << std::endl;
                    }
                } else if (choice == "8") {
                    shouldExit = true;
                    std::cout << "Exiting..." << std::endl;
                } else {
                    std::cout << "Invalid option!" << std::endl;
                }
            } catch (const MacroError& e) {
                std::cerr << "Error: " << e.what() << std::endl;
            }
        }
    }

    const Settings& getSettings() const { return settings; }

private:
    bool isStopKey(const RawInput& raw) const {
        return raw.kind == EventKind::KEY_DOWN && !raw.injected && raw.key == settings.stopKey;
    }

    static std::string prompt(const char* text) {
        std::cout << text;
        std::string line;
        std::getline(std::cin, line);
        return line;
    }

    static void printStats(const Macro& macro) {
        MacroStats stats = macro.getStats();
        std::cout << "Events:      " << stats.totalEvents << std::endl;
        std::cout << "Duration:    " << (stats.duration.count() / 1000.0) << " s" << std::endl;
        std::cout << "Clicks:      " << stats.mouseClicks << std::endl;
        std::cout << "Moves:       " << stats.mouseMoves << std::endl;
        std::cout << "Scrolls:     " << stats.mouseScrolls << std::endl;
        std::cout << "Key presses: " << stats.keyPresses << std::endl;
    }

    InputCapture& capture() {
        if (!systemCapture) systemCapture = createSystemCapture();
        return *systemCapture;
    }

    Player& player() {
        if (!systemPlayer) {
            if (!systemSynth) systemSynth = createSystemSynthesizer();
            systemPlayer = std::make_unique<Player>(*systemSynth);
        }
        return *systemPlayer;
    }

    Settings settings;
    std::unique_ptr<InputCapture> systemCapture;
    std::unique_ptr<InputSynthesizer> systemSynth;
    std::unique_ptr<Player> systemPlayer;
    std::unique_ptr<Macro> lastMacro;
};

int run(std::vector<std::string> args) {
    Settings settings;
    std::string configPath = takeOption(args, "--config");
    if (!configPath.empty()) settings = loadSettings(configPath);

    MacroConsole console(settings);
    if (args.empty()) {
        console.interactiveMode();
        return 0;
    }

    std::string command = args.front();
    args.erase(args.begin());

    if (command == "record") {
        bool noMoves = takeFlag(args, "--no-moves");
        expectPositional(args, 1, "record");
        Macro macro = console.record(!noMoves);
        if (macro.isEmpty()) {
            std::cout << "Nothing recorded, no file written." << std::endl;
            return 1;
        }
        saveMacro(macro, args[0]);
        return 0;
    }

    if (command == "play") {
        PlaybackOptions options = toPlaybackOptions(console.getSettings());
        std::string speed = takeOption(args, "--speed");
        std::string loops = takeOption(args, "--loops");
        if (!speed.empty()) options.speed = parseSpeed(speed);
        if (!loops.empty()) options.loops = parseCount(loops, "loops");
        if (takeFlag(args, "--no-moves")) options.replayMouseMoves = false;
        expectPositional(args, 1, "play");
        Macro macro = loadMacro(args[0]);
        return console.play(macro, options) == PlayerState::COMPLETED ? 0 : 1;
    }

    if (command == "compile") {
        CompileOptions options;
        options.speed = console.getSettings().speed;
        options.loops = console.getSettings().loops;
        options.replayMouseMoves = console.getSettings().replayMouseMoves;
        std::string target = takeOption(args, "--target");
        std::string speed = takeOption(args, "--speed");
        std::string loops = takeOption(args, "--loops");
        std::string cxx = takeOption(args, "--cxx");
        if (!target.empty()) options.target = compileTargetFromName(target);
        if (!speed.empty()) options.speed = parseSpeed(speed);
        if (!loops.empty()) options.loops = parseCount(loops, "loops");
        if (!cxx.empty()) options.cxx = cxx;
        if (takeFlag(args, "--no-moves")) options.replayMouseMoves = false;
        options.build = takeFlag(args, "--build");
        expectPositional(args, 2, "compile");
        compile(loadMacro(args[0]), args[1], options);
        return 0;
    }

    if (command == "info") {
        expectPositional(args, 1, "info");
        console.info(loadMacro(args[0]));
        return 0;
    }

    if (command == "list") {
        expectPositional(args, 0, "list");
        console.list();
        return 0;
    }

    if (command == "help" || command == "--help" || command == "-h") {
        printUsage();
        return 0;
    }

    std::cerr << "Unknown command: " << command << std::endl;
    printUsage();
    return 2;
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        return run(std::vector<std::string>(argv + 1, argv + argc));
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
