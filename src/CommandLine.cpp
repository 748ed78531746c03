#include "CommandLine.h"

#include <charconv>
#include <string_view>
#include <system_error>
#include <vector>

#include "Config.h"

namespace {

bool parseUnsigned(std::string_view text, unsigned& out) {
    if (text.empty()) {
        return false;
    }
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, out);
    return ec == std::errc() && ptr == last;
}

} // namespace

bool parseCommandLine(int argc, const char* const* argv, RunOptions& out, std::string& error) {
    out = RunOptions{};
    out.delay = kDefaultStepDelay;

    std::vector<std::string_view> positional;

    for (int i = 1; i < argc; i++) {
        const std::string_view arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            out.help = true;
        } else if (arg == "-i" || arg == "--interactive") {
            out.interactive = true;
        } else if (arg == "-s" || arg == "--sleep") {
            out.sleep = true;
        } else if (arg == "-p" || arg == "--print") {
            out.printSteps = true;
        } else if (arg == "-c" || arg == "--clear") {
            out.clearScreen = true;
        } else if (arg == "-d" || arg == "--diagram") {
            out.diagram = true;
        } else if (arg == "-e" || arg == "--extended") {
            out.variant = ProgramVariant::Extended;
        } else if (arg == "-g" || arg == "--gui") {
            out.gui = true;
        } else if (arg == "--delay") {
            unsigned ms = 0;
            if (i + 1 >= argc || !parseUnsigned(argv[i + 1], ms)) {
                error = "--delay expects a number of milliseconds";
                return false;
            }
            out.delay = std::chrono::milliseconds(ms);
            out.sleep = true;
            i++;
        } else if (arg == "--font") {
            if (i + 1 >= argc) {
                error = "--font expects a path";
                return false;
            }
            out.fontPath = argv[++i];
        } else if (arg.size() > 1 && arg[0] == '-') {
            error = "Unknown option " + std::string(arg);
            return false;
        } else {
            positional.push_back(arg);
        }
    }

    // Справка не требует операндов
    if (out.help) {
        return true;
    }

    if (positional.size() != 2) {
        error = positional.size() < 2 ? "Not enough arguments" : "Too many arguments";
        return false;
    }

    if (!parseUnsigned(positional[0], out.multiplier) || !parseUnsigned(positional[1], out.multiplicand)) {
        error = "Operands must be non-negative integers";
        return false;
    }

    if (!out.sleep) {
        out.delay = std::chrono::milliseconds(0);
    }
    return true;
}

std::string usage(const std::string& program) {
    return "Usage: " + program +
           " multiplier multiplicand [-i|--interactive] [-s|--sleep] [--delay MS] [-p|--print]"
           " [-c|--clear] [-d|--diagram] [-e|--extended] [-g|--gui] [--font PATH]\n";
}
