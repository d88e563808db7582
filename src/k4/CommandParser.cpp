#include "rotbridge/k4/CommandParser.hpp"
#include "rotbridge/log/Log.hpp"

#include <cctype>
#include <limits>

namespace rotbridge::k4 {
namespace {

bool isAsciiDigit(char c) {
    return c >= '0' && c <= '9';
}

bool isAsciiSpace(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\v' || c == '\f';
}

char upper(char c) {
    return static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
}

bool equalsIgnoreCase(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (upper(a[i]) != upper(b[i])) return false;
    }
    return true;
}

// Parses the digit run starting at text[pos]; saturates at INT_MAX.
int parseDigitRun(std::string_view text, std::size_t pos) {
    constexpr long long kMax = std::numeric_limits<int>::max();
    long long value = 0;
    for (; pos < text.size() && isAsciiDigit(text[pos]); ++pos) {
        value = value * 10 + (text[pos] - '0');
        if (value > kMax) {
            return static_cast<int>(kMax);
        }
    }
    return static_cast<int>(value);
}

Command classify(std::string_view text) {
    if (text.empty()) {
        return Command::invalid();
    }

    const char lead = upper(text.front());

    if (lead == 'C') {
        return Command::query();
    }

    if (lead == 'M' && text.size() > 1 && isAsciiDigit(text[1])) {
        return Command::moveTo(parseDigitRun(text, 1));
    }

    if (text == ";" || equalsIgnoreCase(text, "S") || equalsIgnoreCase(text, "STOP")) {
        return Command::stop();
    }

    return Command::invalid();
}

} // namespace

std::string normaliseRequest(std::string_view raw) {
    std::string ascii;
    ascii.reserve(raw.size());
    for (char c : raw) {
        const auto byte = static_cast<unsigned char>(c);
        if (byte >= 0x80) {
            continue; // not 7-bit ASCII text, drop it
        }
        ascii.push_back(c);
    }

    std::size_t first = 0;
    while (first < ascii.size() && isAsciiSpace(ascii[first])) ++first;
    std::size_t last = ascii.size();
    while (last > first && isAsciiSpace(ascii[last - 1])) --last;

    return ascii.substr(first, last - first);
}

Command parseCommand(std::string_view text) {
    const std::string request = normaliseRequest(text);
    logTraffic("RECEIVED", "PROGRAM", request);

    const Command command = classify(request);
    if (command.isValid()) {
        logTraffic("PARSED", "TRANSLATOR", "Command: " + command.describe());
    } else {
        logTraffic("PARSED", "TRANSLATOR", "No valid command found");
    }
    return command;
}

Command parseCommand(const std::uint8_t* data, std::size_t size) {
    if (!data || size == 0) {
        return parseCommand(std::string_view{});
    }
    return parseCommand(std::string_view(reinterpret_cast<const char*>(data), size));
}

} // namespace rotbridge::k4
