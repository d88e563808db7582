#include "rotbridge/log/Log.hpp"
#include "TestHarness.hpp"

#include <cctype>
#include <string>
#include <vector>

using rotbridge::log::escapePayload;

static void testEscapePayload() {
    ASSERT_EQ(escapePayload("AI1\r;"), std::string("'AI1\\r;'"), "carriage return");
    ASSERT_EQ(escapePayload("AZ=045\r\n"), std::string("'AZ=045\\r\\n'"), "line ending");
    ASSERT_EQ(escapePayload("a\tb"), std::string("'a\\tb'"), "tab");
    ASSERT_EQ(escapePayload(std::string("\x01\x7f", 2)), std::string("'\\x01\\x7f'"), "other control bytes");
    ASSERT_EQ(escapePayload("it's"), std::string("'it\\'s'"), "quote");
    ASSERT_EQ(escapePayload(""), std::string("''"), "empty");
}

static void testTrafficLine() {
    std::vector<std::string> lines;
    rotbridge::setInfoLogHandler([&lines](std::string_view message) {
        lines.emplace_back(message);
    });

    rotbridge::logTraffic("SENT", "RT21", "AP0200\r;");
    rotbridge::resetLogHandlers();

    REQUIRE_TRUE(lines.size() == 1, "one line per call");
    const std::string& line = lines.front();

    // [HH:MM:SS.mmm] SENT RT21: 'AP0200\r;'
    ASSERT_TRUE(line.size() > 14 && line[0] == '[' && line[13] == ']', "bracketed timestamp");
    ASSERT_TRUE(line.size() > 14 && line[3] == ':' && line[6] == ':' && line[9] == '.', "timestamp separators");
    bool digits = true;
    for (int i : {1, 2, 4, 5, 7, 8, 10, 11, 12}) {
        digits = digits && std::isdigit(static_cast<unsigned char>(line[i]));
    }
    ASSERT_TRUE(digits, "timestamp digits");
    ASSERT_EQ(line.substr(14), std::string(" SENT RT21: 'AP0200\\r;'\n"), "direction, channel, payload");
}

static void testHandlersAreSeparate() {
    std::string info;
    std::string error;
    rotbridge::setLogHandlers(
        [&info](std::string_view message) { info.append(message); },
        [&error](std::string_view message) { error.append(message); });

    rotbridge::logInfo("port ", 6555, "\n");
    rotbridge::logError("connect failed: ", "refused", "\n");
    rotbridge::resetLogHandlers();

    ASSERT_EQ(info, std::string("port 6555\n"), "info built from pieces");
    ASSERT_EQ(error, std::string("connect failed: refused\n"), "error goes to its own sink");
}

int main() {
    testEscapePayload();
    testTrafficLine();
    testHandlersAreSeparate();

    return finishTests("Log tests");
}
