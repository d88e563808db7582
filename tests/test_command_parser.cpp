#include "rotbridge/k4/CommandParser.hpp"
#include "TestHarness.hpp"

#include <climits>
#include <cstdint>
#include <string>

using rotbridge::core::Command;
using rotbridge::k4::parseCommand;
using rotbridge::k4::normaliseRequest;

static void testQueryIsCaseInsensitive() {
    ASSERT_TRUE(parseCommand("c").isQuery(), "lower-case c");
    ASSERT_TRUE(parseCommand("C").isQuery(), "upper-case C");
    ASSERT_TRUE(parseCommand(" c ").isQuery(), "padded c");
    ASSERT_TRUE(parseCommand("C\r\n").isQuery(), "C with line ending");
    ASSERT_TRUE(parseCommand("CLIENT").isQuery(), "anything starting with C");
}

static void testMoveParsesDigitRun() {
    ASSERT_TRUE(parseCommand("M030") == Command::moveTo(30), "M030 -> 30");
    ASSERT_TRUE(parseCommand("m7") == Command::moveTo(7), "m7 -> 7");
    ASSERT_TRUE(parseCommand("M359\r") == Command::moveTo(359), "trailing CR trimmed");
    ASSERT_TRUE(parseCommand("M000") == Command::moveTo(0), "all zeros");
    ASSERT_TRUE(parseCommand("M12ab") == Command::moveTo(12), "text after digits ignored");
    ASSERT_TRUE(parseCommand("M1234") == Command::moveTo(1234), "no range check at parse time");
}

static void testMoveWithoutDigitsIsInvalid() {
    ASSERT_TRUE(!parseCommand("M").isValid(), "bare M");
    ASSERT_TRUE(!parseCommand("M ").isValid(), "M then space");
    ASSERT_TRUE(!parseCommand("MX30").isValid(), "M then letter");
    ASSERT_TRUE(!parseCommand("M 30").isValid(), "digits must follow M directly");
}

static void testHugeAzimuthSaturates() {
    const auto command = parseCommand("M99999999999999999999");
    ASSERT_TRUE(command.isMove(), "still a move");
    ASSERT_EQ(command.azimuth, INT_MAX, "saturated azimuth");
}

static void testStopForms() {
    ASSERT_TRUE(parseCommand("S").isStop(), "S");
    ASSERT_TRUE(parseCommand("s").isStop(), "s");
    ASSERT_TRUE(parseCommand("stop").isStop(), "stop");
    ASSERT_TRUE(parseCommand("StOp\n").isStop(), "mixed-case STOP");
    ASSERT_TRUE(parseCommand(";").isStop(), "semicolon");
    ASSERT_TRUE(!parseCommand("SS").isValid(), "SS is not a stop");
    ASSERT_TRUE(!parseCommand("STOPPED").isValid(), "STOP must be exact");
    ASSERT_TRUE(!parseCommand(";;").isValid(), "only a single semicolon");
}

static void testEverythingElseIsInvalid() {
    ASSERT_TRUE(!parseCommand("").isValid(), "empty");
    ASSERT_TRUE(!parseCommand("   \r\n").isValid(), "whitespace only");
    ASSERT_TRUE(!parseCommand("XYZ").isValid(), "XYZ");
    ASSERT_TRUE(!parseCommand("JUNK").isValid(), "JUNK");
    ASSERT_TRUE(!parseCommand(nullptr, 0).isValid(), "null buffer");
}

static void testNonAsciiBytesAreDropped() {
    const std::uint8_t raw[] = {0xFF, 'c', 0x80, '\r', '\n'};
    ASSERT_TRUE(parseCommand(raw, sizeof(raw)).isQuery(), "high bytes dropped before classify");

    const std::uint8_t move[] = {'M', 0xC3, 0xA9, '4', '5'};
    ASSERT_TRUE(parseCommand(move, sizeof(move)) == Command::moveTo(45), "high bytes inside a move");

    ASSERT_EQ(normaliseRequest("\t  M030 \r\n"), std::string("M030"), "trimmed");
    ASSERT_EQ(normaliseRequest("\xE2\x82\xAC"), std::string(), "only high bytes");
}

int main() {
    // Keep the traffic log out of the test output.
    rotbridge::setInfoLogHandler([](std::string_view) {});

    testQueryIsCaseInsensitive();
    testMoveParsesDigitRun();
    testMoveWithoutDigitsIsInvalid();
    testHugeAzimuthSaturates();
    testStopForms();
    testEverythingElseIsInvalid();
    testNonAsciiBytesAreDropped();

    rotbridge::resetLogHandlers();
    return finishTests("CommandParser tests");
}
