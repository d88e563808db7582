#include "rotbridge/rt21/Rt21Command.hpp"
#include "rotbridge/rt21/Rt21Config.hpp"
#include "rotbridge/rt21/Rt21Response.hpp"
#include "TestHarness.hpp"

#include <climits>
#include <string>
#include <system_error>

using rotbridge::core::Command;
using rotbridge::rt21::decodeAzimuth;
using rotbridge::rt21::encodeCommand;

static std::string encoded(const Command& command) {
    auto wire = encodeCommand(command);
    return wire ? *wire : std::string("<error: ") + wire.error().message() + ">";
}

static void testMoveTable() {
    ASSERT_EQ(encoded(Command::moveTo(0)), std::string("AP0000\r;"), "0");
    ASSERT_EQ(encoded(Command::moveTo(35)), std::string("AP0035\r;"), "35");
    ASSERT_EQ(encoded(Command::moveTo(180)), std::string("AP0180\r;"), "180");
    ASSERT_EQ(encoded(Command::moveTo(359)), std::string("AP0359\r;"), "359");
    ASSERT_EQ(encoded(Command::moveTo(999)), std::string("AP0999\r;"), "largest three-digit value");
}

static void testMoveFieldIsAlwaysThreeDigits() {
    for (int n = 0; n <= 999; n += 37) {
        const std::string wire = encoded(Command::moveTo(n));
        ASSERT_EQ(wire.size(), std::string("AP0000\r;").size(), "fixed width");
        ASSERT_EQ(std::stoi(wire.substr(3, 3)), n, "field holds the azimuth");
    }
}

static void testStop() {
    ASSERT_EQ(encoded(Command::stop()), std::string(";"), "stop");
}

static void testUnencodable() {
    auto tooBig = encodeCommand(Command::moveTo(1000));
    ASSERT_TRUE(!tooBig, "1000 does not fit the field");
    ASSERT_TRUE(tooBig.error() == std::errc::result_out_of_range, "1000 reports out of range");

    auto saturated = encodeCommand(Command::moveTo(INT_MAX));
    ASSERT_TRUE(!saturated, "INT_MAX rejected");

    auto negative = encodeCommand(Command::moveTo(-1));
    ASSERT_TRUE(!negative && negative.error() == std::errc::result_out_of_range, "negative rejected");

    auto query = encodeCommand(Command::query());
    ASSERT_TRUE(!query && query.error() == std::errc::operation_not_supported,
                "queries use the fixed literal instead");

    auto invalid = encodeCommand(Command::invalid());
    ASSERT_TRUE(!invalid && invalid.error() == std::errc::invalid_argument, "invalid never encodes");

    ASSERT_EQ(std::string(rotbridge::rt21::config::RT21_QUERY_POSITION), std::string("AI1\r;"),
              "query literal");
}

static void testDecodeFirstDigitRun() {
    auto plain = decodeAzimuth("030;");
    ASSERT_TRUE(plain && *plain == 30, "030; -> 30");

    auto padded = decodeAzimuth("\r\nAZ 275;");
    ASSERT_TRUE(padded && *padded == 275, "prefix skipped");

    auto twoRuns = decodeAzimuth("12;345;");
    ASSERT_TRUE(twoRuns && *twoRuns == 12, "first run wins");

    auto zero = decodeAzimuth("000;");
    ASSERT_TRUE(zero && *zero == 0, "explicit zero is a position");
}

static void testDecodeFailures() {
    auto none = decodeAzimuth(";;;no digits");
    ASSERT_TRUE(!none, "no digits is a failure, not zero");
    ASSERT_TRUE(!none && none.error() == std::errc::protocol_error, "protocol error");

    ASSERT_TRUE(!decodeAzimuth(""), "empty reply");

    auto huge = decodeAzimuth("99999999999999999999;");
    ASSERT_TRUE(!huge && huge.error() == std::errc::result_out_of_range, "overflow rejected");
}

int main() {
    testMoveTable();
    testMoveFieldIsAlwaysThreeDigits();
    testStop();
    testUnencodable();
    testDecodeFirstDigitRun();
    testDecodeFailures();

    return finishTests("RT21 command tests");
}
