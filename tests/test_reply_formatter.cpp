#include "rotbridge/k4/ReplyFormatter.hpp"
#include "TestHarness.hpp"

#include <string>
#include <system_error>

using rotbridge::core::Command;
using rotbridge::core::TranslationResult;
using rotbridge::k4::MoveStopFailurePolicy;
using rotbridge::k4::formatReply;

static const TranslationResult kBrokenPipe =
    TranslationResult::failed(std::make_error_code(std::errc::broken_pipe));

static void testQueryReplies() {
    ASSERT_EQ(formatReply(Command::query(), TranslationResult::position(45)),
              std::string("AZ=045\r\n"), "padded position");
    ASSERT_EQ(formatReply(Command::query(), TranslationResult::position(0)),
              std::string("AZ=000\r\n"), "zero");
    ASSERT_EQ(formatReply(Command::query(), TranslationResult::position(359)),
              std::string("AZ=359\r\n"), "three digits");
    ASSERT_EQ(formatReply(Command::query(), kBrokenPipe),
              std::string("ERROR\r\n"), "failed query");
}

static void testMoveAndStopDefaultToOk() {
    ASSERT_EQ(formatReply(Command::moveTo(200), TranslationResult::acknowledged()),
              std::string("OK\r\n"), "move delivered");
    ASSERT_EQ(formatReply(Command::stop(), TranslationResult::acknowledged()),
              std::string("OK\r\n"), "stop delivered");

    // Existing K4 controllers expect OK even when the RT21 write failed.
    ASSERT_EQ(formatReply(Command::moveTo(200), kBrokenPipe),
              std::string("OK\r\n"), "failed move still OK");
    ASSERT_EQ(formatReply(Command::stop(), kBrokenPipe),
              std::string("OK\r\n"), "failed stop still OK");
}

static void testReportErrorPolicy() {
    ASSERT_EQ(formatReply(Command::stop(), kBrokenPipe, MoveStopFailurePolicy::ReportError),
              std::string("ERROR\r\n"), "failed stop surfaces");
    ASSERT_EQ(formatReply(Command::moveTo(10), kBrokenPipe, MoveStopFailurePolicy::ReportError),
              std::string("ERROR\r\n"), "failed move surfaces");
    ASSERT_EQ(formatReply(Command::moveTo(10), TranslationResult::acknowledged(),
                          MoveStopFailurePolicy::ReportError),
              std::string("OK\r\n"), "delivered move still OK");
}

static void testInvalidIsAlwaysError() {
    ASSERT_EQ(formatReply(Command::invalid(), TranslationResult::acknowledged()),
              std::string("ERROR\r\n"), "invalid with ack");
    ASSERT_EQ(formatReply(Command::invalid(), TranslationResult::position(10)),
              std::string("ERROR\r\n"), "invalid with position");
}

int main() {
    testQueryReplies();
    testMoveAndStopDefaultToOk();
    testReportErrorPolicy();
    testInvalidIsAlwaysError();

    return finishTests("ReplyFormatter tests");
}
