#include "Logger.h"
#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

namespace {

class CaptureHandler : public pl::logging::Handler {
public:
    void emit(pl::logging::Level level, const std::string& formatted) override {
        if (level < level_) {
            return;
        }
        records.push_back(formatted);
    }

    std::vector<std::string> records;
};

} // namespace

TEST(LoggerTest, RootLoggerWorks) {
    auto rootLogger = pl::logging::getRootLogger();
    EXPECT_NO_THROW({
        rootLogger.debug << "Debug message";
        rootLogger.info << "Info message";
        rootLogger.warning << "Warning message";
        rootLogger.error << "Error message";
        rootLogger.critical << "Critical message";
    });
}

TEST(LoggerTest, NamedLoggerHasFullName) {
    auto logger = pl::logging::getLogger("ledger.block");
    EXPECT_EQ(logger.getFullName(), "ledger.block");
}

TEST(LoggerTest, SameNameReturnsSameNode) {
    auto first = pl::logging::getLogger("same_node");
    auto second = pl::logging::getLogger("same_node");
    EXPECT_EQ(first, second);
    EXPECT_NE(first, pl::logging::getLogger("other_node"));
}

TEST(LoggerTest, FormatsLevelAndName) {
    auto logger = pl::logging::getLogger("format_test");
    auto capture = std::make_shared<CaptureHandler>();
    logger.addHandler(capture);
    logger.setPropagate(false);

    logger.info << "Mined block " << 7;

    ASSERT_EQ(capture->records.size(), 1u);
    const std::string& record = capture->records[0];
    EXPECT_NE(record.find("[INFO]"), std::string::npos);
    EXPECT_NE(record.find("[format_test]"), std::string::npos);
    EXPECT_NE(record.find("Mined block 7"), std::string::npos);
}

TEST(LoggerTest, LoggingLevelFiltersMessages) {
    auto logger = pl::logging::getLogger("level_test");
    auto capture = std::make_shared<CaptureHandler>();
    logger.addHandler(capture);
    logger.setPropagate(false);
    logger.setLevel(pl::logging::Level::WARNING);

    EXPECT_EQ(logger.getLevel(), pl::logging::Level::WARNING);

    logger.debug << "Debug message";
    logger.info << "Info message";
    logger.warning << "Warning message";
    logger.error << "Error message";

    EXPECT_EQ(capture->records.size(), 2u);
}

TEST(LoggerTest, ChildPropagatesToParentHandlers) {
    auto parent = pl::logging::getLogger("propagate_parent");
    auto child = pl::logging::getLogger("propagate_parent.child");
    auto capture = std::make_shared<CaptureHandler>();
    parent.addHandler(capture);
    parent.setPropagate(false);

    child.info << "From child";

    ASSERT_EQ(capture->records.size(), 1u);
    EXPECT_NE(capture->records[0].find("[propagate_parent.child]"), std::string::npos);
}

TEST(LoggerTest, ParentLevelFiltersPropagatedRecords) {
    auto parent = pl::logging::getLogger("filter_parent");
    auto child = pl::logging::getLogger("filter_parent.child");
    auto capture = std::make_shared<CaptureHandler>();
    parent.addHandler(capture);
    parent.setPropagate(false);
    parent.setLevel(pl::logging::Level::ERROR);

    child.info << "Dropped by parent";
    child.error << "Kept by parent";

    ASSERT_EQ(capture->records.size(), 1u);
    EXPECT_NE(capture->records[0].find("Kept by parent"), std::string::npos);
}

TEST(LoggerTest, PropagateFalseStopsAtNode) {
    auto parent = pl::logging::getLogger("stop_parent");
    auto child = pl::logging::getLogger("stop_parent.child");
    auto parentCapture = std::make_shared<CaptureHandler>();
    auto childCapture = std::make_shared<CaptureHandler>();
    parent.addHandler(parentCapture);
    parent.setPropagate(false);
    child.addHandler(childCapture);
    child.setPropagate(false);

    child.warning << "Local only";

    EXPECT_EQ(childCapture->records.size(), 1u);
    EXPECT_TRUE(parentCapture->records.empty());
}

TEST(LoggerTest, ClearHandlersRemovesOutput) {
    auto logger = pl::logging::getLogger("clear_test");
    auto capture = std::make_shared<CaptureHandler>();
    logger.addHandler(capture);
    logger.setPropagate(false);
    logger.clearHandlers();

    logger.error << "Nobody listens";

    EXPECT_TRUE(capture->records.empty());
}

TEST(LoggerTest, FileHandlerWorks) {
    auto fileLogger = pl::logging::getLogger("file_test");
    EXPECT_NO_THROW(fileLogger.addFileHandler("pow_ledger_logger_test.log",
                                              pl::logging::Level::DEBUG));
    EXPECT_NO_THROW({
        fileLogger.debug << "Debug message";
        fileLogger.info << "Info message";
    });
}

TEST(LoggerTest, FileHandlerThrowsOnBadPath) {
    auto logger = pl::logging::getLogger("bad_file_test");
    EXPECT_THROW(logger.addFileHandler("/nonexistent-dir/sub/log.txt"),
                 std::runtime_error);
}

TEST(LoggerTest, CopiedLoggerWritesToSameNode) {
    auto original = pl::logging::getLogger("copy_test");
    auto capture = std::make_shared<CaptureHandler>();
    original.addHandler(capture);
    original.setPropagate(false);

    pl::logging::Logger copy = original;
    copy.info << "Through the copy";

    EXPECT_EQ(copy, original);
    EXPECT_EQ(capture->records.size(), 1u);
}

TEST(LoggerTest, ParseLevelAcceptsKnownNames) {
    pl::logging::Level level = pl::logging::Level::DEBUG;
    EXPECT_TRUE(pl::logging::parseLevel("warning", level));
    EXPECT_EQ(level, pl::logging::Level::WARNING);
    EXPECT_TRUE(pl::logging::parseLevel("ERROR", level));
    EXPECT_EQ(level, pl::logging::Level::ERROR);
    EXPECT_FALSE(pl::logging::parseLevel("verbose", level));
    EXPECT_EQ(level, pl::logging::Level::ERROR);
    EXPECT_STREQ(pl::logging::levelToString(pl::logging::Level::CRITICAL), "CRITICAL");
}
