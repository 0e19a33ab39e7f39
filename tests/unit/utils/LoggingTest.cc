#include "trellis/core/Log.hh"
#include "trellis/math/MatrixOps.hh"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

namespace trellis {
namespace Tests {

class LoggingTest : public ::testing::Test {};

TEST_F(LoggingTest, LogInfoDoesNotCrash) {
    TRELLIS_LOG_INFO("Info message");
    ASSERT_TRUE(true);
}

TEST_F(LoggingTest, LogErrorDoesNotCrash) {
    TRELLIS_LOG_ERROR("Error message");
    ASSERT_TRUE(true);
}

TEST_F(LoggingTest, LogWithFormatArgs) {
    TRELLIS_LOG_INFO("Cell ({}, {}) = {}", 3, 0, 10.5);
    ASSERT_TRUE(true);
}

TEST_F(LoggingTest, ChannelLoggersAreDistinct) {
    ASSERT_NE(trellis::log::logger(), nullptr);
    ASSERT_NE(trellis::log::mathLogger(), nullptr);
    EXPECT_NE(trellis::log::logger(), trellis::log::mathLogger());
}

TEST_F(LoggingTest, InitIsIdempotent) {
    quill::Logger* before = trellis::log::logger();
    trellis::log::init();
    EXPECT_EQ(trellis::log::logger(), before);
}

TEST_F(LoggingTest, SetChannelLevels) {
    trellis::log::setMathLevel(quill::LogLevel::Debug);
    TRELLIS_MATH_LOG_DEBUG("Math channel at debug");
    trellis::log::setLevel(quill::LogLevel::Warning);
    TRELLIS_LOG_INFO("Filtered out");
    // Reset to default
    trellis::log::setMathLevel(quill::LogLevel::Info);
    trellis::log::setLevel(quill::LogLevel::Info);
    ASSERT_TRUE(true);
}

TEST_F(LoggingTest, FileSinkAttachesAfterLibraryHasLogged) {
    // A singular inversion logs through the math channel, creating the loggers.
    auto singular = trellis::math::invert(trellis::math::zero<trellis::math::Matrix>());
    ASSERT_TRUE(singular.isError());
    ASSERT_TRUE(trellis::log::logFilePath().empty());

    const std::filesystem::path path = std::filesystem::temp_directory_path() / "trellis_logging_test.log";
    std::filesystem::remove(path);

    trellis::log::setMathLevel(quill::LogLevel::Debug);
    trellis::log::init(path.string().c_str());

    EXPECT_EQ(trellis::log::logFilePath(), path.string());
    EXPECT_EQ(trellis::log::mathLogger()->get_log_level(), quill::LogLevel::Debug); // level carried over

    TRELLIS_LOG_INFO("Written after file sink attached: {}", 42);
    trellis::log::logger()->flush_log();

    std::ifstream in(path);
    ASSERT_TRUE(in.is_open());
    std::stringstream contents;
    contents << in.rdbuf();
    EXPECT_NE(contents.str().find("Written after file sink attached: 42"), std::string::npos);

    // Same path again keeps the current loggers
    quill::Logger* withFile = trellis::log::logger();
    trellis::log::init(path.string().c_str());
    EXPECT_EQ(trellis::log::logger(), withFile);

    trellis::log::setMathLevel(quill::LogLevel::Info);
}

} // namespace Tests
} // namespace trellis
