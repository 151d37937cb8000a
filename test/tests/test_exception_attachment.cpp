#include <gtest/gtest.h>
#include "redirect_log.hpp"
#include "utils/test_utils.hpp"
#include <exception>
#include <stdexcept>
#include <string>

class ExceptionAttachmentTest : public ::testing::Test {
protected:
    MemoryOutput output;
    relog::TestLoggerProvider provider{output, false};
};

// ---------------------------------------------------------------------------
// Exception info extraction
// ---------------------------------------------------------------------------

TEST_F(ExceptionAttachmentTest, DemangleStdRuntimeError) {
    std::runtime_error ex("test error");
    std::string typeName = relog::detail::getExceptionTypeName(ex);
    EXPECT_TRUE(typeName.find("runtime_error") != std::string::npos);
}

TEST_F(ExceptionAttachmentTest, ExtractNestedExceptionInfo) {
    try {
        try {
            throw std::runtime_error("inner error");
        } catch (...) {
            std::throw_with_nested(std::logic_error("outer error"));
        }
    } catch (const std::exception& ex) {
        auto info = relog::detail::extractExceptionInfo(ex);
        EXPECT_TRUE(info.type.find("logic_error") != std::string::npos);
        EXPECT_EQ(info.message, "outer error");
        ASSERT_EQ(info.causes.size(), 1u);
        EXPECT_TRUE(info.causes[0].find("runtime_error") != std::string::npos);
        EXPECT_TRUE(info.causes[0].find("inner error") != std::string::npos);
    }
}

static void throwNestedLevels(int depth) {
    if (depth == 0) throw std::runtime_error("root");
    try {
        throwNestedLevels(depth - 1);
    } catch (...) {
        std::throw_with_nested(std::runtime_error("level " + std::to_string(depth)));
    }
}

TEST_F(ExceptionAttachmentTest, DeepNestingIsCapped) {
    try {
        throwNestedLevels(30);
    } catch (const std::exception& ex) {
        auto info = relog::detail::extractExceptionInfo(ex);
        EXPECT_EQ(info.message, "level 30");
        ASSERT_EQ(info.causes.size(), static_cast<size_t>(relog::detail::kMaxExceptionCauses));
        EXPECT_TRUE(info.causes.front().find("level 29") != std::string::npos);
    }
}

TEST_F(ExceptionAttachmentTest, ExtractFromExceptionPtr) {
    std::exception_ptr error;
    try {
        throw std::out_of_range("index 9");
    } catch (...) {
        error = std::current_exception();
    }
    auto info = relog::detail::extractExceptionInfo(error);
    EXPECT_TRUE(info.type.find("out_of_range") != std::string::npos);
    EXPECT_EQ(info.message, "index 9");
}

TEST_F(ExceptionAttachmentTest, NonStdPayloadIsUnknown) {
    std::exception_ptr error;
    try {
        throw 42;
    } catch (...) {
        error = std::current_exception();
    }
    auto info = relog::detail::extractExceptionInfo(error);
    EXPECT_EQ(info.type, "unknown exception");
    EXPECT_EQ(relog::detail::describeException(info), "unknown exception");
}

TEST_F(ExceptionAttachmentTest, DescribeIncludesTypeAndMessage) {
    auto info = relog::detail::extractExceptionInfo(std::invalid_argument("bad arg"));
    std::string text = relog::detail::describeException(info);
    EXPECT_NE(text.find("invalid_argument: bad arg"), std::string::npos);
}

// ---------------------------------------------------------------------------
// Exceptions attached through the logger
// ---------------------------------------------------------------------------

TEST_F(ExceptionAttachmentTest, LoggedExceptionAddsLineAfterMessage) {
    auto logger = provider.createLogger("Orders");
    logger->log(relog::LogLevel::ERROR, 3, std::runtime_error("payment declined"), "Order {id} failed", 17);

    std::string text = output.last();
    const std::string expectedPrefix = "fail: Orders[3]\n      Order 17 failed\n      ";
    ASSERT_EQ(text.substr(0, expectedPrefix.size()), expectedPrefix);
    EXPECT_NE(text.find("payment declined", expectedPrefix.size()), std::string::npos);
}

TEST_F(ExceptionAttachmentTest, LoggedExceptionPtr) {
    auto logger = provider.createLogger("Orders");
    try {
        throw std::runtime_error("timeout");
    } catch (...) {
        logger->log(relog::LogLevel::WARN, 0, std::current_exception(), "Retrying");
    }
    std::string text = output.last();
    EXPECT_NE(text.find("      Retrying\n      "), std::string::npos);
    EXPECT_NE(text.find("timeout"), std::string::npos);
}

TEST_F(ExceptionAttachmentTest, NullExceptionPtrAddsNoLine) {
    auto logger = provider.createLogger("Orders");
    logger->log(relog::LogLevel::INFO, 0, std::exception_ptr(), "Nothing wrong");
    EXPECT_EQ(output.last(), "info: Orders[0]\n      Nothing wrong");
}

TEST_F(ExceptionAttachmentTest, RecordWithoutExceptionHasTwoLines) {
    auto logger = provider.createLogger("Orders");
    logger->info("fine");
    EXPECT_EQ(TestUtils::countOccurrences(output.last(), "\n"), 1u);
}
