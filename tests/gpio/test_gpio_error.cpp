#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cerrno>

#include "sysgpio/gpio/gpio_error.hpp"

using namespace sysgpio::gpio;
using ::testing::HasSubstr;

TEST(GpioErrorTest, IoKeepsCodeAndPath) {
    auto error = GpioError::io(std::error_code(EACCES, std::system_category()),
                               "/sys/class/gpio/export");
    EXPECT_EQ(error.kind(), GpioError::Kind::IO);
    EXPECT_TRUE(error.isIo());
    EXPECT_EQ(error.code().value(), EACCES);
    EXPECT_TRUE(error.code().category() == std::system_category());
    EXPECT_EQ(error.path(), "/sys/class/gpio/export");
    EXPECT_TRUE(error.content().empty());
    EXPECT_THAT(error.message(), HasSubstr("/sys/class/gpio/export"));
    EXPECT_THAT(error.message(), HasSubstr("IO error"));
}

TEST(GpioErrorTest, FromErrnoCapturesCurrentErrno) {
    errno = ENOENT;
    auto error = GpioError::fromErrno("/sys/class/gpio/gpio4/value");
    EXPECT_TRUE(error.isIo());
    EXPECT_EQ(error.code().value(), ENOENT);
    EXPECT_EQ(error.code(), std::errc::no_such_file_or_directory);
}

TEST(GpioErrorTest, ParseKeepsContent) {
    auto error = GpioError::parse("abc", "/sys/class/gpio/gpio4/value");
    EXPECT_EQ(error.kind(), GpioError::Kind::PARSE);
    EXPECT_TRUE(error.isParse());
    EXPECT_FALSE(error.code());
    EXPECT_EQ(error.content(), "abc");
    EXPECT_THAT(error.message(), HasSubstr("Parse error"));
    EXPECT_THAT(error.message(), HasSubstr("\"abc\""));
}

TEST(GpioErrorTest, Equality) {
    auto a = GpioError::parse("abc", "/p");
    EXPECT_EQ(a, GpioError::parse("abc", "/p"));
    EXPECT_NE(a, GpioError::parse("abd", "/p"));
    EXPECT_NE(a, GpioError::io(std::error_code(EIO, std::system_category()),
                               "/p"));
}
