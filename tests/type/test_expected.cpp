#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <utility>

#include "sysgpio/type/expected.hpp"

namespace {

using namespace sysgpio::type;

struct CustomError {
    int code;
    std::string message;

    bool operator==(const CustomError& other) const = default;
};

using Result = expected<int, CustomError>;
using Status = expected<void, CustomError>;

class ExpectedTest : public ::testing::Test {};

TEST_F(ExpectedTest, Unexpected) {
    unexpected<int> unex1(42);
    EXPECT_EQ(unex1.error(), 42);

    auto unex2 = make_unexpected(CustomError{404, "Not Found"});
    EXPECT_EQ(unex2.error().code, 404);
    EXPECT_EQ(std::move(unex2).error().message, "Not Found");
}

TEST_F(ExpectedTest, HoldsValue) {
    Result defaulted;
    EXPECT_TRUE(defaulted.has_value());
    EXPECT_EQ(defaulted.value(), 0);

    Result exp(42);
    EXPECT_TRUE(exp.has_value());
    EXPECT_TRUE(static_cast<bool>(exp));
    EXPECT_EQ(exp.value(), 42);
    EXPECT_EQ(*exp, 42);

    const Result& constExp = exp;
    EXPECT_EQ(constExp.value(), 42);

    expected<std::string, CustomError> text(std::string("hello"));
    EXPECT_EQ(text->size(), 5u);
    EXPECT_EQ(std::move(text).value(), "hello");
}

TEST_F(ExpectedTest, HoldsError) {
    Result exp = make_unexpected(CustomError{5, "I/O"});
    EXPECT_FALSE(exp.has_value());
    EXPECT_FALSE(static_cast<bool>(exp));
    EXPECT_EQ(exp.error().code, 5);

    Result copy = exp;
    EXPECT_EQ(copy.error(), (CustomError{5, "I/O"}));

    CustomError moved = std::move(exp).error();
    EXPECT_EQ(moved.message, "I/O");
}

TEST_F(ExpectedTest, WrongAccessThrows) {
    Result value(1);
    Result error = make_unexpected(CustomError{1, "bad"});

    EXPECT_THROW((void)error.value(), std::logic_error);
    EXPECT_THROW((void)value.error(), std::logic_error);
}

TEST_F(ExpectedTest, Assignment) {
    Result exp(1);
    exp = Result(make_unexpected(CustomError{2, "later"}));
    EXPECT_FALSE(exp);
    exp = Result(3);
    ASSERT_TRUE(exp);
    EXPECT_EQ(*exp, 3);
}

TEST_F(ExpectedTest, AndThen) {
    auto increment = [](int val) -> Result { return val + 1; };
    auto fail = [](int) -> Result {
        return make_unexpected(CustomError{9, "failed"});
    };

    EXPECT_EQ(Result(1).and_then(increment).value(), 2);
    EXPECT_EQ(Result(1).and_then(fail).error().code, 9);

    Result error = make_unexpected(CustomError{3, "first"});
    EXPECT_EQ(error.and_then(increment).error().code, 3);
}

TEST_F(ExpectedTest, Transform) {
    auto doubled = Result(21).transform([](int v) { return v * 2; });
    EXPECT_EQ(doubled.value(), 42);

    auto asText = Result(7).transform([](int v) { return std::to_string(v); });
    EXPECT_EQ(asText.value(), "7");

    Result error = make_unexpected(CustomError{4, "x"});
    EXPECT_EQ(error.transform([](int v) { return v * 2; }).error().code, 4);
}

TEST_F(ExpectedTest, VoidSpecialization) {
    Status ok;
    EXPECT_TRUE(ok.has_value());
    EXPECT_NO_THROW(ok.value());
    EXPECT_THROW((void)ok.error(), std::logic_error);

    Status failed = make_unexpected(CustomError{1, "nope"});
    EXPECT_FALSE(failed);
    EXPECT_EQ(failed.error().message, "nope");
    EXPECT_THROW(failed.value(), std::logic_error);
}

TEST_F(ExpectedTest, VoidChaining) {
    int calls = 0;
    auto step = [&calls]() -> Status {
        ++calls;
        return {};
    };

    Status ok;
    EXPECT_TRUE(ok.and_then(step));
    EXPECT_EQ(calls, 1);

    Status failed = make_unexpected(CustomError{1, "nope"});
    EXPECT_FALSE(failed.and_then(step));
    EXPECT_EQ(calls, 1);
}

TEST_F(ExpectedTest, TransformToVoid) {
    int seen = 0;
    Status stored = Result(6).transform([&seen](int v) { seen = v; });
    EXPECT_TRUE(stored);
    EXPECT_EQ(seen, 6);

    Result error = make_unexpected(CustomError{8, "gone"});
    Status failed = error.transform([&seen](int v) { seen = v * 10; });
    ASSERT_FALSE(failed);
    EXPECT_EQ(failed.error().code, 8);
    EXPECT_EQ(seen, 6);
}

}  // namespace
