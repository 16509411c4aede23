#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <spdlog/spdlog.h>

#include <cerrno>
#include <utility>

#include "sysgpio/gpio/scoped_pin.hpp"
#include "mock_gpio_controller.hpp"

using namespace sysgpio::gpio;
using namespace sysgpio::test;
using ::testing::InSequence;
using ::testing::Return;
using ::testing::StrictMock;

class ScopedPinTest : public ::testing::Test {
protected:
    void SetUp() override { spdlog::set_level(spdlog::level::off); }

    StrictMock<MockGpioController> controller;
};

TEST_F(ScopedPinTest, ExportsOnAcquireAndUnexportsOnDestruction) {
    InSequence seq;
    EXPECT_CALL(controller, exportPin(4)).WillOnce(Return(ok()));
    EXPECT_CALL(controller, unexportPin(4)).WillOnce(Return(ok()));

    auto pin = ScopedPin::acquire(controller, 4);
    ASSERT_TRUE(pin);
    EXPECT_EQ(pin->pin(), 4);
    EXPECT_TRUE(pin->owns());
}

TEST_F(ScopedPinTest, FailedExportIsReturnedAndNothingIsUnexported) {
    EXPECT_CALL(controller, exportPin(4))
        .WillOnce(Return(ioFailure(EBUSY, "/sys/class/gpio/export")));

    auto pin = ScopedPin::acquire(controller, 4);
    ASSERT_FALSE(pin);
    EXPECT_TRUE(pin.error().isIo());
    EXPECT_EQ(pin.error().code().value(), EBUSY);
}

TEST_F(ScopedPinTest, ReleaseUnexportsOnce) {
    EXPECT_CALL(controller, exportPin(4)).WillOnce(Return(ok()));
    EXPECT_CALL(controller, unexportPin(4)).Times(1).WillOnce(Return(ok()));

    auto pin = ScopedPin::acquire(controller, 4);
    ASSERT_TRUE(pin);
    EXPECT_TRUE(pin->release());
    EXPECT_FALSE(pin->owns());
    EXPECT_TRUE(pin->release());
}

TEST_F(ScopedPinTest, ReleaseReportsUnexportFailure) {
    EXPECT_CALL(controller, exportPin(4)).WillOnce(Return(ok()));
    EXPECT_CALL(controller, unexportPin(4))
        .WillOnce(Return(ioFailure(EINVAL, "/sys/class/gpio/unexport")));

    auto pin = ScopedPin::acquire(controller, 4);
    ASSERT_TRUE(pin);
    auto released = pin->release();
    ASSERT_FALSE(released);
    EXPECT_EQ(released.error().code().value(), EINVAL);
}

TEST_F(ScopedPinTest, DestructorToleratesUnexportFailure) {
    EXPECT_CALL(controller, exportPin(4)).WillOnce(Return(ok()));
    EXPECT_CALL(controller, unexportPin(4))
        .WillOnce(Return(ioFailure(EINVAL, "/sys/class/gpio/unexport")));

    EXPECT_NO_THROW({
        auto pin = ScopedPin::acquire(controller, 4);
        EXPECT_TRUE(pin);
    });
}

TEST_F(ScopedPinTest, MoveTransfersOwnership) {
    EXPECT_CALL(controller, exportPin(4)).WillOnce(Return(ok()));
    EXPECT_CALL(controller, unexportPin(4)).Times(1).WillOnce(Return(ok()));

    auto acquired = ScopedPin::acquire(controller, 4);
    ASSERT_TRUE(acquired);
    ScopedPin moved(std::move(*acquired));
    EXPECT_FALSE(acquired->owns());
    EXPECT_TRUE(moved.owns());
    EXPECT_EQ(moved.pin(), 4);
}

TEST_F(ScopedPinTest, MoveAssignmentReleasesPreviousPin) {
    InSequence seq;
    EXPECT_CALL(controller, exportPin(4)).WillOnce(Return(ok()));
    EXPECT_CALL(controller, exportPin(5)).WillOnce(Return(ok()));
    EXPECT_CALL(controller, unexportPin(4)).WillOnce(Return(ok()));
    EXPECT_CALL(controller, unexportPin(5)).WillOnce(Return(ok()));

    auto first = ScopedPin::acquire(controller, 4);
    auto second = ScopedPin::acquire(controller, 5);
    ASSERT_TRUE(first);
    ASSERT_TRUE(second);

    *first = std::move(*second);
    EXPECT_EQ(first->pin(), 5);
    EXPECT_FALSE(second->owns());
}
