#include "scoped_pin.hpp"

#include <spdlog/spdlog.h>
#include <utility>

namespace sysgpio::gpio {

ScopedPin::ScopedPin(GpioController& controller, int pin) noexcept
    : controller_(&controller), pin_(pin) {}

GpioResult<ScopedPin> ScopedPin::acquire(GpioController& controller,
                                         int pin) {
    auto result = controller.exportPin(pin);
    if (!result) {
        return type::make_unexpected(std::move(result).error());
    }
    return ScopedPin(controller, pin);
}

ScopedPin::~ScopedPin() {
    if (controller_ == nullptr) {
        return;
    }
    auto result = controller_->unexportPin(pin_);
    if (!result) {
        spdlog::warn("Failed to unexport GPIO pin {}: {}", pin_,
                     result.error().message());
    }
}

ScopedPin::ScopedPin(ScopedPin&& other) noexcept
    : controller_(std::exchange(other.controller_, nullptr)),
      pin_(other.pin_) {}

ScopedPin& ScopedPin::operator=(ScopedPin&& other) noexcept {
    if (this != &other) {
        if (controller_ != nullptr) {
            auto result = controller_->unexportPin(pin_);
            if (!result) {
                spdlog::warn("Failed to unexport GPIO pin {}: {}", pin_,
                             result.error().message());
            }
        }
        controller_ = std::exchange(other.controller_, nullptr);
        pin_ = other.pin_;
    }
    return *this;
}

GpioResult<void> ScopedPin::release() {
    if (controller_ == nullptr) {
        return {};
    }
    return std::exchange(controller_, nullptr)->unexportPin(pin_);
}

}  // namespace sysgpio::gpio
