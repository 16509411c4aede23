#ifndef SYSGPIO_GPIO_SCOPED_PIN_HPP
#define SYSGPIO_GPIO_SCOPED_PIN_HPP

#include "sysgpio/gpio/gpio.hpp"

namespace sysgpio::gpio {

/**
 * @class ScopedPin
 * @brief Keeps a pin exported for the lifetime of the object.
 *
 * The pin is exported by acquire() and unexported when the object is
 * destroyed. A failing unexport in the destructor is logged, not thrown;
 * call release() to observe it.
 */
class ScopedPin {
public:
    /**
     * @brief Exports a pin and takes responsibility for unexporting it.
     * @param controller The controller to use; must outlive the ScopedPin.
     * @param pin The pin number.
     * @return The handle, or the export error.
     */
    static GpioResult<ScopedPin> acquire(GpioController& controller, int pin);

    ~ScopedPin();

    ScopedPin(ScopedPin&& other) noexcept;
    ScopedPin& operator=(ScopedPin&& other) noexcept;

    ScopedPin(const ScopedPin&) = delete;
    ScopedPin& operator=(const ScopedPin&) = delete;

    /**
     * @brief Unexports the pin now.
     *
     * After release() the destructor does nothing, whatever the result.
     */
    GpioResult<void> release();

    [[nodiscard]] int pin() const noexcept { return pin_; }
    [[nodiscard]] bool owns() const noexcept { return controller_ != nullptr; }

private:
    ScopedPin(GpioController& controller, int pin) noexcept;

    GpioController* controller_;
    int pin_;
};

}  // namespace sysgpio::gpio

#endif  // SYSGPIO_GPIO_SCOPED_PIN_HPP
