#ifndef SYSGPIO_GPIO_GPIO_HPP
#define SYSGPIO_GPIO_GPIO_HPP

#include <optional>
#include <string>
#include <string_view>

#include "sysgpio/gpio/gpio_error.hpp"
#include "sysgpio/gpio/sysfs_path.hpp"

namespace sysgpio::gpio {

/**
 * @enum Direction
 * @brief GPIO pin direction.
 */
enum class Direction {
    INPUT,  ///< Input mode, written as "in"
    OUTPUT  ///< Output mode, written as "out"
};

/**
 * @brief Converts GPIO Direction enumeration to its sysfs text.
 * @param direction The Direction enumeration.
 * @return "in" or "out".
 */
std::string directionToString(Direction direction);

/**
 * @brief Parses the exact sysfs text of a direction.
 * @return The direction, or std::nullopt unless the text is "in" or "out".
 */
std::optional<Direction> parseDirection(std::string_view text) noexcept;

/**
 * @brief Converts sysfs text to Direction enumeration.
 * @param direction The direction as a string ("in" or "out").
 * @return The corresponding Direction enumeration.
 * @throws sysgpio::error::InvalidArgument for any other text.
 */
Direction stringToDirection(const std::string& direction);

/**
 * @class GpioController
 * @brief The five operations of the GPIO protocol.
 *
 * Implementations hold no per-pin state: every call is one independent
 * round trip and every failure is returned, never thrown.
 */
class GpioController {
public:
    virtual ~GpioController() = default;

    /**
     * @brief Asks the kernel to expose a pin to userspace.
     * @param pin The pin number.
     */
    virtual GpioResult<void> exportPin(int pin) = 0;

    /**
     * @brief Releases a pin previously exported.
     * @param pin The pin number.
     */
    virtual GpioResult<void> unexportPin(int pin) = 0;

    /**
     * @brief Configures a pin as input or output.
     * @param pin The pin number.
     * @param direction The direction to set.
     */
    virtual GpioResult<void> setDirection(int pin, Direction direction) = 0;

    /**
     * @brief Drives a pin high (true) or low (false).
     *
     * The pin's direction is not checked.
     */
    virtual GpioResult<void> write(int pin, bool level) = 0;

    /**
     * @brief Reads the current level of a pin.
     *
     * Any integer greater than zero reads as high.
     */
    virtual GpioResult<bool> read(int pin) = 0;
};

/**
 * @class SysfsGpio
 * @brief GpioController talking to the kernel's sysfs GPIO files.
 *
 * The only state is the directory the files live under, which never
 * changes after construction. Instances can be shared freely; calls on
 * the same pin are not serialized.
 */
class SysfsGpio final : public GpioController {
public:
    /**
     * @param root The sysfs GPIO directory; /sys/class/gpio on a real
     * system, any directory laid out the same way otherwise. An empty
     * root selects /sys/class/gpio.
     */
    explicit SysfsGpio(std::string root = std::string(kDefaultSysfsRoot));

    GpioResult<void> exportPin(int pin) override;
    GpioResult<void> unexportPin(int pin) override;
    GpioResult<void> setDirection(int pin, Direction direction) override;
    GpioResult<void> write(int pin, bool level) override;
    GpioResult<bool> read(int pin) override;

    /**
     * @brief Reads back the direction a pin is configured with.
     * @return The direction, or a parse error for anything but "in"/"out".
     */
    GpioResult<Direction> readDirection(int pin) const;

    /**
     * @brief Checks whether the kernel currently exposes the pin.
     */
    bool isExported(int pin) const;

    const std::string& root() const noexcept { return root_; }

private:
    std::string root_;
};

// Stateless shorthands operating under /sys/class/gpio.
GpioResult<void> exportPin(int pin);
GpioResult<void> unexportPin(int pin);
GpioResult<void> setDirection(int pin, Direction direction);
GpioResult<void> write(int pin, bool level);
GpioResult<bool> read(int pin);
GpioResult<Direction> readDirection(int pin);
bool isExported(int pin);

}  // namespace sysgpio::gpio

#endif  // SYSGPIO_GPIO_GPIO_HPP
