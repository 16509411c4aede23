#include "sysgpio/gpio/gpio.hpp"

#include <iostream>

using namespace sysgpio::gpio;

int main() {
    const int pin = 17;

    // Export the pin so the kernel creates /sys/class/gpio/gpio17
    if (auto result = exportPin(pin); !result) {
        std::cerr << result.error().message() << std::endl;
        return 1;
    }

    if (auto result = setDirection(pin, Direction::OUTPUT); !result) {
        std::cerr << result.error().message() << std::endl;
        if (auto released = unexportPin(pin); !released) {
            std::cerr << released.error().message() << std::endl;
        }
        return 1;
    }

    // Set the value of the GPIO pin
    if (auto result = write(pin, true); !result) {
        std::cerr << result.error().message() << std::endl;
    } else {
        std::cout << "GPIO pin 17 set to HIGH" << std::endl;
    }

    // Get the value of the GPIO pin
    auto value = read(pin);
    if (value) {
        std::cout << "GPIO pin 17 value: " << (*value ? "HIGH" : "LOW")
                  << std::endl;
    } else if (value.error().isParse()) {
        std::cerr << "Unexpected kernel output: " << value.error().message()
                  << std::endl;
    } else {
        std::cerr << value.error().message() << std::endl;
    }

    if (auto result = unexportPin(pin); !result) {
        std::cerr << result.error().message() << std::endl;
        return 1;
    }
    return 0;
}
