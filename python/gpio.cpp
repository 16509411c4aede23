#include "sysgpio/error/exception.hpp"
#include "sysgpio/gpio/gpio.hpp"

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <exception>
#include <string>
#include <utility>

namespace py = pybind11;
using namespace sysgpio::gpio;

namespace {

[[noreturn]] void raise(const GpioError& error) {
    if (error.isIo()) {
        // OSError(errno, strerror, filename) fills in .errno and .filename
        PyObject* exc = PyObject_CallFunction(
            PyExc_OSError, "iss", error.code().value(),
            error.code().message().c_str(), error.path().c_str());
        if (exc != nullptr) {
            PyErr_SetObject(PyExc_OSError, exc);
            Py_DECREF(exc);
        }
        throw py::error_already_set();
    }
    throw py::value_error(error.message());
}

void check(const GpioResult<void>& result) {
    if (!result) {
        raise(result.error());
    }
}

template <typename T>
T unwrap(GpioResult<T> result) {
    if (!result) {
        raise(result.error());
    }
    return std::move(result).value();
}

}  // namespace

PYBIND11_MODULE(sysgpio, m) {
    m.doc() = "Control of GPIO pins through the Linux sysfs interface";

    py::register_exception_translator([](std::exception_ptr p) {
        try {
            if (p)
                std::rethrow_exception(p);
        } catch (const sysgpio::error::InvalidArgument& e) {
            PyErr_SetString(PyExc_ValueError, e.getMessage().c_str());
        }
    });

    py::enum_<Direction>(m, "Direction", "GPIO pin direction")
        .value("INPUT", Direction::INPUT, "Input mode")
        .value("OUTPUT", Direction::OUTPUT, "Output mode")
        .export_values();

    py::class_<SysfsGpio>(
        m, "SysfsGpio",
        R"(GPIO controller bound to a sysfs directory.

Every method performs one read or write of a sysfs file. IO failures
raise OSError with errno set; unexpected file content raises ValueError.

Args:
    root: The sysfs GPIO directory. Default is /sys/class/gpio.

Examples:
    >>> from sysgpio import SysfsGpio, Direction
    >>> gpio = SysfsGpio()
    >>> gpio.export_pin(4)
    >>> gpio.set_direction(4, Direction.OUTPUT)
    >>> gpio.write(4, True)
    >>> gpio.read(4)
    True
    >>> gpio.unexport_pin(4)
)")
        .def(py::init<std::string>(),
             py::arg("root") = std::string(kDefaultSysfsRoot))
        .def_property_readonly("root", &SysfsGpio::root)
        .def(
            "export_pin",
            [](SysfsGpio& self, int pin) { check(self.exportPin(pin)); },
            py::arg("pin"), "Exports a pin to userspace.")
        .def(
            "unexport_pin",
            [](SysfsGpio& self, int pin) { check(self.unexportPin(pin)); },
            py::arg("pin"), "Releases an exported pin.")
        .def(
            "set_direction",
            [](SysfsGpio& self, int pin, Direction direction) {
                check(self.setDirection(pin, direction));
            },
            py::arg("pin"), py::arg("direction"),
            "Configures a pin as input or output.")
        .def(
            "write",
            [](SysfsGpio& self, int pin, bool level) {
                check(self.write(pin, level));
            },
            py::arg("pin"), py::arg("level"), "Drives a pin high or low.")
        .def(
            "read",
            [](SysfsGpio& self, int pin) { return unwrap(self.read(pin)); },
            py::arg("pin"), "Reads the level of a pin.")
        .def(
            "read_direction",
            [](const SysfsGpio& self, int pin) {
                return unwrap(self.readDirection(pin));
            },
            py::arg("pin"), "Reads back the direction of a pin.")
        .def("is_exported", &SysfsGpio::isExported, py::arg("pin"),
             "Checks whether the kernel exposes the pin.");

    m.def(
        "export_pin", [](int pin) { check(exportPin(pin)); }, py::arg("pin"));
    m.def(
        "unexport_pin", [](int pin) { check(unexportPin(pin)); },
        py::arg("pin"));
    m.def(
        "set_direction",
        [](int pin, Direction direction) {
            check(setDirection(pin, direction));
        },
        py::arg("pin"), py::arg("direction"));
    m.def(
        "write",
        [](int pin, bool level) { check(sysgpio::gpio::write(pin, level)); },
        py::arg("pin"), py::arg("level"));
    m.def(
        "read", [](int pin) { return unwrap(sysgpio::gpio::read(pin)); },
        py::arg("pin"));
    m.def(
        "read_direction",
        [](int pin) { return unwrap(sysgpio::gpio::readDirection(pin)); },
        py::arg("pin"));
    m.def(
        "is_exported", [](int pin) { return sysgpio::gpio::isExported(pin); },
        py::arg("pin"));

    m.def("string_to_direction", &stringToDirection, py::arg("direction"),
          R"(Converts "in" or "out" to a Direction.

Raises:
    ValueError: For any other text.
)");
    m.def("direction_to_string", &directionToString, py::arg("direction"),
          "Converts a Direction to its sysfs text.");
}
