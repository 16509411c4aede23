#include "gpio.hpp"

#include <spdlog/spdlog.h>
#include <cerrno>
#include <charconv>
#include <string_view>
#include <utility>

#include <fcntl.h>
#include <unistd.h>

#include "sysgpio/error/exception.hpp"

namespace sysgpio::gpio {

using type::make_unexpected;

std::optional<Direction> parseDirection(std::string_view text) noexcept {
    if (text == "in")
        return Direction::INPUT;
    if (text == "out")
        return Direction::OUTPUT;
    return std::nullopt;
}

Direction stringToDirection(const std::string& direction) {
    if (auto parsed = parseDirection(direction)) {
        return *parsed;
    }
    THROW_INVALID_ARGUMENT("Invalid GPIO direction: ", direction);
}

std::string directionToString(Direction direction) {
    switch (direction) {
        case Direction::INPUT:
            return "in";
        case Direction::OUTPUT:
            return "out";
    }
    THROW_INVALID_ARGUMENT("Invalid GPIO direction enum value: ",
                           static_cast<int>(direction));
}

namespace {

/**
 * @brief Owns a file descriptor for the length of one sysfs round trip.
 */
class FileDescriptor {
public:
    explicit FileDescriptor(int fd) noexcept : fd_(fd) {}
    ~FileDescriptor() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    int get() const noexcept { return fd_; }
    bool valid() const noexcept { return fd_ >= 0; }

private:
    int fd_;
};

type::unexpected<GpioError> fail(GpioError error) {
    spdlog::debug("gpio: {}", error.message());
    return make_unexpected(std::move(error));
}

GpioResult<void> writeAttribute(const std::string& path,
                                std::string_view payload) {
    spdlog::debug("gpio: write \"{}\" to {}", payload, path);

    // Never O_CREAT: a missing file means the pin is not exported.
    FileDescriptor fd(::open(path.c_str(), O_WRONLY | O_TRUNC | O_CLOEXEC));
    if (!fd.valid()) {
        return fail(GpioError::fromErrno(path));
    }

    ssize_t bytes;
    do {
        bytes = ::write(fd.get(), payload.data(), payload.size());
    } while (bytes < 0 && errno == EINTR);

    if (bytes < 0) {
        return fail(GpioError::fromErrno(path));
    }
    if (static_cast<std::size_t>(bytes) != payload.size()) {
        return fail(
            GpioError::io(std::error_code(EIO, std::system_category()), path));
    }
    return {};
}

GpioResult<std::string> readAttribute(const std::string& path) {
    FileDescriptor fd(::open(path.c_str(), O_RDONLY | O_CLOEXEC));
    if (!fd.valid()) {
        return fail(GpioError::fromErrno(path));
    }

    std::string content;
    char buffer[64];
    for (;;) {
        ssize_t bytes = ::read(fd.get(), buffer, sizeof(buffer));
        if (bytes < 0) {
            if (errno == EINTR) {
                continue;
            }
            return fail(GpioError::fromErrno(path));
        }
        if (bytes == 0) {
            break;
        }
        content.append(buffer, static_cast<std::size_t>(bytes));
    }

    spdlog::debug("gpio: read \"{}\" from {}", content, path);
    return content;
}

std::string_view trim(std::string_view text) {
    constexpr std::string_view kWhitespace = " \t\n\r\f\v";
    auto first = text.find_first_not_of(kWhitespace);
    if (first == std::string_view::npos) {
        return {};
    }
    auto last = text.find_last_not_of(kWhitespace);
    return text.substr(first, last - first + 1);
}

/**
 * @brief Parses the whole of a value file as a decimal int.
 *
 * Accepts an optional sign. Empty input, trailing characters and values
 * out of range for int are rejected.
 */
bool parseLevel(std::string_view text, int& value) {
    if (!text.empty() && text.front() == '+') {
        text.remove_prefix(1);
        if (!text.empty() && text.front() == '-') {
            return false;
        }
    }
    if (text.empty()) {
        return false;
    }
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, value);
    return ec == std::errc() && ptr == end;
}

}  // namespace

SysfsGpio::SysfsGpio(std::string root) : root_(std::move(root)) {
    if (root_.empty()) {
        root_ = kDefaultSysfsRoot;
    }
    while (root_.size() > 1 && root_.back() == '/') {
        root_.pop_back();
    }
}

GpioResult<void> SysfsGpio::exportPin(int pin) {
    return writeAttribute(resolvePath(ExportPath{}, root_),
                          std::to_string(pin));
}

GpioResult<void> SysfsGpio::unexportPin(int pin) {
    return writeAttribute(resolvePath(UnexportPath{}, root_),
                          std::to_string(pin));
}

GpioResult<void> SysfsGpio::setDirection(int pin, Direction direction) {
    return writeAttribute(resolvePath(DirectionPath{pin}, root_),
                          directionToString(direction));
}

GpioResult<void> SysfsGpio::write(int pin, bool level) {
    return writeAttribute(resolvePath(ValuePath{pin}, root_),
                          level ? "1" : "0");
}

GpioResult<bool> SysfsGpio::read(int pin) {
    const auto path = resolvePath(ValuePath{pin}, root_);
    return readAttribute(path).and_then(
        [&path](const std::string& content) -> GpioResult<bool> {
            auto text = trim(content);
            int value = 0;
            if (!parseLevel(text, value)) {
                return fail(GpioError::parse(std::string(text), path));
            }
            return value > 0;
        });
}

GpioResult<Direction> SysfsGpio::readDirection(int pin) const {
    const auto path = resolvePath(DirectionPath{pin}, root_);
    return readAttribute(path).and_then(
        [&path](const std::string& content) -> GpioResult<Direction> {
            auto text = trim(content);
            if (auto direction = parseDirection(text)) {
                return *direction;
            }
            return fail(GpioError::parse(std::string(text), path));
        });
}

bool SysfsGpio::isExported(int pin) const {
    return ::access(pinDirectory(pin, root_).c_str(), F_OK) == 0;
}

GpioResult<void> exportPin(int pin) { return SysfsGpio().exportPin(pin); }

GpioResult<void> unexportPin(int pin) { return SysfsGpio().unexportPin(pin); }

GpioResult<void> setDirection(int pin, Direction direction) {
    return SysfsGpio().setDirection(pin, direction);
}

GpioResult<void> write(int pin, bool level) {
    return SysfsGpio().write(pin, level);
}

GpioResult<bool> read(int pin) { return SysfsGpio().read(pin); }

GpioResult<Direction> readDirection(int pin) {
    return SysfsGpio().readDirection(pin);
}

bool isExported(int pin) { return SysfsGpio().isExported(pin); }

}  // namespace sysgpio::gpio
