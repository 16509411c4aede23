#include "gpio_error.hpp"

#include <cerrno>
#include <utility>

#include <spdlog/fmt/fmt.h>

namespace sysgpio::gpio {

GpioError::GpioError(Kind kind, std::error_code code, std::string path,
                     std::string content)
    : kind_(kind),
      code_(code),
      path_(std::move(path)),
      content_(std::move(content)) {}

GpioError GpioError::io(std::error_code code, std::string path) {
    return GpioError(Kind::IO, code, std::move(path), {});
}

GpioError GpioError::fromErrno(std::string path) {
    return io(std::error_code(errno, std::system_category()), std::move(path));
}

GpioError GpioError::parse(std::string content, std::string path) {
    return GpioError(Kind::PARSE, {}, std::move(path), std::move(content));
}

std::string GpioError::message() const {
    if (kind_ == Kind::IO) {
        return fmt::format("IO error on {}: {}", path_, code_.message());
    }
    return fmt::format("Parse error on {}: unexpected content \"{}\"", path_,
                       content_);
}

}  // namespace sysgpio::gpio
