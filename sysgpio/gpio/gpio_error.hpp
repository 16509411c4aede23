#ifndef SYSGPIO_GPIO_GPIO_ERROR_HPP
#define SYSGPIO_GPIO_GPIO_ERROR_HPP

#include <string>
#include <system_error>

#include "sysgpio/type/expected.hpp"

namespace sysgpio::gpio {

/**
 * @class GpioError
 * @brief Failure of a GPIO operation at the sysfs boundary.
 *
 * An IO error means the file could not be opened, written or read; it
 * keeps the errno of the failing call. A PARSE error means the file was
 * read but its content is not what the protocol allows; it keeps the
 * content that was rejected.
 */
class GpioError {
public:
    enum class Kind {
        IO,    ///< open/read/write failed
        PARSE  ///< unexpected file content
    };

    /**
     * @brief Creates an IO error.
     * @param code The OS error of the failing call.
     * @param path The sysfs file involved.
     */
    static GpioError io(std::error_code code, std::string path);

    /**
     * @brief Creates an IO error from the current errno.
     */
    static GpioError fromErrno(std::string path);

    /**
     * @brief Creates a parse error.
     * @param content The (trimmed) content that failed to parse.
     * @param path The sysfs file involved.
     */
    static GpioError parse(std::string content, std::string path);

    [[nodiscard]] Kind kind() const noexcept { return kind_; }
    [[nodiscard]] bool isIo() const noexcept { return kind_ == Kind::IO; }
    [[nodiscard]] bool isParse() const noexcept {
        return kind_ == Kind::PARSE;
    }

    /// OS error for IO failures, empty for parse failures.
    [[nodiscard]] const std::error_code& code() const noexcept {
        return code_;
    }
    [[nodiscard]] const std::string& path() const noexcept { return path_; }
    /// Rejected content for parse failures, empty for IO failures.
    [[nodiscard]] const std::string& content() const noexcept {
        return content_;
    }

    /**
     * @brief Human readable description, e.g.
     * "IO error on /sys/class/gpio/gpio4/value: No such file or directory".
     */
    [[nodiscard]] std::string message() const;

    bool operator==(const GpioError& other) const = default;

private:
    GpioError(Kind kind, std::error_code code, std::string path,
              std::string content);

    Kind kind_;
    std::error_code code_;
    std::string path_;
    std::string content_;
};

/**
 * @brief Result of a GPIO operation.
 */
template <typename T>
using GpioResult = type::expected<T, GpioError>;

}  // namespace sysgpio::gpio

#endif  // SYSGPIO_GPIO_GPIO_ERROR_HPP
