#ifndef SYSGPIO_GPIO_SYSFS_PATH_HPP
#define SYSGPIO_GPIO_SYSFS_PATH_HPP

#include <string>
#include <string_view>
#include <variant>

namespace sysgpio::gpio {

/// Directory the kernel exposes the legacy GPIO interface under.
inline constexpr std::string_view kDefaultSysfsRoot = "/sys/class/gpio";

struct ExportPath {};
struct UnexportPath {};

struct ValuePath {
    int pin;
};

struct DirectionPath {
    int pin;
};

/**
 * @brief One of the four files the GPIO protocol talks to.
 */
using SysfsPath =
    std::variant<ExportPath, UnexportPath, ValuePath, DirectionPath>;

/**
 * @brief Resolves a sysfs file below the given root.
 *
 * The pin is formatted as a decimal integer and not validated; whether it
 * names a real line is decided by the kernel when the file is opened.
 *
 * @param path The file to resolve.
 * @param root The sysfs GPIO directory; trailing slashes are ignored.
 * @return The absolute path of the file.
 */
[[nodiscard]] std::string resolvePath(const SysfsPath& path,
                                      std::string_view root = kDefaultSysfsRoot);

/**
 * @brief Directory the kernel creates for an exported pin.
 */
[[nodiscard]] std::string pinDirectory(int pin,
                                       std::string_view root = kDefaultSysfsRoot);

}  // namespace sysgpio::gpio

#endif  // SYSGPIO_GPIO_SYSFS_PATH_HPP
