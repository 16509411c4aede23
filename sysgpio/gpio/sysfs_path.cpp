#include "sysfs_path.hpp"

#include <spdlog/fmt/fmt.h>

namespace sysgpio::gpio {

namespace {
template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

// "/" and "/sys/class/gpio/" join without a doubled separator
std::string_view stripTrailingSlashes(std::string_view root) {
    while (!root.empty() && root.back() == '/') {
        root.remove_suffix(1);
    }
    return root;
}
}  // namespace

std::string resolvePath(const SysfsPath& path, std::string_view root) {
    root = stripTrailingSlashes(root);
    return std::visit(
        Overloaded{
            [root](ExportPath) { return fmt::format("{}/export", root); },
            [root](UnexportPath) { return fmt::format("{}/unexport", root); },
            [root](ValuePath p) {
                return fmt::format("{}/gpio{}/value", root, p.pin);
            },
            [root](DirectionPath p) {
                return fmt::format("{}/gpio{}/direction", root, p.pin);
            },
        },
        path);
}

std::string pinDirectory(int pin, std::string_view root) {
    root = stripTrailingSlashes(root);
    return fmt::format("{}/gpio{}", root, pin);
}

}  // namespace sysgpio::gpio
