#ifndef SYSGPIO_CLI_BLINK_HPP
#define SYSGPIO_CLI_BLINK_HPP

#include <chrono>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include <spdlog/common.h>

#include "sysgpio/gpio/gpio.hpp"

namespace sysgpio::cli {

/**
 * @enum FailurePolicy
 * @brief What the driver does when an operation on a pin fails.
 */
enum class FailurePolicy {
    ABORT,  ///< Stop at the first failure
    SKIP    ///< Skip pins that cannot be exported, stop on anything else
};

std::string policyToString(FailurePolicy policy);

/**
 * @brief Parses "abort" or "skip".
 * @throws sysgpio::error::InvalidArgument for any other text.
 */
FailurePolicy stringToPolicy(const std::string& policy);

/// Environment variable naming the sysfs GPIO directory.
inline constexpr const char* kRootEnv = "SYSGPIO_SYSFS_ROOT";
/// Environment variable naming the spdlog level.
inline constexpr const char* kLogLevelEnv = "SYSGPIO_LOG_LEVEL";

/**
 * @struct BlinkOptions
 * @brief Resolved configuration of one driver run.
 */
struct BlinkOptions {
    std::vector<int> pins;
    FailurePolicy policy = FailurePolicy::ABORT;
    std::chrono::milliseconds delay{500};
    std::string sysfsRoot{gpio::kDefaultSysfsRoot};
    spdlog::level::level_enum logLevel = spdlog::level::info;
    bool showHelp = false;
};

/// Looks up an environment variable; std::nullopt when unset.
using Environment =
    std::function<std::optional<std::string>(const std::string&)>;

std::optional<std::string> processEnvironment(const std::string& name);

/**
 * @brief Builds the run configuration.
 *
 * Options given in @p args win over the environment, which wins over the
 * defaults in BlinkOptions.
 *
 * @param args The arguments without the program name.
 * @param env Environment lookup.
 * @throws sysgpio::error::InvalidArgument on unknown options, missing
 * option values and malformed numbers, policies or levels.
 */
BlinkOptions parseArguments(const std::vector<std::string>& args,
                            const Environment& env = processEnvironment);

std::string usage(const std::string& program);

/**
 * @class BlinkRunner
 * @brief Runs export, configure, toggle and unexport on each pin.
 *
 * For every pin: export, direction out, write high, read, wait, write low,
 * wait, read, unexport. Each read is printed as "gpio<n>: true|false".
 */
class BlinkRunner {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    BlinkRunner(gpio::GpioController& controller, BlinkOptions options,
                std::ostream& out, Sleeper sleeper = {});

    /**
     * @brief Processes every configured pin.
     * @return Process exit status: 0 on success, 1 when a failure stopped
     * the run.
     */
    int run();

    /// Pins skipped because export failed (SKIP policy only).
    [[nodiscard]] const std::vector<int>& skippedPins() const noexcept {
        return skipped_;
    }

private:
    gpio::GpioResult<void> blinkPin(int pin);
    gpio::GpioResult<void> readAndPrint(int pin);

    gpio::GpioController& controller_;
    BlinkOptions options_;
    std::ostream& out_;
    Sleeper sleeper_;
    std::vector<int> skipped_;
};

}  // namespace sysgpio::cli

#endif  // SYSGPIO_CLI_BLINK_HPP
