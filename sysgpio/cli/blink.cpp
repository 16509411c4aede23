#include "blink.hpp"

#include <spdlog/spdlog.h>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <sstream>
#include <string_view>
#include <thread>
#include <utility>

#include "sysgpio/error/exception.hpp"
#include "sysgpio/gpio/scoped_pin.hpp"

namespace sysgpio::cli {

std::string policyToString(FailurePolicy policy) {
    switch (policy) {
        case FailurePolicy::ABORT:
            return "abort";
        case FailurePolicy::SKIP:
            return "skip";
    }
    THROW_INVALID_ARGUMENT("Invalid failure policy enum value: ",
                           static_cast<int>(policy));
}

FailurePolicy stringToPolicy(const std::string& policy) {
    if (policy == "abort")
        return FailurePolicy::ABORT;
    if (policy == "skip")
        return FailurePolicy::SKIP;
    THROW_INVALID_ARGUMENT("Invalid failure policy: ", policy,
                           " (expected abort or skip)");
}

std::optional<std::string> processEnvironment(const std::string& name) {
    if (const char* value = std::getenv(name.c_str())) {
        return std::string(value);
    }
    return std::nullopt;
}

namespace {

template <typename Int>
bool parseInteger(std::string_view text, Int& value) {
    if (text.empty()) {
        return false;
    }
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, value);
    return ec == std::errc() && ptr == end;
}

int parsePin(const std::string& text) {
    int pin = 0;
    if (!parseInteger(text, pin)) {
        THROW_INVALID_ARGUMENT("Invalid pin number: ", text);
    }
    return pin;
}

std::chrono::milliseconds parseDelay(const std::string& text) {
    long long ms = 0;
    if (!parseInteger(text, ms) || ms < 0) {
        THROW_INVALID_ARGUMENT("Invalid delay: ", text,
                               " (expected milliseconds >= 0)");
    }
    return std::chrono::milliseconds(ms);
}

spdlog::level::level_enum parseLevel(const std::string& text) {
    auto level = spdlog::level::from_str(text);
    // from_str maps unknown names to off
    if (level == spdlog::level::off && text != "off") {
        THROW_INVALID_ARGUMENT("Invalid log level: ", text);
    }
    return level;
}

}  // namespace

BlinkOptions parseArguments(const std::vector<std::string>& args,
                            const Environment& env) {
    BlinkOptions options;
    if (auto root = env(kRootEnv); root && !root->empty()) {
        options.sysfsRoot = *root;
    }
    if (auto level = env(kLogLevelEnv); level && !level->empty()) {
        options.logLevel = parseLevel(*level);
    }

    bool optionsDone = false;
    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        bool negativeNumber =
            arg.size() > 1 && std::isdigit(static_cast<unsigned char>(arg[1]));
        if (optionsDone || arg.empty() || arg[0] != '-' || negativeNumber) {
            options.pins.push_back(parsePin(arg));
            continue;
        }
        if (arg == "--") {
            optionsDone = true;
            continue;
        }
        if (arg == "-h" || arg == "--help") {
            options.showHelp = true;
            continue;
        }

        // --name=value
        std::string name = arg;
        std::optional<std::string> inlineValue;
        auto eq = arg.find('=');
        if (arg.rfind("--", 0) == 0 && eq != std::string::npos) {
            name = arg.substr(0, eq);
            inlineValue = arg.substr(eq + 1);
        }

        auto takeValue = [&]() -> std::string {
            if (inlineValue) {
                return *inlineValue;
            }
            if (i + 1 >= args.size()) {
                THROW_INVALID_ARGUMENT("Missing value for option ", name);
            }
            return args[++i];
        };

        if (name == "-p" || name == "--policy") {
            options.policy = stringToPolicy(takeValue());
        } else if (name == "-d" || name == "--delay") {
            options.delay = parseDelay(takeValue());
        } else if (name == "-r" || name == "--root") {
            options.sysfsRoot = takeValue();
            if (options.sysfsRoot.empty()) {
                THROW_INVALID_ARGUMENT("Empty sysfs root for option ", name);
            }
        } else if (name == "-l" || name == "--log-level") {
            options.logLevel = parseLevel(takeValue());
        } else {
            THROW_INVALID_ARGUMENT("Unknown option: ", arg);
        }
    }
    return options;
}

std::string usage(const std::string& program) {
    std::ostringstream oss;
    oss << "usage: " << program << " [options] <pin>...\n"
        << "\n"
        << "Exports each pin, drives it high then low, prints the level read\n"
        << "back after each write and unexports it.\n"
        << "\n"
        << "Options:\n"
        << "  -p, --policy abort|skip  on failure stop, or skip pins that\n"
        << "                           cannot be exported (default abort)\n"
        << "  -d, --delay <ms>         wait after each write (default 500)\n"
        << "  -r, --root <dir>         sysfs GPIO directory (default $"
        << kRootEnv << " or " << gpio::kDefaultSysfsRoot << ")\n"
        << "  -l, --log-level <level>  trace|debug|info|warn|error|critical|off\n"
        << "                           (default $" << kLogLevelEnv
        << " or info)\n"
        << "  -h, --help               show this message\n";
    return oss.str();
}

BlinkRunner::BlinkRunner(gpio::GpioController& controller,
                         BlinkOptions options, std::ostream& out,
                         Sleeper sleeper)
    : controller_(controller),
      options_(std::move(options)),
      out_(out),
      sleeper_(std::move(sleeper)) {
    if (!sleeper_) {
        sleeper_ = [](std::chrono::milliseconds duration) {
            std::this_thread::sleep_for(duration);
        };
    }
}

int BlinkRunner::run() {
    skipped_.clear();
    for (int pin : options_.pins) {
        auto exported = gpio::ScopedPin::acquire(controller_, pin);
        if (!exported) {
            if (options_.policy == FailurePolicy::SKIP) {
                spdlog::warn("Skipping GPIO pin {}: {}", pin,
                             exported.error().message());
                skipped_.push_back(pin);
                continue;
            }
            spdlog::error("Failed to export GPIO pin {}: {}", pin,
                          exported.error().message());
            return 1;
        }

        auto result = blinkPin(pin);
        if (result) {
            result = exported->release();
        }
        if (!result) {
            spdlog::error("GPIO pin {} failed: {}", pin,
                          result.error().message());
            return 1;
        }
        spdlog::info("GPIO pin {} done", pin);
    }

    if (!skipped_.empty()) {
        spdlog::warn("{} of {} pins skipped", skipped_.size(),
                     options_.pins.size());
    }
    return 0;
}

gpio::GpioResult<void> BlinkRunner::blinkPin(int pin) {
    spdlog::info("Blinking GPIO pin {}", pin);

    auto pause = [this]() -> gpio::GpioResult<void> {
        sleeper_(options_.delay);
        return {};
    };
    return controller_.setDirection(pin, gpio::Direction::OUTPUT)
        .and_then([&] { return controller_.write(pin, true); })
        .and_then([&] { return readAndPrint(pin); })
        .and_then(pause)
        .and_then([&] { return controller_.write(pin, false); })
        .and_then(pause)
        .and_then([&] { return readAndPrint(pin); });
}

gpio::GpioResult<void> BlinkRunner::readAndPrint(int pin) {
    return controller_.read(pin).transform([this, pin](bool level) {
        out_ << "gpio" << pin << ": " << (level ? "true" : "false")
             << std::endl;
    });
}

}  // namespace sysgpio::cli
