#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <iostream>
#include <string>
#include <vector>

#include "sysgpio/cli/blink.hpp"
#include "sysgpio/error/exception.hpp"
#include "sysgpio/gpio/gpio.hpp"

using namespace sysgpio;

int main(int argc, char** argv) {
    const std::string program = argc > 0 ? argv[0] : "sysgpio-blink";
    std::vector<std::string> args(argv + (argc > 0 ? 1 : 0), argv + argc);

    // Levels go to stdout, diagnostics to stderr.
    spdlog::set_default_logger(spdlog::stderr_color_mt("sysgpio"));

    cli::BlinkOptions options;
    try {
        options = cli::parseArguments(args);
    } catch (const error::InvalidArgument& e) {
        std::cerr << program << ": " << e.getMessage() << "\n\n"
                  << cli::usage(program);
        return 2;
    }

    if (options.showHelp || options.pins.empty()) {
        std::cout << cli::usage(program);
        return 0;
    }

    spdlog::set_level(options.logLevel);
    spdlog::debug("sysfs root {}, policy {}, delay {}ms", options.sysfsRoot,
                  cli::policyToString(options.policy),
                  options.delay.count());

    gpio::SysfsGpio controller(options.sysfsRoot);
    cli::BlinkRunner runner(controller, std::move(options), std::cout);
    return runner.run();
}
