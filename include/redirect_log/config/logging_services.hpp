#ifndef REDIRECT_LOG_LOGGING_SERVICES_HPP
#define REDIRECT_LOG_LOGGING_SERVICES_HPP

#include "configuration.hpp"
#include "formatter_options.hpp"
#include <memory>

namespace relog {

    /// What the host has registered for logging before the test redirect
    /// runs. Every member is optional.
    struct LoggingServices {
        std::shared_ptr<const SimpleConsoleFormatterOptions> simpleConsoleOptions;
        std::shared_ptr<const JsonConsoleFormatterOptions> jsonConsoleOptions;
        std::shared_ptr<const ConsoleFormatterOptions> consoleOptions;
        std::shared_ptr<const IConfiguration> configuration;
    };

} // namespace relog

#endif // REDIRECT_LOG_LOGGING_SERVICES_HPP
