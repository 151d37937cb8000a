#ifndef REDIRECT_LOG_FORMATTER_OPTIONS_HPP
#define REDIRECT_LOG_FORMATTER_OPTIONS_HPP

#include <string>

namespace relog {

    /// Options a host registers for its console formatters. Only
    /// includeScopes is read when redirecting to test output; the rest is
    /// carried so hosts can register the same objects they use in production.
    struct ConsoleFormatterOptions {
        virtual ~ConsoleFormatterOptions() = default;

        bool includeScopes = false;
        std::string timestampFormat;
        bool useUtcTimestamp = false;
    };

    struct SimpleConsoleFormatterOptions : ConsoleFormatterOptions {
        bool singleLine = false;
    };

    struct JsonConsoleFormatterOptions : ConsoleFormatterOptions {
        bool indented = false;
    };

} // namespace relog

#endif // REDIRECT_LOG_FORMATTER_OPTIONS_HPP
