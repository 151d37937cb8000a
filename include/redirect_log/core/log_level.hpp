#ifndef REDIRECT_LOG_LEVEL_HPP
#define REDIRECT_LOG_LEVEL_HPP

#include <stdexcept>
#include <string>

namespace relog {
    enum class LogLevel {
        TRACE,
        DEBUG,
        INFO,
        WARN,
        ERROR,
        CRITICAL,
        NONE
    };

    /// Thrown when a level without a severity code reaches the formatter.
    /// LogLevel::NONE is filtered out by ILogger::isEnabled() before that.
    class UnsupportedSeverity : public std::logic_error {
    public:
        explicit UnsupportedSeverity(LogLevel level)
            : std::logic_error("Unsupported log severity: " + std::to_string(static_cast<int>(level)))
            , m_level(level) {}

        LogLevel level() const { return m_level; }

    private:
        LogLevel m_level;
    };

    /// Four-character severity code used on the first line of each record.
    inline const char *getLevelCode(LogLevel level) {
        switch (level) {
            case LogLevel::TRACE: return "trce";
            case LogLevel::DEBUG: return "dbug";
            case LogLevel::INFO: return "info";
            case LogLevel::WARN: return "warn";
            case LogLevel::ERROR: return "fail";
            case LogLevel::CRITICAL: return "crit";
            case LogLevel::NONE: break;
        }
        throw UnsupportedSeverity(level);
    }
} // namespace relog

#endif // REDIRECT_LOG_LEVEL_HPP
