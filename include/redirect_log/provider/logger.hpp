#ifndef REDIRECT_LOG_LOGGER_HPP
#define REDIRECT_LOG_LOGGER_HPP

#include "../core/event_id.hpp"
#include "../core/exception_info.hpp"
#include "../core/log_common.hpp"
#include "../core/log_level.hpp"
#include "../core/message_template.hpp"
#include "../scope/log_scope.hpp"
#include <exception>
#include <initializer_list>
#include <memory>
#include <string>
#include <utility>

namespace relog {

    /// The logging surface application code sees. Implementations provide
    /// isEnabled(), write() and beginScope(const std::string&); the
    /// templated helpers interpolate message templates and attach
    /// exceptions before calling write().
    ///
    /// Usage:
    /// @code
    ///   auto log = provider.createLogger("App.Service");
    ///   auto scope = log->beginScope("request:42");
    ///   log->log(LogLevel::INFO, 7, "User {name} logged in", "alice");
    ///   log->error("Lookup failed for {id}", 42);
    /// @endcode
    class ILogger {
    public:
        virtual ~ILogger() = default;

        virtual bool isEnabled(LogLevel level) const = 0;

        /// Writes an already interpolated message. @p exception may be null.
        virtual void write(LogLevel level, const EventId &eventId, const std::string &message,
                           std::shared_ptr<const detail::ExceptionInfo> exception) = 0;

        virtual LogScope beginScope(const std::string &state) = 0;

        template<typename T>
        LogScope beginScope(const T &state) {
            return beginScope(detail::toString(state));
        }

        /// Key/value scope, rendered "k1=v1, k2=v2".
        LogScope beginScope(std::initializer_list<std::pair<std::string, std::string> > properties) {
            std::string state;
            for (const auto &kv : properties) {
                if (!state.empty()) state += ", ";
                state += kv.first;
                state += '=';
                state += kv.second;
            }
            return beginScope(state);
        }

        template<typename... Args>
        void log(LogLevel level, const EventId &eventId, const std::string &messageTemplate,
                 const Args &... args) {
            if (!isEnabled(level)) return;
            write(level, eventId, detail::formatMessage(messageTemplate, args...), nullptr);
        }

        template<typename... Args>
        void log(LogLevel level, const EventId &eventId, const std::exception &ex,
                 const std::string &messageTemplate, const Args &... args) {
            if (!isEnabled(level)) return;
            write(level, eventId, detail::formatMessage(messageTemplate, args...),
                  std::make_shared<detail::ExceptionInfo>(detail::extractExceptionInfo(ex)));
        }

        template<typename... Args>
        void log(LogLevel level, const EventId &eventId, std::exception_ptr error,
                 const std::string &messageTemplate, const Args &... args) {
            if (!isEnabled(level)) return;
            std::shared_ptr<const detail::ExceptionInfo> info;
            if (error) {
                info = std::make_shared<detail::ExceptionInfo>(detail::extractExceptionInfo(error));
            }
            write(level, eventId, detail::formatMessage(messageTemplate, args...), std::move(info));
        }

        template<typename... Args>
        void trace(const std::string &messageTemplate, const Args &... args) {
            log(LogLevel::TRACE, EventId(), messageTemplate, args...);
        }

        template<typename... Args>
        void debug(const std::string &messageTemplate, const Args &... args) {
            log(LogLevel::DEBUG, EventId(), messageTemplate, args...);
        }

        template<typename... Args>
        void info(const std::string &messageTemplate, const Args &... args) {
            log(LogLevel::INFO, EventId(), messageTemplate, args...);
        }

        template<typename... Args>
        void warn(const std::string &messageTemplate, const Args &... args) {
            log(LogLevel::WARN, EventId(), messageTemplate, args...);
        }

        template<typename... Args>
        void error(const std::string &messageTemplate, const Args &... args) {
            log(LogLevel::ERROR, EventId(), messageTemplate, args...);
        }

        template<typename... Args>
        void critical(const std::string &messageTemplate, const Args &... args) {
            log(LogLevel::CRITICAL, EventId(), messageTemplate, args...);
        }
    };

    /// Creates loggers for categories. One provider per destination.
    class ILoggerProvider {
    public:
        virtual ~ILoggerProvider() = default;

        virtual std::shared_ptr<ILogger> createLogger(const std::string &category) = 0;

        /// Called by the host when logging is torn down. Must not throw.
        virtual void shutdown() = 0;
    };

} // namespace relog

#endif // REDIRECT_LOG_LOGGER_HPP
