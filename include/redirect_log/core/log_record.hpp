#ifndef REDIRECT_LOG_RECORD_HPP
#define REDIRECT_LOG_RECORD_HPP

#include "log_level.hpp"
#include "event_id.hpp"
#include "exception_info.hpp"
#include <string>
#include <memory>

namespace relog {
    /// One log call, after message interpolation. Built by the logger,
    /// consumed by TestOutputFormatter, then discarded.
    struct LogRecord {
        LogLevel level;
        std::string category;
        EventId eventId;
        std::string message;
        std::shared_ptr<const detail::ExceptionInfo> exception;

        bool hasException() const { return exception != nullptr; }
    };
} // namespace relog

#endif // REDIRECT_LOG_RECORD_HPP
