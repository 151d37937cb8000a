#ifndef REDIRECT_LOG_CALLBACK_OUTPUT_HPP
#define REDIRECT_LOG_CALLBACK_OUTPUT_HPP

#include "test_output.hpp"
#include <functional>
#include <stdexcept>
#include <string>
#include <utility>

namespace relog {

    /// Output that forwards each formatted record to a user callback, e.g.
    /// a test framework's per-test output hook.
    ///
    /// @note The callback runs under the provider's write lock, so it is
    ///       never entered concurrently by loggers of the same provider.
    /// @note Exceptions thrown by the callback propagate to the log call.
    class CallbackOutput : public ITestOutput {
    public:
        using LineCallback = std::function<void(const std::string&)>;

        explicit CallbackOutput(LineCallback cb)
            : m_callback(std::move(cb)) {
            if (!m_callback) {
                throw std::invalid_argument("CallbackOutput requires a callback");
            }
        }

        void writeLine(const std::string &text) override {
            m_callback(text);
        }

    private:
        LineCallback m_callback;
    };

} // namespace relog

#endif // REDIRECT_LOG_CALLBACK_OUTPUT_HPP
