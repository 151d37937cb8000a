#ifndef REDIRECT_LOG_STREAM_OUTPUT_HPP
#define REDIRECT_LOG_STREAM_OUTPUT_HPP

#include "test_output.hpp"
#include <iostream>
#include <mutex>
#include <stdexcept>

namespace relog {
namespace detail {
    /// A failed stream raises std::runtime_error so a broken output channel
    /// fails the test run instead of dropping records.
    inline void writeStreamLine(std::ostream &stream, const std::string &text) {
        stream << text << '\n' << std::flush;
        if (!stream) {
            throw std::runtime_error("Failed to write log record to output stream");
        }
    }
} // namespace detail

    /// Writes each record followed by '\n' to a caller-owned stream.
    class StreamOutput : public ITestOutput {
    public:
        explicit StreamOutput(std::ostream &stream)
            : m_stream(stream) {}

        void writeLine(const std::string &text) override {
            std::lock_guard<std::mutex> lock(m_mutex);
            detail::writeStreamLine(m_stream, text);
        }

    private:
        std::ostream &m_stream;
        std::mutex m_mutex;
    };

    /// @note All StdoutOutput instances share a single mutex so that
    ///       concurrent writes to stdout are serialized.  StderrOutput
    ///       has its own independent mutex, so stdout and stderr writes
    ///       may interleave at the terminal level.
    class StdoutOutput : public ITestOutput {
    public:
        void writeLine(const std::string &text) override {
            std::lock_guard<std::mutex> lock(sharedMutex());
            detail::writeStreamLine(std::cout, text);
        }

    private:
        static std::mutex &sharedMutex() {
            static std::mutex s_mutex;
            return s_mutex;
        }
    };

    class StderrOutput : public ITestOutput {
    public:
        void writeLine(const std::string &text) override {
            std::lock_guard<std::mutex> lock(sharedMutex());
            detail::writeStreamLine(std::cerr, text);
        }

    private:
        static std::mutex &sharedMutex() {
            static std::mutex s_mutex;
            return s_mutex;
        }
    };
} // namespace relog

#endif // REDIRECT_LOG_STREAM_OUTPUT_HPP
