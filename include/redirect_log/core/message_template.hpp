#ifndef REDIRECT_LOG_MESSAGE_TEMPLATE_HPP
#define REDIRECT_LOG_MESSAGE_TEMPLATE_HPP

#include "log_common.hpp"
#include <string>
#include <vector>

namespace relog {
namespace detail {

    /// Replaces each {placeholder} positionally with the next value.
    /// "{{" and "}}" are literal braces. Placeholders without a value and
    /// unterminated '{' are copied verbatim.
    inline std::string renderTemplate(const std::string &messageTemplate,
                                      const std::vector<std::string> &values) {
        std::string result;
        result.reserve(messageTemplate.length());
        size_t valueIndex = 0;

        for (size_t i = 0; i < messageTemplate.length(); ++i) {
            const char c = messageTemplate[i];
            if (c == '{') {
                if (i + 1 < messageTemplate.length() && messageTemplate[i + 1] == '{') {
                    result += '{';
                    ++i;
                    continue;
                }
                size_t endPos = messageTemplate.find('}', i);
                if (endPos == std::string::npos) {
                    result += c;
                } else if (valueIndex < values.size()) {
                    result += values[valueIndex++];
                    i = endPos;
                } else {
                    result.append(messageTemplate, i, endPos - i + 1);
                    i = endPos;
                }
            } else if (c == '}') {
                if (i + 1 < messageTemplate.length() && messageTemplate[i + 1] == '}') {
                    ++i;
                }
                result += '}';
            } else {
                result += c;
            }
        }
        return result;
    }

    template<typename... Args>
    std::string formatMessage(const std::string &messageTemplate, const Args &... args) {
        std::vector<std::string> values{toString(args)...};
        return renderTemplate(messageTemplate, values);
    }

    inline std::string formatMessage(const std::string &messageTemplate) {
        return renderTemplate(messageTemplate, std::vector<std::string>());
    }

} // namespace detail
} // namespace relog

#endif // REDIRECT_LOG_MESSAGE_TEMPLATE_HPP
