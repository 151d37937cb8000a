#ifndef REDIRECT_LOG_COMMON_HPP
#define REDIRECT_LOG_COMMON_HPP

#include <string>
#include <sstream>
#include <memory>
#include <utility>

namespace relog {
namespace detail {
#if __cplusplus < 201402L
    template<typename T, typename... Args>
    std::unique_ptr<T> make_unique(Args&&... args) {
        return std::unique_ptr<T>(new T(std::forward<Args>(args)...));
    }
#else
    using std::make_unique;
#endif

    template<typename T>
    std::string toString(const T &value) {
        std::ostringstream oss;
        oss << value;
        return oss.str();
    }

    inline std::string toString(const std::string &value) {
        return value;
    }

    inline std::string toString(const char *value) {
        return value ? std::string(value) : std::string("(null)");
    }

    inline std::string toString(bool value) {
        return value ? "true" : "false";
    }
} // namespace detail
} // namespace relog

#endif // REDIRECT_LOG_COMMON_HPP
