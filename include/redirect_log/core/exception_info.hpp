#ifndef REDIRECT_LOG_EXCEPTION_INFO_HPP
#define REDIRECT_LOG_EXCEPTION_INFO_HPP

#include <string>
#include <exception>
#include <typeinfo>
#include <cstdlib>
#include <vector>

#if defined(__GNUC__) || defined(__clang__)
#include <cxxabi.h>
#endif

namespace relog {
namespace detail {

    inline std::string demangleTypeName(const char* mangledName) {
        if (!mangledName) return "unknown";
#if defined(__GNUC__) || defined(__clang__)
        int status = 0;
        char* demangled = abi::__cxa_demangle(mangledName, nullptr, nullptr, &status);
        if (status == 0 && demangled) {
            std::string result(demangled);
            std::free(demangled);
            return result;
        }
        std::free(demangled);
        return std::string(mangledName);
#else
        return std::string(mangledName);
#endif
    }

    inline std::string getExceptionTypeName(const std::exception& ex) {
        return demangleTypeName(typeid(ex).name());
    }

    constexpr int kMaxExceptionCauses = 20;

    /// What a log record keeps of an exception once the exception itself is
    /// gone.
    struct ExceptionInfo {
        std::string type;
        std::string message;
        /// "type: message" of each nested cause, outermost first.
        std::vector<std::string> causes;
    };

    inline std::string describeCause(const std::exception& ex) {
        const char* what = ex.what();
        return getExceptionTypeName(ex) + ": " + (what ? what : "");
    }

    inline void collectCauses(const std::exception& ex, std::vector<std::string>& causes) {
        if (causes.size() >= static_cast<size_t>(kMaxExceptionCauses)) return;
        try {
            std::rethrow_if_nested(ex);
        } catch (const std::exception& nested) {
            causes.push_back(describeCause(nested));
            collectCauses(nested, causes);
        } catch (...) {
            causes.push_back("unknown exception");
        }
    }

    inline ExceptionInfo extractExceptionInfo(const std::exception& ex) {
        ExceptionInfo info;
        info.type = getExceptionTypeName(ex);
        const char* what = ex.what();
        info.message = what ? what : "";
        collectCauses(ex, info.causes);
        return info;
    }

    /// Rethrows @p error to inspect it. Payloads that are not derived from
    /// std::exception are reported as "unknown exception".
    inline ExceptionInfo extractExceptionInfo(std::exception_ptr error) {
        ExceptionInfo info;
        if (!error) {
            info.type = "unknown exception";
            return info;
        }
        try {
            std::rethrow_exception(error);
        } catch (const std::exception& ex) {
            info = extractExceptionInfo(ex);
        } catch (...) {
            info.type = "unknown exception";
        }
        return info;
    }

    /// "type: message", then one "\n  --- type: message" line per cause.
    inline std::string describeException(const ExceptionInfo& info) {
        std::string result = info.type;
        if (!info.message.empty()) {
            result += ": ";
            result += info.message;
        }
        for (const auto& cause : info.causes) {
            result += "\n  --- ";
            result += cause;
        }
        return result;
    }

} // namespace detail
} // namespace relog

#endif // REDIRECT_LOG_EXCEPTION_INFO_HPP
