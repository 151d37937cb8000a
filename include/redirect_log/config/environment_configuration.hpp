#ifndef REDIRECT_LOG_ENVIRONMENT_CONFIGURATION_HPP
#define REDIRECT_LOG_ENVIRONMENT_CONFIGURATION_HPP

#include "configuration.hpp"
#include <map>
#include <string>

#ifdef _WIN32
#include <stdlib.h>
#else
#include <unistd.h>
extern char **environ;
#endif

namespace relog {

    /// Configuration read from environment variables, captured once at
    /// construction. "__" separates sections, so
    /// Logging__Console__IncludeScopes maps to Logging:Console:IncludeScopes.
    /// When @p prefix is non-empty only variables starting with it
    /// (case-insensitively) are kept, with the prefix removed.
    class EnvironmentConfiguration : public IConfiguration {
    public:
        explicit EnvironmentConfiguration(const std::string &prefix = std::string()) {
#ifdef _WIN32
            char **env = _environ;
#else
            char **env = environ;
#endif
            const std::string normalizedPrefix = detail::normalizeKey(prefix);
            for (; env && *env; ++env) {
                const std::string entry(*env);
                const size_t eq = entry.find('=');
                if (eq == std::string::npos || eq == 0) continue;

                std::string name = entry.substr(0, eq);
                if (!normalizedPrefix.empty()) {
                    if (detail::normalizeKey(name.substr(0, normalizedPrefix.size())) != normalizedPrefix) continue;
                    name = name.substr(normalizedPrefix.size());
                    if (name.empty()) continue;
                }
                m_values[detail::normalizeKey(toPath(name))] = entry.substr(eq + 1);
            }
        }

        bool tryGet(const std::string &path, std::string &value) const override {
            auto it = m_values.find(detail::normalizeKey(path));
            if (it == m_values.end()) return false;
            value = it->second;
            return true;
        }

    private:
        static std::string toPath(const std::string &name) {
            std::string path;
            path.reserve(name.size());
            for (size_t i = 0; i < name.size(); ++i) {
                if (name[i] == '_' && i + 1 < name.size() && name[i + 1] == '_') {
                    path += ':';
                    ++i;
                } else {
                    path += name[i];
                }
            }
            return path;
        }

        std::map<std::string, std::string> m_values;
    };

} // namespace relog

#endif // REDIRECT_LOG_ENVIRONMENT_CONFIGURATION_HPP
