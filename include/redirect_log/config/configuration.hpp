#ifndef REDIRECT_LOG_CONFIGURATION_HPP
#define REDIRECT_LOG_CONFIGURATION_HPP

#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace relog {
namespace detail {
    inline std::string toLowerAscii(std::string value) {
        std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        return value;
    }

    inline std::string trimAscii(const std::string &value) {
        size_t begin = 0;
        size_t end = value.size();
        while (begin < end && std::isspace(static_cast<unsigned char>(value[begin]))) ++begin;
        while (end > begin && std::isspace(static_cast<unsigned char>(value[end - 1]))) --end;
        return value.substr(begin, end - begin);
    }

    /// Configuration keys compare case-insensitively.
    inline std::string normalizeKey(const std::string &key) {
        return toLowerAscii(key);
    }
} // namespace detail

    /// Hierarchical key/value configuration. Paths use ':' between
    /// sections ("Logging:Console:IncludeScopes") and are case-insensitive.
    class IConfiguration {
    public:
        virtual ~IConfiguration() = default;

        /// @return false if @p path has no value.
        virtual bool tryGet(const std::string &path, std::string &value) const = 0;
    };

    /// Flat in-memory configuration.
    class MemoryConfiguration : public IConfiguration {
    public:
        MemoryConfiguration() {}

        MemoryConfiguration(std::initializer_list<std::pair<std::string, std::string> > values) {
            for (const auto &kv : values) {
                set(kv.first, kv.second);
            }
        }

        MemoryConfiguration &set(const std::string &path, const std::string &value) {
            m_values[detail::normalizeKey(path)] = value;
            return *this;
        }

        bool tryGet(const std::string &path, std::string &value) const override {
            auto it = m_values.find(detail::normalizeKey(path));
            if (it == m_values.end()) return false;
            value = it->second;
            return true;
        }

    private:
        std::map<std::string, std::string> m_values;
    };

    /// Layered configuration. A later source overrides an earlier one.
    class ConfigurationRoot : public IConfiguration {
    public:
        ConfigurationRoot &add(std::shared_ptr<const IConfiguration> source) {
            if (source) {
                m_sources.push_back(std::move(source));
            }
            return *this;
        }

        bool tryGet(const std::string &path, std::string &value) const override {
            for (auto it = m_sources.rbegin(); it != m_sources.rend(); ++it) {
                if ((*it)->tryGet(path, value)) return true;
            }
            return false;
        }

        size_t sourceCount() const { return m_sources.size(); }

    private:
        std::vector<std::shared_ptr<const IConfiguration> > m_sources;
    };

    /// Reads a boolean. "true"/"false" in any case, surrounding whitespace
    /// ignored. Anything else counts as missing.
    inline bool getBool(const IConfiguration &config, const std::string &path, bool &value) {
        std::string raw;
        if (!config.tryGet(path, raw)) return false;
        const std::string text = detail::toLowerAscii(detail::trimAscii(raw));
        if (text == "true") {
            value = true;
            return true;
        }
        if (text == "false") {
            value = false;
            return true;
        }
        return false;
    }
} // namespace relog

#endif // REDIRECT_LOG_CONFIGURATION_HPP
