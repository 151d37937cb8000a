#ifndef REDIRECT_LOG_JSON_CONFIGURATION_HPP
#define REDIRECT_LOG_JSON_CONFIGURATION_HPP

#include "configuration.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>

namespace relog {

    /// Configuration backed by a JSON document such as appsettings.json.
    ///
    /// The tree is flattened once at construction: nested objects become
    /// ':'-joined paths and array elements are addressed by index
    /// ("Servers:0:Name"). Strings are exposed verbatim, booleans as
    /// "true"/"false", numbers as their JSON text. Nulls, and objects or
    /// arrays themselves, have no value.
    class JsonConfiguration : public IConfiguration {
    public:
        /// @throws std::runtime_error if @p document is not a JSON object.
        explicit JsonConfiguration(const nlohmann::json &document) {
            if (!document.is_object()) {
                throw std::runtime_error("Configuration root must be a JSON object");
            }
            flatten(document, std::string());
        }

        /// @throws std::runtime_error on malformed JSON.
        static JsonConfiguration fromString(const std::string &text) {
            nlohmann::json document;
            try {
                document = nlohmann::json::parse(text);
            } catch (const nlohmann::json::exception &ex) {
                throw std::runtime_error(std::string("Failed to parse configuration: ") + ex.what());
            }
            return JsonConfiguration(document);
        }

        /// @throws std::runtime_error if the file cannot be read or parsed.
        static JsonConfiguration fromFile(const std::string &filename) {
            std::ifstream file(filename);
            if (!file.is_open()) {
                throw std::runtime_error("Failed to open configuration file: " + filename);
            }
            std::stringstream buffer;
            buffer << file.rdbuf();
            return fromString(buffer.str());
        }

        bool tryGet(const std::string &path, std::string &value) const override {
            auto it = m_values.find(detail::normalizeKey(path));
            if (it == m_values.end()) return false;
            value = it->second;
            return true;
        }

    private:
        void flatten(const nlohmann::json &node, const std::string &prefix) {
            if (node.is_object()) {
                for (auto it = node.begin(); it != node.end(); ++it) {
                    flatten(it.value(), join(prefix, it.key()));
                }
            } else if (node.is_array()) {
                for (size_t i = 0; i < node.size(); ++i) {
                    flatten(node[i], join(prefix, std::to_string(i)));
                }
            } else if (node.is_string()) {
                m_values[detail::normalizeKey(prefix)] = node.get<std::string>();
            } else if (node.is_boolean()) {
                m_values[detail::normalizeKey(prefix)] = node.get<bool>() ? "true" : "false";
            } else if (!node.is_null()) {
                m_values[detail::normalizeKey(prefix)] = node.dump();
            }
        }

        static std::string join(const std::string &prefix, const std::string &key) {
            return prefix.empty() ? key : prefix + ":" + key;
        }

        std::map<std::string, std::string> m_values;
    };

} // namespace relog

#endif // REDIRECT_LOG_JSON_CONFIGURATION_HPP
