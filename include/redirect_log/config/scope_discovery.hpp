#ifndef REDIRECT_LOG_SCOPE_DISCOVERY_HPP
#define REDIRECT_LOG_SCOPE_DISCOVERY_HPP

#include "configuration.hpp"
#include "formatter_options.hpp"
#include "logging_services.hpp"
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace relog {

    constexpr char kConsoleIncludeScopesKey[] = "Logging:Console:IncludeScopes";
    constexpr char kIncludeScopesKey[] = "Logging:IncludeScopes";

    /// Decides whether the host expects scopes to be rendered.
    ///
    /// Strategies are tried in registration order; the first one that
    /// reports a value decides. If none does, scopes are off.
    class ScopeRenderingDiscovery {
    public:
        /// Sets @p includeScopes and returns true when it has an answer.
        using LookupStrategy = std::function<bool(bool &includeScopes)>;

        ScopeRenderingDiscovery &addStrategy(LookupStrategy strategy) {
            if (strategy) {
                m_strategies.push_back(std::move(strategy));
            }
            return *this;
        }

        bool resolve() const {
            for (const auto &strategy : m_strategies) {
                bool includeScopes = false;
                if (strategy(includeScopes)) {
                    return includeScopes;
                }
            }
            return false;
        }

        size_t strategyCount() const { return m_strategies.size(); }

        /// Registered formatter options, most specific kind first, then the
        /// console-specific configuration key, then the generic one.
        static ScopeRenderingDiscovery forServices(const LoggingServices &services) {
            ScopeRenderingDiscovery discovery;
            discovery.addStrategy(fromOptions(services.simpleConsoleOptions))
                     .addStrategy(fromOptions(services.jsonConsoleOptions))
                     .addStrategy(fromOptions(services.consoleOptions))
                     .addStrategy(fromConfiguration(services.configuration, kConsoleIncludeScopesKey))
                     .addStrategy(fromConfiguration(services.configuration, kIncludeScopesKey));
            return discovery;
        }

        static LookupStrategy fromOptions(std::shared_ptr<const ConsoleFormatterOptions> options) {
            return [options](bool &includeScopes) -> bool {
                if (!options) return false;
                includeScopes = options->includeScopes;
                return true;
            };
        }

        static LookupStrategy fromConfiguration(std::shared_ptr<const IConfiguration> config,
                                                const std::string &key) {
            return [config, key](bool &includeScopes) -> bool {
                return config && getBool(*config, key, includeScopes);
            };
        }

    private:
        std::vector<LookupStrategy> m_strategies;
    };

    /// True if the host's logging setup asks for scopes.
    inline bool usesScopes(const LoggingServices &services) {
        return ScopeRenderingDiscovery::forServices(services).resolve();
    }

} // namespace relog

#endif // REDIRECT_LOG_SCOPE_DISCOVERY_HPP
