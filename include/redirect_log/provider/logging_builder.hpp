#ifndef REDIRECT_LOG_LOGGING_BUILDER_HPP
#define REDIRECT_LOG_LOGGING_BUILDER_HPP

#include "logger.hpp"
#include "test_logger_provider.hpp"
#include "../config/logging_services.hpp"
#include "../config/scope_discovery.hpp"
#include "../core/log_common.hpp"
#include "../output/test_output.hpp"
#include "../scope/external_scope_provider.hpp"
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace relog {

    /// Host-side logger factory over a single provider. Owns the scope
    /// storage and hands it to the provider if the provider accepts one.
    class LoggerFactory {
    public:
        explicit LoggerFactory(std::shared_ptr<ILoggerProvider> provider)
            : m_provider(std::move(provider))
            , m_scopes(std::make_shared<LoggerExternalScopeProvider>()) {
            if (!m_provider) {
                throw std::invalid_argument("LoggerFactory requires a provider");
            }
            ISupportExternalScope *external = dynamic_cast<ISupportExternalScope *>(m_provider.get());
            if (external) {
                external->setScopeProvider(m_scopes);
            }
        }

        ~LoggerFactory() {
            m_provider->shutdown();
        }

        LoggerFactory(const LoggerFactory &) = delete;
        LoggerFactory &operator=(const LoggerFactory &) = delete;

        std::shared_ptr<ILogger> createLogger(const std::string &category) {
            return m_provider->createLogger(category);
        }

        const std::shared_ptr<LoggerExternalScopeProvider> &scopeProvider() const {
            return m_scopes;
        }

    private:
        std::shared_ptr<ILoggerProvider> m_provider;
        std::shared_ptr<LoggerExternalScopeProvider> m_scopes;
    };

    /// Collects the host's logging registrations before a LoggerFactory is
    /// built.
    ///
    /// Usage:
    /// @code
    ///   LoggingBuilder builder;
    ///   builder.services().configuration = config;
    ///   withTestLogging(builder, output);
    ///   auto factory = builder.build();
    /// @endcode
    class LoggingBuilder {
    public:
        LoggingServices &services() { return m_services; }

        const LoggingServices &services() const { return m_services; }

        LoggingBuilder &addProvider(std::shared_ptr<ILoggerProvider> provider) {
            if (!provider) {
                throw std::invalid_argument("Cannot add a null logger provider");
            }
            m_providers.push_back(std::move(provider));
            return *this;
        }

        LoggingBuilder &clearProviders() {
            m_providers.clear();
            return *this;
        }

        const std::vector<std::shared_ptr<ILoggerProvider> > &providers() const {
            return m_providers;
        }

        /// Builds the factory. May be called once: a second factory would
        /// rebind the provider's scopes and shut it down a second time.
        /// @throws std::logic_error unless exactly one provider is registered,
        ///         or if build() was already called.
        std::unique_ptr<LoggerFactory> build() {
            if (m_built) {
                throw std::logic_error("LoggingBuilder::build() may only be called once");
            }
            if (m_providers.size() != 1) {
                throw std::logic_error("LoggingBuilder requires exactly one provider, found " +
                                       std::to_string(m_providers.size()));
            }
            std::unique_ptr<LoggerFactory> factory = detail::make_unique<LoggerFactory>(m_providers.front());
            m_built = true;
            return factory;
        }

    private:
        LoggingServices m_services;
        std::vector<std::shared_ptr<ILoggerProvider> > m_providers;
        bool m_built = false;
    };

    /// Redirects all logging of @p builder to @p output.
    ///
    /// Scope usage is read from the builder's registrations first, then
    /// every existing provider (console, file, remote) is removed and a
    /// TestLoggerProvider takes their place.
    inline std::shared_ptr<TestLoggerProvider> withTestLogging(LoggingBuilder &builder, ITestOutput &output) {
        const bool useScopes = usesScopes(builder.services());

        builder.clearProviders();

        std::shared_ptr<TestLoggerProvider> provider = std::make_shared<TestLoggerProvider>(output, useScopes);
        builder.addProvider(provider);
        return provider;
    }

} // namespace relog

#endif // REDIRECT_LOG_LOGGING_BUILDER_HPP
