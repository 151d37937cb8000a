#ifndef REDIRECT_LOG_SCOPE_PROVIDER_HPP
#define REDIRECT_LOG_SCOPE_PROVIDER_HPP

#include "log_scope.hpp"
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace relog {

    using ScopeVisitor = std::function<void(const std::string &scope)>;

    /// Read-only view over the scopes active on the calling thread.
    class IScopeChain {
    public:
        virtual ~IScopeChain() = default;

        /// Calls @p visitor once per active scope, outermost first.
        virtual void forEachScope(const ScopeVisitor &visitor) const = 0;
    };

    /// Scope storage owned by the host logging infrastructure.
    class IExternalScopeProvider : public IScopeChain {
    public:
        virtual LogScope push(std::string state) = 0;
    };

    /// Implemented by providers that accept the host's scope storage
    /// after they have been constructed.
    class ISupportExternalScope {
    public:
        virtual ~ISupportExternalScope() = default;

        virtual void setScopeProvider(std::shared_ptr<IExternalScopeProvider> scopes) = 0;
    };

    /// Fixed list of scope values, outermost first.
    class ScopeSnapshot : public IScopeChain {
    public:
        ScopeSnapshot() {}

        explicit ScopeSnapshot(std::vector<std::string> scopes)
            : m_scopes(std::move(scopes)) {}

        /// Copies whatever @p chain currently reports.
        static ScopeSnapshot capture(const IScopeChain &chain) {
            std::vector<std::string> scopes;
            chain.forEachScope([&scopes](const std::string &scope) {
                scopes.push_back(scope);
            });
            return ScopeSnapshot(std::move(scopes));
        }

        void forEachScope(const ScopeVisitor &visitor) const override {
            for (const auto &scope : m_scopes) {
                visitor(scope);
            }
        }

        const std::vector<std::string> &scopes() const { return m_scopes; }

    private:
        std::vector<std::string> m_scopes;
    };

} // namespace relog

#endif // REDIRECT_LOG_SCOPE_PROVIDER_HPP
