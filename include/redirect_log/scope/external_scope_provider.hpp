#ifndef REDIRECT_LOG_EXTERNAL_SCOPE_PROVIDER_HPP
#define REDIRECT_LOG_EXTERNAL_SCOPE_PROVIDER_HPP

#include "scope_provider.hpp"
#include <atomic>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace relog {

    /// Default IExternalScopeProvider. Scopes form a linked stack per
    /// thread and per provider instance, so scopes pushed on one thread are
    /// never visible on another and two providers never share a stack.
    class LoggerExternalScopeProvider : public IExternalScopeProvider {
    public:
        LoggerExternalScopeProvider()
            : m_id(nextId()) {}

        ~LoggerExternalScopeProvider() override {
            // Other threads' entries are released when those threads exit;
            // ids are never reused so stale entries are never read.
            threadScopes().erase(m_id);
        }

        LoggerExternalScopeProvider(const LoggerExternalScopeProvider &) = delete;
        LoggerExternalScopeProvider &operator=(const LoggerExternalScopeProvider &) = delete;

        void forEachScope(const ScopeVisitor &visitor) const override {
            std::vector<const Node *> path;
            for (const Node *node = current().get(); node; node = node->parent.get()) {
                if (!node->released) path.push_back(node);
            }
            for (auto it = path.rbegin(); it != path.rend(); ++it) {
                visitor((*it)->state);
            }
        }

        /// Scopes may be released in any order. A released scope below the
        /// top stays linked but hidden until everything above it is gone.
        LogScope push(std::string state) override {
            std::shared_ptr<Node> &top = threadScopes()[m_id];
            std::shared_ptr<Node> node = std::make_shared<Node>(std::move(state), top);
            top = node;

            const unsigned long long id = m_id;
            return LogScope([id, node]() {
                release(id, node.get());
            });
        }

    private:
        struct Node {
            Node(std::string s, std::shared_ptr<Node> p)
                : state(std::move(s)), parent(std::move(p)), released(false) {}

            std::string state;
            std::shared_ptr<Node> parent;
            bool released;
        };

        using ScopeMap = std::unordered_map<unsigned long long, std::shared_ptr<Node> >;

        // Nodes are only reachable from the pushing thread's map, so a
        // release from any other thread finds nothing and does nothing.
        static void release(unsigned long long id, Node *node) {
            ScopeMap &scopes = threadScopes();
            auto it = scopes.find(id);
            if (it == scopes.end()) return;

            bool onStack = false;
            for (Node *n = it->second.get(); n; n = n->parent.get()) {
                if (n == node) {
                    onStack = true;
                    break;
                }
            }
            if (!onStack) return;

            node->released = true;

            std::shared_ptr<Node> top = it->second;
            while (top && top->released) {
                top = top->parent;
            }
            if (top) {
                it->second = std::move(top);
            } else {
                scopes.erase(it);
            }
        }

        static ScopeMap &threadScopes() {
            static thread_local ScopeMap s_scopes;
            return s_scopes;
        }

        static unsigned long long nextId() {
            static std::atomic<unsigned long long> s_next(1);
            return s_next.fetch_add(1, std::memory_order_relaxed);
        }

        std::shared_ptr<const Node> current() const {
            const ScopeMap &scopes = threadScopes();
            auto it = scopes.find(m_id);
            return it == scopes.end() ? std::shared_ptr<const Node>() : std::shared_ptr<const Node>(it->second);
        }

        unsigned long long m_id;
    };

} // namespace relog

#endif // REDIRECT_LOG_EXTERNAL_SCOPE_PROVIDER_HPP
