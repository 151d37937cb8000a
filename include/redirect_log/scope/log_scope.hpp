#ifndef REDIRECT_LOG_LOG_SCOPE_HPP
#define REDIRECT_LOG_LOG_SCOPE_HPP

#include <functional>
#include <utility>

namespace relog {

    /// RAII handle for one pushed scope. Destroying (or dispose()-ing) the
    /// handle pops exactly the scope it pushed. Move-only; a default
    /// constructed or moved-from handle is inactive and pops nothing.
    ///
    /// Must be released on the thread that pushed the scope. Releasing it
    /// on another thread is a no-op.
    class LogScope {
    public:
        LogScope() {}

        explicit LogScope(std::function<void()> release)
            : m_release(std::move(release)) {}

        ~LogScope() {
            dispose();
        }

        LogScope(const LogScope &) = delete;
        LogScope &operator=(const LogScope &) = delete;

        LogScope(LogScope &&other) noexcept
            : m_release(std::move(other.m_release)) {
            other.m_release = nullptr;
        }

        LogScope &operator=(LogScope &&other) noexcept {
            if (this != &other) {
                dispose();
                m_release = std::move(other.m_release);
                other.m_release = nullptr;
            }
            return *this;
        }

        bool active() const {
            return static_cast<bool>(m_release);
        }

        void dispose() {
            if (m_release) {
                std::function<void()> release;
                release.swap(m_release);
                release();
            }
        }

    private:
        std::function<void()> m_release;
    };

} // namespace relog

#endif // REDIRECT_LOG_LOG_SCOPE_HPP
