#pragma once
#include <stdexcept>
#include <string>

namespace ferry {

    /**
     * @brief Invalid configuration: bad redaction pattern, unreadable config, bad credentials format.
     * Never retried.
     */
    class ConfigError : public std::runtime_error {
    public:
        explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
    };

    /**
     * @brief Classified failure of a sync operation (remote or local).
     */
    class SyncError : public std::runtime_error {
    public:
        enum class Kind {
            Unauthorized,   // 401/403, caller must re-authenticate
            NotFound,       // 404, session or file gone on the backend
            Conflict,       // 409
            RateLimited,    // 429 after retries were exhausted
            Transport,      // Connection failure, timeout, other non-2xx
            Protocol,       // Response could not be decoded
            LocalIo,        // Unreadable file, line larger than the chunk budget
            NotInitialized  // sync_all() before init()
        };

        SyncError(Kind kind, const std::string& what) : std::runtime_error(what), m_kind(kind) {}

        Kind kind() const { return m_kind; }

        /**
         * @brief True when the outcome of the request is unknown to us, so the
         * backend may or may not have applied it.
         */
        bool is_ambiguous() const {
            switch (m_kind) {
                case Kind::Unauthorized:
                case Kind::NotFound:
                case Kind::LocalIo:
                case Kind::NotInitialized:
                    return false;
                default:
                    return true;
            }
        }

    private:
        Kind m_kind;
    };

}
