#pragma once

#include "AuthError.h"
#include "Credentials.h"
#include "ServerConfig.h"
#include "UserProfile.h"
#include "core/Result.h"
#include <optional>
#include <variant>

namespace ArcticLink {
namespace Session {

// Everything the store holds, always read and written as one unit.
struct StoredSession {
    std::optional<ServerConfig> server;
    std::optional<Credentials> credentials;
    std::optional<UserProfile> user;

    bool operator==(const StoredSession&) const = default;
};

/**
 * @brief Durable storage for the session document.
 *
 * save() replaces the whole document. Implementations reject a document that
 * holds credentials or a user without a server config.
 */
class CredentialStore {
public:
    virtual ~CredentialStore() = default;

    virtual Result<StoredSession, AuthError> load() = 0;
    virtual Result<std::monostate, AuthError> save(const StoredSession& session) = 0;

    Result<std::monostate, AuthError> clear() { return save(StoredSession{}); }

protected:
    static Result<std::monostate, AuthError> validate(const StoredSession& session);
};

class InMemoryCredentialStore : public CredentialStore {
public:
    Result<StoredSession, AuthError> load() override;
    Result<std::monostate, AuthError> save(const StoredSession& session) override;

    int saveCount() const { return saveCount_; }

private:
    StoredSession session_;
    int saveCount_ = 0;
};

} // namespace Session
} // namespace ArcticLink
