#include "CredentialStore.h"

namespace ArcticLink {
namespace Session {

Result<std::monostate, AuthError> CredentialStore::validate(const StoredSession& session)
{
    if (!session.server.has_value() && (session.credentials || session.user)) {
        return Result<std::monostate, AuthError>::error(AuthError::make(
            AuthError::Kind::StorageFailure, "Refusing to store credentials without a server"));
    }
    return Result<std::monostate, AuthError>::okay(std::monostate{});
}

Result<StoredSession, AuthError> InMemoryCredentialStore::load()
{
    return Result<StoredSession, AuthError>::okay(session_);
}

Result<std::monostate, AuthError> InMemoryCredentialStore::save(const StoredSession& session)
{
    auto valid = validate(session);
    if (valid.isError()) {
        return valid;
    }
    session_ = session;
    ++saveCount_;
    return valid;
}

} // namespace Session
} // namespace ArcticLink
