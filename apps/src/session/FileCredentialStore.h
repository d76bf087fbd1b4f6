#pragma once

#include "CredentialStore.h"
#include <filesystem>

namespace ArcticLink {
namespace Session {

/**
 * @brief Stores the session as one JSON document:
 *   { "server": {...} | null, "credentials": {...} | null, "user": {...} | null }
 *
 * Writes go to "<path>.tmp" and are renamed over the target, so a reader sees
 * either the old document or the new one. A missing file loads as empty.
 */
class FileCredentialStore : public CredentialStore {
public:
    explicit FileCredentialStore(std::filesystem::path path);

    Result<StoredSession, AuthError> load() override;
    Result<std::monostate, AuthError> save(const StoredSession& session) override;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

} // namespace Session
} // namespace ArcticLink
