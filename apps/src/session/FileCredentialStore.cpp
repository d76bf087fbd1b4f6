#include "FileCredentialStore.h"
#include "core/LoggingChannels.h"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sys/stat.h>
#include <unistd.h>

namespace ArcticLink {
namespace Session {

namespace {

template <typename T>
nlohmann::json optionalToJson(const std::optional<T>& value)
{
    return value.has_value() ? nlohmann::json(value.value()) : nlohmann::json(nullptr);
}

template <typename T>
std::optional<T> optionalFromJson(const nlohmann::json& doc, const char* key)
{
    if (!doc.contains(key) || doc[key].is_null()) {
        return std::nullopt;
    }
    return doc[key].get<T>();
}

AuthError storageError(const std::string& message)
{
    return AuthError::make(AuthError::Kind::StorageFailure, message);
}

// The document carries bearer tokens: the file is created 0600 rather than
// narrowed after the fact.
Result<std::monostate, AuthError> writeOwnerOnly(
    const std::filesystem::path& path, const std::string& contents)
{
    using R = Result<std::monostate, AuthError>;

    const int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, S_IRUSR | S_IWUSR);
    if (fd < 0) {
        return R::error(storageError("Cannot write " + path.string() + ": " + std::strerror(errno)));
    }
    // O_CREAT leaves the mode of a pre-existing file alone.
    if (::fchmod(fd, S_IRUSR | S_IWUSR) != 0) {
        LOG_WARN(Storage, "Cannot restrict permissions on {}", path.string());
    }

    size_t offset = 0;
    while (offset < contents.size()) {
        const ssize_t n = ::write(fd, contents.data() + offset, contents.size() - offset);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            const std::string reason = std::strerror(errno);
            ::close(fd);
            return R::error(storageError("Write failed for " + path.string() + ": " + reason));
        }
        offset += static_cast<size_t>(n);
    }

    if (::fsync(fd) != 0) {
        LOG_WARN(Storage, "fsync failed for {}", path.string());
    }
    if (::close(fd) != 0) {
        return R::error(storageError("Close failed for " + path.string()));
    }
    return R::okay(std::monostate{});
}

} // namespace

FileCredentialStore::FileCredentialStore(std::filesystem::path path) : path_(std::move(path))
{}

Result<StoredSession, AuthError> FileCredentialStore::load()
{
    using R = Result<StoredSession, AuthError>;
    namespace fs = std::filesystem;

    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        LOG_DEBUG(Storage, "No session file at {}", path_.string());
        return R::okay(StoredSession{});
    }

    std::ifstream file(path_);
    if (!file.is_open()) {
        return R::error(storageError("Cannot open " + path_.string()));
    }

    const auto doc = nlohmann::json::parse(file, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return R::error(storageError("Corrupt session file " + path_.string()));
    }

    try {
        StoredSession session;
        session.server = optionalFromJson<ServerConfig>(doc, "server");
        session.credentials = optionalFromJson<Credentials>(doc, "credentials");
        session.user = optionalFromJson<UserProfile>(doc, "user");

        auto valid = validate(session);
        if (valid.isError()) {
            return R::error(storageError("Session file holds credentials without a server"));
        }
        return R::okay(std::move(session));
    }
    catch (const nlohmann::json::exception& e) {
        return R::error(storageError("Invalid session file " + path_.string() + ": " + e.what()));
    }
}

Result<std::monostate, AuthError> FileCredentialStore::save(const StoredSession& session)
{
    using R = Result<std::monostate, AuthError>;
    namespace fs = std::filesystem;

    auto valid = validate(session);
    if (valid.isError()) {
        return valid;
    }

    std::error_code ec;
    if (path_.has_parent_path()) {
        fs::create_directories(path_.parent_path(), ec);
        if (ec) {
            return R::error(storageError(
                "Cannot create " + path_.parent_path().string() + ": " + ec.message()));
        }
    }

    const nlohmann::json doc{
        { "server", optionalToJson(session.server) },
        { "credentials", optionalToJson(session.credentials) },
        { "user", optionalToJson(session.user) },
    };

    const fs::path tmpPath = path_.string() + ".tmp";
    auto written = writeOwnerOnly(tmpPath, doc.dump(2) + "\n");
    if (written.isError()) {
        fs::remove(tmpPath, ec);
        return written;
    }

    fs::rename(tmpPath, path_, ec);
    if (ec) {
        fs::remove(tmpPath, ec);
        return R::error(storageError("Cannot replace " + path_.string()));
    }

    LOG_DEBUG(
        Storage,
        "Saved session (server={}, credentials={}, user={})",
        session.server.has_value(),
        session.credentials.has_value(),
        session.user.has_value());
    return R::okay(std::monostate{});
}

} // namespace Session
} // namespace ArcticLink
