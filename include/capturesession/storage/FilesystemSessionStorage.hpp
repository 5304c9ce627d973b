#pragma once

#include <capturesession/providers/SessionStorageManager.hpp>

#include <chrono>
#include <filesystem>
#include <string>

namespace CS {

struct FilesystemSessionStorageOptions {
    std::filesystem::path root;
    // Entries directly below a session directory whose newest write is older
    // than this are removed whenever the directory is handed out. Zero
    // disables the sweep.
    std::chrono::hours max_session_age{std::chrono::hours{24}};
};

/**
 * SessionStorageManager backed by a directory on the local filesystem.
 *
 * resolveSessionDirectory("X") names <root>/X. getSessionDirectory("X")
 * also creates it if needed and sweeps expired entries inside it.
 */
class FilesystemSessionStorage final : public SessionStorageManager {
public:
    explicit FilesystemSessionStorage(FilesystemSessionStorageOptions options);

    auto resolveSessionDirectory(std::string const& subDirectory) const -> Expected<std::filesystem::path> override;
    auto getSessionDirectory(std::string const& subDirectory) -> Expected<std::filesystem::path> override;

    auto root() const -> std::filesystem::path const&;

private:
    auto cleanUpExpiredSessions(std::filesystem::path const& directory) const -> void;

    FilesystemSessionStorageOptions options_;
};

} // namespace CS
