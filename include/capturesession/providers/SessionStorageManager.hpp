#pragma once

#include <capturesession/core/Error.hpp>

#include <filesystem>
#include <string>

namespace CS {

/**
 * SessionStorageManager: tells the core where session data may be written.
 *
 * resolveSessionDirectory names the directory for a subdirectory without
 * touching the filesystem. getSessionDirectory returns the same directory,
 * provisioning it (and doing any housekeeping) if needed. Both fail with
 * Error::Code::StorageUnavailable.
 */
struct SessionStorageManager {
    virtual ~SessionStorageManager() = default;

    virtual auto resolveSessionDirectory(std::string const& subDirectory) const -> Expected<std::filesystem::path> = 0;
    virtual auto getSessionDirectory(std::string const& subDirectory) -> Expected<std::filesystem::path>           = 0;
};

} // namespace CS
