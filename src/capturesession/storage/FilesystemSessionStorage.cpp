#include <capturesession/storage/FilesystemSessionStorage.hpp>
#include <capturesession/log/TaggedLogger.hpp>

#include <system_error>

namespace CS {

namespace fs = std::filesystem;

FilesystemSessionStorage::FilesystemSessionStorage(FilesystemSessionStorageOptions options)
    : options_{std::move(options)} {}

auto FilesystemSessionStorage::root() const -> fs::path const& {
    return options_.root;
}

namespace {

// Newest write time of path or anything below it. A session directory's own
// mtime does not move when a file inside it is rewritten.
auto newestWriteTime(fs::path const& path, fs::file_time_type newest) -> fs::file_time_type {
    std::error_code ec;
    if (!fs::is_directory(path, ec)) {
        return newest;
    }
    for (auto it = fs::recursive_directory_iterator(path, ec); !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        std::error_code timeError;
        auto const      lastWrite = it->last_write_time(timeError);
        if (!timeError && lastWrite > newest) {
            newest = lastWrite;
        }
    }
    return newest;
}

} // namespace

auto FilesystemSessionStorage::resolveSessionDirectory(std::string const& subDirectory) const -> Expected<fs::path> {
    if (options_.root.empty()) {
        return std::unexpected(Error{Error::Code::StorageUnavailable, "no session storage root configured"});
    }
    if (subDirectory.empty() || fs::path{subDirectory}.has_parent_path() || subDirectory == "." || subDirectory == "..") {
        return std::unexpected(Error{Error::Code::StorageUnavailable, "invalid session subdirectory '" + subDirectory + "'"});
    }
    return options_.root / subDirectory;
}

auto FilesystemSessionStorage::getSessionDirectory(std::string const& subDirectory) -> Expected<fs::path> {
    auto resolved = resolveSessionDirectory(subDirectory);
    if (!resolved) {
        return resolved;
    }

    auto const&     directory = *resolved;
    std::error_code ec;
    fs::create_directories(directory, ec);
    if (ec) {
        return std::unexpected(Error{Error::Code::StorageUnavailable,
                                     "could not create session directory " + directory.string() + ": " + ec.message()});
    }
    if (!fs::is_directory(directory, ec)) {
        return std::unexpected(
                Error{Error::Code::StorageUnavailable, "session directory " + directory.string() + " is not a directory"});
    }

    cleanUpExpiredSessions(directory);
    return directory;
}

auto FilesystemSessionStorage::cleanUpExpiredSessions(fs::path const& directory) const -> void {
    if (options_.max_session_age.count() <= 0) {
        return;
    }
    std::error_code ec;
    auto const      cutoff = fs::file_time_type::clock::now() - options_.max_session_age;
    for (auto it = fs::directory_iterator(directory, ec); !ec && it != fs::directory_iterator(); it.increment(ec)) {
        std::error_code timeError;
        auto const      lastWrite = newestWriteTime(it->path(), it->last_write_time(timeError));
        if (timeError || lastWrite >= cutoff) {
            continue;
        }
        std::error_code removeError;
        fs::remove_all(it->path(), removeError);
        if (removeError) {
            cs_log("Could not remove expired session " + it->path().string() + ": " + removeError.message(),
                   "SessionStorage", "Warning");
        } else {
            cs_log("Removed expired session " + it->path().string(), "SessionStorage");
        }
    }
    if (ec) {
        cs_log("Could not list " + directory.string() + ": " + ec.message(), "SessionStorage", "Warning");
    }
}

} // namespace CS
