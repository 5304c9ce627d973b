#pragma once

#include <capturesession/core/Types.hpp>

#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace CS {

// Invoked with the stored location, or std::nullopt if the save failed.
using OnMediaSavedListener = std::function<void(std::optional<Uri> const&)>;

/**
 * MediaSaver: persists an already-finished image without going through the
 * session/placeholder flow.
 */
struct MediaSaver {
    virtual ~MediaSaver() = default;

    virtual auto addImage(Bytes const&                          bytes,
                          std::string const&                    title,
                          std::chrono::system_clock::time_point date,
                          std::optional<Location> const&        location,
                          int                                   width,
                          int                                   height,
                          int                                   orientation,
                          std::optional<ImageMetadata> const&   metadata,
                          OnMediaSavedListener                  listener) -> void = 0;
};

} // namespace CS
