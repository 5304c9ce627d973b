#pragma once

#include <capturesession/core/Error.hpp>
#include <capturesession/core/Types.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace CS {

/**
 * PlaceholderManager: owns the provisional media entries shown before a
 * capture has been fully processed.
 *
 * Contract
 * --------
 * - insertPlaceholder/convertToPlaceholder return the handle whose outputUri
 *   becomes the session identifier.
 * - replacePlaceholder swaps the preview content of a live placeholder.
 * - finishPlaceholder turns the placeholder into the final media item and
 *   returns its location.
 *
 * Thread-safety
 * -------------
 * Calls arrive from producer threads and from the background queue, possibly
 * concurrently for different placeholders. Implementations must be thread-safe.
 */
struct PlaceholderManager {
    virtual ~PlaceholderManager() = default;

    virtual auto insertPlaceholder(std::string const&                    title,
                                   Bytes const&                          seed,
                                   std::chrono::system_clock::time_point timestamp) -> Expected<PlaceholderSession> = 0;

    virtual auto convertToPlaceholder(Uri const& existing) -> Expected<PlaceholderSession> = 0;

    virtual auto replacePlaceholder(PlaceholderSession const& session, Bytes const& bytes, int width, int height)
            -> Expected<void> = 0;

    virtual auto finishPlaceholder(PlaceholderSession const&       session,
                                   std::optional<Location> const&  location,
                                   int                             orientation,
                                   std::optional<ImageMetadata> const& metadata,
                                   Bytes const&                    bytes,
                                   int                             width,
                                   int                             height,
                                   std::string_view                mimeType) -> Expected<Uri> = 0;
};

} // namespace CS
