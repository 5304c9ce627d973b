#pragma once

#include <capturesession/core/Error.hpp>
#include <capturesession/core/Types.hpp>

namespace CS {

/**
 * ImageInspector: reads what the core needs from encoded image bytes
 * without decoding pixel data.
 */
struct ImageInspector {
    virtual ~ImageInspector() = default;

    virtual auto decodeBounds(Bytes const& bytes) const -> Expected<ImageBounds>   = 0;
    virtual auto readMetadata(Bytes const& bytes) const -> Expected<ImageMetadata> = 0;
};

} // namespace CS
