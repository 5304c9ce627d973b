#pragma once

#include <capturesession/providers/ImageInspector.hpp>

namespace CS {

/**
 * ImageInspector for baseline and progressive JPEG streams.
 *
 * Only marker segments up to the first start-of-scan are examined; no
 * entropy-coded data is touched.
 */
class JpegImageInspector final : public ImageInspector {
public:
    // Dimensions from the first SOFn segment.
    auto decodeBounds(Bytes const& bytes) const -> Expected<ImageBounds> override;

    // Payload of the first APP1 segment carrying an "Exif\0\0" header.
    auto readMetadata(Bytes const& bytes) const -> Expected<ImageMetadata> override;
};

} // namespace CS
