#include <capturesession/image/JpegImageInspector.hpp>

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace CS {

namespace {

constexpr std::uint8_t kMarkerPrefix = 0xFF;
constexpr std::uint8_t kSOI          = 0xD8;
constexpr std::uint8_t kEOI          = 0xD9;
constexpr std::uint8_t kSOS          = 0xDA;
constexpr std::uint8_t kTEM          = 0x01;
constexpr std::uint8_t kAPP1         = 0xE1;

constexpr std::array<std::uint8_t, 6> kExifHeader{'E', 'x', 'i', 'f', 0x00, 0x00};

struct Segment {
    std::uint8_t marker;
    std::size_t  payloadOffset; // first byte after the length field
    std::size_t  payloadLength;
};

auto isStartOfFrame(std::uint8_t marker) -> bool {
    // C4 (DHT), C8 (JPG) and CC (DAC) share the range but are not frame headers.
    return marker >= 0xC0 && marker <= 0xCF && marker != 0xC4 && marker != 0xC8 && marker != 0xCC;
}

auto isStandalone(std::uint8_t marker) -> bool {
    return marker == kTEM || (marker >= 0xD0 && marker <= 0xD7);
}

auto readU16(Bytes const& bytes, std::size_t offset) -> std::uint16_t {
    return static_cast<std::uint16_t>((bytes[offset] << 8) | bytes[offset + 1]);
}

// Walks the marker segments between SOI and SOS. visit returns true to stop.
auto walkSegments(Bytes const& bytes, std::function<bool(Segment const&)> const& visit) -> Expected<bool> {
    if (bytes.size() < 4 || bytes[0] != kMarkerPrefix || bytes[1] != kSOI) {
        return std::unexpected(Error{Error::Code::MalformedInput, "not a JPEG stream"});
    }
    std::size_t pos = 2;
    while (pos < bytes.size()) {
        if (bytes[pos] != kMarkerPrefix) {
            return std::unexpected(Error{Error::Code::MalformedInput, "expected marker at offset " + std::to_string(pos)});
        }
        while (pos < bytes.size() && bytes[pos] == kMarkerPrefix) {
            ++pos;
        }
        if (pos >= bytes.size()) {
            break;
        }
        std::uint8_t const marker = bytes[pos++];
        if (marker == kSOS || marker == kEOI) {
            return false;
        }
        if (isStandalone(marker)) {
            continue;
        }
        if (pos + 2 > bytes.size()) {
            break;
        }
        std::uint16_t const length = readU16(bytes, pos);
        if (length < 2) {
            return std::unexpected(Error{Error::Code::MalformedInput, "segment length below 2"});
        }
        if (pos + length > bytes.size()) {
            break;
        }
        if (visit(Segment{marker, pos + 2, static_cast<std::size_t>(length - 2)})) {
            return true;
        }
        pos += length;
    }
    return std::unexpected(Error{Error::Code::MalformedInput, "truncated JPEG stream"});
}

} // namespace

auto JpegImageInspector::decodeBounds(Bytes const& bytes) const -> Expected<ImageBounds> {
    ImageBounds           bounds{};
    std::optional<Error>  frameError;
    auto found = walkSegments(bytes, [&](Segment const& segment) {
        if (!isStartOfFrame(segment.marker)) {
            return false;
        }
        // precision(1) height(2) width(2) components(1)
        if (segment.payloadLength < 6) {
            frameError = Error{Error::Code::MalformedInput, "frame header too short"};
            return true;
        }
        bounds.height = readU16(bytes, segment.payloadOffset + 1);
        bounds.width  = readU16(bytes, segment.payloadOffset + 3);
        return true;
    });
    if (!found) {
        return std::unexpected(found.error());
    }
    if (frameError) {
        return std::unexpected(*frameError);
    }
    if (!*found) {
        return std::unexpected(Error{Error::Code::MalformedInput, "no frame header before scan data"});
    }
    if (bounds.width == 0 || bounds.height == 0) {
        return std::unexpected(Error{Error::Code::MalformedInput, "frame header has zero dimension"});
    }
    return bounds;
}

auto JpegImageInspector::readMetadata(Bytes const& bytes) const -> Expected<ImageMetadata> {
    ImageMetadata metadata{};
    auto found = walkSegments(bytes, [&](Segment const& segment) {
        if (segment.marker != kAPP1 || segment.payloadLength < kExifHeader.size()) {
            return false;
        }
        auto const begin = bytes.begin() + static_cast<std::ptrdiff_t>(segment.payloadOffset);
        if (!std::equal(kExifHeader.begin(), kExifHeader.end(), begin)) {
            return false;
        }
        metadata.exif.assign(begin, begin + static_cast<std::ptrdiff_t>(segment.payloadLength));
        return true;
    });
    if (!found) {
        return std::unexpected(found.error());
    }
    if (!*found) {
        return std::unexpected(Error{Error::Code::NotFound, "no Exif segment"});
    }
    return metadata;
}

} // namespace CS
