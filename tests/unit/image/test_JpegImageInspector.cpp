#include <capturesession/image/JpegImageInspector.hpp>
#include <doctest/doctest.h>

#include "CaptureSessionTestHelper.hpp"

using namespace CS;
using CS::Test::makeJpeg;

TEST_SUITE("image.jpeg") {
TEST_CASE("decodeBounds") {
    JpegImageInspector inspector;

    SUBCASE("Baseline frame") {
        auto bounds = inspector.decodeBounds(makeJpeg(800, 600));
        REQUIRE(bounds.has_value());
        CHECK(bounds->width == 800);
        CHECK(bounds->height == 600);
    }

    SUBCASE("Frame after an Exif segment") {
        auto bounds = inspector.decodeBounds(makeJpeg(4032, 3024, true));
        REQUIRE(bounds.has_value());
        CHECK(bounds->width == 4032);
        CHECK(bounds->height == 3024);
    }

    SUBCASE("Progressive frame and fill bytes") {
        auto bytes = makeJpeg(10, 20);
        bytes[3]   = 0xC2;
        bytes.insert(bytes.begin() + 2, 0xFF);
        auto bounds = inspector.decodeBounds(bytes);
        REQUIRE(bounds.has_value());
        CHECK(bounds->width == 10);
        CHECK(bounds->height == 20);
    }

    SUBCASE("Huffman tables are not frames") {
        Bytes bytes{0xFF, 0xD8, 0xFF, 0xC4, 0x00, 0x08, 0x00, 0x10, 0x00, 0x20, 0x03, 0x00};
        auto  rest = makeJpeg(7, 9);
        bytes.insert(bytes.end(), rest.begin() + 2, rest.end());
        auto bounds = inspector.decodeBounds(bytes);
        REQUIRE(bounds.has_value());
        CHECK(bounds->width == 7);
        CHECK(bounds->height == 9);
    }

    SUBCASE("Malformed input") {
        CHECK(inspector.decodeBounds(Bytes{}).error().code == Error::Code::MalformedInput);
        CHECK(inspector.decodeBounds(Bytes{0x89, 'P', 'N', 'G'}).error().code == Error::Code::MalformedInput);
        // SOI followed directly by scan data
        CHECK(inspector.decodeBounds(Bytes{0xFF, 0xD8, 0xFF, 0xDA, 0x00, 0x02}).error().code == Error::Code::MalformedInput);
        // Truncated frame header
        CHECK(inspector.decodeBounds(Bytes{0xFF, 0xD8, 0xFF, 0xC0, 0x00, 0x11, 0x08}).error().code
              == Error::Code::MalformedInput);
        CHECK(inspector.decodeBounds(makeJpeg(0, 10)).error().code == Error::Code::MalformedInput);
    }
}

TEST_CASE("readMetadata") {
    JpegImageInspector inspector;

    SUBCASE("Exif payload is returned whole") {
        auto metadata = inspector.readMetadata(makeJpeg(2, 2, true));
        REQUIRE(metadata.has_value());
        CHECK(metadata->exif == Bytes{'E', 'x', 'i', 'f', 0x00, 0x00, 'M', 'M', 0x00, 0x2A});
        CHECK(metadata->orientation == 0);
    }

    SUBCASE("No Exif segment") {
        auto metadata = inspector.readMetadata(makeJpeg(2, 2));
        REQUIRE_FALSE(metadata.has_value());
        CHECK(metadata.error().code == Error::Code::NotFound);
    }

    SUBCASE("APP1 without the Exif header is ignored") {
        Bytes bytes{0xFF, 0xD8, 0xFF, 0xE1, 0x00, 0x06, 'h', 't', 't', 'p'};
        auto  rest = makeJpeg(2, 2);
        bytes.insert(bytes.end(), rest.begin() + 2, rest.end());
        CHECK(inspector.readMetadata(bytes).error().code == Error::Code::NotFound);
    }
}
}
