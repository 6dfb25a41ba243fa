//
// Created by Giuseppe Francione on 10/12/25.
//

#include "test_helpers.hpp"
#include "exif_reader.hpp"
#include "metadata_cache.hpp"
#include "metadata_extractor.hpp"
#include <cstdint>

using namespace archivist;
using namespace archivist::test;

namespace {

void put_le16(Bytes& b, const std::size_t off, const std::uint16_t v) {
    b[off] = static_cast<unsigned char>(v & 0xFF);
    b[off + 1] = static_cast<unsigned char>(v >> 8);
}

void put_le32(Bytes& b, const std::size_t off, const std::uint32_t v) {
    for (int i = 0; i < 4; ++i) b[off + i] = static_cast<unsigned char>(v >> (8 * i) & 0xFF);
}

} // namespace

class MetadataExtractorTest : public TempDirTest {
protected:
    MetadataExtractor extractor_;
};

TEST_F(MetadataExtractorTest, PngDimensionsFromHeader) {
    const Bytes png = make_png(64, 48);
    const auto fast = MetadataExtractor::read_header_fast(png);
    ASSERT_TRUE(fast.has_value());
    EXPECT_EQ(fast->width, 64);
    EXPECT_EQ(fast->height, 48);

    const ImageMetadata m = extractor_.extract(png, "x.png");
    EXPECT_EQ(m.width, 64);
    EXPECT_EQ(m.height, 48);
    EXPECT_EQ(m.format, "PNG");
    EXPECT_FALSE(m.has_exif_data);
}

TEST_F(MetadataExtractorTest, JpegDimensionsFromSofMarker) {
    const ImageMetadata m = extractor_.extract(make_jpeg(80, 30), "photo.jpg");
    EXPECT_EQ(m.width, 80);
    EXPECT_EQ(m.height, 30);
    EXPECT_EQ(m.format, "JPEG");
    EXPECT_FALSE(m.date_taken.has_value());
}

TEST_F(MetadataExtractorTest, JpegExifCaptureDate) {
    const Bytes jpeg = make_jpeg(32, 32, make_exif_tiff("2023:05:17 10:20:30"));
    const ImageMetadata m = extractor_.extract(jpeg, "photo.jpg");
    EXPECT_EQ(m.width, 32);
    EXPECT_TRUE(m.has_exif_data);
    ASSERT_TRUE(m.date_taken.has_value());
    EXPECT_EQ(*m.date_taken, *parse_exif_timestamp("2023:05:17 10:20:30"));
}

TEST_F(MetadataExtractorTest, GifAndBmpHeaders) {
    Bytes gif = {'G', 'I', 'F', '8', '9', 'a', 0, 0, 0, 0};
    put_le16(gif, 6, 320);
    put_le16(gif, 8, 200);
    const ImageMetadata g = extractor_.extract(gif, "anim.gif");
    EXPECT_EQ(g.width, 320);
    EXPECT_EQ(g.height, 200);
    EXPECT_EQ(g.format, "GIF");

    Bytes bmp(54, 0);
    bmp[0] = 'B';
    bmp[1] = 'M';
    put_le32(bmp, 14, 40);
    put_le32(bmp, 18, 120);
    put_le32(bmp, 22, static_cast<std::uint32_t>(-90)); // top-down
    const ImageMetadata b = extractor_.extract(bmp, "scan.bmp");
    EXPECT_EQ(b.width, 120);
    EXPECT_EQ(b.height, 90);
    EXPECT_EQ(b.format, "BMP");
}

TEST_F(MetadataExtractorTest, RejectsOutOfRangeHeaderDimensions) {
    Bytes gif = {'G', 'I', 'F', '8', '9', 'a', 0, 0, 0, 0};
    put_le16(gif, 6, 0);
    put_le16(gif, 8, 10);
    EXPECT_FALSE(MetadataExtractor::read_header_fast(gif).has_value());
}

TEST_F(MetadataExtractorTest, CorruptJpegFallsBackToDefaults) {
    // SOI followed by garbage: no SOF marker for the fast path, nothing libjpeg accepts
    Bytes corrupt = {0xFF, 0xD8};
    for (int i = 0; i < 300; ++i) corrupt.push_back(static_cast<unsigned char>(i % 0xF0));

    const ImageMetadata m = extractor_.extract(corrupt, "broken.JPG");
    EXPECT_EQ(m.width, 0);
    EXPECT_EQ(m.height, 0);
    EXPECT_EQ(m.format, "jpg");
    EXPECT_FALSE(m.has_exif_data);
    EXPECT_FALSE(m.date_taken.has_value());
}

TEST_F(MetadataExtractorTest, EmptyAndTinyStreamsYieldDefaults) {
    EXPECT_EQ(extractor_.extract({}, "a.png").width, 0);
    const Bytes tiny = {1, 2, 3, 4, 5};
    const ImageMetadata m = extractor_.extract(tiny, "b.webp");
    EXPECT_EQ(m.width, 0);
    EXPECT_EQ(m.format, "webp");
}

TEST_F(MetadataExtractorTest, ExtractFileUsesCache) {
    MetadataCache cache(10);
    const MetadataExtractor cached(&cache);
    const auto path = dir_ / "img.png";
    write_file(path, make_png(40, 20));

    const ImageMetadata first = cached.extract_file(path);
    EXPECT_EQ(first.width, 40);
    EXPECT_EQ(cache.size(), 1u);

    const ImageMetadata second = cached.extract_file(path);
    EXPECT_EQ(second.width, 40);
    EXPECT_EQ(cache.size(), 1u);

    // a rewritten file gets a new key
    write_file(path, make_png(50, 25));
    set_mtime(path, std::filesystem::last_write_time(path) + std::chrono::hours(2));
    const ImageMetadata third = cached.extract_file(path);
    EXPECT_EQ(third.width, 50);
    EXPECT_EQ(cache.size(), 2u);
}

TEST_F(MetadataExtractorTest, MissingFileYieldsDefaults) {
    const ImageMetadata m = extractor_.extract_file(dir_ / "nope.gif");
    EXPECT_EQ(m.width, 0);
    EXPECT_EQ(m.format, "gif");
}

TEST(ExifReaderTest, ParsesTimestamps) {
    EXPECT_TRUE(parse_exif_timestamp("2020:01:02 03:04:05").has_value());
    EXPECT_FALSE(parse_exif_timestamp("0000:00:00 00:00:00").has_value());
    EXPECT_FALSE(parse_exif_timestamp("garbage").has_value());

    const Bytes tiff = make_exif_tiff("2021:12:31 23:59:58");
    const auto date = read_exif_date(tiff);
    ASSERT_TRUE(date.has_value());
    EXPECT_EQ(date->raw, "2021:12:31 23:59:58");
    EXPECT_TRUE(date->date_taken.has_value());
}
