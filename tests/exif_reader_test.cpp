#include "test_base.hpp"
#include "core/exif_reader.hpp"

class ExifReaderTest : public TestBase
{
};

TEST_F(ExifReaderTest, ReadsCameraFieldsFromJpeg)
{
    auto jpeg = testdata::withExif(testdata::encode(testdata::cameraLikeImage(64, 64), ".jpg"), testdata::cameraTiff());
    auto metadata = ExifReader::read(jpeg);

    EXPECT_EQ(metadata.container, "jpeg");
    EXPECT_EQ(metadata.get("Make"), "Canon");
    EXPECT_EQ(metadata.get("Model"), "Canon EOS 5D Mark IV");
    EXPECT_EQ(metadata.get("DateTimeOriginal"), "2021:06:01 10:00:00");
    EXPECT_EQ(metadata.get("LensModel"), "EF24-70mm f/2.8L II USM");
    EXPECT_EQ(metadata.get("ISOSpeedRatings"), "200");
    EXPECT_DOUBLE_EQ(std::stod(metadata.get("FNumber")), 2.8);
    EXPECT_DOUBLE_EQ(std::stod(metadata.get("ExposureTime")), 0.008);
    EXPECT_TRUE(metadata.has("GPSLatitude"));
    EXPECT_TRUE(metadata.has("GPSLongitude"));
}

TEST_F(ExifReaderTest, PlainEncodedJpegHasNoCameraFields)
{
    auto metadata = ExifReader::read(testdata::encode(testdata::cameraLikeImage(64, 64), ".jpg"));
    EXPECT_EQ(metadata.container, "jpeg");
    EXPECT_FALSE(metadata.has("Make"));
    EXPECT_FALSE(metadata.has("DateTimeOriginal"));
}

TEST_F(ExifReaderTest, ReadsPngTextChunks)
{
    auto png = testdata::withPngText(testdata::encode(testdata::smoothImage(32, 32), ".png"),
                                     "parameters", "a castle at dusk, Steps: 30, Sampler: Euler a");
    auto metadata = ExifReader::read(png);
    EXPECT_EQ(metadata.container, "png");
    EXPECT_EQ(metadata.get("PNG:parameters"), "a castle at dusk, Steps: 30, Sampler: Euler a");
}

TEST_F(ExifReaderTest, ParsesXmpProperties)
{
    std::map<std::string, std::string> fields;
    ExifReader::parseXmp(
        "<x:xmpmeta xmlns:x=\"adobe:ns:meta/\"><rdf:RDF><rdf:Description "
        "xmp:CreatorTool=\"Adobe Firefly\" "
        "Iptc4xmpExt:DigitalSourceType=\"http://cv.iptc.org/newscodes/digitalsourcetype/trainedAlgorithmicMedia\"/>"
        "</rdf:RDF></x:xmpmeta>",
        fields);
    EXPECT_EQ(fields["XMP:CreatorTool"], "Adobe Firefly");
    EXPECT_NE(fields["XMP:DigitalSourceType"].find("trainedAlgorithmicMedia"), std::string::npos);
}

TEST_F(ExifReaderTest, RejectsUnknownContainers)
{
    std::vector<uint8_t> bytes(64, 0x42);
    EXPECT_THROW(ExifReader::read(bytes), MetadataExtractionError);
    EXPECT_THROW(ExifReader::read(std::vector<uint8_t>{0xFF, 0xD8}), MetadataExtractionError);
}

TEST_F(ExifReaderTest, RejectsTruncatedExifSegment)
{
    auto jpeg = testdata::withExif(testdata::encode(testdata::cameraLikeImage(64, 64), ".jpg"), testdata::cameraTiff());
    jpeg.resize(20);
    EXPECT_THROW(ExifReader::read(jpeg), MetadataExtractionError);
}

TEST_F(ExifReaderTest, RejectsOutOfRangeTiffOffsets)
{
    auto tiff = testdata::buildTiff({testdata::asciiEntry(0x010F, "A long manufacturer name")});
    // Point the Make value far past the end of the block
    tiff[8 + 2 + 8] = 0xFF;
    tiff[8 + 2 + 9] = 0xFF;
    std::map<std::string, std::string> fields;
    EXPECT_THROW(ExifReader::parseTiff(tiff.data(), tiff.size(), fields), MetadataExtractionError);
}

TEST_F(ExifReaderTest, LongXmpValueIsCapped)
{
    const std::string value(60000, 'A');
    auto jpeg = testdata::withXmp(testdata::encode(testdata::cameraLikeImage(64, 64), ".jpg"),
                                  "<x:xmpmeta><rdf:RDF><rdf:Description xmp:CreatorTool=\"" + value +
                                      "\"/></rdf:RDF></x:xmpmeta>");
    auto metadata = ExifReader::read(jpeg);
    EXPECT_EQ(metadata.get("XMP:CreatorTool"), std::string(ExifReader::kMaxFieldLength, 'A'));

    // Packets in PNG iTXt and WebP chunks have no segment limit
    std::map<std::string, std::string> fields;
    ExifReader::parseXmp("<xmp:CreateDate>" + std::string(500000, '7') + "</xmp:CreateDate>", fields);
    EXPECT_EQ(fields["XMP:CreateDate"].size(), ExifReader::kMaxFieldLength);
}

TEST_F(ExifReaderTest, XmpElementAndAttributeForms)
{
    std::map<std::string, std::string> fields;
    ExifReader::parseXmp("<tiff:Make>NIKON CORPORATION</tiff:Make><rdf:Description tiff:Model=\"NIKON D850\" "
                         "xmp:CreatorTool=\"\" xmp:CreatorToolkit=\"x\"/>",
                         fields);
    EXPECT_EQ(fields["XMP:Make"], "NIKON CORPORATION");
    EXPECT_EQ(fields["XMP:Model"], "NIKON D850");
    EXPECT_EQ(fields.count("XMP:CreatorTool"), 0u);
}

TEST_F(ExifReaderTest, Latin1TextIsReencodedAsUtf8)
{
    auto png = testdata::withPngText(testdata::encode(testdata::smoothImage(32, 32), ".png"),
                                     "Copyright", "\xA9 2024 Jos\xE9");
    auto metadata = ExifReader::read(png);
    EXPECT_EQ(metadata.get("PNG:Copyright"), "\xC2\xA9 2024 Jos\xC3\xA9");
    EXPECT_NO_THROW(nlohmann::json(metadata.fields).dump());
}

TEST_F(ExifReaderTest, Utf8ConversionKeepsValidTextAndCutsOnCharacterBoundary)
{
    EXPECT_EQ(ExifReader::toUtf8("Fujifilm X-T4 \xE6\x97\xA5\xE6\x9C\xAC", 100), "Fujifilm X-T4 \xE6\x97\xA5\xE6\x9C\xAC");
    EXPECT_EQ(ExifReader::toUtf8("\xC3\xA9\xC3\xA9\xC3\xA9", 5), "\xC3\xA9\xC3\xA9");
    // A lone continuation byte and a truncated sequence are read as Latin-1
    EXPECT_EQ(ExifReader::toUtf8("a\x80" "b\xE6\x97", 100), "a\xC2\x80" "b\xC3\xA6\xC2\x97");
    // Encoded surrogate halves are not UTF-8
    EXPECT_EQ(ExifReader::toUtf8("\xED\xA0\x80", 100), "\xC3\xAD\xC2\xA0\xC2\x80");
}

TEST_F(ExifReaderTest, RejectsITxtWhoseKeywordFillsTheChunk)
{
    const auto png = testdata::encode(testdata::smoothImage(32, 32), ".png");
    const std::string keyword = "XML:com.adobe.xmp";

    std::vector<uint8_t> only_keyword(keyword.begin(), keyword.end());
    only_keyword.push_back(0);
    EXPECT_THROW(ExifReader::read(testdata::withPngChunk(png, "iTXt", only_keyword)), MetadataExtractionError);

    auto with_flag = only_keyword;
    with_flag.push_back(0);
    EXPECT_THROW(ExifReader::read(testdata::withPngChunk(png, "iTXt", with_flag)), MetadataExtractionError);

    auto unterminated_language = only_keyword;
    unterminated_language.insert(unterminated_language.end(), {0, 0, 'e', 'n'});
    EXPECT_THROW(ExifReader::read(testdata::withPngChunk(png, "iTXt", unterminated_language)), MetadataExtractionError);
}

TEST_F(ExifReaderTest, ReadsWellFormedITxt)
{
    const std::string keyword = "Description";
    std::vector<uint8_t> payload(keyword.begin(), keyword.end());
    payload.insert(payload.end(), {0, 0, 0, 'e', 'n', 0, 0});
    const std::string text = "Sunset over the harbour";
    payload.insert(payload.end(), text.begin(), text.end());

    auto metadata = ExifReader::read(testdata::withPngChunk(testdata::encode(testdata::smoothImage(32, 32), ".png"),
                                                            "iTXt", payload));
    EXPECT_EQ(metadata.get("PNG:Description"), text);
}
