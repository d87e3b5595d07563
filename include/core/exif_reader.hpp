#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

/**
 * @brief Named metadata fields found in an image container
 *
 * EXIF/TIFF tags use their EXIF names ("Make", "DateTimeOriginal", ...),
 * XMP values are prefixed with "XMP:" and PNG text chunks with "PNG:".
 * Rational values are rendered as decimals, multi-valued tags joined by ", ".
 * Values returned by ExifReader::read() are valid UTF-8 of at most
 * ExifReader::kMaxFieldLength bytes.
 */
struct EmbeddedMetadata
{
    std::string container; // "jpeg", "png", "tiff" or "webp"
    std::map<std::string, std::string> fields;

    bool empty() const { return fields.empty(); }
    bool has(const std::string &key) const { return fields.find(key) != fields.end(); }
    std::string get(const std::string &key) const
    {
        auto it = fields.find(key);
        return it != fields.end() ? it->second : std::string();
    }
};

/**
 * @brief Reads EXIF, XMP and PNG text metadata from JPEG, PNG, TIFF and WebP bytes
 */
class ExifReader
{
public:
    static constexpr size_t kMaxFieldLength = 4096;

    /**
     * @brief Extract embedded metadata
     * @param bytes Complete file content
     * @return Fields found; empty when the container carries none
     * @throws MetadataExtractionError on unsupported or corrupt containers
     */
    static EmbeddedMetadata read(const std::vector<uint8_t> &bytes);

    /**
     * @brief Parse a TIFF structure (as embedded in an EXIF block) into fields
     * @throws MetadataExtractionError when offsets point outside the block
     */
    static void parseTiff(const uint8_t *data, size_t size, std::map<std::string, std::string> &fields);

    /**
     * @brief Pick the interesting properties out of an XMP packet
     */
    static void parseXmp(const std::string &xmp, std::map<std::string, std::string> &fields);

    /**
     * @brief Re-encode metadata text as UTF-8, cut on a character boundary
     *
     * Valid UTF-8 sequences are kept; any other byte is taken as Latin-1.
     */
    static std::string toUtf8(const std::string &raw, size_t max_length);

private:
    static EmbeddedMetadata readContainer(const std::vector<uint8_t> &bytes);
    static EmbeddedMetadata readJpeg(const std::vector<uint8_t> &bytes);
    static EmbeddedMetadata readPng(const std::vector<uint8_t> &bytes);
    static EmbeddedMetadata readWebp(const std::vector<uint8_t> &bytes);
};
