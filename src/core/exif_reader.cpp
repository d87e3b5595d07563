#include "core/exif_reader.hpp"
#include "core/detection_errors.hpp"
#include <algorithm>
#include <cstring>
#include <set>
#include <sstream>
#include <unordered_map>

namespace
{
    constexpr uint8_t kPngSignature[8] = {0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A};
    constexpr char kExifHeader[6] = {'E', 'x', 'i', 'f', '\0', '\0'};
    constexpr char kXmpNamespace[] = "http://ns.adobe.com/xap/1.0/";
    constexpr uint32_t kMaxIfdEntries = 1024;

    constexpr uint16_t kExifIfdPointer = 0x8769;
    constexpr uint16_t kGpsIfdPointer = 0x8825;

    enum class IfdKind
    {
        PRIMARY,
        EXIF,
        GPS
    };

    const std::unordered_map<uint16_t, std::string> &primaryTags()
    {
        static const std::unordered_map<uint16_t, std::string> tags = {
            {0x010E, "ImageDescription"},
            {0x010F, "Make"},
            {0x0110, "Model"},
            {0x0131, "Software"},
            {0x0132, "DateTime"},
            {0x013B, "Artist"},
        };
        return tags;
    }

    const std::unordered_map<uint16_t, std::string> &exifTags()
    {
        static const std::unordered_map<uint16_t, std::string> tags = {
            {0x829A, "ExposureTime"},
            {0x829D, "FNumber"},
            {0x8827, "ISOSpeedRatings"},
            {0x9003, "DateTimeOriginal"},
            {0x9004, "DateTimeDigitized"},
            {0x920A, "FocalLength"},
            {0xA432, "LensInfo"},
            {0xA433, "LensMake"},
            {0xA434, "LensModel"},
        };
        return tags;
    }

    const std::unordered_map<uint16_t, std::string> &gpsTags()
    {
        static const std::unordered_map<uint16_t, std::string> tags = {
            {0x0001, "GPSLatitudeRef"},
            {0x0002, "GPSLatitude"},
            {0x0003, "GPSLongitudeRef"},
            {0x0004, "GPSLongitude"},
        };
        return tags;
    }

    // Bounds-checked reader over a TIFF block with the block's byte order
    class TiffCursor
    {
    public:
        TiffCursor(const uint8_t *data, size_t size) : data_(data), size_(size)
        {
            if (size < 8)
                throw MetadataExtractionError("TIFF header truncated");
            if (data[0] == 'I' && data[1] == 'I')
                little_endian_ = true;
            else if (data[0] == 'M' && data[1] == 'M')
                little_endian_ = false;
            else
                throw MetadataExtractionError("Invalid TIFF byte order marker");
            if (u16(2) != 42)
                throw MetadataExtractionError("Invalid TIFF magic number");
        }

        uint16_t u16(size_t offset) const
        {
            require(offset, 2);
            return little_endian_
                       ? static_cast<uint16_t>(data_[offset] | (data_[offset + 1] << 8))
                       : static_cast<uint16_t>((data_[offset] << 8) | data_[offset + 1]);
        }

        uint32_t u32(size_t offset) const
        {
            require(offset, 4);
            if (little_endian_)
            {
                return static_cast<uint32_t>(data_[offset]) |
                       (static_cast<uint32_t>(data_[offset + 1]) << 8) |
                       (static_cast<uint32_t>(data_[offset + 2]) << 16) |
                       (static_cast<uint32_t>(data_[offset + 3]) << 24);
            }
            return (static_cast<uint32_t>(data_[offset]) << 24) |
                   (static_cast<uint32_t>(data_[offset + 1]) << 16) |
                   (static_cast<uint32_t>(data_[offset + 2]) << 8) |
                   static_cast<uint32_t>(data_[offset + 3]);
        }

        const uint8_t *at(size_t offset, size_t length) const
        {
            require(offset, length);
            return data_ + offset;
        }

        void require(size_t offset, size_t length) const
        {
            if (offset > size_ || length > size_ - offset)
                throw MetadataExtractionError("TIFF offset out of range");
        }

    private:
        const uint8_t *data_;
        size_t size_;
        bool little_endian_ = true;
    };

    size_t typeSize(uint16_t type)
    {
        switch (type)
        {
        case 1: // BYTE
        case 2: // ASCII
        case 6: // SBYTE
        case 7: // UNDEFINED
            return 1;
        case 3: // SHORT
        case 8: // SSHORT
            return 2;
        case 4: // LONG
        case 9: // SLONG
            return 4;
        case 5:  // RATIONAL
        case 10: // SRATIONAL
            return 8;
        default:
            return 0;
        }
    }

    std::string trimAscii(const uint8_t *value, size_t length)
    {
        std::string text(reinterpret_cast<const char *>(value), length);
        auto end = text.find('\0');
        if (end != std::string::npos)
            text.resize(end);
        while (!text.empty() && (text.back() == ' ' || text.back() == '\n' || text.back() == '\r'))
            text.pop_back();
        return text;
    }

    std::string formatValue(const TiffCursor &tiff, uint16_t type, uint32_t count, size_t value_offset)
    {
        const size_t unit = typeSize(type);
        if (type == 2)
        {
            return trimAscii(tiff.at(value_offset, count), count);
        }

        std::ostringstream out;
        const uint32_t shown = std::min<uint32_t>(count, 16);
        for (uint32_t i = 0; i < shown; ++i)
        {
            if (i > 0)
                out << ", ";
            const size_t offset = value_offset + static_cast<size_t>(i) * unit;
            switch (type)
            {
            case 1:
            case 7:
                out << static_cast<unsigned>(*tiff.at(offset, 1));
                break;
            case 6:
                out << static_cast<int>(static_cast<int8_t>(*tiff.at(offset, 1)));
                break;
            case 3:
                out << tiff.u16(offset);
                break;
            case 8:
                out << static_cast<int16_t>(tiff.u16(offset));
                break;
            case 4:
                out << tiff.u32(offset);
                break;
            case 9:
                out << static_cast<int32_t>(tiff.u32(offset));
                break;
            case 5:
            {
                const uint32_t num = tiff.u32(offset);
                const uint32_t den = tiff.u32(offset + 4);
                out << (den == 0 ? 0.0 : static_cast<double>(num) / den);
                break;
            }
            case 10:
            {
                const auto num = static_cast<int32_t>(tiff.u32(offset));
                const auto den = static_cast<int32_t>(tiff.u32(offset + 4));
                out << (den == 0 ? 0.0 : static_cast<double>(num) / den);
                break;
            }
            default:
                break;
            }
        }
        return out.str();
    }

    void parseIfd(const TiffCursor &tiff, uint32_t ifd_offset, IfdKind kind,
                  std::set<uint32_t> &visited, std::map<std::string, std::string> &fields)
    {
        if (!visited.insert(ifd_offset).second)
        {
            throw MetadataExtractionError("TIFF IFD chain contains a loop");
        }

        const uint16_t entry_count = tiff.u16(ifd_offset);
        if (entry_count > kMaxIfdEntries)
        {
            throw MetadataExtractionError("TIFF IFD entry count implausible: " + std::to_string(entry_count));
        }

        const auto &names = kind == IfdKind::PRIMARY ? primaryTags()
                            : kind == IfdKind::EXIF  ? exifTags()
                                                     : gpsTags();

        for (uint16_t i = 0; i < entry_count; ++i)
        {
            const size_t entry = ifd_offset + 2 + static_cast<size_t>(i) * 12;
            const uint16_t tag = tiff.u16(entry);
            const uint16_t type = tiff.u16(entry + 2);
            const uint32_t count = tiff.u32(entry + 4);

            if (kind == IfdKind::PRIMARY && (tag == kExifIfdPointer || tag == kGpsIfdPointer))
            {
                const uint32_t sub_offset = tiff.u32(entry + 8);
                parseIfd(tiff, sub_offset, tag == kExifIfdPointer ? IfdKind::EXIF : IfdKind::GPS, visited, fields);
                continue;
            }

            auto name = names.find(tag);
            const size_t unit = typeSize(type);
            if (name == names.end() || unit == 0 || count == 0)
                continue;

            const uint64_t total = static_cast<uint64_t>(unit) * count;
            const size_t value_offset = total <= 4 ? entry + 8 : tiff.u32(entry + 8);
            tiff.require(value_offset, static_cast<size_t>(total));

            std::string value = formatValue(tiff, type, count, value_offset);
            if (!value.empty())
            {
                fields[name->second] = value;
            }
        }
    }

    std::string readPngKeyword(const uint8_t *data, size_t length, size_t &consumed)
    {
        const void *terminator = std::memchr(data, 0, length);
        if (!terminator)
            throw MetadataExtractionError("PNG text chunk keyword not terminated");
        consumed = static_cast<size_t>(static_cast<const uint8_t *>(terminator) - data) + 1;
        return std::string(reinterpret_cast<const char *>(data), consumed - 1);
    }

    uint32_t be32(const uint8_t *p)
    {
        return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
               (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
    }

    uint32_t le32(const uint8_t *p)
    {
        return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
               (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
    }

    void parseExifPayload(const uint8_t *data, size_t size, std::map<std::string, std::string> &fields)
    {
        // Some writers keep the JPEG-style "Exif\0\0" prefix inside PNG/WebP chunks
        if (size >= sizeof(kExifHeader) && std::memcmp(data, kExifHeader, sizeof(kExifHeader)) == 0)
        {
            data += sizeof(kExifHeader);
            size -= sizeof(kExifHeader);
        }
        ExifReader::parseTiff(data, size, fields);
    }
}

EmbeddedMetadata ExifReader::read(const std::vector<uint8_t> &bytes)
{
    EmbeddedMetadata metadata = readContainer(bytes);
    for (auto &[key, value] : metadata.fields)
    {
        value = toUtf8(value, kMaxFieldLength);
    }
    return metadata;
}

EmbeddedMetadata ExifReader::readContainer(const std::vector<uint8_t> &bytes)
{
    if (bytes.size() < 12)
    {
        throw MetadataExtractionError("File too small to contain an image container");
    }

    if (bytes[0] == 0xFF && bytes[1] == 0xD8)
    {
        return readJpeg(bytes);
    }
    if (std::memcmp(bytes.data(), kPngSignature, sizeof(kPngSignature)) == 0)
    {
        return readPng(bytes);
    }
    if (std::memcmp(bytes.data(), "RIFF", 4) == 0 && std::memcmp(bytes.data() + 8, "WEBP", 4) == 0)
    {
        return readWebp(bytes);
    }
    if ((bytes[0] == 'I' && bytes[1] == 'I' && bytes[2] == 42 && bytes[3] == 0) ||
        (bytes[0] == 'M' && bytes[1] == 'M' && bytes[2] == 0 && bytes[3] == 42))
    {
        EmbeddedMetadata metadata;
        metadata.container = "tiff";
        parseTiff(bytes.data(), bytes.size(), metadata.fields);
        return metadata;
    }

    throw MetadataExtractionError("Unsupported container for metadata extraction");
}

void ExifReader::parseTiff(const uint8_t *data, size_t size, std::map<std::string, std::string> &fields)
{
    TiffCursor tiff(data, size);
    std::set<uint32_t> visited;
    parseIfd(tiff, tiff.u32(4), IfdKind::PRIMARY, visited, fields);
}

void ExifReader::parseXmp(const std::string &xmp, std::map<std::string, std::string> &fields)
{
    static const std::vector<std::pair<std::string, std::string>> properties = {
        {"XMP:CreatorTool", "xmp:CreatorTool"},
        {"XMP:DigitalSourceType", "Iptc4xmpExt:DigitalSourceType"},
        {"XMP:CreateDate", "xmp:CreateDate"},
        {"XMP:Make", "tiff:Make"},
        {"XMP:Model", "tiff:Model"},
    };

    for (const auto &[key, property] : properties)
    {
        // Attribute form (prop="value") or element form (<prop>value</prop>)
        size_t pos = xmp.find(property);
        while (pos != std::string::npos)
        {
            size_t value_start = pos + property.size();
            if (xmp.compare(value_start, 2, "=\"") == 0)
                value_start += 2;
            else if (xmp.compare(value_start, 1, ">") == 0)
                value_start += 1;
            else
            {
                pos = xmp.find(property, value_start);
                continue;
            }

            const size_t value_end = std::min(xmp.find_first_of("\"<", value_start), xmp.size());
            if (value_end > value_start)
            {
                fields[key] = xmp.substr(value_start, std::min(value_end - value_start, kMaxFieldLength));
                break;
            }
            pos = xmp.find(property, value_start);
        }
    }
}

std::string ExifReader::toUtf8(const std::string &raw, size_t max_length)
{
    std::string text;
    text.reserve(std::min(raw.size(), max_length));
    size_t i = 0;
    while (i < raw.size())
    {
        const auto lead = static_cast<uint8_t>(raw[i]);
        size_t width = 0;
        if (lead < 0x80)
            width = 1;
        else if (lead >= 0xC2 && lead <= 0xDF)
            width = 2;
        else if (lead >= 0xE0 && lead <= 0xEF)
            width = 3;
        else if (lead >= 0xF0 && lead <= 0xF4)
            width = 4;

        bool valid = width > 0 && i + width <= raw.size();
        for (size_t k = 1; valid && k < width; ++k)
        {
            valid = (static_cast<uint8_t>(raw[i + k]) & 0xC0) == 0x80;
        }
        if (valid && width >= 3)
        {
            const auto second = static_cast<uint8_t>(raw[i + 1]);
            // overlong forms, UTF-16 surrogates and code points above U+10FFFF
            if ((lead == 0xE0 && second < 0xA0) || (lead == 0xED && second > 0x9F) ||
                (lead == 0xF0 && second < 0x90) || (lead == 0xF4 && second > 0x8F))
                valid = false;
        }

        if (valid)
        {
            if (text.size() + width > max_length)
                break;
            text.append(raw, i, width);
            i += width;
        }
        else
        {
            // Not UTF-8: read the byte as Latin-1, which is what PNG tEXt mandates
            if (text.size() + 2 > max_length)
                break;
            text.push_back(static_cast<char>(0xC0 | (lead >> 6)));
            text.push_back(static_cast<char>(0x80 | (lead & 0x3F)));
            ++i;
        }
    }
    return text;
}

EmbeddedMetadata ExifReader::readJpeg(const std::vector<uint8_t> &bytes)
{
    EmbeddedMetadata metadata;
    metadata.container = "jpeg";

    size_t pos = 2;
    while (pos + 4 <= bytes.size())
    {
        if (bytes[pos] != 0xFF)
        {
            throw MetadataExtractionError("JPEG marker expected at offset " + std::to_string(pos));
        }
        const uint8_t marker = bytes[pos + 1];
        if (marker == 0xFF)
        {
            ++pos; // fill byte
            continue;
        }
        if (marker == 0xD9 || marker == 0xDA)
        {
            break; // image data follows; metadata segments precede it
        }
        if ((marker >= 0xD0 && marker <= 0xD7) || marker == 0x01)
        {
            pos += 2;
            continue;
        }

        const size_t length = (static_cast<size_t>(bytes[pos + 2]) << 8) | bytes[pos + 3];
        if (length < 2 || pos + 2 + length > bytes.size())
        {
            throw MetadataExtractionError("JPEG segment truncated at offset " + std::to_string(pos));
        }
        const uint8_t *payload = bytes.data() + pos + 4;
        const size_t payload_size = length - 2;

        if (marker == 0xE1)
        {
            if (payload_size >= sizeof(kExifHeader) &&
                std::memcmp(payload, kExifHeader, sizeof(kExifHeader)) == 0)
            {
                parseTiff(payload + sizeof(kExifHeader), payload_size - sizeof(kExifHeader), metadata.fields);
            }
            else if (payload_size > sizeof(kXmpNamespace) &&
                     std::memcmp(payload, kXmpNamespace, sizeof(kXmpNamespace)) == 0)
            {
                std::string xmp(reinterpret_cast<const char *>(payload) + sizeof(kXmpNamespace),
                                payload_size - sizeof(kXmpNamespace));
                parseXmp(xmp, metadata.fields);
            }
        }
        else if (marker == 0xFE)
        {
            auto comment = trimAscii(payload, payload_size);
            if (!comment.empty())
                metadata.fields["Comment"] = comment;
        }

        pos += 2 + length;
    }
    return metadata;
}

EmbeddedMetadata ExifReader::readPng(const std::vector<uint8_t> &bytes)
{
    EmbeddedMetadata metadata;
    metadata.container = "png";

    size_t pos = sizeof(kPngSignature);
    while (pos + 8 <= bytes.size())
    {
        const uint32_t length = be32(bytes.data() + pos);
        const std::string type(reinterpret_cast<const char *>(bytes.data() + pos + 4), 4);
        if (static_cast<uint64_t>(pos) + 12 + length > bytes.size())
        {
            throw MetadataExtractionError("PNG chunk " + type + " truncated");
        }
        const uint8_t *data = bytes.data() + pos + 8;

        if (type == "eXIf")
        {
            parseExifPayload(data, length, metadata.fields);
        }
        else if (type == "tEXt")
        {
            size_t consumed = 0;
            auto key = readPngKeyword(data, length, consumed);
            metadata.fields["PNG:" + key] = std::string(reinterpret_cast<const char *>(data) + consumed, length - consumed);
        }
        else if (type == "iTXt")
        {
            size_t consumed = 0;
            auto key = readPngKeyword(data, length, consumed);
            // compression flag, compression method, language tag, translated keyword
            size_t cursor = consumed + 2;
            if (cursor > length)
                throw MetadataExtractionError("PNG iTXt chunk malformed");
            for (int skip = 0; skip < 2; ++skip)
            {
                const void *end = std::memchr(data + cursor, 0, length - cursor);
                if (!end)
                    throw MetadataExtractionError("PNG iTXt chunk malformed");
                cursor = static_cast<size_t>(static_cast<const uint8_t *>(end) - data) + 1;
            }
            const bool compressed = consumed < length && data[consumed] != 0;
            std::string text = compressed ? std::string("(compressed)")
                                          : std::string(reinterpret_cast<const char *>(data) + cursor, length - cursor);
            if (key == "XML:com.adobe.xmp")
                parseXmp(text, metadata.fields);
            else
                metadata.fields["PNG:" + key] = text;
        }
        else if (type == "zTXt")
        {
            size_t consumed = 0;
            auto key = readPngKeyword(data, length, consumed);
            metadata.fields["PNG:" + key] = "(compressed)";
        }
        else if (type == "IEND")
        {
            break;
        }

        pos += 12 + length;
    }
    return metadata;
}

EmbeddedMetadata ExifReader::readWebp(const std::vector<uint8_t> &bytes)
{
    EmbeddedMetadata metadata;
    metadata.container = "webp";

    size_t pos = 12;
    while (pos + 8 <= bytes.size())
    {
        const std::string fourcc(reinterpret_cast<const char *>(bytes.data() + pos), 4);
        const uint32_t length = le32(bytes.data() + pos + 4);
        if (static_cast<uint64_t>(pos) + 8 + length > bytes.size())
        {
            throw MetadataExtractionError("WebP chunk " + fourcc + " truncated");
        }
        const uint8_t *data = bytes.data() + pos + 8;

        if (fourcc == "EXIF")
        {
            parseExifPayload(data, length, metadata.fields);
        }
        else if (fourcc == "XMP ")
        {
            parseXmp(std::string(reinterpret_cast<const char *>(data), length), metadata.fields);
        }

        pos += 8 + length + (length & 1);
    }
    return metadata;
}
