#ifndef IDCROP_ARCHIVE_H
#define IDCROP_ARCHIVE_H

#include "image_codec.h"
#include <cstdint>
#include <string>
#include <vector>

namespace idcrop {

// In-memory ZIP writer (deflate, zlib CRC-32).
// Entries carry a fixed DOS timestamp so identical input gives identical bytes.
class ZipWriter {
public:
    ZipWriter() = default;

    ZipWriter(const ZipWriter&) = delete;
    ZipWriter& operator=(const ZipWriter&) = delete;

    // Throws std::invalid_argument on an empty or duplicate name,
    // std::runtime_error if zlib fails
    void addEntry(const std::string& name, const uint8_t* data, size_t size);

    void addEntry(const std::string& name, const Bytes& data) {
        addEntry(name, data.data(), data.size());
    }

    size_t entryCount() const { return entries_.size(); }

    // Append central directory and end record, return the archive.
    // The writer is reset afterwards.
    Bytes finish();

private:
    struct Entry {
        std::string name;
        uint32_t crc = 0;
        uint32_t compressed_size = 0;
        uint32_t uncompressed_size = 0;
        uint32_t local_header_offset = 0;
        uint16_t method = 0;
    };

    Bytes buffer_;
    std::vector<Entry> entries_;
};

// Raw deflate (no zlib header), as stored in ZIP entries
Bytes deflateRaw(const uint8_t* data, size_t size, int level = 6);

// portrait_0.jpg, portrait_1.jpg, ... in the given order
Bytes buildPortraitArchive(const std::vector<Bytes>& jpegs);

// Entry name for crop index i
std::string portraitEntryName(size_t index);

} // namespace idcrop

#endif // IDCROP_ARCHIVE_H
