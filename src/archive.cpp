#include "archive.h"
#include "logger.h"
#include <zlib.h>
#include <cstring>
#include <limits>
#include <stdexcept>

namespace idcrop {

namespace {

// ZIP record signatures
const uint32_t kLocalHeaderSig = 0x04034b50;
const uint32_t kCentralHeaderSig = 0x02014b50;
const uint32_t kEndOfCentralDirSig = 0x06054b50;

const uint16_t kVersionNeeded = 20;   // 2.0: deflate
const uint16_t kMethodDeflate = 8;

// 1980-01-01 00:00:00 in DOS format
const uint16_t kDosTime = 0;
const uint16_t kDosDate = (0 << 9) | (1 << 5) | 1;

void put16(Bytes& out, uint16_t v) {
    out.push_back(static_cast<uint8_t>(v & 0xff));
    out.push_back(static_cast<uint8_t>((v >> 8) & 0xff));
}

void put32(Bytes& out, uint32_t v) {
    out.push_back(static_cast<uint8_t>(v & 0xff));
    out.push_back(static_cast<uint8_t>((v >> 8) & 0xff));
    out.push_back(static_cast<uint8_t>((v >> 16) & 0xff));
    out.push_back(static_cast<uint8_t>((v >> 24) & 0xff));
}

void putBytes(Bytes& out, const uint8_t* data, size_t size) {
    out.insert(out.end(), data, data + size);
}

uint32_t checked32(size_t value, const char* what) {
    if (value > std::numeric_limits<uint32_t>::max()) {
        throw std::runtime_error(std::string("ZIP64 not supported: ") + what + " too large");
    }
    return static_cast<uint32_t>(value);
}

} // namespace

Bytes deflateRaw(const uint8_t* data, size_t size, int level) {
    z_stream strm;
    memset(&strm, 0, sizeof(z_stream));
    // Negative window bits: raw deflate stream without zlib header/trailer
    int r = deflateInit2(&strm, level, Z_DEFLATED, -MAX_WBITS, 8, Z_DEFAULT_STRATEGY);
    if (r != Z_OK) {
        Logger::getInstance().error("zlib deflate init error " + std::to_string(r));
        throw std::runtime_error("zlib deflate init failed");
    }

    Bytes out(deflateBound(&strm, static_cast<uLong>(size)));
    strm.next_in = const_cast<Bytef*>(data);
    strm.avail_in = static_cast<uInt>(size);
    strm.next_out = out.data();
    strm.avail_out = static_cast<uInt>(out.size());

    r = deflate(&strm, Z_FINISH);
    const uLong total_out = strm.total_out;
    deflateEnd(&strm);

    if (r != Z_STREAM_END) {
        Logger::getInstance().warning("zlib deflate error " + std::to_string(r));
        throw std::runtime_error("zlib deflate failed");
    }

    out.resize(total_out);
    return out;
}

void ZipWriter::addEntry(const std::string& name, const uint8_t* data, size_t size) {
    if (name.empty()) {
        throw std::invalid_argument("ZIP entry name must not be empty");
    }
    for (const Entry& e : entries_) {
        if (e.name == name) {
            throw std::invalid_argument("Duplicate ZIP entry: " + name);
        }
    }

    Entry entry;
    entry.name = name;
    entry.local_header_offset = checked32(buffer_.size(), "archive");
    entry.uncompressed_size = checked32(size, name.c_str());
    entry.crc = static_cast<uint32_t>(crc32(crc32(0L, Z_NULL, 0), data, static_cast<uInt>(size)));

    Bytes compressed = deflateRaw(data, size);
    entry.method = kMethodDeflate;
    entry.compressed_size = checked32(compressed.size(), name.c_str());

    put32(buffer_, kLocalHeaderSig);
    put16(buffer_, kVersionNeeded);
    put16(buffer_, 0);                  // flags
    put16(buffer_, entry.method);
    put16(buffer_, kDosTime);
    put16(buffer_, kDosDate);
    put32(buffer_, entry.crc);
    put32(buffer_, entry.compressed_size);
    put32(buffer_, entry.uncompressed_size);
    put16(buffer_, static_cast<uint16_t>(name.size()));
    put16(buffer_, 0);                  // extra field length
    putBytes(buffer_, reinterpret_cast<const uint8_t*>(name.data()), name.size());
    putBytes(buffer_, compressed.data(), compressed.size());

    entries_.push_back(entry);
}

Bytes ZipWriter::finish() {
    const uint32_t cd_offset = checked32(buffer_.size(), "archive");

    for (const Entry& e : entries_) {
        put32(buffer_, kCentralHeaderSig);
        put16(buffer_, kVersionNeeded);     // version made by
        put16(buffer_, kVersionNeeded);     // version needed
        put16(buffer_, 0);                  // flags
        put16(buffer_, e.method);
        put16(buffer_, kDosTime);
        put16(buffer_, kDosDate);
        put32(buffer_, e.crc);
        put32(buffer_, e.compressed_size);
        put32(buffer_, e.uncompressed_size);
        put16(buffer_, static_cast<uint16_t>(e.name.size()));
        put16(buffer_, 0);                  // extra
        put16(buffer_, 0);                  // comment
        put16(buffer_, 0);                  // disk number
        put16(buffer_, 0);                  // internal attributes
        put32(buffer_, 0);                  // external attributes
        put32(buffer_, e.local_header_offset);
        putBytes(buffer_, reinterpret_cast<const uint8_t*>(e.name.data()), e.name.size());
    }

    const uint32_t cd_size = checked32(buffer_.size() - cd_offset, "central directory");
    const uint16_t count = static_cast<uint16_t>(entries_.size());

    put32(buffer_, kEndOfCentralDirSig);
    put16(buffer_, 0);                      // this disk
    put16(buffer_, 0);                      // disk with central directory
    put16(buffer_, count);
    put16(buffer_, count);
    put32(buffer_, cd_size);
    put32(buffer_, cd_offset);
    put16(buffer_, 0);                      // comment length

    Bytes archive;
    archive.swap(buffer_);
    entries_.clear();
    return archive;
}

std::string portraitEntryName(size_t index) {
    return "portrait_" + std::to_string(index) + ".jpg";
}

Bytes buildPortraitArchive(const std::vector<Bytes>& jpegs) {
    ZipWriter zip;
    for (size_t i = 0; i < jpegs.size(); i++) {
        zip.addEntry(portraitEntryName(i), jpegs[i]);
    }
    return zip.finish();
}

} // namespace idcrop
