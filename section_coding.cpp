#include "section_coding.hpp"
#include <zlib.h>
#include <algorithm>
#include <stdexcept>

namespace {

constexpr uint32_t XOR_KEY = 0xEDB88320;

uint32_t rol32(uint32_t value) {
    return (value << 1) | (value >> 31);
}

uint32_t read_be32(const Bytes& data) {
    return (static_cast<uint32_t>(data[0]) << 24) | (static_cast<uint32_t>(data[1]) << 16) |
           (static_cast<uint32_t>(data[2]) << 8) | static_cast<uint32_t>(data[3]);
}

} // namespace

const char* coding_name(SectionCoding coding) {
    switch (coding) {
        case SectionCoding::None: return "none";
        case SectionCoding::Zlib: return "zlib";
        case SectionCoding::Xor: return "xor";
    }
    return "none";
}

SectionCoding coding_from_name(const std::string& name) {
    if (name == "none") return SectionCoding::None;
    if (name == "zlib") return SectionCoding::Zlib;
    if (name == "xor") return SectionCoding::Xor;
    throw std::invalid_argument("Unknown section coding: " + name);
}

bool looks_like_zlib(const Bytes& stored) {
    if (stored.size() < 6) {
        return false;
    }
    uint8_t cmf = stored[4];
    uint8_t flg = stored[5];
    // Deflate method with a window of at most 32K, and a valid header checksum
    if ((cmf & 0x0F) != 8 || (cmf >> 4) > 7) {
        return false;
    }
    if (((cmf << 8) | flg) % 31 != 0) {
        return false;
    }
    return (flg & 0x20) == 0;
}

int zlib_level_of(const Bytes& stored) {
    if (stored.size() < 6) {
        return DEFAULT_ZLIB_LEVEL;
    }
    switch ((stored[5] >> 6) & 0x03) {
        case 0: return 1;
        case 1: return 5;
        case 2: return 6;
        default: return 9;
    }
}

Bytes inflate_section(const Bytes& stored) {
    if (stored.size() < 6) {
        throw std::runtime_error("Compressed payload too short (" + std::to_string(stored.size()) + " bytes)");
    }
    uint64_t size = stored.size() - 4;
    uint64_t usize = read_be32(stored);
    // Max theoretical deflate ratio is 1032:1
    if ((size > 32 && usize < (size * 9) / 10) || usize > size * 1032) {
        throw std::runtime_error("Implausible uncompressed size " + std::to_string(usize) +
                                 " for " + std::to_string(size) + " compressed bytes");
    }

    // zlib refuses a null output buffer, which an empty vector may hand out
    Bytes out(static_cast<size_t>(std::max<uint64_t>(usize, 1)));
    z_stream strm = {};
    if (inflateInit(&strm) != Z_OK) {
        throw std::runtime_error("zlib inflateInit failed");
    }
    strm.next_in = const_cast<Bytef*>(stored.data() + 4);
    strm.avail_in = static_cast<uInt>(size);
    strm.next_out = out.data();
    strm.avail_out = static_cast<uInt>(usize);

    int ret = inflate(&strm, Z_FINISH);
    uLong produced = strm.total_out;
    uInt left_in = strm.avail_in;
    inflateEnd(&strm);

    if (ret != Z_STREAM_END) {
        if (ret == Z_BUF_ERROR || ret == Z_OK) {
            throw std::runtime_error("zlib stream larger than declared size " + std::to_string(usize));
        }
        throw std::runtime_error("zlib inflate failed (code " + std::to_string(ret) + ")");
    }
    if (produced != usize) {
        throw std::runtime_error("Inflated " + std::to_string(produced) + " bytes, header declares " +
                                 std::to_string(usize));
    }
    if (left_in != 0) {
        throw std::runtime_error(std::to_string(left_in) + " bytes follow the zlib stream");
    }
    out.resize(static_cast<size_t>(usize));
    return out;
}

Bytes deflate_section(const Bytes& data, int level) {
    if (data.size() > 0xFFFFFFFFull) {
        throw std::runtime_error("Section too large to compress");
    }
    z_stream strm = {};
    if (deflateInit(&strm, level) != Z_OK) {
        throw std::runtime_error("zlib deflateInit failed");
    }
    uLong bound = deflateBound(&strm, static_cast<uLong>(data.size()));
    Bytes out(4 + bound);
    uint32_t usize = static_cast<uint32_t>(data.size());
    out[0] = static_cast<uint8_t>(usize >> 24);
    out[1] = static_cast<uint8_t>(usize >> 16);
    out[2] = static_cast<uint8_t>(usize >> 8);
    out[3] = static_cast<uint8_t>(usize);

    strm.next_in = const_cast<Bytef*>(data.data());
    strm.avail_in = static_cast<uInt>(data.size());
    strm.next_out = out.data() + 4;
    strm.avail_out = static_cast<uInt>(bound);

    if (deflate(&strm, Z_FINISH) != Z_STREAM_END) {
        deflateEnd(&strm);
        throw std::runtime_error("zlib deflate failed");
    }
    out.resize(4 + strm.total_out);
    deflateEnd(&strm);
    return out;
}

Bytes xor_decrypt(const Bytes& data) {
    Bytes out(data.size());
    uint32_t key = XOR_KEY;
    for (size_t i = 0; i < data.size(); ++i) {
        uint8_t plain = static_cast<uint8_t>((key ^ data[i]) & 0xFF);
        out[i] = plain;
        key = plain ^ rol32(key);
    }
    return out;
}

Bytes xor_encrypt(const Bytes& data) {
    Bytes out(data.size());
    uint32_t key = XOR_KEY;
    for (size_t i = 0; i < data.size(); ++i) {
        out[i] = static_cast<uint8_t>((key ^ data[i]) & 0xFF);
        key = data[i] ^ rol32(key);
    }
    return out;
}

Bytes decode_section_payload(const Bytes& stored, SectionCoding coding) {
    switch (coding) {
        case SectionCoding::Zlib: return inflate_section(stored);
        case SectionCoding::Xor: return xor_decrypt(stored);
        case SectionCoding::None: break;
    }
    return stored;
}

Bytes encode_section_payload(const Bytes& data, SectionCoding coding, int level) {
    switch (coding) {
        case SectionCoding::Zlib: return deflate_section(data, level);
        case SectionCoding::Xor: return xor_encrypt(data);
        case SectionCoding::None: break;
    }
    return data;
}
