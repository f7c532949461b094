#ifndef SECTION_CODING_HPP
#define SECTION_CODING_HPP

#include <string>
#include "utils.hpp"

// How a section payload is stored on disk.
enum class SectionCoding {
    None,
    Zlib,   // [u32 BE uncompressed size][zlib stream]
    Xor     // byte-wise XOR stream keyed from 0xEDB88320
};

const char* coding_name(SectionCoding coding);
SectionCoding coding_from_name(const std::string& name);

constexpr int DEFAULT_ZLIB_LEVEL = 6;

// True when the payload starts with a plausible size word followed by a zlib header.
bool looks_like_zlib(const Bytes& stored);

// Compression level recorded in the zlib FLG byte (1, 5, 6 or 9).
int zlib_level_of(const Bytes& stored);

// Inflates a size-prefixed zlib payload. Throws std::runtime_error when the stream is
// damaged or does not match the declared size.
Bytes inflate_section(const Bytes& stored);

// Produces a size-prefixed zlib payload.
Bytes deflate_section(const Bytes& data, int level);

Bytes xor_decrypt(const Bytes& data);
Bytes xor_encrypt(const Bytes& data);

// Stored bytes -> content bytes. Throws std::runtime_error as inflate_section does.
Bytes decode_section_payload(const Bytes& stored, SectionCoding coding);
Bytes encode_section_payload(const Bytes& data, SectionCoding coding, int level);

#endif // SECTION_CODING_HPP
