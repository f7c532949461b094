#ifndef SHARED_STRUCTURE_HPP
#define SHARED_STRUCTURE_HPP

#include <cstdint>
#include <cstddef>

// Disable padding for all structures for binary compatibility.
// All multi-byte fields are stored big-endian on disk; use to_host()/to_disk() after memcpy.
#pragma pack(push, 1)

struct RsrcHeaderRaw {
    char magic[6];
    uint16_t format_version;
    char type[4];
    char creator[4];
    uint32_t info_offset;   // Offset from beginning of file to the header preceding the Info part
    uint32_t info_size;
    uint32_t data_offset;   // Offset from beginning of file to the Data part
    uint32_t data_size;
};

// Only present in the extended layout, right after the second RSRC header.
struct BlockInfoListHeaderRaw {
    uint32_t int1;
    uint32_t int2;
    uint32_t header_size;       // sizeof(RsrcHeaderRaw)
    uint32_t blockinfo_offset;  // relative to the second RSRC header
    uint32_t blockinfo_size;
};

struct BlockHeaderRaw {
    char ident[4];
    uint32_t count;     // sections - 1
    uint32_t offset;    // to the SectionInfo array, relative to the Blocks Info table
};

struct SectionInfoRaw {
    int32_t section_idx;
    uint32_t name_offset;   // 0xFFFFFFFF when the section has no name
    uint32_t int3;
    uint32_t data_offset;   // relative to the Data part
    uint32_t int5;
};

struct SectionInfoLegacyRaw {
    int32_t section_idx;
    uint32_t int3;
    uint32_t data_offset;
    uint32_t int5;
};

// Restore default packing alignment
#pragma pack(pop)

constexpr char RSRC_MAGIC[6] = {'R', 'S', 'R', 'C', '\r', '\n'};
constexpr char RSRC_CREATOR[4] = {'L', 'B', 'V', 'W'};
constexpr uint16_t RSRC_DEFAULT_FORMAT_VERSION = 3;
constexpr uint32_t RSRC_HEADER_SIZE = sizeof(RsrcHeaderRaw);
constexpr uint32_t BLOCKINFO_LIST_HEADER_SIZE = sizeof(BlockInfoListHeaderRaw);
constexpr uint32_t BLOCKINFO_COUNT_SIZE = 4;
constexpr uint32_t BLOCK_HEADER_SIZE = sizeof(BlockHeaderRaw);
constexpr uint32_t SECTION_INFO_SIZE = sizeof(SectionInfoRaw);
constexpr uint32_t SECTION_INFO_LEGACY_SIZE = sizeof(SectionInfoLegacyRaw);
constexpr uint32_t SECTION_NO_NAME = 0xFFFFFFFF;
constexpr uint32_t SECTION_DATA_ALIGN = 4;
constexpr uint32_t MAX_BLOCK_COUNT = 4096;

static_assert(RSRC_HEADER_SIZE == 32, "RSRC header must be 32 bytes");
static_assert(BLOCKINFO_LIST_HEADER_SIZE == 20, "BlockInfo list header must be 20 bytes");
static_assert(BLOCK_HEADER_SIZE == 12, "Block header must be 12 bytes");
static_assert(SECTION_INFO_SIZE == 20, "Section info must be 20 bytes");
static_assert(SECTION_INFO_LEGACY_SIZE == 16, "Legacy section info must be 16 bytes");

// Host <-> big-endian conversion, independent of host byte order.
inline uint16_t swap_be16(uint16_t v) {
    const auto* b = reinterpret_cast<const uint8_t*>(&v);
    return static_cast<uint16_t>((b[0] << 8) | b[1]);
}

inline uint32_t swap_be32(uint32_t v) {
    const auto* b = reinterpret_cast<const uint8_t*>(&v);
    return (static_cast<uint32_t>(b[0]) << 24) | (static_cast<uint32_t>(b[1]) << 16) |
           (static_cast<uint32_t>(b[2]) << 8) | static_cast<uint32_t>(b[3]);
}

inline int32_t swap_be32(int32_t v) {
    return static_cast<int32_t>(swap_be32(static_cast<uint32_t>(v)));
}

// swap_be* is its own inverse, so the same routines serve both directions.
inline void to_host(RsrcHeaderRaw& h) {
    h.format_version = swap_be16(h.format_version);
    h.info_offset = swap_be32(h.info_offset);
    h.info_size = swap_be32(h.info_size);
    h.data_offset = swap_be32(h.data_offset);
    h.data_size = swap_be32(h.data_size);
}

inline void to_host(BlockInfoListHeaderRaw& h) {
    h.int1 = swap_be32(h.int1);
    h.int2 = swap_be32(h.int2);
    h.header_size = swap_be32(h.header_size);
    h.blockinfo_offset = swap_be32(h.blockinfo_offset);
    h.blockinfo_size = swap_be32(h.blockinfo_size);
}

inline void to_host(BlockHeaderRaw& h) {
    h.count = swap_be32(h.count);
    h.offset = swap_be32(h.offset);
}

inline void to_host(SectionInfoRaw& s) {
    s.section_idx = swap_be32(s.section_idx);
    s.name_offset = swap_be32(s.name_offset);
    s.int3 = swap_be32(s.int3);
    s.data_offset = swap_be32(s.data_offset);
    s.int5 = swap_be32(s.int5);
}

inline void to_host(SectionInfoLegacyRaw& s) {
    s.section_idx = swap_be32(s.section_idx);
    s.int3 = swap_be32(s.int3);
    s.data_offset = swap_be32(s.data_offset);
    s.int5 = swap_be32(s.int5);
}

template<typename T>
inline T to_disk(T value) {
    to_host(value);
    return value;
}

#endif
