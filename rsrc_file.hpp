#ifndef RSRC_FILE_HPP
#define RSRC_FILE_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "section_coding.hpp"
#include "shared_structure.hpp"
#include "utils.hpp"

enum class ContainerLayout {
    Legacy,     // Blocks Info right after the second header, 16-byte section infos, filename tail
    Extended    // BlockInfoListHeader, 20-byte section infos, section name table
};

const char* layout_name(ContainerLayout layout);
ContainerLayout layout_from_name(const std::string& name);

struct RsrcSection {
    int32_t index = 0;
    std::optional<Bytes> name;              // raw Pascal string bytes
    std::optional<uint32_t> name_offset;    // as found in the name table, if any
    uint32_t int3 = 0;
    uint32_t int5 = 0;
    SectionCoding coding = SectionCoding::None;
    int zlib_level = DEFAULT_ZLIB_LEVEL;
    Bytes data;     // content after inflate / XOR decode
    Bytes stored;   // on-disk payload as read; reused on write while it still decodes to data
};

struct RsrcBlock {
    std::string ident;
    std::vector<RsrcSection> sections;
};

// Editable in-memory form of one container, shared by the reader and the writer.
struct RsrcFile {
    std::string type = "LVIN";
    uint16_t format_version = RSRC_DEFAULT_FORMAT_VERSION;
    ContainerLayout layout = ContainerLayout::Extended;
    uint32_t int1 = 0;
    uint32_t int2 = 0;
    Bytes file_name;    // legacy tail only
    std::vector<RsrcBlock> blocks;

    const RsrcBlock* find_block(const std::string& ident) const;
};

#endif // RSRC_FILE_HPP
