#include "rsrc_parser.hpp"
#include "byte_stream.hpp"
#include <cstring>
#include <iostream>
#include <set>

namespace {

const char* const COMPRESSED_TAGS[] = {
    "BDHc", "BDHb", "FPHc", "FPHb", "VCTP", "DFDS", "GCDI", "DSIM", "BDHX", "FPHX"
};

constexpr const char* XOR_CODED_TAG = "LVzp";

} // namespace

bool is_compressed_tag(const std::string& ident) {
    for (const char* tag : COMPRESSED_TAGS) {
        if (ident == tag) {
            return true;
        }
    }
    return false;
}

RsrcContainer::RsrcContainer(const Bytes& data) {
    read_headers(data);
    this->file.layout = detect_layout(data);
    read_block_info(data);
}

void RsrcContainer::read_headers(const Bytes& data) {
    if (data.size() < RSRC_HEADER_SIZE) {
        throw TruncatedDataError("File too small for an RSRC header (" + std::to_string(data.size()) + " bytes)", 0);
    }

    RsrcHeaderRaw first;
    std::memcpy(&first, data.data(), RSRC_HEADER_SIZE);
    if (std::memcmp(first.magic, RSRC_MAGIC, sizeof(RSRC_MAGIC)) != 0) {
        throw FormatError("Invalid RSRC header magic", 0);
    }
    if (std::memcmp(first.creator, RSRC_CREATOR, sizeof(RSRC_CREATOR)) != 0) {
        throw FormatError("Unexpected creator tag '" + ident_from_bytes(first.creator) + "'", 12);
    }

    RsrcHeaderRaw hdr = first;
    to_host(hdr);
    if (hdr.info_offset < RSRC_HEADER_SIZE) {
        throw CorruptOffsetError("Info offset " + std::to_string(hdr.info_offset) + " points into the first header", 16);
    }
    if (static_cast<uint64_t>(hdr.info_offset) + RSRC_HEADER_SIZE > data.size()) {
        throw TruncatedDataError("Info offset " + std::to_string(hdr.info_offset) + " exceeds file size " +
                                 std::to_string(data.size()), 16);
    }
    if (std::memcmp(&first, data.data() + hdr.info_offset, RSRC_HEADER_SIZE) != 0) {
        throw FormatError("Second RSRC header differs from the first", hdr.info_offset);
    }
    if (hdr.info_size < RSRC_HEADER_SIZE) {
        throw CorruptOffsetError("Info size " + std::to_string(hdr.info_size) + " cannot hold the second header", 20);
    }
    if (static_cast<uint64_t>(hdr.info_offset) + hdr.info_size > data.size()) {
        throw TruncatedDataError("Info region runs past end of file", hdr.info_offset);
    }
    if (hdr.data_offset < RSRC_HEADER_SIZE) {
        throw CorruptOffsetError("Data offset " + std::to_string(hdr.data_offset) + " points into the first header", 24);
    }
    if (static_cast<uint64_t>(hdr.data_offset) + hdr.data_size > hdr.info_offset) {
        throw CorruptOffsetError("Data region overlaps the info region", 24);
    }

    this->header = hdr;
    this->file.type = ident_from_bytes(hdr.type);
    this->file.format_version = hdr.format_version;
}

ContainerLayout RsrcContainer::detect_layout(const Bytes& data) const {
    uint64_t list_pos = static_cast<uint64_t>(this->header.info_offset) + RSRC_HEADER_SIZE;
    uint64_t info_end = static_cast<uint64_t>(this->header.info_offset) + this->header.info_size;
    if (list_pos + BLOCKINFO_LIST_HEADER_SIZE > info_end) {
        return ContainerLayout::Legacy;
    }
    BlockInfoListHeaderRaw list;
    std::memcpy(&list, data.data() + list_pos, BLOCKINFO_LIST_HEADER_SIZE);
    to_host(list);
    if (list.header_size == RSRC_HEADER_SIZE &&
        list.blockinfo_offset == RSRC_HEADER_SIZE + BLOCKINFO_LIST_HEADER_SIZE) {
        return ContainerLayout::Extended;
    }
    return ContainerLayout::Legacy;
}

void RsrcContainer::read_block_info(const Bytes& data) {
    const bool extended = this->file.layout == ContainerLayout::Extended;
    const size_t info_offset = this->header.info_offset;
    const size_t info_end = info_offset + this->header.info_size;
    ByteReader reader(data.data(), info_end);

    size_t blockinfo_start;
    if (extended) {
        reader.seek(info_offset + RSRC_HEADER_SIZE);
        BlockInfoListHeaderRaw list;
        reader.read_struct(list);
        to_host(list);
        this->file.int1 = list.int1;
        this->file.int2 = list.int2;
        this->blockinfo_size = list.blockinfo_size;
        blockinfo_start = info_offset + list.blockinfo_offset;
    } else {
        blockinfo_start = info_offset + RSRC_HEADER_SIZE;
    }

    reader.seek(blockinfo_start);
    uint32_t stored_count = reader.u32();
    if (stored_count > MAX_BLOCK_COUNT) {
        throw CorruptOffsetError("Block count " + std::to_string(count_from_stored(stored_count)) +
                                 " exceeds the supported maximum", blockinfo_start);
    }
    const size_t block_count = static_cast<size_t>(count_from_stored(stored_count));
    const size_t headers_size = BLOCKINFO_COUNT_SIZE + block_count * BLOCK_HEADER_SIZE;
    if (blockinfo_start + headers_size > info_end) {
        if (blockinfo_start + headers_size > data.size()) {
            throw TruncatedDataError("Block headers run past end of file", blockinfo_start);
        }
        throw CorruptOffsetError("Block headers run past the info region", blockinfo_start);
    }

    std::vector<BlockHeaderRaw> block_headers(block_count);
    for (auto& bh : block_headers) {
        reader.read_struct(bh);
        to_host(bh);
    }
    const size_t info_entry_size = extended ? SECTION_INFO_SIZE : SECTION_INFO_LEGACY_SIZE;

    size_t total_sections = 0;
    for (size_t i = 0; i < block_headers.size(); ++i) {
        const auto& bh = block_headers[i];
        RsrcBlock block;
        block.ident = ident_from_bytes(bh.ident);

        if (bh.offset < headers_size) {
            throw CorruptOffsetError("Section info of block '" + block.ident + "' points back into the block headers",
                                     blockinfo_start + BLOCKINFO_COUNT_SIZE + i * BLOCK_HEADER_SIZE + 8);
        }
        const uint64_t section_count = count_from_stored(bh.count);
        const uint64_t table_pos = static_cast<uint64_t>(blockinfo_start) + bh.offset;
        if (table_pos + section_count * info_entry_size > info_end) {
            if (table_pos + section_count * info_entry_size > data.size()) {
                throw TruncatedDataError("Section info of block '" + block.ident + "' runs past end of file", table_pos);
            }
            throw CorruptOffsetError("Section info of block '" + block.ident + "' runs past the info region", table_pos);
        }
        reader.seek(static_cast<size_t>(table_pos));

        std::set<int32_t> seen;
        for (uint64_t j = 0; j < section_count; ++j) {
            const size_t entry_pos = reader.tell();
            RsrcSection section;
            uint32_t data_offset;
            if (extended) {
                SectionInfoRaw si;
                reader.read_struct(si);
                to_host(si);
                section.index = si.section_idx;
                if (si.name_offset != SECTION_NO_NAME) {
                    section.name_offset = si.name_offset;
                }
                section.int3 = si.int3;
                section.int5 = si.int5;
                data_offset = si.data_offset;
            } else {
                SectionInfoLegacyRaw si;
                reader.read_struct(si);
                to_host(si);
                section.index = si.section_idx;
                section.int3 = si.int3;
                section.int5 = si.int5;
                data_offset = si.data_offset;
            }
            if (!seen.insert(section.index).second) {
                throw CorruptOffsetError("Section index " + std::to_string(section.index) +
                                         " appears twice in block '" + block.ident + "'", entry_pos);
            }
            read_section_payload(data, block.ident, data_offset, section);
            block.sections.push_back(std::move(section));
        }
        total_sections += block.sections.size();
        this->file.blocks.push_back(std::move(block));
    }

    const uint64_t names_start = static_cast<uint64_t>(blockinfo_start) + headers_size +
                                 static_cast<uint64_t>(total_sections) * info_entry_size;
    if (names_start > info_end) {
        throw CorruptOffsetError("Section info tables run past the info region", blockinfo_start);
    }
    read_section_names(data, static_cast<size_t>(names_start));
}

void RsrcContainer::read_section_payload(const Bytes& data, const std::string& ident, uint32_t data_offset,
                                         RsrcSection& section) {
    const uint64_t pos = static_cast<uint64_t>(this->header.data_offset) + data_offset;
    const uint64_t data_end = static_cast<uint64_t>(this->header.data_offset) + this->header.data_size;
    if (pos + 4 > data.size()) {
        throw TruncatedDataError("Data of block '" + ident + "' section " + std::to_string(section.index) +
                                 " starts past end of file", pos);
    }
    if (pos + 4 > data_end) {
        throw CorruptOffsetError("Data of block '" + ident + "' section " + std::to_string(section.index) +
                                 " starts outside the data region", pos);
    }

    ByteReader reader(data);
    reader.seek(static_cast<size_t>(pos));
    const uint32_t size = reader.u32();
    if (pos + 4 + size > data.size()) {
        throw TruncatedDataError("Data of block '" + ident + "' section " + std::to_string(section.index) +
                                 " runs past end of file (size " + std::to_string(size) + ")", pos);
    }
    if (pos + 4 + size > data_end) {
        throw CorruptOffsetError("Data of block '" + ident + "' section " + std::to_string(section.index) +
                                 " runs past the data region (size " + std::to_string(size) + ")", pos);
    }
    Bytes stored = reader.bytes(size);

    if (ident == XOR_CODED_TAG) {
        section.coding = SectionCoding::Xor;
        section.data = xor_decrypt(stored);
        section.stored = std::move(stored);
        return;
    }

    const bool candidate = is_compressed_tag(ident) ||
                           (this->file.layout == ContainerLayout::Legacy && looks_like_zlib(stored));
    if (candidate) {
        try {
            section.data = inflate_section(stored);
            section.coding = SectionCoding::Zlib;
            section.zlib_level = zlib_level_of(stored);
            section.stored = std::move(stored);
            return;
        } catch (const std::runtime_error& e) {
            this->warnings.push_back({WarningKind::Compression, ident, section.index,
                                      std::string("kept raw: ") + e.what()});
        }
    }
    section.coding = SectionCoding::None;
    section.data = std::move(stored);
}

void RsrcContainer::read_section_names(const Bytes& data, size_t names_start) {
    const size_t info_end = static_cast<size_t>(this->header.info_offset) + this->header.info_size;
    ByteReader reader(data.data(), info_end);

    if (this->file.layout == ContainerLayout::Legacy) {
        if (names_start < info_end) {
            reader.seek(names_start);
            this->file.file_name = reader.pascal();
        }
        return;
    }

    for (auto& block : this->file.blocks) {
        for (auto& section : block.sections) {
            if (!section.name_offset.has_value()) {
                continue;
            }
            const uint64_t pos = static_cast<uint64_t>(names_start) + *section.name_offset;
            if (pos >= info_end) {
                throw CorruptOffsetError("Name of block '" + block.ident + "' section " +
                                         std::to_string(section.index) + " lies past the info region", pos);
            }
            reader.seek(static_cast<size_t>(pos));
            section.name = reader.pascal();
        }
    }
}

void RsrcContainer::print_info(bool verbose) const {
    std::cout << "RSRC Header" << std::endl;
    std::cout << "===========" << std::endl;
    std::cout << "type = " << this->file.type << ", format_version = " << this->header.format_version
              << ", layout = " << layout_name(this->file.layout) << std::endl;
    std::cout << "info_offset = " << this->header.info_offset << ", info_size = " << this->header.info_size << std::endl;
    std::cout << "data_offset = " << this->header.data_offset << ", data_size = " << this->header.data_size << std::endl;
    if (this->file.layout == ContainerLayout::Extended) {
        std::cout << "int1 = " << format_hex32(this->file.int1) << ", int2 = " << format_hex32(this->file.int2)
                  << ", blockinfo_size = " << this->blockinfo_size << std::endl;
    } else {
        std::cout << "file_name = '" << std::string(this->file.file_name.begin(), this->file.file_name.end())
                  << "'" << std::endl;
    }
    std::cout << "blocks = " << this->file.blocks.size() << std::endl;
    for (const auto& block : this->file.blocks) {
        std::cout << "  Block(ident='" << block.ident << "', sections=" << block.sections.size() << ")" << std::endl;
        if (!verbose) {
            continue;
        }
        for (const auto& section : block.sections) {
            std::cout << "    Section(index=" << section.index << ", size=" << section.data.size()
                      << ", coding=" << coding_name(section.coding);
            if (section.name.has_value()) {
                std::cout << ", name='" << std::string(section.name->begin(), section.name->end()) << "'";
            }
            std::cout << ")" << std::endl;
        }
    }
    std::cout << std::endl;
}
