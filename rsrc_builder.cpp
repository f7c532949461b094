#include "rsrc_builder.hpp"
#include "byte_stream.hpp"
#include "errors.hpp"
#include "shared_structure.hpp"
#include <algorithm>
#include <cstring>
#include <stdexcept>

namespace {

uint32_t checked_u32(uint64_t value, const std::string& what) {
    if (value > 0xFFFFFFFFull) {
        throw EncodeError(what + " " + std::to_string(value) + " does not fit in 32 bits");
    }
    return static_cast<uint32_t>(value);
}

} // namespace

void RsrcBuilder::validate() const {
    if (this->file.type.size() != 4) {
        throw EncodeError("File type '" + this->file.type + "' is not 4 bytes long");
    }
    count_to_stored(this->file.blocks.size(), "blocks");
    for (const auto& block : this->file.blocks) {
        if (block.ident.size() != 4) {
            throw EncodeError("Block identifier '" + block.ident + "' is not 4 bytes long");
        }
        count_to_stored(block.sections.size(), "sections in block '" + block.ident + "'");
        for (const auto& section : block.sections) {
            if (section.name.has_value()) {
                if (this->file.layout == ContainerLayout::Legacy) {
                    throw VersionMismatchError("Block '" + block.ident + "' section " + std::to_string(section.index) +
                                               " has a name; the legacy layout cannot store section names");
                }
                if (section.name->size() > 0xFF) {
                    throw EncodeError("Name of block '" + block.ident + "' section " + std::to_string(section.index) +
                                      " is longer than 255 bytes");
                }
            }
        }
    }
    if (this->file.layout == ContainerLayout::Legacy && this->file.file_name.size() > 0xFF) {
        throw EncodeError("File name is longer than 255 bytes");
    }
}

Bytes RsrcBuilder::section_payload(const RsrcBlock& block, const RsrcSection& section) const {
    if (section.coding == SectionCoding::Zlib && !section.stored.empty()) {
        // Reuse the original compressed bytes while they still decode to the same content
        Bytes original;
        try {
            original = inflate_section(section.stored);
        } catch (const std::runtime_error& e) {
            throw EncodeError("Stored payload of block '" + block.ident + "' section " +
                              std::to_string(section.index) + " is not valid zlib data: " + e.what());
        }
        if (original == section.data) {
            return section.stored;
        }
    }
    try {
        return encode_section_payload(section.data, section.coding, section.zlib_level);
    } catch (const EncodeError&) {
        throw;
    } catch (const std::runtime_error& e) {
        throw EncodeError("Cannot encode block '" + block.ident + "' section " + std::to_string(section.index) +
                          ": " + e.what());
    }
}

Bytes RsrcBuilder::build_name_table(std::vector<std::vector<uint32_t>>& name_offsets) const {
    struct NameRef {
        uint32_t recorded;
        size_t block;
        size_t section;
    };

    name_offsets.clear();
    std::vector<NameRef> recorded;
    std::vector<NameRef> unrecorded;
    for (size_t b = 0; b < this->file.blocks.size(); ++b) {
        const auto& sections = this->file.blocks[b].sections;
        name_offsets.emplace_back(sections.size(), SECTION_NO_NAME);
        for (size_t s = 0; s < sections.size(); ++s) {
            if (!sections[s].name.has_value()) {
                continue;
            }
            if (sections[s].name_offset.has_value()) {
                recorded.push_back({*sections[s].name_offset, b, s});
            } else {
                unrecorded.push_back({0, b, s});
            }
        }
    }
    std::stable_sort(recorded.begin(), recorded.end(),
                     [](const NameRef& a, const NameRef& b) { return a.recorded < b.recorded; });

    ByteWriter table;
    const NameRef* previous = nullptr;
    for (const auto& ref : recorded) {
        const Bytes& name = *this->file.blocks[ref.block].sections[ref.section].name;
        if (previous != nullptr && previous->recorded == ref.recorded &&
            *this->file.blocks[previous->block].sections[previous->section].name == name) {
            // Shared entry in the original table
            name_offsets[ref.block][ref.section] = name_offsets[previous->block][previous->section];
        } else {
            name_offsets[ref.block][ref.section] = checked_u32(table.size(), "Name table offset");
            table.pascal(name);
        }
        previous = &ref;
    }
    for (const auto& ref : unrecorded) {
        name_offsets[ref.block][ref.section] = checked_u32(table.size(), "Name table offset");
        table.pascal(*this->file.blocks[ref.block].sections[ref.section].name);
    }
    return table.take();
}

Bytes RsrcBuilder::build() const {
    validate();
    const bool extended = this->file.layout == ContainerLayout::Extended;

    ByteWriter out;
    out.zeros(RSRC_HEADER_SIZE);

    // Data region: size-prefixed payloads, each padded to 4 bytes
    std::vector<std::vector<uint32_t>> data_offsets;
    for (const auto& block : this->file.blocks) {
        data_offsets.emplace_back();
        for (const auto& section : block.sections) {
            Bytes payload = section_payload(block, section);
            data_offsets.back().push_back(checked_u32(out.size() - RSRC_HEADER_SIZE, "Section data offset"));
            out.u32(payload.size());
            out.bytes(payload);
            out.align(SECTION_DATA_ALIGN);
        }
    }
    const uint32_t info_offset = checked_u32(out.size(), "Info offset");
    const uint32_t data_size = info_offset - RSRC_HEADER_SIZE;

    std::vector<std::vector<uint32_t>> name_offsets;
    Bytes names;
    if (extended) {
        names = build_name_table(name_offsets);
    }

    // Info region: second header, list header, Blocks Info, section infos, tail
    out.zeros(RSRC_HEADER_SIZE);
    size_t total_sections = 0;
    for (const auto& block : this->file.blocks) {
        total_sections += block.sections.size();
    }
    const size_t info_entry_size = extended ? SECTION_INFO_SIZE : SECTION_INFO_LEGACY_SIZE;
    const uint64_t headers_size = BLOCKINFO_COUNT_SIZE + this->file.blocks.size() * BLOCK_HEADER_SIZE;

    if (extended) {
        const uint32_t blockinfo_offset = RSRC_HEADER_SIZE + BLOCKINFO_LIST_HEADER_SIZE;
        out.u32(this->file.int1);
        out.u32(this->file.int2);
        out.u32(RSRC_HEADER_SIZE);
        out.u32(blockinfo_offset);
        out.u32(checked_u32(blockinfo_offset + headers_size + total_sections * info_entry_size, "Block info size"));
    }

    out.u32(count_to_stored(this->file.blocks.size(), "blocks"));
    uint64_t table_offset = headers_size;
    for (const auto& block : this->file.blocks) {
        char ident[4];
        ident_to_bytes(block.ident, ident);
        out.bytes(reinterpret_cast<const uint8_t*>(ident), sizeof(ident));
        out.u32(count_to_stored(block.sections.size(), "sections in block '" + block.ident + "'"));
        out.u32(checked_u32(table_offset, "Section info offset"));
        table_offset += block.sections.size() * info_entry_size;
    }

    for (size_t b = 0; b < this->file.blocks.size(); ++b) {
        const auto& block = this->file.blocks[b];
        for (size_t s = 0; s < block.sections.size(); ++s) {
            const auto& section = block.sections[s];
            out.i32(section.index);
            if (extended) {
                out.u32(name_offsets[b][s]);
            }
            out.u32(section.int3);
            out.u32(data_offsets[b][s]);
            out.u32(section.int5);
        }
    }

    if (extended) {
        out.bytes(names);
    } else {
        out.pascal(this->file.file_name);
    }
    const uint32_t info_size = checked_u32(out.size() - info_offset, "Info size");

    RsrcHeaderRaw hdr{};
    std::memcpy(hdr.magic, RSRC_MAGIC, sizeof(hdr.magic));
    hdr.format_version = this->file.format_version;
    ident_to_bytes(this->file.type, hdr.type);
    std::memcpy(hdr.creator, RSRC_CREATOR, sizeof(hdr.creator));
    hdr.info_offset = info_offset;
    hdr.info_size = info_size;
    hdr.data_offset = RSRC_HEADER_SIZE;
    hdr.data_size = data_size;
    RsrcHeaderRaw disk = to_disk(hdr);

    Bytes result = out.take();
    std::memcpy(result.data(), &disk, RSRC_HEADER_SIZE);
    std::memcpy(result.data() + info_offset, &disk, RSRC_HEADER_SIZE);
    return result;
}

void RsrcBuilder::build(const std::filesystem::path& output_path) const {
    Bytes data = build();
    write_filepath(output_path, data);
}
