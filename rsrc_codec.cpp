#include "rsrc_codec.hpp"
#include "block_codec.hpp"
#include "format_context.hpp"
#include "rsrc_builder.hpp"
#include "rsrc_parser.hpp"
#include <limits>

namespace {

// Identifiers are raw bytes; latin1 maps each one to a code point and back.
std::string ident_to_text(const std::string& ident) {
    return code_page_by_name("latin1").decode(Bytes(ident.begin(), ident.end()));
}

std::string ident_from_text(const IntermediateNode& node, const std::string& key) {
    Bytes raw = code_page_by_name("latin1").encode(node.get(key));
    return std::string(raw.begin(), raw.end());
}

IntermediateNode decode_content(const RsrcBlock& block, const RsrcSection& section, const FormatContext& ctx,
                                std::vector<DecodeWarning>& warnings) {
    const BlockCodecRegistry& registry = BlockCodecRegistry::instance();
    const BlockCodec* codec = registry.find(block.ident);
    if (codec == nullptr) {
        warnings.push_back({WarningKind::UnknownBlockTag, block.ident, section.index, "kept as opaque data"});
        return registry.passthrough().decode(section.data, ctx);
    }
    try {
        IntermediateNode content = codec->decode(section.data, ctx);
        if (codec->encode(content, ctx) == section.data) {
            return content;
        }
        warnings.push_back({WarningKind::MalformedBlock, block.ident, section.index,
                            "content does not re-encode to the same bytes, kept as opaque data"});
    } catch (const RsrcError& e) {
        warnings.push_back({WarningKind::MalformedBlock, block.ident, section.index,
                            std::string("kept as opaque data: ") + e.what()});
    }
    return registry.passthrough().decode(section.data, ctx);
}

Bytes encode_content(const std::string& ident, const IntermediateNode& section, const FormatContext& ctx) {
    if (section.children.size() != 1) {
        throw EncodeError("Section " + section.get_or("Index", "?") + " of block '" + ident +
                          "' must have exactly one content node, has " + std::to_string(section.children.size()));
    }
    const IntermediateNode& content = section.children.front();
    if (content.tag == PassthroughCodec::NODE_TAG) {
        return content.require_payload();
    }
    const BlockCodec* codec = BlockCodecRegistry::instance().find(ident);
    if (codec == nullptr) {
        throw EncodeError("No codec for block '" + ident + "' to encode a '" + content.tag + "' node");
    }
    return codec->encode(content, ctx);
}

uint32_t u32_attribute(const IntermediateNode& node, const std::string& key) {
    return node.has(key) ? static_cast<uint32_t>(node.get_uint(key, 0xFFFFFFFF)) : 0;
}

} // namespace

void set_text_attr(IntermediateNode& node, const std::string& key, const Bytes& raw, const CodePage& code_page) {
    try {
        node.set(key, code_page.decode(raw));
    } catch (const FormatError&) {
        node.set(key + "Hex", bytes_to_hex(raw));
    }
}

std::optional<Bytes> get_text_attr(const IntermediateNode& node, const std::string& key, const CodePage& code_page) {
    if (node.has(key)) {
        return code_page.encode(node.get(key));
    }
    const std::string hex_key = key + "Hex";
    if (node.has(hex_key)) {
        try {
            return unhexlify(node.get(hex_key));
        } catch (const std::invalid_argument& e) {
            throw EncodeError("Attribute '" + hex_key + "' of node '" + node.tag + "': " + e.what());
        }
    }
    return std::nullopt;
}

DecodeResult file_to_tree(const RsrcFile& file, const CodePage& code_page) {
    const FormatContext ctx = resolve_format(file, code_page);
    DecodeResult result;
    IntermediateNode& root = result.tree;
    root.tag = "RSRC";
    root.set("Type", ident_to_text(file.type));
    root.set_int("FormatVersion", file.format_version);
    root.set("Layout", layout_name(file.layout));
    if (file.layout == ContainerLayout::Extended) {
        root.set_hex("Int1", file.int1);
        root.set_hex("Int2", file.int2);
    } else {
        set_text_attr(root, "FileName", file.file_name, code_page);
    }

    for (const auto& block : file.blocks) {
        IntermediateNode& block_node = root.add_child(IntermediateNode("Block"));
        block_node.set("Ident", ident_to_text(block.ident));
        for (const auto& section : block.sections) {
            IntermediateNode& section_node = block_node.add_child(IntermediateNode("Section"));
            section_node.set_int("Index", section.index);
            if (section.name.has_value()) {
                set_text_attr(section_node, "Name", *section.name, code_page);
            }
            if (section.name_offset.has_value()) {
                section_node.set_int("NameOffset", *section.name_offset);
            }
            section_node.set_hex("Int3", section.int3);
            section_node.set_hex("Int5", section.int5);
            section_node.set("Coding", coding_name(section.coding));
            if (section.coding == SectionCoding::Zlib) {
                section_node.set_int("ZlibLevel", section.zlib_level);
                section_node.payload = section.stored;
            }
            section_node.add_child(decode_content(block, section, ctx, result.warnings));
        }
    }
    return result;
}

DecodeResult decode_rsrc(const Bytes& data, const CodePage& code_page) {
    RsrcContainer container(data);
    DecodeResult result = file_to_tree(container.file, code_page);
    result.warnings.insert(result.warnings.begin(), container.warnings.begin(), container.warnings.end());
    return result;
}

ContainerLayout tree_layout(const IntermediateNode& root) {
    try {
        return layout_from_name(root.get("Layout"));
    } catch (const std::invalid_argument& e) {
        throw EncodeError(e.what());
    }
}

RsrcFile tree_to_file(const IntermediateNode& root, ContainerLayout layout, const CodePage& code_page) {
    if (root.tag != "RSRC") {
        throw EncodeError("Document root must be an 'RSRC' node, found '" + root.tag + "'");
    }
    const FormatContext ctx = resolve_format(root, layout, code_page);

    RsrcFile file;
    file.layout = layout;
    file.type = ident_from_text(root, "Type");
    file.format_version = static_cast<uint16_t>(
        root.has("FormatVersion") ? root.get_uint("FormatVersion", 0xFFFF) : RSRC_DEFAULT_FORMAT_VERSION);
    if (layout == ContainerLayout::Extended) {
        file.int1 = u32_attribute(root, "Int1");
        file.int2 = u32_attribute(root, "Int2");
    } else {
        file.file_name = get_text_attr(root, "FileName", code_page).value_or(Bytes());
    }

    for (const IntermediateNode* block_node : root.children_with("Block")) {
        RsrcBlock block;
        block.ident = ident_from_text(*block_node, "Ident");
        for (const IntermediateNode* section_node : block_node->children_with("Section")) {
            RsrcSection section;
            const long long index = section_node->get_int("Index");
            if (index < std::numeric_limits<int32_t>::min() || index > std::numeric_limits<int32_t>::max()) {
                throw EncodeError("Section index " + std::to_string(index) + " of block '" + block.ident +
                                  "' does not fit in 32 bits");
            }
            section.index = static_cast<int32_t>(index);
            section.name = get_text_attr(*section_node, "Name", code_page);
            if (section_node->has("NameOffset")) {
                section.name_offset = static_cast<uint32_t>(section_node->get_uint("NameOffset", 0xFFFFFFFE));
            }
            section.int3 = u32_attribute(*section_node, "Int3");
            section.int5 = u32_attribute(*section_node, "Int5");
            try {
                section.coding = coding_from_name(section_node->get_or("Coding", "none"));
            } catch (const std::invalid_argument& e) {
                throw EncodeError(std::string(e.what()) + " in block '" + block.ident + "'");
            }
            section.zlib_level = static_cast<int>(section_node->has("ZlibLevel")
                                                      ? section_node->get_uint("ZlibLevel", 9)
                                                      : DEFAULT_ZLIB_LEVEL);
            if (section.coding == SectionCoding::Zlib && section_node->payload.has_value()) {
                section.stored = *section_node->payload;
            }
            section.data = encode_content(block.ident, *section_node, ctx);
            block.sections.push_back(std::move(section));
        }
        file.blocks.push_back(std::move(block));
    }
    return file;
}

Bytes encode_rsrc(const IntermediateNode& root, ContainerLayout layout, const CodePage& code_page) {
    RsrcFile file = tree_to_file(root, layout, code_page);
    return RsrcBuilder(file).build();
}

Bytes encode_rsrc(const IntermediateNode& root, const CodePage& code_page) {
    return encode_rsrc(root, tree_layout(root), code_page);
}
